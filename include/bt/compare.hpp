// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef BT_COMPARE_HPP
#define BT_COMPARE_HPP

// Whole-tree comparisons.
//
// Like the merge operations these walk both trees side by side and step
// over subtrees the two trees share, so comparing a tree with a lightly
// edited copy of itself costs O(log n) per edit instead of O(n).
//
// The subset tests look at keys only, with duplicates grouped: [1, 1] is a
// subset of [1] and vice versa.

#include "bt/config.hpp"
#include "bt/merge.hpp"
#include "bt/path.hpp"
#include "bt/profiling.hpp"
#include "bt/tree.hpp"

#include <concepts>
#include <functional>

namespace bt {

namespace detail {

template <std::totally_ordered Key, typename Payload>
bool at_shared_slot(const tree_path<Key, Payload>& a, const tree_path<Key, Payload>& b) noexcept {
    return a.node() == b.node() && a.slot() == b.slot();
}

// Climbs both paths past the subtree they share.  `last` receives the last
// element skipped.  Returns false once either path reaches its end.
template <std::totally_ordered Key, typename Payload>
bool skip_shared(tree_path<Key, Payload>& a, tree_path<Key, Payload>& b,
                 const typename node<Key, Payload>::element_type*& last) {
    bool ended = false;
    do {
        last = a.node()->last();
        if (a.ascend_one_level()) ended = true;
        if (b.ascend_one_level()) ended = true;
    } while (!ended && at_shared_slot(a, b));
    if (!a.is_at_end()) a.ascend_to_key();
    if (!b.is_at_end()) b.ascend_to_key();
    return !a.is_at_end() && !b.is_at_end();
}

template <std::totally_ordered Key, typename Payload>
void skip_key(tree_path<Key, Payload>& p, const Key& key) {
    while (!p.is_at_end() && keys_equal(p.key(), key)) static_cast<void>(p.next_part(key, true));
}

template <std::totally_ordered Key, typename Payload>
bool is_subset(const tree<Key, Payload>& a, const tree<Key, Payload>& b, bool strict) {
    if (a.empty()) return !strict || !b.empty();
    if (b.empty()) return false;
    if (a.root() == b.root()) return !strict;

    tree_path<Key, Payload> pa(*a.root(), 0);
    tree_path<Key, Payload> pb(*b.root(), 0);
    bool known_strict = false;
    while (!pa.is_at_end() && !pb.is_at_end()) {
        if (at_shared_slot(pa, pb)) {
            const typename node<Key, Payload>::element_type* last = nullptr;
            static_cast<void>(skip_shared(pa, pb, last));
            // Equal keys may continue past the shared part in either tree.
            const Key key = last->first;
            skip_key(pa, key);
            skip_key(pb, key);
            continue;
        }
        if (pb.key() < pa.key()) {
            known_strict = true;
            const Key limit = pa.key();
            while (!pb.is_at_end() && pb.key() < limit) static_cast<void>(pb.next_part(limit, false));
        } else if (pa.key() < pb.key()) {
            return false;
        } else {
            const Key key = pa.key();
            skip_key(pa, key);
            skip_key(pb, key);
        }
    }
    if (!pa.is_at_end()) return false;
    if (!pb.is_at_end()) known_strict = true;
    return !strict || known_strict;
}

}  // namespace detail

// True when both trees hold equal elements in the same order.  `eq`
// compares two elements.
template <std::totally_ordered Key, typename Payload, typename Eq>
BT_NODISCARD bool elements_equal(const tree<Key, Payload>& a, const tree<Key, Payload>& b, Eq&& eq) {
    if (a.size() != b.size()) return false;
    if (a.root() == b.root()) return true;

    profiler prof("compare::elements_equal", a.size());
    tree_path<Key, Payload> pa(*a.root(), 0);
    tree_path<Key, Payload> pb(*b.root(), 0);
    while (!pa.is_at_end() && !pb.is_at_end()) {
        if (detail::at_shared_slot(pa, pb)) {
            const typename node<Key, Payload>::element_type* last = nullptr;
            if (!detail::skip_shared(pa, pb, last)) break;
            continue;
        }
        if (!std::invoke(eq, pa.element(), pb.element())) return false;
        pa.move_forward();
        pb.move_forward();
    }
    return pa.is_at_end() && pb.is_at_end();
}

template <std::totally_ordered Key, typename Payload>
    requires std::equality_comparable<Payload>
BT_NODISCARD bool elements_equal(const tree<Key, Payload>& a, const tree<Key, Payload>& b) {
    return elements_equal(a, b, [](const auto& x, const auto& y) { return x.first == y.first && x.second == y.second; });
}

template <std::totally_ordered Key, typename Payload>
    requires std::equality_comparable<Payload>
BT_NODISCARD bool operator==(const tree<Key, Payload>& a, const tree<Key, Payload>& b) {
    return elements_equal(a, b);
}

// True when no key appears in both trees.
template <std::totally_ordered Key, typename Payload>
BT_NODISCARD bool is_disjoint(const tree<Key, Payload>& a, const tree<Key, Payload>& b) {
    if (a.empty() || b.empty()) return true;
    if (a.root() == b.root()) return false;

    tree_path<Key, Payload> pa(*a.root(), 0);
    tree_path<Key, Payload> pb(*b.root(), 0);
    while (!pa.is_at_end() && !pb.is_at_end()) {
        if (pa.key() < pb.key()) {
            const Key limit = pb.key();
            while (!pa.is_at_end() && pa.key() < limit) static_cast<void>(pa.next_part(limit, false));
        } else if (pb.key() < pa.key()) {
            const Key limit = pa.key();
            while (!pb.is_at_end() && pb.key() < limit) static_cast<void>(pb.next_part(limit, false));
        } else {
            return false;
        }
    }
    return true;
}

// Every key of `a` is also a key of `b`.
template <std::totally_ordered Key, typename Payload>
BT_NODISCARD bool is_subset(const tree<Key, Payload>& a, const tree<Key, Payload>& b) {
    return detail::is_subset(a, b, false);
}

// is_subset, and `b` has a key that `a` lacks.
template <std::totally_ordered Key, typename Payload>
BT_NODISCARD bool is_strict_subset(const tree<Key, Payload>& a, const tree<Key, Payload>& b) {
    return detail::is_subset(a, b, true);
}

template <std::totally_ordered Key, typename Payload>
BT_NODISCARD bool is_superset(const tree<Key, Payload>& a, const tree<Key, Payload>& b) {
    return detail::is_subset(b, a, false);
}

template <std::totally_ordered Key, typename Payload>
BT_NODISCARD bool is_strict_superset(const tree<Key, Payload>& a, const tree<Key, Payload>& b) {
    return detail::is_subset(b, a, true);
}

}  // namespace bt

#endif  // BT_COMPARE_HPP
