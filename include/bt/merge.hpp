// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef BT_MERGE_HPP
#define BT_MERGE_HPP

// Set algebra over two trees.
//
// Every operation walks both trees in key order and feeds a builder.  Runs
// of one tree that do not interleave with the other are linked into the
// result as whole subtrees, and subtrees that both trees share (same node,
// e.g. after a copy) are spliced or skipped in one step.  Non-interleaved
// inputs therefore merge in O(log n); densely interleaved ones in O(n).
//
// Equal keys are matched according to match_strategy:
//  - grouping: a key present in both trees is one group, whatever the
//    multiplicities (subtracting removes every copy, intersection keeps
//    every copy from the second tree);
//  - counting: equal keys pair off one-to-one (multiset semantics).

#include "bt/builder.hpp"
#include "bt/config.hpp"
#include "bt/node.hpp"
#include "bt/path.hpp"
#include "bt/profiling.hpp"
#include "bt/tree.hpp"

#include <iterator>
#include <optional>
#include <ranges>

namespace bt {

enum class match_strategy : unsigned char { grouping, counting };

namespace detail {

template <typename Key>
bool keys_equal(const Key& a, const Key& b) {
    return !(a < b) && !(b < a);
}

template <std::totally_ordered Key, typename Payload>
void append_part(builder<Key, Payload>& b, const typename tree_path<Key, Payload>::part& p) {
    if (p.element) b.append(*p.element);
    else b.append(node<Key, Payload>::slice(*p.source, p.begin, p.end));
}

// Two read-only walkers and the builder collecting the result.
template <std::totally_ordered Key, typename Payload>
class merger {
public:
    using tree_type = tree<Key, Payload>;
    using node_type = node<Key, Payload>;
    using path_type = tree_path<Key, Payload>;
    using element_type = typename node_type::element_type;
    using pointer = typename node_type::pointer;

    merger(const char* label, const tree_type& first, const tree_type& second)
        : _prof(label),
          _first_root(first.root()),
          _second_root(second.root()),
          _a(*_first_root, 0),
          _b(*_second_root, 0),
          _builder(_first_root->order) {
        BT_PRECONDITION(_first_root->order == _second_root->order, "merge: trees of different order");
        _done = _a.is_at_end() || _b.is_at_end();
    }

    merger(const merger&) = delete;
    merger& operator=(const merger&) = delete;

    BT_NODISCARD bool done() const noexcept { return _done; }

    tree_type finish() {
        tree_type result(_builder.finish());
        _prof.set_elements(result.size());
        return result;
    }

    void append_first() { append_rest(_a); }
    void append_second() { append_rest(_b); }

    void copy_from_first(bool inclusive) {
        while (!_done && matches(_a.key(), _b.key(), inclusive)) {
            append_part(_builder, _a.next_part(_b.key(), inclusive));
            _done = _a.is_at_end();
        }
    }

    void copy_from_second(bool inclusive) {
        while (!_done && matches(_b.key(), _a.key(), inclusive)) {
            append_part(_builder, _b.next_part(_a.key(), inclusive));
            _done = _b.is_at_end();
        }
    }

    void skip_from_first(bool inclusive) {
        while (!_done && matches(_a.key(), _b.key(), inclusive)) {
            static_cast<void>(_a.next_part(_b.key(), inclusive));
            _done = _a.is_at_end();
        }
    }

    void skip_from_second(bool inclusive) {
        while (!_done && matches(_b.key(), _a.key(), inclusive)) {
            static_cast<void>(_b.next_part(_a.key(), inclusive));
            _done = _b.is_at_end();
        }
    }

    // Grouping: drops every copy of a common key from the first tree and
    // keeps every copy from the second.
    void copy_common_from_second() {
        while (!_done && keys_equal(_a.key(), _b.key())) {
            if (at_shared_leaf_start()) {
                const element_type* last = nullptr;
                _builder.append(ascend_shared(last));
                finish_group(*last, &_builder);
                continue;
            }
            const Key key = _a.key();
            skip_run(_a, key, nullptr);
            skip_run(_b, key, &_builder);
            _done = _a.is_at_end() || _b.is_at_end();
        }
    }

    // Counting: pairs common elements one-to-one, keeping the second tree's.
    void copy_matching_common_from_second() {
        while (!_done && keys_equal(_a.key(), _b.key())) {
            if (at_shared_leaf_start()) {
                const element_type* last = nullptr;
                _builder.append(ascend_shared(last));
                continue;
            }
            _builder.append(_b.element());
            _a.move_forward();
            _b.move_forward();
            _done = _a.is_at_end() || _b.is_at_end();
        }
    }

    // Grouping: drops every copy of a common key from both trees.
    void skip_common() {
        while (!_done && keys_equal(_a.key(), _b.key())) {
            if (_a.node() == _b.node()) {
                // Everything from here to the end of the shared node is in
                // both trees.
                const element_type* last = nullptr;
                while (!_done && _a.node() == _b.node()) {
                    last = _a.node()->last();
                    if (_a.ascend_one_level()) _done = true;
                    if (_b.ascend_one_level()) _done = true;
                }
                if (!_a.is_at_end()) _a.ascend_to_key();
                if (!_b.is_at_end()) _b.ascend_to_key();
                finish_group(*last, nullptr);
                continue;
            }
            const Key key = _a.key();
            skip_run(_a, key, nullptr);
            skip_run(_b, key, nullptr);
            _done = _a.is_at_end() || _b.is_at_end();
        }
    }

    // Counting: drops common elements pairwise.
    void skip_matching_common() {
        while (!_done && keys_equal(_a.key(), _b.key())) {
            if (at_shared_leaf_start()) {
                const element_type* last = nullptr;
                static_cast<void>(ascend_shared(last));
                continue;
            }
            _a.move_forward();
            _b.move_forward();
            _done = _a.is_at_end() || _b.is_at_end();
        }
    }

private:
    static bool matches(const Key& key, const Key& reference, bool inclusive) {
        return inclusive ? !(reference < key) : key < reference;
    }

    // Moves `p` past every element with key `key`, appending them to `out`
    // when given.
    static void skip_run(path_type& p, const Key& key, builder<Key, Payload>* out) {
        while (!p.is_at_end() && keys_equal(p.key(), key)) {
            auto part = p.next_part(key, true);
            if (out) append_part(*out, part);
        }
    }

    bool at_shared_leaf_start() const {
        return _a.node() == _b.node() && _a.node()->is_leaf() && _a.slot() == 0 && _b.slot() == 0;
    }

    // Both walkers stand at the start of the same leaf.  Climbs while the
    // ancestors are shared as well and returns the largest shared subtree,
    // which both walkers have now passed.  `last` receives its last element.
    pointer ascend_shared(const element_type*& last) {
        pointer shared;
        do {
            shared = _b.focused_subtree(_second_root);
            last = shared->last();
            if (_a.ascend_one_level()) _done = true;
            if (_b.ascend_one_level()) _done = true;
        } while (!_done && _a.node() == _b.node() && _a.slot() == 0 && _b.slot() == 0);
        if (!_a.is_at_end()) _a.ascend_to_key();
        if (!_b.is_at_end()) _b.ascend_to_key();
        return shared;
    }

    // A shared subtree may end in the middle of a run of equal keys.  With
    // grouping the rest of that run belongs to the same group: it is dropped
    // from the first tree and copied from the second when `out` is given.
    void finish_group(const element_type& last, builder<Key, Payload>* out) {
        const Key key = last.first;
        skip_run(_a, key, nullptr);
        skip_run(_b, key, out);
        _done = _a.is_at_end() || _b.is_at_end();
    }

    void append_rest(path_type& p) {
        if (p.is_at_end()) return;
        _builder.append(p.element());
        _builder.append(p.suffix());
        p.move_to_end();
        _done = true;
    }

    profiler _prof;
    pointer _first_root;
    pointer _second_root;
    path_type _a;
    path_type _b;
    builder<Key, Payload> _builder;
    bool _done = false;
};

}  // namespace detail

// ========== Tree operations ==========

// Every element of both trees.  Among equal keys the first tree's elements
// come first.
template <std::totally_ordered Key, typename Payload>
BT_NODISCARD tree<Key, Payload> union_of(const tree<Key, Payload>& first, const tree<Key, Payload>& second) {
    detail::merger<Key, Payload> m("merge::union_of", first, second);
    while (!m.done()) {
        m.copy_from_first(true);
        m.copy_from_second(false);
    }
    m.append_first();
    m.append_second();
    return m.finish();
}

// Like union_of, but a key present in both trees contributes only the
// second tree's elements.
template <std::totally_ordered Key, typename Payload>
BT_NODISCARD tree<Key, Payload> distinct_union(const tree<Key, Payload>& first, const tree<Key, Payload>& second) {
    detail::merger<Key, Payload> m("merge::distinct_union", first, second);
    while (!m.done()) {
        m.copy_from_first(false);
        m.copy_from_second(false);
        m.copy_common_from_second();
    }
    m.append_first();
    m.append_second();
    return m.finish();
}

// Elements of `first` not matched in `second`.
template <std::totally_ordered Key, typename Payload>
BT_NODISCARD tree<Key, Payload> subtracting(const tree<Key, Payload>& first, const tree<Key, Payload>& second,
                                            match_strategy strategy = match_strategy::grouping) {
    detail::merger<Key, Payload> m("merge::subtracting", first, second);
    while (!m.done()) {
        m.copy_from_first(false);
        m.skip_from_second(false);
        if (strategy == match_strategy::grouping) m.skip_common();
        else m.skip_matching_common();
    }
    m.append_first();
    return m.finish();
}

// Elements of either tree not matched in the other.
template <std::totally_ordered Key, typename Payload>
BT_NODISCARD tree<Key, Payload> symmetric_difference(const tree<Key, Payload>& first, const tree<Key, Payload>& second,
                                                     match_strategy strategy = match_strategy::grouping) {
    detail::merger<Key, Payload> m("merge::symmetric_difference", first, second);
    while (!m.done()) {
        m.copy_from_first(false);
        m.copy_from_second(false);
        if (strategy == match_strategy::grouping) m.skip_common();
        else m.skip_matching_common();
    }
    m.append_first();
    m.append_second();
    return m.finish();
}

// Elements of `second` matched in `first`.
template <std::totally_ordered Key, typename Payload>
BT_NODISCARD tree<Key, Payload> intersection(const tree<Key, Payload>& first, const tree<Key, Payload>& second,
                                             match_strategy strategy = match_strategy::grouping) {
    detail::merger<Key, Payload> m("merge::intersection", first, second);
    while (!m.done()) {
        m.skip_from_first(false);
        m.skip_from_second(false);
        if (strategy == match_strategy::grouping) m.copy_common_from_second();
        else m.copy_matching_common_from_second();
    }
    return m.finish();
}

// ========== Key-sequence filters ==========

// Elements of `t` whose keys do not appear in the ascending key sequence.
template <std::totally_ordered Key, typename Payload, std::input_iterator It, std::sentinel_for<It> S>
BT_NODISCARD tree<Key, Payload> subtracting_keys(const tree<Key, Payload>& t, It first, S last) {
    if (t.empty()) return t;
    profiler prof("merge::subtracting_keys");
    builder<Key, Payload> b(t.order());
    tree_path<Key, Payload> p(*t.root(), 0);
    std::optional<Key> previous;
    bool done = false;
    for (; first != last && !done; ++first) {
        const Key& key = *first;
        BT_PRECONDITION(!previous || !(key < *previous), "subtracting_keys: keys are not sorted");
        while (p.key() < key) {
            detail::append_part(b, p.next_part(key, false));
            if (p.is_at_end()) {
                done = true;
                break;
            }
        }
        while (!done && detail::keys_equal(p.key(), key)) {
            static_cast<void>(p.next_part(key, true));
            done = p.is_at_end();
        }
        previous = key;
    }
    if (!p.is_at_end()) {
        b.append(p.element());
        b.append(p.suffix());
    }
    tree<Key, Payload> result(b.finish());
    prof.set_elements(result.size());
    return result;
}

// Elements of `t` whose keys appear in the ascending key sequence.
template <std::totally_ordered Key, typename Payload, std::input_iterator It, std::sentinel_for<It> S>
BT_NODISCARD tree<Key, Payload> intersection_keys(const tree<Key, Payload>& t, It first, S last) {
    if (t.empty()) return t;
    profiler prof("merge::intersection_keys");
    builder<Key, Payload> b(t.order());
    tree_path<Key, Payload> p(*t.root(), 0);
    std::optional<Key> previous;
    bool done = false;
    for (; first != last && !done; ++first) {
        const Key& key = *first;
        BT_PRECONDITION(!previous || !(key < *previous), "intersection_keys: keys are not sorted");
        while (p.key() < key) {
            static_cast<void>(p.next_part(key, false));
            if (p.is_at_end()) {
                done = true;
                break;
            }
        }
        while (!done && detail::keys_equal(p.key(), key)) {
            detail::append_part(b, p.next_part(key, true));
            done = p.is_at_end();
        }
        previous = key;
    }
    tree<Key, Payload> result(b.finish());
    prof.set_elements(result.size());
    return result;
}

template <std::totally_ordered Key, typename Payload, std::ranges::input_range R>
BT_NODISCARD tree<Key, Payload> subtracting_keys(const tree<Key, Payload>& t, const R& keys) {
    return subtracting_keys(t, std::ranges::begin(keys), std::ranges::end(keys));
}

template <std::totally_ordered Key, typename Payload, std::ranges::input_range R>
BT_NODISCARD tree<Key, Payload> intersection_keys(const tree<Key, Payload>& t, const R& keys) {
    return intersection_keys(t, std::ranges::begin(keys), std::ranges::end(keys));
}

}  // namespace bt

#endif  // BT_MERGE_HPP
