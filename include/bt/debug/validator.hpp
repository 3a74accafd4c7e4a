// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef BT_DEBUG_VALIDATOR_HPP
#define BT_DEBUG_VALIDATOR_HPP

// Structural checks for bt trees.
//
// validate() walks the whole tree and reports every broken invariant as a
// human-readable line.  It is O(n) and meant for tests and debugging; none of
// the tree operations call it.

#include "bt/config.hpp"
#include "bt/node.hpp"
#include "bt/tree.hpp"

#include <cstddef>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace bt::debug {

namespace detail {

template <std::totally_ordered Key, typename Payload>
class validator {
public:
    using node_type = node<Key, Payload>;
    using size_type = typename node_type::size_type;

    explicit validator(size_type order) : _order(order) {}

    void check(const node_type& n, bool is_root, const std::string& where) {
        if (n.order != _order) report(where, "order " + std::to_string(n.order) + " differs from root order");

        if (n.is_leaf()) {
            if (n.elements.size() > n.max_keys()) report(where, "leaf holds too many elements");
            if (!is_root && n.elements.size() < n.min_keys()) report(where, "leaf holds too few elements");
            if (n.depth != 0) report(where, "leaf depth is " + std::to_string(n.depth));
        } else {
            if (n.children.size() != n.elements.size() + 1) {
                report(where, "internal node has " + std::to_string(n.elements.size()) + " elements and " +
                                  std::to_string(n.children.size()) + " children");
                return;
            }
            if (n.children.size() > n.max_children()) report(where, "too many children");
            if (is_root && n.children.size() < 2) report(where, "internal root has fewer than 2 children");
            if (!is_root && n.children.size() < n.min_children()) report(where, "too few children");
        }

        size_type total = n.elements.size();
        for (size_type i = 0; i < n.children.size(); ++i) {
            const node_type& c = *n.children[i];
            const std::string child_where = where + "/" + std::to_string(i);
            if (c.depth + 1 != n.depth) report(child_where, "child depth does not match parent depth");
            total += c.count;
            check(c, false, child_where);
            if (i < n.elements.size()) check_order(n.elements[i].first, child_where);
        }
        if (n.is_leaf()) {
            for (const auto& e : n.elements) check_order(e.first, where);
        }
        if (total != n.count) {
            report(where, "count " + std::to_string(n.count) + " but subtree holds " + std::to_string(total));
        }
    }

    std::vector<std::string> take() { return std::move(_defects); }

private:
    // Keys are visited in tree order; each must not be below the previous.
    void check_order(const Key& key, const std::string& where) {
        if (_previous && key < *_previous) report(where, "keys out of order");
        _previous = &key;
    }

    void report(const std::string& where, const std::string& what) { _defects.push_back(where + ": " + what); }

    size_type _order;
    const Key* _previous = nullptr;
    std::vector<std::string> _defects;
};

template <std::totally_ordered Key, typename Payload>
void dump_node(std::ostringstream& out, const node<Key, Payload>& n) {
    for (std::size_t i = 0; i < n.elements.size(); ++i) {
        if (i > 0) out << ' ';
        if (!n.is_leaf()) {
            out << '(';
            dump_node(out, *n.children[i]);
            out << ") ";
        }
        out << n.elements[i].first;
    }
    if (!n.is_leaf()) {
        out << " (";
        dump_node(out, *n.children.back());
        out << ')';
    }
}

}  // namespace detail

// Every broken invariant of `t`, one line each; empty when `t` is valid.
template <std::totally_ordered Key, typename Payload>
BT_NODISCARD std::vector<std::string> validate(const tree<Key, Payload>& t) {
    if (!t.is_attached()) return {"tree is detached"};
    detail::validator<Key, Payload> v(t.order());
    v.check(*t.root(), true, "root");
    return v.take();
}

template <std::totally_ordered Key, typename Payload>
BT_NODISCARD bool is_valid(const tree<Key, Payload>& t) {
    return validate(t).empty();
}

// Renders the keys of `t` with each child in parentheses, e.g. "(0 1) 2 (3 4)".
template <std::totally_ordered Key, typename Payload>
BT_NODISCARD std::string dump(const tree<Key, Payload>& t) {
    std::ostringstream out;
    if (t.is_attached()) detail::dump_node(out, *t.root());
    return out.str();
}

}  // namespace bt::debug

#endif  // BT_DEBUG_VALIDATOR_HPP
