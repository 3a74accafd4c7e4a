// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef BT_BUILDER_HPP
#define BT_BUILDER_HPP

// Bulk loader.
//
// Elements (and whole subtrees) are appended in ascending key order and
// assembled bottom-up in a single left-to-right pass.  The builder keeps a
// line of finished subtrees ("saplings") separated by single elements, plus
// the leaf currently being filled ("seedling").  A finished sapling is merged
// into the line right away, so the line stays logarithmic in length.
//
// Usage:
//     bt::builder<int, std::string> b(order);
//     for (...) b.append({key, payload});
//     auto root = b.finish();

#include "bt/config.hpp"
#include "bt/node.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

namespace bt {

template <std::totally_ordered Key, typename Payload>
class builder {
public:
    using node_type = node<Key, Payload>;
    using element_type = typename node_type::element_type;
    using size_type = typename node_type::size_type;
    using pointer = typename node_type::pointer;

    // Builder filling every node completely.
    explicit builder(size_type order) : builder(order, order - 1) {}

    builder(size_type order, size_type keys_per_node)
        : _order(order), _keys_per_node(keys_per_node), _seedling(node_type::make(order)) {
        BT_PRECONDITION(order >= 2, "builder: order must be at least 2");
        BT_PRECONDITION(keys_per_node >= std::max<size_type>((order - 1) / 2, 1) && keys_per_node <= order - 1,
                        "builder: keys per node out of range");
    }

    // Keys per node for a fill factor in (0, 1].
    BT_NODISCARD static size_type keys_for_fill(size_type order, double fill_factor) {
        BT_PRECONDITION(order >= 2, "builder: order must be at least 2");
        BT_PRECONDITION(fill_factor > 0.0 && fill_factor <= 1.0, "builder: fill factor must be in (0, 1]");
        const size_type lo = std::max<size_type>((order - 1) / 2, 1);
        const size_type hi = order - 1;
        const auto wanted = static_cast<size_type>(std::lround(fill_factor * static_cast<double>(hi)));
        return std::clamp(wanted, lo, hi);
    }

    BT_NODISCARD size_type order() const noexcept { return _order; }
    BT_NODISCARD size_type keys_per_node() const noexcept { return _keys_per_node; }

    void append(element_type element) {
        if (_state == state::separator) {
            _separators.push_back(std::move(element));
            _state = state::element;
            return;
        }
        _seedling->insert(std::move(element), _seedling->elements.size());
        if (_seedling->elements.size() == _keys_per_node) close_seedling();
    }

    // Appends every element of `subtree`.  Internal subtrees are linked in
    // without being copied.
    void append(pointer subtree) {
        BT_PRECONDITION(subtree->order == _order, "builder: subtree of different order");
        if (subtree->count == 0) return;
        node_type::collapse_root(subtree);
        if (subtree->is_leaf()) {
            if (subtree.use_count() == 1) {
                for (element_type& e : subtree->elements) append(std::move(e));
            } else {
                for (const element_type& e : subtree->elements) append(e);
            }
            return;
        }
        if (_state == state::element) {
            if (_seedling->elements.empty()) {
                append_sapling(std::move(subtree));
                _state = state::separator;
                return;
            }
            close_seedling();
        }
        // The subtree's first element separates it from the last sapling.
        _separators.push_back(node_type::remove_at(subtree, 0));
        append_sapling(std::move(subtree));
        _state = state::separator;
    }

    // Returns the root of the assembled tree and resets the builder.
    BT_NODISCARD pointer finish() {
        pointer root;
        if (_state == state::separator) {
            root = std::move(_saplings.back());
            _saplings.pop_back();
        } else {
            root = std::move(_seedling);
        }
        while (!_saplings.empty()) {
            root = node_type::join(std::move(_saplings.back()), std::move(_separators.back()), std::move(root));
            _saplings.pop_back();
            _separators.pop_back();
        }
        _seedling = node_type::make(_order);
        _state = state::element;
        return root;
    }

private:
    enum class state : unsigned char { element, separator };

    void close_seedling() {
        append_sapling(std::move(_seedling));
        _seedling = node_type::make(_order);
        _state = state::separator;
    }

    void append_sapling(pointer sapling) {
        while (!_saplings.empty()) {
            pointer previous = std::move(_saplings.back());
            element_type separator = std::move(_separators.back());
            _saplings.pop_back();
            _separators.pop_back();

            // Join earlier saplings until the line is at least as deep as the newcomer.
            bool joined_all = false;
            while (previous->depth < sapling->depth) {
                if (_saplings.empty()) {
                    sapling = node_type::join(std::move(previous), std::move(separator), std::move(sapling));
                    joined_all = true;
                    break;
                }
                previous = node_type::join(std::move(_saplings.back()), std::move(_separators.back()),
                                           std::move(previous));
                _saplings.pop_back();
                _separators.pop_back();
            }
            if (joined_all) break;

            const bool full_previous = previous->elements.size() >= _keys_per_node;
            const bool full_sapling = sapling->elements.size() >= _keys_per_node;

            if (previous->depth == sapling->depth + 1 && !full_previous && full_sapling) {
                // Graft the sapling under the previous one as its last branch.
                node_type& p = node_type::isolate(previous);
                p.count += sapling->count + 1;
                p.elements.push_back(std::move(separator));
                p.children.push_back(std::move(sapling));
                sapling = std::move(previous);
            } else if (previous->depth == sapling->depth && full_previous && full_sapling) {
                sapling = node_type::make(std::move(previous), std::move(separator), std::move(sapling));
            } else if (previous->depth > sapling->depth || full_previous) {
                _saplings.push_back(std::move(previous));
                _separators.push_back(std::move(separator));
                break;
            } else {
                sapling = node_type::join(std::move(previous), std::move(separator), std::move(sapling));
            }
        }
        _saplings.push_back(std::move(sapling));
    }

    size_type _order;
    size_type _keys_per_node;
    std::vector<pointer> _saplings;
    std::vector<element_type> _separators;
    pointer _seedling;
    state _state = state::element;
};

}  // namespace bt

#endif  // BT_BUILDER_HPP
