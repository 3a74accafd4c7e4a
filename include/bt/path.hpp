// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef BT_PATH_HPP
#define BT_PATH_HPP

// Read-only root-to-slot navigation.
//
// A tree_path records, for every level from the root down, the node visited
// and a slot in it.  Ancestor slots are child indices; the slot of the last
// level is an element index.  The path never keeps nodes alive: whoever owns
// the path also owns a reference to the root.

#include "bt/config.hpp"
#include "bt/node.hpp"

#include <cstddef>
#include <vector>

namespace bt {

template <std::totally_ordered Key, typename Payload>
class tree_path {
public:
    using node_type = ::bt::node<Key, Payload>;
    using element_type = typename node_type::element_type;
    using size_type = typename node_type::size_type;
    using pointer = typename node_type::pointer;

    struct level {
        const node_type* node;
        size_type slot;
    };

    // A unit of output for the merge walker: either a single element or the
    // elements source->elements[begin, end) together with the children
    // between and around them.
    struct part {
        const element_type* element = nullptr;
        const node_type* source = nullptr;
        size_type begin = 0;
        size_type end = 0;
    };

    tree_path() = default;

    tree_path(const node_type& root, size_type offset) : _root(&root) { move_to(offset); }

    // ========== State ==========

    BT_NODISCARD size_type offset() const noexcept { return _offset; }
    BT_NODISCARD size_type size() const noexcept { return _root->count; }
    BT_NODISCARD bool is_at_start() const noexcept { return _offset == 0; }
    BT_NODISCARD bool is_at_end() const noexcept { return _offset == _root->count; }
    BT_NODISCARD const node_type& root() const noexcept { return *_root; }
    BT_NODISCARD const node_type* node() const noexcept { return _levels.back().node; }
    BT_NODISCARD size_type slot() const noexcept { return _levels.back().slot; }
    BT_NODISCARD size_type length() const noexcept { return _levels.size(); }

    BT_NODISCARD const element_type& element() const {
        BT_PRECONDITION(!is_at_end(), "path: no element at the end");
        const level& cur = _levels.back();
        return cur.node->elements[cur.slot];
    }

    BT_NODISCARD const Key& key() const { return element().first; }

    // Pointer to the subtree rooted at the last level's node.
    BT_NODISCARD pointer focused_subtree(const pointer& root) const {
        if (_levels.size() == 1) return root;
        const level& parent = _levels[_levels.size() - 2];
        return parent.node->children[parent.slot];
    }

    // ========== Movement ==========

    void move_to(size_type offset) {
        BT_PRECONDITION(offset <= _root->count, "path: offset out of range");
        if (offset == _root->count) {
            move_to_end();
            return;
        }
        _levels.clear();
        _offset = offset;
        const node_type* n = _root;
        for (;;) {
            typename node_type::position_slot s = n->slot_of_position(offset);
            _levels.push_back({n, s.slot});
            if (s.match) return;
            n = n->children[s.slot].get();
            offset = s.offset;
        }
    }

    void move_to_start() { move_to(0); }

    // The end position is the rightmost leaf, one past its last element.
    void move_to_end() {
        _levels.clear();
        _offset = _root->count;
        const node_type* n = _root;
        while (!n->is_leaf()) {
            _levels.push_back({n, n->children.size() - 1});
            n = n->children.back().get();
        }
        _levels.push_back({n, n->elements.size()});
    }

    void move_forward() {
        BT_PRECONDITION(!is_at_end(), "path: cannot move forward from the end");
        ++_offset;
        if (_offset == _root->count) {
            move_to_end();
            return;
        }
        level& cur = _levels.back();
        if (cur.node->is_leaf()) {
            if (++cur.slot < cur.node->elements.size()) return;
            ascend_to_key();
            return;
        }
        const node_type* n = cur.node->children[++cur.slot].get();
        while (!n->is_leaf()) {
            _levels.push_back({n, 0});
            n = n->children.front().get();
        }
        _levels.push_back({n, 0});
        if (n->elements.empty()) ascend_to_key();
    }

    void move_backward() {
        BT_PRECONDITION(!is_at_start(), "path: cannot move backward from the start");
        --_offset;
        level& cur = _levels.back();
        if (cur.node->is_leaf()) {
            if (cur.slot > 0) {
                --cur.slot;
                return;
            }
            step_back_from_leaf_start();
            return;
        }
        const node_type* n = cur.node->children[cur.slot].get();
        while (!n->is_leaf()) {
            _levels.push_back({n, n->children.size() - 1});
            n = n->children.back().get();
        }
        if (n->elements.empty()) {
            _levels.push_back({n, 0});
            step_back_from_leaf_start();
            return;
        }
        _levels.push_back({n, n->elements.size() - 1});
    }

    // Pops levels whose slot is past their last element, so that the path
    // addresses an element again.
    void ascend_to_key() {
        BT_PRECONDITION(!is_at_end(), "path: no key to ascend to at the end");
        while (_levels.back().slot == _levels.back().node->elements.size()) _levels.pop_back();
    }

    // Skips the rest of the current node and moves to its parent.  Leaves the
    // path at the end (and returns true) when it ascends past the root or
    // when nothing follows the skipped node.
    bool ascend_one_level() {
        const level& cur = _levels.back();
        if (_levels.size() == 1) {
            _levels.back().slot = cur.node->elements.size();
            _offset = _root->count;
            return true;
        }
        _offset += cur.node->count - cur.node->position_of_slot(cur.slot);
        _levels.pop_back();
        return is_at_end();
    }

    // Skips `n` elements of the current node along with the subtrees that
    // follow each of them.
    void skip_forward(size_type n) {
        level& cur = _levels.back();
        if (!cur.node->is_leaf()) {
            for (size_type i = 0; i < n; ++i) _offset += cur.node->children[cur.slot + i + 1]->count;
        }
        _offset += n;
        cur.slot += n;
        if (!is_at_end()) ascend_to_key();
    }

    // Returns the largest run starting at the current element whose keys all
    // fall below `limit` (or up to and including it when `inclusive`), and
    // moves past it.  At a leaf start the walk first climbs while the parent
    // key also matches, so that whole subtrees are returned at once.
    part next_part(const Key& limit, bool inclusive) {
        auto matches = [&](const Key& k) { return inclusive ? !(limit < k) : k < limit; };

        bool include_leftmost = false;
        if (cur_node().is_leaf() && slot() == 0) {
            while (slot() == 0 && _levels.size() > 1) {
                const level& parent = _levels[_levels.size() - 2];
                if (parent.slot == parent.node->elements.size() || !matches(parent.node->elements[parent.slot].first))
                    break;
                ascend_one_level();
                include_leftmost = true;
            }
        }

        const level cur = _levels.back();
        const node_type& n = *cur.node;
        if (!include_leftmost && !n.is_leaf()) {
            part single{&n.elements[cur.slot], nullptr, 0, 0};
            move_forward();
            return single;
        }

        size_type end = cur.slot + 1;
        while (end < n.elements.size() && matches(n.elements[end].first)) ++end;

        bool include_rightmost = n.is_leaf();
        if (!include_rightmost) {
            const element_type* last = n.children[end]->last();
            include_rightmost = last == nullptr || matches(last->first);
        }
        if (include_rightmost) {
            part run{nullptr, &n, cur.slot, end};
            skip_forward(end - cur.slot);
            return run;
        }
        part run{nullptr, &n, cur.slot, end - 1};
        skip_forward(end - 1 - cur.slot);
        return run;
    }

    // ========== Slicing ==========

    // Tree of every element before the current position.
    BT_NODISCARD pointer prefix() const {
        const level& cur = _levels.back();
        pointer result = node_type::slice(*cur.node, 0, cur.slot);
        for (size_type i = _levels.size() - 1; i-- > 0;) {
            const level& l = _levels[i];
            if (l.slot == 0) continue;
            result = node_type::join(node_type::slice(*l.node, 0, l.slot - 1), l.node->elements[l.slot - 1],
                                     std::move(result));
        }
        return result;
    }

    // Tree of every element after the current one.
    BT_NODISCARD pointer suffix() const {
        BT_PRECONDITION(!is_at_end(), "path: no suffix at the end");
        const level& cur = _levels.back();
        pointer result = node_type::slice(*cur.node, cur.slot + 1, cur.node->elements.size());
        for (size_type i = _levels.size() - 1; i-- > 0;) {
            const level& l = _levels[i];
            if (l.slot == l.node->elements.size()) continue;
            result = node_type::join(std::move(result), l.node->elements[l.slot],
                                     node_type::slice(*l.node, l.slot + 1, l.node->elements.size()));
        }
        return result;
    }

private:
    const node_type& cur_node() const noexcept { return *_levels.back().node; }

    // The path stands at the start of a leaf; climbs to the nearest element
    // on the left.
    void step_back_from_leaf_start() {
        do {
            _levels.pop_back();
        } while (_levels.back().slot == 0);
        --_levels.back().slot;
    }

    const node_type* _root = nullptr;
    std::vector<level> _levels;
    size_type _offset = 0;
};

}  // namespace bt

#endif  // BT_PATH_HPP
