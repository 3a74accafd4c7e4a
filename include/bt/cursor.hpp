// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef BT_CURSOR_HPP
#define BT_CURSOR_HPP

// Batch editor.
//
// A cursor takes exclusive ownership of a tree's root (the source tree is
// left detached) and keeps a path of uniquely owned nodes from the root to
// its position.  The count of every node on the path excludes the child the
// path continues into; counts are restored as the path is popped.  Edits
// inside a leaf therefore touch only the leaf, which makes sequential
// inserts and removals amortized O(1).
//
// Usage:
//     bt::cursor<int, std::string> c(std::move(t));
//     c.move_to(10);
//     c.insert({10, "ten"});
//     t = std::move(c).finish();

#include "bt/builder.hpp"
#include "bt/config.hpp"
#include "bt/node.hpp"
#include "bt/profiling.hpp"
#include "bt/tree.hpp"

#include <cstddef>
#include <exception>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace bt {

template <std::totally_ordered Key, typename Payload>
class cursor {
public:
    using tree_type = tree<Key, Payload>;
    using node_type = node<Key, Payload>;
    using element_type = typename node_type::element_type;
    using size_type = typename node_type::size_type;
    using pointer = typename node_type::pointer;

    // Result of finish_by_cutting().
    struct cut {
        tree_type prefix;
        element_type element;
        tree_type suffix;
    };

    // Positions the cursor at the start.
    explicit cursor(tree_type&& source) : _root(source.release_root()) {
        _count = _root->count;
        descend_to(0);
    }

    cursor(const cursor&) = delete;
    cursor& operator=(const cursor&) = delete;
    cursor(cursor&&) noexcept = default;
    cursor& operator=(cursor&&) noexcept = default;
    ~cursor() = default;

    // ========== State ==========

    // False once one of the finish functions has run.
    BT_NODISCARD bool is_active() const noexcept { return _root != nullptr; }
    BT_NODISCARD size_type offset() const noexcept { return _offset; }
    BT_NODISCARD size_type size() const noexcept { return _count; }
    BT_NODISCARD bool is_at_start() const noexcept { return _offset == 0; }
    BT_NODISCARD bool is_at_end() const noexcept { return _offset == _count; }

    BT_NODISCARD size_type order() const {
        check_active();
        return _root->order;
    }

    BT_NODISCARD const element_type& element() const {
        BT_PRECONDITION(!is_at_end(), "cursor: no element at the end");
        return current();
    }

    BT_NODISCARD const Key& key() const { return element().first; }
    BT_NODISCARD const Payload& payload() const { return element().second; }

    // The new key must keep the tree ordered.
    element_type set_element(element_type element) {
        BT_PRECONDITION(!is_at_end(), "cursor: no element at the end");
        return std::exchange(current(), std::move(element));
    }

    Key set_key(Key key) {
        BT_PRECONDITION(!is_at_end(), "cursor: no element at the end");
        return std::exchange(current().first, std::move(key));
    }

    Payload set_payload(Payload payload) {
        BT_PRECONDITION(!is_at_end(), "cursor: no element at the end");
        return std::exchange(current().second, std::move(payload));
    }

    // ========== Movement ==========

    void move_forward() {
        BT_PRECONDITION(!is_at_end(), "cursor: cannot move forward from the end");
        ++_offset;
        level& cur = _path.back();
        if (cur.node->is_leaf()) {
            ++cur.slot;
            if (cur.slot < cur.node->elements.size() || _offset == _count) return;
            ascend_to_key();
            return;
        }
        // Leftmost leaf of the next subtree.
        node_type* parent = cur.node;
        size_type slot = ++cur.slot;
        for (;;) {
            node_type& child = parent->make_child_unique(slot);
            parent->count -= child.count;
            _path.push_back({&child, 0});
            if (child.is_leaf()) {
                if (child.elements.empty() && _offset < _count) ascend_to_key();
                return;
            }
            parent = &child;
            slot = 0;
        }
    }

    void move_backward() {
        BT_PRECONDITION(!is_at_start(), "cursor: cannot move backward from the start");
        --_offset;
        level& cur = _path.back();
        if (cur.node->is_leaf()) {
            if (cur.slot > 0) {
                --cur.slot;
                return;
            }
            step_back_from_leaf_start();
            return;
        }
        // Rightmost leaf of the preceding subtree.
        node_type* parent = cur.node;
        size_type slot = cur.slot;
        for (;;) {
            node_type& child = parent->make_child_unique(slot);
            parent->count -= child.count;
            if (child.is_leaf()) {
                if (child.elements.empty()) {
                    _path.push_back({&child, 0});
                    step_back_from_leaf_start();
                } else {
                    _path.push_back({&child, child.elements.size() - 1});
                }
                return;
            }
            slot = child.children.size() - 1;
            _path.push_back({&child, slot});
            parent = &child;
        }
    }

    void move_to_start() { move_to(0); }
    void move_to_end() { move_to(_count); }

    void move_to(size_type offset) {
        check_active();
        BT_PRECONDITION(offset <= _count, "cursor: offset out of range");
        ascend_all();
        descend_to(offset);
    }

    // Lands on the element picked by `sel`, or, when `key` is missing, on
    // the first element after it (possibly the end).
    void move_to_key(const Key& key, selector sel = selector::any) {
        check_active();
        ascend_all();
        const size_type lower = _root->rank_of(key, false);
        const size_type upper = _root->rank_of(key, true);
        switch (sel) {
        case selector::first:
        case selector::any:
            descend_to(lower);
            break;
        case selector::last:
            descend_to(upper > lower ? upper - 1 : upper);
            break;
        case selector::after:
            descend_to(upper);
            break;
        }
    }

    // ========== Editing ==========

    // Inserts before the current position; the cursor stays on the element
    // it was on (or at the end).
    void insert(element_type element) {
        check_active();
        descend_to_leaf_slot();
        level& cur = _path.back();
        cur.node->insert(std::move(element), cur.slot);
        ++cur.slot;
        ++_offset;
        ++_count;
        settle();
    }

    // Inserts after the current element and moves onto the new one.
    void insert_after(element_type element) {
        BT_PRECONDITION(!is_at_end(), "cursor: cannot insert after the end");
        move_forward();
        insert(std::move(element));
        move_backward();
    }

    // Inserts every element of `t` before the current position.
    void insert(tree_type t) {
        check_active();
        BT_PRECONDITION(t.order() == _root->order, "cursor: inserted tree has a different order");
        const size_type n = t.size();
        if (n == 0) return;
        BT_PRECONDITION(run_fits(*t.root()), "cursor: inserted keys out of order");
        const size_type at = _offset;
        static_cast<void>(splice(at, at, std::move(t), at + n));
    }

    // Inserts an ascending run of elements before the current position.
    template <std::input_iterator It, std::sentinel_for<It> S>
    void insert(It first, S last) {
        check_active();
        builder<Key, Payload> b(_root->order);
        std::optional<Key> previous;
        for (; first != last; ++first) {
            element_type e = *first;
            BT_PRECONDITION(!previous || !(e.first < *previous), "cursor: inserted run is not sorted");
            previous = e.first;
            b.append(std::move(e));
        }
        insert(tree_type(b.finish()));
    }

    // Removes the current element; the cursor moves to the one after it.
    element_type remove() {
        check_active();
        BT_PRECONDITION(!is_at_end(), "cursor: nothing to remove at the end");
        if (!_path.back().node->is_leaf()) return remove_internal();
        level& cur = _path.back();
        element_type old = cur.node->remove(cur.slot);
        --_count;
        settle();
        return old;
    }

    // Removes the current element and the n - 1 after it.
    void remove(size_type n) {
        check_active();
        BT_PRECONDITION(n <= _count - _offset, "cursor: cannot remove more elements than remain");
        if (n <= _root->order) {
            for (; n > 0; --n) static_cast<void>(remove());
            return;
        }
        const size_type at = _offset;
        static_cast<void>(splice(at, at + n, tree_type(_root->order), at));
    }

    // Removes n elements starting at the current one and returns them as a tree.
    tree_type extract(size_type n) {
        check_active();
        BT_PRECONDITION(n <= _count - _offset, "cursor: cannot extract more elements than remain");
        const size_type at = _offset;
        return splice(at, at + n, tree_type(_root->order), at);
    }

    void remove_all() {
        check_active();
        static_cast<void>(splice(0, _count, tree_type(_root->order), 0));
    }

    // Leaves the cursor at the start.
    void remove_all_before(bool including_current) {
        check_active();
        BT_PRECONDITION(!including_current || !is_at_end(), "cursor: no current element to remove");
        const size_type end = including_current ? _offset + 1 : _offset;
        static_cast<void>(splice(0, end, tree_type(_root->order), 0));
    }

    // Leaves the cursor on the current element, or at the end when the
    // current element was removed too.
    void remove_all_after(bool including_current) {
        check_active();
        BT_PRECONDITION(including_current || !is_at_end(), "cursor: no current element to keep");
        const size_type begin = including_current ? _offset : _offset + 1;
        static_cast<void>(splice(begin, _count, tree_type(_root->order), _offset));
    }

    // ========== Finishing ==========

    BT_NODISCARD tree_type finish() && {
        BT_PROFILE_SCOPE("cursor::finish", _count);
        return take_tree();
    }

    BT_NODISCARD tree_type finish_and_keep_prefix() && {
        BT_PROFILE_SCOPE("cursor::finish", _count);
        const size_type at = _offset;
        return take_tree().prefix(at);
    }

    BT_NODISCARD tree_type finish_and_keep_suffix() && {
        BT_PROFILE_SCOPE("cursor::finish", _count);
        const size_type at = _offset;
        return take_tree().drop_first(at);
    }

    // Splits the tree around the current element.
    BT_NODISCARD cut finish_by_cutting() && {
        BT_PRECONDITION(!is_at_end(), "cursor: no element to cut at the end");
        BT_PROFILE_SCOPE("cursor::finish", _count);
        const size_type at = _offset;
        element_type element = current();
        tree_type whole = take_tree();
        return cut{whole.prefix(at), std::move(element), whole.drop_first(at + 1)};
    }

private:
    struct level {
        node_type* node;
        size_type slot;
    };

    void check_active() const { BT_PRECONDITION(_root != nullptr, "cursor used after finish"); }

    element_type& current() const {
        const level& cur = _path.back();
        return cur.node->elements[cur.slot];
    }

    void pop_level() {
        const level child = _path.back();
        _path.pop_back();
        _path.back().node->count += child.node->count;
    }

    // Pops levels whose slot is past their last element.
    void ascend_to_key() {
        while (_path.back().slot == _path.back().node->elements.size()) pop_level();
    }

    // The keys of `run` fit between the elements around the cursor.
    bool run_fits(const node_type& run) {
        if (!is_at_end() && current().first < run.last()->first) return false;
        if (is_at_start()) return true;
        move_backward();
        const bool fits = !(run.first()->first < current().first);
        move_forward();
        return fits;
    }

    // Climbs from the start of a leaf to the nearest element on the left.
    void step_back_from_leaf_start() {
        do {
            pop_level();
        } while (_path.back().slot == 0);
        --_path.back().slot;
    }

    // Builds the path to `offset` from the root, isolating every node on it.
    // Expects an empty path.
    void descend_to(size_type offset) {
        _offset = offset;
        node_type* n = &node_type::isolate(_root);
        if (offset == _count) {
            while (!n->is_leaf()) {
                const size_type s = n->children.size() - 1;
                node_type& child = n->make_child_unique(s);
                n->count -= child.count;
                _path.push_back({n, s});
                n = &child;
            }
            _path.push_back({n, n->elements.size()});
            return;
        }
        for (;;) {
            auto s = n->slot_of_position(offset);
            _path.push_back({n, s.slot});
            if (s.match) return;
            node_type& child = n->make_child_unique(s.slot);
            n->count -= child.count;
            n = &child;
            offset = s.offset;
        }
    }

    // Restores every count on the path, fixing nodes that over- or
    // underflowed on the way up, and leaves the path empty.
    void ascend_all() {
        while (_path.size() > 1) {
            const level child = _path.back();
            _path.pop_back();
            level& parent = _path.back();
            parent.node->count += child.node->count;
            if (child.node->is_too_large()) parent.node->insert(child.node->split(), parent.slot);
            else if (child.node->is_too_small()) parent.node->fix_deficiency(parent.slot);
        }
        _path.clear();
        if (_root->is_too_large()) {
            auto s = _root->split();
            _root = node_type::make(std::move(_root), std::move(s.separator), std::move(s.sibling));
        }
        node_type::collapse_root(_root);
    }

    // Moves from an internal element to the end of the rightmost leaf of the
    // subtree before it; the position does not change.
    void descend_to_leaf_slot() {
        if (_path.back().node->is_leaf()) return;
        node_type* parent = _path.back().node;
        size_type slot = _path.back().slot;
        for (;;) {
            node_type& child = parent->make_child_unique(slot);
            parent->count -= child.count;
            if (child.is_leaf()) {
                _path.push_back({&child, child.elements.size()});
                return;
            }
            slot = child.children.size() - 1;
            _path.push_back({&child, slot});
            parent = &child;
        }
    }

    // Called after a leaf edit: rebalances when the leaf left its bounds,
    // otherwise climbs back to the element at the current offset.
    void settle() {
        const node_type& leaf = *_path.back().node;
        if (leaf.is_too_large() || (_path.size() > 1 && leaf.is_too_small())) {
            ascend_all();
            descend_to(_offset);
        } else if (_offset < _count) {
            ascend_to_key();
        }
    }

    // An internal element is replaced by its predecessor, the last element of
    // the rightmost leaf before it.  At order 2 that leaf may be empty; the
    // element is then cut out of the tree instead.
    element_type remove_internal() {
        const node_type* n = _path.back().node->children[_path.back().slot].get();
        while (!n->is_leaf()) n = n->children.back().get();
        if (n->elements.empty()) {
            const size_type at = _offset;
            tree_type removed = splice(at, at + 1, tree_type(_root->order), at);
            return removed.remove_first();
        }
        node_type* holder = _path.back().node;
        const size_type slot = _path.back().slot;
        descend_to_leaf_slot();
        level& leaf = _path.back();
        element_type predecessor = leaf.node->remove(leaf.node->elements.size() - 1);
        leaf.slot = leaf.node->elements.size();
        element_type old = holder->set_element(slot, std::move(predecessor));
        --_count;
        ascend_all();
        descend_to(_offset);
        return old;
    }

    // Hands the root back as a tree and deactivates the cursor.
    tree_type take_tree() {
        check_active();
        ascend_all();
        ++_root->version;
        _count = 0;
        _offset = 0;
        return tree_type(std::move(_root));
    }

    // Replaces elements [begin, end) with `replacement`, repositions at
    // `offset` and returns the replaced elements.
    tree_type splice(size_type begin, size_type end, tree_type replacement, size_type offset) {
        tree_type whole = take_tree();
        tree_type removed = whole.subtree(begin, end);
        tree_type edited =
            tree_type::concat(tree_type::concat(whole.prefix(begin), std::move(replacement)), whole.drop_first(end));
        // Release the old root so that nodes it shares with `edited` become
        // uniquely owned again before the path is rebuilt.
        {
            tree_type released = std::move(whole);
        }
        _root = edited.release_root();
        _count = _root->count;
        descend_to(offset);
        return removed;
    }

    pointer _root;
    std::vector<level> _path;
    size_type _offset = 0;
    size_type _count = 0;
};

// ========== tree cursor sessions ==========

template <std::totally_ordered Key, typename Payload>
template <typename Position, typename Fn>
auto tree<Key, Payload>::run_cursor_session(Position&& position, Fn& fn) {
    cursor_type c(std::move(*this));
    try {
        position(c);
        if constexpr (std::is_void_v<std::invoke_result_t<Fn&, cursor_type&>>) {
            fn(c);
            *this = std::move(c).finish();
        } else {
            auto result = fn(c);
            *this = std::move(c).finish();
            return result;
        }
    } catch (...) {
        if (c.is_active()) *this = std::move(c).finish();
        throw;
    }
}

template <std::totally_ordered Key, typename Payload>
template <typename Fn>
auto tree<Key, Payload>::with_cursor_at_start(Fn&& fn) {
    return run_cursor_session([](cursor_type&) {}, fn);
}

template <std::totally_ordered Key, typename Payload>
template <typename Fn>
auto tree<Key, Payload>::with_cursor_at_end(Fn&& fn) {
    return run_cursor_session([](cursor_type& c) { c.move_to_end(); }, fn);
}

template <std::totally_ordered Key, typename Payload>
template <typename Fn>
auto tree<Key, Payload>::with_cursor_at(size_type offset, Fn&& fn) {
    return run_cursor_session([offset](cursor_type& c) { c.move_to(offset); }, fn);
}

template <std::totally_ordered Key, typename Payload>
template <typename Fn>
auto tree<Key, Payload>::with_cursor_at(const Key& key, selector sel, Fn&& fn) {
    return run_cursor_session([&key, sel](cursor_type& c) { c.move_to_key(key, sel); }, fn);
}

}  // namespace bt

#endif  // BT_CURSOR_HPP
