// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef BT_NODE_HPP
#define BT_NODE_HPP

// B-tree node.
//
// A node holds a sorted run of key/payload elements and, unless it is a
// leaf, one more child than it has elements.  At order 2 the minimum is zero
// elements, so non-root leaves may be empty and internal nodes may have a
// single child.  Nodes are shared between trees
// through std::shared_ptr; a node may only be written while its pointer is
// the sole owner, so every editing path calls isolate() (clone on shared
// access) before touching a node.

#include "bt/alloc_hooks.hpp"
#include "bt/config.hpp"

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace bt {

// Tie-break rule among elements with equal keys.
enum class selector : std::uint8_t {
    first,  // the first matching element
    last,   // the last matching element
    any,    // whichever matching element the search meets first
    after   // the first element with a greater key
};

template <std::totally_ordered Key, typename Payload>
struct node {
    using key_type = Key;
    using payload_type = Payload;
    using element_type = std::pair<Key, Payload>;
    using size_type = std::size_t;
    using pointer = std::shared_ptr<node>;

    // Result of split(): the separator element and the new right sibling.
    struct splinter {
        element_type separator;
        pointer sibling;
    };

    // Result of slot_of(): the matching element slot, if any, and the child
    // slot a search for the key continues in.
    struct key_slot {
        std::optional<size_type> match;
        size_type descend;
    };

    // Result of slot_of_position(): an element slot when `match` is set,
    // otherwise a child slot and the offset within that child.
    struct position_slot {
        size_type slot;
        bool match;
        size_type offset;
    };

    std::vector<element_type> elements;
    std::vector<pointer> children;
    size_type count = 0;
    size_type order;
    size_type depth = 0;
    // Bumped each time a tree edits this node in place while it is the root.
    std::uint64_t version = 0;

    // ========== Construction ==========

    explicit node(size_type order_) : order(order_) {}

    node(size_type order_, std::vector<element_type> elements_, std::vector<pointer> children_ = {})
        : elements(std::move(elements_)), children(std::move(children_)), order(order_) {
        recount();
    }

    // New root over two subtrees of equal depth.
    node(pointer left, element_type separator, pointer right)
        : count(left->count + 1 + right->count), order(left->order), depth(left->depth + 1) {
        elements.push_back(std::move(separator));
        children.reserve(2);
        children.push_back(std::move(left));
        children.push_back(std::move(right));
    }

    template <typename... Args>
    BT_NODISCARD static pointer make(Args&&... args) {
        return std::allocate_shared<node>(node_alloc<node>{}, std::forward<Args>(args)...);
    }

    BT_NODISCARD pointer clone() const { return make(*this); }

    // Clone `p` unless it is uniquely owned; returns the writable node.
    static node& isolate(pointer& p) {
        if (p.use_count() != 1) p = p->clone();
        return *p;
    }

    node& make_child_unique(size_type slot) { return isolate(children[slot]); }

    // Node holding elements[begin, end) and the children around them.  An
    // empty range of an internal node is the child at that slot.
    BT_NODISCARD static pointer slice(const node& n, size_type begin, size_type end) {
        if (begin == end && !n.is_leaf()) return n.children[begin];
        std::vector<element_type> elems(n.elements.begin() + begin, n.elements.begin() + end);
        std::vector<pointer> kids;
        if (!n.is_leaf()) kids.assign(n.children.begin() + begin, n.children.begin() + end + 1);
        return make(n.order, std::move(elems), std::move(kids));
    }

    // ========== Shape ==========

    BT_NODISCARD bool is_leaf() const noexcept { return children.empty(); }
    BT_NODISCARD bool empty() const noexcept { return count == 0; }
    BT_NODISCARD size_type max_children() const noexcept { return order; }
    BT_NODISCARD size_type min_children() const noexcept { return (order + 1) / 2; }
    BT_NODISCARD size_type max_keys() const noexcept { return order - 1; }
    BT_NODISCARD size_type min_keys() const noexcept { return min_children() - 1; }
    BT_NODISCARD bool is_too_small() const noexcept { return elements.size() < min_keys(); }
    BT_NODISCARD bool is_too_large() const noexcept { return elements.size() > max_keys(); }
    BT_NODISCARD bool is_balanced() const noexcept { return !is_too_small() && !is_too_large(); }

    void recount() {
        count = elements.size();
        for (const pointer& c : children) count += c->count;
        depth = children.empty() ? 0 : children.front()->depth + 1;
    }

    // ========== Search ==========

    BT_NODISCARD key_slot slot_of(const Key& key, selector sel) const {
        auto key_before = [](const element_type& e, const Key& k) { return e.first < k; };
        auto key_after = [](const Key& k, const element_type& e) { return k < e.first; };
        switch (sel) {
        case selector::any: {
            size_type lo = 0;
            size_type hi = elements.size();
            while (lo < hi) {
                size_type mid = lo + (hi - lo) / 2;
                const Key& k = elements[mid].first;
                if (k < key) lo = mid + 1;
                else if (key < k) hi = mid;
                else return {mid, mid};
            }
            return {std::nullopt, lo};
        }
        case selector::first: {
            size_type s = static_cast<size_type>(
                std::lower_bound(elements.begin(), elements.end(), key, key_before) - elements.begin());
            if (s < elements.size() && !(key < elements[s].first)) return {s, s};
            return {std::nullopt, s};
        }
        case selector::last: {
            size_type s = static_cast<size_type>(
                std::upper_bound(elements.begin(), elements.end(), key, key_after) - elements.begin());
            if (s > 0 && !(elements[s - 1].first < key)) return {s - 1, s};
            return {std::nullopt, s};
        }
        case selector::after: {
            size_type s = static_cast<size_type>(
                std::upper_bound(elements.begin(), elements.end(), key, key_after) - elements.begin());
            if (s < elements.size()) return {s, s};
            return {std::nullopt, s};
        }
        }
        return {std::nullopt, elements.size()};
    }

    // Number of elements in this subtree with keys less than `key`
    // (or not greater than `key` when `inclusive`).
    BT_NODISCARD size_type rank_of(const Key& key, bool inclusive) const {
        const node* n = this;
        size_type base = 0;
        for (;;) {
            size_type s = n->slot_of(key, inclusive ? selector::after : selector::first).descend;
            if (n->is_leaf()) return base + s;
            base += n->position_of_child(s);
            n = n->children[s].get();
        }
    }

    // Maps a position in [0, count] to a slot, scanning from the nearer end.
    BT_NODISCARD position_slot slot_of_position(size_type position) const {
        if (is_leaf()) return {position, true, 0};
        if (position <= count / 2) {
            size_type p = 0;
            for (size_type i = 0; i < elements.size(); ++i) {
                size_type c = children[i]->count;
                if (position < p + c) return {i, false, position - p};
                if (position == p + c) return {i, true, 0};
                p += c + 1;
            }
            return {elements.size(), false, position - p};
        }
        size_type p = count;
        for (size_type i = children.size() - 1; i > 0; --i) {
            p -= children[i]->count;
            if (position >= p) return {i, false, position - p};
            --p;
            if (position == p) return {i - 1, true, 0};
        }
        return {0, false, position};
    }

    // Position of elements[slot] within this subtree; slot == elements.size()
    // maps to count.
    BT_NODISCARD size_type position_of_slot(size_type slot) const {
        if (is_leaf()) return slot;
        if (slot < elements.size() / 2) {
            size_type p = slot;
            for (size_type i = 0; i <= slot; ++i) p += children[i]->count;
            return p;
        }
        size_type p = count;
        for (size_type i = children.size() - 1; i > slot; --i) p -= children[i]->count + 1;
        return p;
    }

    // Position of the first element of children[slot].
    BT_NODISCARD size_type position_of_child(size_type slot) const {
        return slot == 0 ? 0 : position_of_slot(slot - 1) + 1;
    }

    BT_NODISCARD const element_type& element_at(size_type position) const {
        const node* n = this;
        for (;;) {
            position_slot s = n->slot_of_position(position);
            if (s.match) return n->elements[s.slot];
            n = n->children[s.slot].get();
            position = s.offset;
        }
    }

    BT_NODISCARD const element_type* first() const { return count == 0 ? nullptr : &element_at(0); }
    BT_NODISCARD const element_type* last() const { return count == 0 ? nullptr : &element_at(count - 1); }

    // ========== Traversal ==========

    template <typename Fn>
    void for_each(Fn& fn) const {
        if (is_leaf()) {
            for (const element_type& e : elements) fn(e);
            return;
        }
        for (size_type i = 0; i < elements.size(); ++i) {
            children[i]->for_each(fn);
            fn(elements[i]);
        }
        children.back()->for_each(fn);
    }

    // Stops as soon as `fn` returns false; returns false when interrupted.
    template <typename Fn>
    bool for_each_while(Fn& fn) const {
        if (is_leaf()) {
            for (const element_type& e : elements) {
                if (!fn(e)) return false;
            }
            return true;
        }
        for (size_type i = 0; i < elements.size(); ++i) {
            if (!children[i]->for_each_while(fn)) return false;
            if (!fn(elements[i])) return false;
        }
        return children.back()->for_each_while(fn);
    }

    // ========== Slot edits (node must be uniquely owned) ==========

    void insert(element_type element, size_type slot) {
        elements.insert(elements.begin() + slot, std::move(element));
        ++count;
    }

    // Links a splinter of children[slot] in after it.  Counts are unchanged.
    void insert(splinter s, size_type slot) {
        elements.insert(elements.begin() + slot, std::move(s.separator));
        children.insert(children.begin() + slot + 1, std::move(s.sibling));
    }

    element_type remove(size_type slot) {
        element_type old = std::move(elements[slot]);
        elements.erase(elements.begin() + slot);
        --count;
        return old;
    }

    element_type set_element(size_type slot, element_type element) {
        return std::exchange(elements[slot], std::move(element));
    }

    BT_NODISCARD splinter split() {
        const size_type median = elements.size() / 2;
        element_type separator = std::move(elements[median]);
        std::vector<element_type> right(std::make_move_iterator(elements.begin() + median + 1),
                                        std::make_move_iterator(elements.end()));
        elements.erase(elements.begin() + median, elements.end());
        std::vector<pointer> right_children;
        if (!is_leaf()) {
            right_children.assign(std::make_move_iterator(children.begin() + median + 1),
                                  std::make_move_iterator(children.end()));
            children.erase(children.begin() + median + 1, children.end());
        }
        pointer sibling = make(order, std::move(right), std::move(right_children));
        count -= sibling->count + 1;
        return {std::move(separator), std::move(sibling)};
    }

    // Restores the minimum size of children[slot] after it lost an element.
    void fix_deficiency(size_type slot) {
        if (slot > 0 && children[slot - 1]->elements.size() > min_keys()) {
            rotate_right(slot);
        } else if (slot + 1 < children.size() && children[slot + 1]->elements.size() > min_keys()) {
            rotate_left(slot);
        } else if (slot > 0) {
            collapse(slot - 1);
        } else {
            collapse(slot);
        }
    }

    // Moves one element (and subtree) from the right sibling into children[slot].
    void rotate_left(size_type slot) {
        node& child = make_child_unique(slot);
        node& right = make_child_unique(slot + 1);
        child.elements.push_back(std::move(elements[slot]));
        elements[slot] = std::move(right.elements.front());
        right.elements.erase(right.elements.begin());
        size_type moved = 1;
        if (!right.is_leaf()) {
            pointer c = std::move(right.children.front());
            right.children.erase(right.children.begin());
            moved += c->count;
            child.children.push_back(std::move(c));
        }
        right.count -= moved;
        child.count += moved;
    }

    // Moves one element (and subtree) from the left sibling into children[slot].
    void rotate_right(size_type slot) {
        node& left = make_child_unique(slot - 1);
        node& child = make_child_unique(slot);
        child.elements.insert(child.elements.begin(), std::move(elements[slot - 1]));
        elements[slot - 1] = std::move(left.elements.back());
        left.elements.pop_back();
        size_type moved = 1;
        if (!left.is_leaf()) {
            pointer c = std::move(left.children.back());
            left.children.pop_back();
            moved += c->count;
            child.children.insert(child.children.begin(), std::move(c));
        }
        left.count -= moved;
        child.count += moved;
    }

    // Merges children[slot], elements[slot] and children[slot + 1] into one node.
    void collapse(size_type slot) {
        node& left = make_child_unique(slot);
        pointer right = std::move(children[slot + 1]);
        left.count += right->count + 1;
        left.elements.push_back(std::move(elements[slot]));
        take_contents(std::move(right), left.elements, left.children);
        elements.erase(elements.begin() + slot);
        children.erase(children.begin() + slot + 1);
    }

    // Merges `scion`, a subtree of the same depth, into this node around
    // `separator`: after the current contents when `append` is set, before
    // them otherwise.  Returns the upper half when the result overflows.
    std::optional<splinter> graft(element_type separator, pointer scion, bool append) {
        std::vector<element_type> elems;
        std::vector<pointer> kids;
        elems.reserve(elements.size() + 1 + scion->elements.size());
        kids.reserve(children.size() + scion->children.size());
        if (append) {
            std::move(elements.begin(), elements.end(), std::back_inserter(elems));
            std::move(children.begin(), children.end(), std::back_inserter(kids));
            elems.push_back(std::move(separator));
            take_contents(std::move(scion), elems, kids);
        } else {
            take_contents(std::move(scion), elems, kids);
            elems.push_back(std::move(separator));
            std::move(elements.begin(), elements.end(), std::back_inserter(elems));
            std::move(children.begin(), children.end(), std::back_inserter(kids));
        }
        if (elems.size() <= max_keys()) {
            elements = std::move(elems);
            children = std::move(kids);
            recount();
            return std::nullopt;
        }
        const size_type mid = elems.size() / 2;
        element_type upper_separator = std::move(elems[mid]);
        std::vector<element_type> right(std::make_move_iterator(elems.begin() + mid + 1),
                                        std::make_move_iterator(elems.end()));
        elems.erase(elems.begin() + mid, elems.end());
        std::vector<pointer> right_children;
        if (!kids.empty()) {
            right_children.assign(std::make_move_iterator(kids.begin() + mid + 1),
                                  std::make_move_iterator(kids.end()));
            kids.erase(kids.begin() + mid + 1, kids.end());
        }
        elements = std::move(elems);
        children = std::move(kids);
        recount();
        return splinter{std::move(upper_separator), make(order, std::move(right), std::move(right_children))};
    }

    // ========== Whole-tree operations on a root pointer ==========

    // Concatenates two trees around `separator`.  Every key in `left` must
    // not exceed the separator, which must not exceed any key in `right`.
    // The shorter tree is grafted onto the facing spine of the taller one.
    BT_NODISCARD static pointer join(pointer left, element_type separator, pointer right) {
        BT_PRECONDITION(left->order == right->order, "join: trees of different order");
        const bool append = left->depth >= right->depth;
        pointer stock = append ? std::move(left) : std::move(right);
        pointer scion = append ? std::move(right) : std::move(left);
        const size_type grown = scion->count + 1;

        std::vector<node*> spine;
        node* n = &isolate(stock);
        while (n->depth > scion->depth) {
            n->count += grown;
            spine.push_back(n);
            n = &n->make_child_unique(append ? n->children.size() - 1 : 0);
        }
        std::optional<splinter> s = n->graft(std::move(separator), std::move(scion), append);
        while (s && !spine.empty()) {
            node* parent = spine.back();
            spine.pop_back();
            parent->insert(std::move(*s), append ? parent->elements.size() : 0);
            if (parent->is_too_large()) s = parent->split();
            else s.reset();
        }
        if (s) return make(std::move(stock), std::move(s->separator), std::move(s->sibling));
        return stock;
    }

    // Removes the element at `position`, rebalancing on the way back up.
    static element_type remove_at(pointer& root, size_type position) {
        element_type old = isolate(root).remove_position(position);
        collapse_root(root);
        return old;
    }

    // Drops internal roots left without elements.  Such a node has a single
    // child holding the same elements.
    static void collapse_root(pointer& root) {
        while (!root->is_leaf() && root->elements.empty()) {
            pointer child = root->children.front();
            root = std::move(child);
        }
    }

    element_type remove_position(size_type position) {
        if (is_leaf()) return remove(position);
        position_slot s = slot_of_position(position);
        if (s.match && children[s.slot]->count == 0) {
            // No predecessor below an empty child (order 2 only); the child
            // goes with the element.
            children.erase(children.begin() + s.slot);
            return remove(s.slot);
        }
        node& child = make_child_unique(s.slot);
        // An internal element is replaced by its predecessor.
        element_type old = s.match ? set_element(s.slot, child.remove_position(child.count - 1))
                                   : child.remove_position(s.offset);
        --count;
        if (children[s.slot]->is_too_small()) fix_deficiency(s.slot);
        return old;
    }

private:
    static void take_contents(pointer source, std::vector<element_type>& elems, std::vector<pointer>& kids) {
        if (source.use_count() == 1) {
            std::move(source->elements.begin(), source->elements.end(), std::back_inserter(elems));
            std::move(source->children.begin(), source->children.end(), std::back_inserter(kids));
        } else {
            elems.insert(elems.end(), source->elements.begin(), source->elements.end());
            kids.insert(kids.end(), source->children.begin(), source->children.end());
        }
    }
};

template <std::totally_ordered Key, typename Payload>
using node_ptr = typename node<Key, Payload>::pointer;

// Order used when none is given: as many elements as fit the configured
// node footprint, but never fewer than BT_MIN_DEFAULT_ORDER.
template <typename Key, typename Payload>
constexpr std::size_t default_order() noexcept {
    constexpr std::size_t fit = BT_DEFAULT_NODE_BYTES / sizeof(std::pair<Key, Payload>);
    return fit > BT_MIN_DEFAULT_ORDER ? fit : BT_MIN_DEFAULT_ORDER;
}

}  // namespace bt

#endif  // BT_NODE_HPP
