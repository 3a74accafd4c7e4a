// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef BT_TREE_HPP
#define BT_TREE_HPP

// Value-semantic B-tree.
//
// bt::tree holds one shared reference to a root node.  Copying a tree is
// O(1); the first mutation of either copy clones only the nodes on the
// path it edits.  Elements are key/payload pairs kept in ascending key
// order; equal keys are allowed and keep their insertion order.
//
// Positions are addressed three ways:
//  - offsets (size_type), checked through BT_PRECONDITION;
//  - tree_index, a path that fails loudly once the tree is mutated;
//  - tree_iterator, a bidirectional iterator over a snapshot of the tree.

#include "bt/builder.hpp"
#include "bt/config.hpp"
#include "bt/node.hpp"
#include "bt/path.hpp"
#include "bt/profiling.hpp"

#include <compare>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace bt {

template <std::totally_ordered Key, typename Payload>
class tree;

template <std::totally_ordered Key, typename Payload>
class cursor;

// ========== tree_index ==========

// Position handle.  Only the tree it was taken from can resolve it, and only
// until that tree's next mutation.
template <std::totally_ordered Key, typename Payload>
class tree_index {
public:
    using node_type = node<Key, Payload>;
    using path_type = tree_path<Key, Payload>;

    tree_index() = default;

    BT_NODISCARD bool operator==(const tree_index& other) const noexcept {
        return (*this <=> other) == 0;
    }

    // Indices of the same tree state order by offset; indices of different
    // roots or versions order by those first.
    BT_NODISCARD std::strong_ordering operator<=>(const tree_index& other) const noexcept {
        if (_root.owner_before(other._root)) return std::strong_ordering::less;
        if (other._root.owner_before(_root)) return std::strong_ordering::greater;
        if (_version != other._version) return _version <=> other._version;
        return _path.offset() <=> other._path.offset();
    }

private:
    friend class tree<Key, Payload>;

    std::weak_ptr<const node_type> _root;
    std::uint64_t _version = 0;
    path_type _path;
};

// ========== tree_iterator ==========

// Keeps the root it started from alive, so later mutations of the tree
// (which clone the shared root) never disturb it.
template <std::totally_ordered Key, typename Payload>
class tree_iterator {
public:
    using node_type = node<Key, Payload>;
    using path_type = tree_path<Key, Payload>;
    using iterator_category = std::bidirectional_iterator_tag;
    using iterator_concept = std::bidirectional_iterator_tag;
    using value_type = typename node_type::element_type;
    using difference_type = std::ptrdiff_t;
    using reference = const value_type&;
    using pointer = const value_type*;

    tree_iterator() = default;

    tree_iterator(std::shared_ptr<const node_type> root, std::size_t offset)
        : _root(std::move(root)), _path(*_root, offset) {}

    reference operator*() const { return _path.element(); }
    pointer operator->() const { return &_path.element(); }

    tree_iterator& operator++() {
        _path.move_forward();
        return *this;
    }

    tree_iterator operator++(int) {
        tree_iterator tmp = *this;
        _path.move_forward();
        return tmp;
    }

    tree_iterator& operator--() {
        _path.move_backward();
        return *this;
    }

    tree_iterator operator--(int) {
        tree_iterator tmp = *this;
        _path.move_backward();
        return tmp;
    }

    // Iterators over different snapshots never compare equal.
    BT_NODISCARD bool operator==(const tree_iterator& other) const noexcept {
        return _root == other._root && _path.offset() == other._path.offset();
    }

    BT_NODISCARD std::size_t offset() const noexcept { return _path.offset(); }

private:
    std::shared_ptr<const node_type> _root;
    path_type _path;
};

// ========== tree ==========

template <std::totally_ordered Key, typename Payload>
class tree {
public:
    using key_type = Key;
    using payload_type = Payload;
    using node_type = node<Key, Payload>;
    using element_type = typename node_type::element_type;
    using value_type = element_type;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;
    using pointer = typename node_type::pointer;
    using path_type = tree_path<Key, Payload>;
    using builder_type = builder<Key, Payload>;
    using index = tree_index<Key, Payload>;
    using iterator = tree_iterator<Key, Payload>;
    using const_iterator = iterator;
    using reverse_iterator = std::reverse_iterator<iterator>;
    using cursor_type = cursor<Key, Payload>;

    // ========== Construction ==========

    tree() : tree(default_order<Key, Payload>()) {}

    explicit tree(size_type order) : _root(make_root(order)) {}

    explicit tree(pointer root) : _root(std::move(root)) {
        BT_PRECONDITION(_root != nullptr, "tree: null root");
        node_type::collapse_root(_root);
    }

    // Unsorted input; equal keys keep their input order.
    template <std::input_iterator It, std::sentinel_for<It> S>
    tree(It first, S last, size_type order = default_order<Key, Payload>()) : tree(order) {
        for (; first != last; ++first) insert(*first, selector::after);
    }

    tree(std::initializer_list<element_type> init, size_type order = default_order<Key, Payload>())
        : tree(init.begin(), init.end(), order) {}

    tree(const tree&) = default;
    tree(tree&&) noexcept = default;
    tree& operator=(const tree&) = default;
    tree& operator=(tree&&) noexcept = default;
    ~tree() = default;

    // Bulk load from input sorted by key.  With `drop_duplicates` only the
    // last element of each run of equal keys is kept.  `fill_factor` sets
    // how full the loaded nodes are.
    template <std::input_iterator It, std::sentinel_for<It> S>
    BT_NODISCARD static tree from_sorted(It first, S last, bool drop_duplicates = false, double fill_factor = 1.0,
                                         size_type order = default_order<Key, Payload>()) {
        profiler prof("tree::from_sorted");
        builder_type b(order, builder_type::keys_for_fill(order, fill_factor));
        std::optional<element_type> pending;
        for (; first != last; ++first) {
            element_type e = *first;
            if (pending) {
                BT_PRECONDITION(!(e.first < pending->first), "from_sorted: elements are not sorted");
                if (drop_duplicates && !(pending->first < e.first)) {
                    *pending = std::move(e);
                    continue;
                }
                b.append(std::move(*pending));
            }
            pending = std::move(e);
        }
        if (pending) b.append(std::move(*pending));
        tree result(b.finish());
        prof.set_elements(result.size());
        return result;
    }

    BT_NODISCARD static tree from_sorted(std::initializer_list<element_type> init, bool drop_duplicates = false,
                                         double fill_factor = 1.0, size_type order = default_order<Key, Payload>()) {
        return from_sorted(init.begin(), init.end(), drop_duplicates, fill_factor, order);
    }

    // ========== Queries ==========

    BT_NODISCARD size_type size() const {
        check_attached();
        return _root->count;
    }

    BT_NODISCARD bool empty() const { return size() == 0; }

    BT_NODISCARD size_type order() const {
        check_attached();
        return _root->order;
    }

    BT_NODISCARD size_type depth() const {
        check_attached();
        return _root->depth;
    }

    BT_NODISCARD const pointer& root() const {
        check_attached();
        return _root;
    }

    // False once the root has been handed to a cursor or moved out.
    BT_NODISCARD bool is_attached() const noexcept { return _root != nullptr; }

    BT_NODISCARD std::optional<element_type> first() const {
        check_attached();
        const element_type* e = _root->first();
        return e ? std::optional<element_type>(*e) : std::nullopt;
    }

    BT_NODISCARD std::optional<element_type> last() const {
        check_attached();
        const element_type* e = _root->last();
        return e ? std::optional<element_type>(*e) : std::nullopt;
    }

    BT_NODISCARD bool contains(const Key& key, selector sel = selector::any) const {
        return lookup(key, sel).has_value();
    }

    BT_NODISCARD std::optional<Payload> find(const Key& key, selector sel = selector::any) const {
        auto hit = lookup(key, sel);
        if (!hit) return std::nullopt;
        return hit->element->second;
    }

    // Pointer into the tree; valid until the next mutation.
    BT_NODISCARD const element_type* find_element(const Key& key, selector sel = selector::any) const {
        auto hit = lookup(key, sel);
        return hit ? hit->element : nullptr;
    }

    BT_NODISCARD std::optional<size_type> offset_of(const Key& key, selector sel = selector::any) const {
        auto hit = lookup(key, sel);
        if (!hit) return std::nullopt;
        return hit->offset;
    }

    // Number of elements with keys less than `key`.
    BT_NODISCARD size_type lower_bound_offset(const Key& key) const {
        check_attached();
        return _root->rank_of(key, false);
    }

    // Number of elements with keys not greater than `key`.
    BT_NODISCARD size_type upper_bound_offset(const Key& key) const {
        check_attached();
        return _root->rank_of(key, true);
    }

    BT_NODISCARD const element_type& operator[](size_type offset) const {
        BT_PRECONDITION(offset < size(), "tree: offset out of range");
        return _root->element_at(offset);
    }

    // Like operator[], but throws std::out_of_range on invalid offset.
    BT_NODISCARD const element_type& at(size_type offset) const {
        if (offset >= size()) throw std::out_of_range("tree::at: offset out of range");
        return _root->element_at(offset);
    }

    // ========== Traversal ==========

    template <typename Fn>
    void for_each(Fn&& fn) const {
        check_attached();
        _root->for_each(fn);
    }

    // Stops when `fn` returns false.  Returns false if it was interrupted.
    template <typename Fn>
    bool for_each_while(Fn&& fn) const {
        check_attached();
        return _root->for_each_while(fn);
    }

    BT_NODISCARD iterator begin() const {
        check_attached();
        return iterator(_root, 0);
    }

    BT_NODISCARD iterator end() const {
        check_attached();
        return iterator(_root, _root->count);
    }

    BT_NODISCARD reverse_iterator rbegin() const { return reverse_iterator(end()); }
    BT_NODISCARD reverse_iterator rend() const { return reverse_iterator(begin()); }

    // ========== Indices ==========

    BT_NODISCARD index begin_index() const { return index_at(0); }
    BT_NODISCARD index end_index() const { return index_at(size()); }

    BT_NODISCARD index index_at(size_type offset) const {
        BT_PRECONDITION(offset <= size(), "tree: offset out of range");
        index i;
        i._root = _root;
        i._version = _root->version;
        i._path = path_type(*_root, offset);
        return i;
    }

    BT_NODISCARD std::optional<index> index_of(const Key& key, selector sel = selector::any) const {
        auto hit = lookup(key, sel);
        if (!hit) return std::nullopt;
        return index_at(hit->offset);
    }

    BT_NODISCARD size_type offset_of(const index& i) const { return resolve(i).offset(); }

    BT_NODISCARD const element_type& operator[](const index& i) const { return resolve(i).element(); }

    void increment(index& i) const {
        resolve(i);
        i._path.move_forward();
    }

    void decrement(index& i) const {
        resolve(i);
        i._path.move_backward();
    }

    void advance(index& i, difference_type n) const {
        const auto target = static_cast<difference_type>(resolve(i).offset()) + n;
        BT_PRECONDITION(target >= 0 && static_cast<size_type>(target) <= size(), "tree: index advanced out of range");
        if (n == 1) i._path.move_forward();
        else if (n == -1) i._path.move_backward();
        else if (n != 0) i._path.move_to(static_cast<size_type>(target));
    }

    BT_NODISCARD difference_type distance(const index& from, const index& to) const {
        return static_cast<difference_type>(resolve(to).offset()) - static_cast<difference_type>(resolve(from).offset());
    }

    element_type remove_at(const index& i) { return remove_at(offset_of(i)); }

    BT_NODISCARD tree subtree(const index& from, const index& to) const { return subtree(offset_of(from), offset_of(to)); }

    // ========== Keyed mutation ==========

    // `first` inserts before any equal keys; every other selector after them.
    void insert(element_type element, selector sel = selector::any) {
        const selector mode = sel == selector::first ? selector::first : selector::after;
        node_type& r = make_unique_root();
        auto s = insert_into(r, std::move(element), mode);
        if (s) grow_root(std::move(*s));
    }

    // Replaces the selected element with an equal key, or inserts when the
    // key is missing.  Returns the replaced element.
    std::optional<element_type> insert_or_replace(element_type element, selector sel = selector::any) {
        const selector mode = sel == selector::after ? selector::last : sel;
        auto hit = lookup(element.first, mode);
        if (hit) return set_at(hit->offset, std::move(element));
        insert(std::move(element), sel);
        return std::nullopt;
    }

    // Returns the selected element with an equal key, or inserts when the
    // key is missing.
    std::optional<element_type> insert_or_find(element_type element, selector sel = selector::any) {
        const selector mode = sel == selector::after ? selector::last : sel;
        auto hit = lookup(element.first, mode);
        if (hit) return *hit->element;
        insert(std::move(element), sel);
        return std::nullopt;
    }

    // `any` removes the first matching element and `after` the last one.
    std::optional<element_type> remove(const Key& key, selector sel = selector::any) {
        const selector mode = (sel == selector::last || sel == selector::after) ? selector::last : selector::first;
        auto hit = lookup(key, mode);
        if (!hit) return std::nullopt;
        return remove_at(hit->offset);
    }

    // ========== Positional mutation ==========
    //
    // The caller keeps keys in order; the validator reports violations.

    element_type set_at(size_type offset, element_type element) {
        BT_PRECONDITION(offset < size(), "tree: offset out of range");
        node_type* n = &make_unique_root();
        for (;;) {
            auto s = n->slot_of_position(offset);
            if (s.match) return n->set_element(s.slot, std::move(element));
            n = &n->make_child_unique(s.slot);
            offset = s.offset;
        }
    }

    Payload set_payload_at(size_type offset, Payload payload) {
        BT_PRECONDITION(offset < size(), "tree: offset out of range");
        Key key = _root->element_at(offset).first;
        element_type old = set_at(offset, element_type(std::move(key), std::move(payload)));
        return std::move(old.second);
    }

    void insert_at(size_type offset, element_type element) {
        BT_PRECONDITION(offset <= size(), "tree: offset out of range");
        auto s = insert_at_position(make_unique_root(), offset, std::move(element));
        if (s) grow_root(std::move(*s));
    }

    element_type remove_at(size_type offset) {
        BT_PRECONDITION(offset < size(), "tree: offset out of range");
        element_type old = make_unique_root().remove_position(offset);
        node_type::collapse_root(_root);
        return old;
    }

    element_type remove_first() {
        BT_PRECONDITION(!empty(), "tree: remove_first on an empty tree");
        return remove_at(0);
    }

    element_type remove_last() {
        BT_PRECONDITION(!empty(), "tree: remove_last on an empty tree");
        return remove_at(size() - 1);
    }

    void remove_first(size_type n) {
        BT_PRECONDITION(n <= size(), "tree: cannot remove more elements than the tree holds");
        *this = drop_first(n);
    }

    void remove_last(size_type n) {
        BT_PRECONDITION(n <= size(), "tree: cannot remove more elements than the tree holds");
        *this = drop_last(n);
    }

    std::optional<element_type> pop_first() {
        if (empty()) return std::nullopt;
        return remove_at(0);
    }

    std::optional<element_type> pop_last() {
        if (empty()) return std::nullopt;
        return remove_at(size() - 1);
    }

    void clear() { _root = make_root(order()); }

    // ========== Slicing ==========

    // The first `n` elements.
    BT_NODISCARD tree prefix(size_type n) const {
        BT_PRECONDITION(n <= size(), "tree: prefix longer than the tree");
        if (n == size()) return *this;
        return tree(path_type(*_root, n).prefix());
    }

    // The last `n` elements.
    BT_NODISCARD tree suffix(size_type n) const {
        BT_PRECONDITION(n <= size(), "tree: suffix longer than the tree");
        return drop_first(size() - n);
    }

    BT_NODISCARD tree drop_first(size_type n) const {
        BT_PRECONDITION(n <= size(), "tree: cannot drop more elements than the tree holds");
        if (n == 0) return *this;
        if (n == size()) return tree(order());
        return tree(path_type(*_root, n - 1).suffix());
    }

    BT_NODISCARD tree drop_last(size_type n) const {
        BT_PRECONDITION(n <= size(), "tree: cannot drop more elements than the tree holds");
        return prefix(size() - n);
    }

    // Elements at offsets [begin, end).
    BT_NODISCARD tree subtree(size_type begin, size_type end) const {
        BT_PRECONDITION(begin <= end && end <= size(), "tree: invalid offset range");
        return prefix(end).drop_first(begin);
    }

    // Elements with keys less than `key`.
    BT_NODISCARD tree prefix_up_to(const Key& key) const { return prefix(lower_bound_offset(key)); }

    // Elements with keys not greater than `key`.
    BT_NODISCARD tree prefix_through(const Key& key) const { return prefix(upper_bound_offset(key)); }

    // Elements with keys not less than `key`.
    BT_NODISCARD tree suffix_from(const Key& key) const { return drop_first(lower_bound_offset(key)); }

    // Elements with keys greater than `key`.
    BT_NODISCARD tree suffix_after(const Key& key) const { return drop_first(upper_bound_offset(key)); }

    // Elements with keys in [from, to).
    BT_NODISCARD tree subtree_by_key(const Key& from, const Key& to) const {
        BT_PRECONDITION(!(to < from), "tree: key range is reversed");
        return subtree(lower_bound_offset(from), lower_bound_offset(to));
    }

    // Elements with keys in [from, through].
    BT_NODISCARD tree subtree_by_key_through(const Key& from, const Key& through) const {
        BT_PRECONDITION(!(through < from), "tree: key range is reversed");
        return subtree(lower_bound_offset(from), upper_bound_offset(through));
    }

    // ========== Concatenation ==========

    // Every key of `left` must not exceed `separator`, which must not exceed
    // any key of `right`.
    BT_NODISCARD static tree concat(tree left, element_type separator, tree right) {
        BT_PRECONDITION(left.order() == right.order(), "concat: trees of different order");
        BT_PRECONDITION(keys_fit(*left._root, separator.first, *right._root), "concat: keys out of order");
        pointer joined = node_type::join(left.release_root(), std::move(separator), right.release_root());
        // join() may have edited a source root in place.
        ++joined->version;
        return tree(std::move(joined));
    }

    // Every key of `left` must not exceed any key of `right`.
    BT_NODISCARD static tree concat(tree left, tree right) {
        BT_PRECONDITION(left.order() == right.order(), "concat: trees of different order");
        BT_PRECONDITION(left.empty() || keys_fit(*left._root, left._root->last()->first, *right._root),
                        "concat: keys out of order");
        if (right.empty()) return left;
        if (left.empty()) return right;
        element_type separator = left.remove_last();
        return concat(std::move(left), std::move(separator), std::move(right));
    }

    void append(tree other) { *this = concat(std::move(*this), std::move(other)); }

    // ========== Cursor sessions (defined in bt/cursor.hpp) ==========
    //
    // Each helper detaches the root into a cursor, runs fn(cursor&), stores
    // the edited tree back (also when fn throws) and returns fn's result.

    template <typename Fn>
    auto with_cursor_at_start(Fn&& fn);

    template <typename Fn>
    auto with_cursor_at_end(Fn&& fn);

    template <typename Fn>
    auto with_cursor_at(size_type offset, Fn&& fn);

    template <typename Fn>
    auto with_cursor_at(const Key& key, selector sel, Fn&& fn);

private:
    friend class cursor<Key, Payload>;

    struct lookup_result {
        const element_type* element;
        size_type offset;
    };

    using splinter = typename node_type::splinter;

    static pointer make_root(size_type order) {
        BT_PRECONDITION(order >= 2, "tree: order must be at least 2");
        return node_type::make(order);
    }

    void check_attached() const { BT_PRECONDITION(_root != nullptr, "tree used while detached"); }

    // No key of `left` exceeds `key`, and `key` exceeds no key of `right`.
    static bool keys_fit(const node_type& left, const Key& key, const node_type& right) {
        const element_type* l = left.last();
        const element_type* r = right.first();
        return (l == nullptr || !(key < l->first)) && (r == nullptr || !(r->first < key));
    }

    // Isolates the root for an in-place edit and invalidates indices.
    node_type& make_unique_root() {
        check_attached();
        node_type& r = node_type::isolate(_root);
        ++r.version;
        return r;
    }

    pointer release_root() {
        check_attached();
        return std::move(_root);
    }

    template <typename Position, typename Fn>
    auto run_cursor_session(Position&& position, Fn& fn);

    const path_type& resolve(const index& i) const {
        check_attached();
        BT_PRECONDITION(i._root.lock() == _root && i._version == _root->version, "invalid index");
        return i._path;
    }

    // Deepest match wins for first/last/after, so the search keeps going
    // below an internal match.
    std::optional<lookup_result> lookup(const Key& key, selector sel) const {
        check_attached();
        const node_type* n = _root.get();
        size_type base = 0;
        std::optional<lookup_result> found;
        for (;;) {
            auto s = n->slot_of(key, sel);
            if (s.match) {
                found = lookup_result{&n->elements[*s.match], base + n->position_of_slot(*s.match)};
                if (sel == selector::any) return found;
            }
            if (n->is_leaf()) return found;
            base += n->position_of_child(s.descend);
            n = n->children[s.descend].get();
        }
    }

    void grow_root(splinter s) { _root = node_type::make(std::move(_root), std::move(s.separator), std::move(s.sibling)); }

    static std::optional<splinter> insert_into(node_type& n, element_type&& element, selector mode) {
        const size_type slot = n.slot_of(element.first, mode).descend;
        if (n.is_leaf()) {
            n.insert(std::move(element), slot);
        } else {
            ++n.count;
            auto s = insert_into(n.make_child_unique(slot), std::move(element), mode);
            if (s) n.insert(std::move(*s), slot);
        }
        if (n.is_too_large()) return n.split();
        return std::nullopt;
    }

    static std::optional<splinter> insert_at_position(node_type& n, size_type position, element_type&& element) {
        if (n.is_leaf()) {
            n.insert(std::move(element), position);
        } else {
            auto ps = n.slot_of_position(position);
            // Before an internal element means at the end of its left child.
            const size_type child_position = ps.match ? n.children[ps.slot]->count : ps.offset;
            ++n.count;
            auto s = insert_at_position(n.make_child_unique(ps.slot), child_position, std::move(element));
            if (s) n.insert(std::move(*s), ps.slot);
        }
        if (n.is_too_large()) return n.split();
        return std::nullopt;
    }

    pointer _root;
};

}  // namespace bt

#include "bt/cursor.hpp"

#endif  // BT_TREE_HPP
