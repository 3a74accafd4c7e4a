// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef BT_ALLOC_HOOKS_HPP
#define BT_ALLOC_HOOKS_HPP

// Allocator hooks and node_alloc<T>.
//
// Every b-tree node is created through std::allocate_shared with
// node_alloc<T>, so the node and its control block share one allocation that
// is routed through the pluggable allocate/deallocate function pointers
// below.  Installing custom hooks lets an application account for or pool
// node memory; tests use it to count how many nodes a mutation clones.

#include <atomic>
#include <cstddef>
#include <cstdlib>
#include <new>
#if defined(_MSC_VER)
# include <malloc.h>  // _aligned_malloc / _aligned_free
#endif

namespace bt {

using allocate_fn = void*(*)(std::size_t size, std::size_t align);
using deallocate_fn = void(*)(void* p, std::size_t size, std::size_t align);

namespace alloc_hooks {

    inline void* default_allocate(std::size_t n, std::size_t align) {
        if (n == 0) return nullptr;
#ifdef _WIN32
        return _aligned_malloc(n, align);
#else
        if (align <= alignof(std::max_align_t)) {
            // malloc already guarantees alignof(max_align_t).
            return std::malloc(n);
        }
        // aligned_alloc requires size to be a multiple of alignment.
        std::size_t adj = ((n + align - 1) / align) * align;
        return std::aligned_alloc(align, adj);
#endif
    }

    inline void default_deallocate(void* p, std::size_t, std::size_t) {
        if (!p) return;
#ifdef _WIN32
        _aligned_free(p);
#else
        std::free(p);
#endif
    }

    inline std::atomic<allocate_fn>& get_allocate_ptr() noexcept {
        static std::atomic<allocate_fn> ptr{default_allocate};
        return ptr;
    }

    inline std::atomic<deallocate_fn>& get_deallocate_ptr() noexcept {
        static std::atomic<deallocate_fn> ptr{default_deallocate};
        return ptr;
    }

    inline void* allocate_bytes(std::size_t n, std::size_t align) noexcept {
        return get_allocate_ptr().load(std::memory_order_relaxed)(n, align);
    }

    inline void deallocate_bytes(void* p, std::size_t n, std::size_t align) noexcept {
        get_deallocate_ptr().load(std::memory_order_relaxed)(p, n, align);
    }

    // Passing nullptr for either hook restores its default.  Memory must be
    // released through the hook that allocated it, so swap hooks only while
    // no nodes are alive or when the new hooks forward to the old ones.
    inline void set_hooks(allocate_fn a, deallocate_fn d) noexcept {
        get_allocate_ptr().store(a ? a : default_allocate, std::memory_order_relaxed);
        get_deallocate_ptr().store(d ? d : default_deallocate, std::memory_order_relaxed);
    }

    inline void reset_hooks() noexcept { set_hooks(nullptr, nullptr); }

}  // namespace alloc_hooks

inline void set_alloc_hooks(allocate_fn a, deallocate_fn d) noexcept { alloc_hooks::set_hooks(a, d); }

// Standard allocator adapter over the hooks, for std::allocate_shared.
template <typename T>
struct node_alloc {
    using value_type = T;

    node_alloc() noexcept = default;
    template <typename U> node_alloc(const node_alloc<U>&) noexcept {}

    T* allocate(std::size_t n) {
        void* p = alloc_hooks::allocate_bytes(n * sizeof(T), alignof(T));
        if (!p) throw std::bad_alloc{};
        return static_cast<T*>(p);
    }

    void deallocate(T* p, std::size_t n) noexcept {
        alloc_hooks::deallocate_bytes(p, n * sizeof(T), alignof(T));
    }

    template <typename U> bool operator==(const node_alloc<U>&) const noexcept { return true; }
    template <typename U> bool operator!=(const node_alloc<U>&) const noexcept { return false; }
};

}  // namespace bt

#endif  // BT_ALLOC_HOOKS_HPP
