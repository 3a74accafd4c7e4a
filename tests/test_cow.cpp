// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#include "test_support.hpp"

#include <cstddef>
#include <iostream>
#include <utility>

#define TEST(condition, name) \
    if (!(condition)) { \
        std::cerr << "FAIL: " << name << "\n"; \
        return 1; \
    } else { \
        std::cout << "PASS: " << name << "\n"; \
    }

using bt_test::int_tree;
using bt_test::keys_of;
using bt_test::range;

namespace {

std::size_t g_allocations = 0;
std::size_t g_live = 0;

void* counting_allocate(std::size_t n, std::size_t align) {
    ++g_allocations;
    ++g_live;
    return bt::alloc_hooks::default_allocate(n, align);
}

void counting_deallocate(void* p, std::size_t n, std::size_t align) {
    --g_live;
    bt::alloc_hooks::default_deallocate(p, n, align);
}

// Node allocations made by `fn`.
template <typename Fn>
std::size_t allocations_during(Fn&& fn) {
    const std::size_t before = g_allocations;
    fn();
    return g_allocations - before;
}

}  // namespace

int main() {
    bt::set_alloc_hooks(counting_allocate, counting_deallocate);

    {
        const int_tree original = bt_test::sequence_tree(10000, 8);
        const std::size_t levels = original.depth() + 1;
        const std::size_t nodes = g_live;
        TEST(levels >= 4 && nodes > 1000, "fixture: deep tree");

        // Copies share every node.
        int_tree copy = original;
        TEST(g_live == nodes, "copy: no nodes allocated");

        std::size_t n = allocations_during([&] { copy.set_payload_at(0, -1); });
        TEST(n == levels, "edit of a copy clones one path");
        TEST(original[0].second == 0 && copy[0].second == -1, "edit of a copy: original unchanged");

        n = allocations_during([&] { copy.set_payload_at(1, -2); });
        TEST(n == 0, "second edit on the same path reuses the clones");

        n = allocations_during([&] { copy.insert({5000, 1}); });
        TEST(n <= 2 * levels + 1, "insert into a copy: O(depth) nodes");
        n = allocations_during([&] { static_cast<void>(copy.remove(7777)); });
        TEST(n <= 3 * levels, "remove from a copy: O(depth) nodes");
        TEST(keys_of(original) == range(0, 10000) && bt::debug::is_valid(original), "original untouched");
        TEST(copy.size() == 10000 && bt::debug::is_valid(copy), "copy edited");

        n = allocations_during([&] { static_cast<void>(original.subtree(1234, 8765)); });
        TEST(n < 12 * levels, "subtree: O(depth) nodes");

        std::size_t result_size = 0;
        n = allocations_during([&] {
            result_size = int_tree::concat(original, bt_test::make_tree(range(10000, 10010), 8)).size();
        });
        TEST(result_size == 10010 && n < 4 * levels + 8, "concat: O(depth) nodes");

        const int_tree high = bt_test::make_tree(range(20000, 30000), 8);
        n = allocations_during([&] { result_size = bt::union_of(original, high).size(); });
        TEST(result_size == 20000 && n < nodes / 4, "union_of: separate ranges link whole subtrees");

        n = allocations_during([&] { result_size = bt::intersection(original, copy).size(); });
        TEST(result_size == 10000 && n < nodes / 4, "intersection: shared subtrees spliced");
    }
    TEST(g_live == 0, "every node released");

    // Cursor sessions on a shared tree
    {
        const int_tree original = bt_test::sequence_tree(5000, 6);
        int_tree copy = original;
        const std::size_t live = g_live;
        copy.with_cursor_at(2500, [](bt::cursor<int, int>& c) {
            for (int i = 0; i < 10; ++i) c.move_forward();
            c.set_payload(0);
        });
        TEST(g_live - live <= 3 * (original.depth() + 1), "cursor: clones only visited paths");
        TEST(original[2510].second == 25100 && copy[2510].second == 0, "cursor: original unchanged");
    }
    TEST(g_live == 0, "every node released after cursor session");

    bt::alloc_hooks::reset_hooks();
    return 0;
}
