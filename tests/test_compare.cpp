// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#include "test_support.hpp"

#include <iostream>
#include <vector>

#define TEST(condition, name) \
    if (!(condition)) { \
        std::cerr << "FAIL: " << name << "\n"; \
        return 1; \
    } else { \
        std::cout << "PASS: " << name << "\n"; \
    }

using bt_test::int_tree;
using bt_test::make_tree;

int main() {
    // Element equality
    {
        const int_tree a = bt_test::sequence_tree(500, 5);
        const int_tree built = make_tree(bt_test::range(0, 500), 7);
        int_tree inserted(5);
        for (int k = 499; k >= 0; --k) inserted.insert({k, bt_test::payload_for(k)});
        TEST(a == inserted && bt::elements_equal(a, inserted), "equal elements, different shapes");
        TEST(bt::elements_equal(a, a), "equal to itself");

        int_tree copy = a;
        TEST(copy == a, "copy: equal");
        copy.set_payload_at(250, -1);
        TEST(copy != a, "copy: payload edit detected");
        copy.set_payload_at(250, 2500);
        TEST(copy == a, "copy: payload restored");
        static_cast<void>(copy.remove(100));
        TEST(copy != a, "copy: size differs");
        copy.insert({100, 1000});
        TEST(copy == a && bt::debug::is_valid(copy), "copy: element restored");

        int_tree keys_only = a;
        for (std::size_t i = 0; i < keys_only.size(); i += 3) keys_only.set_payload_at(i, 0);
        TEST(!bt::elements_equal(a, keys_only), "payloads compared");
        auto same_key = [](const auto& x, const auto& y) { return x.first == y.first; };
        TEST(bt::elements_equal(a, keys_only, same_key), "custom predicate");
        TEST(bt::elements_equal(a, built, same_key), "custom predicate: different order");
        TEST(int_tree(5) == int_tree(5), "empty trees equal");
        TEST(int_tree(5) != a, "empty and non-empty differ");
    }

    // An edited copy is compared along the edited path only
    {
        const int_tree big = bt_test::sequence_tree(100000, 8);
        int_tree edited = big;
        edited.set_payload_at(54321, -1);
        edited.set_payload_at(54321, bt_test::payload_for(54321));
        std::size_t calls = 0;
        auto counting_eq = [&calls](const auto& x, const auto& y) {
            ++calls;
            return x == y;
        };
        TEST(edited.root() != big.root() && bt::elements_equal(big, edited, counting_eq), "edited copy: equal");
        TEST(calls > 0 && calls <= big.order() * (big.depth() + 1), "edited copy: shared subtrees skipped");

        calls = 0;
        edited.set_payload_at(99999, 0);
        TEST(!bt::elements_equal(big, edited, counting_eq) && calls <= 2 * big.order() * (big.depth() + 1),
             "edited copy: difference found without a full walk");
    }

    // Disjoint
    {
        const int_tree odds = make_tree({1, 3, 5, 7, 9}, 4);
        const int_tree evens = make_tree({0, 2, 4, 6, 8}, 4);
        TEST(bt::is_disjoint(odds, evens), "is_disjoint: interleaved");
        TEST(!bt::is_disjoint(odds, make_tree({2, 9}, 4)), "is_disjoint: common last key");
        TEST(!bt::is_disjoint(odds, odds), "is_disjoint: same tree");
        TEST(bt::is_disjoint(odds, int_tree(4)) && bt::is_disjoint(int_tree(4), odds), "is_disjoint: empty");
        TEST(bt::is_disjoint(bt_test::sequence_tree(300, 4), make_tree(bt_test::range(300, 600), 4)),
             "is_disjoint: separate ranges");
    }

    // Subsets
    {
        const int_tree empty(4);
        const int_tree small = make_tree({1, 2}, 4);
        const int_tree full = make_tree({1, 2, 3}, 4);
        TEST(bt::is_subset(empty, empty) && !bt::is_strict_subset(empty, empty), "empty: subset of empty");
        TEST(bt::is_subset(empty, full) && bt::is_strict_subset(empty, full), "empty: strict subset");
        TEST(!bt::is_subset(full, empty), "non-empty: not a subset of empty");
        TEST(bt::is_subset(small, full) && bt::is_strict_subset(small, full), "is_strict_subset");
        TEST(bt::is_subset(full, full) && !bt::is_strict_subset(full, full), "same keys: not strict");
        TEST(!bt::is_subset(make_tree({1, 4}, 4), full), "missing key");
        TEST(!bt::is_subset(make_tree({0, 1}, 4), full), "key before every key");
        TEST(bt::is_subset(make_tree({1, 1, 1}, 4), make_tree({1}, 4)), "duplicates grouped");
        TEST(bt::is_subset(make_tree({1}, 4), make_tree({1, 1, 1}, 4)), "duplicates grouped: reversed");
        TEST(!bt::is_strict_subset(make_tree({1, 1}, 4), make_tree({1}, 4)), "duplicates: not strict");
        TEST(bt::is_superset(full, small) && bt::is_strict_superset(full, small), "is_superset");
        TEST(bt::is_superset(full, full) && !bt::is_strict_superset(full, full), "is_superset: same keys");
        TEST(bt::is_superset(full, empty) && !bt::is_superset(empty, full), "is_superset: empty");
    }

    // Subsets of trees sharing nodes
    {
        const int_tree base = bt_test::sequence_tree(2000, 5);
        int_tree grown = base;
        grown.insert({5000, 0});
        int_tree shrunk = base;
        for (int k = 700; k < 720; ++k) static_cast<void>(shrunk.remove(k));
        int_tree duplicated = base;
        duplicated.insert({1500, 1});

        TEST(bt::is_strict_subset(base, grown) && !bt::is_subset(grown, base), "shared: grown tree");
        TEST(bt::is_strict_subset(shrunk, base) && !bt::is_subset(base, shrunk), "shared: shrunk tree");
        TEST(bt::is_subset(base, duplicated) && !bt::is_strict_subset(base, duplicated), "shared: duplicate key");
        TEST(bt::is_subset(duplicated, base), "shared: duplicate key, reversed");
        TEST(bt::is_subset(shrunk, grown) && bt::is_strict_superset(grown, shrunk), "shared: both edited");
        TEST(!bt::is_disjoint(base, grown), "shared: not disjoint");
        TEST(bt::elements_equal(base, int_tree(base)), "shared: copy equal");
    }

    return 0;
}
