// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#include "test_support.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <random>
#include <string>
#include <utility>
#include <vector>

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
using bt::match_strategy;

namespace {

// Payload records which input an element came from.
int_tree tagged(const std::vector<int>& keys, int tag, std::size_t order = 5) {
    std::vector<std::pair<int, int>> elements;
    for (int k : keys) elements.emplace_back(k, tag);
    return int_tree::from_sorted(elements.begin(), elements.end(), false, 1.0, order);
}

std::vector<int> tags_of(const int_tree& t) {
    std::vector<int> tags;
    for (const auto& e : t) tags.push_back(e.second);
    return tags;
}

std::vector<int> random_keys(std::mt19937& rng, int count, int max_key) {
    std::uniform_int_distribution<int> key(0, max_key);
    std::vector<int> keys;
    for (int i = 0; i < count; ++i) keys.push_back(key(rng));
    std::sort(keys.begin(), keys.end());
    return keys;
}

// Keys present in `a` but not in `b`, every copy.
std::vector<int> grouped_difference(const std::vector<int>& a, const std::vector<int>& b) {
    std::vector<int> out;
    for (int k : a) {
        if (!std::binary_search(b.begin(), b.end(), k)) out.push_back(k);
    }
    return out;
}

}  // namespace

int main() {
    const std::vector<int> first_keys = {0, 0, 0, 0, 3, 4, 6, 6, 6, 6, 7, 7};
    const std::vector<int> second_keys = {0, 0, 1, 1, 3, 3, 6, 8};
    const int_tree first = tagged(first_keys, 1);
    const int_tree second = tagged(second_keys, 2);

    // Union
    {
        auto u = bt::union_of(first, second);
        TEST(keys_of(u) == std::vector<int>({0, 0, 0, 0, 0, 0, 1, 1, 3, 3, 3, 4, 6, 6, 6, 6, 6, 7, 7, 8}),
             "union_of: keys");
        TEST(tags_of(u) == std::vector<int>({1, 1, 1, 1, 2, 2, 2, 2, 1, 2, 2, 1, 1, 1, 1, 1, 2, 1, 1, 2}),
             "union_of: first tree's elements lead among equal keys");
        TEST(bt::debug::is_valid(u), "union_of: valid");

        auto evens = bt_test::make_tree({}, 5);
        auto odds = bt_test::make_tree({}, 5);
        for (int k = 0; k < 100; ++k) (k % 2 == 0 ? evens : odds).insert({k, k});
        auto all = bt::union_of(evens, odds);
        TEST(keys_of(all) == range(0, 100) && bt::debug::is_valid(all), "union_of: evens and odds");
    }

    // Distinct union
    {
        auto d = bt::distinct_union(first, second);
        TEST(keys_of(d) == std::vector<int>({0, 0, 1, 1, 3, 3, 4, 6, 7, 7, 8}), "distinct_union: keys");
        TEST(tags_of(d) == std::vector<int>({2, 2, 2, 2, 2, 2, 1, 2, 1, 1, 2}),
             "distinct_union: common keys come from the second tree");
        auto r = bt::distinct_union(second, first);
        TEST(keys_of(r) == std::vector<int>({0, 0, 0, 0, 1, 1, 3, 4, 6, 6, 6, 6, 7, 7, 8}),
             "distinct_union: reversed");
        TEST(bt::debug::is_valid(d) && bt::debug::is_valid(r), "distinct_union: valid");
    }

    // Subtraction
    {
        TEST(keys_of(bt::subtracting(first, second)) == std::vector<int>({4, 7, 7}), "subtracting: grouping");
        TEST(keys_of(bt::subtracting(second, first)) == std::vector<int>({1, 1, 8}), "subtracting: grouping, reversed");
        TEST(keys_of(bt::subtracting(first, second, match_strategy::counting)) ==
                 std::vector<int>({0, 0, 4, 6, 6, 6, 7, 7}),
             "subtracting: counting");
        TEST(keys_of(bt::subtracting(second, first, match_strategy::counting)) == std::vector<int>({1, 1, 3, 8}),
             "subtracting: counting, reversed");
        TEST(bt::subtracting(first, int_tree(5)) == first, "subtracting: nothing to remove");
        TEST(bt::subtracting(int_tree(5), first).empty(), "subtracting: from an empty tree");
    }

    // Symmetric difference
    {
        TEST(keys_of(bt::symmetric_difference(first, second)) == std::vector<int>({1, 1, 4, 7, 7, 8}),
             "symmetric_difference: grouping");
        TEST(keys_of(bt::symmetric_difference(first, second, match_strategy::counting)) ==
                 std::vector<int>({0, 0, 1, 1, 3, 4, 6, 6, 6, 7, 7, 8}),
             "symmetric_difference: counting");
        TEST(keys_of(bt::symmetric_difference(second, first)) == std::vector<int>({1, 1, 4, 7, 7, 8}),
             "symmetric_difference: symmetric");
    }

    // Intersection
    {
        auto i = bt::intersection(first, second);
        TEST(keys_of(i) == std::vector<int>({0, 0, 3, 3, 6}), "intersection: grouping");
        TEST(tags_of(i) == std::vector<int>({2, 2, 2, 2, 2}), "intersection: elements of the second tree");
        TEST(keys_of(bt::intersection(second, first)) == std::vector<int>({0, 0, 0, 0, 3, 6, 6, 6, 6}),
             "intersection: grouping, reversed");
        TEST(keys_of(bt::intersection(first, second, match_strategy::counting)) == std::vector<int>({0, 0, 3, 6}),
             "intersection: counting");
        TEST(bt::intersection(first, int_tree(5)).empty(), "intersection: with an empty tree");
    }

    // Random multisets against the standard algorithms
    {
        std::mt19937 rng(2026);
        bool all = true;
        for (std::size_t order : {3, 4, 7}) {
            for (int round = 0; round < 30; ++round) {
                auto a = random_keys(rng, round * 13, 60 + round);
                auto b = random_keys(rng, 200 - round * 5, 80);
                int_tree ta = tagged(a, 1, order);
                int_tree tb = tagged(b, 2, order);

                std::vector<int> merged;
                std::merge(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(merged));
                std::vector<int> difference;
                std::set_difference(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(difference));
                std::vector<int> symmetric;
                std::set_symmetric_difference(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(symmetric));
                std::vector<int> common;
                std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(common));

                auto u = bt::union_of(ta, tb);
                auto s = bt::subtracting(ta, tb, match_strategy::counting);
                auto x = bt::symmetric_difference(ta, tb, match_strategy::counting);
                auto i = bt::intersection(ta, tb, match_strategy::counting);
                auto g = bt::subtracting(ta, tb);
                all = all && keys_of(u) == merged && keys_of(s) == difference && keys_of(x) == symmetric &&
                      keys_of(i) == common && keys_of(g) == grouped_difference(a, b);
                all = all && bt::debug::is_valid(u) && bt::debug::is_valid(s) && bt::debug::is_valid(x) &&
                      bt::debug::is_valid(i) && bt::debug::is_valid(g);

                // Counting keeps every element accounted for.
                all = all && keys_of(bt::union_of(s, i)) == a;
            }
        }
        TEST(all, "random multisets: match the standard algorithms");
    }

    // On sets, the symmetric difference is the union minus the intersection
    {
        std::mt19937 rng(7);
        bool all = true;
        for (int round = 0; round < 20; ++round) {
            auto a = random_keys(rng, 150, 300);
            auto b = random_keys(rng, 150, 300);
            a.erase(std::unique(a.begin(), a.end()), a.end());
            b.erase(std::unique(b.begin(), b.end()), b.end());
            int_tree ta = tagged(a, 1);
            int_tree tb = tagged(b, 2);
            auto x = bt::symmetric_difference(ta, tb);
            auto expected = bt::subtracting(bt::distinct_union(ta, tb), bt::intersection(ta, tb));
            all = all && keys_of(x) == keys_of(expected);
        }
        TEST(all, "sets: symmetric difference is union minus intersection");
    }

    // Trees sharing nodes with each other
    {
        const int_tree base = bt_test::sequence_tree(3000, 5);
        int_tree edited = base;
        for (int k = 1000; k < 1100; ++k) static_cast<void>(edited.remove(k));
        edited.insert({5000, 0});
        edited.insert({2500, 1});

        std::vector<int> edited_keys = keys_of(edited);
        std::vector<int> base_keys = keys_of(base);

        std::vector<int> merged;
        std::merge(base_keys.begin(), base_keys.end(), edited_keys.begin(), edited_keys.end(),
                   std::back_inserter(merged));
        auto u = bt::union_of(base, edited);
        TEST(keys_of(u) == merged && bt::debug::is_valid(u), "shared nodes: union_of");

        auto d = bt::distinct_union(base, edited);
        std::vector<int> distinct = base_keys;
        distinct.insert(std::find(distinct.begin(), distinct.end(), 2500), 2500);
        distinct.push_back(5000);
        TEST(keys_of(d) == distinct && bt::debug::is_valid(d), "shared nodes: distinct_union");

        TEST(keys_of(bt::subtracting(base, edited)) == range(1000, 1100), "shared nodes: subtracting");
        auto added = bt::subtracting(edited, base, match_strategy::counting);
        TEST(keys_of(added) == std::vector<int>({2500, 5000}), "shared nodes: subtracting, counting");

        std::vector<int> xor_keys = range(1000, 1100);
        xor_keys.push_back(5000);
        TEST(keys_of(bt::symmetric_difference(base, edited)) == xor_keys, "shared nodes: symmetric_difference");

        auto i = bt::intersection(base, edited, match_strategy::counting);
        std::vector<int> common = edited_keys;
        common.erase(std::find(common.begin(), common.end(), 5000));
        common.erase(std::find(common.begin(), common.end(), 2500));
        TEST(keys_of(i) == common && bt::debug::is_valid(i), "shared nodes: intersection");

        TEST(bt::subtracting(base, base).empty(), "self: subtracting");
        TEST(bt::symmetric_difference(base, base).empty(), "self: symmetric_difference");
        TEST(bt::intersection(base, base) == base, "self: intersection");
        TEST(bt::distinct_union(base, base) == base, "self: distinct_union");
        TEST(bt::union_of(base, base).size() == 6000, "self: union_of");
    }

    // Order 2
    {
        std::vector<int> twos;
        std::vector<int> threes;
        for (int k = 0; k < 300; ++k) {
            if (k % 2 == 0) twos.push_back(k);
            if (k % 3 == 0) threes.push_back(k);
        }
        const int_tree a = bt_test::make_tree(twos, 2);
        const int_tree b = bt_test::make_tree(threes, 2);

        std::vector<int> merged;
        std::merge(twos.begin(), twos.end(), threes.begin(), threes.end(), std::back_inserter(merged));
        std::vector<int> common;
        std::set_intersection(twos.begin(), twos.end(), threes.begin(), threes.end(), std::back_inserter(common));
        std::vector<int> only_twos;
        std::set_difference(twos.begin(), twos.end(), threes.begin(), threes.end(), std::back_inserter(only_twos));
        std::vector<int> either;
        std::set_symmetric_difference(twos.begin(), twos.end(), threes.begin(), threes.end(),
                                      std::back_inserter(either));

        auto u = bt::union_of(a, b);
        TEST(keys_of(u) == merged && bt::debug::is_valid(u), "order 2: union_of");
        auto i = bt::intersection(a, b);
        TEST(keys_of(i) == common && bt::debug::is_valid(i), "order 2: intersection");
        auto d = bt::subtracting(a, b);
        TEST(keys_of(d) == only_twos && bt::debug::is_valid(d), "order 2: subtracting");
        auto x = bt::symmetric_difference(a, b);
        TEST(keys_of(x) == either && bt::debug::is_valid(x), "order 2: symmetric_difference");

        int_tree edited = a;
        for (int k = 100; k < 140; k += 2) static_cast<void>(edited.remove(k));
        std::vector<int> dropped;
        for (int k = 100; k < 140; k += 2) dropped.push_back(k);
        auto removed = bt::subtracting(a, edited);
        TEST(keys_of(removed) == dropped && bt::debug::is_valid(removed), "order 2: shared nodes");
    }

    // Key-sequence filters
    {
        const int_tree t = bt_test::make_tree({1, 2, 2, 3, 5, 8, 8, 13, 21}, 4);
        std::vector<int> keys = {2, 4, 8, 21, 40};
        TEST(keys_of(bt::subtracting_keys(t, keys)) == std::vector<int>({1, 3, 5, 13}), "subtracting_keys");
        TEST(keys_of(bt::intersection_keys(t, keys)) == std::vector<int>({2, 2, 8, 8, 21}), "intersection_keys");
        TEST(bt::subtracting_keys(t, std::vector<int>{}) == t, "subtracting_keys: no keys");
        TEST(bt::intersection_keys(t, std::vector<int>{}).empty(), "intersection_keys: no keys");

        const int_tree big = bt_test::sequence_tree(1000, 6);
        std::vector<int> multiples;
        for (int k = 0; k < 1000; k += 3) multiples.push_back(k);
        auto kept = bt::intersection_keys(big, multiples.begin(), multiples.end());
        auto rest = bt::subtracting_keys(big, multiples.begin(), multiples.end());
        TEST(keys_of(kept) == multiples && bt::debug::is_valid(kept), "intersection_keys: large tree");
        TEST(rest.size() == 666 && bt::debug::is_valid(rest) && !rest.contains(999) && rest.contains(998),
             "subtracting_keys: large tree");
    }

    return 0;
}
