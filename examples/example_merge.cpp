#include <iostream>
#include <vector>
#include "../include/bt.hpp"

namespace {

void print(const char* label, const bt::tree<int, char>& t) {
    std::cout << "  " << label << ": ";
    for (const auto& e : t) {
        std::cout << e.first << e.second << " ";
    }
    std::cout << std::endl;
}

}  // namespace

/// Set operations over trees
int main() {
    std::cout << "=== Merge Examples ===" << std::endl << std::endl;

    const auto a = bt::tree<int, char>::from_sorted({{1, 'a'}, {2, 'a'}, {2, 'a'}, {4, 'a'}, {6, 'a'}}, false, 1.0, 5);
    const auto b = bt::tree<int, char>::from_sorted({{2, 'b'}, {3, 'b'}, {4, 'b'}, {5, 'b'}}, false, 1.0, 5);

    // Example 1: Set algebra
    {
        std::cout << "1. Set algebra (grouping equal keys):" << std::endl;
        print("a", a);
        print("b", b);
        print("union_of", bt::union_of(a, b));
        print("distinct_union", bt::distinct_union(a, b));
        print("subtracting", bt::subtracting(a, b));
        print("symmetric_difference", bt::symmetric_difference(a, b));
        print("intersection", bt::intersection(a, b));
        std::cout << std::endl;
    }

    // Example 2: Multiset semantics
    {
        std::cout << "2. Counting equal keys one-to-one:" << std::endl;
        print("subtracting", bt::subtracting(a, b, bt::match_strategy::counting));
        print("intersection", bt::intersection(a, b, bt::match_strategy::counting));
        std::cout << std::endl;
    }

    // Example 3: Filtering by a key list
    {
        std::cout << "3. Key filters:" << std::endl;
        std::vector<int> keys = {2, 6};
        print("subtracting_keys", bt::subtracting_keys(a, keys));
        print("intersection_keys", bt::intersection_keys(a, keys));
        std::cout << std::endl;
    }

    // Example 4: Comparisons
    {
        std::cout << "4. Comparisons:" << std::endl;
        auto copy = a;
        copy.insert({3, 'c'});
        std::cout << "  a subset of copy: " << (bt::is_subset(a, copy) ? "true" : "false") << std::endl;
        std::cout << "  a == copy: " << (a == copy ? "true" : "false") << std::endl;
        std::cout << "  a disjoint from b: " << (bt::is_disjoint(a, b) ? "true" : "false") << std::endl << std::endl;
    }

    std::cout << "=== Examples completed ===" << std::endl;
    return 0;
}
