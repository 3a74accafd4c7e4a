#include <iostream>
#include <string>
#include "../include/bt.hpp"

/// Basic bt::tree usage examples
int main() {
    std::cout << "=== bt library version " << bt::version() << " ===" << std::endl << std::endl;

    // Example 1: Sorted inserts
    {
        std::cout << "1. Sorted inserts:" << std::endl;

        bt::tree<int, std::string> t(5);
        t.insert({3, "three"});
        t.insert({1, "one"});
        t.insert({2, "two"});
        std::cout << "  Size: " << t.size() << ", Order: " << t.order() << std::endl;
        std::cout << "  Elements: ";
        for (const auto& e : t) {
            std::cout << e.first << "=" << e.second << " ";
        }
        std::cout << std::endl << std::endl;
    }

    // Example 2: Lookup by key and by position
    {
        std::cout << "2. Lookup:" << std::endl;

        bt::tree<int, int> t;
        for (int k = 0; k < 1000; ++k) t.insert({k * 2, k});
        if (auto p = t.find(500)) {
            std::cout << "  Payload of key 500: " << *p << std::endl;
        }
        std::cout << "  Contains 501: " << (t.contains(501) ? "true" : "false") << std::endl;
        std::cout << "  Element at offset 10: " << t[10].first << std::endl;
        std::cout << "  Offset of key 600: " << *t.offset_of(600) << std::endl << std::endl;
    }

    // Example 3: Duplicate keys
    {
        std::cout << "3. Duplicate keys:" << std::endl;

        bt::tree<std::string, int> t(4);
        t.insert({"apple", 1});
        t.insert({"apple", 2});
        t.insert({"apple", 0}, bt::selector::first);
        std::cout << "  First apple: " << *t.find("apple", bt::selector::first) << std::endl;
        std::cout << "  Last apple: " << *t.find("apple", bt::selector::last) << std::endl << std::endl;
    }

    // Example 4: Cheap copies
    {
        std::cout << "4. Copy on write:" << std::endl;

        auto original = bt::tree<int, int>::from_sorted({{1, 1}, {2, 2}, {3, 3}});
        bt::tree<int, int> copy = original;
        copy.insert({4, 4});
        std::cout << "  Original size: " << original.size() << std::endl;
        std::cout << "  Copy size: " << copy.size() << std::endl << std::endl;
    }

    // Example 5: Slicing
    {
        std::cout << "5. Slicing:" << std::endl;

        bt::tree<int, int> t(8);
        for (int k = 0; k < 100; ++k) t.insert({k, k});
        auto middle = t.subtree_by_key(40, 45);
        std::cout << "  Keys in [40, 45): ";
        middle.for_each([](const auto& e) { std::cout << e.first << " "; });
        std::cout << std::endl;
        auto joined = bt::tree<int, int>::concat(t.prefix(10), t.suffix(10));
        std::cout << "  First ten and last ten: " << joined.size() << " elements" << std::endl << std::endl;
    }

    std::cout << "=== Examples completed ===" << std::endl;
    return 0;
}
