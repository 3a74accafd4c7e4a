#include <iostream>
#include <string>
#include "../include/bt.hpp"

/// Editing a tree in place through a cursor
int main() {
    std::cout << "=== Cursor Examples ===" << std::endl << std::endl;

    // Example 1: Appending through a cursor
    {
        std::cout << "1. Appending:" << std::endl;

        bt::tree<int, std::string> t(4);
        bt::cursor<int, std::string> c(std::move(t));
        for (int k = 0; k < 10; ++k) c.insert({k, std::to_string(k * k)});
        t = std::move(c).finish();
        std::cout << "  Size after append: " << t.size() << std::endl << std::endl;
    }

    // Example 2: Filtering while walking
    {
        std::cout << "2. Removing odd keys:" << std::endl;

        bt::tree<int, int> t(5);
        for (int k = 0; k < 20; ++k) t.insert({k, k});
        t.with_cursor_at_start([](bt::cursor<int, int>& c) {
            while (!c.is_at_end()) {
                if (c.key() % 2 != 0) static_cast<void>(c.remove());
                else c.move_forward();
            }
        });
        std::cout << "  Remaining: ";
        for (const auto& e : t) {
            std::cout << e.first << " ";
        }
        std::cout << std::endl << std::endl;
    }

    // Example 3: Updating payloads in a key range
    {
        std::cout << "3. Updating payloads:" << std::endl;

        bt::tree<int, int> t(5);
        for (int k = 0; k < 20; ++k) t.insert({k, 0});
        const int updated = t.with_cursor_at(5, bt::selector::first, [](bt::cursor<int, int>& c) {
            int n = 0;
            while (!c.is_at_end() && c.key() < 10) {
                c.set_payload(c.key() * 100);
                c.move_forward();
                ++n;
            }
            return n;
        });
        std::cout << "  Updated " << updated << " payloads, key 7 now holds " << *t.find(7) << std::endl << std::endl;
    }

    // Example 4: Cutting a tree in two
    {
        std::cout << "4. Cutting:" << std::endl;

        bt::tree<int, int> t(6);
        for (int k = 0; k < 50; ++k) t.insert({k, k});
        bt::cursor<int, int> c(std::move(t));
        c.move_to_key(20);
        auto cut = std::move(c).finish_by_cutting();
        std::cout << "  Prefix: " << cut.prefix.size() << " elements" << std::endl;
        std::cout << "  Cut at key: " << cut.element.first << std::endl;
        std::cout << "  Suffix: " << cut.suffix.size() << " elements" << std::endl << std::endl;
    }

    std::cout << "=== Examples completed ===" << std::endl;
    return 0;
}
