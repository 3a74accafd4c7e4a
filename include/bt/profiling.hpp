// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef BT_PROFILING_HPP
#define BT_PROFILING_HPP

// Optional scoped profiler for bulk tree operations.
//
// Define BT_ENABLE_PROFILING before including any bt header to log the
// duration of bulk loads, merges and cursor sessions to std::clog.  Without
// the macro the profiler compiles to a zero-cost no-op.

#include <cstddef>
#include <string_view>

#ifdef BT_ENABLE_PROFILING

#include <chrono>
#include <iostream>
#include <string>

namespace bt {
class profiler {
public:
    explicit profiler(std::string_view label, std::size_t elements = 0)
        : _label(label), _elements(elements), _start(std::chrono::steady_clock::now()) {}

    profiler(const profiler&) = delete;
    profiler& operator=(const profiler&) = delete;

    ~profiler() {
        auto end = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - _start).count();
        std::clog << "[bt::profiler] " << _label;
        if (_elements != 0) std::clog << " (" << _elements << " elements)";
        std::clog << " took " << duration << " us" << '\n';
    }

    // Element count is often only known once the operation is done.
    void set_elements(std::size_t elements) noexcept { _elements = elements; }

private:
    std::string _label;
    std::size_t _elements;
    std::chrono::steady_clock::time_point _start;
};
}  // namespace bt

#else  // BT_ENABLE_PROFILING

namespace bt {
class profiler {
public:
    constexpr explicit profiler(const char*, std::size_t = 0) noexcept {}
    constexpr explicit profiler(std::string_view, std::size_t = 0) noexcept {}
    constexpr void set_elements(std::size_t) noexcept {}
};
}  // namespace bt

#endif  // BT_ENABLE_PROFILING

#define BT_PROFILE_CONCAT_IMPL(a, b) a##b
#define BT_PROFILE_CONCAT(a, b) BT_PROFILE_CONCAT_IMPL(a, b)
#define BT_PROFILE_SCOPE(label, n) ::bt::profiler BT_PROFILE_CONCAT(_bt_profiler_, __LINE__)((label), (n))

#endif  // BT_PROFILING_HPP
