// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef BT_CONFIG_HPP
#define BT_CONFIG_HPP

// Configuration and feature-detection for bt.
//
// Baseline: C++20
//
// This header intentionally contains only preprocessor logic and small helpers.

#include <cstddef>
#include <cstdlib>
#include <iostream>

#ifndef BT_DEFAULT_NODE_BYTES
// Target footprint of the element array of a node.  The default tree order
// is derived from it (see bt::default_order).
#define BT_DEFAULT_NODE_BYTES 16383
#endif

#ifndef BT_MIN_DEFAULT_ORDER
#define BT_MIN_DEFAULT_ORDER 8
#endif

// -------- Language version detection --------

#if defined(_MSVC_LANG)
#define BT_CPP_LANG _MSVC_LANG
#else
#define BT_CPP_LANG __cplusplus
#endif

#if BT_CPP_LANG >= 202302L
#define BT_HAS_CPP23 1
#else
#define BT_HAS_CPP23 0
#endif

#if BT_CPP_LANG >= 202002L
#define BT_HAS_CPP20 1
#else
#define BT_HAS_CPP20 0
#endif

#if !BT_HAS_CPP20
#error "bt requires C++20"
#endif

// Attributes / hints
#define BT_NODISCARD [[nodiscard]]

#define BT_STRINGIFY_IMPL(x) #x
#define BT_STRINGIFY(x) BT_STRINGIFY_IMPL(x)
#define BT_LOC (__FILE__ ":" BT_STRINGIFY(__LINE__))

// -------- Precondition checks --------
//
// Caller errors (out-of-range offsets, mismatched orders, stale indices,
// detached trees) are fatal.  The hook may be overridden before including
// any bt header, e.g. to throw from a test harness.

namespace bt::detail {

[[noreturn]] inline void precondition_failed(const char* message, const char* location) noexcept {
    std::cerr << "[bt] precondition failed: " << message << " (" << location << ")\n";
    std::abort();
}

}  // namespace bt::detail

#ifndef BT_PRECONDITION_FAILED
#define BT_PRECONDITION_FAILED(msg) ::bt::detail::precondition_failed((msg), BT_LOC)
#endif

#define BT_PRECONDITION(cond, msg)      \
    do {                                \
        if (!(cond)) {                  \
            BT_PRECONDITION_FAILED(msg); \
        }                               \
    } while (0)

#endif  // BT_CONFIG_HPP
