// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef BT_HPP
#define BT_HPP

// Umbrella header for the bt library.  Including this single header pulls in
// every public component: nodes, the bulk builder, trees with their indices
// and iterators, cursors, and the merge and comparison algorithms.

#include "bt/config.hpp"
#include "bt/alloc_hooks.hpp"
#include "bt/profiling.hpp"
#include "bt/node.hpp"
#include "bt/path.hpp"
#include "bt/builder.hpp"
#include "bt/tree.hpp"
#include "bt/cursor.hpp"
#include "bt/merge.hpp"
#include "bt/compare.hpp"

namespace bt {
    constexpr int MAJOR_VERSION = 1;
    constexpr int MINOR_VERSION = 0;
    constexpr int PATCH_VERSION = 0;

    // Returns the library version as a human-readable string.
    inline const char* version() noexcept {
        return "1.0.0";
    }
}

#endif  // BT_HPP
