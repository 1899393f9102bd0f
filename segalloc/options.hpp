/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <cstddef> // size_t

#include <segalloc/impexp.hpp>

namespace segalloc {

// Runtime tunables. Initial values are taken from the environment variables
// SEGALLOC_CACHED_SEGMENTS, SEGALLOC_MAINTAIN_INTERVAL,
// SEGALLOC_LARGE_OS_PAGES and SEGALLOC_VERBOSE.
struct options {
    // Number of empty segments a thread heap keeps instead of unmapping.
    size_t cached_segments = 1;
    // Number of page refills and emptyings of the kept page between two
    // maintenances of a thread heap. Zero keeps the current value.
    unsigned maintain_interval = 1024;
    // Try to back segments by 2 MiB pages of the OS.
    bool large_os_pages = false;
    // Log debug messages.
    bool verbose = false;
};

SEGALLOC_IMPEXP options get_options() noexcept;
// Heaps created before the call keep their cached_segments and
// maintain_interval.
SEGALLOC_IMPEXP void set_options(options const &opts) noexcept;

} // namespace segalloc
