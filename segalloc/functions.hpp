/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <cstddef> // size_t

#include <segalloc/impexp.hpp>

namespace segalloc {

// Allocate memory from the heap of the calling thread.
// Returns a distinct pointer for size 0.
SEGALLOC_IMPEXP void * malloc(size_t size) noexcept;
// Allocate zeroed memory.
SEGALLOC_IMPEXP void * zalloc(size_t size) noexcept;
// Implementation of a standard calloc function.
SEGALLOC_IMPEXP void * calloc(size_t num, size_t size) noexcept;
// Implementation of a standard realloc function.
// Returns nullptr and keeps p if memory is not available.
SEGALLOC_IMPEXP void * realloc(void *p, size_t size) noexcept;
// alignment must be a power of two not greater than max_alignment.
SEGALLOC_IMPEXP void * malloc_aligned(size_t size, size_t alignment) noexcept;
SEGALLOC_IMPEXP void * zalloc_aligned(size_t size, size_t alignment) noexcept;
SEGALLOC_IMPEXP void * realloc_aligned(void *p, size_t size,
        size_t alignment) noexcept;
// Free memory allocated by functions above in any thread.
SEGALLOC_IMPEXP void free(void *p) noexcept;
// Returns the number of usable bytes in the block pointed by p.
SEGALLOC_IMPEXP size_t usable_size(void const *p) noexcept;
// Returns the number of usable bytes malloc(size) would give.
SEGALLOC_IMPEXP size_t good_size(size_t size) noexcept;

/// Returns trash of the calling thread and of exited threads into pages.
/// If force, also unmaps empty segments of the calling thread.
/// Returns true if some memory was reclaimed.
SEGALLOC_IMPEXP bool collect(bool force) noexcept;

// Calls std::get_new_handler() until allocation succeeds. Returns nullptr if
// there is no handler or it throws std::bad_alloc.
SEGALLOC_IMPEXP void * malloc_with_new_handler(size_t size);
// Collects memory, then calls the previous new handler or throws
// std::bad_alloc. Installed at startup when the allocator replaces malloc.
SEGALLOC_IMPEXP void new_handler();

} // namespace segalloc
