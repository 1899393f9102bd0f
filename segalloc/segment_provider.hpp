/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <atomic> // atomic
#include <cstddef> // size_t

#include <segalloc/impexp.hpp>

namespace segalloc {

// Source of the memory segments are carved from.
class SEGALLOC_IMPEXP segment_provider {
public:
    virtual ~segment_provider() = default;

    // Maps `size` bytes of zero filled read-write memory at an address which
    // is a multiple of `alignment` (a power of two).
    // Returns nullptr if memory is not available.
    virtual void * map(size_t size, size_t alignment) noexcept = 0;

    // Returns region [p, p + size) obtained from map().
    virtual void unmap(void *p, size_t size) noexcept = 0;
};

// Anonymous private mappings of the operating system.
class SEGALLOC_IMPEXP os_provider final : public segment_provider {
public:
    // Never destroyed.
    static os_provider & instance() noexcept;

    void * map(size_t size, size_t alignment) noexcept override;
    void unmap(void *p, size_t size) noexcept override;

    /// Retries unmapping regions for which munmap failed before.
    /// Returns true if some region was unmapped.
    bool clean() noexcept;

private:
    os_provider() = default;
    os_provider(os_provider const &) = delete;
    void operator = (os_provider const &) = delete;

    void * map_aligned(size_t size, size_t alignment, int flags) noexcept;
    void unmap_region(void *p, size_t size) noexcept;
    void add_region(void *p, size_t size) noexcept;

    // Singly linked list of regions which could not be unmapped. The link and
    // the size are stored in the region itself.
    std::atomic<void *> trash_ = {nullptr};
};

} // namespace segalloc
