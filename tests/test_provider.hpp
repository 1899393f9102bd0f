/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <atomic>
#include <cstddef>

#include <segalloc/segment_provider.hpp>

// Maps through os_provider and counts calls. Can be switched to fail.
class counting_provider : public segalloc::segment_provider {
public:
    void * map(size_t size, size_t alignment) noexcept override
    {
        if (fail.load(std::memory_order_relaxed))
            return nullptr;
        void *p = segalloc::os_provider::instance().map(size, alignment);
        if (p) {
            maps.fetch_add(1, std::memory_order_relaxed);
            last_size.store(size, std::memory_order_relaxed);
        }
        return p;
    }

    void unmap(void *p, size_t size) noexcept override
    {
        unmaps.fetch_add(1, std::memory_order_relaxed);
        segalloc::os_provider::instance().unmap(p, size);
    }

    size_t live() const noexcept
    {
        return maps.load(std::memory_order_relaxed)
            - unmaps.load(std::memory_order_relaxed);
    }

    std::atomic<size_t> maps = {0};
    std::atomic<size_t> unmaps = {0};
    std::atomic<size_t> last_size = {0};
    std::atomic<bool> fail = {false};
};
