/*
 * Copyright (C) Andrey Pikas
 */

#include <segalloc/segment_provider.hpp>

#include <cerrno>
#include <cstdint> // uintptr_t
#include <new> // placement new

#include <sys/mman.h>

#include <segalloc/options.hpp>
#include <segalloc/size_class.hpp>

#include "log.hpp"

namespace segalloc {

namespace {

constexpr size_t PAGESIZE = 4096;
constexpr size_t HUGEPAGESIZE = 2 << 20;

} // namespace

os_provider & os_provider::instance() noexcept
{
    // Segments may be unmapped by threads exiting after static destructors.
    alignas(os_provider) static unsigned char storage[sizeof(os_provider)];
    static os_provider *inst = new (storage) os_provider;
    return *inst;
}

void * os_provider::map(size_t size, size_t alignment) noexcept
{
    clean();

    if (alignment < PAGESIZE)
        alignment = PAGESIZE;
    size = align_up(size, PAGESIZE);

    if (get_options().large_os_pages && size % HUGEPAGESIZE == 0
            && alignment % HUGEPAGESIZE == 0) {
#ifndef MAP_HUGE_2MB
        constexpr int MAP_HUGE_2MB = (21 << MAP_HUGE_SHIFT);
#endif
        if (void *p = map_aligned(size, alignment, MAP_HUGETLB | MAP_HUGE_2MB))
            return p;
    }

    void *p = map_aligned(size, alignment, 0);
    if (!p) {
        int err = errno;
        SEGALLOC_LOG(warning) << "mmap of " << size << " bytes failed, errno "
            << err;
    }
    return p;
}

void * os_provider::map_aligned(size_t size, size_t alignment, int flags)
    noexcept
{
    int const prot = PROT_READ | PROT_WRITE;
    flags |= MAP_PRIVATE | MAP_ANONYMOUS;

    // Mapping of exact size is often aligned already.
    char *p = (char *)mmap(nullptr, size, prot, flags, -1, 0);
    if (p == MAP_FAILED || !p) // Allow zero page to leak.
        return nullptr;
    if (!(uintptr_t(p) & (alignment - 1)))
        return p;
    unmap_region(p, size);

    if (size + alignment < size)
        return nullptr;
    p = (char *)mmap(nullptr, size + alignment, prot, flags, -1, 0);
    if (p == MAP_FAILED || !p) // Allow zero page to leak.
        return nullptr;
    size_t left_pad_size = (alignment - (uintptr_t(p) & (alignment - 1)))
        & (alignment - 1);
    size_t right_pad_size = alignment - left_pad_size;
    if (left_pad_size)
        unmap_region(p, left_pad_size);
    p += left_pad_size;
    if (right_pad_size)
        unmap_region(p + size, right_pad_size);
    return p;
}

void os_provider::unmap(void *p, size_t size) noexcept
{
    unmap_region(p, align_up(size, PAGESIZE));
}

void os_provider::unmap_region(void *p, size_t size) noexcept
{
    // munmap may fail if unmaping should split mapped region into two ones
    // and make number of mapped regions greater then vm.max_map_count.
    // Such regions are retried later.
    if (munmap(p, size) == 0)
        return;
    int err = errno;
    SEGALLOC_LOG(warning) << "munmap of " << size << " bytes at " << p
        << " failed, errno " << err << ", will retry";
    add_region(p, size);
}

void os_provider::add_region(void *p, size_t size) noexcept
{
    reinterpret_cast<size_t *>(p)[1] = size;
    *reinterpret_cast<void **>(p) = trash_.load(std::memory_order_relaxed);
    while (!trash_.compare_exchange_weak(
                *reinterpret_cast<void **>(p), p,
                std::memory_order_release, std::memory_order_relaxed)) {}
}

bool os_provider::clean() noexcept
{
    if (!trash_.load(std::memory_order_relaxed))
        return false;

    bool result = false;
    // Unmapping in different orders may find an order in which regions are
    // unmapped from ends of mapped regions.
    for (bool unmaped = true; unmaped;) {
        unmaped = false;
        void *p = trash_.exchange(nullptr, std::memory_order_acquire);
        while (p) {
            size_t *r = reinterpret_cast<size_t *>(p);
            p = *reinterpret_cast<void **>(p);
            if (munmap(r, r[1]) == 0)
                result = unmaped = true;
            else
                add_region(r, r[1]);
        }
    }
    return result;
}

} // namespace segalloc
