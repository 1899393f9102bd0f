/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <algorithm> // min, max
#include <atomic> // atomic
#include <cstddef> // size_t
#include <cstdint> // uintptr_t

#include <boost/smart_ptr/detail/spinlock.hpp>

#include <segalloc/size_class.hpp>

namespace segalloc {

class segment_provider;

// Fresh blocks are linked into the free list by this many bytes at a time.
constexpr size_t extend_bytes = 4096;

// Size class of the single page of a huge segment.
constexpr unsigned huge_class = size_class_count;

[[gnu::always_inline]]
inline char * align_up(char *p, size_t alignment)
{
    return reinterpret_cast<char *>(
            align_up(reinterpret_cast<uintptr_t>(p), alignment));
}

///
/// page_header
///

// Metadata of a page. Lives in the header of the page's segment.
struct page_header {
    void *free = nullptr; // free blocks linked through their first word
    page_header *next = nullptr; // page queue or free pages of the segment
    page_header *prev = nullptr;
    char *area = nullptr; // first block
    size_t block_size = 0;
    unsigned used = 0; // blocks handed out
    unsigned capacity = 0; // blocks linked into the free list so far
    unsigned reserved = 0; // blocks which fit into the page
    unsigned short size_class = 0;
    bool in_use = false;
    bool in_full = false; // in the full queue of the heap
    bool ever_used = false; // memory was written since it was mapped
    bool is_zero = false; // memory of not yet linked blocks is zero
    bool free_is_zero = false; // blocks in free list are zero but the link
    bool has_aligned = false; // some block handed out by interior pointer
    bool idle = false; // empty since the last maintenance

    inline void init(unsigned cls, size_t size, char *start,
            size_t area_size) noexcept;
    inline void * alloc(bool &zeroed) noexcept;
    inline void put_free(void *block) noexcept;
    inline void extend() noexcept;

    bool is_full() const noexcept
    {
        return !free && capacity == reserved;
    }

    // Start of the block containing p.
    char * block_start(void const *p) const noexcept
    {
        size_t offs = static_cast<char const *>(p) - area;
        return area + offs - offs % block_size;
    }
};

inline void page_header::init(unsigned cls, size_t size, char *start,
        size_t area_size) noexcept
{
    free = nullptr;
    area = start;
    block_size = size;
    used = 0;
    capacity = 0;
    reserved = static_cast<unsigned>(area_size / size);
    size_class = static_cast<unsigned short>(cls);
    in_use = true;
    in_full = false;
    is_zero = !ever_used;
    ever_used = true;
    free_is_zero = false;
    has_aligned = false;
    idle = false;
}

inline void page_header::extend() noexcept
{
    size_t cnt = std::min<size_t>(reserved - capacity,
            std::max<size_t>(1, extend_bytes / block_size));
    char *p = area + capacity * block_size;
    free = p;
    for (size_t i = 1; i < cnt; ++i, p += block_size)
        *reinterpret_cast<void **>(p) = p + block_size;
    *reinterpret_cast<void **>(p) = nullptr;
    capacity += static_cast<unsigned>(cnt);
    free_is_zero = is_zero;
}

inline void * page_header::alloc(bool &zeroed) noexcept
{
    if (!free) {
        if (capacity == reserved)
            return nullptr;
        extend();
    }
    void *result = free;
    zeroed = free_is_zero;
    free = *reinterpret_cast<void **>(result);
    ++used;
    return result;
}

inline void page_header::put_free(void *block) noexcept
{
    *reinterpret_cast<void **>(block) = free;
    free = block;
    free_is_zero = false;
    --used;
}

///
/// segment_header
///

// Placed at the start of every segment. Segments are aligned by
// segment_size, so the header of any block's segment is found by masking.
struct segment_header {
    // heap_local or heap_global
    std::atomic<void *> owner = {nullptr};
    // Held by foreign frees and by transfer of ownership.
    boost::detail::spinlock owner_lock = BOOST_DETAIL_SPINLOCK_INIT;
    segment_provider *provider = nullptr;
    segment_header *next = nullptr; // segment list of the owner
    segment_header *prev = nullptr;
    size_t mapped_size = 0;
    segment_kind kind = segment_kind::small;
    unsigned page_shift = small_page_shift;
    unsigned page_count = 0;
    unsigned used_pages = 0;
    page_header *free_pages = nullptr; // singly linked
    page_header pages[max_pages_per_segment];

    // fresh: memory was not written since it was mapped.
    inline void init(segment_kind kind, bool fresh) noexcept;

    inline page_header * page_of(void const *p) noexcept;
    inline char * page_start(page_header const *page) noexcept;
    inline size_t page_area(page_header const *page) const noexcept;
    inline page_header * take_page() noexcept;
    inline void retire_page(page_header *page) noexcept;
};

constexpr size_t segment_header_size = align_up(sizeof(segment_header), 64);

[[gnu::always_inline]]
inline segment_header * segment_of(void const *p)
{
    return reinterpret_cast<segment_header *>(
            reinterpret_cast<uintptr_t>(p) & ~segment_mask);
}

inline void segment_header::init(segment_kind kind, bool fresh) noexcept
{
    this->kind = kind;
    switch (kind) {
    case segment_kind::small:
        page_shift = small_page_shift;
        break;
    case segment_kind::medium:
        page_shift = medium_page_shift;
        break;
    default:
        page_shift = large_page_shift;
        break;
    }
    page_count = static_cast<unsigned>(segment_size >> page_shift);
    used_pages = 0;
    free_pages = nullptr;
    for (unsigned i = page_count; i-- > 0;) {
        page_header &page = pages[i];
        page = page_header();
        page.ever_used = !fresh;
        page.next = free_pages;
        free_pages = &page;
    }
}

inline page_header * segment_header::page_of(void const *p) noexcept
{
    uintptr_t offs = reinterpret_cast<uintptr_t>(p)
        - reinterpret_cast<uintptr_t>(this);
    return &pages[offs >> page_shift];
}

inline char * segment_header::page_start(page_header const *page) noexcept
{
    size_t idx = page - pages;
    char *start = reinterpret_cast<char *>(this) + (idx << page_shift);
    return idx ? start : start + segment_header_size;
}

inline size_t segment_header::page_area(page_header const *page) const noexcept
{
    if (kind == segment_kind::huge)
        return mapped_size - segment_header_size;
    size_t size = size_t(1) << page_shift;
    return page == pages ? size - segment_header_size : size;
}

inline page_header * segment_header::take_page() noexcept
{
    page_header *page = free_pages;
    if (page) {
        free_pages = page->next;
        page->next = page->prev = nullptr;
        ++used_pages;
    }
    return page;
}

inline void segment_header::retire_page(page_header *page) noexcept
{
    page->in_use = false;
    page->in_full = false;
    page->free = nullptr;
    page->used = 0;
    page->prev = nullptr;
    page->next = free_pages;
    free_pages = page;
    --used_pages;
}

// Maps a segment of the kind. Huge segments get at least `size` bytes
// including the header, others get segment_size.
// Returns nullptr if the provider has no memory.
segment_header * acquire_segment(segment_provider &provider, segment_kind kind,
        size_t size) noexcept;

// Returns segment to its provider.
void release_segment(segment_header *seg) noexcept;

} // namespace segalloc
