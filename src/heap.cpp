/*
 * Copyright (C) Andrey Pikas
 */

#include <segalloc/heap.hpp>

#include <algorithm> // max, min
#include <cstring> // memcpy, memset

#include <segalloc/options.hpp>
#include <segalloc/segment_provider.hpp>

#include "heap_global.hpp"
#include "registry.hpp"
#include "segment.hpp"
#include "likely.hpp"

namespace segalloc {

namespace {

// push page into the beginning of the list
inline void push(page_header **list, page_header *page)
{
    page->next = *list;
    page->prev = nullptr;
    if (page->next)
        page->next->prev = page;
    *list = page;
}

// remove page from double linked list
inline void remove_from_list(page_header **list, page_header *page)
{
    if (page->next)
        page->next->prev = page->prev;
    if (page->prev)
        page->prev->next = page->next;
    if (*list == page)
        *list = page->next;
    page->next = page->prev = nullptr;
}

inline void push(segment_header **list, segment_header *seg)
{
    seg->next = *list;
    seg->prev = nullptr;
    if (seg->next)
        seg->next->prev = seg;
    *list = seg;
}

inline void remove_from_list(segment_header **list, segment_header *seg)
{
    if (seg->next)
        seg->next->prev = seg->prev;
    if (seg->prev)
        seg->prev->next = seg->next;
    if (*list == seg)
        *list = seg->next;
    seg->next = seg->prev = nullptr;
}

// Zeroes [p, p + size) of a block just taken from a free list.
// If zeroed, the block is zero except the link to the next free block.
[[gnu::always_inline]]
inline void zero_block(void *block, void *p, size_t size, bool zeroed)
{
    if (zeroed)
        *reinterpret_cast<void **>(block) = nullptr;
    else
        memset(p, 0, size);
}

inline bool is_power_of_2(size_t x)
{
    return x && !(x & (x - 1));
}

} // namespace


//
// heap_local
//

heap_local::heap_local() noexcept : heap_local(os_provider::instance()) {}

heap_local::heap_local(segment_provider &provider) noexcept
    : provider_(provider)
{
    options opts = get_options();
    cached_limit_ = opts.cached_segments;
    maintain_interval_ = timer_ = std::max(1U, opts.maintain_interval);
    register_heap(this);
}

heap_local::~heap_local()
{
    // Move trash objects to pages while segments are owned by this heap.
    // Release all empty pages and segments.
    maintain(true);
    heap_global::instance().take_over(*this);
    unregister_heap(this);
}

inline void heap_local::move_to_full(page_queue &q, page_header *page) noexcept
{
    remove_from_list(&q.partial, page);
    push(&q.full, page);
    page->in_full = true;
}

[[gnu::always_inline]]
inline void * heap_local::alloc_block(unsigned cls, page_header *&page,
        bool &zeroed) noexcept
{
    page_queue &q = queues_[cls];
    page = q.partial;
    if (unlikely(!page)) {
        page = refill(cls);
        if (unlikely(!page))
            return nullptr;
    }
    // Pages in partial list always have a free block.
    void *result = page->alloc(zeroed);
    if (unlikely(page->is_full()))
        move_to_full(q, page);
    return result;
}

[[gnu::always_inline]]
inline void * heap_local::alloc_inline(size_t size, bool zero) noexcept
{
    if (likely(size <= large_max)) {
        page_header *page;
        bool zeroed = false;
        void *result = alloc_block(size_class_of(size), page, zeroed);
        if (zero && likely(result != nullptr))
            zero_block(result, result, size, zeroed);
        return result;
    }
    return alloc_huge(size, 0, zero);
}

void * heap_local::malloc(size_t size) noexcept
{
    return alloc_inline(size, false);
}

void * heap_local::zalloc(size_t size) noexcept
{
    return alloc_inline(size, true);
}

page_header * heap_local::refill(unsigned cls) noexcept
{
    // Objects freed by other threads may refill our pages,
    // take them before asking for a new page.
    if (!--timer_)
        maintain(false);
    else
        collect_trash();
    if (page_header *page = queues_[cls].partial)
        return page;
    return get_page(cls);
}

page_header * heap_local::get_page(unsigned cls) noexcept
{
    segment_kind kind = kind_of_class(cls);
    segment_header *seg = segments_[static_cast<unsigned>(kind)];
    while (seg && !seg->free_pages)
        seg = seg->next;
    if (!seg) {
        seg = new_segment(kind);
        if (!seg)
            return nullptr;
        // Adopted segment may bring a page of this class.
        if (page_header *page = queues_[cls].partial)
            return page;
    }

    page_header *page = seg->take_page();
    page->init(cls, class_size(cls), seg->page_start(page),
            seg->page_area(page));
    push(&queues_[cls].partial, page);
    return page;
}

segment_header * heap_local::new_segment(segment_kind kind) noexcept
{
    segment_header *seg = cached_segments_;
    if (seg) {
        cached_segments_ = seg->next;
        --cached_cnt_;
        seg->init(kind, false);
    }
    else if ((seg = heap_global::instance().adopt(kind, provider_, this)))
        enqueue_pages(seg);
    else {
        seg = acquire_segment(provider_, kind, segment_size);
        if (!seg)
            return nullptr;
        seg->owner.store(this, std::memory_order_relaxed);
    }
    push(&segments_[static_cast<unsigned>(kind)], seg);
    return seg;
}

void heap_local::enqueue_pages(segment_header *seg) noexcept
{
    for (unsigned i = 0; i < seg->page_count; ++i) {
        page_header *page = &seg->pages[i];
        if (!page->in_use)
            continue;
        page_queue &q = queues_[page->size_class];
        page->in_full = page->is_full();
        push(page->in_full ? &q.full : &q.partial, page);
    }
}

void * heap_local::alloc_huge(size_t size, size_t alignment, bool zero) noexcept
{
    if (size > max_alloc_size - segment_header_size - alignment)
        return nullptr;

    // Some huge block may wait in trash for being unmapped.
    collect_trash();
    segment_header *seg = acquire_segment(provider_, segment_kind::huge,
            segment_header_size + size + alignment);
    if (!seg)
        return nullptr;
    seg->owner.store(this, std::memory_order_relaxed);
    push(&segments_[static_cast<unsigned>(segment_kind::huge)], seg);

    page_header *page = seg->take_page();
    size_t area = seg->page_area(page);
    page->init(huge_class, area, seg->page_start(page), area);
    bool zeroed = false;
    char *block = static_cast<char *>(page->alloc(zeroed));
    char *result = block;
    if (alignment) {
        result = align_up(block, alignment);
        page->has_aligned = result != block;
    }
    if (zero)
        zero_block(block, result, size, zeroed);
    return result;
}

void * heap_local::alloc_aligned(size_t size, size_t alignment, bool zero)
    noexcept
{
    if (unlikely(!is_power_of_2(alignment) || alignment > max_alignment))
        return nullptr;
    if (alignment <= max_align)
        return alloc_inline(size, zero);
    if (alignment > large_max || size > large_max - alignment)
        return alloc_huge(size, alignment, zero);

    // Block has room for the object at any aligned address within the first
    // alignment bytes.
    page_header *page;
    bool zeroed = false;
    char *block = static_cast<char *>(
            alloc_block(size_class_of(size + alignment), page, zeroed));
    if (!block)
        return nullptr;
    char *result = align_up(block, alignment);
    if (result != block)
        page->has_aligned = true;
    if (zero)
        zero_block(block, result, size, zeroed);
    return result;
}

void * heap_local::malloc_aligned(size_t size, size_t alignment) noexcept
{
    return alloc_aligned(size, alignment, false);
}

void * heap_local::zalloc_aligned(size_t size, size_t alignment) noexcept
{
    return alloc_aligned(size, alignment, true);
}

void * heap_local::realloc(void *p, size_t size) noexcept
{
    if (unlikely(!p))
        return malloc(size);

    size_t usable = usable_size(p);
    // Reuse the block unless it's more than twice as large as needed.
    if (size <= usable && size >= usable / 2)
        return p;

    void *np = malloc(size);
    if (!np)
        return nullptr;
    memcpy(np, p, std::min(usable, size));
    free(p);
    return np;
}

void * heap_local::realloc_aligned(void *p, size_t size, size_t alignment)
    noexcept
{
    if (unlikely(!is_power_of_2(alignment) || alignment > max_alignment))
        return nullptr;
    if (alignment <= max_align)
        return realloc(p, size);
    if (!p)
        return malloc_aligned(size, alignment);

    size_t usable = usable_size(p);
    if (!(reinterpret_cast<uintptr_t>(p) & (alignment - 1))
            && size <= usable && size >= usable / 2)
        return p;

    void *np = malloc_aligned(size, alignment);
    if (!np)
        return nullptr;
    memcpy(np, p, std::min(usable, size));
    free(p);
    return np;
}

[[gnu::always_inline]]
inline void heap_local::free_local(segment_header *seg, void *p) noexcept
{
    page_header *page = seg->page_of(p);
    void *block = unlikely(page->has_aligned) ? page->block_start(p) : p;
    if (unlikely(page->in_full)) {
        // page in full list now. Move it to partial.
        page_queue &q = queues_[page->size_class];
        remove_from_list(&q.full, page);
        push(&q.partial, page);
        page->in_full = false;
    }
    page->put_free(block);
    if (unlikely(!page->used))
        page_emptied(seg, page);
}

void heap_local::free(void *p) noexcept
{
    if (unlikely(!p))
        return;
    segment_header *seg = segment_of(p);
    if (likely(seg->owner.load(std::memory_order_relaxed) == this))
        free_local(seg, p);
    else
        free_foreign(p);
}

void heap_local::free_foreign(void *p) noexcept
{
    segment_header *seg = segment_of(p);
    boost::detail::spinlock::scoped_lock lock(seg->owner_lock);
    void *owner = seg->owner.load(std::memory_order_relaxed);
    heap_global *global = &heap_global::instance();
    mailbox &trash = (owner == global
        ? global->trash
        : static_cast<heap_local *>(owner)->trash);
    trash.push(p);
}

void heap_local::page_emptied(segment_header *seg, page_header *page) noexcept
{
    if (seg->kind == segment_kind::huge) {
        seg->retire_page(page);
        segment_emptied(seg);
        return;
    }
    // Keep the last page of the class to not map and unmap a segment on
    // every allocation when only one object of the class is alive. It's
    // retired by maintenance if it stays empty for a whole interval.
    if (queues_[page->size_class].partial == page && !page->next) {
        page->idle = false;
        // Alloc/free cycles on the kept page never reach refill.
        if (!--timer_)
            maintain(false);
        return;
    }
    retire_page(seg, page);
}

void heap_local::retire_page(segment_header *seg, page_header *page) noexcept
{
    page_queue &q = queues_[page->size_class];
    remove_from_list(page->in_full ? &q.full : &q.partial, page);
    seg->retire_page(page);
    if (!seg->used_pages)
        segment_emptied(seg);
}

void heap_local::segment_emptied(segment_header *seg) noexcept
{
    remove_from_list(&segments_[static_cast<unsigned>(seg->kind)], seg);
    if (seg->kind != segment_kind::huge && cached_cnt_ < cached_limit_) {
        seg->next = cached_segments_;
        cached_segments_ = seg;
        ++cached_cnt_;
        return;
    }
    release_segment(seg);
}

bool heap_local::collect_trash() noexcept
{
    void *p = trash.take_all();
    if (!p)
        return false;
    while (p) {
        void *next = mailbox::next(p);
        // Objects in trash lay in segments of this heap.
        free_local(segment_of(p), p);
        p = next;
    }
    return true;
}

bool heap_local::retire_empty_pages(bool force) noexcept
{
    bool result = false;
    for (page_queue &q : queues_) {
        page_header *page = q.partial;
        while (page) {
            page_header *next = page->next;
            if (!page->used) {
                if (force || page->idle) {
                    retire_page(segment_of(page), page);
                    result = true;
                } else {
                    page->idle = true;
                }
            }
            page = next;
        }
    }
    return result;
}

bool heap_local::maintain(bool force) noexcept
{
    // Frees below tick the timer.
    timer_ = maintain_interval_;
    bool result = collect_trash();
    result |= retire_empty_pages(force);

    if (force) {
        while (cached_segments_) {
            segment_header *seg = cached_segments_;
            cached_segments_ = seg->next;
            --cached_cnt_;
            release_segment(seg);
            result = true;
        }
    }

    result |= heap_global::instance().maintain();
    return result;
}

size_t heap_local::usable_size(void const *p) noexcept
{
    if (!p)
        return 0;
    page_header *page = segment_of(p)->page_of(p);
    char const *block = page->block_start(p);
    return block + page->block_size - static_cast<char const *>(p);
}

} // namespace segalloc
