/*
 * Copyright (C) Andrey Pikas
 */

#include "heap_global.hpp"

#include <new> // placement new

#include <segalloc/heap.hpp>

#include "log.hpp"
#include "segment.hpp"

namespace segalloc {

heap_global & heap_global::instance() noexcept
{
    // Blocks of orphaned segments may be freed until the process ends.
    alignas(heap_global) static unsigned char storage[sizeof(heap_global)];
    static heap_global *inst = new (storage) heap_global;
    return *inst;
}

void heap_global::link(segment_header *seg) noexcept
{
    seg->prev = nullptr;
    seg->next = segments_;
    if (segments_)
        segments_->prev = seg;
    segments_ = seg;
}

void heap_global::unlink(segment_header *seg) noexcept
{
    if (seg->next)
        seg->next->prev = seg->prev;
    if (seg->prev)
        seg->prev->next = seg->next;
    if (segments_ == seg)
        segments_ = seg->next;
    seg->next = seg->prev = nullptr;
}

void heap_global::free_block(void *p) noexcept
{
    segment_header *seg = segment_of(p);
    page_header *page = seg->page_of(p);
    page->put_free(page->has_aligned ? page->block_start(p) : p);
    if (page->used)
        return;
    seg->retire_page(page);
    // Segment adopted after the block was pushed here is not in our list.
    if (seg->used_pages || seg->owner.load(std::memory_order_relaxed) != this)
        return;
    unlink(seg);
    release_segment(seg);
}

bool heap_global::collect_trash() noexcept
{
    bool result = false;
    void *p = trash.take_all();
    while (p) {
        void *next = mailbox::next(p);
        free_block(p);
        p = next;
        result = true;
    }
    return result;
}

bool heap_global::maintain() noexcept
{
    if (trash.empty())
        return false;
    if (!lock_.try_lock())
        return false;
    // Unlock only after collecting to protect pages of orphaned segments,
    // not only trash pointer itself.
    bool result = collect_trash();
    lock_.unlock();
    return result;
}

void heap_global::take_over(heap_local &heap) noexcept
{
    lock_.lock();
    size_t cnt = 0;
    for (segment_header *&list : heap.segments_) {
        while (list) {
            segment_header *seg = list;
            list = seg->next;
            seg->owner_lock.lock();
            seg->owner.store(this, std::memory_order_relaxed);
            seg->owner_lock.unlock();
            link(seg);
            ++cnt;
        }
    }

    // All segments are owned by us now, nobody pushes into heap's trash.
    void *first = heap.trash.take_all();
    if (first) {
        void *last = first;
        while (mailbox::next(last))
            last = mailbox::next(last);
        trash.push_list(first, last);
    }
    lock_.unlock();

    if (cnt)
        SEGALLOC_LOG(debug) << "exiting heap orphaned " << cnt << " segments";
}

segment_header * heap_global::adopt(segment_kind kind,
        segment_provider const &provider, heap_local *heap) noexcept
{
    if (!lock_.try_lock())
        return nullptr;
    collect_trash();
    segment_header *seg = segments_;
    while (seg && (seg->kind != kind || !seg->free_pages
                || seg->provider != &provider))
        seg = seg->next;
    if (seg) {
        unlink(seg);
        seg->owner_lock.lock();
        seg->owner.store(heap, std::memory_order_relaxed);
        seg->owner_lock.unlock();
        // Blocks of seg pushed before the owner changed.
        collect_trash();
    }
    lock_.unlock();
    return seg;
}

size_t heap_global::segment_count() noexcept
{
    boost::detail::spinlock::scoped_lock lock(lock_);
    size_t cnt = 0;
    for (segment_header *seg = segments_; seg; seg = seg->next)
        ++cnt;
    return cnt;
}

} // namespace segalloc
