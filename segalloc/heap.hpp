/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <cstddef> // size_t

#include <segalloc/impexp.hpp>
#include <segalloc/list_node.hpp>
#include <segalloc/mailbox.hpp>
#include <segalloc/size_class.hpp>

namespace segalloc {

class segment_provider;
class heap_global;
struct segment_header;
struct page_header;

// Allocator state of one thread.
// Must be used only in one thread, except trash field, which any thread
// pushes blocks to.
class SEGALLOC_IMPEXP heap_local : public list_node<heap_local> {
public:
    // Segments are taken from os_provider.
    heap_local() noexcept;
    explicit heap_local(segment_provider &provider) noexcept;
    // Returns empty pages and segments to the provider and hands the others
    // over to the orphan heap, so blocks still in use stay valid.
    ~heap_local();

    void * malloc(size_t size) noexcept;
    void * zalloc(size_t size) noexcept;
    void * malloc_aligned(size_t size, size_t alignment) noexcept;
    void * zalloc_aligned(size_t size, size_t alignment) noexcept;
    void * realloc(void *p, size_t size) noexcept;
    void * realloc_aligned(void *p, size_t size, size_t alignment) noexcept;
    // p may be allocated by any heap.
    void free(void *p) noexcept;

    /// Returns blocks from trash into pages and retires pages which stayed
    /// empty since the previous call. If force, retires all empty pages and
    /// unmaps all empty segments.
    /// Returns true if some memory was reclaimed.
    bool maintain(bool force) noexcept;

    // Number of usable bytes in the block pointed by p.
    static size_t usable_size(void const *p) noexcept;

    // Frees p from a thread which does not own p's segment.
    static void free_foreign(void *p) noexcept;

    // Blocks freed from foreign threads.
    mailbox trash;

private:
    struct page_queue {
        page_header *partial = nullptr; // pages with free blocks, double linked
        page_header *full = nullptr; // double linked
    };

    heap_local(heap_local const &) = delete;
    heap_local(heap_local &&) = delete;
    void operator = (heap_local const &) = delete;
    void operator = (heap_local &&) = delete;

    [[gnu::always_inline]] inline void * alloc_inline(size_t size,
            bool zero) noexcept;
    [[gnu::always_inline]] inline void * alloc_block(unsigned cls,
            page_header *&page, bool &zeroed) noexcept;
    void * alloc_aligned(size_t size, size_t alignment, bool zero) noexcept;
    void * alloc_huge(size_t size, size_t alignment, bool zero) noexcept;
    [[gnu::always_inline]] inline void free_local(segment_header *seg,
            void *p) noexcept;

    // Returns page of class cls with free blocks when the queue is empty.
    page_header * refill(unsigned cls) noexcept;
    // Takes free page from a segment and puts it into the queue of cls.
    page_header * get_page(unsigned cls) noexcept;
    void page_emptied(segment_header *seg, page_header *page) noexcept;
    void retire_page(segment_header *seg, page_header *page) noexcept;
    // Retires empty pages kept in queues. Without force only pages marked
    // idle by the previous call are retired, the rest are marked.
    bool retire_empty_pages(bool force) noexcept;
    segment_header * new_segment(segment_kind kind) noexcept;
    void segment_emptied(segment_header *seg) noexcept;
    // Puts used pages of adopted segment into queues.
    void enqueue_pages(segment_header *seg) noexcept;
    void move_to_full(page_queue &q, page_header *page) noexcept;
    bool collect_trash() noexcept;

    friend class heap_global;

    segment_provider &provider_;
    size_t cached_limit_;
    unsigned maintain_interval_;
    unsigned timer_;
    size_t cached_cnt_ = 0;
    // Empty segments kept for reuse, singly linked.
    segment_header *cached_segments_ = nullptr;
    // Segments in use by kind, double linked.
    segment_header *segments_[segment_kind_count] = {};
    page_queue queues_[size_class_count];
};

// Returns heap of the calling thread. It's created on the first call and
// destroyed at thread exit. Returns nullptr if memory for it is not available.
SEGALLOC_IMPEXP heap_local * current_heap() noexcept;

// Number of constructed and not yet destroyed heaps.
SEGALLOC_IMPEXP size_t live_heap_count() noexcept;

} // namespace segalloc
