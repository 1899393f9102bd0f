/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <cstddef> // size_t

#include <boost/smart_ptr/detail/spinlock.hpp>

#include <segalloc/mailbox.hpp>
#include <segalloc/size_class.hpp>

namespace segalloc {

class heap_local;
class segment_provider;
struct segment_header;

// Owner of segments of exited threads. It only takes blocks back; empty
// segments are unmapped and segments with free pages are given to heaps
// which need them.
class heap_global {
public:
    // Never destroyed.
    static heap_global & instance() noexcept;

    // Returns blocks from trash into pages. Does nothing if other thread is
    // maintaining now. Returns true if some block was returned.
    bool maintain() noexcept;

    // Takes all segments and trash of heap. Called by exiting heap after its
    // last maintenance.
    void take_over(heap_local &heap) noexcept;

    // Passes to heap a segment of the kind from provider having free pages.
    // Returns nullptr if there is none or other thread holds the lock.
    segment_header * adopt(segment_kind kind, segment_provider const &provider,
            heap_local *heap) noexcept;

    size_t segment_count() noexcept;

    // Blocks freed into orphaned segments.
    mailbox trash;

private:
    heap_global() = default;
    heap_global(heap_global const &) = delete;
    void operator = (heap_global const &) = delete;

    bool collect_trash() noexcept;
    void free_block(void *p) noexcept;
    void link(segment_header *seg) noexcept;
    void unlink(segment_header *seg) noexcept;

    boost::detail::spinlock lock_ = BOOST_DETAIL_SPINLOCK_INIT;
    segment_header *segments_ = nullptr; // double linked
};

} // namespace segalloc
