/*
 * Copyright (C) Andrey Pikas
 */

#include "registry.hpp"

#include <new> // placement new

#include <boost/smart_ptr/detail/spinlock.hpp>

#include <segalloc/heap.hpp>
#include <segalloc/options.hpp>
#include <segalloc/segment_provider.hpp>

#include "log.hpp"
#include "likely.hpp"

namespace segalloc {

namespace {

constexpr size_t heap_storage_size = align_up(sizeof(heap_local), 4096);

// Constant initialized, heaps may be created before dynamic initialization.
struct registry {
    boost::detail::spinlock lock = BOOST_DETAIL_SPINLOCK_INIT;
    list_node<heap_local> heaps;
    size_t count = 0;
};

registry heaps_registry;

void release_current() noexcept;

// Destroys heap of the thread at thread exit. Armed after the heap is created,
// so a thread which never allocates does not register a destructor.
struct heap_guard {
    bool armed = false;

    ~heap_guard()
    {
        if (armed)
            release_current();
    }
};

thread_local heap_local *current = nullptr;
thread_local bool torn_down = false;
thread_local heap_guard guard;

heap_local * create_current() noexcept
{
    // Loading of options may log, and the logger may allocate and so create
    // the heap itself.
    get_options();
    if (current)
        return current;

    heap_local *heap;
    {
        // Logger may allocate while the heap is not ready.
        log_silence silence;
        void *mem = os_provider::instance().map(heap_storage_size,
                alignof(heap_local));
        if (!mem)
            return nullptr;
        heap = new (mem) heap_local;
    }
    current = heap;
    // Heap created by a thread destructor running after ours lives until
    // the process ends.
    if (!torn_down)
        guard.armed = true;
    SEGALLOC_LOG(debug) << "created heap " << static_cast<void *>(heap);
    return heap;
}

void release_current() noexcept
{
    heap_local *heap = current;
    if (!heap)
        return;
    SEGALLOC_LOG(debug) << "tearing down heap " << static_cast<void *>(heap);
    // Frees made by the destructor of the heap must not reach it.
    current = nullptr;
    torn_down = true;
    log_silence silence;
    heap->~heap_local();
    // Nobody pushes into the trash of the heap after it gave away its
    // segments.
    os_provider::instance().unmap(heap, heap_storage_size);
}

} // namespace

void register_heap(heap_local *heap) noexcept
{
    boost::detail::spinlock::scoped_lock lock(heaps_registry.lock);
    heaps_registry.heaps.append(heap);
    ++heaps_registry.count;
}

void unregister_heap(heap_local *heap) noexcept
{
    boost::detail::spinlock::scoped_lock lock(heaps_registry.lock);
    heap->remove();
    --heaps_registry.count;
}

heap_local * existing_heap() noexcept
{
    return current;
}

heap_local * current_heap() noexcept
{
    if (likely(current != nullptr))
        return current;
    return create_current();
}

size_t live_heap_count() noexcept
{
    boost::detail::spinlock::scoped_lock lock(heaps_registry.lock);
    return heaps_registry.count;
}

} // namespace segalloc
