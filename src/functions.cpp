/*
 * Copyright (C) Andrey Pikas
 */

#include <segalloc/functions.hpp>

#include <cerrno>

#include <segalloc/heap.hpp>
#include <segalloc/segment_provider.hpp>
#include <segalloc/size_class.hpp>

#include "heap_global.hpp"
#include "registry.hpp"
#include "segment.hpp"
#include "likely.hpp"

namespace segalloc {

void * malloc(size_t size) noexcept
{
    heap_local *heap = current_heap();
    return likely(heap != nullptr) ? heap->malloc(size) : nullptr;
}

void * zalloc(size_t size) noexcept
{
    heap_local *heap = current_heap();
    return likely(heap != nullptr) ? heap->zalloc(size) : nullptr;
}

void * calloc(size_t num, size_t size) noexcept
{
    size_t total;
    if (unlikely(__builtin_mul_overflow(num, size, &total)))
        return nullptr;
    return zalloc(total);
}

void * realloc(void *p, size_t size) noexcept
{
    heap_local *heap = current_heap();
    return likely(heap != nullptr) ? heap->realloc(p, size) : nullptr;
}

void * malloc_aligned(size_t size, size_t alignment) noexcept
{
    heap_local *heap = current_heap();
    return likely(heap != nullptr)
        ? heap->malloc_aligned(size, alignment)
        : nullptr;
}

void * zalloc_aligned(size_t size, size_t alignment) noexcept
{
    heap_local *heap = current_heap();
    return likely(heap != nullptr)
        ? heap->zalloc_aligned(size, alignment)
        : nullptr;
}

void * realloc_aligned(void *p, size_t size, size_t alignment) noexcept
{
    heap_local *heap = current_heap();
    return likely(heap != nullptr)
        ? heap->realloc_aligned(p, size, alignment)
        : nullptr;
}

void free(void *p) noexcept
{
    if (unlikely(!p))
        return;
    // Freeing must not create a heap, the thread may be exiting.
    if (heap_local *heap = existing_heap())
        heap->free(p);
    else
        heap_local::free_foreign(p);
}

size_t usable_size(void const *p) noexcept
{
    return heap_local::usable_size(p);
}

size_t good_size(size_t size) noexcept
{
    if (size <= large_max)
        return class_size(size_class_of(size));
    if (size > max_alloc_size - segment_header_size)
        return size;
    return align_up(size + segment_header_size, huge_round)
        - segment_header_size;
}

bool collect(bool force) noexcept
{
    bool result;
    if (heap_local *heap = existing_heap())
        result = heap->maintain(force);
    else
        result = heap_global::instance().maintain();
    result |= os_provider::instance().clean();
    return result;
}

} // namespace segalloc

#ifdef SEGALLOC_STDAPI
#include <malloc.h>

extern "C" {

SEGALLOC_IMPEXP void * malloc(size_t size) noexcept
{
    void *p = segalloc::malloc(size);
    if (unlikely(!p))
        errno = ENOMEM;
    return p;
}

SEGALLOC_IMPEXP void * calloc(size_t num, size_t size) noexcept
{
    void *p = segalloc::calloc(num, size);
    if (unlikely(!p))
        errno = ENOMEM;
    return p;
}

SEGALLOC_IMPEXP void * realloc(void *p, size_t size) noexcept
{
    void *np = segalloc::realloc(p, size);
    if (unlikely(!np))
        errno = ENOMEM;
    return np;
}

SEGALLOC_IMPEXP void free(void *p) noexcept
{
    segalloc::free(p);
}

SEGALLOC_IMPEXP void * aligned_alloc(size_t alignment, size_t size) noexcept
{
    void *p = segalloc::malloc_aligned(size, alignment);
    if (unlikely(!p))
        errno = ENOMEM;
    return p;
}

SEGALLOC_IMPEXP void * memalign(size_t alignment, size_t size) noexcept
{
    return aligned_alloc(alignment, size);
}

SEGALLOC_IMPEXP int posix_memalign(void **p, size_t alignment, size_t size)
    noexcept
{
    if (alignment < sizeof(void *) || (alignment & (alignment - 1)))
        return EINVAL;
    void *result = segalloc::malloc_aligned(size, alignment);
    if (!result)
        return ENOMEM;
    *p = result;
    return 0;
}

SEGALLOC_IMPEXP size_t malloc_usable_size(void *p) noexcept
{
    return segalloc::usable_size(p);
}

} // extern "C"

namespace {

// Static linking must not drop the replacement of malloc.
[[gnu::used]] void * (*const keep_malloc)(size_t) = &::malloc;

} // namespace
#endif
