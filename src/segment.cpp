/*
 * Copyright (C) Andrey Pikas
 */

#include "segment.hpp"

#include <new> // placement new

#include <segalloc/segment_provider.hpp>

#include "log.hpp"

namespace segalloc {

static_assert(segment_header_size < (size_t(1) << small_page_shift) / 2,
        "segment header must leave the first small page usable");

segment_header * acquire_segment(segment_provider &provider, segment_kind kind,
        size_t size) noexcept
{
    size_t mapped = segment_size;
    if (kind == segment_kind::huge) {
        if (size > max_alloc_size)
            return nullptr;
        mapped = align_up(size, huge_round);
    }

    void *p = provider.map(mapped, segment_size);
    if (!p)
        return nullptr;

    segment_header *seg = new (p) segment_header;
    seg->provider = &provider;
    seg->mapped_size = mapped;
    seg->init(kind, true);
    SEGALLOC_LOG(debug) << "mapped segment " << p << " of " << mapped
        << " bytes";
    return seg;
}

void release_segment(segment_header *seg) noexcept
{
    segment_provider *provider = seg->provider;
    size_t size = seg->mapped_size;
    SEGALLOC_LOG(debug) << "unmapping segment " << static_cast<void *>(seg)
        << " of " << size << " bytes";
    seg->~segment_header();
    provider->unmap(seg, size);
}

} // namespace segalloc
