/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <cstddef> // size_t, ptrdiff_t
#include <cstdint> // uintptr_t
#include <limits>

namespace segalloc {

// Every block is aligned at least by max_align.
constexpr size_t max_align = 16;

// Segments are aligned by their size, so the segment of any block is found by
// masking its address.
constexpr unsigned segment_shift = 22;
constexpr size_t segment_size = size_t(1) << segment_shift;
constexpr uintptr_t segment_mask = segment_size - 1;

constexpr unsigned small_page_shift = 16;  // 64 KiB
constexpr unsigned medium_page_shift = 19; // 512 KiB
constexpr unsigned large_page_shift = segment_shift;
constexpr unsigned max_pages_per_segment = 1U << (segment_shift - small_page_shift);

constexpr size_t small_max = 1024;
constexpr size_t medium_max = 128 << 10;
constexpr size_t large_max = 1 << 20;

// Huge segments are rounded up to this size.
constexpr size_t huge_round = 64 << 10;

// Interior aligned pointers of huge blocks must stay inside the first
// segment_size bytes of the mapping.
constexpr size_t max_alignment = segment_size / 2;

// Larger requests cannot be satisfied by any mapping.
constexpr size_t max_alloc_size = std::numeric_limits<ptrdiff_t>::max();

enum class segment_kind : unsigned char { small, medium, large, huge };
constexpr unsigned segment_kind_count = 4;

static constexpr unsigned idx_frac_bits = 3;

constexpr inline size_t align_up(size_t x, size_t alignment)
{
    return (x + alignment - 1) & ~(alignment - 1);
}

[[gnu::always_inline]]
constexpr inline unsigned log2floor(size_t x)
{
    // Expected to be a single `bsr` insruction for amd64.
    return __builtin_clzl(x) ^ (std::numeric_limits<size_t>::digits - 1);
}

// Sizes up to 128 bytes go in steps of max_align. Above that every power of
// two range is split into 2^idx_frac_bits classes, so a block is never more
// than 12.5% larger than the request.
// Valid for size <= large_max.
[[gnu::always_inline]]
constexpr inline unsigned size_class_of(size_t size)
{
    size_t units = (size + max_align - 1) / max_align;
    if (units <= (1U << idx_frac_bits))
        return units ? static_cast<unsigned>(units) - 1 : 0;
    size_t w = units - 1;
    unsigned b = log2floor(w);
    return (1U << idx_frac_bits) + ((b - idx_frac_bits) << idx_frac_bits)
        + static_cast<unsigned>((w >> (b - idx_frac_bits))
                & ((1U << idx_frac_bits) - 1));
}

constexpr inline size_t class_size(unsigned cls)
{
    constexpr unsigned steps = 1U << idx_frac_bits;
    if (cls < steps)
        return (cls + 1) * max_align;
    unsigned exp = (cls - steps) >> idx_frac_bits;
    unsigned mantissa = (cls - steps) & (steps - 1);
    return ((size_t(steps + 1) + mantissa) << exp) * max_align;
}

constexpr unsigned size_class_count = size_class_of(large_max) + 1;
constexpr unsigned small_class_max = size_class_of(small_max);
constexpr unsigned medium_class_max = size_class_of(medium_max);

constexpr inline segment_kind kind_of_class(unsigned cls)
{
    return cls <= small_class_max ? segment_kind::small
        : cls <= medium_class_max ? segment_kind::medium
        : segment_kind::large;
}

static_assert(class_size(size_class_count - 1) == large_max,
        "the last class must hold exactly large_max bytes");
static_assert(class_size(small_class_max) == small_max, "");
static_assert(class_size(medium_class_max) == medium_max, "");

} // namespace segalloc
