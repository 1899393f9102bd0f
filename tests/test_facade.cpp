/*
 * Copyright (C) Andrey Pikas
 */

#include <catch2/catch.hpp>

#include <cstdint>
#include <cstring>
#include <new>

#include <segalloc/functions.hpp>
#include <segalloc/heap.hpp>
#include <segalloc/size_class.hpp>

namespace {

int handler_calls = 0;

void give_up_on_third_call()
{
    if (++handler_calls == 3)
        throw std::bad_alloc();
}

} // namespace

TEST_CASE("free of null is a no-op", "[facade]")
{
    segalloc::free(nullptr);
    REQUIRE(segalloc::usable_size(nullptr) == 0);
}

TEST_CASE("malloc of zero bytes returns distinct freeable pointers",
        "[facade]")
{
    void *p = segalloc::malloc(0);
    void *q = segalloc::malloc(0);
    REQUIRE(p != nullptr);
    REQUIRE(q != nullptr);
    REQUIRE(p != q);
    segalloc::free(p);
    segalloc::free(q);
}

TEST_CASE("calloc zeroes memory and checks overflow", "[facade]")
{
    void *p = segalloc::malloc(100);
    REQUIRE(p != nullptr);
    memset(p, 0xff, 100);
    segalloc::free(p);

    unsigned char *z = static_cast<unsigned char *>(segalloc::calloc(10, 10));
    REQUIRE(z != nullptr);
    for (int i = 0; i < 100; ++i)
        REQUIRE(z[i] == 0);
    segalloc::free(z);

    REQUIRE(segalloc::calloc(SIZE_MAX / 2, 3) == nullptr);
    REQUIRE(segalloc::calloc(3, SIZE_MAX / 2) == nullptr);
}

TEST_CASE("usable size covers the request", "[facade]")
{
    for (size_t s : {size_t(1), size_t(100), size_t(5000),
            size_t(2) << 20}) {
        void *p = segalloc::malloc(s);
        REQUIRE(p != nullptr);
        REQUIRE(segalloc::usable_size(p) >= s);
        REQUIRE(segalloc::usable_size(p) <= segalloc::good_size(s));
        segalloc::free(p);
    }
}

TEST_CASE("aligned reallocation preserves contents", "[facade]")
{
    void *p = segalloc::malloc_aligned(8, 8);
    REQUIRE(p != nullptr);
    memcpy(p, "abcdefg", 8);
    void *q = segalloc::realloc_aligned(p, 16, 8);
    REQUIRE(q != nullptr);
    REQUIRE(memcmp(q, "abcdefg", 8) == 0);
    segalloc::free(q);

    REQUIRE(segalloc::malloc_aligned(16, 3) == nullptr);

    void *z = segalloc::zalloc_aligned(64, 4096);
    REQUIRE(z != nullptr);
    REQUIRE(reinterpret_cast<uintptr_t>(z) % 4096 == 0);
    segalloc::free(z);
}

TEST_CASE("realloc through the facade", "[facade]")
{
    char *p = static_cast<char *>(segalloc::realloc(nullptr, 10));
    REQUIRE(p != nullptr);
    memcpy(p, "123456789", 10);
    char *q = static_cast<char *>(segalloc::realloc(p, 100000));
    REQUIRE(q != nullptr);
    REQUIRE(strcmp(q, "123456789") == 0);
    REQUIRE(segalloc::realloc(q, SIZE_MAX) == nullptr);
    REQUIRE(strcmp(q, "123456789") == 0);
    segalloc::free(q);
}

TEST_CASE("thread heap is created once", "[facade]")
{
    segalloc::heap_local *heap = segalloc::current_heap();
    REQUIRE(heap != nullptr);
    REQUIRE(segalloc::current_heap() == heap);
    REQUIRE(segalloc::live_heap_count() >= 1);
}

TEST_CASE("collect releases empty pages", "[facade]")
{
    void *p = segalloc::malloc(300000);
    REQUIRE(p != nullptr);
    segalloc::free(p);
    REQUIRE(segalloc::collect(true));
}

TEST_CASE("malloc_with_new_handler stops when the handler gives up",
        "[facade]")
{
    void *p = segalloc::malloc_with_new_handler(100);
    REQUIRE(p != nullptr);
    segalloc::free(p);

    handler_calls = 0;
    std::new_handler old = std::set_new_handler(give_up_on_third_call);
    void *q = segalloc::malloc_with_new_handler(SIZE_MAX);
    std::set_new_handler(old);
    REQUIRE(q == nullptr);
    REQUIRE(handler_calls == 3);
}

TEST_CASE("new_handler throws when nothing can be collected", "[facade]")
{
    void *p = segalloc::malloc(300000);
    REQUIRE(p != nullptr);
    segalloc::free(p);

    bool thrown = false;
    for (int i = 0; i < 16 && !thrown; ++i)
        try {
            segalloc::new_handler();
        }
        catch (std::bad_alloc const &) {
            thrown = true;
        }
    REQUIRE(thrown);
}
