/*
 * Copyright (C) Andrey Pikas
 */

#include <catch2/catch.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <thread>
#include <vector>

#include <segalloc/functions.hpp>
#include <segalloc/heap.hpp>

#include "heap_global.hpp"
#include "segment.hpp"

using namespace segalloc;

namespace {

size_t worker_count()
{
    unsigned hw = std::thread::hardware_concurrency();
    return hw ? std::min<size_t>(hw, 8) : 4;
}

void wait_for_start(std::atomic<bool> const &start)
{
    while (!start.load(std::memory_order_acquire))
        std::this_thread::yield();
}

// Block which knows its own size and owner.
struct stamp {
    uint32_t tag;
    uint32_t size;
};

void * alloc_stamped(size_t size, uint32_t tag)
{
    size = std::max(size, sizeof(stamp));
    unsigned char *p = static_cast<unsigned char *>(segalloc::malloc(size));
    if (!p)
        return nullptr;
    stamp s{tag, static_cast<uint32_t>(size)};
    memcpy(p, &s, sizeof(s));
    memset(p + sizeof(s), static_cast<int>(tag & 0xff), size - sizeof(s));
    return p;
}

bool check_stamped(void const *block, uint32_t tag)
{
    unsigned char const *p = static_cast<unsigned char const *>(block);
    stamp s;
    memcpy(&s, p, sizeof(s));
    if (s.tag != tag)
        return false;
    for (size_t i = sizeof(s); i < s.size; ++i)
        if (p[i] != static_cast<unsigned char>(tag & 0xff))
            return false;
    return true;
}

// Deterministic sizes mixing small, medium and large classes.
size_t next_size(uint32_t &state)
{
    state = state * 1664525 + 1013904223;
    uint32_t r = state >> 8;
    switch (r % 16) {
    case 0:
        return r % (200 << 10);
    case 1:
    case 2:
        return r % (16 << 10);
    default:
        return r % 512;
    }
}

} // namespace

TEST_CASE("threads allocate and free privately", "[thread]")
{
    size_t const threads = worker_count();
    size_t const iterations = 20000;
    std::atomic<bool> start{false};
    std::atomic<size_t> failures{0};
    std::vector<std::thread> workers;

    for (size_t t = 0; t < threads; ++t)
        workers.emplace_back([&, t] {
            wait_for_start(start);
            uint32_t rnd = static_cast<uint32_t>(t + 1);
            std::vector<void *> window(64, nullptr);
            for (size_t i = 0; i < iterations; ++i) {
                void *&slot = window[i % window.size()];
                uint32_t tag = static_cast<uint32_t>((t << 24) | i);
                if (slot) {
                    uint32_t old_tag = static_cast<uint32_t>(
                            (t << 24) | (i - window.size()));
                    if (!check_stamped(slot, old_tag))
                        failures.fetch_add(1, std::memory_order_relaxed);
                    segalloc::free(slot);
                }
                slot = alloc_stamped(next_size(rnd), tag);
                if (!slot)
                    failures.fetch_add(1, std::memory_order_relaxed);
            }
            for (void *p : window)
                segalloc::free(p);
        });

    start.store(true, std::memory_order_release);
    for (auto &w : workers)
        w.join();
    REQUIRE(failures.load() == 0);
}

TEST_CASE("threads free blocks allocated by other threads", "[thread]")
{
    size_t const producers = std::max<size_t>(worker_count() / 2, 1);
    size_t const consumers = producers;
    size_t const per_producer = 20000;

    std::mutex lock;
    std::vector<std::pair<void *, uint32_t>> queue;
    std::atomic<bool> start{false};
    std::atomic<size_t> producing{producers};
    std::atomic<size_t> freed{0};
    std::atomic<size_t> failures{0};
    std::vector<std::thread> workers;

    for (size_t t = 0; t < producers; ++t)
        workers.emplace_back([&, t] {
            wait_for_start(start);
            uint32_t rnd = static_cast<uint32_t>(t + 100);
            for (size_t i = 0; i < per_producer; ++i) {
                uint32_t tag = static_cast<uint32_t>((t << 24) | i);
                void *p = alloc_stamped(next_size(rnd), tag);
                if (!p) {
                    failures.fetch_add(1, std::memory_order_relaxed);
                    continue;
                }
                std::lock_guard<std::mutex> guard(lock);
                queue.emplace_back(p, tag);
            }
            producing.fetch_sub(1, std::memory_order_release);
        });

    for (size_t t = 0; t < consumers; ++t)
        workers.emplace_back([&] {
            wait_for_start(start);
            std::vector<std::pair<void *, uint32_t>> batch;
            for (;;) {
                bool done = !producing.load(std::memory_order_acquire);
                {
                    std::lock_guard<std::mutex> guard(lock);
                    batch.swap(queue);
                }
                for (auto &b : batch) {
                    if (!check_stamped(b.first, b.second))
                        failures.fetch_add(1, std::memory_order_relaxed);
                    segalloc::free(b.first);
                }
                freed.fetch_add(batch.size(), std::memory_order_relaxed);
                bool empty = batch.empty();
                batch.clear();
                if (done && empty)
                    break;
                if (empty)
                    std::this_thread::yield();
            }
        });

    start.store(true, std::memory_order_release);
    for (auto &w : workers)
        w.join();
    REQUIRE(failures.load() == 0);
    REQUIRE(freed.load() == producers * per_producer);
}

TEST_CASE("blocks of an exited thread stay valid and are reclaimed",
        "[thread]")
{
    // Reclaim what earlier tests left in the orphan heap trash.
    collect(false);
    heap_global &global = heap_global::instance();
    size_t const orphans = global.segment_count();
    size_t heaps = live_heap_count();

    std::vector<void *> blocks;
    std::thread owner([&blocks] {
        for (uint32_t i = 0; i < 1000; ++i)
            blocks.push_back(alloc_stamped(100 + i % 3000, i));
    });
    owner.join();

    REQUIRE(live_heap_count() == heaps);
    REQUIRE(global.segment_count() > orphans);

    for (uint32_t i = 0; i < blocks.size(); ++i) {
        REQUIRE(blocks[i] != nullptr);
        REQUIRE(check_stamped(blocks[i], i));
        segalloc::free(blocks[i]);
    }
    REQUIRE(collect(false));
    REQUIRE(global.segment_count() == orphans);
}

TEST_CASE("new thread adopts orphaned segments", "[thread]")
{
    // Reclaim what earlier tests left in the orphan heap trash.
    collect(false);
    heap_global &global = heap_global::instance();
    size_t const orphans = global.segment_count();

    std::vector<void *> blocks;
    std::thread owner([&blocks] {
        for (uint32_t i = 0; i < 10; ++i)
            blocks.push_back(alloc_stamped(100, i));
    });
    owner.join();
    REQUIRE(global.segment_count() == orphans + 1);

    bool same_segment = false;
    bool intact = true;
    std::thread adopter([&] {
        void *p = segalloc::malloc(100);
        same_segment = p && segment_of(p) == segment_of(blocks[0]);
        segalloc::free(p);
        for (uint32_t i = 0; i < blocks.size(); ++i) {
            intact = intact && check_stamped(blocks[i], i);
            segalloc::free(blocks[i]);
        }
    });
    adopter.join();

    REQUIRE(same_segment);
    REQUIRE(intact);
    REQUIRE(global.segment_count() == orphans);
}

TEST_CASE("thread heap is torn down at thread exit", "[thread]")
{
    size_t const before = live_heap_count();
    size_t inside = 0;
    std::thread t([&inside] {
        void *p = segalloc::malloc(10);
        inside = live_heap_count();
        segalloc::free(p);
    });
    t.join();
    REQUIRE(inside == before + 1);
    REQUIRE(live_heap_count() == before);
}
