/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <atomic> // atomic

#include <segalloc/impexp.hpp>

namespace segalloc {

// Lock-free stack of blocks freed by foreign threads. Blocks are linked
// through their first word. Any thread may push, only the owner takes.
class SEGALLOC_IMPEXP mailbox {
public:
    [[gnu::always_inline]]
    inline void push(void *block) noexcept
    {
        push_list(block, block);
    }

    // Pushes chain first..last linked through the first word of blocks.
    [[gnu::always_inline]]
    inline void push_list(void *first, void *last) noexcept
    {
        void *&link = *reinterpret_cast<void **>(last);
        link = head_.load(std::memory_order_relaxed);
        while (!head_.compare_exchange_weak(link, first,
                    std::memory_order_release, std::memory_order_relaxed)) {}
    }

    // Takes all blocks pushed so far. Returns head of the chain.
    void * take_all() noexcept;

    bool empty() const noexcept
    {
        return !head_.load(std::memory_order_relaxed);
    }

    static void * next(void *block) noexcept
    {
        return *reinterpret_cast<void **>(block);
    }

private:
    std::atomic<void *> head_ = {nullptr};
};

} // namespace segalloc
