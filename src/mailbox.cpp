/*
 * Copyright (C) Andrey Pikas
 */

#include <segalloc/mailbox.hpp>

namespace segalloc {

void * mailbox::take_all() noexcept
{
    if (!head_.load(std::memory_order_relaxed))
        return nullptr;
    return head_.exchange(nullptr, std::memory_order_acquire);
}

} // namespace segalloc
