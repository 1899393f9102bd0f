/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

namespace segalloc {

// Node of intrusive circular doubly linked list. A default constructed node
// is an empty list.
template<typename T>
struct list_node {
    constexpr list_node() noexcept : next(this), prev(this) {}

    T * get() noexcept
    {
        return static_cast<T *>(this);
    }

    void append(list_node *other) noexcept
    {
        other->next = next;
        next->prev = other;
        next = other;
        other->prev = this;
    }

    void remove() noexcept
    {
        next->prev = prev;
        prev->next = next;
        next = prev = this;
    }

    list_node *next;
    list_node *prev;
};

} // namespace segalloc
