/*
 * Copyright (C) Andrey Pikas
 */

#include <segalloc/functions.hpp>

#include <new>

namespace segalloc {

void * malloc_with_new_handler(size_t size)
{
    if (void *result = malloc(size))
        return result;
    while (std::new_handler handler = std::get_new_handler())
        try {
            handler();
            if (void *result = malloc(size))
                return result;
        }
        catch (std::bad_alloc const &) {
            return nullptr;
        }
    return nullptr;
}

namespace {

std::new_handler old_new_handler = nullptr;

#ifdef SEGALLOC_STDAPI
struct push_new_handler {
    push_new_handler()
    {
        old_new_handler = std::set_new_handler(new_handler);
    }

    ~push_new_handler()
    {
        std::set_new_handler(old_new_handler);
    }
} push_new_handler_;
#endif

} // namespace

void new_handler()
{
    if (collect(false))
        return;
    if (collect(true))
        return;
    if (old_new_handler) {
        old_new_handler();
        return;
    }
    throw std::bad_alloc();
}

} // namespace segalloc
