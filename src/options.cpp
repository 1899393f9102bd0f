/*
 * Copyright (C) Andrey Pikas
 */

#include <segalloc/options.hpp>

#include <atomic> // atomic
#include <cerrno>
#include <climits> // UINT_MAX
#include <cstdlib> // getenv, strtoull

#include "log.hpp"
#include "options_env.hpp"

namespace segalloc {

namespace {

// Constant initialized, so it's usable by allocations made before dynamic
// initialization of this translation unit.
struct option_store {
    std::atomic<bool> loaded = {false};
    std::atomic<size_t> cached_segments = {1};
    std::atomic<unsigned> maintain_interval = {1024};
    std::atomic<bool> large_os_pages = {false};
    std::atomic<bool> verbose = {false};
};

option_store store;

void load_from_env() noexcept
{
    // Logging below may allocate and so read options again.
    // It must see loaded == true.
    if (store.loaded.exchange(true, std::memory_order_acq_rel))
        return;
    read_options_from_env();
}

} // namespace

parse_result parse_option(char const *s, unsigned long long max,
        unsigned long long &value) noexcept
{
    if (!s || !*s)
        return parse_result::absent;
    if (*s == 'y' || *s == 'Y' || *s == 't' || *s == 'T') { // yes, true
        value = 1;
        return parse_result::ok;
    }
    if (*s == 'n' || *s == 'N' || *s == 'f' || *s == 'F') { // no, false
        value = 0;
        return parse_result::ok;
    }
    char *end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (errno || *end || v > max)
        return parse_result::invalid;
    value = v;
    return parse_result::ok;
}

void read_options_from_env() noexcept
{
    struct {
        char const *name;
        unsigned long long max;
        unsigned long long value;
        parse_result result;
    } vars[] = {
        {"SEGALLOC_CACHED_SEGMENTS", 1 << 16, 0, parse_result::absent},
        {"SEGALLOC_MAINTAIN_INTERVAL", UINT_MAX, 0, parse_result::absent},
        {"SEGALLOC_LARGE_OS_PAGES", 1, 0, parse_result::absent},
        {"SEGALLOC_VERBOSE", 1, 0, parse_result::absent},
    };
    for (auto &v : vars)
        v.result = parse_option(std::getenv(v.name), v.max, v.value);

    if (vars[0].result == parse_result::ok)
        store.cached_segments.store(vars[0].value, std::memory_order_relaxed);
    if (vars[1].result == parse_result::ok && vars[1].value)
        store.maintain_interval.store(static_cast<unsigned>(vars[1].value),
                std::memory_order_relaxed);
    if (vars[2].result == parse_result::ok)
        store.large_os_pages.store(vars[2].value, std::memory_order_relaxed);
    if (vars[3].result == parse_result::ok)
        store.verbose.store(vars[3].value, std::memory_order_relaxed);

    for (auto &v : vars)
        if (v.result == parse_result::invalid)
            SEGALLOC_LOG(warning) << "ignoring invalid value of " << v.name;
}

options get_options() noexcept
{
    if (!store.loaded.load(std::memory_order_acquire))
        load_from_env();
    options result;
    result.cached_segments =
        store.cached_segments.load(std::memory_order_relaxed);
    result.maintain_interval =
        store.maintain_interval.load(std::memory_order_relaxed);
    result.large_os_pages = store.large_os_pages.load(std::memory_order_relaxed);
    result.verbose = store.verbose.load(std::memory_order_relaxed);
    return result;
}

void set_options(options const &opts) noexcept
{
    if (!store.loaded.load(std::memory_order_acquire))
        load_from_env();
    store.cached_segments.store(opts.cached_segments, std::memory_order_relaxed);
    if (opts.maintain_interval)
        store.maintain_interval.store(opts.maintain_interval,
                std::memory_order_relaxed);
    store.large_os_pages.store(opts.large_os_pages, std::memory_order_relaxed);
    store.verbose.store(opts.verbose, std::memory_order_relaxed);
}

} // namespace segalloc
