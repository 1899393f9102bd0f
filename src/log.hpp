/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <boost/log/trivial.hpp>

namespace segalloc {

// Guards one log statement. Messages below the configured threshold are
// dropped, and so are messages issued while the same thread is already
// logging: the logger itself may allocate through this allocator.
class log_scope {
public:
    explicit log_scope(boost::log::trivial::severity_level level) noexcept;
    ~log_scope();

    bool next() noexcept
    {
        bool result = enabled_ && !done_;
        done_ = true;
        return result;
    }

private:
    log_scope(log_scope const &) = delete;
    void operator = (log_scope const &) = delete;

    bool enabled_;
    bool done_ = false;
};

// Drops all messages of the calling thread while alive.
class log_silence {
public:
    log_silence() noexcept;
    ~log_silence();

private:
    log_silence(log_silence const &) = delete;
    void operator = (log_silence const &) = delete;

    bool was_logging_;
};

} // namespace segalloc

#define SEGALLOC_LOG(severity) \
    for (::segalloc::log_scope segalloc_log_scope_( \
                ::boost::log::trivial::severity); \
            segalloc_log_scope_.next();) \
        BOOST_LOG_TRIVIAL(severity) << "segalloc: "
