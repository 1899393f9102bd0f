/*
 * Copyright (C) Andrey Pikas
 */

#include "log.hpp"

#include <exception>

#include <boost/log/core.hpp>
#include <boost/log/utility/exception_handler.hpp>

#include <segalloc/options.hpp>

namespace segalloc {

namespace {

thread_local bool logging = false;

bool suppress_log_exceptions()
{
    // Allocation functions are noexcept, a failure to log must not escape.
    boost::log::core::get()->set_exception_handler(
            boost::log::make_exception_suppressor());
    return true;
}

} // namespace

log_scope::log_scope(boost::log::trivial::severity_level level) noexcept
{
    boost::log::trivial::severity_level threshold = get_options().verbose
        ? boost::log::trivial::debug
        : boost::log::trivial::warning;
    enabled_ = !logging && level >= threshold;
    if (!enabled_)
        return;
    logging = true;
    try {
        static bool suppressed = suppress_log_exceptions();
        (void)suppressed;
    }
    catch (std::exception const &) {
        logging = false;
        enabled_ = false;
    }
}

log_scope::~log_scope()
{
    if (enabled_)
        logging = false;
}

log_silence::log_silence() noexcept : was_logging_(logging)
{
    logging = true;
}

log_silence::~log_silence()
{
    logging = was_logging_;
}

} // namespace segalloc
