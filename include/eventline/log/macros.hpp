#pragma once

#include "logger.hpp"

/// Arguments are only evaluated when the level is enabled
#define EVENTLINE_LOG_AT(lvl, ...)                                                   \
    do {                                                                             \
        auto& eventline_log_ = ::eventline::log::logger::instance();                 \
        if (eventline_log_.enabled(lvl)) {                                           \
            eventline_log_.log(lvl, __FILE__, __LINE__, __VA_ARGS__);                \
        }                                                                            \
    } while (0)

#ifdef EVENTLINE_DEBUG
#define EVENTLINE_LOG_DEBUG(...) EVENTLINE_LOG_AT(::eventline::log::level::debug, __VA_ARGS__)
#else
#define EVENTLINE_LOG_DEBUG(...) ((void)0)
#endif

#define EVENTLINE_LOG_INFO(...) EVENTLINE_LOG_AT(::eventline::log::level::info, __VA_ARGS__)
#define EVENTLINE_LOG_WARNING(...) EVENTLINE_LOG_AT(::eventline::log::level::warning, __VA_ARGS__)
#define EVENTLINE_LOG_ERROR(...) EVENTLINE_LOG_AT(::eventline::log::level::error, __VA_ARGS__)
