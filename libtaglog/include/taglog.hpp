//
// Created by Giuseppe Francione on 09/10/26.
//

/**
 * @file taglog.hpp
 * @brief Public API for the taglog library.
 *
 * Includes the Logger and its collaborators, and defines shorthand macros
 * bound to the process-wide logger. When TAGLOG_DEV_LOGGING is 0 the
 * development macros expand to nothing, so their arguments are not even
 * evaluated.
 */

#ifndef TAGLOG_HPP
#define TAGLOG_HPP

#include "console_log_sink.hpp"
#include "event_bus.hpp"
#include "events.hpp"
#include "log_settings.hpp"
#include "log_sink.hpp"
#include "logger.hpp"
#include "main_tags.hpp"

#if TAGLOG_DEV_LOGGING
#define TAGLOG_LOG(...)      ::taglog::Logger::instance().log(__VA_ARGS__)
#define TAGLOG_LOG_FAST(...) ::taglog::Logger::instance().log_fast(__VA_ARGS__)
#define TAGLOG_SHOW(...)     ::taglog::Logger::instance().show(__VA_ARGS__)
#else
#define TAGLOG_LOG(...)      ((void)0)
#define TAGLOG_LOG_FAST(...) ((void)0)
#define TAGLOG_SHOW(...)     ((void)0)
#endif

#define TAGLOG_ERROR(...)    ::taglog::Logger::instance().log_error(__VA_ARGS__)

#endif // TAGLOG_HPP
