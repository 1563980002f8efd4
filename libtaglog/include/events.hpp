//
// Created by Giuseppe Francione on 02/10/26.
//

#ifndef TAGLOG_EVENTS_HPP
#define TAGLOG_EVENTS_HPP

#include <string>

namespace taglog {

/**
 * @brief Events published by the Logger after a line has been emitted.
 *
 * These lightweight structs are used with EventBus to notify subscribers
 * (e.g. an in-game console, a log viewer, analytics) about logging traffic.
 * They are simple data carriers without behavior.
 */

/**
 * @brief Emitted after a normal log line reached its sinks.
 */
struct LoggedEvent {
    std::string text; ///< Final text, after tag header and timestamp decoration
};

/**
 * @brief Emitted after an error line reached its sinks.
 */
struct ErrorLoggedEvent {
    std::string text; ///< Final text, after tag header and timestamp decoration
};

} // namespace taglog

#endif // TAGLOG_EVENTS_HPP
