//
// Created by Giuseppe Francione on 02/10/26.
//

#ifndef TAGLOG_LOG_SINK_HPP
#define TAGLOG_LOG_SINK_HPP

#include <string_view>

namespace taglog {

/**
 * @brief Abstract sink interface for formatted log lines.
 *
 * Implementations of ILogSink define where log text is delivered
 * (e.g. console, an IDE pane, a test probe). The Logger has already applied
 * tag filtering and decoration, so a sink writes the text it receives as-is.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Write a line to the normal channel.
     * @param message Fully formatted text, without line terminator.
     * @param context Opaque caller context (may be null). Sinks that have no
     * use for it ignore it.
     */
    virtual void write_line(std::string_view message,
                            const void* context) = 0;

    /**
     * @brief Write a line to the dedicated error channel.
     * @param message Fully formatted text, without line terminator.
     * @param context Opaque caller context (may be null).
     */
    virtual void write_error_line(std::string_view message,
                                  const void* context) = 0;
};

} // namespace taglog

#endif // TAGLOG_LOG_SINK_HPP
