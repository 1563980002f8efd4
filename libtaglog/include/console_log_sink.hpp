//
// Created by Giuseppe Francione on 03/10/26.
//

#ifndef TAGLOG_CONSOLE_LOG_SINK_HPP
#define TAGLOG_CONSOLE_LOG_SINK_HPP

#include "log_sink.hpp"
#include <iostream>
#include <ostream>

namespace taglog {

/**
 * @brief Writes normal lines to stdout and error lines to stderr.
 *
 * Streams can be replaced (e.g. by std::ostringstream in tests). The
 * context pointer is ignored.
 */
class ConsoleLogSink final : public ILogSink {
public:
    ///< Wrap error lines in red ANSI escape codes.
    bool use_colors = false;

    explicit ConsoleLogSink(std::ostream& out = std::cout, std::ostream& err = std::cerr)
        : out_(out), err_(err) {}

    void write_line(const std::string_view message, const void*) override {
        out_ << message << std::endl;
    }

    void write_error_line(const std::string_view message, const void*) override {
        if (use_colors) {
            err_ << "\033[1;31m" << message << "\033[0m" << std::endl;
        } else {
            err_ << message << std::endl;
        }
    }

private:
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace taglog

#endif // TAGLOG_CONSOLE_LOG_SINK_HPP
