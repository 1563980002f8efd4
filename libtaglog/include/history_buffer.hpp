//
// Created by Giuseppe Francione on 06/10/26.
//

#ifndef TAGLOG_HISTORY_BUFFER_HPP
#define TAGLOG_HISTORY_BUFFER_HPP

#include <string>
#include <string_view>

namespace taglog {

/**
 * @brief In-memory transcript of every emitted line.
 *
 * Append-only text, in emission order. There is no size limit; callers that
 * need a bound clear it periodically. Not synchronized, the owning Logger
 * serializes access.
 */
class HistoryBuffer {
public:
    /// Append a line followed by '\n'.
    void append(std::string_view line);

    /// Append text as-is, without line terminator.
    void append_raw(std::string_view text);

    void clear() noexcept { text_.clear(); }

    [[nodiscard]] const std::string& contents() const noexcept { return text_; }
    [[nodiscard]] std::size_t size() const noexcept { return text_.size(); }
    [[nodiscard]] bool empty() const noexcept { return text_.empty(); }

private:
    std::string text_;
};

} // namespace taglog

#endif // TAGLOG_HISTORY_BUFFER_HPP
