//
// Created by Giuseppe Francione on 06/10/26.
//

#include "../../include/history_buffer.hpp"

namespace taglog {

void HistoryBuffer::append(const std::string_view line) {
    text_.append(line);
    text_.push_back('\n');
}

void HistoryBuffer::append_raw(const std::string_view text) {
    text_.append(text);
}

} // namespace taglog
