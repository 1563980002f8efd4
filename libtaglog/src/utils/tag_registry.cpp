//
// Created by Giuseppe Francione on 05/10/26.
//

#include "../../include/tag_registry.hpp"
#include "../../include/main_tags.hpp"
#include <algorithm>
#include <cctype>

namespace taglog {

bool is_blank(const std::string_view tag) {
    return std::ranges::all_of(tag, [](const unsigned char c) { return std::isspace(c) != 0; });
}

void TagRegistry::activate(const std::string_view tag) {
    if (is_blank(tag) || is_active(tag)) return;
    tags_.emplace_back(tag);
}

void TagRegistry::deactivate(const std::string_view tag) {
    // the force tag can't be disabled
    if (is_blank(tag) || tag == MainTag::FORCE) return;
    std::erase(tags_, tag);
}

bool TagRegistry::is_active(const std::string_view tag) const {
    if (is_blank(tag)) return false;
    return std::find(tags_.begin(), tags_.end(), tag) != tags_.end();
}

bool TagRegistry::has_any(const TagList tags) const {
    return std::ranges::any_of(tags, [this](const std::string_view t) { return is_active(t); });
}

void TagRegistry::reset(const LogSettings& settings) {
    tags_.clear();
    for (const auto& tag : settings.default_active_tags) {
        activate(tag);
    }

    if (!is_active(MainTag::FORCE)) {
        tags_.insert(tags_.begin(), std::string(MainTag::FORCE));
    }
}

} // namespace taglog
