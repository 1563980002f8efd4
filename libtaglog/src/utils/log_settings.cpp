//
// Created by Giuseppe Francione on 06/10/26.
//

#include "../../include/log_settings.hpp"
#include "../../include/main_tags.hpp"
#include <utility>

namespace taglog {

LogSettings DefaultSettingsProvider::current_settings() const {
    LogSettings settings;
    settings.default_active_tags.emplace_back(MainTag::FORCE);
    return settings;
}

StaticSettingsProvider::StaticSettingsProvider(LogSettings settings)
    : settings_(std::move(settings)) {}

} // namespace taglog
