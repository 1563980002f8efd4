//
// Created by Giuseppe Francione on 06/10/26.
//

/**
 * @file log_settings.hpp
 * @brief Configuration snapshot applied to a Logger and its providers.
 */

#ifndef TAGLOG_LOG_SETTINGS_HPP
#define TAGLOG_LOG_SETTINGS_HPP

#include <string>
#include <vector>

namespace taglog {

/**
 * @brief Snapshot of the logger configuration.
 *
 * Obtained once from an ISettingsProvider and applied with
 * Logger::apply_settings(). The Logger copies it; later changes to a
 * snapshot do not affect a logger it was applied to.
 */
struct LogSettings {
    bool log_to_console = true;   ///< Write normal lines to the sinks
    bool log_to_history = true;   ///< Mirror lines into the history buffer
    bool show_tag_header = true;  ///< Prefix "[TAG,TAG] " to tagged lines
    bool show_timestamp = false;  ///< Prefix "(HH:MM:SS) " to lines

    ///< Tags active right after the settings are applied, in order.
    std::vector<std::string> default_active_tags;
};

/**
 * @brief Source of persisted logger settings.
 *
 * Where the values come from (a config file, command line, an embedded
 * resource) is up to the implementation. Exceptions thrown here propagate
 * to the caller of Logger::initialize().
 */
struct ISettingsProvider {
    virtual ~ISettingsProvider() = default;

    /**
     * @brief Read the current persisted settings.
     */
    [[nodiscard]] virtual LogSettings current_settings() const = 0;
};

/**
 * @brief Provider returning the built-in defaults.
 *
 * Console and history on, tag header on, no timestamp, only the FORCE tag
 * active.
 */
class DefaultSettingsProvider final : public ISettingsProvider {
public:
    [[nodiscard]] LogSettings current_settings() const override;
};

/**
 * @brief Provider wrapping a fixed snapshot.
 */
class StaticSettingsProvider final : public ISettingsProvider {
public:
    explicit StaticSettingsProvider(LogSettings settings);

    [[nodiscard]] LogSettings current_settings() const override { return settings_; }

private:
    LogSettings settings_;
};

} // namespace taglog

#endif // TAGLOG_LOG_SETTINGS_HPP
