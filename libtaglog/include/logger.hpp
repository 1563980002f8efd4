//
// Created by Giuseppe Francione on 03/10/26.
//

/**
 * @file logger.hpp
 * @brief Provides the tag-gated, thread-safe logging facade.
 *
 * This file defines the Logger class, the entry point for all logging in
 * taglog. A message carries zero or more tags and is only emitted when one
 * of them is active. Emitted lines go to the history buffer, to every
 * registered ILogSink and finally to the EventBus subscribers.
 *
 * The development entry points (log, log_value, log_fast, show,
 * set_tag_active, set_tag_disabled) exist only when TAGLOG_DEV_LOGGING is
 * non-zero. Otherwise they are empty inline functions that the compiler
 * removes; log_error and the queries are always available.
 */

#ifndef TAGLOG_LOGGER_HPP
#define TAGLOG_LOGGER_HPP

#include "event_bus.hpp"
#include "events.hpp"
#include "history_buffer.hpp"
#include "log_settings.hpp"
#include "log_sink.hpp"
#include "tag_registry.hpp"
#include "value_format.hpp"
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#ifndef TAGLOG_DEV_LOGGING
#define TAGLOG_DEV_LOGGING 1
#endif

namespace taglog {

/**
 * @brief Tag-gated logging facade.
 *
 * Owns the whole logging context: the active tags, the output flags, the
 * history, the sinks and the event bus. All state is guarded by one mutex.
 * Events are published after the mutex is released, so handlers may log.
 *
 * Use Logger::instance() for the process-wide logger, or construct private
 * instances (tests, embedded subsystems).
 */
class Logger {
public:
    /// Blank logger: no tag is active until initialize() or apply_settings().
    Logger();

    /**
     * @brief Construct and initialize from a settings provider.
     * @param provider Source of the initial settings.
     */
    explicit Logger(const ISettingsProvider& provider);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief The process-wide logger.
     *
     * Initialized with DefaultSettingsProvider on first use, so the FORCE tag
     * is active from the start. Hosts override the defaults with
     * apply_settings().
     */
    static Logger& instance();

    // --- Configuration ---

    /**
     * @brief Apply the provider's settings unless tags are already active.
     *
     * Startup hooks that run more than once per process (hot reload, plugin
     * re-registration) keep the state of the first run.
     * Exceptions thrown by the provider propagate unchanged.
     */
    void initialize(const ISettingsProvider& provider);

    /**
     * @brief Copy the output flags and reset the active tags.
     *
     * Replaces the whole tag state with settings.default_active_tags plus
     * the FORCE tag. May be called any number of times.
     */
    void apply_settings(const LogSettings& settings);

    void set_log_to_console(bool enabled);
    void set_log_to_history(bool enabled);
    void set_show_tag_header(bool enabled);
    void set_show_timestamp(bool enabled);

    [[nodiscard]] bool log_to_console() const;
    [[nodiscard]] bool log_to_history() const;
    [[nodiscard]] bool show_tag_header() const;
    [[nodiscard]] bool show_timestamp() const;

    // --- Sinks ---

    /**
     * @brief Add a new log sink to the logger.
     * The Logger takes ownership of the sink. Null sinks are ignored.
     */
    void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    void clear_sinks();

    // --- Events ---

    /**
     * @brief Subscribe to normal log lines. The handler gets the final text.
     */
    SubscriptionId on_logged(std::function<void(const std::string&)> handler);

    /**
     * @brief Subscribe to error lines. The handler gets the final text.
     */
    SubscriptionId on_error_logged(std::function<void(const std::string&)> handler);

    /**
     * @brief Remove a handler registered with on_logged() or on_error_logged().
     * @return true if a handler was removed.
     */
    bool unsubscribe(SubscriptionId id);

    // --- Development logging ---

#if TAGLOG_DEV_LOGGING
    /**
     * @brief Log a message if one of its tags is active.
     *
     * Untagged messages are always emitted. With tags, the message is
     * dropped silently unless one of them is active; when it passes and the
     * tag header is enabled, "[TAG1,TAG2] " is prepended.
     */
    void log(std::string_view message, TagList tags = {});

    void log(std::string_view message, std::initializer_list<std::string_view> tags) {
        log(message, TagList(tags.begin(), tags.size()));
    }

    void log(std::string_view message, const std::vector<std::string>& tags);

    /**
     * @brief Log the text representation of a value.
     * Tags are forwarded, so value logs are filtered like text logs.
     */
    template <typename T>
    void log_value(const T& value, TagList tags = {}) {
        log(value_text(value), tags);
    }

    template <typename T>
    void log_value(const T& value, std::initializer_list<std::string_view> tags) {
        log(value_text(value), TagList(tags.begin(), tags.size()));
    }

    template <typename T>
    void log_value(const T& value, const std::vector<std::string>& tags) {
        log(value_text(value), tags);
    }

    /**
     * @brief Unfiltered, undecorated log.
     *
     * Always appended to the history and written to the sinks, whatever the
     * flags say. The opaque context is forwarded to the sinks.
     */
    void log_fast(std::string_view message, const void* context = nullptr);

    /**
     * @brief Diagnostic dump of positional values on a single line.
     *
     * Renders "[i: null]" or "[i: type - text]" per value, with no
     * separators. The line goes to the history without terminator.
     */
    template <typename... Values>
    void show(const Values&... values) {
        const std::vector<ShowField> fields{describe(values)...};
        show_fields(fields);
    }

    void set_tag_active(std::string_view tag);
    void set_tag_disabled(std::string_view tag);
#else
    void log(std::string_view, TagList = {}) {}
    void log(std::string_view, std::initializer_list<std::string_view>) {}
    void log(std::string_view, const std::vector<std::string>&) {}

    template <typename T>
    void log_value(const T&, TagList = {}) {}

    template <typename T>
    void log_value(const T&, std::initializer_list<std::string_view>) {}

    template <typename T>
    void log_value(const T&, const std::vector<std::string>&) {}

    void log_fast(std::string_view, const void* = nullptr) {}

    template <typename... Values>
    void show(const Values&...) {}

    void set_tag_active(std::string_view) {}
    void set_tag_disabled(std::string_view) {}
#endif

    // --- Errors ---

    /**
     * @brief Log an error. Never filtered.
     *
     * Same decoration as log(). Always written to the sinks' error channel,
     * regardless of log_to_console.
     */
    void log_error(std::string_view message, TagList tags = {});

    void log_error(std::string_view message, std::initializer_list<std::string_view> tags) {
        log_error(message, TagList(tags.begin(), tags.size()));
    }

    void log_error(std::string_view message, const std::vector<std::string>& tags);

    // --- Queries ---

    [[nodiscard]] bool is_tag_active(std::string_view tag) const;

    /// Active tags in activation order.
    [[nodiscard]] std::vector<std::string> get_tags() const;

    /// Copy of the accumulated history.
    [[nodiscard]] std::string history() const;

    /// Empty the history.
    void clear();

private:
#if TAGLOG_DEV_LOGGING
    void show_fields(std::span<const ShowField> fields);

    template <typename T>
    static std::string value_text(const T& value) {
        const ShowField field = describe(value);
        return field ? field->text : std::string("null");
    }
#endif

    // caller holds mtx_
    void apply_locked(const LogSettings& settings);
    [[nodiscard]] std::string decorate(std::string_view message, TagList tags) const;
    void report_handler_failure(const std::exception& e);

    ///< Protects everything below except bus_, which has its own lock.
    mutable std::mutex mtx_;
    TagRegistry tags_;
    HistoryBuffer history_;
    ///< List of all registered sink implementations.
    std::vector<std::unique_ptr<ILogSink>> sinks_;
    bool log_to_console_ = true;
    bool log_to_history_ = true;
    bool show_tag_header_ = true;
    bool show_timestamp_ = false;

    EventBus bus_;
};

/**
 * @brief Current local wall-clock time as HH:MM:SS (24h, zero padded).
 */
std::string current_time_hms();

} // namespace taglog

#endif // TAGLOG_LOGGER_HPP
