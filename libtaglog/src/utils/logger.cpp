//
// Created by Giuseppe Francione on 03/10/26.
//

#include "../../include/logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace taglog {

namespace {

std::vector<std::string_view> as_views(const std::vector<std::string>& tags) {
    return {tags.begin(), tags.end()};
}

} // namespace

std::string current_time_hms() {
    const std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S");
    return oss.str();
}

Logger::Logger() {
    bus_.set_error_handler([this](const std::exception& e) { report_handler_failure(e); });
}

Logger::Logger(const ISettingsProvider& provider) : Logger() {
    initialize(provider);
}

Logger::~Logger() = default;

Logger& Logger::instance() {
    static Logger inst{DefaultSettingsProvider{}};
    return inst;
}

void Logger::initialize(const ISettingsProvider& provider) {
    {
        std::lock_guard lock(mtx_);
        if (!tags_.empty()) return;
    }
    const LogSettings settings = provider.current_settings();

    std::lock_guard lock(mtx_);
    if (!tags_.empty()) return;
    apply_locked(settings);
}

void Logger::apply_settings(const LogSettings& settings) {
    std::lock_guard lock(mtx_);
    apply_locked(settings);
}

void Logger::apply_locked(const LogSettings& settings) {
    log_to_console_ = settings.log_to_console;
    log_to_history_ = settings.log_to_history;
    show_tag_header_ = settings.show_tag_header;
    show_timestamp_ = settings.show_timestamp;
    tags_.reset(settings);
}

void Logger::set_log_to_console(const bool enabled) {
    std::lock_guard lock(mtx_);
    log_to_console_ = enabled;
}

void Logger::set_log_to_history(const bool enabled) {
    std::lock_guard lock(mtx_);
    log_to_history_ = enabled;
}

void Logger::set_show_tag_header(const bool enabled) {
    std::lock_guard lock(mtx_);
    show_tag_header_ = enabled;
}

void Logger::set_show_timestamp(const bool enabled) {
    std::lock_guard lock(mtx_);
    show_timestamp_ = enabled;
}

bool Logger::log_to_console() const {
    std::lock_guard lock(mtx_);
    return log_to_console_;
}

bool Logger::log_to_history() const {
    std::lock_guard lock(mtx_);
    return log_to_history_;
}

bool Logger::show_tag_header() const {
    std::lock_guard lock(mtx_);
    return show_tag_header_;
}

bool Logger::show_timestamp() const {
    std::lock_guard lock(mtx_);
    return show_timestamp_;
}

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    std::lock_guard lock(mtx_);
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

SubscriptionId Logger::on_logged(std::function<void(const std::string&)> handler) {
    return bus_.subscribe<LoggedEvent>([handler = std::move(handler)](const LoggedEvent& e) {
        handler(e.text);
    });
}

SubscriptionId Logger::on_error_logged(std::function<void(const std::string&)> handler) {
    return bus_.subscribe<ErrorLoggedEvent>([handler = std::move(handler)](const ErrorLoggedEvent& e) {
        handler(e.text);
    });
}

bool Logger::unsubscribe(const SubscriptionId id) {
    return bus_.unsubscribe(id);
}

std::string Logger::decorate(const std::string_view message, const TagList tags) const {
    std::string out;
    if (show_timestamp_) {
        out += "(" + current_time_hms() + ") ";
    }
    if (!tags.empty() && show_tag_header_) {
        out += '[';
        for (std::size_t i = 0; i < tags.size(); ++i) {
            if (i > 0) out += ',';
            out += tags[i];
        }
        out += "] ";
    }
    out += message;
    return out;
}

#if TAGLOG_DEV_LOGGING

void Logger::log(const std::string_view message, const TagList tags) {
    LoggedEvent event;
    {
        std::lock_guard lock(mtx_);
        if (!tags.empty() && !tags_.has_any(tags)) {
            return;
        }
        event.text = decorate(message, tags);

        if (log_to_history_) {
            history_.append(event.text);
        }
        if (log_to_console_) {
            for (const auto& sink : sinks_) {
                sink->write_line(event.text, nullptr);
            }
        }
    }
    bus_.publish(event);
}

void Logger::log(const std::string_view message, const std::vector<std::string>& tags) {
    const auto views = as_views(tags);
    log(message, TagList(views));
}

void Logger::log_fast(const std::string_view message, const void* context) {
    {
        std::lock_guard lock(mtx_);
        history_.append(message);
        for (const auto& sink : sinks_) {
            sink->write_line(message, context);
        }
    }
    bus_.publish(LoggedEvent{std::string(message)});
}

void Logger::show_fields(const std::span<const ShowField> fields) {
    std::string line;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        line += render_field(i, fields[i]);
    }
    {
        std::lock_guard lock(mtx_);
        history_.append_raw(line);
        for (const auto& sink : sinks_) {
            sink->write_line(line, nullptr);
        }
    }
    bus_.publish(LoggedEvent{std::move(line)});
}

void Logger::set_tag_active(const std::string_view tag) {
    std::lock_guard lock(mtx_);
    tags_.activate(tag);
}

void Logger::set_tag_disabled(const std::string_view tag) {
    std::lock_guard lock(mtx_);
    tags_.deactivate(tag);
}

#endif // TAGLOG_DEV_LOGGING

void Logger::log_error(const std::string_view message, const TagList tags) {
    ErrorLoggedEvent event;
    {
        std::lock_guard lock(mtx_);
        event.text = decorate(message, tags);

        if (log_to_history_) {
            history_.append(event.text);
        }
        for (const auto& sink : sinks_) {
            sink->write_error_line(event.text, nullptr);
        }
    }
    bus_.publish(event);
}

void Logger::log_error(const std::string_view message, const std::vector<std::string>& tags) {
    const auto views = as_views(tags);
    log_error(message, TagList(views));
}

bool Logger::is_tag_active(const std::string_view tag) const {
    std::lock_guard lock(mtx_);
    return tags_.is_active(tag);
}

std::vector<std::string> Logger::get_tags() const {
    std::lock_guard lock(mtx_);
    return tags_.snapshot();
}

std::string Logger::history() const {
    std::lock_guard lock(mtx_);
    return history_.contents();
}

void Logger::clear() {
    std::lock_guard lock(mtx_);
    history_.clear();
}

void Logger::report_handler_failure(const std::exception& e) {
    const std::string text = std::string("[taglog] event handler failed: ") + e.what();
    std::lock_guard lock(mtx_);
    for (const auto& sink : sinks_) {
        sink->write_error_line(text, nullptr);
    }
}

} // namespace taglog
