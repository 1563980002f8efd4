//
// Created by Giuseppe Francione on 11/10/26.
//

#include "cli_parser.hpp"
#include "../../../libtaglog/include/main_tags.hpp"
#include "../../../libtaglog/include/tag_registry.hpp"
#include <CLI/CLI.hpp>

namespace {
// helper rejecting empty or whitespace-only tags
struct TagValidator : CLI::Validator {
    TagValidator() {
        name_ = "TAG";
        func_ = [](const std::string& str) {
            if (taglog::is_blank(str)) {
                return std::string("Tags must not be empty or whitespace-only.");
            }
            return std::string(); // ok
        };
    }
};
} // namespace

taglog::LogSettings Settings::to_log_settings() const {
    taglog::LogSettings s;
    s.log_to_console = !no_console;
    s.log_to_history = !no_history;
    s.show_tag_header = !no_tag_header;
    s.show_timestamp = timestamp;
    s.default_active_tags = active_tags;
    return s;
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // persisted settings: any long option can also be set in this file
    app.set_config("--config", "", "Read settings from an INI or TOML file.");

    // --- Output flags ---
    app.add_flag("--no-console", settings.no_console,
                 "Don't write normal log lines to the console.");

    app.add_flag("--no-history", settings.no_history,
                 "Don't record log lines in the history.");

    app.add_flag("--no-tag-header", settings.no_tag_header,
                 "Don't prefix tagged lines with [TAG,...].");

    app.add_flag("--timestamp", settings.timestamp,
                 "Prefix lines with (HH:MM:SS).");

    app.add_flag("--color", settings.color,
                 "Print error lines in red.");

    // --- Tags ---
    static const TagValidator tag_validator;

    // INFO is active unless the command line or the config file says otherwise
    settings.active_tags = {std::string(taglog::MainTag::INFO)};
    // one value per occurrence, so "-t UI hello" leaves "hello" as a message
    app.add_option("-a,--active", settings.active_tags,
                   "Tag active at startup. (Can be used multiple times).")
                   ->check(tag_validator)
                   ->allow_extra_args(false)
                   ->capture_default_str();

    app.add_option("-d,--disable", settings.disabled_tags,
                   "Tag to disable after startup. (Can be used multiple times).")
                   ->check(tag_validator)
                   ->allow_extra_args(false);

    app.add_option("-t,--tag", settings.message_tags,
                   "Tag attached to every message. (Can be used multiple times).")
                   ->check(tag_validator)
                   ->allow_extra_args(false);

    // --- Mode ---
    auto* error_flag = app.add_flag("-e,--error", settings.error,
                                    "Log messages as errors (never filtered).");

    app.add_flag("--fast", settings.fast,
                 "Log messages without filtering or decoration.")
                 ->excludes(error_flag);

    // --- Reporting ---
    app.add_flag("--print-history", settings.print_history,
                 "Print the accumulated history to stdout before exiting.");

    app.add_flag("--print-tags", settings.print_tags,
                 "Print the active tags to stdout before exiting.");

    app.add_flag("--stats", settings.stats,
                 "Print the number of emitted lines and errors to stderr.");

    // --- Positional Arguments ---
    app.add_option("messages", settings.messages,
                   "Messages to log. Read from stdin, one per line, when omitted.");

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.fast && !settings.message_tags.empty()) {
            throw CLI::ValidationError("--fast messages are never filtered; --tag cannot be used with it.");
        }
    });
}
