//
// Created by Giuseppe Francione on 11/10/26.
//

#ifndef TAGLOG_CLI_PARSER_HPP
#define TAGLOG_CLI_PARSER_HPP

#include <string>
#include <vector>
#include "../../../libtaglog/include/log_settings.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool no_console = false;
    bool no_history = false;
    bool no_tag_header = false;
    bool timestamp = false;

    bool error = false;
    bool fast = false;
    bool print_history = false;
    bool print_tags = false;
    bool stats = false;
    bool color = false;

    std::vector<std::string> active_tags;
    std::vector<std::string> disabled_tags;
    std::vector<std::string> message_tags;
    std::vector<std::string> messages;

    /**
     * @brief Snapshot handed to the logger at startup.
     */
    [[nodiscard]] taglog::LogSettings to_log_settings() const;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif //TAGLOG_CLI_PARSER_HPP
