//
// Created by Giuseppe Francione on 10/10/26.
//

#include <atomic>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include <CLI/CLI.hpp>
#include "../../libtaglog/include/taglog.hpp"

#ifdef _WIN32
#include <io.h>      // _isatty, _fileno
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

using namespace taglog;

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

// route one message according to the selected mode
static void emit(Logger& logger, const Settings& settings, const std::string& message) {
    if (settings.fast) {
        logger.log_fast(message);
    } else if (settings.error) {
        logger.log_error(message, settings.message_tags);
    } else {
        logger.log(message, settings.message_tags);
    }
}

int main(int argc, char* argv[]) {

    CLI::App app{"taglog: tag-gated logging from the command line."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    Logger& logger = Logger::instance();

    // set console logger
    auto consoleSink = std::make_unique<ConsoleLogSink>();
    consoleSink->use_colors = settings.color && is_stderr_a_tty();
    logger.add_sink(std::move(consoleSink));

    logger.apply_settings(settings.to_log_settings());

    for (const auto& tag : settings.disabled_tags) {
        logger.set_tag_disabled(tag);
    }

    // count emitted lines through the logger events
    std::atomic<size_t> logged{0};
    std::atomic<size_t> errors{0};
    logger.on_logged([&](const std::string&) { ++logged; });
    logger.on_error_logged([&](const std::string&) { ++errors; });

    if (!settings.messages.empty()) {
        for (const auto& message : settings.messages) {
            emit(logger, settings, message);
        }
    } else {
        std::string line;
        while (std::getline(std::cin, line)) {
            emit(logger, settings, line);
        }
        if (std::cin.bad()) {
            logger.log_error("Failed to read messages from stdin.", {"taglog"});
            return 1;
        }
    }

    if (settings.print_history) {
        std::cout << logger.history() << std::flush;
    }

    if (settings.print_tags) {
        const auto tags = logger.get_tags();
        for (size_t i = 0; i < tags.size(); ++i) {
            std::cout << (i > 0 ? "," : "") << tags[i];
        }
        std::cout << std::endl;
    }

    if (settings.stats) {
        std::cerr << CYAN << "[STATS] " << logged.load() << " logged, "
                  << errors.load() << " errors" << RESET << std::endl;
    }

    return 0;
}
