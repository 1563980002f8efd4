//
// Created by Giuseppe Francione on 15/10/26.
//

// built against the taglog variant compiled with TAGLOG_DEV_LOGGING=0

#include <gtest/gtest.h>

#include "../libtaglog/include/taglog.hpp"
#include "common/probe_sink.hpp"

#include <memory>
#include <string>
#include <vector>

static_assert(TAGLOG_DEV_LOGGING == 0, "this suite needs the release variant of taglog");

namespace {

int evaluated = 0;

std::string expensive_message() {
    ++evaluated;
    return "expensive";
}

} // namespace

TEST(DevLoggingDisabledTest, DevelopmentCallsDoNothing) {
    taglog::Logger logger{taglog::DefaultSettingsProvider{}};
    auto sink = std::make_unique<ProbeSink>();
    ProbeSink* probe = sink.get();
    logger.add_sink(std::move(sink));

    int events = 0;
    logger.on_logged([&](const std::string&) { ++events; });

    logger.log("hello");
    logger.log("tagged", {"F"});
    logger.log_value(5);
    logger.log_value(5, std::vector<std::string>{"F"});
    logger.log_fast("fast");
    logger.show(nullptr, 5);
    logger.set_tag_active("UI");

    EXPECT_EQ(logger.history(), "");
    EXPECT_TRUE(probe->lines.empty());
    EXPECT_EQ(events, 0);
    EXPECT_FALSE(logger.is_tag_active("UI"));
}

TEST(DevLoggingDisabledTest, ErrorsAreStillLogged) {
    taglog::Logger logger{taglog::DefaultSettingsProvider{}};
    auto sink = std::make_unique<ProbeSink>();
    ProbeSink* probe = sink.get();
    logger.add_sink(std::move(sink));

    logger.log_error("still here", {"IO"});

    EXPECT_EQ(logger.history(), "[IO] still here\n");
    EXPECT_EQ(probe->error_lines, (std::vector<std::string>{"[IO] still here"}));
    EXPECT_EQ(logger.get_tags(), (std::vector<std::string>{"F"}));
}

TEST(DevLoggingDisabledTest, MacrosSkipArgumentEvaluation) {
    evaluated = 0;
    TAGLOG_LOG(expensive_message(), {"INFO"});
    TAGLOG_LOG_FAST(expensive_message());
    TAGLOG_SHOW(expensive_message(), 1);
    EXPECT_EQ(evaluated, 0);
}
