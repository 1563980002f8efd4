//
// Created by Giuseppe Francione on 13/10/26.
//

#include <gtest/gtest.h>

#include "../libtaglog/include/main_tags.hpp"
#include "../libtaglog/include/tag_registry.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

using taglog::LogSettings;
using taglog::TagList;
using taglog::TagRegistry;
namespace MainTag = taglog::MainTag;

namespace {

LogSettings settings_with(std::vector<std::string> tags) {
    LogSettings s;
    s.default_active_tags = std::move(tags);
    return s;
}

} // namespace

TEST(TagRegistryTest, ActivateKeepsInsertionOrder) {
    TagRegistry reg;
    reg.activate("UI");
    reg.activate("INFO");
    reg.activate("PLAYER");
    EXPECT_EQ(reg.snapshot(), (std::vector<std::string>{"UI", "INFO", "PLAYER"}));
}

TEST(TagRegistryTest, ActivateIgnoresDuplicates) {
    TagRegistry reg;
    reg.activate("INFO");
    reg.activate("INFO");
    EXPECT_EQ(reg.size(), 1u);
}

TEST(TagRegistryTest, BlankTagsAreIgnored) {
    TagRegistry reg;
    for (const std::string_view blank : {"", " ", "\t", " \n "}) {
        reg.activate(blank);
        EXPECT_FALSE(reg.is_active(blank));
        reg.deactivate(blank);
    }
    EXPECT_TRUE(reg.empty());
}

TEST(TagRegistryTest, TagsAreCaseSensitive) {
    TagRegistry reg;
    reg.activate("Info");
    EXPECT_TRUE(reg.is_active("Info"));
    EXPECT_FALSE(reg.is_active("INFO"));
}

TEST(TagRegistryTest, DeactivateRemovesTag) {
    TagRegistry reg;
    reg.activate("A");
    reg.activate("B");
    reg.deactivate("A");
    reg.deactivate("missing");
    EXPECT_EQ(reg.snapshot(), (std::vector<std::string>{"B"}));
}

TEST(TagRegistryTest, ForceTagCannotBeDeactivated) {
    TagRegistry reg;
    reg.reset(settings_with({"INFO"}));
    for (int i = 0; i < 3; ++i) {
        reg.deactivate(MainTag::FORCE);
        reg.deactivate("INFO");
    }
    EXPECT_TRUE(reg.is_active(MainTag::FORCE));
    EXPECT_EQ(reg.snapshot(), (std::vector<std::string>{"F"}));
}

TEST(TagRegistryTest, HasAnyNeedsOneActiveTag) {
    TagRegistry reg;
    reg.activate("A");

    const std::array<std::string_view, 2> mixed{"B", "A"};
    const std::array<std::string_view, 2> inactive{"B", "C"};
    EXPECT_TRUE(reg.has_any(mixed));
    EXPECT_FALSE(reg.has_any(inactive));
    EXPECT_FALSE(reg.has_any(TagList{}));
}

TEST(TagRegistryTest, ResetInsertsForceAtFront) {
    TagRegistry reg;
    reg.activate("OLD");
    reg.reset(settings_with({"INFO", "UI"}));
    EXPECT_EQ(reg.snapshot(), (std::vector<std::string>{"F", "INFO", "UI"}));
}

TEST(TagRegistryTest, ResetKeepsForcePositionWhenListed) {
    TagRegistry reg;
    reg.reset(settings_with({"INFO", "F"}));
    EXPECT_EQ(reg.snapshot(), (std::vector<std::string>{"INFO", "F"}));
}

TEST(TagRegistryTest, ResetDropsBlankAndDuplicateDefaults) {
    TagRegistry reg;
    reg.reset(settings_with({"INFO", " ", "INFO", "", "UI"}));
    EXPECT_EQ(reg.snapshot(), (std::vector<std::string>{"F", "INFO", "UI"}));
}

TEST(TagRegistryTest, SnapshotIsACopy) {
    TagRegistry reg;
    reg.activate("A");
    auto snap = reg.snapshot();
    snap.emplace_back("B");
    EXPECT_FALSE(reg.is_active("B"));
    EXPECT_EQ(reg.size(), 1u);
}
