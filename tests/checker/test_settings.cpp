// BADPATH - Checker Settings Tests
// Copyright (c) 2024 BADPATH Developers
// MIT License

#include <gtest/gtest.h>

#include <badpath/checker/settings.h>
#include <badpath/util/fs.h>

#include <stdexcept>
#include <string>

namespace badpath {
namespace checker {
namespace test {

class SettingsTest : public ::testing::Test {
protected:
    Settings Load(const std::string& content) {
        auto result = config_.ParseString(content, "test.conf");
        EXPECT_TRUE(result.success) << result.Describe();
        return LoadSettings(config_);
    }

    util::ConfigManager config_;
};

TEST_F(SettingsTest, EmptyConfigGivesDefaults) {
    Settings settings = Load("");
    EXPECT_FALSE(settings.options.systemOk);
    EXPECT_FALSE(settings.options.userPathsOk);
    EXPECT_FALSE(settings.options.notWriteable);
    EXPECT_FALSE(settings.options.cwdOnly);
    EXPECT_FALSE(settings.options.raiseError);
    EXPECT_TRUE(settings.userPaths.empty());
    EXPECT_EQ(settings.logLevel, util::LogLevel::Warn);
    EXPECT_TRUE(settings.logCategories.empty());
}

TEST_F(SettingsTest, ModeSetsAllFlags) {
    Settings settings = Load("[checker]\nmode = read\n");
    EXPECT_TRUE(settings.options.systemOk);
    EXPECT_TRUE(settings.options.userPathsOk);
    EXPECT_TRUE(settings.options.notWriteable);
}

TEST_F(SettingsTest, FlagsOverrideMode) {
    Settings settings = Load(
        "[checker]\n"
        "mode = read\n"
        "system_ok = no\n"
        "cwd_only = yes\n"
        "raise_error = true\n");
    EXPECT_FALSE(settings.options.systemOk);
    EXPECT_TRUE(settings.options.userPathsOk);
    EXPECT_TRUE(settings.options.notWriteable);
    EXPECT_TRUE(settings.options.cwdOnly);
    EXPECT_TRUE(settings.options.raiseError);
}

TEST_F(SettingsTest, BareAndNegatedFlags) {
    Settings settings = Load(
        "[checker]\n"
        "cwd_only\n"
        "nosystem_ok\n");
    EXPECT_TRUE(settings.options.cwdOnly);
    EXPECT_FALSE(settings.options.systemOk);
}

TEST_F(SettingsTest, InvalidModeThrows) {
    config_.ParseString("[checker]\nmode = append\n");
    EXPECT_THROW(LoadSettings(config_), std::invalid_argument);
}

TEST_F(SettingsTest, InvalidBooleanThrows) {
    config_.ParseString("[checker]\nsystem_ok = sometimes\n");
    try {
        LoadSettings(config_);
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "Invalid boolean for [checker] system_ok: 'sometimes'");
    }
}

TEST_F(SettingsTest, UserPathsInOrder) {
    Settings settings = Load(
        "[userpaths]\n"
        "path = /srv/data\n"
        "path = /srv/with,comma\n"
        "path = ~/.ssh\n");
    ASSERT_EQ(settings.userPaths.size(), 3u);
    EXPECT_EQ(settings.userPaths[0], "/srv/data");
    EXPECT_EQ(settings.userPaths[1], "/srv/with,comma");
    EXPECT_EQ(settings.userPaths[2], util::fs::ExpandUser("~/.ssh"));
    if (!util::fs::HomeDirectory().empty()) {
        EXPECT_NE(settings.userPaths[2][0], '~');
    }
}

TEST_F(SettingsTest, LogLevelAndCategories) {
    Settings settings = Load("[log]\nlevel = debug\ncategories = normalize, match\n");
    EXPECT_EQ(settings.logLevel, util::LogLevel::Debug);
    ASSERT_EQ(settings.logCategories.size(), 2u);
    EXPECT_EQ(settings.logCategories[0], util::LogCategory::NORMALIZE);
    EXPECT_EQ(settings.logCategories[1], util::LogCategory::MATCH);
}

TEST_F(SettingsTest, ApplySettingsFillsRegistry) {
    Settings settings = Load(
        "[userpaths]\n"
        "path = /srv/a\n"
        "path = /srv/b\n"
        "path = /srv/a\n");

    UserPathRegistry registry;
    registry.Add("/srv/existing");
    ApplySettings(settings, registry);

    auto entries = registry.Snapshot();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0], "/srv/existing");
    EXPECT_EQ(entries[1], "/srv/a");
    EXPECT_EQ(entries[2], "/srv/b");
}

TEST_F(SettingsTest, ValidateFlagsUnknownKeys) {
    AllowSettingsKeys(config_);
    ASSERT_TRUE(config_.ParseString(
        "[checker]\n"
        "mode = write\n"
        "sytem_ok = yes\n"
        "[userpaths]\n"
        "path = /srv/a\n", "test.conf").success);

    auto warnings = config_.Validate();
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0], "Unknown key 'checker:sytem_ok' in test.conf:3");
}

} // namespace test
} // namespace checker
} // namespace badpath
