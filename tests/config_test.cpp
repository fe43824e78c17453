#include <fstream>
#include <stdexcept>

#include <gtest/gtest.h>

#include "displaysnap/config.hpp"

#include "temp_dir.hpp"

TEST(ConfigParse, ParsesAllKeys) {
    const auto overrides = displaysnap::parse_config_text("# displaysnap\n"
                                                          "auto_disable_extras = yes\n"
                                                          "retry_failed = false\n"
                                                          "\n"
                                                          "mode_fallback = on   # pick the largest mode\n"
                                                          "debug_logging = 1\n"
                                                          "profiles_path = /data/profiles.json\n"
                                                          "hyprland_socket = /run/hypr.sock\n");

    EXPECT_EQ(overrides.auto_disable_extras, std::optional<bool>(true));
    EXPECT_EQ(overrides.retry_failed, std::optional<bool>(false));
    EXPECT_EQ(overrides.mode_fallback, std::optional<bool>(true));
    EXPECT_EQ(overrides.debug_logging, std::optional<bool>(true));
    EXPECT_EQ(overrides.profiles_path, std::optional<std::filesystem::path>("/data/profiles.json"));
    EXPECT_EQ(overrides.hyprland_socket, std::optional<std::filesystem::path>("/run/hypr.sock"));
}

TEST(ConfigParse, ParsesWorkspaceAndNotifyKeys) {
    const auto overrides = displaysnap::parse_config_text("manage_workspaces = true\n"
                                                          "notify = yes\n"
                                                          "notify_timeout_ms = 5000\n");

    EXPECT_EQ(overrides.manage_workspaces, std::optional<bool>(true));
    EXPECT_EQ(overrides.notify, std::optional<bool>(true));
    EXPECT_EQ(overrides.notify_timeout_ms, std::optional<int>(5000));

    const auto merged = displaysnap::apply_overrides(displaysnap::Config{}, overrides);
    EXPECT_TRUE(merged.manage_workspaces);
    EXPECT_TRUE(merged.notify);
    EXPECT_EQ(merged.notify_timeout_ms, 5000);
}

TEST(ConfigParse, RejectsNegativeNotifyTimeout) {
    EXPECT_THROW(displaysnap::parse_config_text("notify_timeout_ms = -1\n"), std::runtime_error);
    EXPECT_THROW(displaysnap::parse_config_text("notify_timeout_ms = soon\n"), std::runtime_error);
}

TEST(ConfigParse, LeavesUnsetKeysEmpty) {
    const auto overrides = displaysnap::parse_config_text("retry_failed = true\n");

    EXPECT_FALSE(overrides.auto_disable_extras.has_value());
    EXPECT_FALSE(overrides.profiles_path.has_value());
}

TEST(ConfigParse, RejectsUnknownKeyWithLineNumber) {
    try {
        displaysnap::parse_config_text("retry_failed = true\n\nwrap = 3\n");
        FAIL() << "expected parse failure";
    } catch (const std::runtime_error& ex) { EXPECT_EQ(std::string(ex.what()), "line 3: unknown config key wrap"); }
}

TEST(ConfigParse, RejectsMalformedBoolean) {
    EXPECT_THROW(displaysnap::parse_config_text("auto_disable_extras = sometimes\n"), std::runtime_error);
    EXPECT_THROW(displaysnap::parse_config_text("auto_disable_extras\n"), std::runtime_error);
}

TEST(ConfigOverrides, AppliesOnlyPresentValues) {
    const displaysnap::Config base{
        .auto_disable_extras = false,
        .retry_failed        = true,
        .mode_fallback       = false,
        .debug_logging       = false,
        .profiles_path       = std::nullopt,
        .hyprland_socket     = std::filesystem::path("/run/a.sock"),
    };
    const displaysnap::ConfigOverrides overrides{
        .auto_disable_extras = true,
        .retry_failed        = std::nullopt,
        .mode_fallback       = std::nullopt,
        .debug_logging       = true,
        .profiles_path       = std::filesystem::path("/data/p.json"),
    };

    const auto merged = displaysnap::apply_overrides(base, overrides);

    EXPECT_TRUE(merged.auto_disable_extras);
    EXPECT_TRUE(merged.retry_failed);
    EXPECT_FALSE(merged.mode_fallback);
    EXPECT_TRUE(merged.debug_logging);
    EXPECT_EQ(merged.profiles_path, std::optional<std::filesystem::path>("/data/p.json"));
    EXPECT_EQ(merged.hyprland_socket, std::optional<std::filesystem::path>("/run/a.sock"));
}

TEST(ConfigDefaults, MatchDocumentedValues) {
    const displaysnap::Config config;

    EXPECT_FALSE(config.auto_disable_extras);
    EXPECT_TRUE(config.retry_failed);
    EXPECT_FALSE(config.mode_fallback);
    EXPECT_FALSE(config.debug_logging);
    EXPECT_FALSE(config.manage_workspaces);
    EXPECT_FALSE(config.notify);
    EXPECT_EQ(config.notify_timeout_ms, 3000);
}

TEST(ConfigFile, MissingFileKeepsDefaults) {
    const auto                   dir = displaysnap::fakes::make_temp_dir("displaysnap-config");
    displaysnap::ConfigOverrides overrides;

    const auto                   error = displaysnap::load_config_file(dir / "absent.conf", &overrides);

    EXPECT_FALSE(error.has_value());
    EXPECT_FALSE(overrides.retry_failed.has_value());
    std::filesystem::remove_all(dir);
}

TEST(ConfigFile, ReportsParseErrorsWithPath) {
    const auto dir  = displaysnap::fakes::make_temp_dir("displaysnap-config");
    const auto path = dir / "displaysnap.conf";
    {
        std::ofstream output(path);
        output << "mode_fallback = perhaps\n";
    }
    displaysnap::ConfigOverrides overrides;

    const auto                   error = displaysnap::load_config_file(path, &overrides);

    ASSERT_TRUE(error.has_value());
    EXPECT_NE(error->find("line 1"), std::string::npos);
    EXPECT_NE(error->find("displaysnap.conf"), std::string::npos);
    std::filesystem::remove_all(dir);
}

TEST(ConfigFile, LoadsValues) {
    const auto dir  = displaysnap::fakes::make_temp_dir("displaysnap-config");
    const auto path = dir / "displaysnap.conf";
    {
        std::ofstream output(path);
        output << "auto_disable_extras = true\n";
    }
    displaysnap::ConfigOverrides overrides;

    ASSERT_FALSE(displaysnap::load_config_file(path, &overrides).has_value());
    EXPECT_EQ(overrides.auto_disable_extras, std::optional<bool>(true));
    std::filesystem::remove_all(dir);
}
