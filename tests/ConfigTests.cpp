#include <gtest/gtest.h>

#include "Config.h"

TEST(Config, DefaultsMatchDocumentedValues) {
    DetectorConfig cfg;
    EXPECT_EQ(cfg.pwn_pattern, "pwnagotchi");
    EXPECT_EQ(cfg.flipper_wifi_pattern, "flipper");
    EXPECT_EQ(cfg.flipper_bt_pattern, "Flipper");
    EXPECT_EQ(cfg.scan_interval_s, 60u);
    EXPECT_EQ(cfg.rotation_window, 3u);
    EXPECT_EQ(cfg.rotation_interval_s, 10u);
    EXPECT_EQ(cfg.name_width, 20u);
    EXPECT_EQ(cfg.sidecar_extension, ".gps.json");
    EXPECT_TRUE(cfg.notify);
}

// Valid keys overlay the defaults; unknown keys are ignored.
TEST(Config, LoadOverlaysKnownKeys) {
    DetectorConfig cfg;
    const char* text = R"({
        "pwn_pattern": "pwn.*",
        "scan_interval": 30,
        "rotation_window": 5,
        "log_file": "/logs/seen.json",
        "notify": false,
        "ui_position": [4, 12],
        "font_size": "Bold",
        "ap_password": "hunter22",
        "something_else": 1
    })";

    ASSERT_TRUE(LoadConfigJson(text, cfg));
    EXPECT_EQ(cfg.pwn_pattern, "pwn.*");
    EXPECT_EQ(cfg.scan_interval_s, 30u);
    EXPECT_EQ(cfg.rotation_window, 5u);
    EXPECT_EQ(cfg.log_file, "/logs/seen.json");
    EXPECT_FALSE(cfg.notify);
    EXPECT_EQ(cfg.ui_x, 4);
    EXPECT_EQ(cfg.ui_y, 12);
    EXPECT_EQ(cfg.font_size, FontSize::Bold);
    EXPECT_EQ(cfg.ap_password, "hunter22");
    EXPECT_EQ(cfg.flipper_bt_pattern, "Flipper");
}

// Each bad value is rejected on its own; the rest still loads.
TEST(Config, BadValuesKeepCurrentSetting) {
    DetectorConfig cfg;
    const char* text = R"({
        "flipper_bt_pattern": "[oops",
        "name_width": 0,
        "rotation_window": "three",
        "log_file": "relative/path.json",
        "sidecar_extension": "gps",
        "gps_baud": 300,
        "ui_position": [1],
        "font_size": "huge",
        "ap_password": "short",
        "discovery_timeout": 8
    })";

    ASSERT_TRUE(LoadConfigJson(text, cfg));
    const DetectorConfig defaults;
    EXPECT_EQ(cfg.flipper_bt_pattern, defaults.flipper_bt_pattern);
    EXPECT_EQ(cfg.name_width, defaults.name_width);
    EXPECT_EQ(cfg.rotation_window, defaults.rotation_window);
    EXPECT_EQ(cfg.log_file, defaults.log_file);
    EXPECT_EQ(cfg.sidecar_extension, defaults.sidecar_extension);
    EXPECT_EQ(cfg.gps_baud, defaults.gps_baud);
    EXPECT_EQ(cfg.ui_x, defaults.ui_x);
    EXPECT_EQ(cfg.font_size, defaults.font_size);
    EXPECT_EQ(cfg.ap_password, defaults.ap_password);
    EXPECT_EQ(cfg.discovery_timeout_s, 8u);
}

// An empty log_file turns file logging off.
TEST(Config, EmptyLogFileDisablesLogging) {
    DetectorConfig cfg;
    ASSERT_TRUE(LoadConfigJson(R"({"log_file": ""})", cfg));
    EXPECT_TRUE(cfg.log_file.empty());
}

TEST(Config, RejectsNonObjectDocuments) {
    DetectorConfig cfg;
    EXPECT_FALSE(LoadConfigJson("{ not json", cfg));
    EXPECT_FALSE(LoadConfigJson("[1, 2, 3]", cfg));
    EXPECT_EQ(cfg.scan_interval_s, 60u);
}

TEST(Config, FontSizeNames) {
    FontSize f;
    ASSERT_TRUE(ParseFontSize("MEDIUM", f));
    EXPECT_EQ(f, FontSize::Medium);
    EXPECT_STREQ(FontSizeName(f), "medium");
    EXPECT_FALSE(ParseFontSize("tiny", f));
    EXPECT_FALSE(ParseFontSize(nullptr, f));
}
