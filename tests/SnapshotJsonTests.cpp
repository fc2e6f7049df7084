#include <gtest/gtest.h>

#include <ArduinoJson.h>

#include "SnapshotJson.h"

namespace {

RegistrySnapshot SampleSnapshot() {
    RegistrySnapshot snap;

    DeviceRecord pwn;
    pwn.address = "aa:bb:cc:00:11:22";
    pwn.name = "pwnagotchi-abc123";
    pwn.category = DeviceCategory::PwnDevice;
    pwn.rssi = -60;
    pwn.last_seen_s = 1000;
    pwn.has_fix = true;
    pwn.fix.latitude = 51.5;
    pwn.fix.longitude = -0.12;
    pwn.fix.altitude = 35.0;
    pwn.fix.fix_time = "2024-05-01T12:00:00.000Z";
    pwn.fix.satellites = 7;
    snap.pwn.push_back(pwn);

    DeviceRecord flip;
    flip.address = "11:22:33:44:55:66";
    flip.name = "FlipperZero-X";
    flip.category = DeviceCategory::FlipperBluetooth;
    flip.rssi = -72;
    flip.last_seen_s = 1005;
    snap.flippers.push_back(flip);

    return snap;
}

}  // namespace

// One line, no newline, with both groups and per-record gps.
TEST(SnapshotJson, DetectionLineShape) {
    const std::string line = BuildDetectionLine(SampleSnapshot(), "2024-05-01 12:00:00");
    EXPECT_EQ(line.find('\n'), std::string::npos);

    JsonDocument doc;
    ASSERT_FALSE(deserializeJson(doc, line));

    EXPECT_STREQ(doc["timestamp"].as<const char*>(), "2024-05-01 12:00:00");

    JsonObject pwn = doc["pwnagotchis"][0];
    EXPECT_STREQ(pwn["mac"].as<const char*>(), "aa:bb:cc:00:11:22");
    EXPECT_STREQ(pwn["name"].as<const char*>(), "pwnagotchi-abc123");
    EXPECT_EQ(pwn["rssi"].as<int>(), -60);
    EXPECT_DOUBLE_EQ(pwn["gps"]["Latitude"].as<double>(), 51.5);
    EXPECT_EQ(pwn["gps"]["Satellites"].as<int>(), 7);

    JsonObject flip = doc["flippers"][0];
    EXPECT_STREQ(flip["type"].as<const char*>(), "Bluetooth");
    EXPECT_TRUE(flip["gps"].isNull());
    EXPECT_NE(line.find("\"gps\":null"), std::string::npos);
}

TEST(SnapshotJson, QueryResponseCarriesCountsAndCurrentFix) {
    LocationFix here;
    here.latitude = 10.0;
    here.longitude = 20.0;

    JsonDocument doc;
    ASSERT_FALSE(deserializeJson(doc, BuildQueryResponse(SampleSnapshot(), "ts", &here)));
    EXPECT_EQ(doc["counts"]["pwnagotchis"].as<int>(), 1);
    EXPECT_EQ(doc["counts"]["flippers"].as<int>(), 1);
    EXPECT_DOUBLE_EQ(doc["current_gps"]["Longitude"].as<double>(), 20.0);

    JsonDocument none;
    ASSERT_FALSE(deserializeJson(none, BuildQueryResponse(RegistrySnapshot{}, "ts", nullptr)));
    EXPECT_TRUE(none["current_gps"].isNull());
    EXPECT_EQ(none["pwnagotchis"].size(), 0u);
}

TEST(SnapshotJson, FixDocumentFields) {
    LocationFix fix;
    fix.latitude = 1.25;
    fix.longitude = 2.5;
    fix.altitude = 100.0;
    fix.fix_time = "2024-05-01T12:00:00.000Z";
    fix.satellites = 11;

    JsonDocument doc;
    ASSERT_FALSE(deserializeJson(doc, BuildFixDocument(fix)));
    EXPECT_DOUBLE_EQ(doc["Latitude"].as<double>(), 1.25);
    EXPECT_DOUBLE_EQ(doc["Longitude"].as<double>(), 2.5);
    EXPECT_DOUBLE_EQ(doc["Altitude"].as<double>(), 100.0);
    EXPECT_STREQ(doc["Time"].as<const char*>(), "2024-05-01T12:00:00.000Z");
    EXPECT_EQ(doc["Satellites"].as<int>(), 11);
}
