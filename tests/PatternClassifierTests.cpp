#include <gtest/gtest.h>

#include "PatternClassifier.h"

namespace {

PatternClassifier DefaultClassifier() {
    PatternClassifier c;
    EXPECT_TRUE(c.setPatterns("pwnagotchi", "flipper", "Flipper.*"));
    return c;
}

}  // namespace

// Not ready until patterns compile; nothing matches before that.
TEST(PatternClassifier, NotReadyBeforePatterns) {
    PatternClassifier c;
    DeviceCategory cat;
    EXPECT_FALSE(c.ready());
    EXPECT_FALSE(c.classifyNetwork("pwnagotchi", cat));
    EXPECT_FALSE(c.classifyDiscovery("Flipper", cat));
}

// Prefix match only: the name must start with the pattern.
TEST(PatternClassifier, NetworkNamesMatchAtStart) {
    PatternClassifier c = DefaultClassifier();
    DeviceCategory cat;

    ASSERT_TRUE(c.classifyNetwork("pwnagotchi-abc123", cat));
    EXPECT_EQ(cat, DeviceCategory::PwnDevice);

    ASSERT_TRUE(c.classifyNetwork("Flipper-Wifi-Dev", cat));
    EXPECT_EQ(cat, DeviceCategory::FlipperWifi);

    EXPECT_FALSE(c.classifyNetwork("my-pwnagotchi", cat));
    EXPECT_FALSE(c.classifyNetwork("HomeNetwork", cat));
    EXPECT_FALSE(c.classifyNetwork("", cat));
}

TEST(PatternClassifier, MatchingIsCaseInsensitive) {
    PatternClassifier c = DefaultClassifier();
    DeviceCategory cat;

    ASSERT_TRUE(c.classifyNetwork("PWNAGOTCHI", cat));
    EXPECT_EQ(cat, DeviceCategory::PwnDevice);
    ASSERT_TRUE(c.classifyDiscovery("flipperzero-x", cat));
    EXPECT_EQ(cat, DeviceCategory::FlipperBluetooth);
}

// A name that fits both network patterns is a PwnDevice.
TEST(PatternClassifier, PwnPatternWinsOverFlipperWifi) {
    PatternClassifier c;
    ASSERT_TRUE(c.setPatterns("dev", "dev", "dev"));

    DeviceCategory cat;
    ASSERT_TRUE(c.classifyNetwork("device-1", cat));
    EXPECT_EQ(cat, DeviceCategory::PwnDevice);
}

// Discovery names are only checked against the Bluetooth pattern.
TEST(PatternClassifier, DiscoveryUsesOnlyBluetoothPattern) {
    PatternClassifier c = DefaultClassifier();
    DeviceCategory cat;

    EXPECT_FALSE(c.classifyDiscovery("pwnagotchi", cat));
    ASSERT_TRUE(c.classifyDiscovery("FlipperZero-X", cat));
    EXPECT_EQ(cat, DeviceCategory::FlipperBluetooth);
}

// A bad pattern leaves the previous set in place.
TEST(PatternClassifier, InvalidPatternKeepsPreviousSet) {
    PatternClassifier c = DefaultClassifier();
    EXPECT_FALSE(c.setPatterns("ok", "(unclosed", "ok"));
    EXPECT_FALSE(c.setPatterns("ok", "ok", ""));
    EXPECT_TRUE(c.ready());

    DeviceCategory cat;
    EXPECT_TRUE(c.classifyNetwork("pwnagotchi", cat));
    EXPECT_FALSE(c.classifyNetwork("ok", cat));
}

TEST(PatternClassifier, IsValidPattern) {
    EXPECT_TRUE(PatternClassifier::IsValidPattern("Flipper.*"));
    EXPECT_TRUE(PatternClassifier::IsValidPattern("pwn[a-z]+"));
    EXPECT_FALSE(PatternClassifier::IsValidPattern("[abc"));
    EXPECT_FALSE(PatternClassifier::IsValidPattern(""));
}
