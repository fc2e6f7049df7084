#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "CaptureTracker.h"

// Files already there when watching starts are never reported.
TEST(CaptureTracker, PrimedFilesAreIgnored) {
    CaptureTracker t;
    t.prime({"/handshakes/a.pcap", "/handshakes/b.pcap"});

    EXPECT_TRUE(t.update({"/handshakes/a.pcap", "/handshakes/b.pcap"}).empty());

    const std::vector<std::string> fresh =
        t.update({"/handshakes/a.pcap", "/handshakes/b.pcap", "/handshakes/c.pcap"});
    ASSERT_EQ(fresh.size(), 1u);
    EXPECT_EQ(fresh[0], "/handshakes/c.pcap");
}

// The remembered set is the latest listing, so deleted files drop out of it.
TEST(CaptureTracker, DeletedFilesAreForgotten) {
    CaptureTracker t;
    t.prime({"/handshakes/a.pcap", "/handshakes/b.pcap"});

    EXPECT_TRUE(t.update({"/handshakes/b.pcap"}).empty());
    EXPECT_EQ(t.tracked(), 1u);

    // same name written again after deletion is a new capture
    const std::vector<std::string> fresh = t.update({"/handshakes/a.pcap", "/handshakes/b.pcap"});
    ASSERT_EQ(fresh.size(), 1u);
    EXPECT_EQ(fresh[0], "/handshakes/a.pcap");
}

TEST(CaptureTracker, IsCaptureChecksSuffix) {
    EXPECT_TRUE(CaptureTracker::IsCapture("/handshakes/home_aabbcc.pcap"));
    EXPECT_FALSE(CaptureTracker::IsCapture("/handshakes/home_aabbcc.gps.json"));
    EXPECT_FALSE(CaptureTracker::IsCapture("/handshakes/home.pcapng"));
    EXPECT_FALSE(CaptureTracker::IsCapture("/handshakes/.pcap"));
}
