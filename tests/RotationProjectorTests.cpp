#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "RotationProjector.h"

namespace {

const std::vector<std::string> kNames = {"a", "b", "c", "d", "e"};

}  // namespace

TEST(RotationProjector, WindowFromStart) {
    const std::vector<std::string> v = RotationProjector::VisibleWindow(kNames, 3, 0);
    EXPECT_EQ(v, (std::vector<std::string>{"a", "b", "c"}));
}

// Near the end the slice is short; it does not wrap to the front.
TEST(RotationProjector, WindowDoesNotWrap) {
    EXPECT_EQ(RotationProjector::VisibleWindow(kNames, 3, 3), (std::vector<std::string>{"d", "e"}));
    EXPECT_EQ(RotationProjector::VisibleWindow(kNames, 3, 4), (std::vector<std::string>{"e"}));
}

// Cursor is taken modulo the list length.
TEST(RotationProjector, CursorWrapsModuloLength) {
    EXPECT_EQ(RotationProjector::VisibleWindow(kNames, 2, 6), (std::vector<std::string>{"b", "c"}));
}

TEST(RotationProjector, EmptyInputsGiveEmptyWindow) {
    EXPECT_TRUE(RotationProjector::VisibleWindow({}, 3, 0).empty());
    EXPECT_TRUE(RotationProjector::VisibleWindow(kNames, 0, 0).empty());
}

// No move until strictly more than the interval has passed.
TEST(RotationProjector, AdvanceWaitsForInterval) {
    RotationState s;
    s.last_rotation_s = 100;

    RotationState same = RotationProjector::Advance(s, 3, 5, 110, 10);
    EXPECT_EQ(same.cursor, 0u);
    EXPECT_EQ(same.last_rotation_s, 100u);

    RotationState moved = RotationProjector::Advance(s, 3, 5, 111, 10);
    EXPECT_EQ(moved.cursor, 3u);
    EXPECT_EQ(moved.last_rotation_s, 111u);

    RotationState again = RotationProjector::Advance(moved, 3, 5, 122, 10);
    EXPECT_EQ(again.cursor, 1u);   // (3 + 3) % 5
}

TEST(RotationProjector, EmptyListResetsCursor) {
    RotationState s;
    s.cursor = 4;
    s.last_rotation_s = 50;

    RotationState out = RotationProjector::Advance(s, 3, 0, 1000, 10);
    EXPECT_EQ(out.cursor, 0u);
}

// Header always comes first, names follow.
TEST(RotationProjector, ProjectPrependsHeader) {
    const std::vector<std::string> lines = RotationProjector::Project("Pwn: 2 | Flip: 3", kNames, 3, 3);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "Pwn: 2 | Flip: 3");
    EXPECT_EQ(lines[1], "d");
    EXPECT_EQ(lines[2], "e");

    const std::vector<std::string> empty = RotationProjector::Project("Pwn: 0 | Flip: 0", {}, 3, 0);
    ASSERT_EQ(empty.size(), 1u);
}
