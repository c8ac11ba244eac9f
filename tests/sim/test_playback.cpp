/**
 * @file test_playback.cpp
 * @brief Tests for PlaybackCursor stepping and clamping
 */

#include <gtest/gtest.h>
#include <bioslurry/sim/Playback.hpp>

#include <memory>
#include <vector>

using namespace bioslurry;

namespace {

std::shared_ptr<const Trajectory> MakeTrajectory(std::size_t n) {
    std::vector<StateSnapshot> samples(n);
    for (std::size_t i = 0; i < n; ++i) {
        samples[i].time_h = static_cast<double>(i);
    }
    return std::make_shared<const Trajectory>(std::move(samples));
}

} // namespace

TEST(PlaybackCursor, AdvancesByTwo) {
    PlaybackCursor cursor(MakeTrajectory(7));
    EXPECT_EQ(cursor.Stride(), 2u);
    EXPECT_EQ(cursor.Index(), 0u);

    EXPECT_TRUE(cursor.Advance());
    EXPECT_EQ(cursor.Index(), 2u);
    EXPECT_DOUBLE_EQ(cursor.Current().time_h, 2.0);
}

TEST(PlaybackCursor, ClampsToLastSample) {
    PlaybackCursor cursor(MakeTrajectory(6)); // last index 5
    cursor.Advance();                         // 2
    cursor.Advance();                         // 4
    EXPECT_FALSE(cursor.AtEnd());
    EXPECT_TRUE(cursor.Advance()); // 5, not 6
    EXPECT_EQ(cursor.Index(), 5u);
    EXPECT_TRUE(cursor.AtEnd());
    EXPECT_FALSE(cursor.Advance());
    EXPECT_DOUBLE_EQ(cursor.Progress(), 1.0);
}

TEST(PlaybackCursor, SeekAndReset) {
    PlaybackCursor cursor(MakeTrajectory(10));
    cursor.Seek(100);
    EXPECT_EQ(cursor.Index(), 9u);
    cursor.Seek(3);
    EXPECT_EQ(cursor.Index(), 3u);
    cursor.Reset();
    EXPECT_EQ(cursor.Index(), 0u);
    EXPECT_DOUBLE_EQ(cursor.Progress(), 0.0);
}

TEST(PlaybackCursor, SingleSampleIsAtEnd) {
    PlaybackCursor cursor(MakeTrajectory(1));
    EXPECT_TRUE(cursor.AtEnd());
    EXPECT_FALSE(cursor.Advance());
}

TEST(PlaybackCursor, RejectsEmptyOrNull) {
    EXPECT_THROW(PlaybackCursor{MakeTrajectory(0)}, TrajectoryError);
    EXPECT_THROW(PlaybackCursor{nullptr}, TrajectoryError);
}

TEST(PlaybackCursor, KeepsTrajectoryAlive) {
    auto traj = MakeTrajectory(4);
    PlaybackCursor cursor(traj);
    traj.reset();
    cursor.Seek(3);
    EXPECT_DOUBLE_EQ(cursor.Current().time_h, 3.0);
    EXPECT_EQ(cursor.GetTrajectory()->Size(), 4u);
}
