#pragma once

/**
 * @file Playback.hpp
 * @brief Animated replay of a finished trajectory
 */

#include <bioslurry/core/Error.hpp>
#include <bioslurry/sim/Trajectory.hpp>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <utility>

namespace bioslurry {

/// Samples advanced per playback tick
constexpr std::size_t kDefaultPlaybackStride = 2;

/**
 * @brief Index into an immutable trajectory, advanced tick by tick
 *
 * The cursor shares ownership of the trajectory it replays, so a new run
 * never invalidates a view that is still being animated.
 */
class PlaybackCursor {
  public:
    /// @throws TrajectoryError if the trajectory is null or empty
    explicit PlaybackCursor(std::shared_ptr<const Trajectory> trajectory,
                            std::size_t stride = kDefaultPlaybackStride)
        : trajectory_(std::move(trajectory)), stride_(std::max<std::size_t>(stride, 1)) {
        if (!trajectory_ || trajectory_->Empty()) {
            BIOSLURRY_THROW(TrajectoryError::Empty("Playback"));
        }
    }

    /// Move forward by one stride, stopping on the last sample
    /// @return true if the cursor moved
    bool Advance() {
        if (AtEnd()) {
            return false;
        }
        index_ = std::min(index_ + stride_, LastIndex());
        return true;
    }

    /// Jump to index (clamped to the last sample)
    void Seek(std::size_t index) { index_ = std::min(index, LastIndex()); }

    void Reset() { index_ = 0; }

    [[nodiscard]] bool AtEnd() const { return index_ == LastIndex(); }
    [[nodiscard]] std::size_t Index() const { return index_; }
    [[nodiscard]] std::size_t Stride() const { return stride_; }

    [[nodiscard]] const StateSnapshot &Current() const { return (*trajectory_)[index_]; }

    /// Fraction of the run replayed so far, in [0, 1]
    [[nodiscard]] double Progress() const {
        const std::size_t last = LastIndex();
        return last == 0 ? 1.0 : static_cast<double>(index_) / static_cast<double>(last);
    }

    [[nodiscard]] const std::shared_ptr<const Trajectory> &GetTrajectory() const {
        return trajectory_;
    }

  private:
    [[nodiscard]] std::size_t LastIndex() const { return trajectory_->Size() - 1; }

    std::shared_ptr<const Trajectory> trajectory_;
    std::size_t stride_;
    std::size_t index_ = 0;
};

} // namespace bioslurry
