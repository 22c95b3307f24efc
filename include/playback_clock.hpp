#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace termamp {

// Playback position derived from the render clock: the seek offset plus the
// frames pulled through the render graph since the last restart.
class PlaybackClock {
public:
    explicit PlaybackClock(int sample_rate = 48000);

    void restart(double offset_seconds) noexcept;
    void advance(std::size_t frames) noexcept;

    double position() const noexcept;
    double seek_offset() const noexcept { return seek_offset_.load(std::memory_order_acquire); }
    std::int64_t rendered_frames() const noexcept { return rendered_frames_.load(std::memory_order_acquire); }
    int sample_rate() const noexcept { return sample_rate_; }

private:
    std::atomic<double> seek_offset_{0.0};
    std::atomic<std::int64_t> rendered_frames_{0};
    int sample_rate_;
};

}
