#include "playback_clock.hpp"

#include <algorithm>

namespace termamp {

PlaybackClock::PlaybackClock(int sample_rate)
    : sample_rate_(std::max(1, sample_rate)) {}

void PlaybackClock::restart(double offset_seconds) noexcept {
    seek_offset_.store(std::max(0.0, offset_seconds), std::memory_order_release);
    rendered_frames_.store(0, std::memory_order_release);
}

void PlaybackClock::advance(std::size_t frames) noexcept {
    rendered_frames_.fetch_add(static_cast<std::int64_t>(frames), std::memory_order_acq_rel);
}

double PlaybackClock::position() const noexcept {
    const double elapsed = static_cast<double>(rendered_frames()) / static_cast<double>(sample_rate_);
    return seek_offset() + elapsed;
}

}
