#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>

namespace termamp {

inline constexpr std::size_t kEqBandCount = 10;
inline constexpr std::array<float, kEqBandCount> kEqFrequencies = {
    60.0f, 170.0f, 310.0f, 600.0f, 1000.0f, 3000.0f, 6000.0f, 12000.0f, 14000.0f, 16000.0f};
inline constexpr float kEqMaxGainDb = 12.0f;

using EqGains = std::array<float, kEqBandCount>;

// Ten peaking filters (one octave wide) applied in series to interleaved
// stereo. Gains are set from any thread; coefficients are rebuilt lazily on
// the render thread the next time process() runs.
class Equalizer {
public:
    explicit Equalizer(int sample_rate);

    bool set_band_gain(std::size_t band, float gain_db);
    float band_gain(std::size_t band) const noexcept;
    EqGains gains() const noexcept;
    void set_gains(const EqGains &gains);

    // Clears filter history, e.g. after a seek or a new track.
    void reset() noexcept { reset_requested_.store(true, std::memory_order_release); }

    void process(float *interleaved, std::size_t frame_count);

    bool is_flat() const noexcept;
    int sample_rate() const noexcept { return sample_rate_; }

private:
    struct Biquad {
        float b0{1.0f};
        float b1{0.0f};
        float b2{0.0f};
        float a1{0.0f};
        float a2{0.0f};
        bool active{false};
    };

    struct History {
        float x1{0.0f};
        float x2{0.0f};
        float y1{0.0f};
        float y2{0.0f};
    };

    void rebuild_coefficients();

    int sample_rate_;
    std::array<std::atomic<float>, kEqBandCount> gains_{};
    std::atomic<std::uint64_t> revision_{1};
    std::atomic<bool> reset_requested_{false};

    std::uint64_t applied_revision_{0};
    std::array<Biquad, kEqBandCount> filters_{};
    std::array<std::array<History, 2>, kEqBandCount> history_{};
};

}
