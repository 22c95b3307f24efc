#pragma once

#include <array>
#include <chrono>
#include <complex>
#include <cstddef>
#include <mutex>

namespace termamp {

inline constexpr std::size_t kSpectrumBands = 15;
using Spectrum = std::array<float, kSpectrumBands>;

// Turns blocks of PCM from the render tap into a 15-band log-spaced
// spectrum. process() runs on the render thread and only touches the staging
// buffer; publish()/decay() run on the coordination thread.
class SpectrumAnalyzer {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::size_t kFftSize = 256;
    static constexpr std::size_t kHalfSize = kFftSize / 2;
    static constexpr int kBlocksPerAnalysis = 2;
    static constexpr std::chrono::milliseconds kMinInterval{33};
    static constexpr float kLowCutHz = 50.0f;
    static constexpr float kHistoryWeight = 0.15f;
    static constexpr float kSilenceFloor = 1e-4f;

    SpectrumAnalyzer();

    // Analyzes the first channel of an interleaved block. Returns true when
    // the block produced a new staging value; short or rate-limited blocks
    // are dropped.
    bool process(const float *interleaved, std::size_t frame_count, std::size_t channels,
                 int sample_rate, Clock::time_point now = Clock::now());

    // Band values for one windowed block of kFftSize samples.
    Spectrum analyze(const float *samples, std::size_t stride, int sample_rate);

    const Spectrum &publish();
    const Spectrum &decay();
    void clear_staging();
    void reset();

    const Spectrum &published() const noexcept { return published_; }
    Spectrum staging() const;
    bool is_silent() const noexcept;

private:
    void merge_into_published(const Spectrum &source);
    void transform();

    std::array<float, kFftSize> window_{};
    std::array<std::complex<float>, kHalfSize> twiddles_{};
    std::array<std::complex<float>, kFftSize> fft_buffer_{};
    std::array<float, kHalfSize> power_{};
    int block_counter_{0};
    Clock::time_point last_block_{};

    mutable std::mutex staging_mutex_;
    Spectrum staging_{};
    Spectrum published_{};
};

}
