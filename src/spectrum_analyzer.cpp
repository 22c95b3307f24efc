#include "spectrum_analyzer.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <utility>

namespace termamp {

namespace {

float smooth(float previous, float incoming) {
    float value = previous * SpectrumAnalyzer::kHistoryWeight + incoming * (1.0f - SpectrumAnalyzer::kHistoryWeight);
    return value < SpectrumAnalyzer::kSilenceFloor ? 0.0f : value;
}

}

SpectrumAnalyzer::SpectrumAnalyzer() {
    for (std::size_t i = 0; i < kFftSize; ++i) {
        window_[i] = 0.5f * (1.0f - std::cos(2.0f * std::numbers::pi_v<float> * static_cast<float>(i) / static_cast<float>(kFftSize)));
    }
    for (std::size_t k = 0; k < kHalfSize; ++k) {
        twiddles_[k] = std::polar(1.0f, -2.0f * std::numbers::pi_v<float> * static_cast<float>(k) / static_cast<float>(kFftSize));
    }
}

bool SpectrumAnalyzer::process(const float *interleaved, std::size_t frame_count, std::size_t channels,
                               int sample_rate, Clock::time_point now) {
    if (interleaved == nullptr || channels == 0 || sample_rate <= 0 || frame_count < kFftSize) {
        return false;
    }
    if (last_block_ != Clock::time_point{} && now - last_block_ < kMinInterval) {
        return false;
    }
    last_block_ = now;

    if (++block_counter_ < kBlocksPerAnalysis) {
        return false;
    }
    block_counter_ = 0;

    const Spectrum bands = analyze(interleaved, channels, sample_rate);

    std::lock_guard lock(staging_mutex_);
    for (std::size_t i = 0; i < kSpectrumBands; ++i) {
        staging_[i] = smooth(staging_[i], bands[i]);
    }
    return true;
}

Spectrum SpectrumAnalyzer::analyze(const float *samples, std::size_t stride, int sample_rate) {
    for (std::size_t i = 0; i < kFftSize; ++i) {
        fft_buffer_[i] = std::complex<float>(samples[i * stride] * window_[i], 0.0f);
    }

    transform();

    for (std::size_t i = 0; i < kHalfSize; ++i) {
        power_[i] = std::norm(fft_buffer_[i]);
    }

    const float nyquist = static_cast<float>(sample_rate) * 0.5f;
    const float span = nyquist / kLowCutHz;
    const int half = static_cast<int>(kHalfSize);

    Spectrum bands{};
    for (std::size_t band = 0; band < kSpectrumBands; ++band) {
        float f0 = kLowCutHz * std::pow(span, static_cast<float>(band) / static_cast<float>(kSpectrumBands));
        float f1 = kLowCutHz * std::pow(span, static_cast<float>(band + 1) / static_cast<float>(kSpectrumBands));

        int start = std::clamp(static_cast<int>(f0 / nyquist * static_cast<float>(half)), 0, half - 1);
        int end = std::max(start + 1, std::min(half, static_cast<int>(f1 / nyquist * static_cast<float>(half))));

        float sum = 0.0f;
        for (int bin = start; bin < end; ++bin) {
            sum += power_[static_cast<std::size_t>(bin)];
        }
        float amplitude = std::sqrt(sum / static_cast<float>(end - start));
        bands[band] = std::clamp(std::log10(1.0f + amplitude) * 0.5f, 0.0f, 1.0f);
    }
    return bands;
}

// Iterative radix-2 FFT over fft_buffer_; allocation-free for the render thread.
void SpectrumAnalyzer::transform() {
    for (std::size_t i = 1, j = 0; i < kFftSize; ++i) {
        std::size_t bit = kFftSize >> 1;
        for (; j & bit; bit >>= 1) {
            j ^= bit;
        }
        j ^= bit;
        if (i < j) {
            std::swap(fft_buffer_[i], fft_buffer_[j]);
        }
    }

    for (std::size_t len = 2; len <= kFftSize; len <<= 1) {
        const std::size_t half = len / 2;
        const std::size_t step = kFftSize / len;
        for (std::size_t base = 0; base < kFftSize; base += len) {
            for (std::size_t k = 0; k < half; ++k) {
                const std::complex<float> t = twiddles_[k * step] * fft_buffer_[base + k + half];
                fft_buffer_[base + k + half] = fft_buffer_[base + k] - t;
                fft_buffer_[base + k] += t;
            }
        }
    }
}

const Spectrum &SpectrumAnalyzer::publish() {
    merge_into_published(staging());
    return published_;
}

const Spectrum &SpectrumAnalyzer::decay() {
    merge_into_published(Spectrum{});
    return published_;
}

void SpectrumAnalyzer::merge_into_published(const Spectrum &source) {
    for (std::size_t i = 0; i < kSpectrumBands; ++i) {
        published_[i] = smooth(published_[i], source[i]);
    }
}

void SpectrumAnalyzer::clear_staging() {
    std::lock_guard lock(staging_mutex_);
    staging_.fill(0.0f);
}

void SpectrumAnalyzer::reset() {
    clear_staging();
    published_.fill(0.0f);
    block_counter_ = 0;
    last_block_ = Clock::time_point{};
}

Spectrum SpectrumAnalyzer::staging() const {
    std::lock_guard lock(staging_mutex_);
    return staging_;
}

bool SpectrumAnalyzer::is_silent() const noexcept {
    return std::all_of(published_.begin(), published_.end(), [](float v) { return v == 0.0f; });
}

}
