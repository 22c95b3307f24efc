#include "equalizer.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace termamp {

namespace {

constexpr float kBandwidthOctaves = 1.0f;

}

Equalizer::Equalizer(int sample_rate)
    : sample_rate_(sample_rate) {
    for (auto &gain : gains_) {
        gain.store(0.0f, std::memory_order_relaxed);
    }
}

bool Equalizer::set_band_gain(std::size_t band, float gain_db) {
    if (band >= kEqBandCount) {
        return false;
    }
    gains_[band].store(std::clamp(gain_db, -kEqMaxGainDb, kEqMaxGainDb), std::memory_order_release);
    revision_.fetch_add(1, std::memory_order_acq_rel);
    return true;
}

float Equalizer::band_gain(std::size_t band) const noexcept {
    if (band >= kEqBandCount) {
        return 0.0f;
    }
    return gains_[band].load(std::memory_order_acquire);
}

EqGains Equalizer::gains() const noexcept {
    EqGains result{};
    for (std::size_t i = 0; i < kEqBandCount; ++i) {
        result[i] = gains_[i].load(std::memory_order_acquire);
    }
    return result;
}

void Equalizer::set_gains(const EqGains &gains) {
    for (std::size_t i = 0; i < kEqBandCount; ++i) {
        set_band_gain(i, gains[i]);
    }
}

bool Equalizer::is_flat() const noexcept {
    return std::all_of(gains_.begin(), gains_.end(), [](const std::atomic<float> &g) {
        return g.load(std::memory_order_acquire) == 0.0f;
    });
}

void Equalizer::rebuild_coefficients() {
    const float nyquist = static_cast<float>(sample_rate_) * 0.5f;

    for (std::size_t band = 0; band < kEqBandCount; ++band) {
        Biquad &filter = filters_[band];
        const float gain_db = gains_[band].load(std::memory_order_acquire);
        const float freq = kEqFrequencies[band];

        if (gain_db == 0.0f || freq >= nyquist) {
            filter = Biquad{};
            continue;
        }

        // Peaking EQ from the RBJ audio EQ cookbook.
        const float a = std::pow(10.0f, gain_db / 40.0f);
        const float w0 = 2.0f * std::numbers::pi_v<float> * freq / static_cast<float>(sample_rate_);
        const float sin_w0 = std::sin(w0);
        const float cos_w0 = std::cos(w0);
        const float alpha = sin_w0 * std::sinh(std::numbers::ln2_v<float> / 2.0f * kBandwidthOctaves * w0 / sin_w0);

        const float a0 = 1.0f + alpha / a;
        filter.b0 = (1.0f + alpha * a) / a0;
        filter.b1 = (-2.0f * cos_w0) / a0;
        filter.b2 = (1.0f - alpha * a) / a0;
        filter.a1 = (-2.0f * cos_w0) / a0;
        filter.a2 = (1.0f - alpha / a) / a0;
        filter.active = true;
    }
}

void Equalizer::process(float *interleaved, std::size_t frame_count) {
    if (reset_requested_.exchange(false, std::memory_order_acq_rel)) {
        for (auto &band : history_) {
            band.fill(History{});
        }
    }

    const std::uint64_t revision = revision_.load(std::memory_order_acquire);
    if (revision != applied_revision_) {
        rebuild_coefficients();
        applied_revision_ = revision;
    }

    for (std::size_t band = 0; band < kEqBandCount; ++band) {
        const Biquad &filter = filters_[band];
        if (!filter.active) {
            continue;
        }

        for (std::size_t ch = 0; ch < 2; ++ch) {
            History &h = history_[band][ch];
            for (std::size_t i = 0; i < frame_count; ++i) {
                float &sample = interleaved[i * 2 + ch];
                const float x0 = sample;
                const float y0 = filter.b0 * x0 + filter.b1 * h.x1 + filter.b2 * h.x2
                               - filter.a1 * h.y1 - filter.a2 * h.y2;
                h.x2 = h.x1;
                h.x1 = x0;
                h.y2 = h.y1;
                h.y1 = y0;
                sample = y0;
            }
        }
    }
}

}
