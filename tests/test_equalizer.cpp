#include "equalizer.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <numbers>
#include <vector>

using termamp::Equalizer;
using termamp::kEqBandCount;

namespace {

std::vector<float> stereo_sine(double frequency, int rate, std::size_t frames, float amplitude = 0.1f) {
    std::vector<float> out(frames * 2);
    for (std::size_t i = 0; i < frames; ++i) {
        const float s = amplitude * static_cast<float>(std::sin(2.0 * std::numbers::pi * frequency * static_cast<double>(i) / rate));
        out[i * 2] = s;
        out[i * 2 + 1] = s;
    }
    return out;
}

// RMS of the left channel over the second half, after the filter settles.
double tail_rms(const std::vector<float> &buffer) {
    const std::size_t frames = buffer.size() / 2;
    double sum = 0.0;
    std::size_t count = 0;
    for (std::size_t i = frames / 2; i < frames; ++i) {
        sum += static_cast<double>(buffer[i * 2]) * buffer[i * 2];
        ++count;
    }
    return std::sqrt(sum / static_cast<double>(count));
}

void test_flat_is_transparent() {
    Equalizer eq(48000);
    assert(eq.is_flat());
    auto input = stereo_sine(440.0, 48000, 4096);
    auto output = input;
    eq.process(output.data(), 4096);
    assert(output == input);
}

void test_gain_limits() {
    Equalizer eq(48000);
    assert(!eq.set_band_gain(kEqBandCount, 3.0f));
    assert(eq.set_band_gain(0, 20.0f));
    assert(eq.band_gain(0) == 12.0f);
    assert(eq.set_band_gain(1, -30.0f));
    assert(eq.band_gain(1) == -12.0f);
    assert(eq.band_gain(42) == 0.0f);
    assert(!eq.is_flat());

    termamp::EqGains gains{};
    eq.set_gains(gains);
    assert(eq.is_flat());
}

void test_peak_boost_and_cut() {
    const int rate = 48000;
    const std::size_t frames = 48000;

    Equalizer boost(rate);
    boost.set_band_gain(4, 12.0f);
    auto boosted = stereo_sine(1000.0, rate, frames);
    const double input_rms = tail_rms(boosted);
    boost.process(boosted.data(), frames);
    const double boost_ratio = tail_rms(boosted) / input_rms;
    assert(std::fabs(boost_ratio - std::pow(10.0, 12.0 / 20.0)) < 0.3);

    Equalizer cut(rate);
    cut.set_band_gain(4, -12.0f);
    auto cut_signal = stereo_sine(1000.0, rate, frames);
    cut.process(cut_signal.data(), frames);
    const double cut_ratio = tail_rms(cut_signal) / input_rms;
    assert(std::fabs(cut_ratio - std::pow(10.0, -12.0 / 20.0)) < 0.05);

    // A 60 Hz boost leaves 10 kHz nearly untouched.
    Equalizer low(rate);
    low.set_band_gain(0, 12.0f);
    auto high = stereo_sine(10000.0, rate, frames);
    const double high_rms = tail_rms(high);
    low.process(high.data(), frames);
    assert(std::fabs(tail_rms(high) / high_rms - 1.0) < 0.05);
}

void test_bands_above_nyquist_are_bypassed() {
    Equalizer eq(22050);
    eq.set_band_gain(7, 12.0f);
    eq.set_band_gain(8, 12.0f);
    eq.set_band_gain(9, 12.0f);
    auto input = stereo_sine(5000.0, 22050, 2048);
    auto output = input;
    eq.process(output.data(), 2048);
    assert(output == input);
}

void test_gain_change_applies_between_blocks() {
    Equalizer eq(48000);
    auto block = stereo_sine(1000.0, 48000, 24000);
    const double input_rms = tail_rms(block);

    auto first = block;
    eq.process(first.data(), 24000);
    assert(std::fabs(tail_rms(first) / input_rms - 1.0) < 1e-6);

    eq.set_band_gain(4, -12.0f);
    eq.reset();
    auto second = block;
    eq.process(second.data(), 24000);
    assert(tail_rms(second) / input_rms < 0.4);
}

}

int main() {
    test_flat_is_transparent();
    test_gain_limits();
    test_peak_boost_and_cut();
    test_bands_above_nyquist_are_bypassed();
    test_gain_change_applies_between_blocks();

    std::cout << "All equalizer tests passed." << std::endl;
    return 0;
}
