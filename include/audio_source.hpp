#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace termamp {

struct SourceInfo {
    double duration_seconds{0.0};
    int sample_rate{0};
    int channels{0};
    int bitrate_kbps{0};
    std::string codec;
    std::string title;
    std::string artist;
};

class SourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A decoded stream of interleaved stereo float PCM at the output rate.
// Implementations are not thread-safe; the player serializes access.
class AudioSource {
public:
    virtual ~AudioSource() = default;

    virtual const SourceInfo &info() const noexcept = 0;

    // Fills up to frame_count stereo frames. Returns 0 once the stream has
    // drained.
    virtual std::size_t read(float *interleaved, std::size_t frame_count) = 0;

    // Repositions to an output-rate frame index. Returns false when the
    // container cannot seek.
    virtual bool seek_frame(std::int64_t frame) = 0;
};

using SourceFactory = std::function<std::unique_ptr<AudioSource>(const std::filesystem::path &path, int output_rate)>;

// Opens path with libopenmpt for tracker modules and FFmpeg for everything
// else. Throws SourceError.
std::unique_ptr<AudioSource> open_audio_source(const std::filesystem::path &path, int output_rate);

}
