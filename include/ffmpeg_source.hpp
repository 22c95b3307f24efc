#pragma once

#include "audio_source.hpp"

#include <filesystem>
#include <memory>

namespace termamp {

// Decodes compressed and PCM files (mp3, flac, wav, ogg, opus, m4a, ...)
// through libavformat/libavcodec and resamples to stereo float with
// libswresample.
class FfmpegSource : public AudioSource {
public:
    FfmpegSource(const std::filesystem::path &path, int output_rate);
    ~FfmpegSource() override;

    FfmpegSource(const FfmpegSource &) = delete;
    FfmpegSource &operator=(const FfmpegSource &) = delete;

    const SourceInfo &info() const noexcept override { return info_; }
    std::size_t read(float *interleaved, std::size_t frame_count) override;
    bool seek_frame(std::int64_t frame) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    SourceInfo info_;
};

}
