#pragma once

#include "audio_source.hpp"

#include <filesystem>
#include <memory>

namespace openmpt {
class module;
}

namespace termamp {

// Tracker modules (mod, xm, it, s3m, ...) rendered by libopenmpt.
class ModuleSource : public AudioSource {
public:
    ModuleSource(const std::filesystem::path &path, int output_rate);
    ~ModuleSource() override;

    const SourceInfo &info() const noexcept override { return info_; }
    std::size_t read(float *interleaved, std::size_t frame_count) override;
    bool seek_frame(std::int64_t frame) override;

private:
    std::unique_ptr<openmpt::module> module_;
    int output_rate_;
    SourceInfo info_;
};

}
