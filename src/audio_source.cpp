#include "audio_source.hpp"

#include "ffmpeg_source.hpp"
#include "library_scanner.hpp"
#include "module_source.hpp"

namespace termamp {

std::unique_ptr<AudioSource> open_audio_source(const std::filesystem::path &path, int output_rate) {
    if (is_module_file(path)) {
        return std::make_unique<ModuleSource>(path, output_rate);
    }
    return std::make_unique<FfmpegSource>(path, output_rate);
}

}
