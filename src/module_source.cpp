#include "module_source.hpp"

#include "log.hpp"

#include <fstream>

#include <libopenmpt/libopenmpt.hpp>

namespace termamp {

ModuleSource::ModuleSource(const std::filesystem::path &path, int output_rate)
    : output_rate_(output_rate) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw SourceError("Unable to open module file: " + path.string());
    }

    try {
        module_ = std::make_unique<openmpt::module>(file);
    } catch (const openmpt::exception &e) {
        throw SourceError("Unable to load module " + path.string() + ": " + e.what());
    }

    info_.duration_seconds = module_->get_duration_seconds();
    info_.sample_rate = output_rate_;
    info_.channels = 2;

    info_.codec = module_->get_metadata("type");
    if (info_.codec.empty()) {
        info_.codec = module_->get_metadata("type_long");
    }

    info_.title = module_->get_metadata("title");
    info_.artist = module_->get_metadata("artist");

    std::error_code ec;
    const auto bytes = std::filesystem::file_size(path, ec);
    if (!ec && info_.duration_seconds > 0.0) {
        info_.bitrate_kbps = static_cast<int>(static_cast<double>(bytes) * 8.0 / info_.duration_seconds / 1000.0);
    }
}

ModuleSource::~ModuleSource() = default;

std::size_t ModuleSource::read(float *interleaved, std::size_t frame_count) {
    try {
        return module_->read_interleaved_stereo(output_rate_, frame_count, interleaved);
    } catch (const openmpt::exception &e) {
        log_error(std::string("Module render error: ") + e.what());
        return 0;
    }
}

bool ModuleSource::seek_frame(std::int64_t frame) {
    try {
        module_->set_position_seconds(static_cast<double>(frame) / static_cast<double>(output_rate_));
        return true;
    } catch (const openmpt::exception &e) {
        log_warning(std::string("Module seek failed: ") + e.what());
        return false;
    }
}

}
