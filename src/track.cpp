#include "track.hpp"

#include <utility>

namespace termamp {

Track::Track(std::filesystem::path path, std::string artist, double duration_seconds, std::uintmax_t file_size)
    : path_(std::move(path)),
      title_(path_.stem().string()),
      artist_(std::move(artist)),
      duration_seconds_(duration_seconds),
      file_size_(file_size) {
    if (title_.empty()) {
        title_ = path_.filename().string();
    }
}

const std::string &Track::title() const noexcept {
    return display_title_ ? *display_title_ : title_;
}

void Track::set_display_title(std::string title) {
    if (title.empty()) {
        display_title_.reset();
        return;
    }
    display_title_ = std::move(title);
}

}
