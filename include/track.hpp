#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace termamp {

// A playable audio resource. Everything but the display title is fixed at
// construction; playlists may relabel an entry (e.g. from #EXTINF).
class Track {
public:
    explicit Track(std::filesystem::path path,
                   std::string artist = {},
                   double duration_seconds = 0.0,
                   std::uintmax_t file_size = 0);

    const std::filesystem::path &path() const noexcept { return path_; }
    const std::string &title() const noexcept;
    const std::string &artist() const noexcept { return artist_; }
    double duration_seconds() const noexcept { return duration_seconds_; }
    std::uintmax_t file_size() const noexcept { return file_size_; }

    bool has_title_override() const noexcept { return display_title_.has_value(); }
    void set_display_title(std::string title);

private:
    std::filesystem::path path_;
    std::string title_;
    std::string artist_;
    double duration_seconds_;
    std::uintmax_t file_size_;
    std::optional<std::string> display_title_;
};

}
