#pragma once

#include "track.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace termamp {

bool is_module_file(const std::filesystem::path &path);
bool is_audio_file(const std::filesystem::path &path);
bool is_playlist_file(const std::filesystem::path &path);

// Recursively collects supported audio files below folder, skipping hidden
// entries. Results are sorted case-insensitively by path. Returns false only
// when folder itself cannot be read; unreadable subdirectories are skipped.
bool scan_folder(const std::filesystem::path &folder,
                 std::vector<std::filesystem::path> &files,
                 std::string &error_message);

Track make_track(const std::filesystem::path &path);
std::vector<Track> make_tracks(const std::vector<std::filesystem::path> &paths);

}
