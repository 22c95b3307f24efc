#pragma once

#include "track.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace termamp {

struct M3uEntry {
    std::filesystem::path path;
    std::optional<std::string> title;
    double duration_seconds{-1.0};
};

struct M3uSkippedLine {
    std::size_t line_number{0};
    std::string text;
    std::string reason;
};

struct M3uParseResult {
    std::vector<M3uEntry> entries;
    std::vector<M3uSkippedLine> skipped;
};

// Parses playlist text already decoded to UTF-8. Relative entries resolve
// against base_dir; entries that are missing, not regular files or not a
// supported audio format are skipped.
M3uParseResult parse_m3u(std::string_view text, const std::filesystem::path &base_dir);

bool read_m3u(const std::filesystem::path &path, M3uParseResult &result, std::string &error_message);

// Writes #EXTM3U with one absolute path per entry through a temporary file
// that replaces path on success.
bool write_m3u(const std::filesystem::path &path, const std::vector<Track> &tracks, std::string &error_message);

std::vector<Track> to_tracks(const M3uParseResult &result);

// Strips a UTF-8 BOM; bytes that are not valid UTF-8 are read as
// Windows-1252.
std::string decode_playlist_text(std::string_view bytes);

std::string percent_decode(std::string_view text);

}
