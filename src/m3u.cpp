#include "m3u.hpp"

#include "library_scanner.hpp"
#include "log.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace termamp {

namespace {

// Code points for 0x80-0x9F in Windows-1252. Unassigned slots keep their
// Latin-1 control value.
constexpr std::array<std::uint16_t, 32> kCp1252High = {
    0x20AC, 0x0081, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0x008D, 0x017D, 0x008F,
    0x0090, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x009D, 0x017E, 0x0178
};

void append_utf8(std::string &out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool is_valid_utf8(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto c = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        std::uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + extra >= text.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and values past U+10FFFF.
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool starts_with_nocase(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        char a = text[i];
        if (a >= 'A' && a <= 'Z') {
            a = static_cast<char>(a - 'A' + 'a');
        }
        if (a != prefix[i]) {
            return false;
        }
    }
    return true;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// #EXTINF:<seconds>[ attributes],<title>
bool parse_extinf(std::string_view line, M3uEntry &pending) {
    std::string_view body = line.substr(8);
    const auto comma = body.find(',');
    if (comma == std::string_view::npos) {
        return false;
    }

    const std::string duration_text(trim(body.substr(0, comma)));
    if (duration_text.empty()) {
        return false;
    }
    errno = 0;
    char *end = nullptr;
    const double duration = std::strtod(duration_text.c_str(), &end);
    if (end == duration_text.c_str() || errno == ERANGE) {
        return false;
    }
    // Extended attributes (tvg-id="..." etc.) may follow the number.
    if (*end != '\0' && *end != ' ' && *end != '\t') {
        return false;
    }

    pending.duration_seconds = duration;
    const std::string_view title = trim(body.substr(comma + 1));
    if (!title.empty()) {
        pending.title = std::string(title);
    } else {
        pending.title.reset();
    }
    return true;
}

std::filesystem::path resolve_location(std::string_view location, const std::filesystem::path &base_dir) {
    namespace fs = std::filesystem;

    if (starts_with_nocase(location, "file://")) {
        std::string_view rest = location.substr(7);
        if (!rest.empty() && rest.front() != '/') {
            // file://host/path; only the local host is meaningful here.
            const auto slash = rest.find('/');
            rest = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash);
        }
        return fs::path(percent_decode(rest)).lexically_normal();
    }

    fs::path path{std::string(location)};
    if (path.is_relative()) {
        path = base_dir / path;
    }
    return path.lexically_normal();
}

}

std::string percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int hi = hex_value(text[i + 1]);
            const int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

std::string decode_playlist_text(std::string_view bytes) {
    if (bytes.size() >= 3 && bytes.substr(0, 3) == "\xEF\xBB\xBF") {
        bytes.remove_prefix(3);
    }
    if (is_valid_utf8(bytes)) {
        return std::string(bytes);
    }

    std::string out;
    out.reserve(bytes.size() + bytes.size() / 4);
    for (char ch : bytes) {
        const auto c = static_cast<unsigned char>(ch);
        if (c >= 0x80 && c <= 0x9F) {
            append_utf8(out, kCp1252High[c - 0x80]);
        } else {
            append_utf8(out, c);
        }
    }
    return out;
}

M3uParseResult parse_m3u(std::string_view text, const std::filesystem::path &base_dir) {
    namespace fs = std::filesystem;

    M3uParseResult result;
    M3uEntry pending;
    std::size_t line_number = 0;

    std::size_t start = 0;
    while (start <= text.size()) {
        auto newline = text.find('\n', start);
        if (newline == std::string_view::npos) {
            newline = text.size();
        }
        const std::string_view raw = text.substr(start, newline - start);
        start = newline + 1;
        ++line_number;

        const std::string_view line = trim(raw);
        if (line.empty()) {
            continue;
        }

        if (line.front() == '#') {
            if (starts_with_nocase(line, "#extinf:")) {
                if (!parse_extinf(line, pending)) {
                    result.skipped.push_back({line_number, std::string(line), "malformed #EXTINF"});
                    pending = M3uEntry{};
                }
            }
            continue;
        }

        const fs::path path = resolve_location(line, base_dir);
        std::error_code ec;
        std::string reason;
        if (!fs::exists(path, ec)) {
            reason = "not found";
        } else if (!fs::is_regular_file(path, ec)) {
            reason = "not a regular file";
        } else if (!is_audio_file(path)) {
            reason = "unsupported format";
        }

        if (!reason.empty()) {
            result.skipped.push_back({line_number, std::string(line), reason});
            pending = M3uEntry{};
            continue;
        }

        pending.path = path;
        result.entries.push_back(std::move(pending));
        pending = M3uEntry{};
    }
    return result;
}

bool read_m3u(const std::filesystem::path &path, M3uParseResult &result, std::string &error_message) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        error_message = "Unable to open playlist: " + path.string();
        return false;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        error_message = "Error reading playlist: " + path.string();
        return false;
    }

    const std::string text = decode_playlist_text(contents.str());
    std::error_code ec;
    std::filesystem::path base_dir = std::filesystem::absolute(path, ec).parent_path();
    if (ec) {
        base_dir = path.parent_path();
    }

    result = parse_m3u(text, base_dir);
    for (const auto &skip : result.skipped) {
        log_warning(path.filename().string() + ":" + std::to_string(skip.line_number) + ": " +
                    skip.reason + ": " + skip.text);
    }
    log_info("Loaded " + std::to_string(result.entries.size()) + " tracks from " + path.filename().string());
    return true;
}

bool write_m3u(const std::filesystem::path &path, const std::vector<Track> &tracks, std::string &error_message) {
    namespace fs = std::filesystem;

    std::ostringstream out;
    out << "#EXTM3U\n";
    for (const auto &track : tracks) {
        if (track.has_title_override()) {
            const double duration = track.duration_seconds();
            const long seconds = duration > 0.0 ? static_cast<long>(duration + 0.5) : -1;
            out << "#EXTINF:" << seconds << "," << track.title() << "\n";
        }
        std::error_code ec;
        fs::path absolute = fs::absolute(track.path(), ec);
        out << (ec ? track.path() : absolute).string() << "\n";
    }

    fs::path temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            error_message = "Unable to create " + temp_path.string();
            return false;
        }
        const std::string contents = out.str();
        file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        file.flush();
        if (!file) {
            error_message = "Error writing " + temp_path.string();
            file.close();
            std::error_code ignored;
            fs::remove(temp_path, ignored);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        error_message = "Unable to replace " + path.string() + ": " + ec.message();
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        return false;
    }
    return true;
}

std::vector<Track> to_tracks(const M3uParseResult &result) {
    std::vector<Track> tracks;
    tracks.reserve(result.entries.size());
    for (const auto &entry : result.entries) {
        std::error_code ec;
        std::uintmax_t size = std::filesystem::file_size(entry.path, ec);
        if (ec) {
            size = 0;
        }
        Track track(entry.path, {}, entry.duration_seconds > 0.0 ? entry.duration_seconds : 0.0, size);
        if (entry.title) {
            track.set_display_title(*entry.title);
        }
        tracks.push_back(std::move(track));
    }
    return tracks;
}

}
