#include "library_scanner.hpp"

#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace termamp {

namespace {

const std::vector<std::string> module_extensions = {
    ".mod", ".xm", ".s3m", ".it", ".mptm", ".stm", ".nst", ".m15", ".stk",
    ".wow", ".ult", ".669", ".mtm", ".med", ".far", ".mdl", ".ams", ".dsm",
    ".amf", ".okt", ".dmf", ".ptm", ".psm", ".mt2", ".dbm", ".digi", ".imf",
    ".j2b", ".gdm", ".umx", ".plm", ".mo3", ".xpk", ".ppm", ".mmcmp"
};

const std::vector<std::string> stream_extensions = {
    ".mp3", ".flac", ".wav", ".ogg", ".oga", ".opus", ".m4a", ".aac",
    ".aif", ".aiff", ".wma", ".wv", ".ape", ".mpc"
};

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string lower_extension(const std::filesystem::path &path) {
    if (!path.has_extension()) {
        return {};
    }
    return lowercase(path.extension().string());
}

bool contains(const std::vector<std::string> &list, const std::string &ext) {
    return std::find(list.begin(), list.end(), ext) != list.end();
}

bool is_hidden(const std::filesystem::path &path) {
    const std::string name = path.filename().string();
    return !name.empty() && name.front() == '.';
}

}

bool is_module_file(const std::filesystem::path &path) {
    return contains(module_extensions, lower_extension(path));
}

bool is_audio_file(const std::filesystem::path &path) {
    const std::string ext = lower_extension(path);
    return contains(stream_extensions, ext) || contains(module_extensions, ext);
}

bool is_playlist_file(const std::filesystem::path &path) {
    const std::string ext = lower_extension(path);
    return ext == ".m3u" || ext == ".m3u8";
}

bool scan_folder(const std::filesystem::path &folder,
                 std::vector<std::filesystem::path> &files,
                 std::string &error_message) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        error_message = "Not a directory: " + folder.string();
        return false;
    }

    fs::recursive_directory_iterator it(folder, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        error_message = "Error reading directory: " + ec.message();
        return false;
    }

    std::vector<fs::path> found;
    const fs::recursive_directory_iterator end;
    while (it != end) {
        const fs::path &path = it->path();
        if (is_hidden(path)) {
            if (it->is_directory(ec)) {
                it.disable_recursion_pending();
            }
        } else if (it->is_regular_file(ec) && is_audio_file(path)) {
            found.push_back(path);
        }

        it.increment(ec);
        if (ec) {
            log_warning("Stopped scanning " + folder.string() + ": " + ec.message());
            break;
        }
    }

    std::sort(found.begin(), found.end(), [](const fs::path &a, const fs::path &b) {
        return lowercase(a.string()) < lowercase(b.string());
    });

    files.insert(files.end(), found.begin(), found.end());
    return true;
}

Track make_track(const std::filesystem::path &path) {
    std::error_code ec;
    std::uintmax_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        size = 0;
    }
    return Track(path, {}, 0.0, size);
}

std::vector<Track> make_tracks(const std::vector<std::filesystem::path> &paths) {
    std::vector<Track> tracks;
    tracks.reserve(paths.size());
    for (const auto &path : paths) {
        tracks.push_back(make_track(path));
    }
    return tracks;
}

}
