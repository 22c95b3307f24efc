#include "library_scanner.hpp"

#include "fakes.hpp"
#include "log.hpp"

#include <cassert>
#include <iostream>

using namespace termamp;
using termamp::testing::TempDir;

namespace {

void test_extension_checks() {
    assert(is_module_file("song.XM"));
    assert(is_module_file("/a/b/tune.mod"));
    assert(!is_module_file("song.mp3"));
    assert(is_audio_file("song.MP3"));
    assert(is_audio_file("song.flac"));
    assert(is_audio_file("tune.it"));
    assert(!is_audio_file("cover.jpg"));
    assert(!is_audio_file("README"));
    assert(is_playlist_file("list.m3u"));
    assert(is_playlist_file("LIST.M3U8"));
    assert(!is_playlist_file("list.pls"));
}

void test_scan_sorted_and_filtered() {
    TempDir dir("termamp_scan");
    const auto b = dir.touch("b.mp3");
    const auto a = dir.touch("Album/A.flac");
    const auto c = dir.touch("album2/c.xm");
    dir.touch("cover.jpg");
    dir.touch(".hidden.mp3");
    dir.touch(".cache/deep.mp3");
    dir.touch("Album/notes.txt");

    std::vector<std::filesystem::path> files;
    std::string error;
    assert(scan_folder(dir.path(), files, error));
    assert(files.size() == 3);
    assert(files[0] == a);
    assert(files[1] == c);
    assert(files[2] == b);

    // Results are appended to what the caller already has.
    assert(scan_folder(dir.path() / "Album", files, error));
    assert(files.size() == 4);
    assert(files[3] == a);
}

void test_scan_rejects_non_directories() {
    TempDir dir("termamp_scan_file");
    const auto file = dir.touch("song.mp3");

    std::vector<std::filesystem::path> files;
    std::string error;
    assert(!scan_folder(file, files, error));
    assert(error.find("Not a directory") != std::string::npos);
    assert(!scan_folder(dir.path() / "missing", files, error));
    assert(files.empty());
}

void test_make_tracks() {
    TempDir dir("termamp_scan_tracks");
    const auto song = dir.touch("My Song.mp3", "12345");

    const auto tracks = make_tracks({song, dir.path() / "gone.ogg"});
    assert(tracks.size() == 2);
    assert(tracks[0].title() == "My Song");
    assert(tracks[0].file_size() == 5);
    assert(!tracks[0].has_title_override());
    assert(tracks[1].file_size() == 0);
}

}

int main() {
    set_log_level(LogLevel::Error);

    test_extension_checks();
    test_scan_sorted_and_filtered();
    test_scan_rejects_non_directories();
    test_make_tracks();

    std::cout << "All library scanner tests passed." << std::endl;
    return 0;
}
