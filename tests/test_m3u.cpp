#include "m3u.hpp"

#include "fakes.hpp"
#include "log.hpp"

#include <cassert>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace termamp;
using termamp::testing::TempDir;

namespace {

std::string read_file(const std::filesystem::path &path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

void test_parse_extended_playlist() {
    TempDir dir("termamp_m3u_parse");
    const auto one = dir.touch("music/one.mp3");
    const auto two = dir.touch("music/two words.flac");
    const auto three = dir.touch("three.xm");

    const std::string text =
        "#EXTM3U\n"
        "#EXTINF:215,Artist - First Song\n"
        "music/one.mp3\n"
        "\n"
        "# a comment\n"
        "file://" + dir.path().string() + "/music/two%20words.flac\n"
        "#EXTINF:-1 tvg-id=\"x\",Tracker Tune\n" +
        three.string() + "\n"
        "missing.mp3\n";

    const M3uParseResult result = parse_m3u(text, dir.path());
    assert(result.entries.size() == 3);
    assert(result.skipped.size() == 1);
    assert(result.skipped[0].reason == "not found");
    assert(result.skipped[0].line_number == 9);

    assert(result.entries[0].path == one);
    assert(result.entries[0].title == "Artist - First Song");
    assert(result.entries[0].duration_seconds == 215.0);

    assert(result.entries[1].path == two);
    assert(!result.entries[1].title);
    assert(result.entries[1].duration_seconds == -1.0);

    assert(result.entries[2].path == three);
    assert(result.entries[2].title == "Tracker Tune");

    const auto tracks = to_tracks(result);
    assert(tracks.size() == 3);
    assert(tracks[0].title() == "Artist - First Song");
    assert(tracks[0].duration_seconds() == 215.0);
    assert(tracks[0].file_size() == 1);
    assert(tracks[1].title() == "two words");
    assert(tracks[1].duration_seconds() == 0.0);
}

void test_skip_reasons() {
    TempDir dir("termamp_m3u_skip");
    dir.touch("notes.txt");
    dir.touch("folder.mp3/inside.mp3");
    dir.touch("ok.ogg");

    const std::string text =
        "#EXTINF:abc,Broken\n"
        "notes.txt\n"
        "folder.mp3\n"
        "./sub/../ok.ogg\r\n";

    const M3uParseResult result = parse_m3u(text, dir.path());
    assert(result.entries.size() == 1);
    assert(result.entries[0].path == dir.path() / "ok.ogg");
    assert(!result.entries[0].title);

    assert(result.skipped.size() == 3);
    assert(result.skipped[0].reason == "malformed #EXTINF");
    assert(result.skipped[0].line_number == 1);
    assert(result.skipped[1].reason == "unsupported format");
    assert(result.skipped[2].reason == "not a regular file");
}

void test_crlf_and_bom() {
    TempDir dir("termamp_m3u_crlf");
    dir.touch("a.mp3");
    dir.touch("b.wav");

    const std::string bytes = "\xEF\xBB\xBF#EXTM3U\r\n#EXTINF:10,A\r\na.mp3\r\nb.wav";
    const auto playlist = dir.touch("list.m3u", bytes);

    M3uParseResult result;
    std::string error;
    assert(read_m3u(playlist, result, error));
    assert(result.entries.size() == 2);
    assert(result.entries[0].title == "A");
    assert(result.entries[1].path.filename() == "b.wav");
    assert(result.skipped.empty());
}

void test_windows_1252_fallback() {
    assert(decode_playlist_text("plain") == "plain");
    assert(decode_playlist_text("\xEF\xBB\xBFtext") == "text");
    // Valid UTF-8 passes through unchanged.
    assert(decode_playlist_text("caf\xC3\xA9") == "caf\xC3\xA9");
    // Lone high bytes are read as Windows-1252.
    assert(decode_playlist_text("caf\xE9") == "caf\xC3\xA9");
    assert(decode_playlist_text("\x80 5") == "\xE2\x82\xAC 5");
    // Truncated multi-byte sequence at the end.
    assert(decode_playlist_text("ok\xC3") == "ok\xC3\x83");
}

void test_percent_decode() {
    assert(percent_decode("a%20b") == "a b");
    assert(percent_decode("a%20b%zz") == "a b%zz");
    assert(percent_decode("100%") == "100%");
    assert(percent_decode("%41%42%43") == "ABC");
}

void test_write_and_read_back() {
    TempDir dir("termamp_m3u_write");
    const auto a = dir.touch("a.mp3");
    const auto b = dir.touch("sub/b.flac");

    std::vector<Track> tracks;
    tracks.emplace_back(a, "", 183.6, 1);
    tracks.emplace_back(b);
    tracks[0].set_display_title("Renamed");

    const auto playlist = dir.path() / "out.m3u";
    std::string error;
    assert(write_m3u(playlist, tracks, error));
    assert(!std::filesystem::exists(dir.path() / "out.m3u.tmp"));

    const std::string written = read_file(playlist);
    const std::string expected =
        "#EXTM3U\n"
        "#EXTINF:184,Renamed\n" +
        a.string() + "\n" +
        b.string() + "\n";
    assert(written == expected);

    M3uParseResult result;
    assert(read_m3u(playlist, result, error));
    assert(result.entries.size() == 2);
    assert(result.entries[0].path == a);
    assert(result.entries[0].title == "Renamed");
    assert(result.entries[1].path == b);

    // Writing into a missing directory fails without leaving files behind.
    assert(!write_m3u(dir.path() / "nope" / "x.m3u", tracks, error));
    assert(!error.empty());
}

void test_read_missing_file() {
    M3uParseResult result;
    std::string error;
    assert(!read_m3u("/nonexistent/termamp/list.m3u", result, error));
    assert(error.find("Unable to open playlist") != std::string::npos);
}

}

int main() {
    set_log_level(LogLevel::Error);

    test_parse_extended_playlist();
    test_skip_reasons();
    test_crlf_and_bom();
    test_windows_1252_fallback();
    test_percent_decode();
    test_write_and_read_back();
    test_read_missing_file();

    std::cout << "All M3U tests passed." << std::endl;
    return 0;
}
