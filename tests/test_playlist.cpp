#include "playlist.hpp"

#include "fakes.hpp"
#include "log.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <set>

using termamp::Playlist;
using termamp::Track;
using termamp::testing::FakeTarget;

namespace {

std::vector<Track> make(std::initializer_list<const char *> names) {
    std::vector<Track> tracks;
    for (const char *name : names) {
        tracks.emplace_back(std::filesystem::path("/music") / name);
    }
    return tracks;
}

void test_add_autoplays_first() {
    FakeTarget target;
    Playlist playlist(target, 1);
    assert(playlist.is_at_end());
    assert(playlist.current_track() == nullptr);

    playlist.add_tracks(make({"a.mp3", "b.mp3"}));
    assert(target.loaded.size() == 1);
    assert(target.loaded[0] == "/music/a.mp3");
    assert(playlist.current_index() == 0);

    // Appending to a non-empty list keeps the current track.
    playlist.add_tracks(make({"c.mp3"}));
    assert(target.loaded.size() == 1);
    assert(playlist.size() == 3);
}

void test_sequential_advance_and_end() {
    FakeTarget target;
    Playlist playlist(target, 1);
    playlist.add_tracks(make({"a.mp3", "b.mp3", "c.mp3"}));

    assert(!playlist.is_at_end());
    playlist.next();
    playlist.next();
    assert(playlist.current_index() == 2);
    assert(playlist.is_at_end());
    assert(target.loaded.back() == "/music/c.mp3");

    playlist.next();
    assert(target.stops == 1);
    assert(playlist.current_index() == 2);
    assert(target.loaded.size() == 3);

    playlist.set_repeat(true);
    playlist.next();
    assert(playlist.current_index() == 0);
    assert(target.loaded.back() == "/music/a.mp3");
}

void test_previous() {
    FakeTarget target;
    Playlist playlist(target, 1);
    playlist.add_tracks(make({"a.mp3", "b.mp3", "c.mp3"}));

    playlist.previous();
    assert(playlist.current_index() == 0);
    assert(target.loaded.size() == 2);
    assert(target.loaded.back() == "/music/a.mp3");

    playlist.set_repeat(true);
    playlist.previous();
    assert(playlist.current_index() == 2);

    playlist.previous();
    assert(playlist.current_index() == 1);
}

void test_play_track_bounds_and_loading() {
    FakeTarget target;
    Playlist playlist(target, 1);
    playlist.add_tracks(make({"a.mp3", "b.mp3", "c.mp3"}));

    assert(!playlist.play_track(3));
    assert(playlist.play_track(2));
    assert(playlist.current_index() == 2);

    target.loading = true;
    assert(!playlist.play_track(0));
    assert(playlist.current_index() == 2);
    playlist.next();
    assert(playlist.current_index() == 2);
    target.loading = false;
}

void test_shuffle_visits_every_track_once() {
    FakeTarget target;
    Playlist playlist(target, 42);
    playlist.add_tracks(make({"a.mp3", "b.mp3", "c.mp3", "d.mp3", "e.mp3"}));
    playlist.play_track(2);

    playlist.set_shuffle(true);
    const auto &order = playlist.shuffle_order();
    assert(order.size() == 5);
    assert(order.front() == 2);
    assert(playlist.shuffle_cursor() == 0);

    std::set<int> visited{playlist.current_index()};
    for (int i = 0; i < 4; ++i) {
        assert(!playlist.is_at_end());
        playlist.next();
        visited.insert(playlist.current_index());
    }
    assert(visited.size() == 5);
    assert(playlist.is_at_end());

    const int stops = target.stops;
    playlist.next();
    assert(target.stops == stops + 1);

    // Previous walks back through the permutation.
    const std::size_t cursor = playlist.shuffle_cursor();
    playlist.previous();
    assert(playlist.shuffle_cursor() == cursor - 1);
}

void test_shuffle_repeat_wraps_to_a_new_track() {
    FakeTarget target;
    Playlist playlist(target, 7);
    playlist.add_tracks(make({"a.mp3", "b.mp3", "c.mp3"}));
    playlist.set_shuffle(true);
    playlist.set_repeat(true);

    playlist.next();
    playlist.next();
    assert(playlist.is_at_end());
    const int last = playlist.current_index();

    playlist.next();
    assert(playlist.current_index() != last);
    assert(playlist.shuffle_order().front() == static_cast<std::size_t>(last));
    assert(playlist.shuffle_cursor() == 1);
}

void test_single_track_shuffle_repeat() {
    FakeTarget target;
    Playlist playlist(target, 3);
    playlist.add_tracks(make({"only.mp3"}));
    playlist.set_shuffle(true);
    playlist.set_repeat(true);

    assert(playlist.is_at_end());
    playlist.next();
    assert(target.loaded.size() == 2);
    assert(target.loaded.back() == "/music/only.mp3");
    assert(target.stops == 0);
}

void test_shuffle_previous_at_start_without_repeat() {
    FakeTarget target;
    Playlist playlist(target, 5);
    playlist.add_tracks(make({"a.mp3", "b.mp3"}));
    playlist.set_shuffle(true);

    const std::size_t loads = target.loaded.size();
    playlist.previous();
    assert(target.loaded.size() == loads);
    assert(playlist.current_index() == 0);
}

void test_remove_and_clear() {
    FakeTarget target;
    Playlist playlist(target, 1);
    playlist.add_tracks(make({"a.mp3", "b.mp3", "c.mp3"}));
    playlist.play_track(1);

    assert(!playlist.remove_track(5));
    assert(playlist.remove_track(0));
    assert(playlist.current_index() == 0);
    assert(playlist.current_track()->path() == "/music/b.mp3");

    assert(playlist.remove_track(1));
    assert(playlist.current_index() == 0);

    assert(playlist.remove_track(0));
    assert(playlist.empty());
    assert(playlist.current_index() == -1);
    assert(target.stops == 1);

    playlist.add_tracks(make({"x.mp3", "y.mp3"}));
    assert(target.loaded.back() == "/music/x.mp3");
    playlist.replace_tracks(make({"z.mp3"}));
    assert(playlist.size() == 1);
    assert(target.loaded.back() == "/music/z.mp3");

    playlist.clear();
    assert(playlist.empty());
    assert(playlist.is_at_end());
    assert(target.stops == 3);
}

}

int main() {
    termamp::set_log_level(termamp::LogLevel::Error);

    test_add_autoplays_first();
    test_sequential_advance_and_end();
    test_previous();
    test_play_track_bounds_and_loading();
    test_shuffle_visits_every_track_once();
    test_shuffle_repeat_wraps_to_a_new_track();
    test_single_track_shuffle_repeat();
    test_shuffle_previous_at_start_without_repeat();
    test_remove_and_clear();

    std::cout << "All playlist tests passed." << std::endl;
    return 0;
}
