#include "controller.hpp"

#include "fakes.hpp"
#include "log.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <set>
#include <thread>

using namespace termamp;
using namespace termamp::testing;

namespace {

class CountingAccess : public ResourceAccess {
public:
    bool ensure_access(const std::filesystem::path &path) override {
        ++granted;
        if (path.filename() == "locked") {
            return false;
        }
        held.insert(path);
        return true;
    }
    void release_access(const std::filesystem::path &path) override {
        ++released;
        held.erase(path);
    }

    int granted{0};
    int released{0};
    std::set<std::filesystem::path> held;
};

struct Harness {
    explicit Harness(const TempDir &dir, CountingAccess *access = nullptr)
        : source_log(std::make_shared<SourceLog>()),
          output_log(std::make_shared<OutputLog>()),
          config(dir.path() / "config.ini"),
          controller(config, std::make_unique<FakeOutput>(output_log), fake_factory(source_log),
                     make_options(access)) {}

    static ControllerOptions make_options(CountingAccess *access) {
        ControllerOptions options;
        options.player.render_thread = false;
        options.worker_threads = 0;
        options.shuffle_seed = 42;
        options.resource_access = access;
        return options;
    }

    void send(CommandType type, std::vector<std::filesystem::path> paths = {}, double value = 0.0,
              std::size_t index = 0) {
        Command command;
        command.type = type;
        command.paths = std::move(paths);
        command.value = value;
        command.index = index;
        controller.submit(std::move(command));
        controller.dispatcher().drain();
    }

    bool notified(const std::string &text) {
        const auto messages = controller.take_notifications();
        seen.insert(seen.end(), messages.begin(), messages.end());
        return std::any_of(seen.begin(), seen.end(), [&](const std::string &m) {
            return m.find(text) != std::string::npos;
        });
    }

    std::shared_ptr<SourceLog> source_log;
    std::shared_ptr<OutputLog> output_log;
    Config config;
    Controller controller;
    std::vector<std::string> seen;
};

void test_config_applied_on_start() {
    TempDir dir("termamp_controller_config");
    dir.touch("config.ini", "volume=0.5\nshuffle=yes\nrepeat=on\neq=1,2,3,4,5,6,7,8,9,10\n");
    Harness h(dir);

    assert(h.controller.player().volume() == 0.5f);
    assert(h.controller.player().eq_gains()[9] == 10.0f);
    const PlaylistView view = h.controller.playlist_view();
    assert(view.shuffle);
    assert(view.repeat);
    assert(view.titles.empty());
    assert(h.controller.transport().state == PlayerState::Empty);
}

void test_add_folder_and_navigate() {
    TempDir dir("termamp_controller_add");
    dir.touch("music/a.mp3");
    dir.touch("music/b.mp3");
    dir.touch("music/c.mp3");
    dir.touch("music/cover.jpg");
    Harness h(dir);

    h.send(CommandType::AddFolder, {dir.path() / "music"});
    assert(h.notified("Added 3 tracks"));
    PlaylistView view = h.controller.playlist_view();
    assert((view.titles == std::vector<std::string>{"a", "b", "c"}));
    assert(view.current_index == 0);

    TransportState state = h.controller.transport();
    assert(state.state == PlayerState::Playing);
    assert(state.track->title == "a");

    h.send(CommandType::Next);
    assert(h.controller.playlist_view().current_index == 1);
    assert(h.controller.transport().track->title == "b");

    h.send(CommandType::Pause);
    assert(h.controller.transport().state == PlayerState::Paused);
    h.send(CommandType::Pause);
    assert(h.controller.transport().state == PlayerState::Playing);

    h.send(CommandType::PlayTrack, {}, 0.0, 2);
    assert(h.controller.transport().track->title == "c");

    h.send(CommandType::Previous);
    assert(h.controller.playlist_view().current_index == 1);

    h.send(CommandType::Seek, {}, 42.0);
    assert(h.controller.transport().position_seconds == 42.0);

    h.send(CommandType::Stop);
    assert(h.controller.transport().state == PlayerState::Stopped);
    h.send(CommandType::Play);
    assert(h.controller.transport().state == PlayerState::Playing);
}

void test_settings_persist_to_config() {
    TempDir dir("termamp_controller_settings");
    Harness h(dir);

    h.send(CommandType::SetVolume, {}, 0.4);
    assert(h.config.volume() == 0.4f);
    assert(h.controller.transport().volume == 0.4f);

    h.send(CommandType::SetVolume, {}, 3.0);
    assert(h.config.volume() == 1.0f);

    h.send(CommandType::SetEqBand, {}, 5.0, 2);
    assert(h.config.eq_gains()[2] == 5.0f);
    h.send(CommandType::SetEqBand, {}, 5.0, 99);
    assert(h.config.eq_gains()[2] == 5.0f);

    h.send(CommandType::ToggleShuffle);
    assert(h.config.shuffle());
    assert(h.notified("Shuffle on"));
    h.send(CommandType::ToggleRepeat);
    assert(h.config.repeat());
    assert(h.notified("Repeat on"));
    assert(h.controller.playlist_view().repeat);

    assert(h.config.save());
    Config reloaded(dir.path() / "config.ini");
    assert(reloaded.volume() == 1.0f);
    assert(reloaded.shuffle());
    assert(reloaded.eq_gains()[2] == 5.0f);
}

void test_save_and_load_playlist() {
    TempDir dir("termamp_controller_playlist");
    const auto a = dir.touch("a.mp3");
    const auto b = dir.touch("b.ogg");
    Harness h(dir);

    h.send(CommandType::SavePlaylist, {dir.path() / "empty.m3u"});
    assert(h.notified("Cannot save an empty playlist"));
    assert(!std::filesystem::exists(dir.path() / "empty.m3u"));

    h.send(CommandType::AddFiles, {a, b});
    assert(h.notified("Added 2 tracks"));

    const auto list = dir.path() / "list.m3u";
    h.send(CommandType::SavePlaylist, {list});
    assert(h.notified("Saved list.m3u"));
    assert(std::filesystem::exists(list));

    h.send(CommandType::ClearPlaylist);
    assert(h.notified("Playlist cleared"));
    assert(h.controller.playlist().empty());
    assert(h.controller.transport().state == PlayerState::Stopped);

    h.send(CommandType::LoadPlaylist, {list});
    assert(h.notified("Loaded 2 tracks from list.m3u"));
    assert(h.controller.playlist().size() == 2);
    assert(h.controller.transport().state == PlayerState::Playing);

    h.send(CommandType::AppendPlaylist, {list});
    assert(h.controller.playlist().size() == 4);

    // A playlist naming a missing file reports the skip.
    dir.touch("partial.m3u", "a.mp3\ngone.mp3\n");
    h.send(CommandType::LoadPlaylist, {dir.path() / "partial.m3u"});
    assert(h.notified("Loaded 1 tracks from partial.m3u (1 skipped)"));
    assert(h.controller.playlist().size() == 1);

    h.send(CommandType::LoadPlaylist, {dir.path() / "missing.m3u"});
    assert(h.notified("Unable to open playlist"));
    assert(h.controller.playlist().size() == 1);

    h.send(CommandType::LoadPlaylist);
    assert(h.notified("No playlist given"));
}

void test_failures_are_reported() {
    TempDir dir("termamp_controller_failures");
    const auto broken = dir.touch("broken.mp3");
    const auto good = dir.touch("good.mp3");
    const auto notes = dir.touch("notes.txt");
    Harness h(dir);

    h.send(CommandType::AddFiles, {broken, good, notes});
    assert(h.notified("Unsupported file: " + notes.string()));
    assert(h.notified("Cannot play broken: Invalid data found when processing input"));
    assert(h.notified("Added 2 tracks"));
    assert(h.controller.transport().state == PlayerState::Empty);

    h.send(CommandType::PlayTrack, {}, 0.0, 1);
    assert(h.controller.transport().state == PlayerState::Playing);
    assert(h.controller.transport().track->title == "good");
}

void test_resource_access() {
    TempDir dir("termamp_controller_access");
    const auto a = dir.touch("a.mp3");
    const auto b = dir.touch("b.mp3");
    const auto c = dir.touch("c.mp3");
    dir.touch("sub/x.mp3");
    dir.touch("sub/y.mp3");
    CountingAccess access;
    Harness h(dir, &access);

    h.send(CommandType::AddFiles, {a, b, c, dir.path() / "locked"});
    assert(access.granted == 4);
    assert(h.notified("No access to"));
    assert(h.controller.playlist().size() == 3);

    // A second entry for the same file shares its access.
    h.send(CommandType::AddFiles, {a});
    assert(h.controller.playlist().size() == 4);
    h.send(CommandType::RemoveTrack, {}, 0.0, 3);
    assert(access.released == 0);
    assert(access.held.count(a) == 1);

    h.send(CommandType::RemoveTrack, {}, 0.0, 1);
    assert(access.released == 1);
    assert(access.held.count(b) == 0);
    assert((h.controller.playlist_view().titles == std::vector<std::string>{"a", "c"}));

    h.send(CommandType::RemoveTrack, {}, 0.0, 7);
    assert(access.released == 1);

    // Folder access is handed over to the files found in it.
    const int granted_before = access.granted;
    h.send(CommandType::AddFiles, {dir.path() / "sub"});
    assert(access.granted == granted_before + 3);
    assert(access.released == 2);
    assert(access.held.count(dir.path() / "sub") == 0);
    assert(access.held.count(dir.path() / "sub" / "x.mp3") == 1);
    assert(h.controller.playlist().size() == 4);

    h.send(CommandType::AddFiles, {a});
    h.send(CommandType::ClearPlaylist);
    assert(access.released == 6);
    assert(access.held.empty());
}

void test_run_on_coordination_thread() {
    TempDir dir("termamp_controller_thread");
    const auto a = dir.touch("a.mp3");
    Harness h(dir);

    std::thread loop([&] { h.controller.run(); });
    Command add;
    add.type = CommandType::AddFiles;
    add.paths = {a};
    h.controller.submit(add);

    for (int i = 0; i < 200 && h.controller.transport().state != PlayerState::Playing; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(h.controller.transport().state == PlayerState::Playing);

    h.controller.shutdown();
    loop.join();
}

}

int main() {
    set_log_level(LogLevel::Error);

    test_config_applied_on_start();
    test_add_folder_and_navigate();
    test_settings_persist_to_config();
    test_save_and_load_playlist();
    test_failures_are_reported();
    test_resource_access();
    test_run_on_coordination_thread();

    std::cout << "All controller tests passed." << std::endl;
    return 0;
}
