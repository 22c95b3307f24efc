#pragma once

#include "audio_output.hpp"
#include "audio_source.hpp"
#include "collaborators.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "player.hpp"
#include "playlist.hpp"
#include "worker_pool.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace termamp {

enum class CommandType {
    AddFiles,
    AddFolder,
    LoadPlaylist,
    AppendPlaylist,
    SavePlaylist,
    PlayTrack,
    RemoveTrack,
    ClearPlaylist,
    Play,
    Pause,
    Stop,
    Next,
    Previous,
    Seek,
    SetVolume,
    SetEqBand,
    ToggleShuffle,
    ToggleRepeat
};

struct Command {
    CommandType type{CommandType::Play};
    std::vector<std::filesystem::path> paths;
    double value{0.0};
    std::size_t index{0};
};

struct PlaylistView {
    std::vector<std::string> titles;
    int current_index{-1};
    bool shuffle{false};
    bool repeat{false};
};

struct ControllerOptions {
    PlayerOptions player{};
    std::size_t worker_threads{2};
    std::optional<std::uint32_t> shuffle_seed;
    // Both must outlive the controller. ResourceAccess is called from
    // worker threads.
    ResourceAccess *resource_access{nullptr};
    LyricsSource *lyrics{nullptr};
};

// Application context: owns the coordination loop, the worker pool, one
// Player and one Playlist. Front-ends submit commands from any thread and
// read back snapshots.
class Controller : public PlayerObserver {
public:
    static constexpr std::size_t kMaxNotifications = 32;

    Controller(Config &config,
               std::unique_ptr<AudioOutput> output,
               SourceFactory factory,
               ControllerOptions options = {});
    ~Controller() override;

    Controller(const Controller &) = delete;
    Controller &operator=(const Controller &) = delete;

    void submit(Command command);

    // Runs the coordination loop on the calling thread until shutdown().
    void run();
    void shutdown();

    TransportState transport() const { return player_.snapshot(); }
    PlaylistView playlist_view() const;
    std::vector<std::string> take_notifications();

    // Coordination-thread access, used by tests that drive the loop by hand.
    Dispatcher &dispatcher() noexcept { return dispatcher_; }
    Player &player() noexcept { return player_; }
    Playlist &playlist() noexcept { return playlist_; }

    void on_transport_changed(const TransportState &state) override;
    void on_load_failed(const Track &track, const std::string &reason) override;

private:
    struct Gathered {
        std::vector<Track> tracks;
        std::vector<std::string> messages;
    };

    void execute(const Command &command);
    void add_paths(const std::vector<std::filesystem::path> &paths);
    void import_playlist(const std::filesystem::path &path, bool replace);
    void save_playlist(const std::filesystem::path &path);
    void play();
    void remove_track(std::size_t index);
    void clear_playlist();

    Gathered gather(const std::vector<std::filesystem::path> &paths);
    // Drops the tracks access is refused for; returns how many were dropped.
    std::size_t keep_accessible(std::vector<Track> &tracks);
    bool in_playlist(const std::filesystem::path &path) const;
    void notify(const std::string &message);
    void refresh_view();

    Config &config_;
    LocalResourceAccess local_access_;
    ResourceAccess &access_;
    bool shut_down_{false};

    Dispatcher dispatcher_;
    WorkerPool workers_;
    Player player_;
    Playlist playlist_;

    mutable std::mutex view_mutex_;
    PlaylistView view_;
    std::deque<std::string> notifications_;
};

}
