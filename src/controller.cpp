#include "controller.hpp"

#include "library_scanner.hpp"
#include "log.hpp"
#include "m3u.hpp"

#include <algorithm>
#include <iterator>
#include <random>
#include <set>
#include <system_error>
#include <utility>

namespace termamp {

namespace {

std::string on_off(bool enabled) {
    return enabled ? "on" : "off";
}

}

Controller::Controller(Config &config,
                       std::unique_ptr<AudioOutput> output,
                       SourceFactory factory,
                       ControllerOptions options)
    : config_(config),
      access_(options.resource_access ? *options.resource_access : local_access_),
      workers_(options.worker_threads),
      player_(dispatcher_, workers_, std::move(output), std::move(factory), options.player),
      playlist_(player_, options.shuffle_seed ? *options.shuffle_seed : std::random_device{}()) {
    player_.set_queue(&playlist_);
    player_.set_lyrics_source(options.lyrics);
    player_.add_observer(this);

    player_.set_volume(config_.volume());
    const EqGains &gains = config_.eq_gains();
    for (std::size_t band = 0; band < kEqBandCount; ++band) {
        player_.set_eq_band(band, gains[band]);
    }
    playlist_.set_shuffle(config_.shuffle());
    playlist_.set_repeat(config_.repeat());
    refresh_view();
}

Controller::~Controller() {
    shutdown();
    player_.remove_observer(this);
}

void Controller::submit(Command command) {
    dispatcher_.post([this, command = std::move(command)] { execute(command); });
}

void Controller::run() {
    dispatcher_.run();
}

void Controller::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    workers_.shutdown();
    dispatcher_.stop();
}

PlaylistView Controller::playlist_view() const {
    std::lock_guard lock(view_mutex_);
    return view_;
}

std::vector<std::string> Controller::take_notifications() {
    std::lock_guard lock(view_mutex_);
    std::vector<std::string> out(notifications_.begin(), notifications_.end());
    notifications_.clear();
    return out;
}

void Controller::on_transport_changed(const TransportState &) {
    // Auto-advance moves the current index without going through execute().
    refresh_view();
}

void Controller::on_load_failed(const Track &track, const std::string &reason) {
    notify("Cannot play " + track.title() + ": " + reason);
}

void Controller::execute(const Command &command) {
    switch (command.type) {
        case CommandType::AddFiles:
        case CommandType::AddFolder:
            add_paths(command.paths);
            break;
        case CommandType::LoadPlaylist:
        case CommandType::AppendPlaylist:
            if (command.paths.empty()) {
                notify("No playlist given");
                break;
            }
            import_playlist(command.paths.front(), command.type == CommandType::LoadPlaylist);
            break;
        case CommandType::SavePlaylist:
            save_playlist(command.paths.empty() ? std::filesystem::path("playlist.m3u") : command.paths.front());
            break;
        case CommandType::PlayTrack:
            if (!playlist_.play_track(command.index)) {
                log_debug("Play request for entry " + std::to_string(command.index) + " ignored");
            }
            break;
        case CommandType::RemoveTrack:
            remove_track(command.index);
            break;
        case CommandType::ClearPlaylist:
            clear_playlist();
            break;
        case CommandType::Play:
            play();
            break;
        case CommandType::Pause:
            player_.pause();
            break;
        case CommandType::Stop:
            player_.stop();
            break;
        case CommandType::Next:
            playlist_.next();
            break;
        case CommandType::Previous:
            playlist_.previous();
            break;
        case CommandType::Seek:
            player_.seek(command.value);
            break;
        case CommandType::SetVolume:
            player_.set_volume(static_cast<float>(command.value));
            config_.set_volume(player_.volume());
            break;
        case CommandType::SetEqBand:
            if (player_.set_eq_band(command.index, static_cast<float>(command.value))) {
                config_.set_eq_gains(player_.eq_gains());
            }
            break;
        case CommandType::ToggleShuffle:
            playlist_.set_shuffle(!playlist_.shuffle_enabled());
            config_.set_shuffle(playlist_.shuffle_enabled());
            notify("Shuffle " + on_off(playlist_.shuffle_enabled()));
            break;
        case CommandType::ToggleRepeat:
            playlist_.set_repeat(!playlist_.repeat_enabled());
            config_.set_repeat(playlist_.repeat_enabled());
            notify("Repeat " + on_off(playlist_.repeat_enabled()));
            break;
    }
    refresh_view();
}

void Controller::play() {
    if (player_.state() == PlayerState::Empty && !player_.is_loading() && !playlist_.empty()) {
        const int current = playlist_.current_index();
        playlist_.play_track(current >= 0 ? static_cast<std::size_t>(current) : 0);
        return;
    }
    player_.play();
}

void Controller::remove_track(std::size_t index) {
    if (index >= playlist_.size()) {
        return;
    }
    const std::filesystem::path path = playlist_.tracks()[index].path();
    if (playlist_.remove_track(index) && !in_playlist(path)) {
        access_.release_access(path);
    }
}

void Controller::clear_playlist() {
    std::set<std::filesystem::path> paths;
    for (const auto &track : playlist_.tracks()) {
        paths.insert(track.path());
    }
    playlist_.clear();
    for (const auto &path : paths) {
        access_.release_access(path);
    }
    notify("Playlist cleared");
}

bool Controller::in_playlist(const std::filesystem::path &path) const {
    const auto &tracks = playlist_.tracks();
    return std::any_of(tracks.begin(), tracks.end(), [&](const Track &track) { return track.path() == path; });
}

std::size_t Controller::keep_accessible(std::vector<Track> &tracks) {
    const auto denied = std::remove_if(tracks.begin(), tracks.end(),
                                       [this](const Track &track) { return !access_.ensure_access(track.path()); });
    const auto dropped = static_cast<std::size_t>(std::distance(denied, tracks.end()));
    tracks.erase(denied, tracks.end());
    return dropped;
}

Controller::Gathered Controller::gather(const std::vector<std::filesystem::path> &paths) {
    Gathered result;
    for (const auto &path : paths) {
        if (!access_.ensure_access(path)) {
            result.messages.push_back("No access to " + path.string());
            continue;
        }

        std::error_code ec;
        if (std::filesystem::is_directory(path, ec)) {
            std::vector<std::filesystem::path> files;
            std::string error;
            const bool scanned = scan_folder(path, files, error);
            if (scanned) {
                log_info("Found " + std::to_string(files.size()) + " audio files in " + path.string());
                auto tracks = make_tracks(files);
                const std::size_t dropped = keep_accessible(tracks);
                if (dropped > 0) {
                    result.messages.push_back("No access to " + std::to_string(dropped) + " files in " +
                                              path.filename().string());
                }
                result.tracks.insert(result.tracks.end(), tracks.begin(), tracks.end());
            } else {
                result.messages.push_back(error);
            }
            // The scanned files hold their own access from here on.
            access_.release_access(path);
        } else if (is_playlist_file(path)) {
            M3uParseResult parsed;
            std::string error;
            const bool read = read_m3u(path, parsed, error);
            access_.release_access(path);
            if (!read) {
                result.messages.push_back(error);
                continue;
            }
            auto tracks = to_tracks(parsed);
            const std::size_t skipped = parsed.skipped.size() + keep_accessible(tracks);
            result.tracks.insert(result.tracks.end(), tracks.begin(), tracks.end());
            if (skipped > 0) {
                result.messages.push_back(std::to_string(skipped) + " entries skipped in " +
                                          path.filename().string());
            }
        } else if (std::filesystem::is_regular_file(path, ec) && is_audio_file(path)) {
            result.tracks.push_back(make_track(path));
        } else {
            access_.release_access(path);
            result.messages.push_back("Unsupported file: " + path.string());
        }
    }
    return result;
}

void Controller::add_paths(const std::vector<std::filesystem::path> &paths) {
    if (paths.empty()) {
        return;
    }
    workers_.submit([this, paths] {
        auto gathered = std::make_shared<Gathered>(gather(paths));
        dispatcher_.post([this, gathered] {
            for (const auto &message : gathered->messages) {
                notify(message);
            }
            const std::size_t count = gathered->tracks.size();
            if (count > 0) {
                playlist_.add_tracks(std::move(gathered->tracks));
                notify("Added " + std::to_string(count) + (count == 1 ? " track" : " tracks"));
            }
            refresh_view();
        });
    });
}

void Controller::import_playlist(const std::filesystem::path &path, bool replace) {
    workers_.submit([this, path, replace] {
        auto tracks = std::make_shared<std::vector<Track>>();
        auto error = std::make_shared<std::string>();
        std::size_t skipped = 0;
        bool ok = access_.ensure_access(path);
        if (!ok) {
            *error = "No access to " + path.string();
        } else {
            M3uParseResult parsed;
            ok = read_m3u(path, parsed, *error);
            access_.release_access(path);
            if (ok) {
                *tracks = to_tracks(parsed);
                skipped = parsed.skipped.size() + keep_accessible(*tracks);
            }
        }

        dispatcher_.post([this, path, replace, tracks, error, ok, skipped] {
            if (!ok) {
                log_error(*error);
                notify(*error);
                return;
            }
            const std::size_t count = tracks->size();
            if (replace) {
                std::set<std::filesystem::path> previous;
                for (const auto &track : playlist_.tracks()) {
                    previous.insert(track.path());
                }
                playlist_.replace_tracks(std::move(*tracks));
                for (const auto &old_path : previous) {
                    if (!in_playlist(old_path)) {
                        access_.release_access(old_path);
                    }
                }
            } else {
                playlist_.add_tracks(std::move(*tracks));
            }

            std::string message = "Loaded " + std::to_string(count) + " tracks from " + path.filename().string();
            if (skipped > 0) {
                message += " (" + std::to_string(skipped) + " skipped)";
            }
            notify(message);
            refresh_view();
        });
    });
}

void Controller::save_playlist(const std::filesystem::path &path) {
    if (playlist_.empty()) {
        notify("Cannot save an empty playlist");
        return;
    }

    workers_.submit([this, path, tracks = playlist_.tracks()] {
        std::string error;
        bool ok = access_.ensure_access(path);
        if (!ok) {
            error = "No access to " + path.string();
        } else {
            ok = write_m3u(path, tracks, error);
            access_.release_access(path);
        }

        const std::size_t count = tracks.size();
        dispatcher_.post([this, path, ok, error, count] {
            if (ok) {
                log_info("Saved playlist with " + std::to_string(count) + " tracks to " + path.string());
                notify("Saved " + path.filename().string());
            } else {
                log_error("Failed to save playlist: " + error);
                notify("Save failed: " + error);
            }
        });
    });
}

void Controller::notify(const std::string &message) {
    std::lock_guard lock(view_mutex_);
    notifications_.push_back(message);
    while (notifications_.size() > kMaxNotifications) {
        notifications_.pop_front();
    }
}

void Controller::refresh_view() {
    PlaylistView view;
    view.titles.reserve(playlist_.size());
    for (const auto &track : playlist_.tracks()) {
        view.titles.push_back(track.title());
    }
    view.current_index = playlist_.current_index();
    view.shuffle = playlist_.shuffle_enabled();
    view.repeat = playlist_.repeat_enabled();

    std::lock_guard lock(view_mutex_);
    view_ = std::move(view);
}

}
