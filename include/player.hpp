#pragma once

#include "audio_output.hpp"
#include "audio_source.hpp"
#include "collaborators.hpp"
#include "dispatcher.hpp"
#include "equalizer.hpp"
#include "playback_clock.hpp"
#include "spectrum_analyzer.hpp"
#include "track.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace termamp {

enum class PlayerState {
    Empty,
    Stopped,
    Playing,
    Paused
};

const char *to_string(PlayerState state) noexcept;

struct TrackInfo {
    std::string title;
    std::string artist;
    std::filesystem::path path;
    std::string codec;
    double duration_seconds{0.0};
    int bitrate_kbps{0};
    int sample_rate{0};
    int channels{0};
};

struct TransportState {
    PlayerState state{PlayerState::Empty};
    bool playing{false};
    bool loading{false};
    double position_seconds{0.0};
    double duration_seconds{0.0};
    float volume{0.0f};
    EqGains eq_gains{};
    Spectrum spectrum{};
    std::optional<TrackInfo> track;
    std::string lyric_line;
};

class PlayerObserver {
public:
    virtual ~PlayerObserver() = default;

    virtual void on_transport_changed(const TransportState &state) = 0;
    virtual void on_load_failed(const Track &track, const std::string &reason) = 0;
};

struct PlayerOptions {
    int sample_rate{48000};
    int buffer_frames{1024};
    float volume{0.75f};
    // Tests drive render_once() by hand instead.
    bool render_thread{true};
};

// Owns the render graph (source -> equalizer -> volume -> analyzer tap ->
// output) and the playback state machine. Every public method except
// snapshot() and render_once() must be called on the dispatcher's thread.
class Player : public PlaybackTarget {
public:
    static constexpr std::chrono::milliseconds kTickInterval{100};

    Player(Dispatcher &dispatcher,
           WorkerPool &workers,
           std::unique_ptr<AudioOutput> output,
           SourceFactory factory,
           PlayerOptions options = {});
    ~Player() override;

    Player(const Player &) = delete;
    Player &operator=(const Player &) = delete;

    bool load_track(const Track &track) override;
    void play();
    void pause();
    void stop() override;
    void seek(double seconds);

    void set_volume(float volume);
    float volume() const noexcept { return volume_.load(std::memory_order_acquire); }
    bool set_eq_band(std::size_t band, float gain_db);
    EqGains eq_gains() const noexcept { return equalizer_.gains(); }

    void set_queue(PlaybackQueue *queue) noexcept { queue_ = queue; }
    void set_lyrics_source(LyricsSource *lyrics) noexcept { lyrics_ = lyrics; }
    void add_observer(PlayerObserver *observer);
    void remove_observer(PlayerObserver *observer);

    bool is_loading() const override { return loading_; }
    bool is_seeking() const noexcept { return seeking_; }
    PlayerState state() const noexcept { return state_; }
    double position() const;
    double duration() const noexcept { return duration_; }
    const std::optional<Track> &loaded_track() const noexcept { return loaded_track_; }

    // Periodic updater body; normally driven by the dispatcher timer.
    void tick();
    bool timer_running() const noexcept { return timer_running_; }

    // Pulls one block through the render graph. Returns the frame count
    // written to the output.
    std::size_t render_once();

    TransportState snapshot() const;

private:
    struct LoadResult {
        std::unique_ptr<AudioSource> source;
        std::string error;
    };

    void finish_load(const Track &track, LoadResult &result, std::uint64_t load_generation);
    void finish_seek(bool resume);
    void handle_completion(std::uint64_t generation);
    bool completion_eligible(std::uint64_t generation) const;

    void set_render_active(bool active);
    // Returns false when the source refused to reposition; the clock is left
    // untouched in that case.
    bool restart_source(double seconds);
    void render_loop();

    void ensure_timer();
    void schedule_tick();
    void stop_timer();

    double clamp_position(double seconds) const;
    void publish();

    Dispatcher &dispatcher_;
    WorkerPool &workers_;
    std::unique_ptr<AudioOutput> output_;
    SourceFactory factory_;
    const int sample_rate_;
    const std::size_t buffer_frames_;

    // Render thread state.
    std::thread render_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool shutting_down_{false};
    std::atomic<bool> render_active_{false};
    std::vector<float> buffer_;

    std::mutex source_mutex_;
    std::unique_ptr<AudioSource> source_;
    std::uint64_t render_generation_{0};

    PlaybackClock clock_;
    Equalizer equalizer_;
    SpectrumAnalyzer analyzer_;
    std::atomic<float> volume_;

    // Coordination thread state.
    PlayerState state_{PlayerState::Empty};
    std::uint64_t generation_{0};
    bool loading_{false};
    bool seeking_{false};
    bool auto_advance_{false};
    double position_{0.0};
    double duration_{0.0};
    std::optional<Track> loaded_track_;
    std::optional<TrackInfo> track_info_;
    std::string lyric_line_;

    bool timer_running_{false};
    std::uint64_t timer_epoch_{0};

    PlaybackQueue *queue_{nullptr};
    LyricsSource *lyrics_{nullptr};
    std::vector<PlayerObserver *> observers_;

    mutable std::mutex snapshot_mutex_;
    TransportState snapshot_{};
};

}
