#include "player.hpp"

#include "log.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace termamp {

const char *to_string(PlayerState state) noexcept {
    switch (state) {
        case PlayerState::Empty:
            return "Empty";
        case PlayerState::Stopped:
            return "Stopped";
        case PlayerState::Playing:
            return "Playing";
        case PlayerState::Paused:
            return "Paused";
    }
    return "Unknown";
}

Player::Player(Dispatcher &dispatcher,
               WorkerPool &workers,
               std::unique_ptr<AudioOutput> output,
               SourceFactory factory,
               PlayerOptions options)
    : dispatcher_(dispatcher),
      workers_(workers),
      output_(std::move(output)),
      factory_(std::move(factory)),
      sample_rate_(options.sample_rate),
      buffer_frames_(static_cast<std::size_t>(std::max(options.buffer_frames, 1))),
      buffer_(buffer_frames_ * 2, 0.0f),
      clock_(options.sample_rate),
      equalizer_(options.sample_rate),
      volume_(std::clamp(options.volume, 0.0f, 1.0f)) {
    if (!output_) {
        throw std::invalid_argument("Player requires an audio output");
    }
    if (!factory_) {
        throw std::invalid_argument("Player requires a source factory");
    }

    output_->open(sample_rate_, 2, static_cast<int>(buffer_frames_));

    if (options.render_thread) {
        render_thread_ = std::thread(&Player::render_loop, this);
    }
    publish();
}

Player::~Player() {
    {
        std::lock_guard lock(wake_mutex_);
        shutting_down_ = true;
        render_active_.store(false, std::memory_order_release);
    }
    wake_cv_.notify_all();
    if (render_thread_.joinable()) {
        render_thread_.join();
    }
    output_->close();
}

bool Player::load_track(const Track &track) {
    if (loading_) {
        log_warning("Ignoring load of " + track.path().string() + ": another load is in progress");
        return false;
    }

    loading_ = true;
    ++generation_;
    const std::uint64_t load_generation = generation_;
    set_render_active(false);
    {
        std::lock_guard lock(source_mutex_);
        source_.reset();
        render_generation_ = generation_;
    }

    clock_.restart(0.0);
    analyzer_.clear_staging();
    equalizer_.reset();
    state_ = PlayerState::Empty;
    position_ = 0.0;
    duration_ = track.duration_seconds();
    loaded_track_ = track;
    track_info_.reset();
    lyric_line_.clear();
    publish();

    log_debug("Opening " + track.path().string());

    auto result = std::make_shared<LoadResult>();
    workers_.submit([this, track, result, load_generation] {
        try {
            result->source = factory_(track.path(), sample_rate_);
            if (!result->source) {
                result->error = "no decoder available";
            }
        } catch (const std::exception &e) {
            result->error = e.what();
        }
        dispatcher_.post([this, track, result, load_generation] { finish_load(track, *result, load_generation); });
    });
    return true;
}

void Player::finish_load(const Track &track, LoadResult &result, std::uint64_t load_generation) {
    if (load_generation != generation_) {
        // Cancelled by stop(); a newer load may own loading_ by now.
        log_debug("Discarding cancelled load of " + track.path().string());
        return;
    }
    loading_ = false;

    if (!result.error.empty()) {
        state_ = PlayerState::Empty;
        duration_ = 0.0;
        loaded_track_.reset();
        log_error("Failed to load " + track.path().string() + ": " + result.error);
        publish();
        auto observers = observers_;
        for (auto *observer : observers) {
            observer->on_load_failed(track, result.error);
        }
        return;
    }

    const SourceInfo info = result.source->info();

    ++generation_;
    {
        std::lock_guard lock(source_mutex_);
        source_ = std::move(result.source);
        render_generation_ = generation_;
    }
    clock_.restart(0.0);

    TrackInfo details;
    details.path = track.path();
    if (track.has_title_override() || info.title.empty()) {
        details.title = track.title();
    } else {
        details.title = info.title;
    }
    details.artist = info.artist.empty() ? track.artist() : info.artist;
    details.codec = info.codec;
    details.duration_seconds = info.duration_seconds > 0.0 ? info.duration_seconds : track.duration_seconds();
    details.bitrate_kbps = info.bitrate_kbps;
    details.sample_rate = info.sample_rate;
    details.channels = info.channels;

    duration_ = details.duration_seconds;
    track_info_ = details;
    state_ = PlayerState::Stopped;

    log_info("Loaded " + details.title + " (" + details.codec + ", " + std::to_string(details.sample_rate) + " Hz)");

    play();
}

void Player::play() {
    if (state_ == PlayerState::Empty || state_ == PlayerState::Playing) {
        return;
    }

    auto_advance_ = true;
    if (clock_.position() <= 0.0 && !restart_source(0.0)) {
        log_debug("Rewind failed, playing on from the decoder's position");
    }

    state_ = PlayerState::Playing;
    set_render_active(true);
    ensure_timer();
    publish();
}

void Player::pause() {
    switch (state_) {
        case PlayerState::Playing:
            set_render_active(false);
            analyzer_.clear_staging();
            position_ = clamp_position(clock_.position());
            state_ = PlayerState::Paused;
            publish();
            break;
        case PlayerState::Paused:
        case PlayerState::Stopped:
            play();
            break;
        case PlayerState::Empty:
            break;
    }
}

void Player::stop() {
    auto_advance_ = false;
    if (loading_) {
        // The pending result is dropped when it arrives.
        loading_ = false;
        ++generation_;
        loaded_track_.reset();
        duration_ = 0.0;
        log_debug("Cancelled pending load");
    }
    if (state_ == PlayerState::Empty) {
        publish();
        return;
    }

    set_render_active(false);
    ++generation_;
    {
        std::lock_guard lock(source_mutex_);
        render_generation_ = generation_;
    }
    clock_.restart(0.0);
    analyzer_.clear_staging();
    position_ = 0.0;
    lyric_line_.clear();
    state_ = PlayerState::Stopped;
    publish();
}

void Player::seek(double seconds) {
    if (state_ == PlayerState::Empty) {
        return;
    }

    const bool was_playing = state_ == PlayerState::Playing;
    seeking_ = true;
    set_render_active(false);

    const double target = clamp_position(seconds);
    if (restart_source(target)) {
        position_ = target;
    } else {
        position_ = clamp_position(clock_.position());
    }
    publish();

    dispatcher_.post([this, was_playing] { finish_seek(was_playing); });
}

void Player::finish_seek(bool resume) {
    seeking_ = false;
    if (resume && state_ == PlayerState::Playing) {
        set_render_active(true);
    }
}

bool Player::restart_source(double seconds) {
    const auto frame = static_cast<std::int64_t>(std::llround(seconds * sample_rate_));

    {
        std::lock_guard lock(source_mutex_);
        if (source_ && !source_->seek_frame(frame)) {
            log_warning("Seek to " + std::to_string(seconds) + "s failed, keeping the current position");
            return false;
        }
        ++generation_;
        render_generation_ = generation_;
    }
    equalizer_.reset();
    clock_.restart(seconds);
    return true;
}

void Player::set_volume(float volume) {
    volume_.store(std::clamp(volume, 0.0f, 1.0f), std::memory_order_release);
    publish();
}

bool Player::set_eq_band(std::size_t band, float gain_db) {
    if (!equalizer_.set_band_gain(band, gain_db)) {
        return false;
    }
    publish();
    return true;
}

void Player::add_observer(PlayerObserver *observer) {
    if (observer && std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) {
        observers_.push_back(observer);
    }
}

void Player::remove_observer(PlayerObserver *observer) {
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

double Player::position() const {
    if (state_ == PlayerState::Playing && !seeking_) {
        return clamp_position(clock_.position());
    }
    return position_;
}

double Player::clamp_position(double seconds) const {
    seconds = std::max(0.0, seconds);
    if (duration_ > 0.0) {
        seconds = std::min(seconds, duration_);
    }
    return seconds;
}

bool Player::completion_eligible(std::uint64_t generation) const {
    return !seeking_ && generation == generation_ && state_ == PlayerState::Playing;
}

void Player::handle_completion(std::uint64_t generation) {
    if (!completion_eligible(generation)) {
        log_debug("Ignoring stale completion");
        return;
    }

    clock_.restart(0.0);
    position_ = 0.0;

    if (auto_advance_ && queue_) {
        if (queue_->is_at_end() && !queue_->repeat_enabled()) {
            log_info("End of playlist reached");
            stop();
        } else {
            queue_->next();
        }
        return;
    }
    stop();
}

void Player::set_render_active(bool active) {
    {
        std::lock_guard lock(wake_mutex_);
        render_active_.store(active, std::memory_order_release);
    }
    wake_cv_.notify_all();
}

void Player::render_loop() {
    while (true) {
        {
            std::unique_lock lock(wake_mutex_);
            wake_cv_.wait(lock, [this] {
                return shutting_down_ || render_active_.load(std::memory_order_acquire) || output_->is_running();
            });
            if (shutting_down_) {
                break;
            }
        }
        render_once();
    }
}

std::size_t Player::render_once() {
    if (!render_active_.load(std::memory_order_acquire)) {
        output_->stop();
        return 0;
    }

    if (!output_->is_running() && !output_->start()) {
        render_active_.store(false, std::memory_order_release);
        dispatcher_.post([this] {
            if (state_ == PlayerState::Playing) {
                log_error("Audio output unavailable, stopping playback");
                stop();
            }
        });
        return 0;
    }

    std::size_t frames = 0;
    std::uint64_t generation = 0;
    {
        std::lock_guard lock(source_mutex_);
        if (!source_ || !render_active_.load(std::memory_order_acquire)) {
            return 0;
        }
        generation = render_generation_;
        frames = source_->read(buffer_.data(), buffer_frames_);
        if (frames == 0) {
            render_active_.store(false, std::memory_order_release);
        } else {
            clock_.advance(frames);
        }
    }

    if (frames == 0) {
        dispatcher_.post([this, generation] { handle_completion(generation); });
        return 0;
    }

    equalizer_.process(buffer_.data(), frames);

    const float gain = volume_.load(std::memory_order_acquire);
    if (gain != 1.0f) {
        for (std::size_t i = 0; i < frames * 2; ++i) {
            buffer_[i] *= gain;
        }
    }

    analyzer_.process(buffer_.data(), frames, 2, sample_rate_);

    if (!output_->write(buffer_.data(), frames)) {
        log_debug("Dropped a block after an output error");
    }
    return frames;
}

void Player::tick() {
    if (state_ == PlayerState::Playing) {
        if (!seeking_) {
            position_ = clamp_position(clock_.position());
        }
        analyzer_.publish();
        if (lyrics_ && loaded_track_) {
            lyric_line_ = lyrics_->line_at(*loaded_track_, position_);
        }
    } else {
        analyzer_.clear_staging();
        analyzer_.decay();
        if (analyzer_.is_silent()) {
            stop_timer();
        }
    }
    publish();
}

void Player::ensure_timer() {
    if (timer_running_) {
        return;
    }
    timer_running_ = true;
    schedule_tick();
}

void Player::schedule_tick() {
    dispatcher_.post_after(kTickInterval, [this, epoch = timer_epoch_] {
        if (!timer_running_ || epoch != timer_epoch_) {
            return;
        }
        tick();
        if (timer_running_) {
            schedule_tick();
        }
    });
}

void Player::stop_timer() {
    timer_running_ = false;
    ++timer_epoch_;
}

void Player::publish() {
    TransportState state;
    state.state = state_;
    state.playing = state_ == PlayerState::Playing;
    state.loading = loading_;
    state.position_seconds = position();
    state.duration_seconds = duration_;
    state.volume = volume();
    state.eq_gains = equalizer_.gains();
    state.spectrum = analyzer_.published();
    state.track = track_info_;
    state.lyric_line = lyric_line_;

    {
        std::lock_guard lock(snapshot_mutex_);
        snapshot_ = state;
    }

    auto observers = observers_;
    for (auto *observer : observers) {
        observer->on_transport_changed(state);
    }
}

TransportState Player::snapshot() const {
    std::lock_guard lock(snapshot_mutex_);
    return snapshot_;
}

}
