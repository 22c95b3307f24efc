#pragma once

#include "collaborators.hpp"
#include "track.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace termamp {

// Ordered track collection with a current index and sequencing policy.
// Drives its PlaybackTarget on every transition and answers the player's
// end-of-queue questions. Not thread-safe; lives on the coordination thread.
class Playlist : public PlaybackQueue {
public:
    explicit Playlist(PlaybackTarget &target, std::uint32_t shuffle_seed = std::random_device{}());

    void add_tracks(std::vector<Track> tracks);
    void replace_tracks(std::vector<Track> tracks);
    bool remove_track(std::size_t index);
    void clear();

    bool play_track(std::size_t index);
    void next() override;
    void previous();

    bool is_at_end() const override;
    bool repeat_enabled() const override { return repeat_; }
    void set_repeat(bool enabled) noexcept { repeat_ = enabled; }
    bool shuffle_enabled() const noexcept { return shuffle_; }
    void set_shuffle(bool enabled);

    const std::vector<Track> &tracks() const noexcept { return tracks_; }
    std::size_t size() const noexcept { return tracks_.size(); }
    bool empty() const noexcept { return tracks_.empty(); }

    // -1 when there is no current track.
    int current_index() const noexcept { return current_index_; }
    const Track *current_track() const noexcept;

    const std::vector<std::size_t> &shuffle_order() const noexcept { return shuffle_order_; }
    std::size_t shuffle_cursor() const noexcept { return shuffle_cursor_; }

private:
    void regenerate_shuffle();
    void sync_shuffle_cursor();
    void next_sequential();
    void next_shuffled();
    void previous_sequential();
    void previous_shuffled();

    PlaybackTarget &target_;
    std::vector<Track> tracks_;
    int current_index_{-1};
    bool shuffle_{false};
    bool repeat_{false};
    std::vector<std::size_t> shuffle_order_;
    std::size_t shuffle_cursor_{0};
    std::mt19937 rng_;
};

}
