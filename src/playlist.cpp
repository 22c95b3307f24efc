#include "playlist.hpp"

#include "log.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace termamp {

Playlist::Playlist(PlaybackTarget &target, std::uint32_t shuffle_seed)
    : target_(target), rng_(shuffle_seed) {
}

const Track *Playlist::current_track() const noexcept {
    if (current_index_ < 0 || static_cast<std::size_t>(current_index_) >= tracks_.size()) {
        return nullptr;
    }
    return &tracks_[static_cast<std::size_t>(current_index_)];
}

void Playlist::add_tracks(std::vector<Track> tracks) {
    const bool was_empty = tracks_.empty();
    tracks_.insert(tracks_.end(),
                   std::make_move_iterator(tracks.begin()),
                   std::make_move_iterator(tracks.end()));

    if (shuffle_) {
        regenerate_shuffle();
    }

    if (was_empty && !tracks_.empty()) {
        play_track(0);
    }
}

void Playlist::replace_tracks(std::vector<Track> tracks) {
    clear();
    add_tracks(std::move(tracks));
}

bool Playlist::remove_track(std::size_t index) {
    if (index >= tracks_.size()) {
        return false;
    }
    tracks_.erase(tracks_.begin() + static_cast<std::ptrdiff_t>(index));

    const int removed = static_cast<int>(index);
    if (tracks_.empty()) {
        current_index_ = -1;
        target_.stop();
    } else if (removed == current_index_) {
        current_index_ = std::min(removed, static_cast<int>(tracks_.size()) - 1);
    } else if (removed < current_index_) {
        --current_index_;
    }

    if (shuffle_) {
        regenerate_shuffle();
    }
    return true;
}

void Playlist::clear() {
    tracks_.clear();
    current_index_ = -1;
    shuffle_order_.clear();
    shuffle_cursor_ = 0;
    target_.stop();
}

bool Playlist::play_track(std::size_t index) {
    if (index >= tracks_.size()) {
        return false;
    }
    if (target_.is_loading()) {
        log_debug("Track change ignored while a load is in progress");
        return false;
    }

    current_index_ = static_cast<int>(index);
    if (shuffle_) {
        sync_shuffle_cursor();
    }
    return target_.load_track(tracks_[index]);
}

void Playlist::next() {
    if (tracks_.empty()) {
        return;
    }
    if (shuffle_) {
        next_shuffled();
    } else {
        next_sequential();
    }
}

void Playlist::previous() {
    if (tracks_.empty()) {
        return;
    }
    if (shuffle_) {
        previous_shuffled();
    } else {
        previous_sequential();
    }
}

void Playlist::next_sequential() {
    const std::size_t next_index = static_cast<std::size_t>(current_index_ + 1);
    if (next_index < tracks_.size()) {
        play_track(next_index);
    } else if (repeat_) {
        play_track(0);
    } else {
        target_.stop();
    }
}

void Playlist::next_shuffled() {
    if (shuffle_order_.empty()) {
        regenerate_shuffle();
    }

    std::size_t cursor = shuffle_cursor_ + 1;
    if (cursor >= shuffle_order_.size()) {
        if (!repeat_) {
            target_.stop();
            return;
        }
        // The fresh permutation starts with the current entry; resume just
        // past it unless it is the only one.
        regenerate_shuffle();
        cursor = shuffle_order_.size() > 1 ? 1 : 0;
    }
    play_track(shuffle_order_[cursor]);
}

void Playlist::previous_sequential() {
    std::size_t prev_index = 0;
    if (current_index_ > 0) {
        prev_index = static_cast<std::size_t>(current_index_ - 1);
    } else if (repeat_) {
        prev_index = tracks_.size() - 1;
    }
    play_track(prev_index);
}

void Playlist::previous_shuffled() {
    if (shuffle_order_.empty()) {
        regenerate_shuffle();
    }

    std::size_t cursor = 0;
    if (shuffle_cursor_ > 0) {
        cursor = shuffle_cursor_ - 1;
    } else if (repeat_) {
        cursor = shuffle_order_.size() - 1;
    } else {
        return;
    }
    play_track(shuffle_order_[cursor]);
}

bool Playlist::is_at_end() const {
    if (tracks_.empty()) {
        return true;
    }
    if (shuffle_ && !shuffle_order_.empty()) {
        return shuffle_cursor_ + 1 >= shuffle_order_.size();
    }
    return current_index_ >= 0 && static_cast<std::size_t>(current_index_) + 1 >= tracks_.size();
}

void Playlist::set_shuffle(bool enabled) {
    shuffle_ = enabled;
    if (shuffle_) {
        regenerate_shuffle();
    } else {
        shuffle_order_.clear();
        shuffle_cursor_ = 0;
    }
}

void Playlist::regenerate_shuffle() {
    std::vector<std::size_t> rest(tracks_.size());
    std::iota(rest.begin(), rest.end(), std::size_t{0});

    const bool has_current = current_index_ >= 0 && static_cast<std::size_t>(current_index_) < tracks_.size();
    if (has_current) {
        rest.erase(rest.begin() + current_index_);
    }
    std::shuffle(rest.begin(), rest.end(), rng_);

    shuffle_order_.clear();
    if (has_current) {
        shuffle_order_.push_back(static_cast<std::size_t>(current_index_));
    }
    shuffle_order_.insert(shuffle_order_.end(), rest.begin(), rest.end());
    shuffle_cursor_ = 0;
}

void Playlist::sync_shuffle_cursor() {
    auto it = std::find(shuffle_order_.begin(), shuffle_order_.end(), static_cast<std::size_t>(current_index_));
    if (it == shuffle_order_.end()) {
        regenerate_shuffle();
        return;
    }
    shuffle_cursor_ = static_cast<std::size_t>(it - shuffle_order_.begin());
}

}
