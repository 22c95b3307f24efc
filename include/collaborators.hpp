#pragma once

#include "track.hpp"

#include <filesystem>
#include <string>

namespace termamp {

// What the playlist drives: the player's load/stop surface.
class PlaybackTarget {
public:
    virtual ~PlaybackTarget() = default;

    virtual bool load_track(const Track &track) = 0;
    virtual void stop() = 0;
    virtual bool is_loading() const = 0;
};

// What the player asks when a track runs out.
class PlaybackQueue {
public:
    virtual ~PlaybackQueue() = default;

    virtual bool is_at_end() const = 0;
    virtual bool repeat_enabled() const = 0;
    virtual void next() = 0;
};

// Grants access to user-picked files before they are opened. Sandboxed
// front-ends resolve stored permissions here. Access is held per path, not
// counted: one release ends it however often it was ensured.
class ResourceAccess {
public:
    virtual ~ResourceAccess() = default;

    virtual bool ensure_access(const std::filesystem::path &path) = 0;
    virtual void release_access(const std::filesystem::path &path) = 0;
};

class LocalResourceAccess : public ResourceAccess {
public:
    bool ensure_access(const std::filesystem::path &) override { return true; }
    void release_access(const std::filesystem::path &) override {}
};

class LyricsSource {
public:
    virtual ~LyricsSource() = default;

    // Returns the line to show at the given elapsed time, or an empty string.
    virtual std::string line_at(const Track &track, double seconds) = 0;
};

}
