#pragma once

#include "equalizer.hpp"

#include <filesystem>
#include <string>

namespace termamp {

// key=value settings in $XDG_CONFIG_HOME/termamp/config.ini. Unknown keys
// are ignored; invalid values are logged and keep their defaults.
class Config {
public:
    Config();
    explicit Config(std::filesystem::path path);

    void load();
    bool save() const;

    static std::filesystem::path default_directory();

    const std::filesystem::path &path() const noexcept { return path_; }

    float volume() const noexcept { return volume_; }
    int sample_rate() const noexcept { return sample_rate_; }
    int buffer_frames() const noexcept { return buffer_frames_; }
    int worker_threads() const noexcept { return worker_threads_; }
    bool shuffle() const noexcept { return shuffle_; }
    bool repeat() const noexcept { return repeat_; }
    const EqGains &eq_gains() const noexcept { return eq_gains_; }
    const std::string &theme() const noexcept { return theme_; }
    const std::filesystem::path &log_file() const noexcept { return log_file_; }

    void set_volume(float volume);
    void set_shuffle(bool enabled) noexcept { shuffle_ = enabled; }
    void set_repeat(bool enabled) noexcept { repeat_ = enabled; }
    void set_eq_gains(const EqGains &gains);
    void set_theme(const std::string &theme) { theme_ = theme; }

private:
    void parse_line(const std::string &line, std::size_t line_number);

    std::filesystem::path path_;
    float volume_{0.75f};
    int sample_rate_{48000};
    int buffer_frames_{1024};
    int worker_threads_{2};
    bool shuffle_{false};
    bool repeat_{false};
    EqGains eq_gains_{};
    std::string theme_{"dark"};
    std::filesystem::path log_file_;
};

}
