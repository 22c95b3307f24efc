#include "config.hpp"

#include "log.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

namespace termamp {

namespace {

std::string trimmed(std::string text) {
    text.erase(0, text.find_first_not_of(" \t\r\n"));
    text.erase(text.find_last_not_of(" \t\r\n") + 1);
    return text;
}

bool parse_bool(const std::string &value, bool &out) {
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        out = true;
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parse_number(const std::string &value, double &out) {
    try {
        std::size_t consumed = 0;
        out = std::stod(value, &consumed);
        return consumed == value.size();
    } catch (const std::exception &) {
        return false;
    }
}

}

Config::Config()
    : path_(default_directory() / "config.ini") {
    log_file_ = default_directory() / "termamp.log";
    load();
}

Config::Config(std::filesystem::path path)
    : path_(std::move(path)) {
    log_file_ = path_.parent_path() / "termamp.log";
    load();
}

std::filesystem::path Config::default_directory() {
    const char *xdg_config = std::getenv("XDG_CONFIG_HOME");
    std::filesystem::path config_dir;

    if (xdg_config && strlen(xdg_config) > 0) {
        config_dir = xdg_config;
    } else {
        const char *home = std::getenv("HOME");
        if (!home || strlen(home) == 0) {
            return std::filesystem::current_path();
        }
        config_dir = std::filesystem::path(home) / ".config";
    }
    return config_dir / "termamp";
}

void Config::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return;
    }

    std::ifstream file(path_);
    if (!file) {
        log_warning("Unable to read config file: " + path_.string());
        return;
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(file, line)) {
        parse_line(line, ++line_number);
    }
}

void Config::parse_line(const std::string &raw, std::size_t line_number) {
    const std::string line = trimmed(raw);
    if (line.empty() || line[0] == '#' || line[0] == ';') {
        return;
    }

    auto pos = line.find('=');
    if (pos == std::string::npos) {
        log_warning("config.ini:" + std::to_string(line_number) + ": expected key=value");
        return;
    }

    const std::string key = trimmed(line.substr(0, pos));
    const std::string value = trimmed(line.substr(pos + 1));
    auto invalid = [&] {
        log_warning("config.ini:" + std::to_string(line_number) + ": ignoring invalid " + key + " '" + value + "'");
    };

    double number = 0.0;
    if (key == "volume") {
        if (parse_number(value, number)) {
            volume_ = std::clamp(static_cast<float>(number), 0.0f, 1.0f);
        } else {
            invalid();
        }
    } else if (key == "sample_rate") {
        if (parse_number(value, number) && number >= 8000.0 && number <= 384000.0) {
            sample_rate_ = static_cast<int>(number);
        } else {
            invalid();
        }
    } else if (key == "buffer_frames") {
        if (parse_number(value, number) && number >= 256.0) {
            buffer_frames_ = std::min(static_cast<int>(number), 16384);
        } else {
            invalid();
        }
    } else if (key == "worker_threads") {
        if (parse_number(value, number) && number >= 1.0) {
            worker_threads_ = std::min(static_cast<int>(number), 16);
        } else {
            invalid();
        }
    } else if (key == "shuffle") {
        if (!parse_bool(value, shuffle_)) {
            invalid();
        }
    } else if (key == "repeat") {
        if (!parse_bool(value, repeat_)) {
            invalid();
        }
    } else if (key == "eq") {
        EqGains gains{};
        std::istringstream stream(value);
        std::string item;
        std::size_t band = 0;
        bool ok = true;
        while (std::getline(stream, item, ',')) {
            if (band >= kEqBandCount || !parse_number(trimmed(item), number)) {
                ok = false;
                break;
            }
            gains[band++] = std::clamp(static_cast<float>(number), -kEqMaxGainDb, kEqMaxGainDb);
        }
        if (ok && band == kEqBandCount) {
            eq_gains_ = gains;
        } else {
            invalid();
        }
    } else if (key == "theme") {
        theme_ = value;
    } else if (key == "log_file") {
        if (!value.empty()) {
            log_file_ = value;
        }
    }
}

void Config::set_volume(float volume) {
    volume_ = std::clamp(volume, 0.0f, 1.0f);
}

void Config::set_eq_gains(const EqGains &gains) {
    for (std::size_t i = 0; i < kEqBandCount; ++i) {
        eq_gains_[i] = std::clamp(gains[i], -kEqMaxGainDb, kEqMaxGainDb);
    }
}

bool Config::save() const {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    std::ofstream file(path_);
    if (!file) {
        log_error("Failed to save config to: " + path_.string());
        return false;
    }

    file << "# termamp configuration\n";
    file << "# Volume (0.0 - 1.0)\n";
    file << "volume=" << volume_ << "\n";
    file << "\n";
    file << "# Output stream\n";
    file << "sample_rate=" << sample_rate_ << "\n";
    file << "buffer_frames=" << buffer_frames_ << "\n";
    file << "worker_threads=" << worker_threads_ << "\n";
    file << "\n";
    file << "shuffle=" << (shuffle_ ? "true" : "false") << "\n";
    file << "repeat=" << (repeat_ ? "true" : "false") << "\n";
    file << "\n";
    file << "# Equalizer gains in dB for 60, 170, 310, 600, 1k, 3k, 6k, 12k, 14k, 16k Hz\n";
    file << "eq=";
    for (std::size_t i = 0; i < kEqBandCount; ++i) {
        file << (i ? "," : "") << eq_gains_[i];
    }
    file << "\n";
    file << "\n";
    file << "# Theme (dark, light, cyberpunk, retro)\n";
    file << "theme=" << theme_ << "\n";
    file << "log_file=" << log_file_.string() << "\n";

    if (!file) {
        log_error("Error writing config to: " + path_.string());
        return false;
    }
    return true;
}

}
