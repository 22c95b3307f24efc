#include "ui.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

namespace termamp {
namespace {

struct Theme {
    ftxui::Color background;
    ftxui::Color panel;
    ftxui::Color panel_alt;
    ftxui::Color accent;
    ftxui::Color accent_soft;
    ftxui::Color border;
    ftxui::Color text;
    ftxui::Color text_dim;
    ftxui::Color success;
    ftxui::Color warning;
    ftxui::Color danger;
};

const Theme kDarkTheme{ftxui::Color::RGB(16, 18, 26),    ftxui::Color::RGB(26, 28, 38),
                       ftxui::Color::RGB(32, 34, 46),    ftxui::Color::RGB(129, 200, 190),
                       ftxui::Color::RGB(54, 57, 70),    ftxui::Color::RGB(118, 92, 199),
                       ftxui::Color::RGB(230, 230, 230), ftxui::Color::RGB(160, 164, 182),
                       ftxui::Color::RGB(124, 200, 146), ftxui::Color::RGB(230, 196, 84),
                       ftxui::Color::RGB(232, 125, 104)};

const Theme kLightTheme{ftxui::Color::RGB(240, 240, 236), ftxui::Color::RGB(228, 228, 222),
                        ftxui::Color::RGB(214, 214, 206), ftxui::Color::RGB(38, 110, 160),
                        ftxui::Color::RGB(190, 196, 204), ftxui::Color::RGB(120, 120, 140),
                        ftxui::Color::RGB(30, 30, 34),    ftxui::Color::RGB(96, 98, 110),
                        ftxui::Color::RGB(40, 140, 70),   ftxui::Color::RGB(190, 130, 20),
                        ftxui::Color::RGB(200, 60, 50)};

const Theme kCyberpunkTheme{ftxui::Color::RGB(10, 4, 20),     ftxui::Color::RGB(22, 8, 38),
                            ftxui::Color::RGB(34, 12, 56),    ftxui::Color::RGB(255, 0, 170),
                            ftxui::Color::RGB(70, 20, 90),    ftxui::Color::RGB(0, 230, 255),
                            ftxui::Color::RGB(240, 230, 255), ftxui::Color::RGB(160, 130, 200),
                            ftxui::Color::RGB(0, 255, 160),   ftxui::Color::RGB(255, 230, 0),
                            ftxui::Color::RGB(255, 50, 90)};

const Theme kRetroTheme{ftxui::Color::RGB(0, 0, 0),       ftxui::Color::RGB(8, 16, 8),
                        ftxui::Color::RGB(14, 28, 14),    ftxui::Color::RGB(60, 255, 60),
                        ftxui::Color::RGB(20, 60, 20),    ftxui::Color::RGB(40, 160, 40),
                        ftxui::Color::RGB(120, 255, 120), ftxui::Color::RGB(60, 150, 60),
                        ftxui::Color::RGB(60, 255, 60),   ftxui::Color::RGB(255, 190, 0),
                        ftxui::Color::RGB(255, 80, 40)};

const Theme &theme_for(const std::string &name) {
    if (name == "light") return kLightTheme;
    if (name == "cyberpunk") return kCyberpunkTheme;
    if (name == "retro") return kRetroTheme;
    return kDarkTheme;
}

constexpr int kSpectrumHeight = 10;
constexpr int kEqHeight = 6;
constexpr double kSeekStepSeconds = 5.0;
constexpr float kVolumeStep = 0.05f;

std::string format_time(double seconds) {
    if (!std::isfinite(seconds)) {
        seconds = 0.0;
    }
    if (seconds < 0.0) {
        seconds = 0.0;
    }
    int total = static_cast<int>(std::lround(seconds));
    int hours = total / 3600;
    int minutes = (total % 3600) / 60;
    int secs = total % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << ':' << std::setw(2) << std::setfill('0') << minutes << ':'
            << std::setw(2) << std::setfill('0') << secs;
    } else {
        oss << minutes << ':' << std::setw(2) << std::setfill('0') << secs;
    }
    return oss.str();
}

std::string format_frequency(float hz) {
    if (hz >= 1000.0f) {
        std::ostringstream oss;
        oss << static_cast<int>(hz / 1000.0f) << 'k';
        return oss.str();
    }
    return std::to_string(static_cast<int>(hz));
}

std::string format_gain(float db) {
    std::ostringstream oss;
    oss << std::showpos << static_cast<int>(std::lround(db));
    return oss.str();
}

ftxui::Color amplitude_to_color(const Theme &theme, double amplitude) {
    if (amplitude > 0.75) {
        return theme.danger;
    }
    if (amplitude > 0.45) {
        return theme.warning;
    }
    if (amplitude > 0.2) {
        return theme.accent;
    }
    return theme.text_dim;
}

ftxui::Color state_color(const Theme &theme, PlayerState state) {
    switch (state) {
        case PlayerState::Playing:
            return theme.success;
        case PlayerState::Paused:
            return theme.warning;
        default:
            return theme.text_dim;
    }
}

}

Ui::Ui(Controller &controller, Config &config)
    : controller_(controller), config_(config) {}

Ui::~Ui() = default;

void Ui::run() {
    running_ = true;
    auto screen = ftxui::ScreenInteractive::Fullscreen();
    std::atomic<bool> loop_running{true};

    auto renderer = ftxui::Renderer([&] {
        last_state_ = controller_.transport();
        last_view_ = controller_.playlist_view();
        if (!last_view_.titles.empty()) {
            selected_index_ = std::min(selected_index_, last_view_.titles.size() - 1);
        } else {
            selected_index_ = 0;
        }
        poll_notifications();
        return render();
    });

    auto component = ftxui::CatchEvent(renderer, [&](ftxui::Event event) {
        if (event == ftxui::Event::Character('q') || event == ftxui::Event::Character('Q') ||
            event == ftxui::Event::Escape) {
            running_ = false;
            loop_running = false;
            screen.Exit();
            return true;
        }
        if (handle_event(event)) {
            screen.PostEvent(ftxui::Event::Custom);
            return true;
        }
        return false;
    });

    std::thread ticker([&] {
        using namespace std::chrono_literals;
        while (loop_running.load()) {
            std::this_thread::sleep_for(50ms);
            screen.PostEvent(ftxui::Event::Custom);
        }
    });

    screen.Loop(component);

    loop_running = false;
    if (ticker.joinable()) {
        ticker.join();
    }

    running_ = false;
}

bool Ui::handle_event(const ftxui::Event &event) {
    using ftxui::Event;

    if (event == Event::Character(' ')) {
        controller_.submit({CommandType::Pause});
        set_status_message(last_state_.playing ? "Paused" : "Playing");
        return true;
    }
    if (event == Event::Character('p') || event == Event::Character('P')) {
        controller_.submit({CommandType::Play});
        return true;
    }
    if (event == Event::Character('s') || event == Event::Character('S')) {
        controller_.submit({CommandType::Stop});
        set_status_message("Stopped");
        return true;
    }
    if (event == Event::Character('n') || event == Event::Character('N')) {
        controller_.submit({CommandType::Next});
        return true;
    }
    if (event == Event::Character('b') || event == Event::Character('B')) {
        controller_.submit({CommandType::Previous});
        return true;
    }
    if (event == Event::ArrowLeft) {
        seek_by(-kSeekStepSeconds);
        return true;
    }
    if (event == Event::ArrowRight) {
        seek_by(kSeekStepSeconds);
        return true;
    }
    if (event == Event::Character('+') || event == Event::Character('=')) {
        change_volume(kVolumeStep);
        return true;
    }
    if (event == Event::Character('-') || event == Event::Character('_')) {
        change_volume(-kVolumeStep);
        return true;
    }
    if (event == Event::Character('z') || event == Event::Character('Z')) {
        controller_.submit({CommandType::ToggleShuffle});
        return true;
    }
    if (event == Event::Character('r') || event == Event::Character('R')) {
        controller_.submit({CommandType::ToggleRepeat});
        return true;
    }
    if (event == Event::ArrowUp || event == Event::Character('k')) {
        if (selected_index_ > 0) {
            --selected_index_;
        }
        return true;
    }
    if (event == Event::ArrowDown || event == Event::Character('j')) {
        if (selected_index_ + 1 < last_view_.titles.size()) {
            ++selected_index_;
        }
        return true;
    }
    if (event == Event::Return) {
        if (!last_view_.titles.empty()) {
            Command command{CommandType::PlayTrack};
            command.index = selected_index_;
            controller_.submit(std::move(command));
        }
        return true;
    }
    if (event == Event::Character('d') || event == Event::Character('D') || event == Event::Delete) {
        if (!last_view_.titles.empty()) {
            Command command{CommandType::RemoveTrack};
            command.index = selected_index_;
            controller_.submit(std::move(command));
            set_status_message("Removed " + last_view_.titles[selected_index_]);
        }
        return true;
    }
    if (event == Event::Character('c') || event == Event::Character('C')) {
        controller_.submit({CommandType::ClearPlaylist});
        return true;
    }
    if (event == Event::Character('w') || event == Event::Character('W')) {
        Command command{CommandType::SavePlaylist};
        command.paths.emplace_back("playlist.m3u");
        controller_.submit(std::move(command));
        return true;
    }
    if (event == Event::Character('[')) {
        change_eq_gain(-1.0f);
        return true;
    }
    if (event == Event::Character(']')) {
        change_eq_gain(1.0f);
        return true;
    }
    if (event.is_character()) {
        const std::string &ch = event.character();
        if (ch.size() == 1 && ch[0] >= '0' && ch[0] <= '9') {
            eq_band_ = ch[0] == '0' ? 9 : static_cast<std::size_t>(ch[0] - '1');
            set_status_message("EQ band " + format_frequency(kEqFrequencies[eq_band_]) + " Hz");
            return true;
        }
    }
    return false;
}

void Ui::poll_notifications() {
    auto messages = controller_.take_notifications();
    if (!messages.empty()) {
        set_status_message(messages.back(), std::chrono::milliseconds(3000));
    }
}

void Ui::seek_by(double delta_seconds) {
    if (last_state_.state == PlayerState::Empty) {
        return;
    }
    const double target = std::max(0.0, last_state_.position_seconds + delta_seconds);
    Command command{CommandType::Seek};
    command.value = target;
    controller_.submit(std::move(command));
    set_status_message("Seek " + format_time(target));
}

void Ui::change_volume(float delta) {
    float volume = std::clamp(last_state_.volume + delta, 0.0f, 1.0f);
    last_state_.volume = volume;
    Command command{CommandType::SetVolume};
    command.value = volume;
    controller_.submit(std::move(command));

    std::ostringstream oss;
    oss << "Volume: " << static_cast<int>(std::round(volume * 100)) << "%";
    set_status_message(oss.str());
}

void Ui::change_eq_gain(float delta_db) {
    float gain = std::clamp(last_state_.eq_gains[eq_band_] + delta_db, -kEqMaxGainDb, kEqMaxGainDb);
    last_state_.eq_gains[eq_band_] = gain;
    Command command{CommandType::SetEqBand};
    command.index = eq_band_;
    command.value = gain;
    controller_.submit(std::move(command));
    set_status_message("EQ " + format_frequency(kEqFrequencies[eq_band_]) + " Hz " + format_gain(gain) + " dB");
}

ftxui::Element Ui::render() {
    using namespace ftxui;
    const Theme &theme = theme_for(config_.theme());

    auto header = hbox({render_now_playing() | xflex, render_spectrum()});
    auto middle = hbox({render_playlist() | flex, render_equalizer()}) | flex;

    return vbox({header, middle, separator(), render_status_bar(), render_footer()}) |
           bgcolor(theme.background) | color(theme.text) | flex;
}

ftxui::Element Ui::render_now_playing() const {
    using namespace ftxui;
    const Theme &theme = theme_for(config_.theme());
    const TransportState &state = last_state_;

    auto title_line = hbox({text("termamp") | bold | color(theme.accent), filler(),
                            text(to_string(state.state)) | bold | color(state_color(theme, state.state))});

    std::vector<std::vector<Element>> grid_rows;
    if (state.track) {
        const TrackInfo &info = *state.track;
        std::string format_info = info.codec.empty() ? "?" : info.codec;
        if (info.bitrate_kbps > 0) {
            format_info += " • " + std::to_string(info.bitrate_kbps) + " kbps";
        }
        if (info.sample_rate > 0) {
            format_info += " • " + std::to_string(info.sample_rate) + " Hz";
        }
        if (info.channels > 0) {
            format_info += " • " + std::to_string(info.channels) + "ch";
        }

        grid_rows.push_back({text("Title  ") | color(theme.text_dim), text(info.title) | bold | color(theme.accent)});
        if (!info.artist.empty()) {
            grid_rows.push_back({text("Artist ") | color(theme.text_dim), text(info.artist) | bold});
        }
        grid_rows.push_back({text("Format ") | color(theme.text_dim), text(format_info)});
        grid_rows.push_back({text("File   ") | color(theme.text_dim),
                             text(info.path.filename().string()) | color(theme.text_dim)});
    } else if (state.loading) {
        grid_rows.push_back({text("Loading…") | color(theme.text_dim)});
    } else {
        grid_rows.push_back({text("No track loaded") | color(theme.text_dim) | dim});
    }

    Elements content = {title_line, separatorLight(), gridbox(grid_rows), filler()};
    if (!state.lyric_line.empty()) {
        content.push_back(separatorLight());
        content.push_back(text("♪ " + state.lyric_line) | color(theme.warning));
    }

    auto body = vbox(std::move(content)) | bgcolor(theme.panel) | color(theme.text);
    return window(text(" Now Playing ") | color(theme.accent), body) | color(theme.border);
}

ftxui::Element Ui::render_spectrum() const {
    using namespace ftxui;
    const Theme &theme = theme_for(config_.theme());

    const int bar_width = 2;
    const int separator_width = 1;
    const int bucket_count = static_cast<int>(kSpectrumBands);
    const int total_width = bucket_count * bar_width + (bucket_count - 1) * separator_width;

    Elements bars_elements;
    bars_elements.reserve(kSpectrumBands * 2);
    for (std::size_t index = 0; index < kSpectrumBands; ++index) {
        double level = std::clamp(static_cast<double>(last_state_.spectrum[index]), 0.0, 1.0);
        bars_elements.push_back(gaugeUp(static_cast<float>(level)) |
                                size(WIDTH, EQUAL, bar_width) |
                                size(HEIGHT, EQUAL, kSpectrumHeight) |
                                color(amplitude_to_color(theme, level)) |
                                bgcolor(theme.panel_alt));
        if (index + 1 < kSpectrumBands) {
            bars_elements.push_back(separator() | size(WIDTH, EQUAL, separator_width) | color(theme.panel));
        }
    }

    auto bars = hbox(std::move(bars_elements)) | bgcolor(theme.panel) |
                size(HEIGHT, EQUAL, kSpectrumHeight);
    return window(text(" Spectrum ") | color(theme.accent), bars) |
           color(theme.border) | size(WIDTH, EQUAL, total_width + 2);
}

ftxui::Element Ui::render_equalizer() const {
    using namespace ftxui;
    const Theme &theme = theme_for(config_.theme());

    Elements columns;
    for (std::size_t band = 0; band < kEqBandCount; ++band) {
        const float gain = last_state_.eq_gains[band];
        const float ratio = (gain + kEqMaxGainDb) / (2.0f * kEqMaxGainDb);
        const bool selected = band == eq_band_;

        auto gauge = gaugeUp(ratio) | size(WIDTH, EQUAL, 2) | size(HEIGHT, EQUAL, kEqHeight) |
                     color(selected ? theme.accent : theme.text_dim) |
                     bgcolor(selected ? theme.accent_soft : theme.panel_alt);
        auto label = text(format_frequency(kEqFrequencies[band])) | center;
        auto value = text(format_gain(gain)) | center | color(selected ? theme.accent : theme.text_dim);
        if (selected) {
            label = label | bold | color(theme.accent);
        }
        columns.push_back(vbox({hbox({filler(), gauge, filler()}), label, value}) | size(WIDTH, EQUAL, 4));
    }

    auto body = hbox(std::move(columns)) | bgcolor(theme.panel);
    return window(text(" Equalizer ") | color(theme.accent), body) | color(theme.border);
}

ftxui::Element Ui::render_playlist() const {
    using namespace ftxui;
    const Theme &theme = theme_for(config_.theme());

    Elements rows;
    if (last_view_.titles.empty()) {
        rows.push_back(text("Playlist is empty. Pass files, folders or .m3u playlists on the command line.") |
                       color(theme.text_dim) | dim);
    }
    for (std::size_t i = 0; i < last_view_.titles.size(); ++i) {
        const bool current = static_cast<int>(i) == last_view_.current_index;
        std::ostringstream oss;
        oss << std::setw(3) << (i + 1) << ". ";
        auto row = hbox({text(current ? "▶ " : "  ") | color(theme.success),
                         text(oss.str()) | color(theme.text_dim),
                         text(last_view_.titles[i]) | (current ? bold : nothing)});
        if (current) {
            row = row | color(theme.accent);
        }
        if (i == selected_index_) {
            row = row | inverted | focus;
        }
        rows.push_back(row);
    }

    std::string flags = std::string(last_view_.shuffle ? " shuffle" : "") + (last_view_.repeat ? " repeat" : "");
    auto title = hbox({text(" Playlist (" + std::to_string(last_view_.titles.size()) + ")") | color(theme.accent),
                       text(flags + " ") | color(theme.warning)});

    auto body = vbox(std::move(rows)) | vscroll_indicator | frame | bgcolor(theme.panel);
    return window(title, body) | color(theme.border);
}

ftxui::Element Ui::render_status_bar() {
    using namespace ftxui;
    const Theme &theme = theme_for(config_.theme());

    auto now = std::chrono::steady_clock::now();
    if (!status_message_.empty() && now >= status_message_until_) {
        status_message_.clear();
    }

    std::string message = status_message_.empty() ? "Ready" : status_message_;

    double duration = std::max(0.0, last_state_.duration_seconds);
    double position = std::max(0.0, last_state_.position_seconds);
    double progress_ratio = duration > 0.0 ? std::clamp(position / duration, 0.0, 1.0) : 0.0;
    std::string time_label = format_time(position) + " / " + format_time(duration);

    float volume = last_state_.volume;
    int volume_percent = static_cast<int>(std::round(volume * 100));
    std::string volume_icon = volume == 0.0f ? "🔇" : (volume < 0.33f ? "🔈" : (volume < 0.66f ? "🔉" : "🔊"));
    std::string volume_label = volume_icon + " " + std::to_string(volume_percent) + "%";

    auto left = text(message) | color(theme.text_dim);
    auto progress_bar = gaugeRight(static_cast<float>(progress_ratio)) | color(theme.accent) | bgcolor(theme.panel_alt) | flex;
    auto center = hbox({progress_bar, text("  "), text(time_label) | color(theme.text_dim)}) | flex;
    auto right = hbox({
        text(volume_label) | color(theme.text_dim),
        text("  "),
        text(to_string(last_state_.state)) | color(state_color(theme, last_state_.state)) | bold
    });

    return hbox({left, text("  "), center, text("  "), right}) | bgcolor(theme.panel_alt) | color(theme.text);
}

ftxui::Element Ui::render_footer() const {
    using namespace ftxui;
    const Theme &theme = theme_for(config_.theme());
    auto shortcuts = text("Space Pause  P Play  S Stop  N/B Next/Prev  ←/→ ±5s  +/- Volume  Z Shuffle  R Repeat  "
                          "↑/↓ Select  Enter Play  D Remove  C Clear  W Save  1-0 EQ band  [/] EQ gain  Q Quit") |
                     color(theme.text_dim) | dim;
    return hbox({shortcuts}) | bgcolor(theme.background) | color(theme.text);
}

void Ui::set_status_message(const std::string &message, std::chrono::milliseconds duration) {
    status_message_ = message;
    status_message_until_ = std::chrono::steady_clock::now() + duration;
}

}
