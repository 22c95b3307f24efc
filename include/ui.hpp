#pragma once

#include "config.hpp"
#include "controller.hpp"

#include <chrono>
#include <cstddef>
#include <string>

#include <ftxui/component/event.hpp>
#include <ftxui/dom/elements.hpp>

namespace termamp {

class Ui {
public:
    Ui(Controller &controller, Config &config);
    ~Ui();

    void run();

private:
    bool handle_event(const ftxui::Event &event);
    void poll_notifications();

    ftxui::Element render();
    ftxui::Element render_now_playing() const;
    ftxui::Element render_spectrum() const;
    ftxui::Element render_equalizer() const;
    ftxui::Element render_playlist() const;
    ftxui::Element render_status_bar();
    ftxui::Element render_footer() const;

    void seek_by(double delta_seconds);
    void change_volume(float delta);
    void change_eq_gain(float delta_db);
    void set_status_message(const std::string &message,
                            std::chrono::milliseconds duration = std::chrono::milliseconds(2000));

private:
    Controller &controller_;
    Config &config_;
    bool running_{true};
    TransportState last_state_{};
    PlaylistView last_view_{};
    std::size_t selected_index_{0};
    std::size_t eq_band_{0};
    std::string status_message_;
    std::chrono::steady_clock::time_point status_message_until_{};
};

}
