#include "audio_source.hpp"
#include "config.hpp"
#include "controller.hpp"
#include "log.hpp"
#include "portaudio_output.hpp"
#include "ui.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

void print_usage(const char *program) {
    std::cout << "Usage: " << program << " [--config FILE] [--verbose] [FILE|FOLDER|PLAYLIST.m3u]...\n";
}

}

int main(int argc, char **argv) {
    std::vector<std::filesystem::path> inputs;
    std::optional<std::filesystem::path> config_path;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config needs a file argument" << std::endl;
                return 1;
            }
            config_path = argv[++i];
        } else if (!arg.empty() && arg[0] != '-') {
            inputs.emplace_back(arg);
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    for (const auto &input : inputs) {
        if (!std::filesystem::exists(input)) {
            std::cerr << "File not found: " << input << std::endl;
            return 1;
        }
    }

    try {
        termamp::Config config = config_path ? termamp::Config(*config_path) : termamp::Config();
        if (verbose) {
            termamp::set_log_level(termamp::LogLevel::Debug);
        }
        // The terminal belongs to the UI from here on.
        if (!termamp::set_log_file(config.log_file())) {
            std::cerr << "Logging to stderr instead" << std::endl;
        }

        termamp::ControllerOptions options;
        options.player.sample_rate = config.sample_rate();
        options.player.buffer_frames = config.buffer_frames();
        options.player.volume = config.volume();
        options.worker_threads = static_cast<std::size_t>(config.worker_threads());

        termamp::Controller controller(config,
                                       std::make_unique<termamp::PortAudioOutput>(),
                                       termamp::open_audio_source,
                                       options);
        std::thread coordination([&controller] { controller.run(); });

        if (!inputs.empty()) {
            controller.submit({termamp::CommandType::AddFiles, inputs});
        }

        try {
            termamp::Ui ui(controller, config);
            ui.run();
        } catch (...) {
            controller.shutdown();
            coordination.join();
            throw;
        }

        controller.shutdown();
        coordination.join();
        if (!config.save()) {
            std::cerr << "Settings were not saved to " << config.path() << std::endl;
        }
        return 0;
    } catch (const std::exception &ex) {
        termamp::log_error(std::string("Fatal error: ") + ex.what());
        std::cerr << "Fatal error: " << ex.what() << std::endl;
    }
    return 1;
}
