#pragma once

#include "audio_output.hpp"

#include <portaudio.h>

namespace termamp {

class PortAudioOutput : public AudioOutput {
public:
    PortAudioOutput() = default;
    ~PortAudioOutput() override;

    PortAudioOutput(const PortAudioOutput &) = delete;
    PortAudioOutput &operator=(const PortAudioOutput &) = delete;

    void open(int sample_rate, int channels, int frames_per_buffer) override;
    bool start() override;
    void stop() override;
    bool write(const float *interleaved, std::size_t frame_count) override;
    void close() override;
    bool is_running() const noexcept override { return stream_running_; }

private:
    PaStream *stream_{nullptr};
    bool pa_initialized_{false};
    bool stream_running_{false};
};

}
