#include "portaudio_output.hpp"

#include "log.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <unistd.h>

namespace termamp {

namespace {

// PortAudio probes every host API on initialisation and prints ALSA/JACK
// noise to stderr, which would corrupt the terminal UI.
class SuppressStderr {
public:
    SuppressStderr() {
        fflush(stderr);
        old_stderr_ = dup(STDERR_FILENO);
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }
    }

    ~SuppressStderr() {
        fflush(stderr);
        if (old_stderr_ >= 0) {
            dup2(old_stderr_, STDERR_FILENO);
            ::close(old_stderr_);
        }
    }

private:
    int old_stderr_;
};

}

PortAudioOutput::~PortAudioOutput() {
    close();
}

void PortAudioOutput::open(int sample_rate, int channels, int frames_per_buffer) {
    close();

    PaError err;
    {
        SuppressStderr suppress;
        err = Pa_Initialize();
    }
    if (err != paNoError) {
        throw std::runtime_error(std::string("Failed to initialize PortAudio: ") + Pa_GetErrorText(err));
    }
    pa_initialized_ = true;

    err = Pa_OpenDefaultStream(&stream_, 0, channels, paFloat32, sample_rate,
                               static_cast<unsigned long>(frames_per_buffer), nullptr, nullptr);
    if (err != paNoError) {
        stream_ = nullptr;
        Pa_Terminate();
        pa_initialized_ = false;
        throw std::runtime_error(std::string("Failed to open PortAudio stream: ") + Pa_GetErrorText(err));
    }
}

bool PortAudioOutput::start() {
    if (!stream_) {
        return false;
    }
    if (stream_running_) {
        return true;
    }
    PaError err = Pa_StartStream(stream_);
    if (err != paNoError && err != paStreamIsNotStopped) {
        log_error(std::string("PortAudio start error: ") + Pa_GetErrorText(err));
        return false;
    }
    stream_running_ = true;
    return true;
}

void PortAudioOutput::stop() {
    if (!stream_ || !stream_running_) {
        return;
    }
    PaError err = Pa_StopStream(stream_);
    if (err != paNoError && err != paStreamIsStopped) {
        log_error(std::string("PortAudio stop error: ") + Pa_GetErrorText(err));
    }
    stream_running_ = false;
}

bool PortAudioOutput::write(const float *interleaved, std::size_t frame_count) {
    if (!stream_) {
        return false;
    }
    PaError err = Pa_WriteStream(stream_, interleaved, static_cast<unsigned long>(frame_count));
    if (err != paNoError && err != paOutputUnderflowed) {
        log_error(std::string("PortAudio error: ") + Pa_GetErrorText(err));
        return false;
    }
    return true;
}

void PortAudioOutput::close() {
    stop();
    if (stream_) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }
    if (pa_initialized_) {
        Pa_Terminate();
        pa_initialized_ = false;
    }
}

}
