#pragma once

#include <cstddef>

namespace termamp {

// Blocking stereo float output stream. open() throws std::runtime_error;
// the other calls report failure through their return values so the render
// thread never sees an exception.
class AudioOutput {
public:
    virtual ~AudioOutput() = default;

    virtual void open(int sample_rate, int channels, int frames_per_buffer) = 0;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool write(const float *interleaved, std::size_t frame_count) = 0;
    virtual void close() = 0;
    virtual bool is_running() const noexcept = 0;
};

}
