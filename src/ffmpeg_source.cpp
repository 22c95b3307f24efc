#include "ffmpeg_source.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
#include <libswresample/swresample.h>
}

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

namespace termamp {

namespace {

constexpr int kOutputChannels = 2;

std::string av_error_string(int code) {
    char buffer[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(code, buffer, sizeof(buffer));
    return buffer;
}

std::string metadata_value(AVDictionary *dict, const char *key) {
    AVDictionaryEntry *entry = av_dict_get(dict, key, nullptr, AV_DICT_IGNORE_SUFFIX);
    return entry ? entry->value : std::string{};
}

}

struct FfmpegSource::Impl {
    AVFormatContext *format = nullptr;
    AVCodecContext *codec = nullptr;
    SwrContext *swr = nullptr;
    AVPacket *packet = nullptr;
    AVFrame *frame = nullptr;

    int stream_index = -1;
    int output_rate = 0;
    bool input_drained = false;
    bool resampler_flushed = false;

    // Converted frames not yet handed out.
    std::vector<float> residual;
    std::size_t residual_offset = 0;

    // Output frames still to discard after a backward keyframe seek.
    std::int64_t discard_frames = 0;
    std::int64_t seek_target = -1;

    ~Impl() {
        if (frame) av_frame_free(&frame);
        if (packet) av_packet_free(&packet);
        if (swr) swr_free(&swr);
        if (codec) avcodec_free_context(&codec);
        if (format) avformat_close_input(&format);
    }

    std::size_t residual_frames() const {
        return (residual.size() - residual_offset) / kOutputChannels;
    }

    void convert_frame() {
        const int capacity = swr_get_out_samples(swr, frame->nb_samples);
        if (capacity <= 0) {
            return;
        }

        std::vector<float> converted(static_cast<std::size_t>(capacity) * kOutputChannels);
        auto *out = reinterpret_cast<std::uint8_t *>(converted.data());
        const int produced = swr_convert(swr, &out, capacity,
                                         const_cast<const std::uint8_t **>(frame->extended_data),
                                         frame->nb_samples);
        if (produced <= 0) {
            return;
        }

        if (seek_target >= 0 && frame->pts != AV_NOPTS_VALUE) {
            // First frame after a seek: drop what lies before the target.
            const AVRational tb = format->streams[stream_index]->time_base;
            const std::int64_t frame_start = av_rescale_q(frame->pts, tb, AVRational{1, output_rate});
            discard_frames = std::max<std::int64_t>(0, seek_target - frame_start);
            seek_target = -1;
        }
        append(converted, produced);
    }

    // Drains the samples swresample still holds back once the decoder is done.
    // Returns true when that left converted frames to hand out.
    bool flush_resampler() {
        if (resampler_flushed) {
            return residual_frames() > 0;
        }
        resampler_flushed = true;

        const int capacity = swr_get_out_samples(swr, 0);
        if (capacity > 0) {
            std::vector<float> converted(static_cast<std::size_t>(capacity) * kOutputChannels);
            auto *out = reinterpret_cast<std::uint8_t *>(converted.data());
            const int produced = swr_convert(swr, &out, capacity, nullptr, 0);
            if (produced > 0) {
                append(converted, produced);
            }
        }
        return residual_frames() > 0;
    }

    void append(const std::vector<float> &converted, int produced) {
        std::size_t skip = 0;
        if (discard_frames > 0) {
            skip = static_cast<std::size_t>(std::min<std::int64_t>(discard_frames, produced));
            discard_frames -= static_cast<std::int64_t>(skip);
        }

        if (residual_offset == residual.size()) {
            residual.clear();
            residual_offset = 0;
        }
        residual.insert(residual.end(),
                        converted.begin() + static_cast<std::ptrdiff_t>(skip * kOutputChannels),
                        converted.begin() + static_cast<std::ptrdiff_t>(produced) * kOutputChannels);
    }

    // Decodes packets until at least one converted frame is buffered.
    // Returns false once both demuxer and decoder are exhausted.
    bool decode_more() {
        while (true) {
            int ret = avcodec_receive_frame(codec, frame);
            if (ret == 0) {
                convert_frame();
                av_frame_unref(frame);
                if (residual_frames() > 0) {
                    return true;
                }
                continue;
            }
            if (ret != AVERROR(EAGAIN) || input_drained) {
                // End of stream or a decoder error; only the resampler tail is left.
                return flush_resampler();
            }

            ret = av_read_frame(format, packet);
            if (ret < 0) {
                input_drained = true;
                avcodec_send_packet(codec, nullptr);
                continue;
            }
            if (packet->stream_index != stream_index) {
                av_packet_unref(packet);
                continue;
            }
            ret = avcodec_send_packet(codec, packet);
            av_packet_unref(packet);
            if (ret < 0 && ret != AVERROR(EAGAIN)) {
                // Corrupt packet; keep going with the next one.
                continue;
            }
        }
    }
};

FfmpegSource::FfmpegSource(const std::filesystem::path &path, int output_rate)
    : impl_(std::make_unique<Impl>()) {
    auto &d = *impl_;
    d.output_rate = output_rate;
    const std::string location = path.string();

    int ret = avformat_open_input(&d.format, location.c_str(), nullptr, nullptr);
    if (ret < 0) {
        throw SourceError("Unable to open " + location + ": " + av_error_string(ret));
    }
    ret = avformat_find_stream_info(d.format, nullptr);
    if (ret < 0) {
        throw SourceError("No stream info in " + location + ": " + av_error_string(ret));
    }

    d.stream_index = av_find_best_stream(d.format, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (d.stream_index < 0) {
        throw SourceError("No audio stream in " + location);
    }

    AVStream *stream = d.format->streams[d.stream_index];
    const AVCodec *decoder = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!decoder) {
        throw SourceError("Unsupported codec in " + location);
    }

    d.codec = avcodec_alloc_context3(decoder);
    if (!d.codec) {
        throw SourceError("Out of memory opening " + location);
    }
    if (avcodec_parameters_to_context(d.codec, stream->codecpar) < 0) {
        throw SourceError("Bad codec parameters in " + location);
    }
    ret = avcodec_open2(d.codec, decoder, nullptr);
    if (ret < 0) {
        throw SourceError("Unable to open decoder for " + location + ": " + av_error_string(ret));
    }

    if (d.codec->ch_layout.nb_channels == 0) {
        av_channel_layout_default(&d.codec->ch_layout, 2);
    }

    AVChannelLayout out_layout;
    av_channel_layout_default(&out_layout, kOutputChannels);
    ret = swr_alloc_set_opts2(&d.swr,
                              &out_layout, AV_SAMPLE_FMT_FLT, output_rate,
                              &d.codec->ch_layout, d.codec->sample_fmt, d.codec->sample_rate,
                              0, nullptr);
    if (ret < 0 || swr_init(d.swr) < 0) {
        throw SourceError("Unable to set up resampler for " + location);
    }

    d.packet = av_packet_alloc();
    d.frame = av_frame_alloc();
    if (!d.packet || !d.frame) {
        throw SourceError("Out of memory opening " + location);
    }

    info_.sample_rate = d.codec->sample_rate;
    info_.channels = d.codec->ch_layout.nb_channels;
    info_.codec = avcodec_get_name(d.codec->codec_id);

    if (stream->duration != AV_NOPTS_VALUE) {
        info_.duration_seconds = static_cast<double>(stream->duration) * av_q2d(stream->time_base);
    } else if (d.format->duration != AV_NOPTS_VALUE) {
        info_.duration_seconds = static_cast<double>(d.format->duration) / AV_TIME_BASE;
    }

    if (d.format->bit_rate > 0) {
        info_.bitrate_kbps = static_cast<int>(d.format->bit_rate / 1000);
    } else {
        int bits = d.codec->bits_per_raw_sample > 0 ? d.codec->bits_per_raw_sample : 16;
        info_.bitrate_kbps = info_.sample_rate * info_.channels * bits / 1000;
    }

    info_.title = metadata_value(d.format->metadata, "title");
    info_.artist = metadata_value(d.format->metadata, "artist");
    if (info_.title.empty()) {
        info_.title = metadata_value(stream->metadata, "title");
    }
    if (info_.artist.empty()) {
        info_.artist = metadata_value(stream->metadata, "artist");
    }
}

FfmpegSource::~FfmpegSource() = default;

std::size_t FfmpegSource::read(float *interleaved, std::size_t frame_count) {
    auto &d = *impl_;
    std::size_t written = 0;

    while (written < frame_count) {
        if (d.residual_frames() == 0 && !d.decode_more()) {
            break;
        }
        const std::size_t take = std::min(frame_count - written, d.residual_frames());
        std::memcpy(interleaved + written * kOutputChannels,
                    d.residual.data() + d.residual_offset,
                    take * kOutputChannels * sizeof(float));
        d.residual_offset += take * kOutputChannels;
        written += take;
    }
    return written;
}

bool FfmpegSource::seek_frame(std::int64_t frame) {
    auto &d = *impl_;
    frame = std::max<std::int64_t>(0, frame);

    AVStream *stream = d.format->streams[d.stream_index];
    const std::int64_t ts = av_rescale_q(frame, AVRational{1, d.output_rate}, stream->time_base);
    if (av_seek_frame(d.format, d.stream_index, ts, AVSEEK_FLAG_BACKWARD) < 0) {
        return false;
    }

    avcodec_flush_buffers(d.codec);
    if (swr_init(d.swr) < 0) {
        return false;
    }
    d.residual.clear();
    d.residual_offset = 0;
    d.input_drained = false;
    d.resampler_flushed = false;
    d.seek_target = frame;
    d.discard_frames = 0;
    return true;
}

}
