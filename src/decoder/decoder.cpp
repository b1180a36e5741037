/**
 * TrackSense - Audio Decoder Implementation
 *
 * Uses FFmpeg for demuxing, decoding and downmix/resampling.
 */

#include "decoder.h"
#include "../core/log.h"

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/mem.h>
#include <libavutil/opt.h>
#include <libswresample/swresample.h>
}

#include <algorithm>
#include <cstring>
#include <filesystem>

namespace tracksense {

namespace {
    constexpr int kAvioBufferSize = 32768;

    ResultError load_error(std::string message) {
        return ResultError{ErrorKind::Input, "load", std::move(message)};
    }

    // Read cursor over a caller-owned byte range
    struct MemorySource {
        const uint8_t* data = nullptr;
        size_t size = 0;
        size_t pos = 0;
    };

    int read_memory(void* opaque, uint8_t* buf, int buf_size) {
        auto* src = static_cast<MemorySource*>(opaque);
        size_t remaining = src->size - src->pos;
        if (remaining == 0) return AVERROR_EOF;

        size_t count = std::min(remaining, static_cast<size_t>(buf_size));
        std::memcpy(buf, src->data + src->pos, count);
        src->pos += count;
        return static_cast<int>(count);
    }

    int64_t seek_memory(void* opaque, int64_t offset, int whence) {
        auto* src = static_cast<MemorySource*>(opaque);
        if (whence == AVSEEK_SIZE) return static_cast<int64_t>(src->size);

        int64_t base = 0;
        switch (whence & ~AVSEEK_FORCE) {
            case SEEK_SET: base = 0; break;
            case SEEK_CUR: base = static_cast<int64_t>(src->pos); break;
            case SEEK_END: base = static_cast<int64_t>(src->size); break;
            default: return -1;
        }

        int64_t target = base + offset;
        if (target < 0 || target > static_cast<int64_t>(src->size)) return -1;
        src->pos = static_cast<size_t>(target);
        return target;
    }
}

class Decoder::Impl {
public:
    Impl() = default;
    ~Impl() = default;

    Result<AudioBuffer> decode(const std::string& path, int target_sample_rate) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return load_error("File not found: " + path);
        }

        AVFormatContext* format_ctx = nullptr;
        int ret = avformat_open_input(&format_ctx, path.c_str(), nullptr, nullptr);
        if (ret < 0) {
            return load_error("Failed to open file: " + path);
        }

        // decode_stream closes format_ctx
        return decode_stream(format_ctx, target_sample_rate);
    }

    Result<AudioBuffer> decode_memory(const uint8_t* data, size_t size, int target_sample_rate) {
        if (!data || size == 0) {
            return load_error("Empty input buffer");
        }

        MemorySource source{data, size, 0};

        auto* io_buffer = static_cast<uint8_t*>(av_malloc(kAvioBufferSize));
        if (!io_buffer) {
            return load_error("Failed to allocate I/O buffer");
        }

        AVIOContext* avio = avio_alloc_context(io_buffer, kAvioBufferSize, 0, &source,
                                               &read_memory, nullptr, &seek_memory);
        if (!avio) {
            av_free(io_buffer);
            return load_error("Failed to allocate I/O context");
        }

        auto release_io = [&]() {
            av_freep(&avio->buffer);
            avio_context_free(&avio);
        };

        AVFormatContext* format_ctx = avformat_alloc_context();
        if (!format_ctx) {
            release_io();
            return load_error("Failed to allocate format context");
        }
        format_ctx->pb = avio;
        format_ctx->flags |= AVFMT_FLAG_CUSTOM_IO;

        int ret = avformat_open_input(&format_ctx, nullptr, nullptr, nullptr);
        if (ret < 0) {
            // avformat_open_input frees format_ctx on failure, custom I/O stays ours
            release_io();
            return load_error("Failed to probe in-memory audio");
        }

        auto result = decode_stream(format_ctx, target_sample_rate);
        release_io();
        return result;
    }

private:
    // Decode the first audio stream of an opened container to mono float.
    Result<AudioBuffer> decode_stream(AVFormatContext* format_ctx, int target_sample_rate) {
        AVCodecContext* codec_ctx = nullptr;
        SwrContext* swr_ctx = nullptr;
        AVPacket* packet = nullptr;
        AVFrame* frame = nullptr;
        AVChannelLayout in_ch_layout{};

        AudioBuffer buffer;

        // Cleanup helper
        auto cleanup = [&]() {
            if (frame) av_frame_free(&frame);
            if (packet) av_packet_free(&packet);
            if (swr_ctx) swr_free(&swr_ctx);
            if (codec_ctx) avcodec_free_context(&codec_ctx);
            av_channel_layout_uninit(&in_ch_layout);
            if (format_ctx) avformat_close_input(&format_ctx);
        };

        // Find stream info
        int ret = avformat_find_stream_info(format_ctx, nullptr);
        if (ret < 0) {
            cleanup();
            return load_error("Failed to find stream info");
        }

        int audio_stream_idx = av_find_best_stream(format_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
        if (audio_stream_idx < 0) {
            cleanup();
            return load_error("No audio stream found");
        }

        AVCodecParameters* codecpar = format_ctx->streams[audio_stream_idx]->codecpar;

        // Find decoder
        const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
        if (!codec) {
            cleanup();
            return load_error("Unsupported codec");
        }

        codec_ctx = avcodec_alloc_context3(codec);
        if (!codec_ctx) {
            cleanup();
            return load_error("Failed to allocate codec context");
        }

        ret = avcodec_parameters_to_context(codec_ctx, codecpar);
        if (ret < 0) {
            cleanup();
            return load_error("Failed to copy codec parameters");
        }

        ret = avcodec_open2(codec_ctx, codec, nullptr);
        if (ret < 0) {
            cleanup();
            return load_error("Failed to open codec");
        }

        // Downmix to mono at the requested (or native) rate
        int in_sample_rate = codec_ctx->sample_rate > 0 ? codec_ctx->sample_rate : 44100;
        buffer.sample_rate = target_sample_rate > 0 ? target_sample_rate : in_sample_rate;

        AVChannelLayout out_ch_layout = AV_CHANNEL_LAYOUT_MONO;
        if (codec_ctx->ch_layout.nb_channels > 0) {
            av_channel_layout_copy(&in_ch_layout, &codec_ctx->ch_layout);
        } else {
            av_channel_layout_default(&in_ch_layout, codecpar->ch_layout.nb_channels > 0 ?
                codecpar->ch_layout.nb_channels : 2);
        }

        ret = swr_alloc_set_opts2(&swr_ctx,
            &out_ch_layout,
            AV_SAMPLE_FMT_FLT,
            buffer.sample_rate,
            &in_ch_layout,
            codec_ctx->sample_fmt,
            in_sample_rate,
            0, nullptr);

        if (ret < 0 || !swr_ctx) {
            cleanup();
            return load_error("Failed to create resampler");
        }

        ret = swr_init(swr_ctx);
        if (ret < 0) {
            cleanup();
            return load_error("Failed to initialize resampler");
        }

        packet = av_packet_alloc();
        frame = av_frame_alloc();
        if (!packet || !frame) {
            cleanup();
            return load_error("Failed to allocate packet/frame");
        }

        // Estimate output size and reserve
        if (format_ctx->duration > 0) {
            int64_t duration_samples = av_rescale_q(format_ctx->duration,
                AV_TIME_BASE_Q, {1, buffer.sample_rate});
            buffer.samples.reserve(static_cast<size_t>(duration_samples));
        }

        auto convert_frame = [&]() {
            int out_samples = static_cast<int>(av_rescale_rnd(
                swr_get_delay(swr_ctx, in_sample_rate) + frame->nb_samples,
                buffer.sample_rate, in_sample_rate, AV_ROUND_UP));

            std::vector<float> out_buffer(out_samples);
            uint8_t* out_ptr = reinterpret_cast<uint8_t*>(out_buffer.data());

            int converted = swr_convert(swr_ctx,
                &out_ptr, out_samples,
                const_cast<const uint8_t**>(frame->extended_data), frame->nb_samples);

            if (converted > 0) {
                buffer.samples.insert(buffer.samples.end(),
                    out_buffer.begin(), out_buffer.begin() + converted);
            }
            av_frame_unref(frame);
        };

        // Decode loop
        int corrupt_packets = 0;
        while (av_read_frame(format_ctx, packet) >= 0) {
            if (packet->stream_index == audio_stream_idx) {
                ret = avcodec_send_packet(codec_ctx, packet);
                if (ret < 0) {
                    ++corrupt_packets;
                    av_packet_unref(packet);
                    continue;
                }

                while (avcodec_receive_frame(codec_ctx, frame) >= 0) {
                    convert_frame();
                }
            }
            av_packet_unref(packet);
        }

        // Flush decoder
        avcodec_send_packet(codec_ctx, nullptr);
        while (avcodec_receive_frame(codec_ctx, frame) >= 0) {
            convert_frame();
        }

        // Flush resampler
        int tail = swr_get_delay(swr_ctx, buffer.sample_rate);
        if (tail > 0) {
            std::vector<float> out_buffer(tail);
            uint8_t* out_ptr = reinterpret_cast<uint8_t*>(out_buffer.data());

            int converted = swr_convert(swr_ctx, &out_ptr, tail, nullptr, 0);
            if (converted > 0) {
                buffer.samples.insert(buffer.samples.end(),
                    out_buffer.begin(), out_buffer.begin() + converted);
            }
        }

        cleanup();

        if (corrupt_packets > 0) {
            TRACKSENSE_LOG_WARN("Decoder", "skipped " << corrupt_packets << " undecodable packets");
        }

        if (buffer.samples.empty()) {
            return load_error("No audio data decoded");
        }

        TRACKSENSE_LOG_DEBUG("Decoder", buffer.samples.size() << " samples at "
            << buffer.sample_rate << " Hz");
        return buffer;
    }
};

Decoder::Decoder() : impl_(std::make_unique<Impl>()) {}
Decoder::~Decoder() = default;

Result<AudioBuffer> Decoder::decode(const std::string& path, int target_sample_rate) {
    return impl_->decode(path, target_sample_rate);
}

Result<AudioBuffer> Decoder::decode_memory(const uint8_t* data, size_t size,
                                           int target_sample_rate) {
    return impl_->decode_memory(data, size, target_sample_rate);
}

} // namespace tracksense
