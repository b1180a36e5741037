/**
 * TrackSense - Audio Decoder
 */

#ifndef TRACKSENSE_DECODER_H
#define TRACKSENSE_DECODER_H

#include "tracksense/types.h"
#include <cstdint>
#include <memory>
#include <string>

namespace tracksense {

/**
 * Audio loader that converts any FFmpeg-supported format to mono float PCM.
 * All channels are downmixed. Failures are ErrorKind::Input errors with stage "load".
 */
class Decoder {
public:
    Decoder();
    ~Decoder();

    // Non-copyable
    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    /**
     * Decode an audio file.
     *
     * @param path Path to audio file
     * @param target_sample_rate Output sample rate (0 = keep the file's rate)
     * @return AudioBuffer or error
     */
    Result<AudioBuffer> decode(const std::string& path, int target_sample_rate = 0);

    /**
     * Decode an encoded file held in memory (any container FFmpeg can probe).
     */
    Result<AudioBuffer> decode_memory(const uint8_t* data, size_t size,
                                      int target_sample_rate = 0);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tracksense

#endif // TRACKSENSE_DECODER_H
