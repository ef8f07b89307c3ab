/**
 * AudioSource.hpp - Exclusive microphone input stream
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace hark::audio {

using AudioFrame = std::vector<int16_t>;

struct StreamParams {
    int sample_rate = 16000;
    int channels = 1;
    int frame_length = 512;   // Samples per read
    int device = -1;          // -1 = default input device
};

enum class ReadStatus {
    OK,
    OVERRUN,        // Frame is valid but the device dropped input before it
    TIMED_OUT,
    DEVICE_ERROR
};

/**
 * Single mono int16 input stream. Only one stream may be open per source;
 * open() on an open source fails.
 */
class AudioSource {
public:
    virtual ~AudioSource() = default;

    /**
     * Open and start the stream.
     * @return false if the device is missing, busy or access is denied
     */
    virtual bool open(const StreamParams& params) = 0;

    /**
     * Read exactly params.frame_length samples into frame.
     * Blocks at most `timeout`.
     */
    virtual ReadStatus readFrame(AudioFrame& frame, std::chrono::milliseconds timeout) = 0;

    /** Stop and close the stream. No-op if not open. */
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    virtual std::string lastError() const = 0;
};

} // namespace hark::audio
