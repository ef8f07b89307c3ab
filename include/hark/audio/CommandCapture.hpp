/**
 * CommandCapture.hpp - Accumulates the frames of one spoken command
 */

#pragma once

#include "hark/Types.hpp"
#include "hark/audio/AudioSource.hpp"
#include "hark/audio/Endpointer.hpp"

#include <cstddef>
#include <vector>

namespace hark::audio {

/**
 * Frames of one capture episode, in arrival order.
 */
struct CommandBuffer {
    std::vector<AudioFrame> frames;
    int sample_rate = 16000;

    bool empty() const { return frames.empty(); }
    size_t frameCount() const { return frames.size(); }
    size_t sampleCount() const;
    double durationSeconds() const;

    /** Concatenated int16 samples. */
    std::vector<int16_t> samples() const;

    /** Concatenated samples as float32 in [-1, 1). */
    std::vector<float> toWaveform() const;
};

class CommandCapture {
public:
    explicit CommandCapture(Endpointer& endpointer, int sample_rate = 16000);

    /** Discard any previous buffer and start a new episode at `now`. */
    void start(TimePoint now);

    /** Append the frame and forward it to the Endpointer. Ignored if not started. */
    void push(const AudioFrame& frame, TimePoint now);

    /** End the episode and hand over its buffer (possibly empty). */
    CommandBuffer finish();

    /** End the episode and drop the buffer. */
    void abort();

    bool active() const { return active_; }
    size_t frameCount() const { return buffer_.frames.size(); }
    TimePoint startTime() const { return start_time_; }

private:
    Endpointer& endpointer_;
    CommandBuffer buffer_;
    TimePoint start_time_{};
    bool active_ = false;
};

} // namespace hark::audio
