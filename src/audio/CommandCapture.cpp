/**
 * CommandCapture.cpp - Command buffer accumulation
 */

#include "hark/audio/CommandCapture.hpp"

#include <utility>

namespace hark::audio {

size_t CommandBuffer::sampleCount() const {
    size_t total = 0;
    for (const auto& frame : frames) {
        total += frame.size();
    }
    return total;
}

double CommandBuffer::durationSeconds() const {
    if (sample_rate <= 0) return 0.0;
    return static_cast<double>(sampleCount()) / sample_rate;
}

std::vector<int16_t> CommandBuffer::samples() const {
    std::vector<int16_t> out;
    out.reserve(sampleCount());
    for (const auto& frame : frames) {
        out.insert(out.end(), frame.begin(), frame.end());
    }
    return out;
}

std::vector<float> CommandBuffer::toWaveform() const {
    std::vector<float> out;
    out.reserve(sampleCount());
    for (const auto& frame : frames) {
        for (int16_t s : frame) {
            out.push_back(static_cast<float>(s) / 32768.0f);
        }
    }
    return out;
}

CommandCapture::CommandCapture(Endpointer& endpointer, int sample_rate)
    : endpointer_(endpointer)
{
    buffer_.sample_rate = sample_rate;
}

void CommandCapture::start(TimePoint now) {
    buffer_.frames.clear();
    start_time_ = now;
    endpointer_.reset(now);
    active_ = true;
}

void CommandCapture::push(const AudioFrame& frame, TimePoint now) {
    if (!active_) return;

    buffer_.frames.push_back(frame);
    endpointer_.onFrame(frame, now);
}

CommandBuffer CommandCapture::finish() {
    active_ = false;

    CommandBuffer out;
    out.sample_rate = buffer_.sample_rate;
    out.frames = std::move(buffer_.frames);
    buffer_.frames.clear();
    return out;
}

void CommandCapture::abort() {
    active_ = false;
    buffer_.frames.clear();
}

} // namespace hark::audio
