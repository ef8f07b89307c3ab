/**
 * Endpointer.cpp - Silence / phrase-limit deadline race
 */

#include "hark/audio/Endpointer.hpp"

namespace hark::audio {

const char* toString(StopReason reason) {
    switch (reason) {
        case StopReason::NONE:         return "none";
        case StopReason::SILENCE:      return "silence";
        case StopReason::PHRASE_LIMIT: return "phrase limit";
    }
    return "unknown";
}

Endpointer::Endpointer(std::unique_ptr<SoundDetector> detector)
    : detector_(detector ? std::move(detector) : std::make_unique<EnergyDetector>())
{
}

void Endpointer::reset(TimePoint start) {
    last_sound_time_ = start;
    detector_->reset();
}

void Endpointer::onFrame(const AudioFrame& frame, TimePoint now) {
    if (detector_->isSound(frame)) {
        last_sound_time_ = now;
    }
}

bool Endpointer::shouldStop(TimePoint now,
                            Duration silence_timeout,
                            Duration phrase_limit,
                            TimePoint capture_start_time) const {
    return stopReason(now, silence_timeout, phrase_limit, capture_start_time) != StopReason::NONE;
}

StopReason Endpointer::stopReason(TimePoint now,
                                  Duration silence_timeout,
                                  Duration phrase_limit,
                                  TimePoint capture_start_time) const {
    if (now - last_sound_time_ >= silence_timeout) {
        return StopReason::SILENCE;
    }
    if (now - capture_start_time >= phrase_limit) {
        return StopReason::PHRASE_LIMIT;
    }
    return StopReason::NONE;
}

} // namespace hark::audio
