/**
 * Endpointer.hpp - Decides when a captured utterance has ended
 *
 * Two independent deadlines race: silence (time since the last frame
 * that counted as sound) and phrase limit (time since capture start).
 * Whichever expires first ends the capture. This is a plain dual
 * deadline, not a statistical end-of-speech model; the sound test can be
 * swapped (see SoundDetector) without changing the deadline policy.
 */

#pragma once

#include "hark/Types.hpp"
#include "hark/audio/SoundDetector.hpp"

#include <chrono>
#include <memory>

namespace hark::audio {

enum class StopReason {
    NONE,
    SILENCE,
    PHRASE_LIMIT
};

const char* toString(StopReason reason);

class Endpointer {
public:
    using Duration = std::chrono::milliseconds;

    /** Takes ownership of the detector; nullptr selects EnergyDetector. */
    explicit Endpointer(std::unique_ptr<SoundDetector> detector = nullptr);

    /** Start a new utterance: both timestamps set to `start`. */
    void reset(TimePoint start);

    /** Update last_sound_time if the frame counts as sound. */
    void onFrame(const AudioFrame& frame, TimePoint now);

    bool shouldStop(TimePoint now,
                    Duration silence_timeout,
                    Duration phrase_limit,
                    TimePoint capture_start_time) const;

    /** Same decision as shouldStop(), reporting which deadline fired. Silence wins ties. */
    StopReason stopReason(TimePoint now,
                          Duration silence_timeout,
                          Duration phrase_limit,
                          TimePoint capture_start_time) const;

    TimePoint lastSoundTime() const { return last_sound_time_; }

    SoundDetector& detector() { return *detector_; }

private:
    std::unique_ptr<SoundDetector> detector_;
    TimePoint last_sound_time_{};
};

} // namespace hark::audio
