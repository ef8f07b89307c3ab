/**
 * SoundDetector.hpp - Per-frame "is there sound" test used by the Endpointer
 */

#pragma once

#include "hark/audio/AudioSource.hpp"

namespace hark::audio {

class SoundDetector {
public:
    virtual ~SoundDetector() = default;

    virtual bool isSound(const AudioFrame& frame) = 0;

    /** Drop any state carried between frames. */
    virtual void reset() {}
};

/**
 * Amplitude floor: a frame is sound when the L2 norm of its samples,
 * scaled to [-1, 1], exceeds the threshold. No noise-floor calibration.
 */
class EnergyDetector : public SoundDetector {
public:
    static constexpr float DEFAULT_THRESHOLD = 0.01f;

    explicit EnergyDetector(float threshold = DEFAULT_THRESHOLD);

    bool isSound(const AudioFrame& frame) override;

    float threshold() const { return threshold_; }

    /** L2 norm of the frame with samples normalized by 32768. */
    static float frameEnergy(const AudioFrame& frame);

private:
    float threshold_;
};

} // namespace hark::audio
