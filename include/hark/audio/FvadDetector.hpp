/**
 * FvadDetector.hpp - WebRTC VAD (libfvad) sound detector
 */

#pragma once

#include "hark/audio/SoundDetector.hpp"

#include <memory>

namespace hark::audio {

/**
 * Aggressiveness levels passed to fvad_set_mode
 */
enum class VADMode {
    Quality = 0,
    LowBitrate = 1,
    Aggressive = 2,
    VeryAggressive = 3
};

/**
 * Splits each frame into 10/20/30 ms sub-frames for libfvad. A frame is
 * sound if any complete sub-frame is classified as speech. Samples that
 * do not fill a sub-frame are carried over to the next call.
 */
class FvadDetector : public SoundDetector {
public:
    FvadDetector(int sample_rate = 16000, VADMode mode = VADMode::Aggressive, int frame_ms = 10);
    ~FvadDetector() override;

    FvadDetector(const FvadDetector&) = delete;
    FvadDetector& operator=(const FvadDetector&) = delete;

    bool isReady() const;

    bool isSound(const AudioFrame& frame) override;
    void reset() override;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace hark::audio
