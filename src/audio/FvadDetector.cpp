/**
 * FvadDetector.cpp - Voice Activity Detection via libfvad
 *
 * Alternative to the energy floor for the Endpointer. Requires libfvad
 * to be installed.
 */

#include "hark/audio/FvadDetector.hpp"

#include <fvad.h>

#include <iostream>
#include <vector>

namespace hark::audio {

struct FvadDetector::Impl {
    Fvad* vad = nullptr;

    int sample_rate;
    int frame_ms;
    int frame_samples;  // Samples per libfvad sub-frame
    VADMode mode;

    std::vector<int16_t> pending;
};

FvadDetector::FvadDetector(int sample_rate, VADMode mode, int frame_ms)
    : pImpl_(std::make_unique<Impl>())
{
    pImpl_->sample_rate = sample_rate;
    pImpl_->frame_ms = frame_ms;
    pImpl_->frame_samples = (sample_rate * frame_ms) / 1000;
    pImpl_->mode = mode;

    if (frame_ms != 10 && frame_ms != 20 && frame_ms != 30) {
        std::cerr << "[FvadDetector] Invalid frame duration: " << frame_ms
                  << "ms (must be 10, 20 or 30)" << std::endl;
        return;
    }

    pImpl_->vad = fvad_new();
    if (!pImpl_->vad) {
        std::cerr << "[FvadDetector] Failed to create fvad instance" << std::endl;
        return;
    }

    if (fvad_set_sample_rate(pImpl_->vad, sample_rate) < 0) {
        std::cerr << "[FvadDetector] Invalid sample rate: " << sample_rate << std::endl;
        fvad_free(pImpl_->vad);
        pImpl_->vad = nullptr;
        return;
    }

    if (fvad_set_mode(pImpl_->vad, static_cast<int>(mode)) < 0) {
        std::cerr << "[FvadDetector] Invalid mode" << std::endl;
    }

    std::cout << "[FvadDetector] Initialized (sample_rate=" << sample_rate
              << "Hz, frame=" << frame_ms << "ms, mode=" << static_cast<int>(mode) << ")"
              << std::endl;
}

FvadDetector::~FvadDetector() {
    if (pImpl_->vad) {
        fvad_free(pImpl_->vad);
    }
}

bool FvadDetector::isReady() const {
    return pImpl_->vad != nullptr;
}

bool FvadDetector::isSound(const AudioFrame& frame) {
    if (!pImpl_->vad) return false;

    auto& pending = pImpl_->pending;
    pending.insert(pending.end(), frame.begin(), frame.end());

    const size_t step = static_cast<size_t>(pImpl_->frame_samples);
    size_t offset = 0;
    bool speech = false;

    while (pending.size() - offset >= step) {
        int result = fvad_process(pImpl_->vad, pending.data() + offset, step);
        if (result < 0) {
            std::cerr << "[FvadDetector] fvad_process failed" << std::endl;
        } else if (result == 1) {
            speech = true;
        }
        offset += step;
    }

    pending.erase(pending.begin(), pending.begin() + offset);
    return speech;
}

void FvadDetector::reset() {
    pImpl_->pending.clear();

    if (pImpl_->vad) {
        // fvad_reset also restores the default mode and rate
        fvad_reset(pImpl_->vad);
        fvad_set_sample_rate(pImpl_->vad, pImpl_->sample_rate);
        fvad_set_mode(pImpl_->vad, static_cast<int>(pImpl_->mode));
    }
}

} // namespace hark::audio
