/**
 * SoundDetector.cpp - Energy threshold detector
 */

#include "hark/audio/SoundDetector.hpp"

#include <cmath>

namespace hark::audio {

EnergyDetector::EnergyDetector(float threshold)
    : threshold_(threshold)
{
}

bool EnergyDetector::isSound(const AudioFrame& frame) {
    return frameEnergy(frame) > threshold_;
}

float EnergyDetector::frameEnergy(const AudioFrame& frame) {
    double sum = 0.0;
    for (int16_t s : frame) {
        double x = static_cast<double>(s) / 32768.0;
        sum += x * x;
    }
    return static_cast<float>(std::sqrt(sum));
}

} // namespace hark::audio
