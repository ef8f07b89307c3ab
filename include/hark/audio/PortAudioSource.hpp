/**
 * PortAudioSource.hpp - PortAudio blocking-read microphone stream
 */

#pragma once

#include "hark/audio/AudioSource.hpp"

#include <memory>
#include <string>
#include <vector>

namespace hark::audio {

class PortAudioSource : public AudioSource {
public:
    PortAudioSource();
    ~PortAudioSource() override;

    PortAudioSource(const PortAudioSource&) = delete;
    PortAudioSource& operator=(const PortAudioSource&) = delete;

    /** Pa_Initialize. Called implicitly by open(). */
    bool initialize();

    bool open(const StreamParams& params) override;
    ReadStatus readFrame(AudioFrame& frame, std::chrono::milliseconds timeout) override;
    void close() override;
    bool isOpen() const override;
    std::string lastError() const override;

    /** Input-capable devices as "<index>: <name>", index usable as StreamParams::device. */
    static std::vector<std::string> listInputDevices();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace hark::audio
