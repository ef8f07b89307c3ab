/**
 * TranscriptionEngine.hpp - Pluggable speech-to-text model
 */

#pragma once

#include <string>
#include <vector>

namespace hark::stt {

class TranscriptionEngine {
public:
    virtual ~TranscriptionEngine() = default;

    virtual bool isReady() const = 0;

    /** Rate the waveform passed to transcribe() must have. */
    virtual int sampleRate() const = 0;

    /**
     * @param audio mono float32 samples in [-1, 1]
     * @throws std::runtime_error on model failure
     */
    virtual std::string transcribe(const std::vector<float>& audio) = 0;

    virtual std::string getModelInfo() const = 0;
};

} // namespace hark::stt
