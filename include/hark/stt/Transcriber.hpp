/**
 * Transcriber.hpp - Turns a finished command buffer into text
 */

#pragma once

#include "hark/audio/CommandCapture.hpp"
#include "hark/stt/TranscriptionEngine.hpp"

#include <memory>
#include <string>
#include <vector>

namespace hark::stt {

class Transcriber {
public:
    // Shorter input is returned as "" without calling the engine
    static constexpr int MIN_DURATION_MS = 100;

    explicit Transcriber(std::unique_ptr<TranscriptionEngine> engine);
    ~Transcriber();

    Transcriber(const Transcriber&) = delete;
    Transcriber& operator=(const Transcriber&) = delete;

    bool isReady() const;
    int sampleRate() const;
    std::string getModelInfo() const;

    /**
     * Whitespace-trimmed text, "" for empty, too short or all-zero input.
     * Engine exceptions are not caught here.
     */
    std::string transcribe(const audio::CommandBuffer& buffer);
    std::string transcribe(const std::vector<float>& waveform);

    /** Free the engine. Later calls return "". */
    void release();

    static std::string trim(const std::string& text);

private:
    std::unique_ptr<TranscriptionEngine> engine_;
};

} // namespace hark::stt
