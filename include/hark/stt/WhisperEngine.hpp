/**
 * WhisperEngine.hpp - whisper.cpp transcription engine
 */

#pragma once

#include "hark/stt/TranscriptionEngine.hpp"

#include <memory>
#include <string>

namespace hark::stt {

class WhisperEngine : public TranscriptionEngine {
public:
    /**
     * Load the model. Check isReady() afterwards.
     * @param model_path ggml model file
     * @param language ISO code, or "auto"
     * @param n_threads inference threads
     */
    explicit WhisperEngine(const std::string& model_path,
                           const std::string& language = "en",
                           int n_threads = 4);
    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    bool isReady() const override;
    int sampleRate() const override;
    std::string transcribe(const std::vector<float>& audio) override;
    std::string getModelInfo() const override;

    /** Remove bracketed non-speech markers such as [BLANK_AUDIO]. */
    static std::string stripAnnotations(const std::string& text);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hark::stt
