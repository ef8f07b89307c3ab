/**
 * PorcupineEngine.hpp - Picovoice Porcupine keyword engine
 */

#pragma once

#include "hark/wakeword/KeywordEngine.hpp"

#include <memory>
#include <string>

namespace hark::wakeword {

class PorcupineEngine : public KeywordEngine {
public:
    /**
     * @param model_path porcupine_params.pv
     * @param params access key, .ppn keyword files and sensitivities
     */
    PorcupineEngine(const std::string& model_path, const KeywordEngineParams& params);
    ~PorcupineEngine() override;

    PorcupineEngine(const PorcupineEngine&) = delete;
    PorcupineEngine& operator=(const PorcupineEngine&) = delete;

    bool isReady() const override;
    std::string lastError() const override;
    int frameLength() const override;
    int sampleRate() const override;
    int process(const int16_t* samples) override;

    static std::string getVersion();

    /** Factory bound to a model file, for KeywordSpotterOptions::engine_factory. */
    static KeywordEngineFactory factory(const std::string& model_path);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hark::wakeword
