/**
 * PorcupineEngine.cpp - Porcupine wake word detection
 */

#include "hark/wakeword/PorcupineEngine.hpp"

#include <iostream>
#include <vector>

// Porcupine C API
extern "C" {
#include "pv_porcupine.h"
}

namespace hark::wakeword {

struct PorcupineEngine::Impl {
    pv_porcupine_t* porcupine = nullptr;
    int frame_length = 512;
    int sample_rate = 16000;
    bool ready = false;
    std::string lastError;

    Impl(const std::string& model_path, const KeywordEngineParams& params) {
        if (params.keyword_paths.empty()) {
            lastError = "No keyword paths provided";
            std::cerr << "[Porcupine] " << lastError << std::endl;
            return;
        }

        // Prepare C-style arrays
        std::vector<const char*> kw_paths;
        for (const auto& p : params.keyword_paths) {
            kw_paths.push_back(p.c_str());
        }

        std::vector<float> sens = params.sensitivities;
        if (sens.size() != params.keyword_paths.size()) {
            sens.assign(params.keyword_paths.size(), 0.5f);
        }

        pv_status_t status = pv_porcupine_init(
            params.access_key.c_str(),
            model_path.c_str(),
            "cpu",  // device
            static_cast<int32_t>(params.keyword_paths.size()),
            kw_paths.data(),
            sens.data(),
            &porcupine
        );

        if (status != PV_STATUS_SUCCESS) {
            lastError = std::string("Failed to initialize Porcupine: ") + pv_status_to_string(status);
            std::cerr << "[Porcupine] " << lastError << std::endl;
            porcupine = nullptr;
            return;
        }

        frame_length = pv_porcupine_frame_length();
        sample_rate = pv_sample_rate();
        ready = true;

        std::cout << "[Porcupine] Initialized (version: "
                  << pv_porcupine_version()
                  << ", frame_length: " << frame_length
                  << ", sample_rate: " << sample_rate << ")" << std::endl;
    }

    ~Impl() {
        if (porcupine) {
            pv_porcupine_delete(porcupine);
        }
    }

    int process(const int16_t* samples) {
        if (!ready || !porcupine) return -1;

        int32_t keyword_index = -1;
        pv_status_t status = pv_porcupine_process(porcupine, samples, &keyword_index);

        if (status != PV_STATUS_SUCCESS) {
            std::cerr << "[Porcupine] Process error: " << pv_status_to_string(status) << std::endl;
            return -1;
        }

        return keyword_index;
    }
};

PorcupineEngine::PorcupineEngine(const std::string& model_path, const KeywordEngineParams& params)
    : impl_(std::make_unique<Impl>(model_path, params)) {
}

PorcupineEngine::~PorcupineEngine() = default;

bool PorcupineEngine::isReady() const {
    return impl_->ready;
}

std::string PorcupineEngine::lastError() const {
    return impl_->lastError;
}

int PorcupineEngine::frameLength() const {
    return impl_->frame_length;
}

int PorcupineEngine::sampleRate() const {
    return impl_->sample_rate;
}

int PorcupineEngine::process(const int16_t* samples) {
    return impl_->process(samples);
}

std::string PorcupineEngine::getVersion() {
    return pv_porcupine_version();
}

KeywordEngineFactory PorcupineEngine::factory(const std::string& model_path) {
    return [model_path](const KeywordEngineParams& params) -> std::unique_ptr<KeywordEngine> {
        return std::make_unique<PorcupineEngine>(model_path, params);
    };
}

} // namespace hark::wakeword
