/**
 * WhisperEngine.cpp - whisper.cpp transcription backend
 *
 * The ggml model stays resident for the engine's lifetime; each command is
 * decoded on its own with no carried-over prompt.
 */

#include "hark/stt/WhisperEngine.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "whisper.h"

namespace hark::stt {

namespace {

struct ContextDeleter {
    void operator()(whisper_context* ctx) const { whisper_free(ctx); }
};

using ContextPtr = std::unique_ptr<whisper_context, ContextDeleter>;

// Quiet greedy decode of a single short utterance
whisper_full_params commandDecodeParams(const std::string& language, int n_threads) {
    whisper_full_params p = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    p.language = language.c_str();
    p.n_threads = n_threads;
    p.translate = false;
    p.no_context = true;
    p.single_segment = false;
    p.suppress_blank = true;
    p.print_special = false;
    p.print_progress = false;
    p.print_realtime = false;
    p.print_timestamps = false;
    return p;
}

std::string joinSegments(whisper_context* ctx) {
    std::string joined;
    const int count = whisper_full_n_segments(ctx);
    for (int s = 0; s < count; ++s) {
        if (const char* piece = whisper_full_get_segment_text(ctx, s)) {
            joined.append(piece);
        }
    }
    return joined;
}

} // namespace

struct WhisperEngine::Impl {
    const std::string model_path;
    const std::string language;   // whisper_full_params keeps a pointer into this
    ContextPtr ctx;
    whisper_full_params decode{};

    Impl(std::string path, std::string lang, int n_threads)
        : model_path(std::move(path)), language(std::move(lang)) {
        ctx.reset(whisper_init_from_file_with_params(model_path.c_str(),
                                                     whisper_context_default_params()));
        if (!ctx) {
            std::cerr << "[WhisperEngine] Could not open model " << model_path << std::endl;
            return;
        }
        decode = commandDecodeParams(language, n_threads);
        std::cout << "[WhisperEngine] Ready: " << model_path
                  << " (lang " << language << ", " << n_threads << " threads)" << std::endl;
    }
};

WhisperEngine::WhisperEngine(const std::string& model_path, const std::string& language, int n_threads)
    : impl_(std::make_unique<Impl>(model_path, language, n_threads)) {
}

WhisperEngine::~WhisperEngine() = default;

bool WhisperEngine::isReady() const {
    return impl_ && impl_->ctx != nullptr;
}

int WhisperEngine::sampleRate() const {
    return WHISPER_SAMPLE_RATE;
}

std::string WhisperEngine::transcribe(const std::vector<float>& audio) {
    if (!isReady() || audio.empty()) {
        return "";
    }

    whisper_context* ctx = impl_->ctx.get();
    const int rc = whisper_full(ctx, impl_->decode, audio.data(), static_cast<int>(audio.size()));
    if (rc != 0) {
        throw std::runtime_error("whisper_full returned " + std::to_string(rc));
    }
    return stripAnnotations(joinSegments(ctx));
}

std::string WhisperEngine::getModelInfo() const {
    return isReady() ? "whisper (" + impl_->model_path + ")" : "Model not loaded";
}

std::string WhisperEngine::stripAnnotations(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    int depth = 0;
    for (char c : text) {
        if (c == '[') {
            ++depth;
        } else if (c == ']' && depth > 0) {
            --depth;
        } else if (depth == 0) {
            out += c;
        }
    }
    return out;
}

} // namespace hark::stt
