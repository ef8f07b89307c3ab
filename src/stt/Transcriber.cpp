/**
 * Transcriber.cpp - Owned transcription handle
 */

#include "hark/stt/Transcriber.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace hark::stt {

Transcriber::Transcriber(std::unique_ptr<TranscriptionEngine> engine)
    : engine_(std::move(engine))
{
}

Transcriber::~Transcriber() = default;

bool Transcriber::isReady() const {
    return engine_ && engine_->isReady();
}

int Transcriber::sampleRate() const {
    return engine_ ? engine_->sampleRate() : 0;
}

std::string Transcriber::getModelInfo() const {
    return engine_ ? engine_->getModelInfo() : "released";
}

std::string Transcriber::transcribe(const audio::CommandBuffer& buffer) {
    if (buffer.empty()) {
        return "";
    }
    if (engine_ && buffer.sample_rate != engine_->sampleRate()) {
        throw std::invalid_argument("buffer sample rate " + std::to_string(buffer.sample_rate)
                                    + " Hz, engine expects " + std::to_string(engine_->sampleRate()) + " Hz");
    }
    return transcribe(buffer.toWaveform());
}

std::string Transcriber::transcribe(const std::vector<float>& waveform) {
    if (!isReady()) {
        return "";
    }

    const size_t min_samples = static_cast<size_t>(engine_->sampleRate()) * MIN_DURATION_MS / 1000;
    if (waveform.size() < min_samples) {
        std::cout << "[Transcriber] Input too short (" << waveform.size() << " samples), skipping" << std::endl;
        return "";
    }

    bool silent = std::all_of(waveform.begin(), waveform.end(), [](float s) { return s == 0.0f; });
    if (silent) {
        return "";
    }

    return trim(engine_->transcribe(waveform));
}

void Transcriber::release() {
    if (engine_) {
        std::cout << "[Transcriber] Releasing " << engine_->getModelInfo() << std::endl;
        engine_.reset();
    }
}

std::string Transcriber::trim(const std::string& text) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    auto begin = std::find_if_not(text.begin(), text.end(), is_space);
    auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();

    if (begin >= end) {
        return "";
    }
    return std::string(begin, end);
}

} // namespace hark::stt
