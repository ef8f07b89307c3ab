/**
 * KeywordSpotter.cpp - Keyword configuration checks and per-frame detection
 */

#include "hark/wakeword/KeywordSpotter.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace hark::wakeword {

namespace {

const char* const PLACEHOLDER_ACCESS_KEY = "your_picovoice_access_key_here";

std::string joined(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

} // namespace

struct KeywordSpotter::Impl {
    KeywordSpotterOptions options;
    std::unique_ptr<KeywordEngine> engine;
    std::vector<std::string> labels;
    bool ready = false;
    std::string lastError;

    void fail(const std::string& message) {
        lastError = message;
        std::cerr << "[KeywordSpotter] " << message << std::endl;
    }

    void initialize() {
        if (options.access_key.empty()) {
            fail("No Picovoice access key configured");
            return;
        }
        if (options.access_key == PLACEHOLDER_ACCESS_KEY) {
            fail("Access key is still the placeholder value");
            return;
        }

        KeywordEngineParams params;
        params.access_key = options.access_key;

        if (!options.keyword_paths.empty()) {
            params.keyword_paths = options.keyword_paths;
            labels = options.keyword_paths;
        } else if (!options.keywords.empty()) {
            std::vector<std::string> invalid;
            for (const auto& name : options.keywords) {
                if (isBuiltinKeyword(name)) {
                    labels.push_back(name);
                    params.keyword_paths.push_back(builtinKeywordPath(options.keyword_dir, name));
                } else {
                    invalid.push_back(name);
                }
            }
            if (!invalid.empty()) {
                std::cerr << "[KeywordSpotter] Warning: ignoring unknown built-in keywords: "
                          << joined(invalid) << std::endl;
            }
            if (labels.empty()) {
                fail("No valid built-in keywords or keyword paths provided");
                return;
            }
        } else {
            fail("Either keyword_paths or keywords must be provided");
            return;
        }

        const size_t count = params.keyword_paths.size();
        if (options.sensitivities.empty()) {
            params.sensitivities.assign(count, 0.5f);
        } else if (options.sensitivities.size() == 1) {
            params.sensitivities.assign(count, options.sensitivities.front());
        } else if (options.sensitivities.size() == count) {
            params.sensitivities = options.sensitivities;
        } else {
            fail("Got " + std::to_string(options.sensitivities.size()) + " sensitivities for "
                 + std::to_string(count) + " keywords");
            return;
        }

        for (float s : params.sensitivities) {
            if (!(s >= 0.0f && s <= 1.0f)) {
                fail("Sensitivity " + std::to_string(s) + " is outside [0, 1]");
                return;
            }
        }

        if (!options.engine_factory) {
            fail("No keyword engine factory");
            return;
        }

        try {
            engine = options.engine_factory(params);
        } catch (const std::exception& e) {
            fail(std::string("Engine construction failed: ") + e.what());
            engine.reset();
            return;
        }

        if (!engine || !engine->isReady()) {
            fail(engine ? engine->lastError() : std::string("Engine factory returned nothing"));
            engine.reset();
            return;
        }

        if (engine->sampleRate() != options.required_sample_rate) {
            fail("Engine sample rate " + std::to_string(engine->sampleRate())
                 + " Hz does not match stream rate " + std::to_string(options.required_sample_rate)
                 + " Hz (no resampling)");
            engine.reset();
            return;
        }

        if (options.required_frame_length > 0 && engine->frameLength() != options.required_frame_length) {
            fail("Engine frame length " + std::to_string(engine->frameLength())
                 + " does not match required " + std::to_string(options.required_frame_length));
            engine.reset();
            return;
        }

        ready = true;
        std::cout << "[KeywordSpotter] Ready (keywords: " << joined(labels)
                  << ", frame_length: " << engine->frameLength()
                  << ", sample_rate: " << engine->sampleRate() << ")" << std::endl;
    }
};

KeywordSpotter::KeywordSpotter(KeywordSpotterOptions options)
    : impl_(std::make_unique<Impl>())
{
    impl_->options = std::move(options);
    impl_->initialize();
}

KeywordSpotter::~KeywordSpotter() = default;

bool KeywordSpotter::isReady() const {
    return impl_->ready;
}

std::string KeywordSpotter::lastError() const {
    return impl_->lastError;
}

int KeywordSpotter::frameLength() const {
    return impl_->engine ? impl_->engine->frameLength() : 0;
}

int KeywordSpotter::sampleRate() const {
    return impl_->engine ? impl_->engine->sampleRate() : impl_->options.required_sample_rate;
}

int KeywordSpotter::process(const audio::AudioFrame& frame) {
    if (!impl_->ready) return -1;

    if (frame.size() != static_cast<size_t>(impl_->engine->frameLength())) {
        throw std::invalid_argument("frame has " + std::to_string(frame.size())
                                    + " samples, engine expects "
                                    + std::to_string(impl_->engine->frameLength()));
    }

    int index = impl_->engine->process(frame.data());
    if (index >= static_cast<int>(impl_->labels.size())) {
        std::cerr << "[KeywordSpotter] Warning: engine returned unknown keyword index " << index << std::endl;
    }
    return index;
}

std::string KeywordSpotter::keywordName(int index) const {
    if (index < 0 || index >= static_cast<int>(impl_->labels.size())) {
        return "unknown keyword";
    }
    return impl_->labels[static_cast<size_t>(index)];
}

const std::vector<std::string>& KeywordSpotter::keywordNames() const {
    return impl_->labels;
}

const std::vector<std::string>& KeywordSpotter::builtinKeywords() {
    static const std::vector<std::string> keywords = {
        "alexa", "americano", "blueberry", "bumblebee", "computer",
        "grapefruit", "grasshopper", "hey google", "hey siri", "jarvis",
        "ok google", "picovoice", "porcupine", "terminator"
    };
    return keywords;
}

bool KeywordSpotter::isBuiltinKeyword(const std::string& name) {
    const auto& all = builtinKeywords();
    return std::find(all.begin(), all.end(), name) != all.end();
}

std::string KeywordSpotter::builtinKeywordPath(const std::string& keyword_dir, const std::string& name) {
    std::string path = keyword_dir;
    if (!path.empty() && path.back() != '/') {
        path += '/';
    }
    return path + name + "_linux.ppn";
}

} // namespace hark::wakeword
