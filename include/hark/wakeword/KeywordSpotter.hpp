/**
 * KeywordSpotter.hpp - Validated front end for a keyword engine
 *
 * Configuration problems (credential, keyword names, sensitivities,
 * sample-rate mismatch, engine construction failure) never throw: the
 * spotter comes up with isReady() == false and lastError() set, and the
 * wake-word feature stays disabled.
 */

#pragma once

#include "hark/Types.hpp"
#include "hark/audio/AudioSource.hpp"
#include "hark/wakeword/KeywordEngine.hpp"

#include <memory>
#include <string>
#include <vector>

namespace hark::wakeword {

struct KeywordSpotterOptions {
    std::string access_key;

    // Custom .ppn files take precedence over built-in names
    std::vector<std::string> keyword_paths;
    std::vector<std::string> keywords;

    // One value per keyword, or a single value applied to all
    std::vector<float> sensitivities{0.5f};

    // Directory holding the built-in <name>_linux.ppn files
    std::string keyword_dir;

    // Sample rate the audio stream will run at; the engine must match
    int required_sample_rate = 16000;

    // 0 = accept the engine's frame length
    int required_frame_length = 0;

    KeywordEngineFactory engine_factory;
};

struct DetectionEvent {
    int keyword_index = -1;
    std::string keyword;
    TimePoint timestamp{};
};

class KeywordSpotter {
public:
    explicit KeywordSpotter(KeywordSpotterOptions options);
    ~KeywordSpotter();

    KeywordSpotter(const KeywordSpotter&) = delete;
    KeywordSpotter& operator=(const KeywordSpotter&) = delete;

    bool isReady() const;
    std::string lastError() const;

    int frameLength() const;
    int sampleRate() const;

    /**
     * @return keyword index, or -1. -1 also when not ready.
     * @throws std::invalid_argument if the frame length is wrong
     */
    int process(const audio::AudioFrame& frame);

    /** Built-in name or keyword file the index refers to. */
    std::string keywordName(int index) const;

    /** Labels in engine order. */
    const std::vector<std::string>& keywordNames() const;

    /** Built-in keywords shipped with Porcupine. */
    static const std::vector<std::string>& builtinKeywords();

    static bool isBuiltinKeyword(const std::string& name);

    /** <keyword_dir>/<name>_linux.ppn */
    static std::string builtinKeywordPath(const std::string& keyword_dir, const std::string& name);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hark::wakeword
