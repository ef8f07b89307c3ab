/**
 * KeywordEngine.hpp - Pluggable keyword-spotting engine
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace hark::wakeword {

/**
 * Everything an engine needs, already validated by KeywordSpotter.
 * keyword_paths and sensitivities have the same length.
 */
struct KeywordEngineParams {
    std::string access_key;
    std::vector<std::string> keyword_paths;
    std::vector<float> sensitivities;
};

class KeywordEngine {
public:
    virtual ~KeywordEngine() = default;

    virtual bool isReady() const = 0;
    virtual std::string lastError() const = 0;

    /** Samples per process() call, fixed by the engine. */
    virtual int frameLength() const = 0;
    virtual int sampleRate() const = 0;

    /**
     * @param samples exactly frameLength() int16 samples
     * @return index of the detected keyword, or -1
     */
    virtual int process(const int16_t* samples) = 0;
};

using KeywordEngineFactory =
    std::function<std::unique_ptr<KeywordEngine>(const KeywordEngineParams&)>;

} // namespace hark::wakeword
