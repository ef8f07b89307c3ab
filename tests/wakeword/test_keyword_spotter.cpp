/**
 * test_keyword_spotter.cpp - Keyword configuration and detection tests
 */

#include "hark/wakeword/KeywordSpotter.hpp"
#include "../support/Fakes.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace hark;
using namespace hark::wakeword;
using namespace hark::testing;

namespace {

// Captures what the spotter hands to the engine
struct FactoryProbe {
    int calls = 0;
    KeywordEngineParams params;
    int sample_rate = SAMPLE_RATE;
    int frame_length = FRAME_LENGTH;
    bool throws = false;
};

KeywordSpotterOptions baseOptions(FactoryProbe& probe) {
    KeywordSpotterOptions options;
    options.access_key = "test-key";
    options.keywords = {"porcupine"};
    options.keyword_dir = "/opt/keywords";
    options.engine_factory = [&probe](const KeywordEngineParams& params) {
        probe.calls++;
        probe.params = params;
        if (probe.throws) {
            throw std::runtime_error("invalid access key");
        }
        return std::unique_ptr<KeywordEngine>(
            std::make_unique<ScriptedKeywordEngine>(probe.sample_rate, probe.frame_length));
    };
    return options;
}

} // namespace

void test_builtin_keywords_resolve() {
    FactoryProbe probe;
    KeywordSpotterOptions options = baseOptions(probe);
    options.keywords = {"jarvis", "hey google"};

    KeywordSpotter spotter(options);

    assert(spotter.isReady());
    assert(probe.calls == 1);
    assert(probe.params.access_key == "test-key");
    assert(probe.params.keyword_paths.size() == 2);
    assert(probe.params.keyword_paths[0] == "/opt/keywords/jarvis_linux.ppn");
    assert(probe.params.keyword_paths[1] == "/opt/keywords/hey google_linux.ppn");
    assert(spotter.keywordNames().size() == 2);
    assert(spotter.keywordName(1) == "hey google");
    assert(spotter.keywordName(7) == "unknown keyword");
    assert(spotter.frameLength() == FRAME_LENGTH);
    assert(spotter.sampleRate() == SAMPLE_RATE);

    std::cout << "[PASS] test_builtin_keywords_resolve" << std::endl;
}

void test_keyword_paths_take_precedence() {
    FactoryProbe probe;
    KeywordSpotterOptions options = baseOptions(probe);
    options.keyword_paths = {"models/wakeword/hey_hark.ppn"};
    options.keywords = {"jarvis"};

    KeywordSpotter spotter(options);

    assert(spotter.isReady());
    assert(probe.params.keyword_paths.size() == 1);
    assert(probe.params.keyword_paths[0] == "models/wakeword/hey_hark.ppn");
    assert(spotter.keywordName(0) == "models/wakeword/hey_hark.ppn");

    std::cout << "[PASS] test_keyword_paths_take_precedence" << std::endl;
}

void test_unknown_keywords_ignored() {
    FactoryProbe probe;
    KeywordSpotterOptions options = baseOptions(probe);
    options.keywords = {"abracadabra", "computer"};

    KeywordSpotter spotter(options);
    assert(spotter.isReady());
    assert(spotter.keywordNames().size() == 1);
    assert(spotter.keywordName(0) == "computer");

    options.keywords = {"abracadabra"};
    KeywordSpotter none(options);
    assert(!none.isReady());
    assert(none.lastError().find("No valid") != std::string::npos);

    std::cout << "[PASS] test_unknown_keywords_ignored" << std::endl;
}

void test_access_key_required() {
    FactoryProbe probe;
    KeywordSpotterOptions options = baseOptions(probe);

    options.access_key = "";
    KeywordSpotter missing(options);
    assert(!missing.isReady());

    options.access_key = "your_picovoice_access_key_here";
    KeywordSpotter placeholder(options);
    assert(!placeholder.isReady());

    assert(probe.calls == 0);
    assert(missing.process(silentFrame()) == -1);

    std::cout << "[PASS] test_access_key_required" << std::endl;
}

void test_sensitivities() {
    FactoryProbe probe;
    KeywordSpotterOptions options = baseOptions(probe);
    options.keywords = {"alexa", "jarvis", "computer"};

    options.sensitivities = {0.7f};
    KeywordSpotter broadcast(options);
    assert(broadcast.isReady());
    assert((probe.params.sensitivities == std::vector<float>{0.7f, 0.7f, 0.7f}));

    options.sensitivities = {};
    KeywordSpotter defaults(options);
    assert(defaults.isReady());
    assert((probe.params.sensitivities == std::vector<float>{0.5f, 0.5f, 0.5f}));

    options.sensitivities = {0.1f, 0.2f};
    KeywordSpotter mismatch(options);
    assert(!mismatch.isReady());

    options.sensitivities = {0.1f, 1.5f, 0.3f};
    KeywordSpotter out_of_range(options);
    assert(!out_of_range.isReady());
    assert(out_of_range.lastError().find("outside") != std::string::npos);

    std::cout << "[PASS] test_sensitivities" << std::endl;
}

void test_engine_failures() {
    FactoryProbe probe;
    KeywordSpotterOptions options = baseOptions(probe);

    probe.throws = true;
    KeywordSpotter thrown(options);
    assert(!thrown.isReady());
    assert(thrown.lastError().find("invalid access key") != std::string::npos);
    probe.throws = false;

    probe.sample_rate = 8000;
    KeywordSpotter wrong_rate(options);
    assert(!wrong_rate.isReady());
    assert(wrong_rate.lastError().find("8000") != std::string::npos);
    probe.sample_rate = SAMPLE_RATE;

    options.required_frame_length = 256;
    KeywordSpotter wrong_frame(options);
    assert(!wrong_frame.isReady());

    options.required_frame_length = 0;
    options.engine_factory = nullptr;
    KeywordSpotter no_factory(options);
    assert(!no_factory.isReady());

    std::cout << "[PASS] test_engine_failures" << std::endl;
}

void test_process_frames() {
    FactoryProbe probe;
    KeywordSpotter spotter(baseOptions(probe));
    assert(spotter.isReady());

    for (int i = 0; i < 100; ++i) {
        assert(spotter.process(silentFrame()) == -1);
    }
    assert(spotter.process(wakeFrame()) == 0);

    bool threw = false;
    try {
        spotter.process(silentFrame(FRAME_LENGTH / 2));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] test_process_frames" << std::endl;
}

void test_builtin_catalogue() {
    assert(KeywordSpotter::builtinKeywords().size() == 14);
    assert(KeywordSpotter::isBuiltinKeyword("bumblebee"));
    assert(!KeywordSpotter::isBuiltinKeyword("Bumblebee"));
    assert(KeywordSpotter::builtinKeywordPath("kw", "alexa") == "kw/alexa_linux.ppn");

    std::cout << "[PASS] test_builtin_catalogue" << std::endl;
}

int main() {
    std::cout << "=== KeywordSpotter Tests ===" << std::endl;

    test_builtin_keywords_resolve();
    test_keyword_paths_take_precedence();
    test_unknown_keywords_ignored();
    test_access_key_required();
    test_sensitivities();
    test_engine_failures();
    test_process_frames();
    test_builtin_catalogue();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
