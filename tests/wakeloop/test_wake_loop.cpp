/**
 * test_wake_loop.cpp - WakeLoop state machine tests
 *
 * Runs the loop inline with run() against scripted audio and a fake
 * clock; stop() is issued from the callbacks or the read hook.
 */

#include "hark/WakeLoop.hpp"
#include "../support/Fakes.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <limits>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace hark;
using namespace hark::testing;
using namespace std::chrono_literals;

namespace {

std::unique_ptr<wakeword::KeywordSpotter> makeSpotter(std::shared_ptr<int> processed,
                                                      const std::string& access_key = "test-key") {
    wakeword::KeywordSpotterOptions options;
    options.access_key = access_key;
    options.keywords = {"porcupine"};
    options.keyword_dir = "keywords";
    options.engine_factory = [processed](const wakeword::KeywordEngineParams&) {
        auto engine = std::make_unique<ScriptedKeywordEngine>();
        engine->processed = processed;
        return std::unique_ptr<wakeword::KeywordEngine>(std::move(engine));
    };
    return std::make_unique<wakeword::KeywordSpotter>(options);
}

struct Rig {
    FakeClock clock;
    ScriptedSource* source = nullptr;
    std::shared_ptr<int> processed = std::make_shared<int>(0);
    std::shared_ptr<StubTranscriptionEngine::Record> stt = std::make_shared<StubTranscriptionEngine::Record>();

    std::mutex mutex;
    std::vector<std::string> dispatched;
    std::vector<ListenerState> states;
    std::vector<TimePoint> state_times;
    std::vector<std::string> errors;
    std::vector<std::string> wake_words;

    std::unique_ptr<WakeLoop> loop;

    explicit Rig(ListenerConfig config = {},
                 bool stt_fails = false,
                 int stt_rate = SAMPLE_RATE,
                 const std::string& access_key = "test-key") {
        auto src = std::make_unique<ScriptedSource>(clock);
        source = src.get();

        auto engine = std::make_unique<StubTranscriptionEngine>("  turn on the lights ", stt);
        engine->fail = stt_fails;
        engine->sample_rate = stt_rate;

        auto bridge = std::make_unique<dispatch::DispatchBridge>(
            [this](const std::string& text) {
                std::lock_guard<std::mutex> lock(mutex);
                dispatched.push_back(text);
                return std::string("ok");
            },
            1000ms);

        config.now = clock.fn();
        loop = std::make_unique<WakeLoop>(
            std::move(src), makeSpotter(processed, access_key),
            std::make_unique<stt::Transcriber>(std::move(engine)), std::move(bridge), config);
    }

    /** Record everything; stop once `idle_entries` returns to Idle have happened. */
    void stopAfterIdle(int idle_entries) {
        ListenerCallbacks cb;
        cb.onStateChange = [this, idle_entries](ListenerState s) {
            states.push_back(s);
            state_times.push_back(clock.now);
            int idles = 0;
            for (auto st : states) {
                if (st == ListenerState::IDLE) ++idles;
            }
            if (s == ListenerState::IDLE && idles > idle_entries) {
                loop->stop();
            }
        };
        cb.onError = [this](const std::string& msg) { errors.push_back(msg); };
        cb.onWakeWord = [this](const wakeword::DetectionEvent& e) { wake_words.push_back(e.keyword); };
        loop->setCallbacks(cb);
    }

    size_t dispatchCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return dispatched.size();
    }
};

ListenerConfig config(std::chrono::milliseconds silence, std::chrono::milliseconds phrase) {
    ListenerConfig c;
    c.silence_timeout = silence;
    c.phrase_limit = phrase;
    return c;
}

bool sameStates(const std::vector<ListenerState>& actual, const std::vector<ListenerState>& expected) {
    if (actual != expected) {
        std::cout << "  states:";
        for (auto s : actual) std::cout << " " << toString(s);
        std::cout << std::endl;
        return false;
    }
    return true;
}

} // namespace

void test_no_detection_stays_idle() {
    Rig rig;
    rig.stopAfterIdle(1);
    rig.source->push(silentFrame(), 100);
    rig.source->on_read = [&rig](int n) {
        if (n == 300) rig.loop->stop();
    };

    assert(rig.loop->run());

    assert(sameStates(rig.states, {ListenerState::IDLE, ListenerState::STOPPED}));
    assert(*rig.processed == 300);
    assert(rig.stt->calls == 0);
    assert(rig.dispatchCount() == 0);
    assert(rig.source->opens == 1);
    assert(!rig.source->isOpen());

    std::cout << "[PASS] test_no_detection_stays_idle" << std::endl;
}

void test_detection_capture_dispatch() {
    Rig rig(config(2000ms, 7000ms));
    rig.stopAfterIdle(1);
    rig.source->push(silentFrame(), 100);
    rig.source->push(wakeFrame());
    rig.source->fallback = quietFrame();

    assert(rig.loop->run());

    assert(sameStates(rig.states, {ListenerState::IDLE, ListenerState::CAPTURING,
                                   ListenerState::TRANSCRIBING, ListenerState::DISPATCHING,
                                   ListenerState::IDLE, ListenerState::STOPPED}));
    assert(*rig.processed == 101);
    assert(rig.wake_words.size() == 1 && rig.wake_words[0] == "porcupine");

    // 2.0 s of sub-threshold audio at 32 ms per frame
    assert(rig.stt->calls == 1);
    assert(rig.stt->last_samples == 63u * FRAME_LENGTH);

    assert(rig.dispatchCount() == 1);
    assert(rig.dispatched[0] == "turn on the lights");

    // wake stream, capture stream, wake stream again
    assert(rig.source->opens == 3);
    assert(rig.source->closes == 3);

    std::cout << "[PASS] test_detection_capture_dispatch" << std::endl;
}

void test_phrase_limit_caps_capture() {
    Rig rig(config(3000ms, 7000ms));
    rig.stopAfterIdle(1);
    rig.source->push(wakeFrame());
    rig.source->fallback = loudFrame();

    assert(rig.loop->run());

    assert(rig.states.size() >= 3);
    assert(rig.states[1] == ListenerState::CAPTURING);
    assert(rig.states[2] == ListenerState::TRANSCRIBING);

    auto captured = rig.state_times[2] - rig.state_times[1];
    assert(captured >= 7000ms);
    assert(captured <= 7000ms + 32ms);
    assert(rig.stt->last_samples == 219u * FRAME_LENGTH);
    assert(rig.dispatchCount() == 1);

    std::cout << "[PASS] test_phrase_limit_caps_capture" << std::endl;
}

void test_empty_capture_skips_transcription() {
    Rig rig(config(3000ms, 7000ms));
    rig.stopAfterIdle(1);
    rig.source->push(wakeFrame());
    rig.source->pushStatus(audio::ReadStatus::TIMED_OUT, 10);

    assert(rig.loop->run());

    assert(sameStates(rig.states, {ListenerState::IDLE, ListenerState::CAPTURING,
                                   ListenerState::IDLE, ListenerState::STOPPED}));
    assert(rig.stt->calls == 0);
    assert(rig.dispatchCount() == 0);

    std::cout << "[PASS] test_empty_capture_skips_transcription" << std::endl;
}

void test_open_failure_at_start() {
    Rig rig;
    rig.source->fail_opens_after = 0;

    assert(!rig.loop->start());

    ListenerStatus status = rig.loop->status();
    assert(!status.is_listening);
    assert(!status.is_capturing);
    assert(!status.enabled);
    assert(!rig.loop->isRunning());
    assert(!rig.loop->lastError().empty());

    std::cout << "[PASS] test_open_failure_at_start" << std::endl;
}

void test_stop_is_idempotent() {
    Rig rig;

    // Never started
    rig.loop->stop();
    rig.loop->stop();
    assert(rig.loop->state() == ListenerState::STOPPED);
    assert(!rig.loop->isRunning());

    // Threaded run, stopped while idle
    rig.source->max_reads = std::numeric_limits<int>::max();
    assert(rig.loop->start());
    assert(rig.loop->start());
    while (rig.source->reads < 50) {
        std::this_thread::sleep_for(1ms);
    }
    assert(rig.loop->status().is_listening);

    rig.loop->stop();
    rig.loop->stop();

    ListenerStatus status = rig.loop->status();
    assert(status.state == ListenerState::STOPPED);
    assert(!status.is_listening);
    assert(status.enabled);
    assert(!rig.loop->isRunning());
    assert(!rig.source->isOpen());

    std::cout << "[PASS] test_stop_is_idempotent" << std::endl;
}

void test_transcriber_failure_discards_command() {
    Rig rig(config(2000ms, 7000ms), /*stt_fails=*/true);
    rig.stopAfterIdle(1);
    rig.source->push(wakeFrame());
    rig.source->fallback = quietFrame();

    assert(rig.loop->run());

    assert(sameStates(rig.states, {ListenerState::IDLE, ListenerState::CAPTURING,
                                   ListenerState::TRANSCRIBING, ListenerState::IDLE,
                                   ListenerState::STOPPED}));
    assert(rig.stt->calls == 1);
    assert(rig.dispatchCount() == 0);
    assert(rig.errors.size() == 1);
    assert(rig.errors[0].find("Transcription failed") != std::string::npos);

    std::cout << "[PASS] test_transcriber_failure_discards_command" << std::endl;
}

void test_stop_during_capture() {
    Rig rig(config(3000ms, 7000ms));
    rig.stopAfterIdle(1);
    rig.source->push(wakeFrame());
    rig.source->fallback = loudFrame();
    rig.source->on_read = [&rig](int n) {
        if (n == 20) rig.loop->stop();
    };

    assert(rig.loop->run());

    assert(sameStates(rig.states, {ListenerState::IDLE, ListenerState::CAPTURING,
                                   ListenerState::STOPPED}));
    assert(rig.stt->calls == 0);
    assert(rig.dispatchCount() == 0);
    assert(!rig.source->isOpen());

    std::cout << "[PASS] test_stop_during_capture" << std::endl;
}

void test_stop_on_final_capture_read() {
    Rig rig(config(2000ms, 7000ms));
    std::vector<std::string> commands;
    ListenerCallbacks cb;
    cb.onStateChange = [&rig](ListenerState s) { rig.states.push_back(s); };
    cb.onCommand = [&commands](const std::string& text) { commands.push_back(text); };
    rig.loop->setCallbacks(cb);

    rig.source->push(wakeFrame());
    rig.source->fallback = quietFrame();
    // Read 64 is the 63rd capture frame, the one that hits the silence deadline
    rig.source->on_read = [&rig](int n) {
        if (n == 64) rig.loop->stop();
    };

    assert(rig.loop->run());

    assert(sameStates(rig.states, {ListenerState::IDLE, ListenerState::CAPTURING,
                                   ListenerState::STOPPED}));
    assert(rig.source->reads == 64);
    assert(rig.stt->calls == 0);
    assert(commands.empty());
    assert(rig.dispatchCount() == 0);
    assert(!rig.source->isOpen());

    std::cout << "[PASS] test_stop_on_final_capture_read" << std::endl;
}

void test_overflow_frames_processed() {
    Rig rig(config(2000ms, 7000ms));
    rig.stopAfterIdle(1);
    rig.source->push(silentFrame(), 2);
    rig.source->pushStatus(audio::ReadStatus::OVERRUN, silentFrame(), 2);
    rig.source->pushStatus(audio::ReadStatus::OVERRUN, wakeFrame());
    rig.source->pushStatus(audio::ReadStatus::OVERRUN, quietFrame(), 5);
    rig.source->fallback = quietFrame();

    assert(rig.loop->run());

    assert(sameStates(rig.states, {ListenerState::IDLE, ListenerState::CAPTURING,
                                   ListenerState::TRANSCRIBING, ListenerState::DISPATCHING,
                                   ListenerState::IDLE, ListenerState::STOPPED}));
    // The wake word arrived on an overflowed read
    assert(*rig.processed == 5);
    assert(rig.wake_words.size() == 1);
    // Overflowed capture frames count toward the command
    assert(rig.stt->last_samples == 63u * FRAME_LENGTH);
    assert(rig.dispatchCount() == 1);
    assert(rig.errors.empty());

    std::cout << "[PASS] test_overflow_frames_processed" << std::endl;
}

void test_spotter_exception_skips_frame() {
    Rig rig(config(2000ms, 7000ms));
    rig.stopAfterIdle(1);
    rig.source->push(silentFrame(), 2);
    rig.source->push(faultFrame());
    rig.source->push(silentFrame(), 2);
    rig.source->push(wakeFrame());
    rig.source->fallback = quietFrame();

    assert(rig.loop->run());

    assert(sameStates(rig.states, {ListenerState::IDLE, ListenerState::CAPTURING,
                                   ListenerState::TRANSCRIBING, ListenerState::DISPATCHING,
                                   ListenerState::IDLE, ListenerState::STOPPED}));
    assert(rig.errors.size() == 1);
    assert(rig.errors[0] == "Keyword spotting failed: bad frame");
    assert(*rig.processed == 6);
    assert(rig.wake_words.size() == 1);
    assert(rig.stt->calls == 1);
    assert(rig.dispatchCount() == 1);
    assert(rig.loop->isEnabled());

    std::cout << "[PASS] test_spotter_exception_skips_frame" << std::endl;
}

void test_disabled_configurations() {
    {
        Rig rig({}, false, SAMPLE_RATE, /*access_key=*/"");
        assert(!rig.loop->isEnabled());
        assert(!rig.loop->start());
        assert(rig.source->opens == 0);
        assert(rig.loop->lastError().find("Wake word unavailable") != std::string::npos);
    }
    {
        Rig rig({}, false, /*stt_rate=*/8000);
        assert(!rig.loop->isEnabled());
        assert(!rig.loop->start());
        assert(rig.loop->lastError().find("Hz") != std::string::npos);
    }

    std::cout << "[PASS] test_disabled_configurations" << std::endl;
}

void test_idle_read_errors_disable() {
    Rig rig;
    rig.stopAfterIdle(1);
    rig.source->pushStatus(audio::ReadStatus::DEVICE_ERROR, 2);

    assert(rig.loop->run());

    assert(sameStates(rig.states, {ListenerState::IDLE, ListenerState::STOPPED}));
    assert(rig.errors.size() == 2);
    assert(!rig.loop->isEnabled());
    // initial open plus one reopen
    assert(rig.source->opens == 2);

    std::cout << "[PASS] test_idle_read_errors_disable" << std::endl;
}

void test_listen_once() {
    ListenerConfig c;
    c.once_silence_timeout = 2000ms;
    Rig rig(c);
    rig.source->fallback = quietFrame();

    std::string text = rig.loop->listenOnce();

    assert(text == "turn on the lights");
    assert(rig.stt->calls == 1);
    assert(rig.stt->last_samples == 63u * FRAME_LENGTH);
    assert(rig.dispatchCount() == 0);
    assert(*rig.processed == 0);
    assert(!rig.source->isOpen());

    std::cout << "[PASS] test_listen_once" << std::endl;
}

void test_start_refused_during_listen_once() {
    ListenerConfig c;
    c.once_silence_timeout = 2000ms;
    Rig rig(c);
    rig.source->fallback = quietFrame();
    bool started = true;
    rig.source->on_read = [&rig, &started](int n) {
        if (n == 5) started = rig.loop->start();
    };

    std::string text = rig.loop->listenOnce();

    assert(!started);
    assert(text == "turn on the lights");
    assert(rig.loop->isEnabled());
    assert(!rig.loop->isRunning());
    assert(rig.source->opens == 1);
    assert(rig.loop->lastError().empty());

    // The loop starts normally once the capture is over
    assert(rig.loop->start());
    rig.loop->stop();
    assert(rig.loop->isEnabled());
    assert(!rig.source->isOpen());

    std::cout << "[PASS] test_start_refused_during_listen_once" << std::endl;
}

void test_debug_audio_saved() {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "hark_test_debug_audio";
    fs::remove_all(dir);

    ListenerConfig c = config(2000ms, 7000ms);
    c.debug_audio_dir = dir.string();
    Rig rig(c);
    rig.stopAfterIdle(1);
    rig.source->push(wakeFrame());
    rig.source->fallback = quietFrame();

    assert(rig.loop->run());

    int files = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        std::string name = entry.path().filename().string();
        assert(name.rfind("command_", 0) == 0);
        assert(name.size() > 6 && name.substr(name.size() - 6) == "_1.wav");
        assert(fs::file_size(entry.path()) == 44u + 63u * FRAME_LENGTH * 2);
        ++files;
    }
    assert(files == 1);

    fs::remove_all(dir);
    std::cout << "[PASS] test_debug_audio_saved" << std::endl;
}

int main() {
    std::cout << "=== WakeLoop Tests ===" << std::endl;

    test_no_detection_stays_idle();
    test_detection_capture_dispatch();
    test_phrase_limit_caps_capture();
    test_empty_capture_skips_transcription();
    test_open_failure_at_start();
    test_stop_is_idempotent();
    test_transcriber_failure_discards_command();
    test_stop_during_capture();
    test_stop_on_final_capture_read();
    test_overflow_frames_processed();
    test_spotter_exception_skips_frame();
    test_disabled_configurations();
    test_idle_read_errors_disable();
    test_listen_once();
    test_start_refused_during_listen_once();
    test_debug_audio_saved();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
