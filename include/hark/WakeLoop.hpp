/**
 * WakeLoop.hpp - Wake word → command capture → transcription → dispatch
 *
 * One dedicated thread runs the whole cycle sequentially. Only one input
 * stream is open at a time: the wake-word stream is closed before the
 * capture stream opens, and reopened after dispatch. No wake word can be
 * detected while a command is being transcribed or dispatched.
 */

#pragma once

#include "hark/Types.hpp"
#include "hark/audio/AudioSource.hpp"
#include "hark/audio/SoundDetector.hpp"
#include "hark/dispatch/DispatchBridge.hpp"
#include "hark/stt/Transcriber.hpp"
#include "hark/wakeword/KeywordSpotter.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace hark {

struct ListenerConfig {
    // Capture limits after a wake word
    std::chrono::milliseconds silence_timeout{3000};
    std::chrono::milliseconds phrase_limit{7000};

    // Capture limits for listenOnce()
    std::chrono::milliseconds once_silence_timeout{2000};
    std::chrono::milliseconds once_phrase_limit{10000};

    // Per-read bound; 0 = two frame durations
    std::chrono::milliseconds read_timeout{0};

    // Consecutive read timeouts that end a capture
    int max_read_timeouts = 10;

    int input_device = -1;

    // Directory for captured command WAVs; empty = off
    std::string debug_audio_dir;

    // Time source; defaults to steady_clock
    NowFn now;
};

/**
 * Invoked on the loop thread. Set before start().
 */
struct ListenerCallbacks {
    std::function<void(ListenerState)> onStateChange;
    std::function<void(const wakeword::DetectionEvent&)> onWakeWord;
    std::function<void(const std::string&)> onCommand;
    std::function<void(const std::string&)> onError;
};

class WakeLoop {
public:
    /**
     * Never throws on bad components: a missing or not-ready spotter,
     * transcriber or bridge, or a sample-rate mismatch between spotter
     * and transcriber, leaves the loop disabled (see lastError()).
     *
     * @param detector sound test for the Endpointer; nullptr = energy floor
     */
    WakeLoop(std::unique_ptr<audio::AudioSource> source,
             std::unique_ptr<wakeword::KeywordSpotter> spotter,
             std::unique_ptr<stt::Transcriber> transcriber,
             std::unique_ptr<dispatch::DispatchBridge> bridge,
             ListenerConfig config = {},
             std::unique_ptr<audio::SoundDetector> detector = nullptr);

    /** Stops and joins the loop thread. */
    ~WakeLoop();

    WakeLoop(const WakeLoop&) = delete;
    WakeLoop& operator=(const WakeLoop&) = delete;

    /**
     * Open the wake-word stream and start the loop thread.
     * @return false if disabled or the device could not be opened; no
     *         exception escapes. true if already running.
     */
    bool start();

    /**
     * Same as start() but runs the loop on the calling thread until
     * stop() is called (from a callback, another thread or a signal
     * handler path) or the device is lost.
     */
    bool run();

    /** Request a cooperative stop and join the loop thread. Idempotent. */
    void stop();

    /**
     * Capture and transcribe one command without waiting for a wake
     * word. Refused (returns "") while the loop is running.
     */
    std::string listenOnce();

    ListenerStatus status() const;
    ListenerState state() const;
    bool isRunning() const;

    /** Wake-word feature usable (components valid, device not lost). */
    bool isEnabled() const;
    std::string lastError() const;

    audio::StreamParams streamParams() const;

    void setCallbacks(ListenerCallbacks callbacks);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hark
