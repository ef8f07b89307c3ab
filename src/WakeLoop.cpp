/**
 * WakeLoop.cpp - Voice activation control loop
 *
 * IDLE → CAPTURING → TRANSCRIBING → DISPATCHING → IDLE, on one thread.
 * The stop flag is polled once per frame read in every state.
 */

#include "hark/WakeLoop.hpp"
#include "hark/audio/CommandCapture.hpp"
#include "hark/audio/Endpointer.hpp"
#include "hark/audio/WavWriter.hpp"

#include <algorithm>
#include <atomic>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>

namespace hark {

const char* toString(ListenerState state) {
    switch (state) {
        case ListenerState::IDLE:         return "idle";
        case ListenerState::CAPTURING:    return "capturing";
        case ListenerState::TRANSCRIBING: return "transcribing";
        case ListenerState::DISPATCHING:  return "dispatching";
        case ListenerState::STOPPED:      return "stopped";
    }
    return "unknown";
}

namespace {

// Fallback frame length when no keyword engine dictates one
constexpr int DEFAULT_FRAME_LENGTH = 512;

// Consecutive wake-stream read errors before the device is considered lost
constexpr int MAX_IDLE_READ_ERRORS = 2;

} // namespace

struct WakeLoop::Impl {
    enum class ScanResult { DETECTED, STOPPED, DEVICE_LOST };
    enum class CaptureResult { CAPTURED, ABORTED, DEVICE_LOST };

    // Components
    std::unique_ptr<audio::AudioSource> source;
    std::unique_ptr<wakeword::KeywordSpotter> spotter;
    std::unique_ptr<stt::Transcriber> transcriber;
    std::unique_ptr<dispatch::DispatchBridge> bridge;

    ListenerConfig config;
    ListenerCallbacks callbacks;
    audio::StreamParams stream_params;
    std::chrono::milliseconds read_timeout{0};

    audio::Endpointer endpointer;
    audio::CommandCapture capture;

    // State
    std::atomic<ListenerState> state{ListenerState::STOPPED};
    std::atomic<bool> is_listening{false};
    std::atomic<bool> is_capturing{false};
    std::atomic<bool> stop_requested{false};
    std::atomic<bool> running{false};
    std::atomic<bool> configured{false};
    std::atomic<bool> device_lost{false};
    std::atomic<bool> once_active{false};
    std::thread worker_thread;

    mutable std::mutex error_mutex;
    std::string last_error;

    int debug_capture_count = 0;

    Impl(std::unique_ptr<audio::AudioSource> src,
         std::unique_ptr<wakeword::KeywordSpotter> spot,
         std::unique_ptr<stt::Transcriber> stt,
         std::unique_ptr<dispatch::DispatchBridge> disp,
         ListenerConfig cfg,
         std::unique_ptr<audio::SoundDetector> detector)
        : source(std::move(src))
        , spotter(std::move(spot))
        , transcriber(std::move(stt))
        , bridge(std::move(disp))
        , config(std::move(cfg))
        , stream_params(deriveStreamParams(spotter.get(), transcriber.get(), config.input_device))
        , endpointer(std::move(detector))
        , capture(endpointer, stream_params.sample_rate) {

        if (!config.now) {
            config.now = []() { return Clock::now(); };
        }

        const bool spotter_ok = spotter && spotter->isReady();
        const bool stt_ok = transcriber && transcriber->isReady();

        if (config.read_timeout.count() > 0) {
            read_timeout = config.read_timeout;
        } else {
            auto frame_ms = std::chrono::milliseconds(
                stream_params.frame_length * 1000 / std::max(stream_params.sample_rate, 1));
            read_timeout = std::max(std::chrono::milliseconds(10), frame_ms * 2);
        }

        if (!source) {
            setError("No audio source");
        } else if (!spotter_ok) {
            setError("Wake word unavailable: "
                     + (spotter ? spotter->lastError() : std::string("no keyword spotter")));
        } else if (!stt_ok) {
            setError("Transcriber unavailable");
        } else if (!bridge) {
            setError("No dispatch bridge");
        } else if (transcriber->sampleRate() != spotter->sampleRate()) {
            setError("Keyword engine runs at " + std::to_string(spotter->sampleRate())
                     + " Hz but transcriber expects " + std::to_string(transcriber->sampleRate()) + " Hz");
        } else {
            configured = true;
        }

        if (!configured) {
            std::cerr << "[WakeLoop] Disabled: " << lastError() << std::endl;
        }
    }

    // Stream format comes from the keyword engine; the transcriber must agree
    static audio::StreamParams deriveStreamParams(const wakeword::KeywordSpotter* spotter,
                                                  const stt::Transcriber* transcriber,
                                                  int device) {
        const bool spotter_ok = spotter && spotter->isReady();
        const bool stt_ok = transcriber && transcriber->isReady();

        audio::StreamParams params;
        params.sample_rate = spotter_ok ? spotter->sampleRate()
                           : stt_ok ? transcriber->sampleRate()
                           : 16000;
        params.frame_length = spotter_ok ? spotter->frameLength() : DEFAULT_FRAME_LENGTH;
        params.channels = 1;
        params.device = device;
        return params;
    }

    void setError(const std::string& message) {
        std::lock_guard<std::mutex> lock(error_mutex);
        last_error = message;
    }

    std::string lastError() const {
        std::lock_guard<std::mutex> lock(error_mutex);
        return last_error;
    }

    void reportError(const std::string& message) {
        setError(message);
        std::cerr << "[WakeLoop] " << message << std::endl;
        if (callbacks.onError) {
            callbacks.onError(message);
        }
    }

    void setState(ListenerState new_state) {
        state = new_state;
        is_listening = (new_state == ListenerState::IDLE);
        is_capturing = (new_state == ListenerState::CAPTURING);
        if (callbacks.onStateChange) {
            callbacks.onStateChange(new_state);
        }
    }

    bool openStream(const char* purpose) {
        if (source->open(stream_params)) {
            return true;
        }
        reportError(std::string("Cannot open ") + purpose + " stream: " + source->lastError());
        return false;
    }

    // Called on the starting thread; the loop thread takes over afterwards
    bool begin() {
        if (!configured) {
            std::cerr << "[WakeLoop] Not starting, disabled: " << lastError() << std::endl;
            return false;
        }
        if (once_active) {
            std::cerr << "[WakeLoop] Warning: not starting while listenOnce is capturing" << std::endl;
            return false;
        }

        stop_requested = false;
        device_lost = false;

        if (!openStream("wake-word")) {
            device_lost = true;
            return false;
        }

        running = true;
        setState(ListenerState::IDLE);
        std::cout << "[WakeLoop] Listening for: ";
        const auto& names = spotter->keywordNames();
        for (size_t i = 0; i < names.size(); ++i) {
            std::cout << (i ? ", " : "") << names[i];
        }
        std::cout << std::endl;
        return true;
    }

    void loop() {
        try {
            while (!stop_requested) {
                wakeword::DetectionEvent event;
                ScanResult scan = scanForKeyword(event);
                if (scan == ScanResult::DEVICE_LOST) {
                    device_lost = true;
                }
                if (scan != ScanResult::DETECTED) {
                    break;
                }

                source->close();
                if (!handleCommand(config.silence_timeout, config.phrase_limit)) {
                    device_lost = true;
                    break;
                }

                if (stop_requested) break;

                if (!openStream("wake-word")) {
                    device_lost = true;
                    break;
                }
                setState(ListenerState::IDLE);
                std::cout << "[WakeLoop] Resuming wake word detection" << std::endl;
            }
        } catch (const std::exception& e) {
            reportError(std::string("Loop terminated: ") + e.what());
        }

        source->close();
        capture.abort();
        running = false;
        setState(ListenerState::STOPPED);

        if (device_lost) {
            std::cerr << "[WakeLoop] Audio device lost, wake word disabled" << std::endl;
        } else {
            std::cout << "[WakeLoop] Stopped" << std::endl;
        }
    }

    ScanResult scanForKeyword(wakeword::DetectionEvent& event) {
        audio::AudioFrame frame;
        int read_errors = 0;

        while (!stop_requested) {
            audio::ReadStatus status = source->readFrame(frame, read_timeout);

            if (status == audio::ReadStatus::TIMED_OUT) {
                continue;
            }

            if (status == audio::ReadStatus::DEVICE_ERROR) {
                reportError("Wake-word stream read failed: " + source->lastError());
                if (++read_errors >= MAX_IDLE_READ_ERRORS) {
                    return ScanResult::DEVICE_LOST;
                }
                source->close();
                if (!openStream("wake-word")) {
                    return ScanResult::DEVICE_LOST;
                }
                continue;
            }

            read_errors = 0;
            if (status == audio::ReadStatus::OVERRUN) {
                std::cerr << "[WakeLoop] Warning: input audio overflowed" << std::endl;
            }

            int index = -1;
            try {
                index = spotter->process(frame);
            } catch (const std::exception& e) {
                reportError(std::string("Keyword spotting failed: ") + e.what());
                continue;
            }

            if (index >= 0) {
                event.keyword_index = index;
                event.keyword = spotter->keywordName(index);
                event.timestamp = config.now();

                std::cout << "[WakeLoop] Wake word '" << event.keyword
                          << "' detected, listening for command..." << std::endl;
                if (callbacks.onWakeWord) {
                    callbacks.onWakeWord(event);
                }
                return ScanResult::DETECTED;
            }
        }

        return ScanResult::STOPPED;
    }

    CaptureResult captureCommand(std::chrono::milliseconds silence_timeout,
                                 std::chrono::milliseconds phrase_limit,
                                 audio::CommandBuffer& out) {
        if (!openStream("capture")) {
            return CaptureResult::DEVICE_LOST;
        }

        capture.start(config.now());
        setState(ListenerState::CAPTURING);

        std::cout << "[WakeLoop] Capturing (silence " << silence_timeout.count()
                  << "ms, max " << phrase_limit.count() << "ms)" << std::endl;

        audio::AudioFrame frame;
        int timeouts = 0;

        while (true) {
            if (stop_requested) {
                capture.abort();
                source->close();
                std::cout << "[WakeLoop] Stop requested, command discarded" << std::endl;
                return CaptureResult::ABORTED;
            }

            audio::ReadStatus status = source->readFrame(frame, read_timeout);
            TimePoint now = config.now();

            if (status == audio::ReadStatus::TIMED_OUT) {
                if (++timeouts >= config.max_read_timeouts) {
                    std::cerr << "[WakeLoop] Warning: " << timeouts
                              << " consecutive read timeouts, ending capture" << std::endl;
                    break;
                }
            } else if (status == audio::ReadStatus::DEVICE_ERROR) {
                reportError("Capture stream read failed: " + source->lastError());
                break;
            } else {
                if (status == audio::ReadStatus::OVERRUN) {
                    std::cerr << "[WakeLoop] Warning: input audio overflowed" << std::endl;
                }
                timeouts = 0;
                capture.push(frame, now);
            }

            audio::StopReason reason = endpointer.stopReason(
                now, silence_timeout, phrase_limit, capture.startTime());
            if (reason != audio::StopReason::NONE) {
                std::cout << "[WakeLoop] Capture ended by " << audio::toString(reason)
                          << " after " << capture.frameCount() << " frames" << std::endl;
                break;
            }
        }

        source->close();
        out = capture.finish();
        return CaptureResult::CAPTURED;
    }

    std::string transcribeBuffer(const audio::CommandBuffer& buffer) {
        setState(ListenerState::TRANSCRIBING);
        std::cout << "[WakeLoop] Transcribing " << buffer.durationSeconds() << "s of audio..." << std::endl;

        try {
            return transcriber->transcribe(buffer);
        } catch (const std::exception& e) {
            reportError(std::string("Transcription failed: ") + e.what());
            return "";
        }
    }

    // false only when the capture stream could not be opened
    bool handleCommand(std::chrono::milliseconds silence_timeout, std::chrono::milliseconds phrase_limit) {
        audio::CommandBuffer buffer;
        CaptureResult result = captureCommand(silence_timeout, phrase_limit, buffer);

        if (result == CaptureResult::DEVICE_LOST) return false;
        if (result == CaptureResult::ABORTED) return true;

        if (buffer.empty()) {
            std::cout << "[WakeLoop] No command audio captured" << std::endl;
            return true;
        }

        // The deadline can fire on the same read a stop raced with
        if (stop_requested) {
            std::cout << "[WakeLoop] Stop requested, command discarded" << std::endl;
            return true;
        }

        saveDebugAudio(buffer);

        std::string text = transcribeBuffer(buffer);
        if (text.empty()) {
            std::cout << "[WakeLoop] No command recognized" << std::endl;
            return true;
        }

        std::cout << "[WakeLoop] Command: " << text << std::endl;
        if (callbacks.onCommand) {
            callbacks.onCommand(text);
        }

        if (stop_requested) {
            return true;
        }

        setState(ListenerState::DISPATCHING);
        dispatch::DispatchOutcome outcome = bridge->dispatch(text);
        if (outcome != dispatch::DispatchOutcome::COMPLETED) {
            std::cerr << "[WakeLoop] Dispatch " << dispatch::toString(outcome)
                      << " for \"" << text << "\"" << std::endl;
        }
        return true;
    }

    void saveDebugAudio(const audio::CommandBuffer& buffer) {
        if (config.debug_audio_dir.empty()) return;

        std::time_t t = std::time(nullptr);
        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);

        std::ostringstream name;
        name << config.debug_audio_dir << "/command_"
             << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << "_" << ++debug_capture_count << ".wav";

        if (audio::writeWav(name.str(), buffer.samples(), buffer.sample_rate)) {
            std::cout << "[WakeLoop] Command audio saved to " << name.str() << std::endl;
        }
    }

    std::string listenOnce() {
        if (!source || !transcriber || !transcriber->isReady()) {
            std::cerr << "[WakeLoop] Warning: listenOnce needs an audio source and a transcriber" << std::endl;
            return "";
        }
        if (once_active.exchange(true)) {
            std::cerr << "[WakeLoop] Warning: listenOnce already in progress" << std::endl;
            return "";
        }
        if (running) {
            once_active = false;
            std::cerr << "[WakeLoop] Warning: listenOnce refused while the loop is running" << std::endl;
            return "";
        }

        stop_requested = false;
        std::string text;

        try {
            audio::CommandBuffer buffer;
            CaptureResult result = captureCommand(config.once_silence_timeout, config.once_phrase_limit, buffer);

            if (result == CaptureResult::CAPTURED && !buffer.empty()) {
                saveDebugAudio(buffer);
                text = transcribeBuffer(buffer);
            } else if (result == CaptureResult::CAPTURED) {
                std::cout << "[WakeLoop] No speech captured" << std::endl;
            }
        } catch (const std::exception& e) {
            reportError(std::string("listenOnce failed: ") + e.what());
        }

        source->close();
        setState(ListenerState::STOPPED);
        once_active = false;

        if (!text.empty()) {
            std::cout << "[WakeLoop] You said: " << text << std::endl;
        }
        return text;
    }

    void requestStop() {
        stop_requested = true;
        if (worker_thread.joinable() && worker_thread.get_id() != std::this_thread::get_id()) {
            worker_thread.join();
        }
    }
};

WakeLoop::WakeLoop(std::unique_ptr<audio::AudioSource> source,
                   std::unique_ptr<wakeword::KeywordSpotter> spotter,
                   std::unique_ptr<stt::Transcriber> transcriber,
                   std::unique_ptr<dispatch::DispatchBridge> bridge,
                   ListenerConfig config,
                   std::unique_ptr<audio::SoundDetector> detector)
    : impl_(std::make_unique<Impl>(std::move(source), std::move(spotter), std::move(transcriber),
                                   std::move(bridge), std::move(config), std::move(detector))) {
}

WakeLoop::~WakeLoop() {
    stop();
}

bool WakeLoop::start() {
    if (impl_->running) {
        return true;
    }

    // Previous run ended by itself (device lost)
    if (impl_->worker_thread.joinable()) {
        impl_->worker_thread.join();
    }

    if (!impl_->begin()) {
        return false;
    }

    impl_->worker_thread = std::thread([this]() { impl_->loop(); });
    return true;
}

bool WakeLoop::run() {
    if (impl_->running) {
        std::cerr << "[WakeLoop] Warning: already running" << std::endl;
        return false;
    }
    if (!impl_->begin()) {
        return false;
    }
    impl_->loop();
    return true;
}

void WakeLoop::stop() {
    impl_->requestStop();
}

std::string WakeLoop::listenOnce() {
    return impl_->listenOnce();
}

ListenerStatus WakeLoop::status() const {
    ListenerStatus s;
    s.is_listening = impl_->is_listening;
    s.is_capturing = impl_->is_capturing;
    s.enabled = isEnabled();
    s.state = impl_->state;
    return s;
}

ListenerState WakeLoop::state() const {
    return impl_->state;
}

bool WakeLoop::isRunning() const {
    return impl_->running;
}

bool WakeLoop::isEnabled() const {
    return impl_->configured && !impl_->device_lost;
}

std::string WakeLoop::lastError() const {
    return impl_->lastError();
}

audio::StreamParams WakeLoop::streamParams() const {
    return impl_->stream_params;
}

void WakeLoop::setCallbacks(ListenerCallbacks callbacks) {
    impl_->callbacks = std::move(callbacks);
}

} // namespace hark
