/**
 * VoiceAssistant.cpp - Voice pipeline assembly
 */

#include "hark/VoiceAssistant.hpp"
#include "hark/audio/FvadDetector.hpp"
#include "hark/audio/PortAudioSource.hpp"
#include "hark/dispatch/DispatchBridge.hpp"
#include "hark/dispatch/QueryClient.hpp"
#include "hark/stt/Transcriber.hpp"
#include "hark/stt/WhisperEngine.hpp"
#include "hark/wakeword/PorcupineEngine.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>

namespace hark {

namespace {

std::chrono::milliseconds toMillis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

} // namespace

struct VoiceAssistant::Impl {
    VoiceSettings settings;

    // Declared before the loop: the bridge handler points into it
    std::unique_ptr<dispatch::QueryClient> client;
    std::unique_ptr<WakeLoop> loop;

    explicit Impl(VoiceSettings s) : settings(std::move(s)) {}
};

VoiceAssistant::VoiceAssistant(VoiceSettings settings)
    : impl_(std::make_unique<Impl>(std::move(settings))) {
}

VoiceAssistant::~VoiceAssistant() {
    stop();
}

bool VoiceAssistant::initialize() {
    if (impl_->loop) {
        return true;
    }
    const VoiceSettings& s = impl_->settings;

    std::cout << "[Assistant] Initializing..." << std::endl;

    // Audio backend
    auto source = std::make_unique<audio::PortAudioSource>();
    if (!source->initialize()) {
        std::cerr << "[Assistant] Audio backend unavailable: " << source->lastError() << std::endl;
        return false;
    }

    // Transcription
    std::cout << "[Assistant] Loading Whisper model: " << s.whisper_model << std::endl;
    auto transcriber = std::make_unique<stt::Transcriber>(
        std::make_unique<stt::WhisperEngine>(s.whisper_model, s.language, s.whisper_threads));
    if (!transcriber->isReady()) {
        std::cerr << "[Assistant] Whisper model failed to load" << std::endl;
        return false;
    }
    if (transcriber->sampleRate() != s.sample_rate) {
        std::cerr << "[Assistant] sample_rate " << s.sample_rate << " does not match the "
                  << transcriber->sampleRate() << " Hz transcription model" << std::endl;
        return false;
    }

    // Wake word
    std::unique_ptr<wakeword::KeywordSpotter> spotter;
    if (s.wakeword_enabled) {
        std::cout << "[Assistant] Porcupine " << wakeword::PorcupineEngine::getVersion() << std::endl;
        spotter = std::make_unique<wakeword::KeywordSpotter>(spotterOptions(s));
        if (!spotter->isReady()) {
            std::cerr << "[Assistant] Warning: wake word disabled: " << spotter->lastError() << std::endl;
        }
    } else {
        std::cout << "[Assistant] Wake word disabled in settings" << std::endl;
    }

    // Dispatch
    impl_->client = std::make_unique<dispatch::QueryClient>(
        s.router_url, static_cast<int>(s.dispatch_timeout * 1000.0));
    auto bridge = std::make_unique<dispatch::DispatchBridge>(
        impl_->client->handler(), toMillis(s.dispatch_timeout));
    bridge->setResponseCallback([](const std::string& command, const std::string& response) {
        std::cout << "[Assistant] \"" << command << "\" → " << response << std::endl;
    });

    impl_->loop = std::make_unique<WakeLoop>(
        std::move(source), std::move(spotter), std::move(transcriber), std::move(bridge),
        listenerConfig(s), makeDetector(s));

    std::cout << "[Assistant] Ready (wake word "
              << (impl_->loop->isEnabled() ? "enabled" : "disabled") << ")" << std::endl;
    return true;
}

bool VoiceAssistant::start() {
    if (!impl_->loop) {
        std::cerr << "[Assistant] Not initialized" << std::endl;
        return false;
    }
    return impl_->loop->start();
}

bool VoiceAssistant::run() {
    if (!impl_->loop) {
        std::cerr << "[Assistant] Not initialized" << std::endl;
        return false;
    }
    return impl_->loop->run();
}

void VoiceAssistant::stop() {
    if (impl_->loop) {
        impl_->loop->stop();
    }
}

std::string VoiceAssistant::listenOnce() {
    if (!impl_->loop) {
        std::cerr << "[Assistant] Not initialized" << std::endl;
        return "";
    }
    return impl_->loop->listenOnce();
}

ListenerStatus VoiceAssistant::status() const {
    if (!impl_->loop) {
        return ListenerStatus{};
    }
    return impl_->loop->status();
}

bool VoiceAssistant::isWakeWordEnabled() const {
    return impl_->loop && impl_->loop->isEnabled();
}

bool VoiceAssistant::isRouterHealthy() {
    return impl_->client && impl_->client->isHealthy();
}

void VoiceAssistant::setCallbacks(ListenerCallbacks callbacks) {
    if (impl_->loop) {
        impl_->loop->setCallbacks(std::move(callbacks));
    }
}

const VoiceSettings& VoiceAssistant::settings() const {
    return impl_->settings;
}

ListenerConfig VoiceAssistant::listenerConfig(const VoiceSettings& settings) {
    ListenerConfig config;
    config.silence_timeout = toMillis(settings.post_wake_silence_timeout);
    config.phrase_limit = toMillis(settings.post_wake_phrase_limit);
    config.once_silence_timeout = toMillis(settings.stt_silence_timeout);
    config.once_phrase_limit = toMillis(settings.stt_phrase_limit);
    config.max_read_timeouts = settings.max_read_timeouts;
    config.input_device = settings.input_device;
    config.debug_audio_dir = settings.debug_audio_dir;
    return config;
}

wakeword::KeywordSpotterOptions VoiceAssistant::spotterOptions(const VoiceSettings& settings) {
    wakeword::KeywordSpotterOptions options;
    options.access_key = settings.access_key;
    options.keyword_paths = settings.keyword_paths;
    options.keywords = settings.keywords;
    options.sensitivities = settings.sensitivities;
    options.keyword_dir = settings.keyword_dir;
    options.required_sample_rate = settings.sample_rate;
    options.engine_factory = wakeword::PorcupineEngine::factory(settings.porcupine_model);
    return options;
}

std::unique_ptr<audio::SoundDetector> VoiceAssistant::makeDetector(const VoiceSettings& settings) {
    if (settings.vad_mode == "webrtc") {
        auto mode = static_cast<audio::VADMode>(std::clamp(settings.fvad_mode, 0, 3));
        auto fvad = std::make_unique<audio::FvadDetector>(settings.sample_rate, mode);
        if (fvad->isReady()) {
            return fvad;
        }
        std::cerr << "[Assistant] Warning: WebRTC VAD unavailable, using energy threshold" << std::endl;
    }
    return std::make_unique<audio::EnergyDetector>(settings.energy_threshold);
}

} // namespace hark
