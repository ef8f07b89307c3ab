/**
 * VoiceAssistant.hpp - Builds the voice pipeline from VoiceSettings
 *
 * Connects: PortAudioSource → KeywordSpotter (Porcupine) → Endpointer →
 *           Transcriber (whisper.cpp) → DispatchBridge → QueryClient
 */

#pragma once

#include "hark/Config.hpp"
#include "hark/Types.hpp"
#include "hark/WakeLoop.hpp"
#include "hark/audio/SoundDetector.hpp"
#include "hark/wakeword/KeywordSpotter.hpp"

#include <memory>
#include <string>

namespace hark {

class VoiceAssistant {
public:
    explicit VoiceAssistant(VoiceSettings settings);
    ~VoiceAssistant();

    VoiceAssistant(const VoiceAssistant&) = delete;
    VoiceAssistant& operator=(const VoiceAssistant&) = delete;

    /**
     * Load the models and open the engines.
     * @return false if the transcriber or audio backend is unusable. A
     *         wake-word failure only disables the wake-word feature.
     */
    bool initialize();

    bool start();
    bool run();
    void stop();
    std::string listenOnce();

    ListenerStatus status() const;
    bool isWakeWordEnabled() const;

    /** Router reachable at router_url. */
    bool isRouterHealthy();

    void setCallbacks(ListenerCallbacks callbacks);

    const VoiceSettings& settings() const;

    // Settings → component options

    static ListenerConfig listenerConfig(const VoiceSettings& settings);
    static wakeword::KeywordSpotterOptions spotterOptions(const VoiceSettings& settings);

    /** "webrtc" selects libfvad when it initializes, otherwise the energy floor. */
    static std::unique_ptr<audio::SoundDetector> makeDetector(const VoiceSettings& settings);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hark
