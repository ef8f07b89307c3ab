/**
 * Config.hpp - Voice settings loaded from config/settings.json
 */

#pragma once

#include <string>
#include <vector>

namespace hark {

struct VoiceSettings {
    // Wake word (Porcupine)
    bool wakeword_enabled = true;
    std::string access_key;
    std::vector<std::string> keywords = {"porcupine"};
    std::vector<std::string> keyword_paths;
    std::vector<float> sensitivities = {0.5f};
    std::string porcupine_model = "external/porcupine/lib/common/porcupine_params.pv";
    std::string keyword_dir = "external/porcupine/resources/keyword_files/linux";

    // Audio
    int sample_rate = 16000;
    int input_device = -1;

    // Capture after a wake word
    double post_wake_silence_timeout = 3.0;   // seconds
    double post_wake_phrase_limit = 7.0;      // seconds

    // One-shot capture (no wake word)
    double stt_silence_timeout = 2.0;
    double stt_phrase_limit = 10.0;

    int max_read_timeouts = 10;

    // Endpointing
    std::string vad_mode = "energy";          // "energy" or "webrtc"
    float energy_threshold = 0.01f;
    int fvad_mode = 2;

    // Transcription (whisper.cpp)
    std::string whisper_model = "models/whisper/ggml-base.en.bin";
    std::string language = "en";
    int whisper_threads = 4;

    // Dispatch
    double dispatch_timeout = 30.0;
    std::string router_url = "http://localhost:5001";

    // Empty = do not keep captured audio
    std::string debug_audio_dir;
};

/**
 * Parse the "voice_settings" object of a settings document. Unknown keys
 * are ignored; a key of the wrong type or an out-of-range value keeps its
 * default and logs a warning. Malformed JSON yields defaults.
 */
VoiceSettings parseVoiceSettings(const std::string& json_text);

/**
 * Read and parse a settings file. A missing file yields defaults.
 */
VoiceSettings loadVoiceSettings(const std::string& path);

/**
 * Fill access_key from PICOVOICE_ACCESS_KEY, or else from the first line
 * of key_file if the settings did not provide one.
 */
void resolveAccessKey(VoiceSettings& settings, const std::string& key_file = ".porcupine_key");

} // namespace hark
