/**
 * Config.cpp - JSON settings loading
 */

#include "hark/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace hark {

namespace {

template <typename T>
void readField(const json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        std::cerr << "[Config] Warning: ignoring \"" << key << "\": " << e.what() << std::endl;
    }
}

void readPositive(const json& section, const char* key, double& target) {
    double value = target;
    readField(section, key, value);
    if (value > 0.0) {
        target = value;
    } else {
        std::cerr << "[Config] Warning: \"" << key << "\" must be positive, keeping "
                  << target << std::endl;
    }
}

std::string trimKey(std::string key) {
    while (!key.empty() && (key.back() == '\n' || key.back() == '\r' || key.back() == ' ')) {
        key.pop_back();
    }
    return key;
}

} // namespace

VoiceSettings parseVoiceSettings(const std::string& json_text) {
    VoiceSettings settings;

    json root = json::parse(json_text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        std::cerr << "[Config] Warning: settings are not a JSON object, using defaults" << std::endl;
        return settings;
    }

    auto it = root.find("voice_settings");
    if (it == root.end() || !it->is_object()) {
        return settings;
    }
    const json& voice = *it;

    readField(voice, "wakeword_enabled", settings.wakeword_enabled);
    readField(voice, "picovoice_access_key", settings.access_key);
    readField(voice, "picovoice_keywords", settings.keywords);
    readField(voice, "picovoice_keyword_paths", settings.keyword_paths);
    readField(voice, "picovoice_sensitivities", settings.sensitivities);
    readField(voice, "porcupine_model_path", settings.porcupine_model);
    readField(voice, "porcupine_keyword_dir", settings.keyword_dir);

    readField(voice, "sample_rate", settings.sample_rate);
    readField(voice, "input_device", settings.input_device);

    readPositive(voice, "wakeword_post_silence_timeout", settings.post_wake_silence_timeout);
    readPositive(voice, "wakeword_post_phrase_time_limit", settings.post_wake_phrase_limit);
    readPositive(voice, "stt_silence_timeout", settings.stt_silence_timeout);
    readPositive(voice, "stt_phrase_time_limit", settings.stt_phrase_limit);
    readPositive(voice, "dispatch_timeout", settings.dispatch_timeout);

    int max_timeouts = settings.max_read_timeouts;
    readField(voice, "max_read_timeouts", max_timeouts);
    if (max_timeouts > 0) {
        settings.max_read_timeouts = max_timeouts;
    } else {
        std::cerr << "[Config] Warning: \"max_read_timeouts\" must be positive" << std::endl;
    }

    std::string vad_mode = settings.vad_mode;
    readField(voice, "vad_mode", vad_mode);
    if (vad_mode == "energy" || vad_mode == "webrtc") {
        settings.vad_mode = vad_mode;
    } else {
        std::cerr << "[Config] Warning: unknown vad_mode \"" << vad_mode << "\", using "
                  << settings.vad_mode << std::endl;
    }
    readField(voice, "vad_energy_threshold", settings.energy_threshold);
    readField(voice, "fvad_mode", settings.fvad_mode);

    readField(voice, "whisper_model", settings.whisper_model);
    readField(voice, "whisper_language", settings.language);
    readField(voice, "whisper_threads", settings.whisper_threads);

    readField(voice, "router_url", settings.router_url);
    readField(voice, "debug_audio_dir", settings.debug_audio_dir);

    return settings;
}

VoiceSettings loadVoiceSettings(const std::string& path) {
    std::ifstream file(path);
    if (!file.good()) {
        std::cerr << "[Config] Warning: " << path << " not found, using defaults" << std::endl;
        return VoiceSettings{};
    }

    std::stringstream contents;
    contents << file.rdbuf();

    std::cout << "[Config] Loaded " << path << std::endl;
    return parseVoiceSettings(contents.str());
}

void resolveAccessKey(VoiceSettings& settings, const std::string& key_file) {
    const char* env_key = std::getenv("PICOVOICE_ACCESS_KEY");
    if (env_key && *env_key) {
        settings.access_key = env_key;
        return;
    }

    if (!settings.access_key.empty()) {
        return;
    }

    std::ifstream file(key_file);
    if (file.good()) {
        std::string key;
        std::getline(file, key);
        settings.access_key = trimKey(key);
    }
}

} // namespace hark
