/**
 * hark - Main Entry Point
 *
 * Listens for a wake word, captures the spoken command, transcribes it
 * and forwards the text to the assistant's query router.
 */

#include "hark/Config.hpp"
#include "hark/VoiceAssistant.hpp"
#include "hark/audio/PortAudioSource.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

void signalHandler(int /*signal*/) {
    g_running = false;
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config <path>] [--once] [--list-devices]\n"
              << "  --config <path>   settings file (default: config/settings.json)\n"
              << "  --once            capture and transcribe one command, no wake word\n"
              << "  --list-devices    print audio input devices and exit\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/settings.json";
    bool once = false;
    bool list_devices = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--once") == 0) {
            once = true;
        } else if (std::strcmp(argv[i], "--list-devices") == 0) {
            list_devices = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "[hark] Unknown argument: " << argv[i] << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    if (list_devices) {
        for (const auto& device : hark::audio::PortAudioSource::listInputDevices()) {
            std::cout << "  " << device << std::endl;
        }
        return 0;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    hark::VoiceSettings settings = hark::loadVoiceSettings(config_path);
    hark::resolveAccessKey(settings);

    hark::VoiceAssistant assistant(settings);
    if (!assistant.initialize()) {
        std::cerr << "[hark] Initialization failed" << std::endl;
        return 1;
    }

    if (!assistant.isRouterHealthy()) {
        std::cerr << "[hark] Warning: router not reachable at " << settings.router_url << std::endl;
    }

    if (once) {
        std::string text = assistant.listenOnce();
        return text.empty() ? 2 : 0;
    }

    if (!assistant.start()) {
        std::cerr << "[hark] Wake word listener could not start" << std::endl;
        return 1;
    }

    // Signal handlers only flip the flag; the stop itself happens here
    while (g_running && assistant.status().state != hark::ListenerState::STOPPED) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[hark] Shutting down..." << std::endl;
    assistant.stop();

    std::cout << "[hark] Goodbye!" << std::endl;
    return 0;
}
