/**
 * PortAudioSource.cpp - PortAudio wrapper implementation
 *
 * Opens a single int16 mono input stream and reads it with the blocking
 * API. Reads poll Pa_GetStreamReadAvailable so that a stalled device
 * returns TIMED_OUT instead of blocking shutdown.
 */

#include "hark/audio/PortAudioSource.hpp"

#include <portaudio.h>

#include <chrono>
#include <iostream>
#include <thread>

namespace hark::audio {

// Poll interval while waiting for a full frame
constexpr std::chrono::milliseconds READ_POLL_INTERVAL{2};

struct PortAudioSource::Impl {
    PaStream* stream = nullptr;
    StreamParams params;
    bool initialized = false;
    std::string lastError;

    void fail(const std::string& what, PaError err) {
        lastError = what + ": " + Pa_GetErrorText(err);
        std::cerr << "[AudioSource] " << lastError << std::endl;
    }
};

PortAudioSource::PortAudioSource()
    : pImpl_(std::make_unique<Impl>())
{
}

PortAudioSource::~PortAudioSource() {
    close();

    if (pImpl_->initialized) {
        Pa_Terminate();
    }
}

bool PortAudioSource::initialize() {
    if (pImpl_->initialized) {
        return true;
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        pImpl_->fail("Pa_Initialize failed", err);
        return false;
    }

    pImpl_->initialized = true;

    int defaultInput = Pa_GetDefaultInputDevice();
    if (defaultInput >= 0) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(defaultInput);
        std::cout << "[AudioSource] Default input: " << info->name << std::endl;
    }

    return true;
}

bool PortAudioSource::open(const StreamParams& params) {
    if (pImpl_->stream) {
        pImpl_->lastError = "Stream already open";
        std::cerr << "[AudioSource] " << pImpl_->lastError << std::endl;
        return false;
    }

    if (!pImpl_->initialized && !initialize()) {
        return false;
    }

    PaStreamParameters inputParams;
    inputParams.device = (params.device >= 0)
        ? params.device
        : Pa_GetDefaultInputDevice();

    if (inputParams.device == paNoDevice || inputParams.device >= Pa_GetDeviceCount()) {
        pImpl_->lastError = "No input device available";
        std::cerr << "[AudioSource] " << pImpl_->lastError << std::endl;
        return false;
    }

    inputParams.channelCount = params.channels;
    inputParams.sampleFormat = paInt16;
    inputParams.suggestedLatency = Pa_GetDeviceInfo(inputParams.device)->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    // Blocking stream: no callback
    PaError err = Pa_OpenStream(
        &pImpl_->stream,
        &inputParams,
        nullptr,
        params.sample_rate,
        params.frame_length,
        paClipOff,
        nullptr,
        nullptr
    );

    if (err != paNoError) {
        pImpl_->stream = nullptr;
        pImpl_->fail("Pa_OpenStream failed", err);
        return false;
    }

    err = Pa_StartStream(pImpl_->stream);
    if (err != paNoError) {
        pImpl_->fail("Pa_StartStream failed", err);
        Pa_CloseStream(pImpl_->stream);
        pImpl_->stream = nullptr;
        return false;
    }

    pImpl_->params = params;
    return true;
}

ReadStatus PortAudioSource::readFrame(AudioFrame& frame, std::chrono::milliseconds timeout) {
    if (!pImpl_->stream) {
        pImpl_->lastError = "Stream not open";
        return ReadStatus::DEVICE_ERROR;
    }

    const long needed = pImpl_->params.frame_length;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        long available = Pa_GetStreamReadAvailable(pImpl_->stream);
        if (available < 0) {
            pImpl_->fail("Pa_GetStreamReadAvailable failed", static_cast<PaError>(available));
            return ReadStatus::DEVICE_ERROR;
        }
        if (available >= needed) {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return ReadStatus::TIMED_OUT;
        }
        std::this_thread::sleep_for(READ_POLL_INTERVAL);
    }

    frame.resize(static_cast<size_t>(needed) * pImpl_->params.channels);
    PaError err = Pa_ReadStream(pImpl_->stream, frame.data(), needed);

    if (err == paInputOverflowed) {
        return ReadStatus::OVERRUN;
    }
    if (err != paNoError) {
        pImpl_->fail("Pa_ReadStream failed", err);
        return ReadStatus::DEVICE_ERROR;
    }
    return ReadStatus::OK;
}

void PortAudioSource::close() {
    if (!pImpl_->stream) {
        return;
    }

    Pa_StopStream(pImpl_->stream);
    Pa_CloseStream(pImpl_->stream);
    pImpl_->stream = nullptr;
}

bool PortAudioSource::isOpen() const {
    return pImpl_->stream != nullptr;
}

std::string PortAudioSource::lastError() const {
    return pImpl_->lastError;
}

std::vector<std::string> PortAudioSource::listInputDevices() {
    std::vector<std::string> devices;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        return devices;
    }

    int numDevices = Pa_GetDeviceCount();
    for (int i = 0; i < numDevices; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxInputChannels > 0) {
            devices.push_back(std::to_string(i) + ": " + info->name);
        }
    }

    Pa_Terminate();
    return devices;
}

} // namespace hark::audio
