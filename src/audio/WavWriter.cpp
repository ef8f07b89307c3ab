/**
 * WavWriter.cpp - Minimal RIFF/WAVE writer
 */

#include "hark/audio/WavWriter.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace hark::audio {

namespace {

void putU32(std::ofstream& out, uint32_t v) {
    const char bytes[4] = {
        static_cast<char>(v & 0xff),
        static_cast<char>((v >> 8) & 0xff),
        static_cast<char>((v >> 16) & 0xff),
        static_cast<char>((v >> 24) & 0xff)
    };
    out.write(bytes, 4);
}

void putU16(std::ofstream& out, uint16_t v) {
    const char bytes[2] = {
        static_cast<char>(v & 0xff),
        static_cast<char>((v >> 8) & 0xff)
    };
    out.write(bytes, 2);
}

} // namespace

bool writeWav(const std::string& path, const std::vector<int16_t>& samples, int sample_rate) {
    std::filesystem::path file(path);
    if (file.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec) {
            std::cerr << "[WAV] Cannot create " << file.parent_path() << ": " << ec.message() << std::endl;
            return false;
        }
    }

    std::ofstream out(path, std::ios::binary);
    if (!out.good()) {
        std::cerr << "[WAV] Cannot open " << path << " for writing" << std::endl;
        return false;
    }

    const uint16_t channels = 1;
    const uint16_t bits = 16;
    const uint32_t data_bytes = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    const uint32_t byte_rate = static_cast<uint32_t>(sample_rate) * channels * bits / 8;

    out.write("RIFF", 4);
    putU32(out, 36 + data_bytes);
    out.write("WAVE", 4);

    out.write("fmt ", 4);
    putU32(out, 16);
    putU16(out, 1);  // PCM
    putU16(out, channels);
    putU32(out, static_cast<uint32_t>(sample_rate));
    putU32(out, byte_rate);
    putU16(out, channels * bits / 8);
    putU16(out, bits);

    out.write("data", 4);
    putU32(out, data_bytes);
    for (int16_t s : samples) {
        putU16(out, static_cast<uint16_t>(s));
    }

    if (!out.good()) {
        std::cerr << "[WAV] Write failed: " << path << std::endl;
        return false;
    }
    return true;
}

} // namespace hark::audio
