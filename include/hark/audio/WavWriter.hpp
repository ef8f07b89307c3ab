/**
 * WavWriter.hpp - 16-bit PCM mono WAV output for captured commands
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hark::audio {

/**
 * Write a canonical 44-byte-header WAV file. Creates parent directories.
 * @return false if the file could not be written
 */
bool writeWav(const std::string& path, const std::vector<int16_t>& samples, int sample_rate);

} // namespace hark::audio
