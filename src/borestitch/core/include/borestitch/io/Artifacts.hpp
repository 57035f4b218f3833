#pragma once

#include "borestitch/core/Config.hpp"
#include "borestitch/core/Stitcher.hpp"

#include <string>
#include <vector>

namespace borestitch {

// Offsets file: NumPy .npy, format version 1.0.
//
//   char     magic[6] = "\x93NUMPY"
//   uint8_t  major = 1, minor = 0
//   uint16_t header_len            (little-endian)
//   char     header[header_len]    python dict literal, space padded,
//                                  ends with '\n', total prefix % 64 == 0
//   float    data[n]               '<f4', C order, 1-D shape (n,)

/// Throws std::runtime_error if the file cannot be written.
void writeOffsetsNpy(const std::string& path, const std::vector<int>& offsets);

/// Throws std::runtime_error for a missing file or anything but a 1-D '<f4' array.
std::vector<float> readOffsetsNpy(const std::string& path);

/// Files written by saveArtifacts (offsets empty unless saveIntermediate).
struct ArtifactPaths {
    std::string panorama;
    std::string offsets;
};

/**
 * Write `dir`/panorama.png (lossless) and, with cfg.saveIntermediate,
 * `dir`/offsets.npy. The directory is created if needed.
 * Throws std::runtime_error on I/O failure or an empty panorama.
 */
ArtifactPaths saveArtifacts(const std::string& dir, const StitchResult& result, const Config& cfg);

} // namespace borestitch
