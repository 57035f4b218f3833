#include "borestitch/io/Artifacts.hpp"
#include "borestitch/core/Log.hpp"

#include <opencv2/imgcodecs.hpp>

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace borestitch {

namespace {
constexpr char kMagic[6] = {'\x93', 'N', 'U', 'M', 'P', 'Y'};
constexpr std::size_t kPrefix = sizeof(kMagic) + 2 + 2;   // magic, version, header_len
constexpr std::size_t kAlign = 64;

void putU16le(std::ofstream& ofs, std::uint16_t v) {
    const char b[2] = {char(v & 0xFF), char((v >> 8) & 0xFF)};
    ofs.write(b, 2);
}

void putF32le(std::ofstream& ofs, float f) {
    std::uint32_t u;
    std::memcpy(&u, &f, sizeof(u));
    const char b[4] = {char(u & 0xFF), char((u >> 8) & 0xFF), char((u >> 16) & 0xFF), char((u >> 24) & 0xFF)};
    ofs.write(b, 4);
}

float getF32le(const unsigned char* b) {
    const std::uint32_t u = std::uint32_t(b[0]) | (std::uint32_t(b[1]) << 8) |
                            (std::uint32_t(b[2]) << 16) | (std::uint32_t(b[3]) << 24);
    float f;
    std::memcpy(&f, &u, sizeof(f));
    return f;
}
} // namespace

void writeOffsetsNpy(const std::string& path, const std::vector<int>& offsets)
{
    std::string header = "{'descr': '<f4', 'fortran_order': False, 'shape': (" +
                         std::to_string(offsets.size()) + ",), }";
    // pad with spaces so data starts on a 64-byte boundary, newline last
    const std::size_t total = kPrefix + header.size() + 1;
    header.append((kAlign - total % kAlign) % kAlign, ' ');
    header.push_back('\n');

    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) throw std::runtime_error("cannot open " + path + " for writing");

    ofs.write(kMagic, sizeof(kMagic));
    ofs.put(char(1));
    ofs.put(char(0));
    putU16le(ofs, static_cast<std::uint16_t>(header.size()));
    ofs.write(header.data(), static_cast<std::streamsize>(header.size()));
    for (int v : offsets) putF32le(ofs, static_cast<float>(v));

    if (!ofs) throw std::runtime_error("failed writing " + path);
}

/* Pull the integer n out of "'shape': (n,)". */
static std::size_t parseShape(const std::string& header, const std::string& path)
{
    const auto key = header.find("'shape'");
    const auto open = header.find('(', key == std::string::npos ? 0 : key);
    const auto close = header.find(')', open == std::string::npos ? 0 : open);
    if (key == std::string::npos || open == std::string::npos || close == std::string::npos)
        throw std::runtime_error(path + ": npy header has no shape");

    std::string dims = header.substr(open + 1, close - open - 1);
    if (!dims.empty() && dims.back() == ',') dims.pop_back();
    if (dims.empty() || dims.find(',') != std::string::npos)
        throw std::runtime_error(path + ": expected a 1-D array");
    try {
        return static_cast<std::size_t>(std::stoull(dims));
    } catch (const std::logic_error&) {
        throw std::runtime_error(path + ": bad shape '" + dims + "'");
    }
}

std::vector<float> readOffsetsNpy(const std::string& path)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) throw std::runtime_error("cannot open " + path);

    unsigned char pre[kPrefix];
    ifs.read(reinterpret_cast<char*>(pre), kPrefix);
    if (!ifs || std::memcmp(pre, kMagic, sizeof(kMagic)) != 0)
        throw std::runtime_error(path + ": not an npy file");
    if (pre[6] != 1) throw std::runtime_error(path + ": unsupported npy version");

    const std::size_t hlen = std::size_t(pre[8]) | (std::size_t(pre[9]) << 8);
    std::string header(hlen, '\0');
    ifs.read(header.data(), static_cast<std::streamsize>(hlen));
    if (!ifs) throw std::runtime_error(path + ": truncated npy header");

    if (header.find("'descr': '<f4'") == std::string::npos)
        throw std::runtime_error(path + ": expected little-endian float32 data");
    if (header.find("'fortran_order': False") == std::string::npos)
        throw std::runtime_error(path + ": fortran order is not supported");
    const std::size_t n = parseShape(header, path);

    std::vector<unsigned char> raw(n * 4);
    ifs.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size()));
    if (!ifs) throw std::runtime_error(path + ": truncated npy data");

    std::vector<float> out(n);
    for (std::size_t i = 0; i < n; ++i) out[i] = getF32le(raw.data() + 4 * i);
    return out;
}

ArtifactPaths saveArtifacts(const std::string& dir, const StitchResult& result, const Config& cfg)
{
    if (result.panorama.empty()) throw std::runtime_error("no panorama to save");

    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw std::runtime_error("cannot create " + dir + ": " + ec.message());

    ArtifactPaths out;
    out.panorama = (fs::path(dir) / "panorama.png").string();
    // PNG is lossless; level 3 keeps writes fast on tall panoramas
    if (!cv::imwrite(out.panorama, result.panorama, {cv::IMWRITE_PNG_COMPRESSION, 3}))
        throw std::runtime_error("failed to write " + out.panorama);
    logger()->info("panorama saved to {} ({}x{})", out.panorama, result.panorama.cols, result.panorama.rows);

    if (cfg.saveIntermediate) {
        out.offsets = (fs::path(dir) / "offsets.npy").string();
        writeOffsetsNpy(out.offsets, result.offsets);
        logger()->info("offsets saved to {} ({} frames)", out.offsets, result.offsets.size());
    }
    return out;
}

} // namespace borestitch
