//====================================================================
// File: core/include/borestitch/core/Frame.hpp
//====================================================================
#pragma once


#include <opencv2/core.hpp>

#include <span>
#include <cstdint>
#include <chrono>


namespace borestitch {


/// Pixel storage layouts that the pipeline currently understands.
enum class PixelFormat : std::uint8_t {
Gray8 = 0, ///< 8-bit grayscale, 1 byte per pixel
BGR24,     ///< 24-bit BGR, 3 bytes per pixel, interleaved
BGRA32     ///< 32-bit BGRA, 4 bytes per pixel
};


/// Lightweight view of a single borescope frame. The caller owns the bytes.
struct Frame {
std::span<const std::uint8_t> data{}; ///< read-only pixel buffer
std::uint32_t width{0};
std::uint32_t height{0};
std::chrono::steady_clock::time_point timestamp{};
PixelFormat format{PixelFormat::BGR24};


/// Expected byte size for the declared geometry; used to check the buffer.
[[nodiscard]] std::size_t bytes() const noexcept {
switch (format) {
case PixelFormat::Gray8: return static_cast<std::size_t>(width) * height;
case PixelFormat::BGR24: return static_cast<std::size_t>(width) * height * 3;
case PixelFormat::BGRA32: return static_cast<std::size_t>(width) * height * 4;
default: return 0;
}
}
};


/// Throws InputError if the declared geometry does not match the buffer.
void validateFrame(const Frame& f);

/// Deep copy of the frame as an owned CV_8UC3 (BGR) matrix.
cv::Mat toBgr8(const Frame& f);

/// Non-owning Frame view over a continuous CV_8UC1 / CV_8UC3 / CV_8UC4 matrix.
/// The matrix must outlive the returned view.
Frame frameView(const cv::Mat& m);


} // namespace borestitch
