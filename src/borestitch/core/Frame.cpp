#include "borestitch/core/Frame.hpp"
#include "borestitch/core/Errors.hpp"

#include <opencv2/imgproc.hpp>
#include <string>

namespace borestitch {

void validateFrame(const Frame& f) {
    if (f.width == 0 || f.height == 0) {
        throw InputError("frame has zero size");
    }
    const std::size_t expected = f.bytes();
    if (expected == 0) {
        throw InputError("unsupported pixel format");
    }
    if (f.data.size() != expected) {
        throw InputError("frame buffer size " + std::to_string(f.data.size()) +
                         " does not match declared " + std::to_string(f.width) + "x" +
                         std::to_string(f.height) + " (" + std::to_string(expected) + " bytes)");
    }
}

/* Wrap the external bytes without copying, then convert into an owned BGR
   matrix so nothing downstream aliases caller memory. */
cv::Mat toBgr8(const Frame& f) {
    validateFrame(f);
    auto* p = const_cast<std::uint8_t*>(f.data.data());
    const int h = static_cast<int>(f.height);
    const int w = static_cast<int>(f.width);

    cv::Mat out;
    switch (f.format) {
        case PixelFormat::Gray8:
            cv::cvtColor(cv::Mat(h, w, CV_8UC1, p), out, cv::COLOR_GRAY2BGR);
            break;
        case PixelFormat::BGRA32:
            cv::cvtColor(cv::Mat(h, w, CV_8UC4, p), out, cv::COLOR_BGRA2BGR);
            break;
        case PixelFormat::BGR24:
        default:
            out = cv::Mat(h, w, CV_8UC3, p).clone();
            break;
    }
    return out;
}

Frame frameView(const cv::Mat& m) {
    CV_Assert(!m.empty() && m.isContinuous() && m.depth() == CV_8U);

    Frame f{};
    f.width  = static_cast<std::uint32_t>(m.cols);
    f.height = static_cast<std::uint32_t>(m.rows);
    switch (m.channels()) {
        case 1:  f.format = PixelFormat::Gray8;  break;
        case 4:  f.format = PixelFormat::BGRA32; break;
        case 3:
        default: f.format = PixelFormat::BGR24;  break;
    }
    f.data = std::span<const std::uint8_t>(m.data, m.total() * m.elemSize());
    f.timestamp = std::chrono::steady_clock::now();
    return f;
}

} // namespace borestitch
