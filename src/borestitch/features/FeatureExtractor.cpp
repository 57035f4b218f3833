#include "borestitch/features/FeatureExtractor.hpp"
#include "borestitch/core/Errors.hpp"
#include "borestitch/core/Log.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>

namespace borestitch {

cv::Mat normalizeForDetection(const cv::Mat& frame, const FeatureOptions& opt) {
    CV_Assert(!frame.empty() && frame.depth() == CV_8U);

    cv::Mat gray;
    if (frame.channels() == 1) {
        gray = frame;
    } else {
        int code = (frame.channels() == 4) ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY;
        cv::cvtColor(frame, gray, code);
    }

    const int grid = std::max(1, opt.claheTileGrid);
    cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(opt.claheClipLimit, cv::Size(grid, grid));
    cv::Mat eq;
    clahe->apply(gray, eq);
    return eq;
}

KeypointSet extractFeatures(const cv::Mat& frame, IFeatureDetector& detector,
                            const FeatureOptions& opt)
{
    if (frame.empty()) return {};
    return detector.detect(normalizeForDetection(frame, opt));
}

std::vector<KeypointSet> extractAll(const std::vector<cv::Mat>& frames,
                                    const FeatureOptions& opt,
                                    std::size_t workers,
                                    std::stop_token stop)
{
    std::vector<KeypointSet> out(frames.size());
    if (frames.empty()) return out;

    // resolve once so every worker builds the same backend
    const DetectorType type = resolveDetectorType(opt.detector);

    std::size_t n = workers ? workers : std::max(1u, std::thread::hardware_concurrency());
    n = std::min(n, frames.size());

    std::atomic<std::size_t> next{0};
    std::atomic<bool> cancelled{false};
    std::vector<std::exception_ptr> errors(n);

    auto work = [&](std::size_t slot) {
        try {
            auto detector = makeDetector(type, opt);
            for (;;) {
                if (stop.stop_requested()) { cancelled = true; return; }
                const std::size_t i = next.fetch_add(1);
                if (i >= frames.size()) return;
                out[i] = extractFeatures(frames[i], *detector, opt);
            }
        } catch (...) {
            errors[slot] = std::current_exception();
        }
    };

    if (n == 1) {
        work(0);
    } else {
        std::vector<std::thread> pool;
        pool.reserve(n);
        for (std::size_t s = 0; s < n; ++s) pool.emplace_back(work, s);
        for (auto& t : pool) t.join();
    }

    for (auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }
    if (cancelled) throw Cancelled("feature extraction cancelled");

    for (std::size_t i = 0; i < out.size(); ++i) {
        logger()->debug("frame {}: {} keypoints ({})", i, out[i].size(), detectorName(type));
    }
    return out;
}

} // namespace borestitch
