#include "borestitch/compose/Canvas.hpp"
#include "borestitch/core/Log.hpp"

#include <algorithm>
#include <stdexcept>

namespace borestitch {

CanvasCompositor::CanvasCompositor(const std::vector<cv::Size>& frameSizes,
                                   const std::vector<int>& offsets,
                                   const ComposeOptions& opt,
                                   const BlendOptions& blend)
    : sizes_(frameSizes), offsets_(offsets), opt_(opt), blend_(blend)
{
    if (sizes_.size() != offsets_.size())
        throw std::invalid_argument("CanvasCompositor: one offset per frame is required");
    if (sizes_.empty())
        throw std::invalid_argument("CanvasCompositor: no frames");

    int rows = 0, cols = 0;
    for (std::size_t i = 0; i < sizes_.size(); ++i) {
        rows = std::max(rows, offsets_[i] + sizes_[i].height);
        cols = std::max(cols, sizes_[i].width);
    }
    rows += std::max(0, opt_.marginRows);
    CV_Assert(rows > 0 && cols > 0);

    canvas_ = cv::Mat::zeros(rows, cols, CV_32FC3);
    filled_.assign(std::size_t(rows), 0);
    reports_.reserve(sizes_.size());
    logger()->debug("canvas {}x{} for {} frames", cols, rows, sizes_.size());
}

void CanvasCompositor::copyRows(const cv::Mat& frameF, int frameRow0, int canvasRow0, int rows)
{
    if (rows <= 0) return;
    frameF.rowRange(frameRow0, frameRow0 + rows)
          .copyTo(canvas_(cv::Range(canvasRow0, canvasRow0 + rows), cv::Range(0, frameF.cols)));
}

/* Longest run of filled rows inside [begin, end); empty range if none. */
cv::Range CanvasCompositor::longestFilledRun(int begin, int end) const
{
    cv::Range best(begin, begin);
    int runStart = -1;
    for (int y = begin; y <= end; ++y) {
        const bool on = y < end && filled_[std::size_t(y)];
        if (on && runStart < 0) runStart = y;
        if (!on && runStart >= 0) {
            if (y - runStart > best.size()) best = cv::Range(runStart, y);
            runStart = -1;
        }
    }
    return best;
}

/*
  Place one frame.

  - Outside the canvas (negative offset, bottom past the last row) -> skipped.
  - First placed frame -> copied.
  - Otherwise the longest run of already filled rows under the frame forms
    the overlap band; every other row of the frame is copied. Bands taller
    than minBlendRows are blended, and the blend residual at the band edge
    is faded out over transitionRows of the new rows so the boundary does
    not step. Shorter overlaps are overwritten.
*/
PlacementReport CanvasCompositor::place(std::size_t index, const cv::Mat& frame8)
{
    if (index >= sizes_.size())
        throw std::out_of_range("CanvasCompositor::place: frame index out of range");

    PlacementReport r;
    r.index = index;
    r.offset = offsets_[index];

    const int y0 = r.offset;
    if (frame8.type() != CV_8UC3 || frame8.size() != sizes_[index] ||
        y0 < 0 || y0 + frame8.rows > canvas_.rows || frame8.cols > canvas_.cols) {
        logger()->warn("frame {}: placement at row {} ({}x{}) does not fit the {}x{} canvas, skipped",
                       index, y0, frame8.cols, frame8.rows, canvas_.cols, canvas_.rows);
        r.skipped = true;
        reports_.push_back(r);
        return r;
    }

    cv::Mat frameF;
    frame8.convertTo(frameF, CV_32F);
    const int h = frameF.rows;
    const int w = frameF.cols;
    const int y1 = y0 + h;

    if (empty_) {
        copyRows(frameF, 0, y0, h);
        filledBegin_ = y0;
        filledEnd_ = y1;
        std::fill(filled_.begin() + y0, filled_.begin() + y1, 1);
        empty_ = false;
        reports_.push_back(r);
        return r;
    }

    const cv::Range band = longestFilledRun(y0, y1);
    const int ov0 = band.start;
    const int ov1 = band.end;
    r.overlapRows = band.size();

    if (r.overlapRows <= opt_.minBlendRows) {
        copyRows(frameF, 0, y0, h);
    } else {
        const int below = y1 - ov1;   // new rows under the band
        const int above = ov0 - y0;   // new rows over the band
        const bool existingOnTop = below >= above;

        cv::Mat bandCanvas = canvas_(cv::Range(ov0, ov1), cv::Range(0, w));
        const cv::Mat bandIn = frameF.rowRange(ov0 - y0, ov1 - y0);
        BlendOutcome b = blendBand(bandCanvas, bandIn, blend_, existingOnTop);
        b.band.copyTo(bandCanvas);
        r.blended = !b.skipped;
        r.blendSkipped = b.skipped;

        // residual = blended edge row - incoming edge row, faded into new rows
        auto fade = [&](int edgeRow, int step, int available) {
            const int n = std::min(opt_.transitionRows, available);
            if (n <= 0 || b.skipped) return;
            cv::Mat residual = canvas_(cv::Range(edgeRow, edgeRow + 1), cv::Range(0, w))
                             - frameF.rowRange(edgeRow - y0, edgeRow - y0 + 1);
            for (int k = 0; k < n; ++k) {
                const double wk = 1.0 - double(k + 1) / double(n + 1);
                const int row = edgeRow + step * (k + 1);
                cv::Mat dst = canvas_(cv::Range(row, row + 1), cv::Range(0, w));
                cv::scaleAdd(residual, wk, dst, dst);
                cv::max(dst, 0.0, dst);
                cv::min(dst, 255.0, dst);
            }
        };

        if (below > 0) {
            copyRows(frameF, ov1 - y0, ov1, below);
            fade(ov1 - 1, +1, below);
        }
        if (above > 0) {
            copyRows(frameF, 0, y0, above);
            fade(ov0, -1, above);
        }
    }

    filledBegin_ = std::min(filledBegin_, y0);
    filledEnd_ = std::max(filledEnd_, y1);
    std::fill(filled_.begin() + y0, filled_.begin() + y1, 1);

    logger()->debug("frame {}: row {} overlap {} {}", index, y0, r.overlapRows,
                    r.blended ? "blended" : "copied");
    reports_.push_back(r);
    return r;
}

cv::Mat CanvasCompositor::finalize() const
{
    if (empty_ || filledEnd_ <= 0) return {};
    cv::Mat out;
    canvas_.rowRange(0, filledEnd_).convertTo(out, CV_8U);
    return out;
}

} // namespace borestitch
