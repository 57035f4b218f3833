#pragma once
#include "borestitch/compose/SeamBlender.hpp"

#include <opencv2/core.hpp>
#include <cstddef>
#include <vector>

namespace borestitch {

struct ComposeOptions {
    int marginRows      = 200;   // extra rows below the furthest placement
    int minBlendRows    = 10;    // overlaps up to this height are overwritten
    int transitionRows  = 10;    // fade of the blend residual into new rows
};

/** What happened to one frame during composition. */
struct PlacementReport {
    std::size_t index{0};
    int  offset{0};
    int  overlapRows{0};
    bool blended{false};
    bool blendSkipped{false};    // blend operands unusable, rows overwritten
    bool skipped{false};         // placement outside the canvas, frame dropped
};

/*
  Owns the float canvas of one stitch job.

  The canvas is sized (max(offset_i + height_i) + marginRows) x max(width_i)
  and is written only through explicit row / column ranges. Frames are placed
  in call order; the first one is copied, later ones are blended with what
  is already there when the overlap is tall enough. Which rows hold content
  is tracked per row, so a frame spanning an unfilled gap blends only with
  the longest run of filled rows it covers.
*/
class CanvasCompositor {
public:
    CanvasCompositor(const std::vector<cv::Size>& frameSizes,
                     const std::vector<int>& offsets,
                     const ComposeOptions& opt = {},
                     const BlendOptions& blend = {});

    /// Place frame `index` (CV_8UC3, size as declared) at its offset.
    PlacementReport place(std::size_t index, const cv::Mat& frame8);

    /// One past the last row that holds content (0 before the first placement).
    int filledEnd() const { return filledEnd_; }
    int filledBegin() const { return filledBegin_; }

    cv::Size canvasSize() const { return canvas_.size(); }

    const std::vector<PlacementReport>& reports() const { return reports_; }

    /// CV_8UC3 copy of rows [0, filledEnd). Empty if nothing was placed.
    cv::Mat finalize() const;

private:
    void copyRows(const cv::Mat& frameF, int frameRow0, int canvasRow0, int rows);
    cv::Range longestFilledRun(int begin, int end) const;

    std::vector<cv::Size> sizes_;
    std::vector<int>      offsets_;
    ComposeOptions        opt_;
    BlendOptions          blend_;

    cv::Mat canvas_;          // CV_32FC3
    std::vector<unsigned char> filled_;   // one flag per canvas row
    int  filledBegin_{0};
    int  filledEnd_{0};
    bool empty_{true};
    std::vector<PlacementReport> reports_;
};

} // namespace borestitch
