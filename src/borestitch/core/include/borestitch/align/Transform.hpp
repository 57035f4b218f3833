#pragma once
#include <opencv2/core.hpp>

#include <cmath>

namespace borestitch {

/**
 * 2D homogeneous transform fitted as A -> B, i.e. pB ~ T * pA, where A is
 * the earlier frame and B the later one. The B -> A mapping (later frame
 * onto the earlier frame's coordinates) is the inverse, so its dy has the
 * opposite sign; placementDy() applies that flip through invertVertical.
 * Translation lives in the last column; scales are the column norms of the
 * 2x2 linear part (rotation-invariant).
 */
struct Transform2D {
    cv::Matx33d m = cv::Matx33d::eye();

    static Transform2D translation(double tx, double ty) {
        Transform2D t;
        t.m(0, 2) = tx;
        t.m(1, 2) = ty;
        return t;
    }

    /// From the 2x3 CV_64F matrix returned by estimateAffine*2D.
    static Transform2D fromAffine(const cv::Mat& a23) {
        CV_Assert(a23.rows == 2 && a23.cols == 3 && a23.type() == CV_64F);
        Transform2D t;
        for (int r = 0; r < 2; ++r)
            for (int c = 0; c < 3; ++c)
                t.m(r, c) = a23.at<double>(r, c);
        return t;
    }

    double dx() const { return m(0, 2); }
    double dy() const { return m(1, 2); }
    double scaleX() const { return std::hypot(m(0, 0), m(1, 0)); }
    double scaleY() const { return std::hypot(m(0, 1), m(1, 1)); }

    bool invertible(double eps = 1e-9) const {
        return std::abs(cv::determinant(m)) > eps;
    }

    bool withinScaleGate(double lo = 0.8, double hi = 1.2) const {
        const double sx = scaleX(), sy = scaleY();
        return sx >= lo && sx <= hi && sy >= lo && sy <= hi;
    }
};

} // namespace borestitch
