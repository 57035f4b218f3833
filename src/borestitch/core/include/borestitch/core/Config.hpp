#pragma once

#include "borestitch/align/DepthScale.hpp"
#include "borestitch/align/MotionEstimator.hpp"
#include "borestitch/compose/Canvas.hpp"
#include "borestitch/compose/PostProcessor.hpp"
#include "borestitch/compose/SeamBlender.hpp"
#include "borestitch/deblur/Deblurrer.hpp"
#include "borestitch/features/FeatureDetector.hpp"
#include "borestitch/unwrap/PolarUnwrapper.hpp"

#include <cstddef>
#include <string>

namespace borestitch {

/* Global configuration for the stitching pipeline.
   Top-level switches plus the options of every stage. */
struct Config {
    int  overlapHintPx {0};            // expected overlap, informational (0 = unknown)
    int  minOverlapPx {300};           // resolved overlaps below this are logged as weak
    bool saveIntermediate {false};     // also write offsets.npy next to the panorama

    bool enableDeblur {false};
    DefocusMethod defocusMethod {DefocusMethod::Wiener};
    int    lucyRichardsonIterations {10};
    double wienerNoiseRatio {0.1};

    bool unwrapFrames {false};         // frames are raw circular views
    std::size_t workerThreads {0};     // 0 = hardware concurrency

    FeatureOptions features;
    MotionOptions  motion;
    ComposeOptions compose;
    BlendOptions   blend;
    PostOptions    post;
    UnwrapOptions  unwrap;
    DepthOptions   depth;
};

/* Deblur stage options derived from the top-level fields. */
DeblurOptions deblurOptions(const Config& cfg);

/* Throws std::runtime_error naming the first out-of-range field. */
void validateConfig(const Config& cfg);

/* Read a YAML / JSON file written by saveConfig (format from the extension).
   Missing keys keep their defaults. Throws std::runtime_error on I/O or
   validation failure. */
Config loadConfig(const std::string& path);

void saveConfig(const std::string& path, const Config& cfg);

} // namespace borestitch
