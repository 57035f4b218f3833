#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "borestitch/core/Config.hpp"
#include "borestitch/core/Errors.hpp"
#include "borestitch/core/Stitcher.hpp"
#include "borestitch/io/Artifacts.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

static void print_stitch_usage() {
    std::cerr
        << "[stitch] usage:\n"
        << "  borestitch-cli stitch --folder=DIR [--save=DIR] [--config=FILE] [--ext=png,jpg,...]\n"
        << "                        [--unwrap] [--deblur] [--defocus=wiener|lr] [--detector=auto|sift|orb|akaze]\n"
        << "                        [--threads=N] [--overlap=PX] [--intermediate] [--constant-velocity]\n";
}

/* Command-line overrides on top of the defaults or the --config file. */
static void apply_overrides(const CliArgs& args, borestitch::Config& cfg)
{
    if (args.flag("unwrap"))            cfg.unwrapFrames = true;
    if (args.flag("deblur"))            cfg.enableDeblur = true;
    if (args.flag("intermediate"))      cfg.saveIntermediate = true;
    if (args.flag("constant-velocity")) cfg.motion.constantVelocity = true;

    if (const auto t = args.detector())      cfg.features.detector = *t;
    if (const auto m = args.defocusMethod()) cfg.defocusMethod = *m;

    if (args.has("threads"))
        cfg.workerThreads = static_cast<std::size_t>(args.integer("threads", 0, 0, 256));
    cfg.overlapHintPx = args.integer("overlap", cfg.overlapHintPx, 0, 1 << 20);
}

int run_stitch(int argc, char** argv)
{
    std::string folder, save, conf, extstr;
    borestitch::Config cfg;
    try {
        const CliArgs args(argc, argv);
        args.allowOnly({"folder", "save", "config", "ext", "unwrap", "deblur", "defocus", "detector",
                        "threads", "overlap", "intermediate", "constant-velocity"});
        folder = args.str("folder");
        save   = args.str("save", "out");
        conf   = args.str("config");
        extstr = args.str("ext", "png,jpg,jpeg,tif,tiff,bmp");
        if (folder.empty()) {
            print_stitch_usage();
            return 1;
        }
        if (!conf.empty()) cfg = borestitch::loadConfig(conf);
        apply_overrides(args, cfg);
    } catch (const ArgError& e) {
        std::cerr << "[stitch] " << e.what() << "\n";
        print_stitch_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[stitch] bad config: " << e.what() << "\n";
        return 2;
    }

    try {
        const auto files = list_images_in_folder(folder, split_list(extstr));
        std::cout << "[stitch] " << files.size() << " files in " << folder << "\n";
        const std::vector<cv::Mat> images = load_frames(files);

        std::vector<borestitch::Frame> frames;
        frames.reserve(images.size());
        for (const auto& m : images) frames.push_back(borestitch::frameView(m));

        const auto t0 = std::chrono::steady_clock::now();
        const borestitch::Stitcher stitcher(cfg);
        const borestitch::StitchResult res = stitcher.stitch(frames);
        const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

        std::cout << "[stitch] motion: " << borestitch::patternName(res.profile.pattern)
                  << ", panorama " << res.panorama.cols << "x" << res.panorama.rows
                  << " in " << secs << " s\n";
        for (const auto& p : res.pairs) {
            std::cout << "[stitch]   pair " << p.index << "-" << (p.index + 1) << ": " << p.kind
                      << " dy=" << p.relativeDy << " conf=" << p.confidence
                      << " matches=" << p.matches << "\n";
        }

        const auto paths = borestitch::saveArtifacts(save, res, cfg);
        std::cout << "[stitch] saved " << paths.panorama << "\n";
        if (!paths.offsets.empty()) std::cout << "[stitch] saved " << paths.offsets << "\n";
    } catch (const borestitch::InputError& e) {
        std::cerr << "[stitch] bad input: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[stitch] error: " << e.what() << "\n";
        return 3;
    }
    return 0;
}
