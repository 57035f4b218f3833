#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "borestitch/core/Config.hpp"
#include "borestitch/core/Stitcher.hpp"
#include "borestitch/io/Artifacts.hpp"
#include "borestitch/io/ScanSimulator.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

static void print_simulate_usage() {
    std::cerr
        << "[simulate] usage:\n"
        << "  borestitch-cli simulate --save=DIR [--frames=6] [--step=20] [--jitter=0] [--flicker=0]\n"
        << "                          [--width=400] [--height=300] [--pattern=texture|grid|rings|checker]\n"
        << "                          [--master=IMG] [--seed=1] [--bore] [--stitch]\n";
}

int run_simulate(int argc, char** argv)
{
    std::string save;
    bool stitch = false;
    borestitch::ScanSimulator::Options o{};
    try {
        const CliArgs args(argc, argv);
        args.allowOnly({"save", "frames", "step", "jitter", "flicker", "width", "height", "pattern",
                        "master", "seed", "bore", "stitch"});
        save          = args.str("save");
        o.frames      = args.integer("frames", 6, 1, 100000);
        o.step        = args.real("step", 20.0, -4096.0, 4096.0);
        o.jitterSigma = args.real("jitter", 0.0, 0.0, 100.0);
        o.flickerAmp  = args.real("flicker", 0.0, 0.0, 0.5);
        o.frameW      = args.integer("width", 400, 16, 16384);
        o.frameH      = args.integer("height", 300, 16, 16384);
        o.seed        = static_cast<unsigned>(args.integer("seed", 1, 0, 1 << 30));
        o.pattern     = args.choice("pattern", "texture", {"texture", "grid", "rings", "checker"});
        o.masterPath  = args.str("master");
        o.boreView    = args.flag("bore");
        stitch        = args.flag("stitch");
    } catch (const ArgError& e) {
        std::cerr << "[simulate] " << e.what() << "\n";
        print_simulate_usage();
        return 1;
    }
    if (save.empty()) {
        print_simulate_usage();
        return 1;
    }

    std::cout << "[simulate] frames=" << o.frames << ", step=" << o.step << ", size="
              << o.frameW << "x" << o.frameH << ", pattern=" << o.pattern
              << (o.boreView ? ", bore view" : "") << "\n";

    try {
        std::error_code ec;
        std::filesystem::create_directories(save, ec);
        if (ec) {
            std::cerr << "[simulate] cannot create " << save << ": " << ec.message() << "\n";
            return 3;
        }

        borestitch::ScanSimulator sim(o);
        std::vector<cv::Mat> images;
        int idx = 0;
        while (auto img = sim.nextImage()) {
            const auto path = std::filesystem::path(save) / cv::format("frame_%04d.png", idx++);
            if (!save_png(*img, path.string())) return 3;
            images.push_back(*img);
        }

        if (stitch) {
            borestitch::Config cfg{};
            cfg.unwrapFrames = o.boreView;
            cfg.saveIntermediate = true;

            std::vector<borestitch::Frame> frames;
            for (const auto& m : images) frames.push_back(borestitch::frameView(m));
            const auto res = borestitch::Stitcher(cfg).stitch(frames);
            std::cout << "[simulate] motion: " << borestitch::patternName(res.profile.pattern) << "\n";
            borestitch::saveArtifacts((std::filesystem::path(save) / "stitched").string(), res, cfg);
        }
    } catch (const std::exception& e) {
        std::cerr << "[simulate] error: " << e.what() << "\n";
        return 3;
    }
    std::cout << "[simulate] done\n";
    return 0;
}
