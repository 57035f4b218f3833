#include "modes.hpp"
#include "args.hpp"

#include "borestitch/core/Log.hpp"

#include <iostream>
#include <string>

/*
  CLI entry point.

  Modes:
    - stitch   : build a panorama from a folder of frames.
    - unwrap   : convert circular bore views into rectangular strips.
    - simulate : generate a synthetic scan for trying the pipeline out.
*/
static void print_usage() {
    std::cout
        << "Usage:\n"
        << "  borestitch-cli stitch   --folder=DIR [--save=DIR] [--config=FILE] [--unwrap] [--deblur]\n"
        << "                          [--detector=auto|sift|orb|akaze] [--threads=N] [--intermediate]\n"
        << "  borestitch-cli unwrap   --folder=DIR --save=DIR [--calibrate=N]\n"
        << "  borestitch-cli simulate [--frames=6] [--step=20] [--jitter=0] [--flicker=0]\n"
        << "                          [--pattern=texture|grid|rings|checker] [--bore] --save=DIR [--stitch]\n"
        << "  common: [--verbose] [--quiet]\n";
}

int main(int argc, char** argv)
{
    if (argc < 2) { print_usage(); return 0; }
    const std::string mode = argv[1];

    try {
        const CliArgs args(argc, argv);
        if (args.flag("verbose"))    borestitch::setLogLevel(spdlog::level::debug);
        else if (args.flag("quiet")) borestitch::setLogLevel(spdlog::level::warn);
    } catch (const ArgError& e) {
        std::cerr << e.what() << "\n";
        print_usage();
        return 1;
    }

    if      (mode == "stitch")   return run_stitch  (argc, argv);
    else if (mode == "unwrap")   return run_unwrap  (argc, argv);
    else if (mode == "simulate") return run_simulate(argc, argv);

    std::cout << "Unknown mode: " << mode << "\n";
    print_usage();
    return 1;
}
