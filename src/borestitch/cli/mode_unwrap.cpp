#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "borestitch/core/Config.hpp"
#include "borestitch/core/Errors.hpp"
#include "borestitch/unwrap/PolarUnwrapper.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

static void print_unwrap_usage() {
    std::cerr
        << "[unwrap] usage:\n"
        << "  borestitch-cli unwrap --folder=DIR --save=DIR [--calibrate=N] [--config=FILE] [--ext=png,jpg,...]\n";
}

int run_unwrap(int argc, char** argv)
{
    std::string folder, save, conf, extstr;
    int calibrate = 0;
    try {
        const CliArgs args(argc, argv);
        args.allowOnly({"folder", "save", "config", "ext", "calibrate"});
        folder    = args.str("folder");
        save      = args.str("save");
        conf      = args.str("config");
        extstr    = args.str("ext", "png,jpg,jpeg,tif,tiff,bmp");
        calibrate = args.integer("calibrate", 0, 0, 10000);
    } catch (const ArgError& e) {
        std::cerr << "[unwrap] " << e.what() << "\n";
        print_unwrap_usage();
        return 1;
    }

    if (folder.empty() || save.empty()) {
        print_unwrap_usage();
        return 1;
    }

    try {
        const borestitch::Config cfg = conf.empty() ? borestitch::Config{} : borestitch::loadConfig(conf);
        const auto files = list_images_in_folder(folder, split_list(extstr));
        const std::vector<cv::Mat> images = load_frames(files);
        if (images.empty()) {
            std::cerr << "[unwrap] no readable images in " << folder << "\n";
            return 2;
        }

        std::error_code ec;
        std::filesystem::create_directories(save, ec);
        if (ec) {
            std::cerr << "[unwrap] cannot create " << save << ": " << ec.message() << "\n";
            return 3;
        }

        borestitch::UnwrapSession session;
        if (calibrate > 0) {
            const auto a = session.calibrate(images, cfg.unwrap, static_cast<std::size_t>(calibrate));
            std::cout << "[unwrap] calibrated axis (" << a.center.x << ", " << a.center.y
                      << "), confidence " << a.confidence << "\n";
        }

        int written = 0;
        for (std::size_t i = 0; i < images.size(); ++i) {
            const auto u = borestitch::unwrap(images[i], session, cfg.unwrap);
            const auto name = std::filesystem::path(save) / cv::format("unwrapped_%04zu.png", i);
            if (save_png(u.image, name.string())) ++written;
        }
        std::cout << "[unwrap] " << written << "/" << images.size() << " frames, "
                  << session.detections() << " axis detections\n";
        return written == int(images.size()) ? 0 : 3;
    } catch (const borestitch::InputError& e) {
        std::cerr << "[unwrap] bad input: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[unwrap] error: " << e.what() << "\n";
        return 3;
    }
}
