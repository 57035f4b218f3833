#include "utils.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>

static bool ieq(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i)
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
    return true;
}

static std::string ext_of(const std::filesystem::path& p) {
    std::string e = p.extension().string();
    if (!e.empty() && e[0] == '.') e.erase(0, 1);
    return e;
}

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ',' || c == ';' || std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty()) { out.push_back(cur); cur.clear(); }
        } else cur.push_back(c);
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

std::vector<std::filesystem::path>
list_images_in_folder(const std::filesystem::path& folder,
                      const std::vector<std::string>& allow_exts)
{
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    if (!std::filesystem::is_directory(folder, ec)) return files;
    for (auto& de : std::filesystem::directory_iterator(folder, ec)) {
        if (!de.is_regular_file()) continue;
        const auto e = ext_of(de.path());
        if (allow_exts.empty()) {
            files.push_back(de.path());
        } else {
            for (auto& a : allow_exts) {
                if (ieq(e, a)) { files.push_back(de.path()); break; }
            }
        }
    }
    // frame order is the file name order
    std::sort(files.begin(), files.end());
    return files;
}

std::vector<cv::Mat> load_frames(const std::vector<std::filesystem::path>& files) {
    std::vector<cv::Mat> out;
    out.reserve(files.size());
    for (const auto& p : files) {
        cv::Mat src = cv::imread(p.string(), cv::IMREAD_ANYDEPTH | cv::IMREAD_COLOR);
        if (src.empty()) {
            std::cerr << "[load] cannot read " << p.string() << ", skipped\n";
            continue;
        }
        if (src.depth() == CV_16U) src.convertTo(src, CV_8U, 1.0 / 257.0);
        else if (src.depth() != CV_8U) src.convertTo(src, CV_8U);
        out.push_back(src);
    }
    return out;
}

bool save_png(const cv::Mat& m, const std::string& path) {
    if (m.empty()) {
        std::cout << "[save] image is empty, nothing to save\n";
        return false;
    }
    if (cv::imwrite(path, m)) {
        std::cout << "[save] saved " << path << " (" << m.cols << "x" << m.rows << ")\n";
        return true;
    }
    std::cout << "[save] failed to save " << path << "\n";
    return false;
}
