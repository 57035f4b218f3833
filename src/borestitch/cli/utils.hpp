#pragma once
#include <opencv2/core.hpp>

#include <filesystem>
#include <string>
#include <vector>

/*
  Helpers for reading frame folders and writing images.
  Nothing here changes data on disk except save_png.
*/

/* Split "png,jpg;tif" into {"png", "jpg", "tif"}. */
std::vector<std::string> split_list(const std::string& s);

/* Regular files of 'folder' whose extension is in 'allow_exts'
   (case-insensitive; empty list = all), sorted by name. */
std::vector<std::filesystem::path>
list_images_in_folder(const std::filesystem::path& folder,
                      const std::vector<std::string>& allow_exts);

/* Load every file as CV_8UC3. Unreadable files are reported and left out;
   16-bit images are scaled down to 8 bits. */
std::vector<cv::Mat> load_frames(const std::vector<std::filesystem::path>& files);

/* Save an image as PNG to 'path'.
   Prints a short message on success or failure; returns false on failure. */
bool save_png(const cv::Mat& m, const std::string& path);
