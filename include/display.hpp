#pragma once
#include <string>
#include <vector>

#include <opencv2/core.hpp>

// Converts a decoder or model output image (gray, BGR or BGRA) into a
// contiguous 8-bit RGB image owned by the caller.
cv::Mat to_display_rgb(const cv::Mat& image);

// JPEG bytes for an RGB display image. Empty on failure.
std::vector<unsigned char> encode_jpeg(const cv::Mat& display_rgb, int quality = 85);

// Writes an RGB display image to disk; format follows the extension.
bool save_display_image(const cv::Mat& display_rgb, const std::string& path);
