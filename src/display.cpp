#include "display.hpp"

#include <spdlog/spdlog.h>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

cv::Mat to_display_rgb(const cv::Mat& image) {
  cv::Mat src = image;
  if (src.empty()) return cv::Mat();
  if (src.depth() != CV_8U) {
    src.convertTo(src, CV_8U);
  }

  cv::Mat rgb;
  switch (src.channels()) {
    case 1:
      cv::cvtColor(src, rgb, cv::COLOR_GRAY2RGB);
      break;
    case 4:
      cv::cvtColor(src, rgb, cv::COLOR_BGRA2RGB);
      break;
    default:
      cv::cvtColor(src, rgb, cv::COLOR_BGR2RGB);
      break;
  }
  // cvtColor always allocates, so `rgb` is contiguous and unshared.
  return rgb;
}

std::vector<unsigned char> encode_jpeg(const cv::Mat& display_rgb, int quality) {
  std::vector<unsigned char> buf;
  if (display_rgb.empty()) return buf;
  cv::Mat bgr;
  cv::cvtColor(display_rgb, bgr, cv::COLOR_RGB2BGR);
  if (!cv::imencode(".jpg", bgr, buf, {cv::IMWRITE_JPEG_QUALITY, quality})) {
    spdlog::warn("JPEG encode failed ({}x{})", display_rgb.cols, display_rgb.rows);
    buf.clear();
  }
  return buf;
}

bool save_display_image(const cv::Mat& display_rgb, const std::string& path) {
  if (display_rgb.empty() || path.empty()) return false;
  cv::Mat bgr;
  cv::cvtColor(display_rgb, bgr, cv::COLOR_RGB2BGR);
  try {
    return cv::imwrite(path, bgr);
  } catch (const cv::Exception& e) {
    spdlog::error("Failed to write '{}': {}", path, e.what());
    return false;
  }
}
