#include "compilation/Roi.hpp"
#include "Logging.hpp"
#include "core/CoreTypes.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace {

// Outline of the largest connected region of the mask.
std::vector<cv::Point> outline_of(const cv::Mat &mask) {
  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(mask.clone(), contours, cv::RETR_EXTERNAL,
                   cv::CHAIN_APPROX_SIMPLE);
  if (contours.empty()) {
    return {};
  }
  return *std::max_element(contours.begin(), contours.end(),
                           [](const auto &a, const auto &b) {
                             return cv::contourArea(a) < cv::contourArea(b);
                           });
}

} // namespace

Roi::Roi(std::string name, int number, const cv::Mat &mask,
         std::optional<std::vector<cv::Point>> verts)
    : name_(std::move(name)), number_(number) {
  if (mask.empty() || mask.channels() != 1) {
    throw InvalidParameterError("ROI mask must be a non-empty single channel "
                                "image");
  }
  mask_ = mask != 0;
  if (cv::countNonZero(mask_) == 0) {
    Logger::getInstance()->error("ROI {} {} selects no pixel", name_, number_);
    throw InvalidParameterError(
        fmt::format("ROI {} {} selects no pixel", name_, number_));
  }
  verts_ = verts ? std::move(*verts) : outline_of(mask_);
}

Roi Roi::fromVerts(std::string name, int number, std::vector<cv::Point> verts,
                   cv::Size size) {
  if (verts.size() < 3) {
    throw InvalidParameterError("An ROI polygon needs at least 3 vertices");
  }
  cv::Mat mask = cv::Mat::zeros(size, CV_8U);
  const std::vector<std::vector<cv::Point>> polygons{verts};
  cv::fillPoly(mask, polygons, cv::Scalar(255));
  return Roi(std::move(name), number, mask, std::move(verts));
}

int Roi::area() const { return cv::countNonZero(mask_); }

cv::Rect Roi::boundingRect() const { return cv::boundingRect(mask_); }
