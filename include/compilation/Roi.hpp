#pragma once

#include <opencv2/opencv.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Region of interest of an acquisition.
 *
 * The mask is authoritative. The polygon is only an outline and is derived
 * from the mask when it is not supplied.
 */
class Roi {
public:
  /**
   * @brief Constructor for Roi.
   * @param name Name of the ROI family (e.g. "nucleus").
   * @param number Number of the ROI within its family.
   * @param mask Single channel mask, non-zero pixels belong to the ROI.
   * @param verts Optional polygon outline.
   * @throws InvalidParameterError if the mask is empty, has several channels
   * or selects no pixel.
   */
  Roi(std::string name, int number, const cv::Mat &mask,
      std::optional<std::vector<cv::Point>> verts = std::nullopt);

  /**
   * @brief Rasterizes a polygon into a mask of the given size.
   */
  static Roi fromVerts(std::string name, int number,
                       std::vector<cv::Point> verts, cv::Size size);

  [[nodiscard]] const std::string &name() const noexcept { return name_; }
  [[nodiscard]] int number() const noexcept { return number_; }

  /**
   * @brief CV_8U mask holding 255 inside the ROI and 0 elsewhere.
   */
  [[nodiscard]] const cv::Mat &mask() const noexcept { return mask_; }
  [[nodiscard]] const std::vector<cv::Point> &verts() const noexcept {
    return verts_;
  }
  [[nodiscard]] cv::Size size() const noexcept { return mask_.size(); }

  /**
   * @brief Number of pixels in the ROI.
   */
  [[nodiscard]] int area() const;

  [[nodiscard]] cv::Rect boundingRect() const;

private:
  std::string name_;
  int number_;
  cv::Mat mask_;
  std::vector<cv::Point> verts_;
};
