#pragma once

#include "core/CoreTypes.hpp"

#include <opencv2/opencv.hpp>
#include <optional>

/**
 * @brief Flags an unusual ratio between the variance of an ROI's mean
 * spectrum and the mean variance of its pixel spectra.
 *
 * Ratios above 0.4 or below 0.3 suggest the region is absorbing or
 * fluorescing. The bounds are empirical.
 */
std::optional<AnalysisWarning> check_mean_spectra_ratio(double ratio);

/**
 * @brief Flags ACF fits whose R^2 is below 0.7, which makes the slope (and Ld)
 * untrustworthy. NaN entries are ignored.
 */
std::optional<AnalysisWarning> check_r_squared(const cv::Mat &rSquared);

/**
 * @brief Flags mean reflectance outside its physical range: negative, not
 * finite, or above 1 when expressed in physical units.
 */
std::optional<AnalysisWarning>
check_mean_reflectance(const cv::Mat &meanReflectance, bool relativeUnits);

/**
 * @brief Appends the warning if present.
 */
inline void collect(AnalysisWarnings &warnings,
                    std::optional<AnalysisWarning> warning) {
  if (warning) {
    warnings.push_back(std::move(*warning));
  }
}
