#include "analysis/AnalysisWarnings.hpp"
#include "Logging.hpp"

#include <cmath>
#include <fmt/format.h>

namespace {
constexpr double kMaxMeanSpectraRatio = 0.4;
constexpr double kMinMeanSpectraRatio = 0.3;
constexpr double kMinRSquared = 0.7;
} // namespace

std::optional<AnalysisWarning> check_mean_spectra_ratio(double ratio) {
  if (ratio > kMaxMeanSpectraRatio) {
    return AnalysisWarning{
        "Mean RMS ratio too high",
        fmt::format("Ratio between variance of mean ROI spectra and mean of "
                    "spectra variance in ROI is {} (>{}). The ROI may be "
                    "absorbing or fluorescing.",
                    ratio, kMaxMeanSpectraRatio)};
  }
  if (ratio < kMinMeanSpectraRatio) {
    return AnalysisWarning{
        "Mean RMS ratio too low",
        fmt::format("Ratio between variance of mean ROI spectra and mean of "
                    "spectra variance in ROI is {} (<{}). The ROI may be "
                    "absorbing or fluorescing.",
                    ratio, kMinMeanSpectraRatio)};
  }
  return std::nullopt;
}

std::optional<AnalysisWarning> check_r_squared(const cv::Mat &rSquared) {
  cv::Mat values;
  rSquared.convertTo(values, CV_64F);
  int low = 0;
  int finite = 0;
  for (auto it = values.begin<double>(); it != values.end<double>(); ++it) {
    if (std::isfinite(*it)) {
      ++finite;
      low += *it < kMinRSquared ? 1 : 0;
    }
  }
  if (low == 0) {
    return std::nullopt;
  }
  return AnalysisWarning{
      "R^2 too low",
      fmt::format("{} of the {} fitted elements have an autocorrelation fit "
                  "R^2 below {}; Ld and slope values may not be valid.",
                  low, finite, kMinRSquared)};
}

std::optional<AnalysisWarning>
check_mean_reflectance(const cv::Mat &meanReflectance, bool relativeUnits) {
  cv::Mat values;
  meanReflectance.convertTo(values, CV_64F);
  int outOfRange = 0;
  for (auto it = values.begin<double>(); it != values.end<double>(); ++it) {
    if (!std::isfinite(*it) || *it < 0 || (!relativeUnits && *it > 1.0)) {
      ++outOfRange;
    }
  }
  if (outOfRange == 0) {
    return std::nullopt;
  }
  Logger::getInstance()->warn("{} pixels have unphysical mean reflectance",
                              outOfRange);
  return AnalysisWarning{
      "Mean reflectance out of range",
      fmt::format("{} of {} pixels have a mean reflectance that is negative, "
                  "not finite{}. Check the reference and calibration.",
                  outOfRange, values.total(),
                  relativeUnits ? "" : " or above 1")};
}
