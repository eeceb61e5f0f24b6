#include "compilation/RoiCompiler.hpp"
#include "Logging.hpp"
#include "analysis/AnalysisWarnings.hpp"
#include "analysis/SignalProcessing.hpp"

#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <type_traits>
#include <variant>

namespace {

constexpr double kSlopeMinRSquared = 0.9;

void require_size(const cv::Mat &mask, const cv::Mat &values,
                  const char *what) {
  if (values.size() != mask.size() || values.channels() != 1) {
    Logger::getInstance()->error("{} is {}x{}, ROI mask is {}x{}", what,
                                 values.cols, values.rows, mask.cols,
                                 mask.rows);
    throw InvalidParameterError(
        fmt::format("ROI mask does not match the shape of {}", what));
  }
}

std::optional<double> average_field(const cv::Mat &mask,
                                    const std::optional<cv::Mat> &field,
                                    const cv::Mat &condition = cv::Mat()) {
  if (!field) {
    return std::nullopt;
  }
  return average_over_roi(mask, *field, condition);
}

// Column means of the OPD over the ROI's rows, ignoring non-finite entries.
std::vector<double> mean_opd(const cv::Mat &mask, const cv::Mat &opd) {
  const cv::Mat pixels = image_to_pixels(mask);
  if (opd.rows != pixels.rows) {
    throw InvalidParameterError("ROI mask does not match the OPD pixel count");
  }
  cv::Mat values;
  opd.convertTo(values, CV_64F);
  std::vector<double> sums(values.cols, 0.0);
  std::vector<int> counts(values.cols, 0);
  for (int r = 0; r < values.rows; ++r) {
    if (pixels.at<uchar>(r) == 0) {
      continue;
    }
    const double *row = values.ptr<double>(r);
    for (int c = 0; c < values.cols; ++c) {
      if (std::isfinite(row[c])) {
        sums[c] += row[c];
        ++counts[c];
      }
    }
  }
  for (int c = 0; c < values.cols; ++c) {
    sums[c] = counts[c] > 0 ? sums[c] / counts[c]
                            : std::numeric_limits<double>::quiet_NaN();
  }
  return sums;
}

} // namespace

double average_over_roi(const cv::Mat &mask, const cv::Mat &values,
                        const cv::Mat &condition) {
  require_size(mask, values, "the averaged field");
  if (!condition.empty()) {
    require_size(mask, condition, "the averaging condition");
  }
  cv::Mat data;
  values.convertTo(data, CV_64F);
  double sum = 0.0;
  int count = 0;
  for (int y = 0; y < data.rows; ++y) {
    const double *row = data.ptr<double>(y);
    const uchar *inside = mask.ptr<uchar>(y);
    const uchar *allowed = condition.empty() ? nullptr : condition.ptr<uchar>(y);
    for (int x = 0; x < data.cols; ++x) {
      if (inside[x] && (!allowed || allowed[x]) && std::isfinite(row[x])) {
        sum += row[x];
        ++count;
      }
    }
  }
  return count > 0 ? sum / count : std::numeric_limits<double>::quiet_NaN();
}

std::pair<RoiCompilationResults, AnalysisWarnings>
RoiCompiler::compile(const AnalysisResults &results, const Roi &roi) const {
  const auto &logger = Logger::getInstance();
  logger->debug("Compiling ROI {} {}", roi.name(), roi.number());
  AnalysisWarnings warnings;
  RoiCompilationResults compiled{roi.name(), roi.number(), std::nullopt,
                                 std::nullopt, {}};

  try {
    std::visit(
        [&](const auto &r) {
          using T = std::decay_t<decltype(r)>;
          if (const auto mean = r.meanReflectance()) {
            require_size(roi.mask(), *mean, "the analysis results");
          }
          if constexpr (std::is_same_v<T, PwsAnalysisResults>) {
            compiled.pws = compilePws(r, roi, warnings);
          } else {
            compiled.dynamics = compileDynamics(r, roi);
          }
        },
        results);
  } catch (const cv::Exception &e) {
    logger->error("OpenCV error while compiling ROI {} {}: {}", roi.name(),
                  roi.number(), e.what());
    throw ProcessingError(std::string("OpenCV error: ") + e.what());
  }

  if (settings_.generic.roiArea) {
    compiled.generic.roiArea = roi.area();
  }
  logger->info("Compiled ROI {} {} with {} warnings", roi.name(), roi.number(),
               warnings.size());
  return {std::move(compiled), std::move(warnings)};
}

PwsRoiResults RoiCompiler::compilePws(const PwsAnalysisResults &results,
                                      const Roi &roi,
                                      AnalysisWarnings &warnings) const {
  const auto &s = settings_.pws;
  const cv::Mat &mask = roi.mask();
  PwsRoiResults out;
  out.cellIdTag = results.imCubeIdTag();

  if (s.reflectance) {
    out.reflectance = average_field(mask, results.meanReflectance());
  }
  const auto rms = results.rms();
  if (s.rms) {
    out.rms = average_field(mask, rms);
  }
  if (s.polynomialRms) {
    out.polynomialRms = average_field(mask, results.polynomialRms());
  }

  const auto rSquared = results.rSquared();
  if (s.autoCorrelationSlope) {
    const auto slope = results.autoCorrelationSlope();
    if (slope && rSquared) {
      const cv::Mat wellFitted = *rSquared > kSlopeMinRSquared;
      const cv::Mat decaying = *slope < 0.0;
      const cv::Mat condition = wellFitted & decaying;
      out.autoCorrelationSlope = average_over_roi(mask, *slope, condition);
    }
  }
  if (s.rSquared && rSquared) {
    cv::Mat inside;
    rSquared->convertTo(inside, CV_64F);
    inside.setTo(std::numeric_limits<double>::quiet_NaN(), mask == 0);
    collect(warnings, check_r_squared(inside));
    out.rSquared = average_over_roi(mask, *rSquared);
  }
  if (s.ld) {
    out.ld = average_field(mask, results.ld());
  }

  if (s.opd) {
    const auto opd = results.opd();
    const auto opdIndex = results.opdIndex();
    if (opd && opdIndex) {
      out.opd = mean_opd(mask, *opd);
      out.opdIndex = *opdIndex;
    }
  }

  if (s.meanSigmaRatio && rms) {
    if (const auto reflectance = results.reflectance()) {
      cv::Scalar mean;
      cv::Scalar stddev;
      cv::meanStdDev(reflectance->meanSpectrum(mask), mean, stddev);
      cv::Mat rms64;
      rms->convertTo(rms64, CV_64F);
      const double meanVariance = average_over_roi(mask, rms64.mul(rms64));
      const double ratio = stddev[0] * stddev[0] / meanVariance;
      collect(warnings, check_mean_spectra_ratio(ratio));
      out.meanSigmaRatio = ratio;
    }
  }
  return out;
}

DynamicsRoiResults
RoiCompiler::compileDynamics(const DynamicsAnalysisResults &results,
                             const Roi &roi) const {
  const auto &s = settings_.dynamics;
  const cv::Mat &mask = roi.mask();
  DynamicsRoiResults out;
  out.cellIdTag = results.imCubeIdTag();

  if (s.meanReflectance) {
    out.meanReflectance = average_field(mask, results.meanReflectance());
  }
  if (s.rmsTSquared) {
    out.rmsTSquared = average_field(mask, results.rmsTSquared());
  }
  if (s.diffusion) {
    if (const auto diffusion = results.diffusion()) {
      cv::Mat condition;
      if (const auto provenance = results.diffusionMask()) {
        condition =
            *provenance == static_cast<double>(PixelMask::Valid);
      }
      out.diffusion = average_over_roi(mask, *diffusion, condition);
    }
  }
  return out;
}
