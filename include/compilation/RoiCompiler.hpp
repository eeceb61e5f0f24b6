#pragma once

#include "analysis/AnalysisResults.hpp"
#include "compilation/Roi.hpp"
#include "core/CoreTypes.hpp"

#include <opencv2/opencv.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief PWS metrics to compile.
 */
struct PwsCompilerSettings {
  bool reflectance{true};
  bool rms{true};
  bool polynomialRms{true};
  bool autoCorrelationSlope{true};
  bool rSquared{true};
  bool ld{true};
  bool opd{true};
  bool meanSigmaRatio{true};
};

/**
 * @brief Dynamics metrics to compile.
 */
struct DynamicsCompilerSettings {
  bool meanReflectance{true};
  bool rmsTSquared{true};
  bool diffusion{true};
};

struct GenericCompilerSettings {
  bool roiArea{true};
};

struct CompilerSettings {
  PwsCompilerSettings pws;
  DynamicsCompilerSettings dynamics;
  GenericCompilerSettings generic;
};

/**
 * @brief Per-ROI PWS scalars. A metric is absent if it was not requested or
 * its source field is absent.
 */
struct PwsRoiResults {
  std::optional<std::string> cellIdTag;
  std::optional<double> reflectance;
  std::optional<double> rms;
  std::optional<double> polynomialRms;
  std::optional<double> autoCorrelationSlope;
  std::optional<double> rSquared;
  std::optional<double> ld;
  std::optional<std::vector<double>> opd; ///< Mean OPD spectrum of the ROI
  std::optional<std::vector<double>> opdIndex;
  std::optional<double> meanSigmaRatio;
};

struct DynamicsRoiResults {
  std::optional<std::string> cellIdTag;
  std::optional<double> meanReflectance;
  std::optional<double> rmsTSquared;
  std::optional<double> diffusion;
};

struct GenericRoiResults {
  std::optional<int> roiArea;
};

/**
 * @brief Scalars of one ROI. Exactly one of pws and dynamics is set.
 */
struct RoiCompilationResults {
  std::string roiName;
  int roiNumber{0};
  std::optional<PwsRoiResults> pws;
  std::optional<DynamicsRoiResults> dynamics;
  GenericRoiResults generic;
};

/**
 * @brief Mean of values over the ROI, restricted to the pixels where
 * condition is non-zero. Non-finite values are excluded.
 *
 * @param mask CV_8U ROI mask.
 * @param values Single channel map of the mask's size.
 * @param condition Optional CV_8U map of the mask's size.
 * @return The mean, NaN if no pixel qualifies.
 * @throws InvalidParameterError on a size mismatch.
 */
double average_over_roi(const cv::Mat &mask, const cv::Mat &values,
                        const cv::Mat &condition = cv::Mat());

/**
 * @brief Reduces per-pixel analysis results to scalars per ROI.
 */
class RoiCompiler {
public:
  explicit RoiCompiler(CompilerSettings settings = {})
      : settings_(std::move(settings)) {}

  /**
   * @brief Compiles one ROI.
   * @return The scalars and the warnings raised by the compiled region.
   * @throws InvalidParameterError if the ROI does not match the results'
   * spatial shape.
   */
  [[nodiscard]] std::pair<RoiCompilationResults, AnalysisWarnings>
  compile(const AnalysisResults &results, const Roi &roi) const;

  [[nodiscard]] const CompilerSettings &settings() const noexcept {
    return settings_;
  }

private:
  PwsRoiResults compilePws(const PwsAnalysisResults &results, const Roi &roi,
                           AnalysisWarnings &warnings) const;
  DynamicsRoiResults compileDynamics(const DynamicsAnalysisResults &results,
                                     const Roi &roi) const;

  CompilerSettings settings_;
};
