#pragma once

#include "analysis/AnalysisResults.hpp"
#include "analysis/AnalysisSettings.hpp"
#include "core/CoreTypes.hpp"
#include "core/ImageCube.hpp"

#include <optional>
#include <utility>
#include <vector>

/**
 * @brief Average refractive index of the scattering medium (chromatin).
 */
inline constexpr double kMediumRefractiveIndex = 1.37;

/**
 * @brief Ratio of a pixel's zero-lag autocorrelation to the background below
 * which the pixel is excluded from the diffusion regression.
 */
inline constexpr double kDiffusionSnrThreshold = 1.4142135623730951;

/**
 * @brief Mean subtracted, circular temporal autocorrelation of every pixel.
 *
 * @param rows Time series, one per row.
 * @param lags Number of lags returned.
 * @return CV_64F matrix with rows.rows rows and lags columns, scaled by
 * 1 / length so that lag 0 is the population variance.
 */
cv::Mat temporal_autocorrelation(const cv::Mat &rows, int lags);

/**
 * @brief Time resolved (Dynamics) analysis of cubes acquired at one
 * wavelength.
 *
 * The reference is corrected at construction and reduced to its mean image
 * and its background autocorrelation, averaged over the field of view. run()
 * is const and safe to call concurrently.
 */
class DynamicsAnalysis {
public:
  /**
   * @param settings Analysis settings.
   * @param reference Reference time series, consumed by the analysis.
   * @param extraReflectance Optional extra reflectance calibration.
   * @throws InvalidParameterError if the reference is not a dynamics cube,
   * has too few time points for the regression length, or the calibration
   * holds no slice at the acquisition wavelength.
   */
  DynamicsAnalysis(DynamicsAnalysisSettings settings, RawCube reference,
                   std::optional<ExtraReflectanceCube> extraReflectance =
                       std::nullopt);

  [[nodiscard]] std::pair<DynamicsAnalysisResults, AnalysisWarnings>
  run(RawCube cube) const;

  [[nodiscard]] const AnalysisWarnings &setupWarnings() const noexcept {
    return setupWarnings_;
  }

  [[nodiscard]] const DynamicsAnalysisSettings &settings() const noexcept {
    return settings_;
  }

  /**
   * @brief Mean over time of the corrected reference, height x width CV_64F.
   */
  [[nodiscard]] const cv::Mat &referenceMean() const noexcept {
    return refMean_;
  }

  /**
   * @brief Background autocorrelation, lags 0 to diffusionRegressionLength.
   */
  [[nodiscard]] const std::vector<double> &
  backgroundAutocorrelation() const noexcept {
    return backgroundAcf_;
  }

private:
  void prepareForNormalization(RawCube &cube) const;

  DynamicsAnalysisSettings settings_;
  double wavelengthNm_{0.0};
  cv::Mat refMean_;
  cv::Mat extraReflection_; ///< height x width counts/ms, empty if absent
  std::vector<double> backgroundAcf_;
  std::string referenceIdTag_;
  std::optional<std::string> extraReflectanceTag_;
  AnalysisWarnings setupWarnings_;
};
