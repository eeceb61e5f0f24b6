#pragma once

#include "analysis/AnalysisResults.hpp"
#include "analysis/AnalysisSettings.hpp"
#include "analysis/SignalProcessing.hpp"
#include "core/CoreTypes.hpp"
#include "core/ImageCube.hpp"

#include <optional>
#include <utility>

/**
 * @brief Spectral (PWS) analysis of wavelength cubes against one reference.
 *
 * The reference is corrected and normalized once at construction. run() only
 * reads the analysis state, so one instance can serve many cubes concurrently.
 */
class PwsAnalysis {
public:
  /**
   * @brief Prepares the reference.
   *
   * @param settings Analysis settings.
   * @param reference Reference acquisition, consumed by the analysis.
   * @param extraReflectance Optional extra reflectance calibration.
   * @throws InvalidParameterError if the settings do not fit the reference
   * (polynomial order or ACF stop index too large for the cropped spectrum,
   * filter cutoff above Nyquist, calibration without a reference material).
   */
  PwsAnalysis(PwsAnalysisSettings settings, RawCube reference,
              std::optional<ExtraReflectanceCube> extraReflectance =
                  std::nullopt);

  /**
   * @brief Analyzes one cube.
   * @param cube The acquisition, consumed by the analysis.
   * @return The results and the data quality warnings of this run.
   */
  [[nodiscard]] std::pair<PwsAnalysisResults, AnalysisWarnings>
  run(RawCube cube) const;

  /**
   * @brief Warnings raised while preparing the reference (missing
   * calibration, NA mismatch).
   */
  [[nodiscard]] const AnalysisWarnings &setupWarnings() const noexcept {
    return setupWarnings_;
  }

  [[nodiscard]] const PwsAnalysisSettings &settings() const noexcept {
    return settings_;
  }

  [[nodiscard]] const RawCube &reference() const noexcept {
    return reference_;
  }

private:
  void validateAgainstReference() const;
  void prepareForNormalization(RawCube &cube) const;

  PwsAnalysisSettings settings_;
  RawCube reference_;
  std::optional<ExtraReflectionCube> extraReflection_;
  std::optional<FilterCoefficients> filter_;
  std::optional<std::string> extraReflectanceTag_;
  AnalysisWarnings setupWarnings_;
};
