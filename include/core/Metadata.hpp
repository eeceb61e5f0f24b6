#pragma once

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Camera dark count and linearity description.
 *
 * The linearity polynomial holds the coefficients a, b, c, ... of
 * a*x + b*x^2 + c*x^3 + ... and deliberately has no constant term because the
 * dark count subtraction already anchors zero.
 */
struct CameraCorrection {
  double darkCounts{0.0};                  ///< Dark counts per unbinned pixel
  std::vector<double> linearityPolynomial; ///< Empty means linear response

  /**
   * @brief Whether the linearity polynomial is the identity (empty or [1]).
   */
  [[nodiscard]] bool hasIdentityLinearity() const noexcept {
    return linearityPolynomial.empty() ||
           (linearityPolynomial.size() == 1 && linearityPolynomial[0] == 1.0);
  }

  [[nodiscard]] bool isValid() const noexcept { return darkCounts >= 0; }

  bool operator==(const CameraCorrection &) const = default;
};

/**
 * @brief Acquisition metadata attached to an image cube.
 */
struct AcquisitionMetadata {
  std::string systemName;      ///< Name of the acquisition system
  std::string acquisitionTime; ///< Format "%d-%m-%Y %H:%M:%S"
  double exposureMs{1.0};      ///< Exposure time, unit: millisecond
  std::optional<double> pixelSizeUm;  ///< Object space pixel size, unit: um
  std::optional<int> binning;         ///< Camera binning factor
  std::optional<CameraCorrection> cameraCorrection;
  std::optional<double> wavelengthNm; ///< Fixed wavelength of dynamics data
  std::optional<double> numericalAperture; ///< Illumination NA

  [[nodiscard]] bool isValid() const noexcept {
    return exposureMs > 0 && (!pixelSizeUm || *pixelSizeUm > 0) &&
           (!binning || *binning > 0) &&
           (!cameraCorrection || cameraCorrection->isValid());
  }
};

/**
 * @brief Metadata of an extra reflectance calibration cube.
 */
struct ExtraReflectanceMetadata {
  double numericalAperture{0.52}; ///< NA the calibration is valid for
  std::string systemName;
  std::string creationTime;

  /**
   * @brief Opaque identifier derived from system name and creation time.
   */
  [[nodiscard]] std::string idTag() const;
};

/**
 * @brief Current local time formatted as "%d-%m-%Y %H:%M:%S".
 */
std::string current_timestamp();

/**
 * @brief Builds the opaque identifier "<kind>_<system>_<time>".
 */
std::string make_id_tag(const std::string &kind, const std::string &systemName,
                        const std::string &time);
