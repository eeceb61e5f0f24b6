#pragma once

#include "core/Metadata.hpp"

#include <opencv2/opencv.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Three dimensional image data, Y x X x N, with an index of length N.
 *
 * The samples are stored as a single channel CV_32F matrix with one row per
 * pixel (row-major over Y then X) and one column per index entry, so a pixel's
 * spectrum or time series is contiguous.
 */
class ImageCube {
public:
  /**
   * @brief Constructor for ImageCube.
   * @param data Matrix with size.area() rows and index.size() columns.
   * @param size Spatial size of the cube (width x height).
   * @param index Wavelengths (nm), times (ms) or wavenumbers (rad/um).
   * @throws InvalidParameterError if the shapes are inconsistent.
   */
  ImageCube(cv::Mat data, cv::Size size, std::vector<double> index);

  /**
   * @brief Builds a cube from a list of spatial planes, one per index entry.
   */
  static ImageCube fromPlanes(const std::vector<cv::Mat> &planes,
                              std::vector<double> index);

  [[nodiscard]] const cv::Mat &data() const noexcept { return data_; }
  [[nodiscard]] const std::vector<double> &index() const noexcept {
    return index_;
  }
  [[nodiscard]] cv::Size size() const noexcept { return size_; }
  [[nodiscard]] int height() const noexcept { return size_.height; }
  [[nodiscard]] int width() const noexcept { return size_.width; }
  [[nodiscard]] int pixelCount() const noexcept { return data_.rows; }
  [[nodiscard]] int length() const noexcept { return data_.cols; }

  /**
   * @brief Spatial plane at index position i as a height x width image.
   */
  [[nodiscard]] cv::Mat slice(int i) const;

  /**
   * @brief Per-pixel mean along the index axis as a height x width CV_64F
   * image.
   */
  [[nodiscard]] cv::Mat meanImage() const;

  /**
   * @brief Mean spectrum over the pixels selected by mask.
   * @param mask Optional CV_8U height x width mask, empty selects all pixels.
   * @return 1 x N CV_64F row.
   */
  [[nodiscard]] cv::Mat meanSpectrum(const cv::Mat &mask = cv::Mat()) const;

  /**
   * @brief Position of the index entry nearest to value.
   */
  [[nodiscard]] int nearestIndex(double value) const;

protected:
  cv::Mat data_;
  cv::Size size_;
  std::vector<double> index_;
};

/**
 * @brief One-way record of the corrections applied to a raw cube.
 */
struct ProcessingStatus {
  bool cameraCorrected{false};
  bool exposureNormalized{false};
  bool extraReflectionSubtracted{false};
  bool referenceNormalized{false};
};

/**
 * @brief Furthest point reached in the correction chain.
 */
enum class ProcessingStage {
  Raw,
  CameraCorrected,
  ExposureNormalized,
  ExtraReflectionSubtracted,
  ReferenceNormalized
};

enum class CubeKind {
  Pws,     ///< Indexed by wavelength (nm)
  Dynamics ///< Indexed by time (ms) at a fixed wavelength
};

/**
 * @brief An acquired cube plus the state of its correction chain.
 *
 * A RawCube has a single owner: it cannot be copied, only moved or explicitly
 * cloned. Every correction mutates the data in place, flips exactly one status
 * flag and refuses to run twice.
 */
class RawCube : public ImageCube {
public:
  RawCube(cv::Mat data, cv::Size size, std::vector<double> index,
          AcquisitionMetadata metadata, CubeKind kind,
          ProcessingStatus status = {});

  RawCube(const RawCube &) = delete;
  RawCube &operator=(const RawCube &) = delete;
  RawCube(RawCube &&) noexcept = default;
  RawCube &operator=(RawCube &&) noexcept = default;

  /**
   * @brief Deep copy, including the processing status.
   */
  [[nodiscard]] RawCube clone() const;

  [[nodiscard]] const AcquisitionMetadata &metadata() const noexcept {
    return metadata_;
  }
  [[nodiscard]] CubeKind kind() const noexcept { return kind_; }
  [[nodiscard]] const ProcessingStatus &status() const noexcept {
    return status_;
  }
  [[nodiscard]] ProcessingStage stage() const noexcept;

  /**
   * @brief Opaque identifier built from kind, system name and time.
   */
  [[nodiscard]] std::string idTag() const;

  /**
   * @brief Subtracts dark counts (scaled by binning^2) and linearizes the
   * camera response.
   *
   * @param correction Overrides the correction stored in the metadata.
   * @param binning Overrides the binning stored in the metadata.
   * @throws DoubleApplicationError if already applied.
   * @throws PreconditionError if no correction or binning is available.
   */
  void correctCameraEffects(
      const std::optional<CameraCorrection> &correction = std::nullopt,
      std::optional<int> binning = std::nullopt);

  /**
   * @brief Divides the data by the exposure time in milliseconds.
   * @throws PreconditionError if the camera correction has not been applied.
   * @throws DoubleApplicationError if already applied.
   */
  void normalizeByExposure();

  /**
   * @brief Subtracts an extra reflection cube of identical shape.
   * @throws PreconditionError if exposure normalization has not been applied.
   * @throws DoubleApplicationError if already applied.
   * @throws InvalidParameterError on shape mismatch.
   */
  void subtractExtraReflection(const ImageCube &extraReflection);

  /**
   * @brief Subtracts a height x width map from every index plane.
   */
  void subtractExtraReflection(const cv::Mat &extraReflection);

  /**
   * @brief Divides by a reference cube with the same shape and index.
   * @throws DoubleApplicationError if already applied.
   */
  void normalizeByReference(const RawCube &reference);

  /**
   * @brief Divides every index plane by a height x width map.
   */
  void normalizeByReference(const cv::Mat &reference);

  /**
   * @brief Divides every pixel's spectrum by a spectrum of length N.
   */
  void divideBySpectrum(const std::vector<double> &spectrum);

  /**
   * @brief Blurs each plane to suppress dust, sigma given in microns.
   * @throws PreconditionError if the metadata has no pixel size.
   */
  void filterDust(double sigmaUm);

  /**
   * @brief Copy of the cube restricted to the index entries nearest to start
   * and stop, both inclusive.
   */
  [[nodiscard]] RawCube selIndex(std::optional<double> start,
                                 std::optional<double> stop) const;

private:
  void requireShape(const cv::Mat &perPixel, const char *operation) const;
  void requireExtraReflectionPending() const;

  AcquisitionMetadata metadata_;
  CubeKind kind_;
  ProcessingStatus status_;
};

/**
 * @brief Wavelength cube resampled onto an evenly spaced wavenumber grid.
 *
 * The index holds wavenumbers in rad/um in ascending order and the data are
 * CV_64F.
 */
class KCube : public ImageCube {
public:
  /**
   * @brief Resamples per-pixel spectra from wavelength (nm) to wavenumber.
   * @param spectra pixelCount x N matrix indexed by wavelengths.
   */
  static KCube fromWavelengthData(const cv::Mat &spectra, cv::Size size,
                                  const std::vector<double> &wavelengths);

  KCube(cv::Mat data, cv::Size size, std::vector<double> wavenumbers);

  /**
   * @brief Uniform wavenumber step.
   */
  [[nodiscard]] double wavenumberStep() const;
};

/**
 * @brief Extra reflectance calibration: per-pixel reflectance in [0, 1]
 * indexed by wavelength, valid for one NA and system.
 */
class ExtraReflectanceCube : public ImageCube {
public:
  /**
   * @throws InvalidParameterError if any value lies outside [0, 1].
   */
  ExtraReflectanceCube(cv::Mat data, cv::Size size,
                       std::vector<double> wavelengths,
                       ExtraReflectanceMetadata metadata);

  [[nodiscard]] const ExtraReflectanceMetadata &metadata() const noexcept {
    return metadata_;
  }

private:
  ExtraReflectanceMetadata metadata_;
};

/**
 * @brief Extra reflection expressed in the exposure normalized count units of
 * one particular reference acquisition.
 */
class ExtraReflectionCube : public ImageCube {
public:
  /**
   * @brief Reconstructs I0 = reference / (theoryR + Rextra) and returns
   * Rextra * I0.
   *
   * @param extraReflectance The calibration cube.
   * @param theoryR Theoretical reflectance of the reference, one per
   * wavelength.
   * @param reference Exposure normalized reference cube.
   */
  static ExtraReflectionCube create(const ExtraReflectanceCube &extraReflectance,
                                    const std::vector<double> &theoryR,
                                    const RawCube &reference);

  [[nodiscard]] const ExtraReflectanceMetadata &metadata() const noexcept {
    return metadata_;
  }

private:
  ExtraReflectionCube(cv::Mat data, cv::Size size, std::vector<double> index,
                      ExtraReflectanceMetadata metadata);

  ExtraReflectanceMetadata metadata_;
};

/**
 * @brief Reshapes a pixelCount x 1 column into a height x width image.
 */
cv::Mat pixels_to_image(const cv::Mat &column, cv::Size size);

/**
 * @brief Reshapes a height x width image into a pixelCount x 1 column.
 */
cv::Mat image_to_pixels(const cv::Mat &image);
