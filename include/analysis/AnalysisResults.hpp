#pragma once

#include "analysis/AnalysisSettings.hpp"
#include "core/ImageCube.hpp"

#include <map>
#include <memory>
#include <opencv2/opencv.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

/**
 * @brief A stored result field: a per-pixel array, a sequence, a string or a
 * scalar.
 */
using FieldValue = std::variant<cv::Mat, std::vector<double>, std::string, double>;
using FieldMap = std::map<std::string, FieldValue>;

/**
 * @brief Read-only source of result fields.
 *
 * A field that was never computed is reported as std::nullopt, which is
 * distinct from a field holding zeros.
 */
class ResultStore {
public:
  virtual ~ResultStore() = default;

  [[nodiscard]] virtual std::optional<FieldValue>
  get(const std::string &field) const = 0;

  /**
   * @brief Names of the fields present in the store.
   */
  [[nodiscard]] virtual std::vector<std::string> fields() const = 0;
};

/**
 * @brief Store holding freshly computed fields.
 */
class InMemoryResultStore : public ResultStore {
public:
  explicit InMemoryResultStore(FieldMap fields) : fields_(std::move(fields)) {}

  [[nodiscard]] std::optional<FieldValue>
  get(const std::string &field) const override;
  [[nodiscard]] std::vector<std::string> fields() const override;

private:
  FieldMap fields_;
};

/**
 * @brief Plain bundle handed to the persistence boundary.
 */
struct ResultsBundle {
  std::string analysisType; ///< "PWS" or "Dynamics"
  FieldMap fields;
  SettingsDict settings;
  std::string softwareVersion;
};

/**
 * @brief Version string of this library, recorded in every results bundle.
 */
std::string software_version();

/**
 * @brief Computed per-pixel outputs of a PWS analysis.
 */
struct PwsResultFields {
  std::string time;
  KCube reflectance;      ///< Detrended wavenumber cube
  cv::Mat meanReflectance; ///< height x width
  cv::Mat rms;             ///< height x width
  std::optional<cv::Mat> polynomialRms;
  std::optional<cv::Mat> autoCorrelationSlope;
  std::optional<cv::Mat> rSquared;
  std::optional<cv::Mat> ld;
  std::optional<cv::Mat> opd; ///< pixelCount x opdIndex.size()
  std::optional<std::vector<double>> opdIndex;
  std::string imCubeIdTag;
  std::string referenceIdTag;
  std::optional<std::string> extraReflectionTag;
};

/**
 * @brief Write-once results of a PWS analysis.
 */
class PwsAnalysisResults {
public:
  static constexpr const char *kFilePrefix = "analysisResults_";

  /**
   * @brief Results built from computed arrays.
   */
  static PwsAnalysisResults create(PwsResultFields fields,
                                   PwsAnalysisSettings settings);

  /**
   * @brief Results read from a persisted store.
   */
  static PwsAnalysisResults load(std::shared_ptr<const ResultStore> store,
                                 PwsAnalysisSettings settings);

  static std::string fileName(const std::string &name) {
    return kFilePrefix + name;
  }

  [[nodiscard]] std::optional<FieldValue> get(const std::string &field) const {
    return store_->get(field);
  }

  [[nodiscard]] const PwsAnalysisSettings &settings() const noexcept {
    return settings_;
  }

  [[nodiscard]] std::optional<std::string> time() const;
  [[nodiscard]] std::optional<KCube> reflectance() const;
  [[nodiscard]] std::optional<cv::Mat> meanReflectance() const;
  [[nodiscard]] std::optional<cv::Mat> rms() const;
  [[nodiscard]] std::optional<cv::Mat> polynomialRms() const;
  [[nodiscard]] std::optional<cv::Mat> autoCorrelationSlope() const;
  [[nodiscard]] std::optional<cv::Mat> rSquared() const;
  [[nodiscard]] std::optional<cv::Mat> ld() const;
  [[nodiscard]] std::optional<cv::Mat> opd() const;
  [[nodiscard]] std::optional<std::vector<double>> opdIndex() const;
  [[nodiscard]] std::optional<std::string> imCubeIdTag() const;
  [[nodiscard]] std::optional<std::string> referenceIdTag() const;
  [[nodiscard]] std::optional<std::string> extraReflectionTag() const;

  [[nodiscard]] ResultsBundle toBundle() const;

private:
  PwsAnalysisResults(std::shared_ptr<const ResultStore> store,
                     PwsAnalysisSettings settings);

  std::shared_ptr<const ResultStore> store_;
  PwsAnalysisSettings settings_;
};

/**
 * @brief Computed per-pixel outputs of a Dynamics analysis.
 */
struct DynamicsResultFields {
  std::string time;
  ImageCube reflectance;   ///< Normalized time series
  cv::Mat meanReflectance; ///< height x width
  cv::Mat rmsTSquared;     ///< height x width, clipped at zero
  cv::Mat diffusion;       ///< height x width, NaN where masked
  cv::Mat diffusionMask;   ///< height x width CV_8U PixelMask reasons
  std::string imCubeIdTag;
  std::string referenceIdTag;
  std::optional<std::string> extraReflectionTag;
};

/**
 * @brief Write-once results of a Dynamics analysis.
 */
class DynamicsAnalysisResults {
public:
  static constexpr const char *kFilePrefix = "dynAnalysisResults_";

  static DynamicsAnalysisResults create(DynamicsResultFields fields,
                                        DynamicsAnalysisSettings settings);
  static DynamicsAnalysisResults load(std::shared_ptr<const ResultStore> store,
                                      DynamicsAnalysisSettings settings);

  static std::string fileName(const std::string &name) {
    return kFilePrefix + name;
  }

  [[nodiscard]] std::optional<FieldValue> get(const std::string &field) const {
    return store_->get(field);
  }

  [[nodiscard]] const DynamicsAnalysisSettings &settings() const noexcept {
    return settings_;
  }

  [[nodiscard]] std::optional<std::string> time() const;
  [[nodiscard]] std::optional<ImageCube> reflectance() const;
  [[nodiscard]] std::optional<cv::Mat> meanReflectance() const;
  [[nodiscard]] std::optional<cv::Mat> rmsTSquared() const;
  [[nodiscard]] std::optional<cv::Mat> diffusion() const;
  [[nodiscard]] std::optional<cv::Mat> diffusionMask() const;
  [[nodiscard]] std::optional<std::string> imCubeIdTag() const;
  [[nodiscard]] std::optional<std::string> referenceIdTag() const;
  [[nodiscard]] std::optional<std::string> extraReflectionTag() const;

  [[nodiscard]] ResultsBundle toBundle() const;

private:
  DynamicsAnalysisResults(std::shared_ptr<const ResultStore> store,
                          DynamicsAnalysisSettings settings);

  std::shared_ptr<const ResultStore> store_;
  DynamicsAnalysisSettings settings_;
};

using AnalysisResults = std::variant<PwsAnalysisResults, DynamicsAnalysisResults>;
