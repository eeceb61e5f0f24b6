#pragma once

#include "core/Material.hpp"
#include "core/Metadata.hpp"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

/**
 * @brief A serializable settings value. Absent optional settings are simply
 * missing from the dictionary.
 */
using SettingValue =
    std::variant<bool, int, double, std::string, std::vector<double>>;
using SettingsDict = std::map<std::string, SettingValue>;

/**
 * @brief How the minimum of the normalized autocorrelation is subtracted
 * before its logarithm is taken.
 */
enum class AutocorrMinSub {
  Disabled,  ///< No subtraction
  PerPixel,  ///< Each pixel's own minimum
  WholeCube  ///< The minimum over the entire cube
};

/**
 * @brief Parameters of a PWS analysis.
 */
struct PwsSettingsParams {
  int filterOrder{2};                       ///< Butterworth order
  std::optional<double> filterCutoff{0.15}; ///< Unit: 1/nm, absent disables
  int polynomialOrder{0};                   ///< Baseline polynomial order
  std::optional<std::string> extraReflectanceId;
  std::optional<Material> referenceMaterial{Material::Water};
  double wavelengthStart{510}; ///< Unit: nanometer, inclusive
  double wavelengthStop{690};  ///< Unit: nanometer, inclusive
  bool skipAdvanced{false};    ///< Skip ACF, Ld and OPD computations
  int autoCorrStopIndex{15};   ///< Lags used in the ACF decay fit
  AutocorrMinSub autoCorrMinSub{AutocorrMinSub::Disabled};
  double numericalAperture{0.52};
  bool relativeUnits{false}; ///< Skip division by the theoretical reflectance
  std::optional<CameraCorrection> cameraCorrection; ///< Overrides metadata
  std::optional<double> waveNumberCutoff; ///< Unit: um/rad, absent disables
  bool useHannWindow{false};              ///< Window the OPD transform
  int opdIndexStop{100};                  ///< OPD samples kept in the results

  bool operator==(const PwsSettingsParams &) const = default;
};

/**
 * @brief Immutable, validated PWS analysis settings.
 */
class PwsAnalysisSettings {
public:
  /**
   * @brief Constructor for PwsAnalysisSettings.
   * @param params The parameters.
   * @throws InvalidParameterError if the parameters are inconsistent.
   */
  explicit PwsAnalysisSettings(PwsSettingsParams params = {});

  static PwsAnalysisSettings createDefault() { return PwsAnalysisSettings(); }

  [[nodiscard]] const PwsSettingsParams &params() const noexcept {
    return params_;
  }

  [[nodiscard]] SettingsDict toDict() const;

  /**
   * @throws InvalidParameterError for missing keys, mistyped values or values
   * that fail validation.
   */
  static PwsAnalysisSettings fromDict(const SettingsDict &dict);

  bool operator==(const PwsAnalysisSettings &) const = default;

private:
  PwsSettingsParams params_;
};

/**
 * @brief Parameters of a Dynamics analysis.
 */
struct DynamicsSettingsParams {
  std::optional<std::string> extraReflectanceId;
  std::optional<Material> referenceMaterial{Material::Water};
  double numericalAperture{0.52};
  bool relativeUnits{false};
  std::optional<CameraCorrection> cameraCorrection; ///< Overrides metadata
  int diffusionRegressionLength{3}; ///< Lags used in the diffusion fit

  bool operator==(const DynamicsSettingsParams &) const = default;
};

/**
 * @brief Immutable, validated Dynamics analysis settings.
 */
class DynamicsAnalysisSettings {
public:
  /**
   * @throws InvalidParameterError if diffusionRegressionLength is not in
   * (0, 20) or another parameter is invalid.
   */
  explicit DynamicsAnalysisSettings(DynamicsSettingsParams params = {});

  static DynamicsAnalysisSettings createDefault() {
    return DynamicsAnalysisSettings();
  }

  [[nodiscard]] const DynamicsSettingsParams &params() const noexcept {
    return params_;
  }

  [[nodiscard]] SettingsDict toDict() const;
  static DynamicsAnalysisSettings fromDict(const SettingsDict &dict);

  bool operator==(const DynamicsAnalysisSettings &) const = default;

private:
  DynamicsSettingsParams params_;
};

using AnalysisSettings =
    std::variant<PwsAnalysisSettings, DynamicsAnalysisSettings>;

/**
 * @brief Dictionary of either variant, tagged with "analysisType".
 */
SettingsDict analysis_settings_to_dict(const AnalysisSettings &settings);

/**
 * @brief Inverse of analysis_settings_to_dict().
 */
AnalysisSettings analysis_settings_from_dict(const SettingsDict &dict);
