#include "analysis/AnalysisSettings.hpp"
#include "Logging.hpp"
#include "core/CoreTypes.hpp"

#include <fmt/format.h>
#include <type_traits>

namespace {

constexpr int kMaxDiffusionRegressionLength = 20;

const SettingValue *find(const SettingsDict &dict, const std::string &key) {
  auto it = dict.find(key);
  return it == dict.end() ? nullptr : &it->second;
}

const SettingValue &require(const SettingsDict &dict, const std::string &key) {
  const auto *value = find(dict, key);
  if (value == nullptr) {
    throw InvalidParameterError(fmt::format("Settings miss key '{}'", key));
  }
  return *value;
}

// Numbers may come back from text encodings as either int or double, and
// booleans as int.
double as_double(const SettingValue &value, const std::string &key) {
  if (const auto *d = std::get_if<double>(&value)) {
    return *d;
  }
  if (const auto *i = std::get_if<int>(&value)) {
    return *i;
  }
  throw InvalidParameterError(fmt::format("Setting '{}' is not a number", key));
}

int as_int(const SettingValue &value, const std::string &key) {
  if (const auto *i = std::get_if<int>(&value)) {
    return *i;
  }
  if (const auto *d = std::get_if<double>(&value);
      d && *d == static_cast<int>(*d)) {
    return static_cast<int>(*d);
  }
  throw InvalidParameterError(
      fmt::format("Setting '{}' is not an integer", key));
}

bool as_bool(const SettingValue &value, const std::string &key) {
  if (const auto *b = std::get_if<bool>(&value)) {
    return *b;
  }
  if (const auto *i = std::get_if<int>(&value)) {
    return *i != 0;
  }
  throw InvalidParameterError(fmt::format("Setting '{}' is not a flag", key));
}

std::string as_string(const SettingValue &value, const std::string &key) {
  if (const auto *s = std::get_if<std::string>(&value)) {
    return *s;
  }
  throw InvalidParameterError(
      fmt::format("Setting '{}' is not a string", key));
}

std::vector<double> as_vector(const SettingValue &value,
                              const std::string &key) {
  if (const auto *v = std::get_if<std::vector<double>>(&value)) {
    return *v;
  }
  if (std::holds_alternative<double>(value) ||
      std::holds_alternative<int>(value)) {
    return {as_double(value, key)};
  }
  throw InvalidParameterError(
      fmt::format("Setting '{}' is not a sequence", key));
}

std::optional<double> optional_double(const SettingsDict &dict,
                                      const std::string &key) {
  const auto *value = find(dict, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  return as_double(*value, key);
}

std::optional<std::string> optional_string(const SettingsDict &dict,
                                           const std::string &key) {
  const auto *value = find(dict, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  return as_string(*value, key);
}

std::optional<Material> optional_material(const SettingsDict &dict,
                                          const std::string &key) {
  const auto name = optional_string(dict, key);
  if (!name) {
    return std::nullopt;
  }
  const auto material = material_from_name(*name);
  if (!material) {
    throw InvalidParameterError(
        fmt::format("Unknown reference material '{}'", *name));
  }
  return material;
}

void write_camera_correction(SettingsDict &dict,
                             const std::optional<CameraCorrection> &cc) {
  if (cc) {
    dict["cameraCorrectionDarkCounts"] = cc->darkCounts;
    dict["cameraCorrectionLinearityPolynomial"] = cc->linearityPolynomial;
  }
}

std::optional<CameraCorrection> read_camera_correction(const SettingsDict &dict) {
  const auto darkCounts = optional_double(dict, "cameraCorrectionDarkCounts");
  if (!darkCounts) {
    return std::nullopt;
  }
  CameraCorrection cc;
  cc.darkCounts = *darkCounts;
  if (const auto *poly = find(dict, "cameraCorrectionLinearityPolynomial")) {
    cc.linearityPolynomial =
        as_vector(*poly, "cameraCorrectionLinearityPolynomial");
  }
  return cc;
}

std::string min_sub_name(AutocorrMinSub mode) {
  switch (mode) {
  case AutocorrMinSub::PerPixel:
    return "PerPixel";
  case AutocorrMinSub::WholeCube:
    return "WholeCube";
  default:
    return "Disabled";
  }
}

AutocorrMinSub min_sub_from_name(const std::string &name) {
  if (name == "Disabled") {
    return AutocorrMinSub::Disabled;
  }
  if (name == "PerPixel") {
    return AutocorrMinSub::PerPixel;
  }
  if (name == "WholeCube") {
    return AutocorrMinSub::WholeCube;
  }
  throw InvalidParameterError(
      fmt::format("Unknown autocorrelation minimum subtraction '{}'", name));
}

[[noreturn]] void fail(const std::string &message) {
  Logger::getInstance()->error("Invalid analysis settings: {}", message);
  throw InvalidParameterError(message);
}

} // namespace

PwsAnalysisSettings::PwsAnalysisSettings(PwsSettingsParams params)
    : params_(std::move(params)) {
  const auto &p = params_;
  if (p.filterCutoff) {
    if (p.filterOrder <= 0) {
      fail(fmt::format("Filter order must be positive, got {}",
                       p.filterOrder));
    }
    if (*p.filterCutoff <= 0) {
      fail(fmt::format("Filter cutoff must be positive, got {}",
                       *p.filterCutoff));
    }
  }
  if (p.polynomialOrder < 0) {
    fail(fmt::format("Polynomial order must not be negative, got {}",
                     p.polynomialOrder));
  }
  if (p.wavelengthStart >= p.wavelengthStop) {
    fail(fmt::format("Wavelength range [{}, {}] is empty", p.wavelengthStart,
                     p.wavelengthStop));
  }
  if (p.autoCorrStopIndex < 2) {
    fail(fmt::format("Autocorrelation stop index must be at least 2, got {}",
                     p.autoCorrStopIndex));
  }
  if (p.numericalAperture < 0 || p.numericalAperture > 1.5) {
    fail(fmt::format("Numerical aperture {} is outside [0, 1.5]",
                     p.numericalAperture));
  }
  if (p.waveNumberCutoff && *p.waveNumberCutoff <= 0) {
    fail("Wavenumber filter cutoff must be positive");
  }
  if (p.opdIndexStop <= 0) {
    fail("OPD index stop must be positive");
  }
  if (p.extraReflectanceId && !p.referenceMaterial) {
    fail("Extra reflectance correction requires a reference material");
  }
  if (p.cameraCorrection && !p.cameraCorrection->isValid()) {
    fail("Camera correction has negative dark counts");
  }
}

SettingsDict PwsAnalysisSettings::toDict() const {
  const auto &p = params_;
  SettingsDict dict{
      {"filterOrder", p.filterOrder},
      {"polynomialOrder", p.polynomialOrder},
      {"wavelengthStart", p.wavelengthStart},
      {"wavelengthStop", p.wavelengthStop},
      {"skipAdvanced", p.skipAdvanced},
      {"autoCorrStopIndex", p.autoCorrStopIndex},
      {"autoCorrMinSub", p.autoCorrMinSub != AutocorrMinSub::Disabled},
      {"autoCorrMinSubMode", min_sub_name(p.autoCorrMinSub)},
      {"numericalAperture", p.numericalAperture},
      {"relativeUnits", p.relativeUnits},
      {"useHannWindow", p.useHannWindow},
      {"opdIndexStop", p.opdIndexStop},
  };
  if (p.filterCutoff) {
    dict["filterCutoff"] = *p.filterCutoff;
  }
  if (p.extraReflectanceId) {
    dict["extraReflectanceId"] = *p.extraReflectanceId;
  }
  if (p.referenceMaterial) {
    dict["referenceMaterial"] = material_name(*p.referenceMaterial);
  }
  if (p.waveNumberCutoff) {
    dict["waveNumberCutoff"] = *p.waveNumberCutoff;
  }
  write_camera_correction(dict, p.cameraCorrection);
  return dict;
}

PwsAnalysisSettings PwsAnalysisSettings::fromDict(const SettingsDict &dict) {
  PwsSettingsParams p;
  p.filterOrder = as_int(require(dict, "filterOrder"), "filterOrder");
  p.filterCutoff = optional_double(dict, "filterCutoff");
  p.polynomialOrder =
      as_int(require(dict, "polynomialOrder"), "polynomialOrder");
  p.extraReflectanceId = optional_string(dict, "extraReflectanceId");
  p.referenceMaterial = optional_material(dict, "referenceMaterial");
  p.wavelengthStart =
      as_double(require(dict, "wavelengthStart"), "wavelengthStart");
  p.wavelengthStop =
      as_double(require(dict, "wavelengthStop"), "wavelengthStop");
  p.skipAdvanced = as_bool(require(dict, "skipAdvanced"), "skipAdvanced");
  p.autoCorrStopIndex =
      as_int(require(dict, "autoCorrStopIndex"), "autoCorrStopIndex");
  if (const auto mode = optional_string(dict, "autoCorrMinSubMode")) {
    p.autoCorrMinSub = min_sub_from_name(*mode);
  } else {
    // Older dictionaries only carry the flag, which subtracted per cube.
    p.autoCorrMinSub =
        as_bool(require(dict, "autoCorrMinSub"), "autoCorrMinSub")
            ? AutocorrMinSub::WholeCube
            : AutocorrMinSub::Disabled;
  }
  p.numericalAperture =
      as_double(require(dict, "numericalAperture"), "numericalAperture");
  if (const auto *v = find(dict, "relativeUnits")) {
    p.relativeUnits = as_bool(*v, "relativeUnits");
  }
  if (const auto *v = find(dict, "useHannWindow")) {
    p.useHannWindow = as_bool(*v, "useHannWindow");
  }
  if (const auto *v = find(dict, "opdIndexStop")) {
    p.opdIndexStop = as_int(*v, "opdIndexStop");
  }
  p.waveNumberCutoff = optional_double(dict, "waveNumberCutoff");
  p.cameraCorrection = read_camera_correction(dict);
  return PwsAnalysisSettings(std::move(p));
}

DynamicsAnalysisSettings::DynamicsAnalysisSettings(
    DynamicsSettingsParams params)
    : params_(std::move(params)) {
  const auto &p = params_;
  if (p.diffusionRegressionLength <= 0 ||
      p.diffusionRegressionLength >= kMaxDiffusionRegressionLength) {
    fail(fmt::format("Diffusion regression length must be in (0, {}), got {}",
                     kMaxDiffusionRegressionLength,
                     p.diffusionRegressionLength));
  }
  if (p.numericalAperture < 0 || p.numericalAperture > 1.5) {
    fail(fmt::format("Numerical aperture {} is outside [0, 1.5]",
                     p.numericalAperture));
  }
  if (p.extraReflectanceId && !p.referenceMaterial) {
    fail("Extra reflectance correction requires a reference material");
  }
  if (p.cameraCorrection && !p.cameraCorrection->isValid()) {
    fail("Camera correction has negative dark counts");
  }
}

SettingsDict DynamicsAnalysisSettings::toDict() const {
  const auto &p = params_;
  SettingsDict dict{
      {"numericalAperture", p.numericalAperture},
      {"relativeUnits", p.relativeUnits},
      {"diffusionRegressionLength", p.diffusionRegressionLength},
  };
  if (p.extraReflectanceId) {
    dict["extraReflectanceId"] = *p.extraReflectanceId;
  }
  if (p.referenceMaterial) {
    dict["referenceMaterial"] = material_name(*p.referenceMaterial);
  }
  write_camera_correction(dict, p.cameraCorrection);
  return dict;
}

DynamicsAnalysisSettings
DynamicsAnalysisSettings::fromDict(const SettingsDict &dict) {
  DynamicsSettingsParams p;
  p.extraReflectanceId = optional_string(dict, "extraReflectanceId");
  p.referenceMaterial = optional_material(dict, "referenceMaterial");
  p.numericalAperture =
      as_double(require(dict, "numericalAperture"), "numericalAperture");
  p.relativeUnits = as_bool(require(dict, "relativeUnits"), "relativeUnits");
  if (const auto *v = find(dict, "diffusionRegressionLength")) {
    p.diffusionRegressionLength = as_int(*v, "diffusionRegressionLength");
  }
  p.cameraCorrection = read_camera_correction(dict);
  return DynamicsAnalysisSettings(std::move(p));
}

SettingsDict analysis_settings_to_dict(const AnalysisSettings &settings) {
  return std::visit(
      [](const auto &s) {
        SettingsDict dict = s.toDict();
        using T = std::decay_t<decltype(s)>;
        dict["analysisType"] = std::string(
            std::is_same_v<T, PwsAnalysisSettings> ? "PWS" : "Dynamics");
        return dict;
      },
      settings);
}

AnalysisSettings analysis_settings_from_dict(const SettingsDict &dict) {
  const auto type = as_string(require(dict, "analysisType"), "analysisType");
  if (type == "PWS") {
    return PwsAnalysisSettings::fromDict(dict);
  }
  if (type == "Dynamics") {
    return DynamicsAnalysisSettings::fromDict(dict);
  }
  throw InvalidParameterError(fmt::format("Unknown analysis type '{}'", type));
}
