#include "analysis/AnalysisResults.hpp"
#include "core/CoreTypes.hpp"

#include <fmt/format.h>

namespace {

template <typename T>
std::optional<T> get_as(const ResultStore &store, const std::string &field) {
  auto value = store.get(field);
  if (!value) {
    return std::nullopt;
  }
  if (auto *typed = std::get_if<T>(&*value)) {
    return std::move(*typed);
  }
  throw ProcessingError(
      fmt::format("Result field '{}' has an unexpected type", field));
}

template <typename T>
void put_optional(FieldMap &map, const char *field,
                  const std::optional<T> &value) {
  if (value) {
    map.emplace(field, *value);
  }
}

// Spatial size of a results bundle, taken from its mean reflectance map.
std::optional<cv::Size> spatial_size(const ResultStore &store) {
  const auto mean = get_as<cv::Mat>(store, "meanReflectance");
  if (!mean) {
    return std::nullopt;
  }
  return mean->size();
}

} // namespace

std::optional<FieldValue>
InMemoryResultStore::get(const std::string &field) const {
  auto it = fields_.find(field);
  if (it == fields_.end()) {
    return std::nullopt;
  }
  if (const auto *mat = std::get_if<cv::Mat>(&it->second)) {
    return FieldValue(mat->clone());
  }
  return it->second;
}

std::vector<std::string> InMemoryResultStore::fields() const {
  std::vector<std::string> names;
  for (const auto &[name, value] : fields_) {
    names.push_back(name);
  }
  return names;
}

std::string software_version() { return PWS_VERSION; }

PwsAnalysisResults::PwsAnalysisResults(std::shared_ptr<const ResultStore> store,
                                       PwsAnalysisSettings settings)
    : store_(std::move(store)), settings_(std::move(settings)) {}

PwsAnalysisResults PwsAnalysisResults::create(PwsResultFields fields,
                                              PwsAnalysisSettings settings) {
  FieldMap map;
  map.emplace("time", fields.time);
  cv::Mat reflectance;
  fields.reflectance.data().convertTo(reflectance, CV_32F);
  map.emplace("reflectance", reflectance);
  map.emplace("wavenumbers", fields.reflectance.index());
  map.emplace("meanReflectance", fields.meanReflectance);
  map.emplace("rms", fields.rms);
  put_optional(map, "polynomialRms", fields.polynomialRms);
  put_optional(map, "autoCorrelationSlope", fields.autoCorrelationSlope);
  put_optional(map, "rSquared", fields.rSquared);
  put_optional(map, "ld", fields.ld);
  put_optional(map, "opd", fields.opd);
  put_optional(map, "opdIndex", fields.opdIndex);
  map.emplace("imCubeIdTag", fields.imCubeIdTag);
  map.emplace("referenceIdTag", fields.referenceIdTag);
  put_optional(map, "extraReflectionTag", fields.extraReflectionTag);
  return PwsAnalysisResults(
      std::make_shared<InMemoryResultStore>(std::move(map)),
      std::move(settings));
}

PwsAnalysisResults
PwsAnalysisResults::load(std::shared_ptr<const ResultStore> store,
                         PwsAnalysisSettings settings) {
  if (!store) {
    throw InvalidParameterError("Cannot load results from a null store");
  }
  return PwsAnalysisResults(std::move(store), std::move(settings));
}

std::optional<std::string> PwsAnalysisResults::time() const {
  return get_as<std::string>(*store_, "time");
}

std::optional<KCube> PwsAnalysisResults::reflectance() const {
  auto data = get_as<cv::Mat>(*store_, "reflectance");
  auto wavenumbers = get_as<std::vector<double>>(*store_, "wavenumbers");
  const auto size = spatial_size(*store_);
  if (!data || !wavenumbers || !size) {
    return std::nullopt;
  }
  return KCube(std::move(*data), *size, std::move(*wavenumbers));
}

std::optional<cv::Mat> PwsAnalysisResults::meanReflectance() const {
  return get_as<cv::Mat>(*store_, "meanReflectance");
}

std::optional<cv::Mat> PwsAnalysisResults::rms() const {
  return get_as<cv::Mat>(*store_, "rms");
}

std::optional<cv::Mat> PwsAnalysisResults::polynomialRms() const {
  return get_as<cv::Mat>(*store_, "polynomialRms");
}

std::optional<cv::Mat> PwsAnalysisResults::autoCorrelationSlope() const {
  return get_as<cv::Mat>(*store_, "autoCorrelationSlope");
}

std::optional<cv::Mat> PwsAnalysisResults::rSquared() const {
  return get_as<cv::Mat>(*store_, "rSquared");
}

std::optional<cv::Mat> PwsAnalysisResults::ld() const {
  return get_as<cv::Mat>(*store_, "ld");
}

std::optional<cv::Mat> PwsAnalysisResults::opd() const {
  return get_as<cv::Mat>(*store_, "opd");
}

std::optional<std::vector<double>> PwsAnalysisResults::opdIndex() const {
  return get_as<std::vector<double>>(*store_, "opdIndex");
}

std::optional<std::string> PwsAnalysisResults::imCubeIdTag() const {
  return get_as<std::string>(*store_, "imCubeIdTag");
}

std::optional<std::string> PwsAnalysisResults::referenceIdTag() const {
  return get_as<std::string>(*store_, "referenceIdTag");
}

std::optional<std::string> PwsAnalysisResults::extraReflectionTag() const {
  return get_as<std::string>(*store_, "extraReflectionTag");
}

ResultsBundle PwsAnalysisResults::toBundle() const {
  ResultsBundle bundle{"PWS", {}, settings_.toDict(), software_version()};
  for (const auto &name : store_->fields()) {
    if (auto value = store_->get(name)) {
      bundle.fields.emplace(name, std::move(*value));
    }
  }
  return bundle;
}

DynamicsAnalysisResults::DynamicsAnalysisResults(
    std::shared_ptr<const ResultStore> store, DynamicsAnalysisSettings settings)
    : store_(std::move(store)), settings_(std::move(settings)) {}

DynamicsAnalysisResults
DynamicsAnalysisResults::create(DynamicsResultFields fields,
                                DynamicsAnalysisSettings settings) {
  FieldMap map;
  map.emplace("time", fields.time);
  cv::Mat reflectance;
  fields.reflectance.data().convertTo(reflectance, CV_32F);
  map.emplace("reflectance", reflectance);
  map.emplace("times", fields.reflectance.index());
  map.emplace("meanReflectance", fields.meanReflectance);
  map.emplace("rms_t_squared", fields.rmsTSquared);
  map.emplace("diffusion", fields.diffusion);
  map.emplace("diffusionMask", fields.diffusionMask);
  map.emplace("imCubeIdTag", fields.imCubeIdTag);
  map.emplace("referenceIdTag", fields.referenceIdTag);
  put_optional(map, "extraReflectionTag", fields.extraReflectionTag);
  return DynamicsAnalysisResults(
      std::make_shared<InMemoryResultStore>(std::move(map)),
      std::move(settings));
}

DynamicsAnalysisResults
DynamicsAnalysisResults::load(std::shared_ptr<const ResultStore> store,
                              DynamicsAnalysisSettings settings) {
  if (!store) {
    throw InvalidParameterError("Cannot load results from a null store");
  }
  return DynamicsAnalysisResults(std::move(store), std::move(settings));
}

std::optional<std::string> DynamicsAnalysisResults::time() const {
  return get_as<std::string>(*store_, "time");
}

std::optional<ImageCube> DynamicsAnalysisResults::reflectance() const {
  auto data = get_as<cv::Mat>(*store_, "reflectance");
  auto times = get_as<std::vector<double>>(*store_, "times");
  const auto size = spatial_size(*store_);
  if (!data || !times || !size) {
    return std::nullopt;
  }
  return ImageCube(std::move(*data), *size, std::move(*times));
}

std::optional<cv::Mat> DynamicsAnalysisResults::meanReflectance() const {
  return get_as<cv::Mat>(*store_, "meanReflectance");
}

std::optional<cv::Mat> DynamicsAnalysisResults::rmsTSquared() const {
  return get_as<cv::Mat>(*store_, "rms_t_squared");
}

std::optional<cv::Mat> DynamicsAnalysisResults::diffusion() const {
  return get_as<cv::Mat>(*store_, "diffusion");
}

std::optional<cv::Mat> DynamicsAnalysisResults::diffusionMask() const {
  return get_as<cv::Mat>(*store_, "diffusionMask");
}

std::optional<std::string> DynamicsAnalysisResults::imCubeIdTag() const {
  return get_as<std::string>(*store_, "imCubeIdTag");
}

std::optional<std::string> DynamicsAnalysisResults::referenceIdTag() const {
  return get_as<std::string>(*store_, "referenceIdTag");
}

std::optional<std::string> DynamicsAnalysisResults::extraReflectionTag() const {
  return get_as<std::string>(*store_, "extraReflectionTag");
}

ResultsBundle DynamicsAnalysisResults::toBundle() const {
  ResultsBundle bundle{"Dynamics", {}, settings_.toDict(), software_version()};
  for (const auto &name : store_->fields()) {
    if (auto value = store_->get(name)) {
      bundle.fields.emplace(name, std::move(*value));
    }
  }
  return bundle;
}
