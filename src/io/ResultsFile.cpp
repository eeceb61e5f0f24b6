#include "io/ResultsFile.hpp"
#include "Logging.hpp"
#include "core/CoreTypes.hpp"
#include "io/SettingsJson.hpp"

#include <fmt/format.h>
#include <type_traits>
#include <variant>

namespace {

constexpr const char *kExtension = ".yml";

std::string file_name(const ResultsBundle &bundle, const std::string &name) {
  const std::string stem = bundle.analysisType == "Dynamics"
                               ? DynamicsAnalysisResults::fileName(name)
                               : PwsAnalysisResults::fileName(name);
  return stem + kExtension;
}

std::optional<FieldValue> decode(const cv::FileNode &node) {
  if (node.empty()) {
    return std::nullopt;
  }
  if (node.isMap()) {
    cv::Mat mat;
    node >> mat;
    return FieldValue(mat);
  }
  if (node.isSeq()) {
    std::vector<double> values;
    node >> values;
    return FieldValue(std::move(values));
  }
  if (node.isString()) {
    return FieldValue(static_cast<std::string>(node));
  }
  return FieldValue(static_cast<double>(node));
}

} // namespace

std::expected<std::filesystem::path, IoError>
persist(const ResultsBundle &bundle, const std::filesystem::path &directory,
        const std::string &name) {
  const auto &logger = Logger::getInstance();
  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  if (ec) {
    logger->error("Cannot create {}: {}", directory.string(), ec.message());
    return std::unexpected(IoError{IoError::Code::WRITE_FAILED, ec.message()});
  }
  const auto path = directory / file_name(bundle, name);

  try {
    cv::FileStorage fs(path.string(), cv::FileStorage::WRITE);
    if (!fs.isOpened()) {
      logger->error("Cannot open {} for writing", path.string());
      return std::unexpected(IoError{IoError::Code::WRITE_FAILED,
                                     fmt::format("Cannot open {}",
                                                 path.string())});
    }
    // cv::write stores strings verbatim; operator<< would open a map for
    // text starting with '{'.
    cv::write(fs, "analysisType", bundle.analysisType);
    cv::write(fs, "softwareVersion", bundle.softwareVersion);
    cv::write(fs, "settings", settings_to_json(bundle.settings));
    fs << "fields" << "{";
    for (const auto &[field, value] : bundle.fields) {
      std::visit([&](const auto &v) { cv::write(fs, field, v); }, value);
    }
    fs << "}";
    fs.release();
  } catch (const cv::Exception &e) {
    logger->error("Cannot write {}: {}", path.string(), e.what());
    return std::unexpected(IoError{IoError::Code::WRITE_FAILED, e.what()});
  }
  logger->info("Persisted {} results to {}", bundle.analysisType,
               path.string());
  return path;
}

std::expected<std::shared_ptr<FileResultStore>, IoError>
FileResultStore::open(const std::filesystem::path &path) {
  auto store = std::make_shared<FileResultStore>(Token{});
  try {
    if (!store->storage_.open(path.string(), cv::FileStorage::READ)) {
      return std::unexpected(IoError{
          IoError::Code::NOT_FOUND, fmt::format("Cannot open {}", path.string())});
    }
  } catch (const cv::Exception &e) {
    Logger::getInstance()->error("Cannot parse {}: {}", path.string(),
                                 e.what());
    return std::unexpected(IoError{IoError::Code::INVALID_FORMAT, e.what()});
  }
  const auto &fs = store->storage_;
  if (fs["analysisType"].empty() || fs["fields"].empty() ||
      fs["settings"].empty()) {
    return std::unexpected(
        IoError{IoError::Code::INVALID_FORMAT,
                fmt::format("{} is not a results file", path.string())});
  }
  fs["analysisType"] >> store->analysisType_;
  fs["softwareVersion"] >> store->softwareVersion_;
  fs["settings"] >> store->settingsJson_;
  return store;
}

std::optional<FieldValue> FileResultStore::get(const std::string &field) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto cached = cache_.find(field);
  if (cached == cache_.end()) {
    auto value = decode(storage_["fields"][field]);
    if (!value) {
      return std::nullopt;
    }
    cached = cache_.emplace(field, std::move(*value)).first;
  }
  if (const auto *mat = std::get_if<cv::Mat>(&cached->second)) {
    return FieldValue(mat->clone());
  }
  return cached->second;
}

std::vector<std::string> FileResultStore::fields() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  const cv::FileNode node = storage_["fields"];
  for (auto it = node.begin(); it != node.end(); ++it) {
    names.push_back((*it).name());
  }
  return names;
}

std::expected<AnalysisResults, IoError>
load_results(const std::filesystem::path &path) {
  auto store = FileResultStore::open(path);
  if (!store) {
    return std::unexpected(store.error());
  }
  auto dict = settings_from_json((*store)->settingsJson());
  if (!dict) {
    return std::unexpected(dict.error());
  }
  (*dict)["analysisType"] = (*store)->analysisType();

  try {
    const auto settings = analysis_settings_from_dict(*dict);
    std::shared_ptr<const ResultStore> shared = *store;
    if (const auto *pws = std::get_if<PwsAnalysisSettings>(&settings)) {
      return PwsAnalysisResults::load(shared, *pws);
    }
    return DynamicsAnalysisResults::load(
        shared, std::get<DynamicsAnalysisSettings>(settings));
  } catch (const PwsError &e) {
    Logger::getInstance()->error("Invalid results in {}: {}", path.string(),
                                 e.what());
    return std::unexpected(IoError{IoError::Code::INVALID_FORMAT, e.what()});
  }
}
