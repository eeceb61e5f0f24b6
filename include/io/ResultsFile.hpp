#pragma once

#include "analysis/AnalysisResults.hpp"
#include "io/IoError.hpp"

#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <opencv2/opencv.hpp>
#include <string>

/**
 * @brief Writes a results bundle to directory/<prefix><name>.yml.
 *
 * The prefix is analysisResults_ for PWS and dynAnalysisResults_ for Dynamics
 * bundles. Settings are stored as JSON text.
 *
 * @return The path written.
 */
std::expected<std::filesystem::path, IoError>
persist(const ResultsBundle &bundle, const std::filesystem::path &directory,
        const std::string &name);

/**
 * @brief Result store backed by a persisted bundle.
 *
 * The document is parsed when the store is opened but each field is only
 * decoded when first requested, then cached. Access is serialized, so one
 * store can be shared between threads.
 */
class FileResultStore : public ResultStore {
  struct Token {};

public:
  explicit FileResultStore(Token) {}

  static std::expected<std::shared_ptr<FileResultStore>, IoError>
  open(const std::filesystem::path &path);

  [[nodiscard]] std::optional<FieldValue>
  get(const std::string &field) const override;
  [[nodiscard]] std::vector<std::string> fields() const override;

  [[nodiscard]] const std::string &analysisType() const noexcept {
    return analysisType_;
  }
  [[nodiscard]] const std::string &softwareVersion() const noexcept {
    return softwareVersion_;
  }
  [[nodiscard]] const std::string &settingsJson() const noexcept {
    return settingsJson_;
  }

private:
  mutable std::mutex mutex_;
  mutable cv::FileStorage storage_;
  mutable std::map<std::string, FieldValue> cache_;
  std::string analysisType_;
  std::string softwareVersion_;
  std::string settingsJson_;
};

/**
 * @brief Opens persisted results of either analysis type.
 */
std::expected<AnalysisResults, IoError>
load_results(const std::filesystem::path &path);
