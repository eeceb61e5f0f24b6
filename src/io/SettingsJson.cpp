#include "io/SettingsJson.hpp"
#include "Logging.hpp"

#include <fmt/format.h>
#include <opencv2/opencv.hpp>
#include <type_traits>
#include <variant>

std::string settings_to_json(const SettingsDict &dict) {
  cv::FileStorage fs(".json", cv::FileStorage::WRITE | cv::FileStorage::MEMORY |
                                  cv::FileStorage::FORMAT_JSON);
  for (const auto &[key, value] : dict) {
    std::visit(
        [&](const auto &v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, bool>) {
            fs << key << static_cast<int>(v);
          } else {
            fs << key << v;
          }
        },
        value);
  }
  return fs.releaseAndGetString();
}

std::expected<SettingsDict, IoError> settings_from_json(const std::string &json) {
  cv::FileStorage fs;
  try {
    fs.open(json, cv::FileStorage::READ | cv::FileStorage::MEMORY |
                      cv::FileStorage::FORMAT_JSON);
  } catch (const cv::Exception &e) {
    Logger::getInstance()->error("Cannot parse settings: {}", e.what());
    return std::unexpected(IoError{IoError::Code::INVALID_FORMAT, e.what()});
  }
  if (!fs.isOpened()) {
    return std::unexpected(
        IoError{IoError::Code::INVALID_FORMAT, "Settings text is not JSON"});
  }

  SettingsDict dict;
  const cv::FileNode root = fs.root();
  for (auto it = root.begin(); it != root.end(); ++it) {
    const cv::FileNode node = *it;
    const std::string key = node.name();
    if (node.isInt()) {
      dict[key] = static_cast<int>(node);
    } else if (node.isReal()) {
      dict[key] = static_cast<double>(node);
    } else if (node.isString()) {
      dict[key] = static_cast<std::string>(node);
    } else if (node.isSeq()) {
      std::vector<double> values;
      node >> values;
      dict[key] = std::move(values);
    } else {
      return std::unexpected(
          IoError{IoError::Code::INVALID_FORMAT,
                  fmt::format("Setting '{}' has an unsupported type", key)});
    }
  }
  return dict;
}
