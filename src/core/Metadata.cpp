#include "core/Metadata.hpp"

#include <array>
#include <chrono>
#include <ctime>
#include <fmt/format.h>

std::string ExtraReflectanceMetadata::idTag() const {
  return make_id_tag("ExtraReflectanceCube", systemName, creationTime);
}

std::string current_timestamp() {
  const std::time_t now =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);
  std::array<char, 32> buffer{};
  std::strftime(buffer.data(), buffer.size(), "%d-%m-%Y %H:%M:%S", &local);
  return buffer.data();
}

std::string make_id_tag(const std::string &kind, const std::string &systemName,
                        const std::string &time) {
  return fmt::format("{}_{}_{}", kind, systemName, time);
}
