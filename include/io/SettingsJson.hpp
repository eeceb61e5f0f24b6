#pragma once

#include "analysis/AnalysisSettings.hpp"
#include "io/IoError.hpp"

#include <expected>
#include <string>

/**
 * @brief Encodes a settings dictionary as human readable JSON.
 *
 * Flags are written as 0 or 1.
 */
std::string settings_to_json(const SettingsDict &dict);

/**
 * @brief Decodes JSON written by settings_to_json().
 *
 * Integers come back as int, other numbers as double and arrays as
 * sequences of doubles; the settings' fromDict() accepts these encodings.
 */
std::expected<SettingsDict, IoError> settings_from_json(const std::string &json);
