#pragma once

#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Base exception class for every error raised by the analysis core.
 */
class PwsError : public std::runtime_error {
public:
  /**
   * @brief Constructor for PwsError.
   * @param message The error message.
   */
  explicit PwsError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief Raised for invalid settings or arguments. Settings are validated
 * when they are constructed, so this never surfaces from the middle of a run.
 */
class InvalidParameterError : public PwsError {
public:
  explicit InvalidParameterError(const std::string &message)
      : PwsError(message) {}
};

/**
 * @brief Raised when a processing step is requested before a step it depends
 * on, or before the metadata it needs is available.
 */
class PreconditionError : public PwsError {
public:
  explicit PreconditionError(const std::string &message) : PwsError(message) {}
};

/**
 * @brief Raised when a correction that has already been applied to a cube is
 * requested again.
 */
class DoubleApplicationError : public PreconditionError {
public:
  explicit DoubleApplicationError(const std::string &message)
      : PreconditionError(message) {}
};

/**
 * @brief Raised when a material has no refractive index data covering the
 * requested wavelengths.
 */
class MaterialNotFoundError : public PwsError {
public:
  explicit MaterialNotFoundError(const std::string &message)
      : PwsError(message) {}
};

/**
 * @brief Exception class for failures during numerical processing.
 */
class ProcessingError : public PwsError {
public:
  explicit ProcessingError(const std::string &message) : PwsError(message) {}
};

/**
 * @brief A theoretical reflectance fell outside [0, 1].
 */
class ReflectanceRangeError : public ProcessingError {
public:
  explicit ReflectanceRangeError(const std::string &message)
      : ProcessingError(message) {}
};

/**
 * @brief Non-fatal data quality advisory returned alongside results.
 */
struct AnalysisWarning {
  std::string shortMsg; ///< One line summary
  std::string longMsg;  ///< Detailed explanation
};

using AnalysisWarnings = std::vector<AnalysisWarning>;
