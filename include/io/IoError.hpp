#pragma once

#include <string>

/**
 * @brief Error code and description of a failed read or write at the storage
 * boundary.
 */
struct IoError {
  enum class Code {
    NOT_FOUND,      ///< The file does not exist or cannot be opened
    INVALID_FORMAT, ///< The content is missing fields or is malformed
    WRITE_FAILED    ///< The file could not be written
  };

  Code code;
  std::string message;
};
