#pragma once

#include "core/ImageCube.hpp"
#include "io/IoError.hpp"

#include <expected>
#include <filesystem>

/**
 * @brief Source of raw cubes. Acquisition formats plug in behind this
 * interface; the analysis never reads files itself.
 */
class CubeLoader {
public:
  virtual ~CubeLoader() = default;

  [[nodiscard]] virtual std::expected<RawCube, IoError>
  load(const std::filesystem::path &path) const = 0;
};

/**
 * @brief Loads cubes written by save_cube().
 *
 * The file is a cv::FileStorage document (YAML, XML or JSON, chosen by the
 * extension) holding the pixel matrix, the index, the spatial size, the
 * acquisition metadata and the processing status.
 */
class FileStorageCubeLoader : public CubeLoader {
public:
  [[nodiscard]] std::expected<RawCube, IoError>
  load(const std::filesystem::path &path) const override;
};

/**
 * @brief Writes a cube with its metadata and processing status.
 */
std::expected<void, IoError> save_cube(const RawCube &cube,
                                       const std::filesystem::path &path);

/**
 * @brief Writes an extra reflectance calibration cube.
 */
std::expected<void, IoError>
save_extra_reflectance(const ExtraReflectanceCube &cube,
                       const std::filesystem::path &path);

/**
 * @brief Reads an extra reflectance calibration cube written by
 * save_extra_reflectance().
 */
std::expected<ExtraReflectanceCube, IoError>
load_extra_reflectance(const std::filesystem::path &path);
