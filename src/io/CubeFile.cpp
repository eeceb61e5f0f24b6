#include "io/CubeFile.hpp"
#include "Logging.hpp"
#include "core/CoreTypes.hpp"

#include <fmt/format.h>
#include <optional>

namespace {

constexpr const char *kPwsKind = "PWS";
constexpr const char *kDynamicsKind = "Dynamics";

template <typename T>
void write_optional(cv::FileStorage &fs, const char *key,
                    const std::optional<T> &value) {
  if (value) {
    fs << key << *value;
  }
}

template <typename T>
std::optional<T> read_optional(const cv::FileNode &node) {
  if (node.empty()) {
    return std::nullopt;
  }
  T value{};
  node >> value;
  return value;
}

void write_image(cv::FileStorage &fs, const ImageCube &cube) {
  fs << "width" << cube.width();
  fs << "height" << cube.height();
  fs << "index" << cube.index();
  fs << "data" << cube.data();
}

struct StoredImage {
  cv::Mat data;
  cv::Size size;
  std::vector<double> index;
};

std::optional<StoredImage> read_image(const cv::FileStorage &fs) {
  StoredImage image;
  if (fs["data"].empty() || fs["index"].empty() || fs["width"].empty() ||
      fs["height"].empty()) {
    return std::nullopt;
  }
  fs["data"] >> image.data;
  fs["index"] >> image.index;
  int width = 0;
  int height = 0;
  fs["width"] >> width;
  fs["height"] >> height;
  image.size = cv::Size(width, height);
  return image;
}

std::expected<void, IoError> open_storage(cv::FileStorage &fs,
                                          const std::filesystem::path &path,
                                          int flags) {
  try {
    fs.open(path.string(), flags);
  } catch (const cv::Exception &e) {
    return std::unexpected(IoError{
        IoError::Code::INVALID_FORMAT,
        fmt::format("Cannot parse {}: {}", path.string(), e.what())});
  }
  if (!fs.isOpened()) {
    const auto code = (flags & cv::FileStorage::WRITE) != 0
                          ? IoError::Code::WRITE_FAILED
                          : IoError::Code::NOT_FOUND;
    return std::unexpected(
        IoError{code, fmt::format("Cannot open {}", path.string())});
  }
  return {};
}

} // namespace

std::expected<RawCube, IoError>
FileStorageCubeLoader::load(const std::filesystem::path &path) const {
  const auto &logger = Logger::getInstance();
  logger->debug("Loading cube from {}", path.string());
  cv::FileStorage fs;
  if (auto opened = open_storage(fs, path, cv::FileStorage::READ); !opened) {
    logger->error("{}", opened.error().message);
    return std::unexpected(opened.error());
  }

  try {
    auto image = read_image(fs);
    std::string kindName;
    fs["kind"] >> kindName;
    if (!image || (kindName != kPwsKind && kindName != kDynamicsKind)) {
      return std::unexpected(
          IoError{IoError::Code::INVALID_FORMAT,
                  fmt::format("{} is not a cube file", path.string())});
    }

    AcquisitionMetadata metadata;
    fs["systemName"] >> metadata.systemName;
    fs["acquisitionTime"] >> metadata.acquisitionTime;
    fs["exposureMs"] >> metadata.exposureMs;
    metadata.pixelSizeUm = read_optional<double>(fs["pixelSizeUm"]);
    metadata.binning = read_optional<int>(fs["binning"]);
    metadata.wavelengthNm = read_optional<double>(fs["wavelengthNm"]);
    metadata.numericalAperture =
        read_optional<double>(fs["numericalAperture"]);
    if (const auto darkCounts = read_optional<double>(fs["darkCounts"])) {
      CameraCorrection correction{*darkCounts, {}};
      fs["linearityPolynomial"] >> correction.linearityPolynomial;
      metadata.cameraCorrection = std::move(correction);
    }

    ProcessingStatus status;
    int flag = 0;
    fs["cameraCorrected"] >> flag;
    status.cameraCorrected = flag != 0;
    flag = 0;
    fs["exposureNormalized"] >> flag;
    status.exposureNormalized = flag != 0;
    flag = 0;
    fs["extraReflectionSubtracted"] >> flag;
    status.extraReflectionSubtracted = flag != 0;
    flag = 0;
    fs["referenceNormalized"] >> flag;
    status.referenceNormalized = flag != 0;

    RawCube cube(std::move(image->data), image->size, std::move(image->index),
                 std::move(metadata),
                 kindName == kPwsKind ? CubeKind::Pws : CubeKind::Dynamics,
                 status);
    logger->info("Loaded {} from {}", cube.idTag(), path.string());
    return cube;
  } catch (const PwsError &e) {
    logger->error("Invalid cube in {}: {}", path.string(), e.what());
    return std::unexpected(IoError{IoError::Code::INVALID_FORMAT, e.what()});
  } catch (const cv::Exception &e) {
    logger->error("Cannot read cube from {}: {}", path.string(), e.what());
    return std::unexpected(IoError{IoError::Code::INVALID_FORMAT, e.what()});
  }
}

std::expected<void, IoError> save_cube(const RawCube &cube,
                                       const std::filesystem::path &path) {
  const auto &logger = Logger::getInstance();
  cv::FileStorage fs;
  if (auto opened = open_storage(fs, path, cv::FileStorage::WRITE); !opened) {
    logger->error("{}", opened.error().message);
    return std::unexpected(opened.error());
  }
  try {
    const auto &metadata = cube.metadata();
    fs << "kind" << (cube.kind() == CubeKind::Pws ? kPwsKind : kDynamicsKind);
    fs << "systemName" << metadata.systemName;
    fs << "acquisitionTime" << metadata.acquisitionTime;
    fs << "exposureMs" << metadata.exposureMs;
    write_optional(fs, "pixelSizeUm", metadata.pixelSizeUm);
    write_optional(fs, "binning", metadata.binning);
    write_optional(fs, "wavelengthNm", metadata.wavelengthNm);
    write_optional(fs, "numericalAperture", metadata.numericalAperture);
    if (metadata.cameraCorrection) {
      fs << "darkCounts" << metadata.cameraCorrection->darkCounts;
      fs << "linearityPolynomial"
          << metadata.cameraCorrection->linearityPolynomial;
    }
    const auto &status = cube.status();
    fs << "cameraCorrected" << static_cast<int>(status.cameraCorrected);
    fs << "exposureNormalized" << static_cast<int>(status.exposureNormalized);
    fs << "extraReflectionSubtracted"
        << static_cast<int>(status.extraReflectionSubtracted);
    fs << "referenceNormalized"
        << static_cast<int>(status.referenceNormalized);
    write_image(fs, cube);
    fs.release();
  } catch (const cv::Exception &e) {
    logger->error("Cannot write {}: {}", path.string(), e.what());
    return std::unexpected(IoError{IoError::Code::WRITE_FAILED, e.what()});
  }
  logger->info("Saved {} to {}", cube.idTag(), path.string());
  return {};
}

std::expected<void, IoError>
save_extra_reflectance(const ExtraReflectanceCube &cube,
                       const std::filesystem::path &path) {
  cv::FileStorage fs;
  if (auto opened = open_storage(fs, path, cv::FileStorage::WRITE); !opened) {
    Logger::getInstance()->error("{}", opened.error().message);
    return std::unexpected(opened.error());
  }
  try {
    fs << "kind" << "ExtraReflectance";
    fs << "numericalAperture" << cube.metadata().numericalAperture;
    fs << "systemName" << cube.metadata().systemName;
    fs << "creationTime" << cube.metadata().creationTime;
    write_image(fs, cube);
    fs.release();
  } catch (const cv::Exception &e) {
    return std::unexpected(IoError{IoError::Code::WRITE_FAILED, e.what()});
  }
  return {};
}

std::expected<ExtraReflectanceCube, IoError>
load_extra_reflectance(const std::filesystem::path &path) {
  cv::FileStorage fs;
  if (auto opened = open_storage(fs, path, cv::FileStorage::READ); !opened) {
    Logger::getInstance()->error("{}", opened.error().message);
    return std::unexpected(opened.error());
  }
  try {
    auto image = read_image(fs);
    std::string kindName;
    fs["kind"] >> kindName;
    if (!image || kindName != "ExtraReflectance") {
      return std::unexpected(IoError{
          IoError::Code::INVALID_FORMAT,
          fmt::format("{} is not an extra reflectance file", path.string())});
    }
    ExtraReflectanceMetadata metadata;
    fs["numericalAperture"] >> metadata.numericalAperture;
    fs["systemName"] >> metadata.systemName;
    fs["creationTime"] >> metadata.creationTime;
    return ExtraReflectanceCube(std::move(image->data), image->size,
                                std::move(image->index), std::move(metadata));
  } catch (const PwsError &e) {
    return std::unexpected(IoError{IoError::Code::INVALID_FORMAT, e.what()});
  } catch (const cv::Exception &e) {
    return std::unexpected(IoError{IoError::Code::INVALID_FORMAT, e.what()});
  }
}
