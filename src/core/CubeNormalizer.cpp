#include "Logging.hpp"
#include "core/CoreTypes.hpp"
#include "core/ImageCube.hpp"

#include <cmath>
#include <fmt/format.h>

RawCube::RawCube(cv::Mat data, cv::Size size, std::vector<double> index,
                 AcquisitionMetadata metadata, CubeKind kind,
                 ProcessingStatus status)
    : ImageCube(std::move(data), size, std::move(index)),
      metadata_(std::move(metadata)), kind_(kind), status_(status) {
  if (data_.depth() != CV_32F) {
    data_.convertTo(data_, CV_32F);
  }
  if (!metadata_.isValid()) {
    throw InvalidParameterError(
        fmt::format("Invalid acquisition metadata for {}", idTag()));
  }
  if (kind_ == CubeKind::Dynamics && !metadata_.wavelengthNm) {
    throw InvalidParameterError(
        "Dynamics cubes require the acquisition wavelength");
  }
}

RawCube RawCube::clone() const {
  return RawCube(data_.clone(), size_, index_, metadata_, kind_, status_);
}

ProcessingStage RawCube::stage() const noexcept {
  if (status_.referenceNormalized) {
    return ProcessingStage::ReferenceNormalized;
  }
  if (status_.extraReflectionSubtracted) {
    return ProcessingStage::ExtraReflectionSubtracted;
  }
  if (status_.exposureNormalized) {
    return ProcessingStage::ExposureNormalized;
  }
  if (status_.cameraCorrected) {
    return ProcessingStage::CameraCorrected;
  }
  return ProcessingStage::Raw;
}

std::string RawCube::idTag() const {
  return make_id_tag(kind_ == CubeKind::Pws ? "ImCube" : "DynCube",
                     metadata_.systemName, metadata_.acquisitionTime);
}

void RawCube::correctCameraEffects(
    const std::optional<CameraCorrection> &correction,
    std::optional<int> binning) {
  const auto &logger = Logger::getInstance();
  logger->debug("Applying camera correction to {}", idTag());

  if (status_.cameraCorrected) {
    logger->error("Camera correction already applied to {}", idTag());
    throw DoubleApplicationError(
        fmt::format("Camera correction already applied to {}", idTag()));
  }
  const auto cameraCorrection =
      correction ? correction : metadata_.cameraCorrection;
  if (!cameraCorrection) {
    logger->error("No camera correction available for {}", idTag());
    throw PreconditionError(fmt::format(
        "{} has no camera correction metadata and none was supplied",
        idTag()));
  }
  const auto bin = binning ? binning : metadata_.binning;
  if (!bin) {
    logger->error("Binning unknown for {}", idTag());
    throw PreconditionError(fmt::format(
        "{} has no binning metadata and none was supplied", idTag()));
  }

  // Dark counts are specified per unbinned pixel.
  const double darkCounts = cameraCorrection->darkCounts * (*bin) * (*bin);
  data_ -= darkCounts;

  if (!cameraCorrection->hasIdentityLinearity()) {
    cv::Mat power = data_.clone();
    cv::Mat linear = cv::Mat::zeros(data_.size(), data_.type());
    for (double coefficient : cameraCorrection->linearityPolynomial) {
      cv::scaleAdd(power, coefficient, linear, linear);
      power = power.mul(data_);
    }
    data_ = linear;
  }
  status_.cameraCorrected = true;
  logger->info("Camera correction applied to {} (dark counts {})", idTag(),
               darkCounts);
}

void RawCube::normalizeByExposure() {
  const auto &logger = Logger::getInstance();
  if (!status_.cameraCorrected) {
    logger->error("Exposure normalization requested before camera correction");
    throw PreconditionError(fmt::format(
        "{} must be camera corrected before exposure normalization", idTag()));
  }
  if (status_.exposureNormalized) {
    logger->error("Exposure normalization already applied to {}", idTag());
    throw DoubleApplicationError(fmt::format(
        "Exposure normalization already applied to {}", idTag()));
  }
  data_ /= metadata_.exposureMs;
  status_.exposureNormalized = true;
  logger->debug("{} normalized by exposure {} ms", idTag(),
                metadata_.exposureMs);
}

void RawCube::requireExtraReflectionPending() const {
  const auto &logger = Logger::getInstance();
  if (!status_.exposureNormalized) {
    logger->error("Extra reflection subtraction requested before exposure "
                  "normalization of {}",
                  idTag());
    throw PreconditionError(fmt::format(
        "{} must be exposure normalized before extra reflection subtraction",
        idTag()));
  }
  if (status_.extraReflectionSubtracted) {
    logger->error("Extra reflection already subtracted from {}", idTag());
    throw DoubleApplicationError(fmt::format(
        "Extra reflection already subtracted from {}", idTag()));
  }
}

void RawCube::subtractExtraReflection(const ImageCube &extraReflection) {
  requireExtraReflectionPending();
  if (extraReflection.size() != size_ ||
      extraReflection.length() != length()) {
    Logger::getInstance()->error(
        "Extra reflection shape {}x{}x{} does not match {}",
        extraReflection.width(), extraReflection.height(),
        extraReflection.length(), idTag());
    throw InvalidParameterError(
        "Extra reflection cube must have the same shape as the data");
  }
  cv::Mat extra;
  extraReflection.data().convertTo(extra, CV_32F);
  data_ -= extra;
  status_.extraReflectionSubtracted = true;
}

void RawCube::subtractExtraReflection(const cv::Mat &extraReflection) {
  requireExtraReflectionPending();
  requireShape(extraReflection, "extra reflection subtraction");
  cv::Mat column;
  image_to_pixels(extraReflection).convertTo(column, CV_32F);
  data_ -= cv::repeat(column, 1, length());
  status_.extraReflectionSubtracted = true;
}

void RawCube::normalizeByReference(const RawCube &reference) {
  const auto &logger = Logger::getInstance();
  if (status_.referenceNormalized) {
    throw DoubleApplicationError(
        fmt::format("{} is already normalized by a reference", idTag()));
  }
  if (!status_.cameraCorrected || !status_.exposureNormalized) {
    logger->warn("Normalizing {} by reference before camera and exposure "
                 "corrections were applied",
                 idTag());
  }
  if (!reference.status_.exposureNormalized) {
    logger->warn("Reference {} is not exposure normalized", reference.idTag());
  }
  if (reference.size() != size_ || reference.length() != length()) {
    throw InvalidParameterError(fmt::format(
        "Reference {} does not have the shape of {}", reference.idTag(),
        idTag()));
  }
  for (int i = 0; i < length(); ++i) {
    if (std::abs(reference.index()[i] - index_[i]) > 1e-6) {
      throw InvalidParameterError(fmt::format(
          "Reference {} has a different index than {}", reference.idTag(),
          idTag()));
    }
  }
  cv::divide(data_, reference.data(), data_);
  status_.referenceNormalized = true;
}

void RawCube::normalizeByReference(const cv::Mat &reference) {
  if (status_.referenceNormalized) {
    throw DoubleApplicationError(
        fmt::format("{} is already normalized by a reference", idTag()));
  }
  if (!status_.cameraCorrected || !status_.exposureNormalized) {
    Logger::getInstance()->warn("Normalizing {} by reference before camera "
                                "and exposure corrections were applied",
                                idTag());
  }
  requireShape(reference, "reference normalization");
  cv::Mat column;
  image_to_pixels(reference).convertTo(column, CV_32F);
  cv::divide(data_, cv::repeat(column, 1, length()), data_);
  status_.referenceNormalized = true;
}

void RawCube::divideBySpectrum(const std::vector<double> &spectrum) {
  if (static_cast<int>(spectrum.size()) != length()) {
    throw InvalidParameterError(fmt::format(
        "Spectrum of length {} cannot scale a cube of length {}",
        spectrum.size(), length()));
  }
  for (int i = 0; i < length(); ++i) {
    cv::Mat column = data_.col(i);
    column /= spectrum[i];
  }
}

void RawCube::filterDust(double sigmaUm) {
  if (!metadata_.pixelSizeUm) {
    throw PreconditionError(fmt::format(
        "{} has no pixel size, cannot convert the dust filter sigma",
        idTag()));
  }
  const double sigma = sigmaUm / *metadata_.pixelSizeUm;
  Logger::getInstance()->debug("Dust filtering {} with sigma {} px", idTag(),
                               sigma);
  for (int i = 0; i < length(); ++i) {
    cv::Mat plane = slice(i);
    cv::Mat blurred;
    cv::GaussianBlur(plane, blurred, cv::Size(0, 0), sigma, sigma,
                     cv::BORDER_REFLECT);
    image_to_pixels(blurred).copyTo(data_.col(i));
  }
}

RawCube RawCube::selIndex(std::optional<double> start,
                          std::optional<double> stop) const {
  const int first = start ? nearestIndex(*start) : 0;
  const int last = stop ? nearestIndex(*stop) : length() - 1;
  if (first > last) {
    throw InvalidParameterError(
        fmt::format("Index selection [{}, {}] is empty", first, last));
  }
  std::vector<double> index(index_.begin() + first,
                            index_.begin() + last + 1);
  return RawCube(data_.colRange(first, last + 1).clone(), size_,
                 std::move(index), metadata_, kind_, status_);
}

void RawCube::requireShape(const cv::Mat &perPixel,
                           const char *operation) const {
  if (perPixel.size() != size_ || perPixel.channels() != 1) {
    Logger::getInstance()->error("Map for {} is {}x{}, cube {} is {}x{}",
                                 operation, perPixel.cols, perPixel.rows,
                                 idTag(), size_.width, size_.height);
    throw InvalidParameterError(
        fmt::format("Map for {} does not match the cube's spatial shape",
                    operation));
  }
}
