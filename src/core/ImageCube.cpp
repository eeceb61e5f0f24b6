#include "core/ImageCube.hpp"
#include "Logging.hpp"
#include "core/CoreTypes.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <numbers>

ImageCube::ImageCube(cv::Mat data, cv::Size size, std::vector<double> index)
    : data_(std::move(data)), size_(size), index_(std::move(index)) {
  if (data_.channels() != 1 || data_.dims != 2) {
    throw InvalidParameterError("Cube data must be a single channel matrix");
  }
  if (data_.rows != size_.area() ||
      data_.cols != static_cast<int>(index_.size())) {
    throw InvalidParameterError(fmt::format(
        "Cube data of {}x{} does not match {}x{} pixels with {} index entries",
        data_.rows, data_.cols, size_.width, size_.height, index_.size()));
  }
  if (data_.depth() != CV_32F && data_.depth() != CV_64F) {
    data_.convertTo(data_, CV_32F);
  }
  if (!data_.isContinuous()) {
    data_ = data_.clone();
  }
}

ImageCube ImageCube::fromPlanes(const std::vector<cv::Mat> &planes,
                                std::vector<double> index) {
  if (planes.empty() || planes.size() != index.size()) {
    throw InvalidParameterError(
        "Number of planes must match the index and be non-zero");
  }
  const cv::Size size = planes.front().size();
  cv::Mat data(size.area(), static_cast<int>(planes.size()), CV_32F);
  for (size_t i = 0; i < planes.size(); ++i) {
    if (planes[i].size() != size || planes[i].channels() != 1) {
      throw InvalidParameterError("All planes must share one size and channel");
    }
    cv::Mat plane;
    planes[i].convertTo(plane, CV_32F);
    image_to_pixels(plane).copyTo(data.col(static_cast<int>(i)));
  }
  return ImageCube(data, size, std::move(index));
}

cv::Mat ImageCube::slice(int i) const {
  if (i < 0 || i >= length()) {
    throw InvalidParameterError(fmt::format("Slice {} out of range", i));
  }
  return pixels_to_image(data_.col(i).clone(), size_);
}

cv::Mat ImageCube::meanImage() const {
  cv::Mat mean;
  cv::reduce(data_, mean, 1, cv::REDUCE_AVG, CV_64F);
  return pixels_to_image(mean, size_);
}

cv::Mat ImageCube::meanSpectrum(const cv::Mat &mask) const {
  cv::Mat spectrum;
  if (mask.empty()) {
    cv::reduce(data_, spectrum, 0, cv::REDUCE_AVG, CV_64F);
    return spectrum;
  }
  if (mask.size() != size_) {
    throw InvalidParameterError("Mask size does not match the cube");
  }
  cv::Mat selected = image_to_pixels(mask);
  spectrum = cv::Mat::zeros(1, length(), CV_64F);
  int count = 0;
  for (int p = 0; p < pixelCount(); ++p) {
    if (selected.at<uchar>(p) == 0) {
      continue;
    }
    cv::Mat row;
    data_.row(p).convertTo(row, CV_64F);
    spectrum += row;
    ++count;
  }
  if (count == 0) {
    throw InvalidParameterError("Mask selects no pixels");
  }
  return spectrum / count;
}

int ImageCube::nearestIndex(double value) const {
  auto it = std::min_element(index_.begin(), index_.end(),
                             [value](double a, double b) {
                               return std::abs(a - value) < std::abs(b - value);
                             });
  return static_cast<int>(std::distance(index_.begin(), it));
}

cv::Mat pixels_to_image(const cv::Mat &column, cv::Size size) {
  cv::Mat continuous = column.isContinuous() ? column : column.clone();
  return continuous.reshape(1, size.height);
}

cv::Mat image_to_pixels(const cv::Mat &image) {
  cv::Mat continuous = image.isContinuous() ? image : image.clone();
  return continuous.reshape(1, static_cast<int>(continuous.total()));
}

KCube::KCube(cv::Mat data, cv::Size size, std::vector<double> wavenumbers)
    : ImageCube(std::move(data), size, std::move(wavenumbers)) {
  if (data_.depth() != CV_64F) {
    data_.convertTo(data_, CV_64F);
  }
}

KCube KCube::fromWavelengthData(const cv::Mat &spectra, cv::Size size,
                                const std::vector<double> &wavelengths) {
  const int n = static_cast<int>(wavelengths.size());
  if (n < 2 || spectra.cols != n) {
    throw InvalidParameterError(
        "Wavenumber conversion needs at least two wavelengths");
  }

  // Wavenumbers in rad/um, reversed so they ascend.
  std::vector<double> k(n);
  for (int i = 0; i < n; ++i) {
    k[i] = 2 * std::numbers::pi / (wavelengths[n - 1 - i] * 1e-3);
  }
  cv::Mat reversed;
  cv::flip(spectra, reversed, 1);
  reversed.convertTo(reversed, CV_64F);

  std::vector<double> grid(n);
  const double step = (k.back() - k.front()) / (n - 1);
  for (int j = 0; j < n; ++j) {
    grid[j] = k.front() + j * step;
  }
  grid.back() = k.back();

  cv::Mat resampled(spectra.rows, n, CV_64F);
  for (int j = 0; j < n; ++j) {
    auto upper = std::upper_bound(k.begin(), k.end(), grid[j]);
    int i1 = std::clamp(static_cast<int>(upper - k.begin()), 1, n - 1);
    int i0 = i1 - 1;
    double w = (grid[j] - k[i0]) / (k[i1] - k[i0]);
    w = std::clamp(w, 0.0, 1.0);
    cv::Mat dst = resampled.col(j);
    cv::addWeighted(reversed.col(i0), 1.0 - w, reversed.col(i1), w, 0.0, dst);
  }
  return KCube(resampled, size, grid);
}

double KCube::wavenumberStep() const {
  if (index_.size() < 2) {
    throw InvalidParameterError("Wavenumber step needs two samples");
  }
  return index_[1] - index_[0];
}

ExtraReflectanceCube::ExtraReflectanceCube(cv::Mat data, cv::Size size,
                                           std::vector<double> wavelengths,
                                           ExtraReflectanceMetadata metadata)
    : ImageCube(std::move(data), size, std::move(wavelengths)),
      metadata_(std::move(metadata)) {
  if (!cv::checkRange(data_, true, nullptr, 0.0, std::nextafter(1.0, 2.0))) {
    Logger::getInstance()->error(
        "Extra reflectance cube contains values outside [0, 1]");
    throw InvalidParameterError(
        "Extra reflectance values must lie within [0, 1]");
  }
}

ExtraReflectionCube::ExtraReflectionCube(cv::Mat data, cv::Size size,
                                         std::vector<double> index,
                                         ExtraReflectanceMetadata metadata)
    : ImageCube(std::move(data), size, std::move(index)),
      metadata_(std::move(metadata)) {}

ExtraReflectionCube
ExtraReflectionCube::create(const ExtraReflectanceCube &extraReflectance,
                            const std::vector<double> &theoryR,
                            const RawCube &reference) {
  if (extraReflectance.size() != reference.size() ||
      extraReflectance.length() != reference.length() ||
      static_cast<int>(theoryR.size()) != reference.length()) {
    throw InvalidParameterError(
        "Extra reflectance, theory and reference shapes do not match");
  }
  for (int i = 0; i < reference.length(); ++i) {
    if (std::abs(extraReflectance.index()[i] - reference.index()[i]) > 1e-6) {
      throw InvalidParameterError(fmt::format(
          "Extra reflectance wavelength {} does not match reference {}",
          extraReflectance.index()[i], reference.index()[i]));
    }
  }

  cv::Mat er;
  extraReflectance.data().convertTo(er, CV_32F);
  cv::Mat extra(reference.pixelCount(), reference.length(), CV_32F);
  for (int i = 0; i < reference.length(); ++i) {
    cv::Mat i0;
    cv::divide(reference.data().col(i), er.col(i) + theoryR[i], i0);
    cv::Mat dst = extra.col(i);
    cv::multiply(er.col(i), i0, dst);
  }
  return ExtraReflectionCube(extra, reference.size(), reference.index(),
                             extraReflectance.metadata());
}
