#include "analysis/SpectralAnalysis.hpp"
#include "Logging.hpp"
#include "analysis/SignalProcessing.hpp"
#include "core/CoreTypes.hpp"

#include <cmath>
#include <limits>
#include <numbers>
#include <numeric>

namespace {

// Smallest positive double, substituted for exact zeros before the log.
constexpr double kTinyPositive = 1e-323;

cv::Mat windowed(const cv::Mat &data, const std::vector<double> &window) {
  cv::Mat out = data.clone();
  for (int i = 0; i < out.cols; ++i) {
    cv::Mat column = out.col(i);
    column *= window[i];
  }
  return out;
}

std::vector<double> window_for(int n, bool useHannWindow) {
  return useHannWindow ? hann_window(n) : std::vector<double>(n, 1.0);
}

cv::Mat normalized_fft_magnitude(const cv::Mat &data, bool useHannWindow) {
  const int n = data.cols;
  const auto window = window_for(n, useHannWindow);
  const double windowPower =
      std::inner_product(window.begin(), window.end(), window.begin(), 0.0);
  cv::Mat magnitude = fft_magnitude(windowed(data, window), opd_fft_size(n));
  magnitude *= std::sqrt(n / windowPower) / n;
  return magnitude;
}

} // namespace

int opd_fft_size(int n) { return 2 * next_power_of_two(2 * n - 1); }

Opd compute_opd(const KCube &cube, bool useHannWindow,
                std::optional<int> indexOpdStop) {
  const int n = cube.length();
  cv::Mat magnitude = normalized_fft_magnitude(cube.data(), useHannWindow);
  const int m = magnitude.cols;
  const int kept = indexOpdStop ? std::min(*indexOpdStop, m) : m;

  // OPD axis as defined by the original MATLAB implementation.
  const double maxOpd = 2 * std::numbers::pi / cube.wavenumberStep();
  const double dOpd = maxOpd / n;
  Opd opd;
  opd.values = magnitude.colRange(0, kept).clone();
  opd.index.resize(kept);
  for (int i = 0; i < kept; ++i) {
    opd.index[i] = n / 2.0 * i * dOpd / m;
  }
  return opd;
}

cv::Mat rms_from_opd(const KCube &cube, double lowerOpd, double upperOpd,
                     bool useHannWindow) {
  const int n = cube.length();
  const int fftSize = opd_fft_size(n);

  cv::Mat mean;
  cv::reduce(cube.data(), mean, 1, cv::REDUCE_AVG, CV_64F);
  cv::Mat centered = cube.data() - cv::repeat(mean, 1, n);
  const cv::Mat opd = normalized_fft_magnitude(centered, useHannWindow);

  const double dk = cube.wavenumberStep();
  auto nearest = [&](double value) {
    int best = 0;
    double bestDistance = std::numeric_limits<double>::infinity();
    for (int i = 0; i < opd.cols; ++i) {
      const double index = 2 * std::numbers::pi * i / (fftSize * dk);
      if (std::abs(index - value) < bestDistance) {
        bestDistance = std::abs(index - value);
        best = i;
      }
    }
    return best;
  };
  const int start = nearest(lowerOpd);
  const int stop = nearest(upperOpd);

  cv::Mat rms(cube.pixelCount(), 1, CV_64F);
  for (int p = 0; p < opd.rows; ++p) {
    const double *row = opd.ptr<double>(p);
    double sum = 0.0;
    for (int i = start; i <= stop; ++i) {
      const double weight = (i == 0 || i == fftSize / 2) ? 1.0 : 2.0;
      sum += weight * row[i] * row[i];
    }
    rms.at<double>(p) = std::sqrt(sum * n / fftSize);
  }
  return pixels_to_image(rms, cube.size());
}

AutocorrelationDecay autocorrelation_decay(const KCube &cube,
                                           AutocorrMinSub minSub,
                                           int stopIndex) {
  const int n = cube.length();
  if (stopIndex < 2 || stopIndex > n) {
    throw InvalidParameterError(
        "Autocorrelation stop index must lie within the signal length");
  }

  cv::Mat acf = autocorrelation(cube.data(), n);
  for (int p = 0; p < acf.rows; ++p) {
    cv::Mat row = acf.row(p);
    row /= acf.at<double>(p, 0);
  }

  if (minSub == AutocorrMinSub::PerPixel) {
    for (int p = 0; p < acf.rows; ++p) {
      double minimum = 0.0;
      cv::minMaxLoc(acf.row(p), &minimum);
      cv::Mat row = acf.row(p);
      row -= minimum;
    }
  } else if (minSub == AutocorrMinSub::WholeCube) {
    double minimum = std::numeric_limits<double>::infinity();
    for (auto it = acf.begin<double>(); it != acf.end<double>(); ++it) {
      if (std::isfinite(*it)) {
        minimum = std::min(minimum, *it);
      }
    }
    if (std::isfinite(minimum)) {
      acf -= minimum;
    }
  }

  const auto &k = cube.index();
  std::vector<double> lagsSquared(stopIndex);
  for (int i = 0; i < stopIndex; ++i) {
    lagsSquared[i] = (k[i] - k.front()) * (k[i] - k.front());
  }

  cv::Mat logs(acf.rows, stopIndex, CV_64F);
  cv::Mat mask = cv::Mat::zeros(acf.rows, 1, CV_8U);
  for (int p = 0; p < acf.rows; ++p) {
    const double *in = acf.ptr<double>(p);
    double *out = logs.ptr<double>(p);
    for (int i = 0; i < stopIndex; ++i) {
      const double value = in[i] == 0.0 ? kTinyPositive : in[i];
      if (!(value > 0.0)) {
        mask.at<uchar>(p) = static_cast<uchar>(PixelMask::NonPositive);
        out[i] = std::numeric_limits<double>::quiet_NaN();
      } else {
        out[i] = std::log(value);
      }
    }
  }

  const MaskedLineFit fit = masked_fit_lines(lagsSquared, logs, mask);
  AutocorrelationDecay decay;
  decay.slope = pixels_to_image(fit.slope, cube.size());
  decay.rSquared = pixels_to_image(fit.rSquared, cube.size());
  decay.maskedPixels = cube.pixelCount() - fit.validCount;
  if (decay.maskedPixels > 0) {
    Logger::getInstance()->debug(
        "{} pixels excluded from the autocorrelation fit", decay.maskedPixels);
  }
  return decay;
}

cv::Mat disorder_strength(const cv::Mat &rms, const cv::Mat &slope) {
  using namespace ld_constants;
  const double k = 2 * std::numbers::pi / kReferenceWavelengthUm;
  const double fact = kNuclearIndexContrast * kNuclearIndexContrast / 2.0 /
                      (k * k);
  cv::Mat rms64;
  cv::Mat slope64;
  rms.convertTo(rms64, CV_64F);
  slope.convertTo(slope64, CV_64F);
  cv::Mat ld;
  cv::divide(rms64, -slope64, ld);
  return ld * (kA2 / kA1 * fact);
}
