#include "analysis/SignalProcessing.hpp"
#include "Logging.hpp"
#include "core/CoreTypes.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <fmt/format.h>
#include <limits>
#include <numbers>
#include <numeric>

namespace {

using Complex = std::complex<double>;

// Polynomial coefficients, highest power first, with the given roots.
std::vector<Complex> poly_from_roots(const std::vector<Complex> &roots) {
  std::vector<Complex> coeffs{1.0};
  for (const auto &root : roots) {
    coeffs.push_back(0.0);
    for (size_t i = coeffs.size() - 1; i > 0; --i) {
      coeffs[i] -= root * coeffs[i - 1];
    }
  }
  return coeffs;
}

// Steady state of the transposed direct form II filter for a unit step.
std::vector<double> steady_state(const FilterCoefficients &filter) {
  const int n = static_cast<int>(filter.a.size());
  if (n < 2) {
    return {};
  }
  cv::Mat iMinusA = cv::Mat::eye(n - 1, n - 1, CV_64F);
  cv::Mat rhs(n - 1, 1, CV_64F);
  for (int j = 0; j < n - 1; ++j) {
    iMinusA.at<double>(j, 0) += filter.a[j + 1];
    if (j + 1 < n - 1) {
      iMinusA.at<double>(j, j + 1) -= 1.0;
    }
    rhs.at<double>(j) = filter.b[j + 1] - filter.a[j + 1] * filter.b[0];
  }
  cv::Mat zi;
  if (!cv::solve(iMinusA, rhs, zi, cv::DECOMP_LU)) {
    throw ProcessingError("Filter steady state is singular");
  }
  return std::vector<double>(zi.begin<double>(), zi.end<double>());
}

void lfilter_in_place(const FilterCoefficients &filter,
                      const std::vector<double> &zi, std::vector<double> &x) {
  const size_t n = filter.a.size();
  const auto &b = filter.b;
  const auto &a = filter.a;
  const double x0 = x.front();
  std::vector<double> z(zi.size());
  for (size_t j = 0; j < zi.size(); ++j) {
    z[j] = zi[j] * x0;
  }
  for (double &sample : x) {
    const double in = sample;
    const double out = b[0] * in + (z.empty() ? 0.0 : z[0]);
    for (size_t j = 0; j + 2 < n; ++j) {
      z[j] = b[j + 1] * in + z[j + 1] - a[j + 1] * out;
    }
    if (n >= 2) {
      z[n - 2] = b[n - 1] * in - a[n - 1] * out;
    }
    sample = out;
  }
}

cv::Mat zero_padded(const cv::Mat &rows, int fftSize) {
  cv::Mat padded = cv::Mat::zeros(rows.rows, fftSize, CV_64F);
  cv::Mat head = padded.colRange(0, rows.cols);
  rows.convertTo(head, CV_64F);
  return padded;
}

} // namespace

FilterCoefficients butterworth_lowpass(int order, double cutoff, double fs) {
  if (order <= 0) {
    throw InvalidParameterError(
        fmt::format("Butterworth order must be positive, got {}", order));
  }
  const double nyquist = fs / 2.0;
  if (!(cutoff > 0.0 && cutoff < nyquist)) {
    throw InvalidParameterError(fmt::format(
        "Cutoff {} must lie strictly between 0 and the Nyquist frequency {}",
        cutoff, nyquist));
  }

  // Bilinear transform with an internal sampling frequency of 2.
  const double wn = cutoff / nyquist;
  const double fs2 = 4.0;
  const double warped = fs2 * std::tan(std::numbers::pi * wn / 2.0);

  std::vector<Complex> poles;
  Complex denominator = 1.0;
  for (int m = -order + 1; m < order; m += 2) {
    Complex p = -std::exp(Complex(0.0, std::numbers::pi * m / (2.0 * order)));
    p *= warped;
    denominator *= (fs2 - p);
    poles.push_back((fs2 + p) / (fs2 - p));
  }
  const double gain = std::pow(warped, order) * (1.0 / denominator).real();

  const auto b = poly_from_roots(std::vector<Complex>(order, -1.0));
  const auto a = poly_from_roots(poles);

  FilterCoefficients filter;
  for (size_t i = 0; i < b.size(); ++i) {
    filter.b.push_back(gain * b[i].real());
    filter.a.push_back(a[i].real());
  }
  return filter;
}

int filtfilt_padding(const FilterCoefficients &filter) {
  return 3 * static_cast<int>(std::max(filter.a.size(), filter.b.size()));
}

cv::Mat filtfilt(const FilterCoefficients &filter, const cv::Mat &rows) {
  const int edge = filtfilt_padding(filter);
  const int length = rows.cols;
  if (length <= edge) {
    throw InvalidParameterError(fmt::format(
        "Signals of length {} are too short for zero-phase filtering, need "
        "more than {} samples",
        length, edge));
  }

  const auto zi = steady_state(filter);
  cv::Mat input;
  rows.convertTo(input, CV_64F);
  cv::Mat output(rows.size(), CV_64F);
  std::vector<double> ext(length + 2 * edge);

  for (int r = 0; r < input.rows; ++r) {
    const double *x = input.ptr<double>(r);
    for (int i = 0; i < edge; ++i) {
      ext[i] = 2.0 * x[0] - x[edge - i];
      ext[edge + length + i] = 2.0 * x[length - 1] - x[length - 2 - i];
    }
    std::copy(x, x + length, ext.begin() + edge);

    lfilter_in_place(filter, zi, ext);
    std::reverse(ext.begin(), ext.end());
    lfilter_in_place(filter, zi, ext);
    std::reverse(ext.begin(), ext.end());

    std::copy(ext.begin() + edge, ext.begin() + edge + length,
              output.ptr<double>(r));
  }
  return output;
}

cv::Mat polynomial_fit(const std::vector<double> &x, const cv::Mat &rows,
                       int order) {
  const int n = static_cast<int>(x.size());
  if (order < 0 || order >= n) {
    throw InvalidParameterError(fmt::format(
        "Polynomial order {} needs more than {} samples", order, n));
  }
  if (rows.cols != n) {
    throw InvalidParameterError("Polynomial fit abscissa length mismatch");
  }

  // Centered and scaled abscissa keeps the Vandermonde matrix well conditioned.
  const double mean = std::accumulate(x.begin(), x.end(), 0.0) / n;
  double scale = 0.0;
  for (double v : x) {
    scale = std::max(scale, std::abs(v - mean));
  }
  scale = scale > 0 ? scale : 1.0;

  cv::Mat vandermonde(n, order + 1, CV_64F);
  for (int i = 0; i < n; ++i) {
    const double u = (x[i] - mean) / scale;
    double power = 1.0;
    for (int j = 0; j <= order; ++j) {
      vandermonde.at<double>(i, j) = power;
      power *= u;
    }
  }
  cv::Mat pseudoInverse;
  cv::invert(vandermonde, pseudoInverse, cv::DECOMP_SVD);
  const cv::Mat projection = vandermonde * pseudoInverse;

  cv::Mat data;
  rows.convertTo(data, CV_64F);
  cv::Mat fitted;
  cv::gemm(data, projection, 1.0, cv::noArray(), 0.0, fitted, cv::GEMM_2_T);
  return fitted;
}

int next_power_of_two(int n) {
  int size = 1;
  while (size < n) {
    size <<= 1;
  }
  return size;
}

namespace {

// Inverse transform of |FFT|^2 of every row at the given transform length.
cv::Mat power_spectrum_correlation(const cv::Mat &rows, int lags, int fftSize) {
  if (lags <= 0 || lags > rows.cols) {
    throw InvalidParameterError(
        fmt::format("Cannot return {} lags of {} samples", lags, rows.cols));
  }
  cv::Mat spectrum;
  cv::dft(zero_padded(rows, fftSize), spectrum,
          cv::DFT_ROWS | cv::DFT_COMPLEX_OUTPUT);

  cv::Mat planes[2];
  cv::split(spectrum, planes);
  cv::Mat power = planes[0].mul(planes[0]) + planes[1].mul(planes[1]);
  cv::Mat powerComplex;
  cv::merge(std::vector<cv::Mat>{power, cv::Mat::zeros(power.size(), CV_64F)},
            powerComplex);

  cv::Mat correlation;
  cv::dft(powerComplex, correlation,
          cv::DFT_INVERSE | cv::DFT_ROWS | cv::DFT_SCALE | cv::DFT_REAL_OUTPUT);
  return correlation.colRange(0, lags).clone();
}

} // namespace

cv::Mat autocorrelation(const cv::Mat &rows, int lags) {
  return power_spectrum_correlation(rows, lags,
                                    next_power_of_two(2 * rows.cols - 1));
}

cv::Mat circular_autocorrelation(const cv::Mat &rows, int lags) {
  return power_spectrum_correlation(rows, lags, rows.cols);
}

cv::Mat fft_magnitude(const cv::Mat &rows, int fftSize) {
  if (fftSize < rows.cols) {
    throw InvalidParameterError("FFT size shorter than the signal");
  }
  cv::Mat spectrum;
  cv::dft(zero_padded(rows, fftSize), spectrum,
          cv::DFT_ROWS | cv::DFT_COMPLEX_OUTPUT);
  cv::Mat planes[2];
  cv::split(spectrum, planes);
  cv::Mat magnitude;
  cv::magnitude(planes[0], planes[1], magnitude);
  return magnitude.colRange(0, fftSize / 2 + 1).clone();
}

std::vector<double> hann_window(int n) {
  if (n == 1) {
    return {1.0};
  }
  std::vector<double> w(n);
  for (int i = 0; i < n; ++i) {
    w[i] = 0.5 - 0.5 * std::cos(2.0 * std::numbers::pi * i / (n - 1));
  }
  return w;
}

LineFit fit_lines(const std::vector<double> &x, const cv::Mat &y) {
  const int length = static_cast<int>(x.size());
  if (y.cols != length || length < 2) {
    throw InvalidParameterError(fmt::format(
        "Line fit needs matching abscissa of at least 2 samples, got {} and "
        "{}",
        length, y.cols));
  }
  const double xMean = std::accumulate(x.begin(), x.end(), 0.0) / length;
  double sxx = 0.0;
  for (double v : x) {
    sxx += (v - xMean) * (v - xMean);
  }
  if (sxx == 0.0) {
    throw InvalidParameterError("Line fit abscissa has no spread");
  }

  cv::Mat values;
  y.convertTo(values, CV_64F);
  LineFit fit{cv::Mat(y.rows, 1, CV_64F), cv::Mat(y.rows, 1, CV_64F),
              cv::Mat(y.rows, 1, CV_64F)};
  for (int r = 0; r < values.rows; ++r) {
    const double *v = values.ptr<double>(r);
    const double yMean = std::accumulate(v, v + length, 0.0) / length;
    double sxy = 0.0;
    for (int i = 0; i < length; ++i) {
      sxy += (x[i] - xMean) * (v[i] - yMean);
    }
    const double slope = sxy / sxx;
    const double intercept = yMean - slope * xMean;
    double ssErr = 0.0;
    for (int i = 0; i < length; ++i) {
      const double residual = v[i] - (intercept + slope * x[i]);
      ssErr += residual * residual;
    }
    const double ssReg = slope * slope * sxx;
    fit.slope.at<double>(r) = slope;
    fit.intercept.at<double>(r) = intercept;
    fit.rSquared.at<double>(r) = ssReg / (ssReg + ssErr);
  }
  return fit;
}

MaskedLineFit masked_fit_lines(const std::vector<double> &x, const cv::Mat &y,
                               const cv::Mat &mask) {
  if (mask.rows != y.rows || mask.cols != 1 || mask.type() != CV_8U) {
    throw InvalidParameterError("Regression mask must be a CV_8U column");
  }
  cv::Mat values;
  y.convertTo(values, CV_64F);

  MaskedLineFit result;
  result.mask = mask.clone();
  const cv::Scalar nan(std::numeric_limits<double>::quiet_NaN());
  result.slope = cv::Mat(y.rows, 1, CV_64F, nan);
  result.rSquared = cv::Mat(y.rows, 1, CV_64F, nan);

  std::vector<int> survivors;
  for (int r = 0; r < values.rows; ++r) {
    if (result.mask.at<uchar>(r) != static_cast<uchar>(PixelMask::Valid)) {
      continue;
    }
    if (!cv::checkRange(values.row(r), true)) {
      result.mask.at<uchar>(r) = static_cast<uchar>(PixelMask::NotFinite);
      continue;
    }
    survivors.push_back(r);
  }
  result.validCount = static_cast<int>(survivors.size());
  if (survivors.empty()) {
    Logger::getInstance()->warn("Masked regression has no surviving rows");
    return result;
  }

  cv::Mat compact(result.validCount, values.cols, CV_64F);
  for (int i = 0; i < result.validCount; ++i) {
    values.row(survivors[i]).copyTo(compact.row(i));
  }
  const LineFit fit = fit_lines(x, compact);
  for (int i = 0; i < result.validCount; ++i) {
    result.slope.at<double>(survivors[i]) = fit.slope.at<double>(i);
    result.rSquared.at<double>(survivors[i]) = fit.rSquared.at<double>(i);
  }
  return result;
}

cv::Mat row_std(const cv::Mat &rows) {
  cv::Mat out(rows.rows, 1, CV_64F);
  for (int r = 0; r < rows.rows; ++r) {
    cv::Scalar mean;
    cv::Scalar stddev;
    cv::meanStdDev(rows.row(r), mean, stddev);
    out.at<double>(r) = stddev[0];
  }
  return out;
}
