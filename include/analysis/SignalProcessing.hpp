#pragma once

#include <opencv2/opencv.hpp>
#include <vector>

/**
 * @brief Transfer function coefficients b (numerator) and a (denominator) of a
 * digital IIR filter, normalized so that a[0] == 1.
 */
struct FilterCoefficients {
  std::vector<double> b;
  std::vector<double> a;
};

/**
 * @brief Designs a digital low-pass Butterworth filter.
 *
 * The analog prototype is frequency prewarped and mapped with the bilinear
 * transform.
 *
 * @param order Filter order, must be positive.
 * @param cutoff Cutoff frequency in the units of fs.
 * @param fs Sampling frequency.
 * @throws InvalidParameterError unless 0 < cutoff < fs / 2.
 */
FilterCoefficients butterworth_lowpass(int order, double cutoff, double fs);

/**
 * @brief Number of samples filtfilt pads each end with.
 */
int filtfilt_padding(const FilterCoefficients &filter);

/**
 * @brief Zero-phase filtering of every row of a matrix.
 *
 * Each row is extended by odd reflection at both ends, filtered forward and
 * backward starting from the filter's steady state, and trimmed back to its
 * original length.
 *
 * @param filter Filter coefficients.
 * @param rows Signals, one per row.
 * @return CV_64F matrix of the same size.
 * @throws InvalidParameterError if the rows are not longer than the padding.
 */
cv::Mat filtfilt(const FilterCoefficients &filter, const cv::Mat &rows);

/**
 * @brief Least squares polynomial fit of every row against x.
 * @return The fitted values, CV_64F matrix of the same size as rows.
 * @throws InvalidParameterError if order >= x.size().
 */
cv::Mat polynomial_fit(const std::vector<double> &x, const cv::Mat &rows,
                       int order);

/**
 * @brief Smallest power of two that is >= n.
 */
int next_power_of_two(int n);

/**
 * @brief Linear autocorrelation sums r[l] = sum_i x[i] x[i + l] of every row,
 * computed through a zero padded FFT.
 *
 * @param rows Signals, one per row.
 * @param lags Number of lags to return, at most the row length.
 * @return CV_64F matrix with rows.rows rows and lags columns.
 */
cv::Mat autocorrelation(const cv::Mat &rows, int lags);

/**
 * @brief Circular autocorrelation sums r[l] = sum_i x[i] x[(i + l) mod N] of
 * every row, the inverse FFT of the unpadded power spectrum.
 *
 * @param rows Signals, one per row.
 * @param lags Number of lags to return, at most the row length.
 * @return CV_64F matrix with rows.rows rows and lags columns.
 */
cv::Mat circular_autocorrelation(const cv::Mat &rows, int lags);

/**
 * @brief Magnitude of the one-sided FFT of each row, zero padded to fftSize.
 * @return CV_64F matrix with fftSize / 2 + 1 columns.
 */
cv::Mat fft_magnitude(const cv::Mat &rows, int fftSize);

/**
 * @brief Symmetric Hann window of length n.
 */
std::vector<double> hann_window(int n);

/**
 * @brief Per-row least squares line y = slope * x + intercept.
 */
struct LineFit {
  cv::Mat slope;     ///< rows x 1, CV_64F
  cv::Mat intercept; ///< rows x 1, CV_64F
  cv::Mat rSquared;  ///< rows x 1, CV_64F, SSreg / (SSreg + SSerr)
};

/**
 * @brief Fits a straight line to every row of y against x.
 */
LineFit fit_lines(const std::vector<double> &x, const cv::Mat &y);

/**
 * @brief Reason a pixel was excluded from a regression.
 */
enum class PixelMask : uchar {
  Valid = 0,       ///< Included in the regression
  LowSignal = 1,   ///< Signal to noise ratio below threshold
  NonPositive = 2, ///< Non-positive value where a logarithm was needed
  NotFinite = 3    ///< NaN or infinite input
};

/**
 * @brief Result of a regression restricted to unmasked rows.
 */
struct MaskedLineFit {
  cv::Mat slope;    ///< rows x 1, CV_64F, NaN where masked
  cv::Mat rSquared; ///< rows x 1, CV_64F, NaN where masked
  cv::Mat mask;     ///< rows x 1, CV_8U PixelMask values
  int validCount{0};
};

/**
 * @brief Fits lines to the rows whose mask entry is PixelMask::Valid.
 *
 * Only the surviving rows are gathered and fitted. Rows containing non-finite
 * values are additionally marked PixelMask::NotFinite. The full size output
 * keeps the mask reason of every excluded row.
 *
 * @param x Abscissa shared by all rows.
 * @param y Values, one row per pixel.
 * @param mask rows x 1 CV_8U PixelMask values.
 */
MaskedLineFit masked_fit_lines(const std::vector<double> &x, const cv::Mat &y,
                               const cv::Mat &mask);

/**
 * @brief Population standard deviation of every row.
 * @return rows x 1 CV_64F column.
 */
cv::Mat row_std(const cv::Mat &rows);
