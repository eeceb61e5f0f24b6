#pragma once

#include "analysis/AnalysisSettings.hpp"
#include "core/ImageCube.hpp"

#include <opencv2/opencv.hpp>
#include <optional>
#include <vector>

/**
 * @brief Optical path difference spectrum of every pixel.
 */
struct Opd {
  cv::Mat values;            ///< pixelCount x index.size(), CV_64F
  std::vector<double> index; ///< OPD of each column, unit: um
};

/**
 * @brief FFT size used for OPD spectra of n samples.
 *
 * Twice the next power of two >= 2n - 1, which interpolates the spectrum.
 */
int opd_fft_size(int n);

/**
 * @brief Magnitude of the (optionally Hann windowed) FFT of each pixel's
 * signal along wavenumber, normalized by the signal length and by the window
 * power so that the area under the squared OPD is preserved.
 *
 * @param cube Wavenumber cube.
 * @param useHannWindow Apply a Hann window before the transform.
 * @param indexOpdStop Keep only the first indexOpdStop OPD samples.
 */
Opd compute_opd(const KCube &cube, bool useHannWindow,
                std::optional<int> indexOpdStop = std::nullopt);

/**
 * @brief Signal RMS integrated from the OPD between two OPD limits.
 *
 * Uses Parseval's theorem on the mean subtracted signal: every one-sided
 * frequency except DC and Nyquist counts twice. Over the full OPD range and
 * without a window the result equals the population standard deviation of
 * each pixel's signal.
 *
 * @return height x width CV_64F map.
 */
cv::Mat rms_from_opd(const KCube &cube, double lowerOpd, double upperOpd,
                     bool useHannWindow = false);

/**
 * @brief Decay of the normalized autocorrelation of each pixel's signal.
 */
struct AutocorrelationDecay {
  cv::Mat slope;    ///< height x width CV_64F, NaN where masked
  cv::Mat rSquared; ///< height x width CV_64F, NaN where masked
  int maskedPixels{0};
};

/**
 * @brief Fits log(ACF) against the squared wavenumber lag.
 *
 * The autocorrelation is computed through a zero padded FFT and normalized to
 * 1 at zero lag. Pixels with a non-positive or non-finite ACF within the first
 * stopIndex lags are masked rather than fitted.
 *
 * @param cube Detrended wavenumber cube.
 * @param minSub Minimum subtraction applied before the logarithm.
 * @param stopIndex Number of lags included in the fit.
 */
AutocorrelationDecay autocorrelation_decay(const KCube &cube,
                                           AutocorrMinSub minSub,
                                           int stopIndex);

/**
 * @brief Empirical constants of the disorder strength Ld. Their physical
 * derivation after a change of units is uncertain, so Ld is a legacy, low
 * confidence metric.
 */
namespace ld_constants {
inline constexpr double kA1 = 0.008;
inline constexpr double kA2 = 4.0;
inline constexpr double kNuclearIndexContrast = 1.38; ///< Refractive index
inline constexpr double kReferenceWavelengthUm = 0.55;
} // namespace ld_constants

/**
 * @brief Disorder strength Ld = (A2 / A1) * fact * rms / (-slope) with
 * fact = n^2 / 2 / k^2 at k = 2 pi / 0.55 um.
 */
cv::Mat disorder_strength(const cv::Mat &rms, const cv::Mat &slope);
