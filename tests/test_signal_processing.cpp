#include "doctest/doctest.h"

#include "TestCubes.hpp"
#include "analysis/SignalProcessing.hpp"
#include "analysis/SpectralAnalysis.hpp"
#include "core/CoreTypes.hpp"

#include <cmath>
#include <limits>
#include <numbers>
#include <opencv2/opencv.hpp>

TEST_CASE("butterworth design") {
  SUBCASE("unit gain at DC") {
    const auto filter = butterworth_lowpass(2, 0.15, 1.0);
    REQUIRE(filter.b.size() == 3);
    REQUIRE(filter.a.size() == 3);
    CHECK(filter.a[0] == doctest::Approx(1.0));
    double sumB = 0.0;
    double sumA = 0.0;
    for (size_t i = 0; i < filter.b.size(); ++i) {
      sumB += filter.b[i];
      sumA += filter.a[i];
    }
    CHECK(sumB / sumA == doctest::Approx(1.0));
  }
  SUBCASE("cutoff must be below Nyquist") {
    CHECK_THROWS_AS(butterworth_lowpass(2, 0.5, 1.0), InvalidParameterError);
    CHECK_THROWS_AS(butterworth_lowpass(2, 0.0, 1.0), InvalidParameterError);
    CHECK_THROWS_AS(butterworth_lowpass(0, 0.1, 1.0), InvalidParameterError);
  }
}

TEST_CASE("filtfilt keeps constant and slowly varying signals") {
  const auto filter = butterworth_lowpass(2, 0.15, 1.0);
  cv::Mat rows(2, 64, CV_64F);
  for (int i = 0; i < rows.cols; ++i) {
    rows.at<double>(0, i) = 3.5;
    rows.at<double>(1, i) = 1.0 + 0.01 * i;
  }
  const cv::Mat filtered = filtfilt(filter, rows);
  REQUIRE(filtered.size() == rows.size());
  for (int i = 0; i < rows.cols; ++i) {
    CHECK(filtered.at<double>(0, i) == doctest::Approx(3.5).epsilon(1e-9));
    CHECK(filtered.at<double>(1, i) ==
          doctest::Approx(rows.at<double>(1, i)).epsilon(1e-3));
  }
}

TEST_CASE("filtfilt attenuates content above the cutoff") {
  const auto filter = butterworth_lowpass(4, 0.05, 1.0);
  cv::Mat rows(1, 200, CV_64F);
  for (int i = 0; i < rows.cols; ++i) {
    rows.at<double>(0, i) = std::sin(2 * std::numbers::pi * 0.4 * i);
  }
  const cv::Mat filtered = filtfilt(filter, rows);
  const cv::Mat interior = filtered.colRange(50, 150);
  double maxAbs = 0.0;
  cv::minMaxLoc(cv::abs(interior), nullptr, &maxAbs);
  CHECK(maxAbs < 0.01);
}

TEST_CASE("filtfilt needs signals longer than its padding") {
  const auto filter = butterworth_lowpass(2, 0.15, 1.0);
  const cv::Mat rows = cv::Mat::ones(1, filtfilt_padding(filter), CV_64F);
  CHECK_THROWS_AS(filtfilt(filter, rows), InvalidParameterError);
}

TEST_CASE("polynomial fit reproduces polynomials") {
  const auto x = linspace(10.0, 12.0, 30);
  cv::Mat rows(2, 30, CV_64F);
  for (int i = 0; i < 30; ++i) {
    rows.at<double>(0, i) = 2.0 - 0.5 * x[i] + 0.1 * x[i] * x[i];
    rows.at<double>(1, i) = 7.0;
  }
  const cv::Mat fitted = polynomial_fit(x, rows, 2);
  const cv::Mat residual = rows - fitted;
  CHECK(cv::norm(residual, cv::NORM_INF) < 1e-8);

  CHECK_THROWS_AS(polynomial_fit(x, rows, 30), InvalidParameterError);
}

TEST_CASE("autocorrelation sums lagged products") {
  cv::Mat rows = (cv::Mat_<double>(1, 4) << 1.0, 2.0, 3.0, 4.0);
  const cv::Mat acf = autocorrelation(rows, 3);
  REQUIRE(acf.cols == 3);
  CHECK(acf.at<double>(0, 0) == doctest::Approx(30.0));
  CHECK(acf.at<double>(0, 1) == doctest::Approx(20.0));
  CHECK(acf.at<double>(0, 2) == doctest::Approx(11.0));
}

TEST_CASE("hann window is symmetric") {
  const auto window = hann_window(9);
  CHECK(window.front() == doctest::Approx(0.0));
  CHECK(window[4] == doctest::Approx(1.0));
  for (int i = 0; i < 9; ++i) {
    CHECK(window[i] == doctest::Approx(window[8 - i]));
  }
}

TEST_CASE("line fits") {
  const std::vector<double> x{0.0, 1.0, 2.0, 3.0};
  cv::Mat y = (cv::Mat_<double>(2, 4) << 1.0, 3.0, 5.0, 7.0, 2.0, 1.0, 2.0,
               1.0);

  const auto fit = fit_lines(x, y);
  CHECK(fit.slope.at<double>(0) == doctest::Approx(2.0));
  CHECK(fit.intercept.at<double>(0) == doctest::Approx(1.0));
  CHECK(fit.rSquared.at<double>(0) == doctest::Approx(1.0));
  CHECK(fit.slope.at<double>(1) == doctest::Approx(-0.2));
  // Closed form: SSreg = 0.04 * 5, SSerr = 1 - 0.2
  CHECK(fit.rSquared.at<double>(1) == doctest::Approx(0.2));
}

TEST_CASE("masked line fits skip excluded rows") {
  const std::vector<double> x{0.0, 1.0, 2.0};
  const double nan = std::numeric_limits<double>::quiet_NaN();
  cv::Mat y = (cv::Mat_<double>(4, 3) << 0.0, -1.0, -2.0, //
               5.0, 5.0, 5.0,                             //
               1.0, nan, 3.0,                             //
               2.0, 4.0, 6.0);
  cv::Mat mask = cv::Mat::zeros(4, 1, CV_8U);
  mask.at<uchar>(1) = static_cast<uchar>(PixelMask::LowSignal);

  const auto fit = masked_fit_lines(x, y, mask);
  CHECK(fit.validCount == 2);
  CHECK(fit.slope.at<double>(0) == doctest::Approx(-1.0));
  CHECK(fit.slope.at<double>(3) == doctest::Approx(2.0));
  CHECK(std::isnan(fit.slope.at<double>(1)));
  CHECK(std::isnan(fit.slope.at<double>(2)));
  CHECK(fit.mask.at<uchar>(1) == static_cast<uchar>(PixelMask::LowSignal));
  CHECK(fit.mask.at<uchar>(2) == static_cast<uchar>(PixelMask::NotFinite));
  CHECK(fit.mask.at<uchar>(3) == static_cast<uchar>(PixelMask::Valid));
}

TEST_CASE("masked slopes equal a direct fit of the valid rows") {
  const std::vector<double> x{0.0, 0.4, 1.1, 1.5, 2.7};
  cv::Mat y(6, 5, CV_64F);
  cv::RNG rng(7);
  rng.fill(y, cv::RNG::UNIFORM, -3.0, 3.0);
  cv::Mat mask = cv::Mat::zeros(6, 1, CV_8U);
  mask.at<uchar>(1) = static_cast<uchar>(PixelMask::NonPositive);
  mask.at<uchar>(4) = static_cast<uchar>(PixelMask::LowSignal);

  const auto fit = masked_fit_lines(x, y, mask);
  REQUIRE(fit.validCount == 4);

  // Order 1 polynomial through each row; its values give the slope.
  const cv::Mat fitted = polynomial_fit(x, y, 1);
  const auto direct = fit_lines(x, y);
  for (int r = 0; r < y.rows; ++r) {
    CAPTURE(r);
    if (mask.at<uchar>(r) != static_cast<uchar>(PixelMask::Valid)) {
      CHECK(std::isnan(fit.slope.at<double>(r)));
      continue;
    }
    const double slope = (fitted.at<double>(r, 1) - fitted.at<double>(r, 0)) /
                         (x[1] - x[0]);
    CHECK(fit.slope.at<double>(r) == doctest::Approx(slope).epsilon(1e-9));
    CHECK(fit.slope.at<double>(r) ==
          doctest::Approx(direct.slope.at<double>(r)).epsilon(1e-9));
    CHECK(fit.rSquared.at<double>(r) ==
          doctest::Approx(direct.rSquared.at<double>(r)).epsilon(1e-9));
  }
}

TEST_CASE("OPD based RMS over the full range equals the signal std") {
  const auto k = linspace(9.0, 12.3, 80);
  cv::Mat data(3, 80, CV_64F);
  for (int p = 0; p < 3; ++p) {
    for (int i = 0; i < 80; ++i) {
      data.at<double>(p, i) =
          0.1 * (p + 1) * std::sin(7.0 * (p + 1) * k[i]) + 0.02 * p * i;
    }
  }
  const KCube cube(data, cv::Size(3, 1), k);
  const cv::Mat fromOpd = rms_from_opd(cube, 0.0, 1e9);
  const cv::Mat direct = pixels_to_image(row_std(data), cube.size());
  for (int p = 0; p < 3; ++p) {
    CHECK(fromOpd.at<double>(0, p) ==
          doctest::Approx(direct.at<double>(0, p)).epsilon(1e-9));
  }
}

TEST_CASE("OPD spectrum peaks at the oscillation's path difference") {
  const auto k = linspace(9.0, 12.3, 100);
  const double opd = 6.0;
  cv::Mat data(1, 100, CV_64F);
  for (int i = 0; i < 100; ++i) {
    data.at<double>(0, i) = std::cos(opd * k[i]);
  }
  const KCube cube(data, cv::Size(1, 1), k);
  const auto spectrum = compute_opd(cube, true);
  REQUIRE(spectrum.values.cols == static_cast<int>(spectrum.index.size()));

  cv::Point peak;
  cv::minMaxLoc(spectrum.values, nullptr, nullptr, nullptr, &peak);
  const double angular = 2 * std::numbers::pi * peak.x /
                         (opd_fft_size(100) * cube.wavenumberStep());
  CHECK(angular == doctest::Approx(opd).epsilon(0.05));

  const auto truncated = compute_opd(cube, false, 10);
  CHECK(truncated.values.cols == 10);
  CHECK(truncated.index.size() == 10);
}

TEST_CASE("autocorrelation decay of a smooth signal") {
  const auto k = linspace(9.0, 12.3, 60);
  cv::Mat data(2, 60, CV_64F);
  for (int i = 0; i < 60; ++i) {
    data.at<double>(0, i) = std::sin(2.0 * k[i]) + 0.5 * std::sin(3.1 * k[i]);
    data.at<double>(1, i) = 0.0;
  }
  const KCube cube(data, cv::Size(2, 1), k);
  const auto decay = autocorrelation_decay(cube, AutocorrMinSub::Disabled, 5);
  CHECK(decay.slope.at<double>(0, 0) < 0.0);
  CHECK(decay.rSquared.at<double>(0, 0) > 0.5);
  // An all-zero signal has no defined autocorrelation.
  CHECK(std::isnan(decay.slope.at<double>(0, 1)));
  CHECK(decay.maskedPixels == 1);

  CHECK_THROWS_AS(autocorrelation_decay(cube, AutocorrMinSub::Disabled, 61),
                  InvalidParameterError);
}

TEST_CASE("disorder strength uses the legacy constants") {
  const cv::Mat rms(1, 2, CV_64F, cv::Scalar(0.1));
  cv::Mat slope = (cv::Mat_<double>(1, 2) << -2.0,
                   std::numeric_limits<double>::quiet_NaN());
  const cv::Mat ld = disorder_strength(rms, slope);

  const double k = 2 * std::numbers::pi / ld_constants::kReferenceWavelengthUm;
  const double fact = ld_constants::kNuclearIndexContrast *
                      ld_constants::kNuclearIndexContrast / 2.0 / (k * k);
  const double expected =
      ld_constants::kA2 / ld_constants::kA1 * fact * 0.1 / 2.0;
  CHECK(ld.at<double>(0, 0) == doctest::Approx(expected));
  CHECK(std::isnan(ld.at<double>(0, 1)));
}
