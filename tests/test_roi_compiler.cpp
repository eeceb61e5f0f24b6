#include "doctest/doctest.h"

#include "TestCubes.hpp"
#include "analysis/SignalProcessing.hpp"
#include "compilation/Roi.hpp"
#include "compilation/RoiCompiler.hpp"
#include "core/CoreTypes.hpp"

#include <cmath>
#include <limits>
#include <opencv2/opencv.hpp>

namespace {

const cv::Size kSize(4, 4);
const double kNan = std::numeric_limits<double>::quiet_NaN();

// Left half of the field of view.
Roi left_half() {
  return Roi::fromVerts("nucleus", 1, {{0, 0}, {1, 0}, {1, 3}, {0, 3}}, kSize);
}

// Inside value in the left half, a different value in the right half.
cv::Mat split_map(double inside, double outside) {
  cv::Mat map(kSize, CV_64F, cv::Scalar(outside));
  map.colRange(0, 2).setTo(inside);
  return map;
}

PwsAnalysisResults pws_results() {
  // Every pixel oscillates by +-0.1, so each pixel's RMS equals the standard
  // deviation of the ROI's mean spectrum.
  const auto k = linspace(9.0, 12.0, 8);
  cv::Mat spectra(kSize.area(), 8, CV_64F);
  for (int p = 0; p < spectra.rows; ++p) {
    for (int i = 0; i < 8; ++i) {
      spectra.at<double>(p, i) = i % 2 == 0 ? 0.1 : -0.1;
    }
  }

  cv::Mat rms = split_map(0.1, 7.0);
  rms.at<double>(2, 1) = kNan;

  cv::Mat slope = split_map(-2.0, -50.0);
  cv::Mat rSquared = split_map(0.95, 0.99);
  slope.at<double>(0, 0) = -10.0;
  rSquared.at<double>(0, 0) = 0.5;
  slope.at<double>(1, 0) = 1.0;

  cv::Mat opd(kSize.area(), 3, CV_32F, cv::Scalar(9.0f));
  for (int y = 0; y < kSize.height; ++y) {
    for (int x = 0; x < 2; ++x) {
      const int p = y * kSize.width + x;
      opd.at<float>(p, 0) = 1.0f;
      opd.at<float>(p, 1) = 2.0f;
      opd.at<float>(p, 2) = 3.0f;
    }
  }

  PwsResultFields fields{
      .time = "01-01-2024 12:00:00",
      .reflectance = KCube(spectra, kSize, k),
      .meanReflectance = split_map(0.3, 5.0),
      .rms = rms,
      .imCubeIdTag = "ImCube_TestSystem_01-01-2024 12:00:00",
      .referenceIdTag = "ImCube_TestSystem_01-01-2024 11:00:00",
  };
  fields.polynomialRms = split_map(0.02, 1.0);
  fields.autoCorrelationSlope = slope;
  fields.rSquared = rSquared;
  fields.ld = split_map(4.0, 0.0);
  fields.opd = opd;
  fields.opdIndex = std::vector<double>{0.0, 1.0, 2.0};
  return PwsAnalysisResults::create(std::move(fields),
                                    PwsAnalysisSettings::createDefault());
}

DynamicsAnalysisResults dynamics_results() {
  cv::Mat diffusion = split_map(0.5, 3.0);
  cv::Mat provenance(kSize, CV_8U,
                     cv::Scalar(static_cast<int>(PixelMask::Valid)));
  diffusion.at<double>(3, 1) = 100.0;
  provenance.at<uchar>(3, 1) = static_cast<uchar>(PixelMask::LowSignal);

  DynamicsResultFields fields{
      .time = "01-01-2024 12:00:00",
      .reflectance = ImageCube(cv::Mat::ones(kSize.area(), 4, CV_32F), kSize,
                               {0.0, 10.0, 20.0, 30.0}),
      .meanReflectance = split_map(1.0, 2.0),
      .rmsTSquared = split_map(0.001, 0.0),
      .diffusion = diffusion,
      .diffusionMask = provenance,
      .imCubeIdTag = "DynCube_TestSystem_01-01-2024 12:00:00",
      .referenceIdTag = "DynCube_TestSystem_01-01-2024 11:00:00",
  };
  return DynamicsAnalysisResults::create(
      std::move(fields), DynamicsAnalysisSettings::createDefault());
}

} // namespace

TEST_CASE("roi masks and outlines") {
  const Roi roi = left_half();
  CHECK(roi.area() == 8);
  CHECK(roi.size() == kSize);
  CHECK(roi.boundingRect() == cv::Rect(0, 0, 2, 4));
  CHECK(roi.name() == "nucleus");
  CHECK(roi.number() == 1);

  cv::Mat mask = cv::Mat::zeros(kSize, CV_8U);
  mask(cv::Rect(1, 1, 2, 2)).setTo(1);
  const Roi traced("cell", 2, mask);
  CHECK(traced.area() == 4);
  CHECK_FALSE(traced.verts().empty());

  CHECK_THROWS_AS(Roi("empty", 1, cv::Mat()), InvalidParameterError);
  CHECK_THROWS_AS(Roi("blank", 1, cv::Mat::zeros(kSize, CV_8U)),
                  InvalidParameterError);
  CHECK_THROWS_AS(Roi("color", 1, cv::Mat(kSize, CV_8UC3, cv::Scalar::all(1))),
                  InvalidParameterError);
  CHECK_THROWS_AS(Roi::fromVerts("line", 1, {{0, 0}, {3, 3}}, kSize),
                  InvalidParameterError);
}

TEST_CASE("averages over a roi ignore non-finite values") {
  const Roi roi = left_half();
  cv::Mat values = split_map(2.5, -1.0);
  CHECK(average_over_roi(roi.mask(), values) == doctest::Approx(2.5));

  values.at<double>(0, 0) = std::numeric_limits<double>::infinity();
  values.at<double>(1, 1) = kNan;
  CHECK(average_over_roi(roi.mask(), values) == doctest::Approx(2.5));

  const cv::Mat none = cv::Mat::zeros(kSize, CV_8U);
  CHECK(std::isnan(average_over_roi(roi.mask(), values, none)));

  CHECK_THROWS_AS(average_over_roi(roi.mask(), cv::Mat::zeros(3, 3, CV_64F)),
                  InvalidParameterError);
}

TEST_CASE("compiling pws results") {
  const RoiCompiler compiler;
  const auto [compiled, warnings] = compiler.compile(pws_results(), left_half());

  CHECK(compiled.roiName == "nucleus");
  CHECK(compiled.roiNumber == 1);
  CHECK_FALSE(compiled.dynamics.has_value());
  REQUIRE(compiled.pws.has_value());
  const auto &pws = *compiled.pws;

  CHECK(pws.cellIdTag == std::string("ImCube_TestSystem_01-01-2024 12:00:00"));
  CHECK(*pws.reflectance == doctest::Approx(0.3));
  CHECK(*pws.rms == doctest::Approx(0.1));
  CHECK(*pws.polynomialRms == doctest::Approx(0.02));
  // Only well fitted, decaying pixels count towards the slope.
  CHECK(*pws.autoCorrelationSlope == doctest::Approx(-2.0));
  CHECK(*pws.rSquared == doctest::Approx((7 * 0.95 + 0.5) / 8));
  CHECK(*pws.ld == doctest::Approx(4.0));

  REQUIRE(pws.opd.has_value());
  REQUIRE(pws.opd->size() == 3);
  CHECK((*pws.opd)[0] == doctest::Approx(1.0));
  CHECK((*pws.opd)[2] == doctest::Approx(3.0));
  CHECK(pws.opdIndex->size() == 3);

  REQUIRE(pws.meanSigmaRatio.has_value());
  CHECK(*pws.meanSigmaRatio == doctest::Approx(1.0));
  CHECK(compiled.generic.roiArea == 8);

  REQUIRE(warnings.size() == 2);
  CHECK(warnings[0].shortMsg == "R^2 too low");
  CHECK(warnings[1].shortMsg == "Mean RMS ratio too high");
}

TEST_CASE("disabled metrics stay absent") {
  CompilerSettings settings;
  settings.pws.rms = false;
  settings.pws.opd = false;
  settings.pws.meanSigmaRatio = false;
  settings.generic.roiArea = false;
  const RoiCompiler compiler(settings);
  const auto [compiled, warnings] = compiler.compile(pws_results(), left_half());

  REQUIRE(compiled.pws.has_value());
  CHECK_FALSE(compiled.pws->rms.has_value());
  CHECK_FALSE(compiled.pws->opd.has_value());
  CHECK_FALSE(compiled.pws->meanSigmaRatio.has_value());
  CHECK_FALSE(compiled.generic.roiArea.has_value());
  CHECK(compiled.pws->reflectance.has_value());
}

TEST_CASE("advanced metrics absent from the results stay absent") {
  PwsResultFields fields{
      .time = "01-01-2024 12:00:00",
      .reflectance = KCube(cv::Mat::zeros(kSize.area(), 4, CV_64F), kSize,
                           {9.0, 10.0, 11.0, 12.0}),
      .meanReflectance = split_map(0.3, 0.3),
      .rms = split_map(0.1, 0.1),
      .imCubeIdTag = "ImCube_TestSystem_01-01-2024 12:00:00",
      .referenceIdTag = "ImCube_TestSystem_01-01-2024 11:00:00",
  };
  const auto results = PwsAnalysisResults::create(
      std::move(fields), PwsAnalysisSettings::createDefault());

  CompilerSettings settings;
  settings.pws.meanSigmaRatio = false;
  const auto [compiled, warnings] =
      RoiCompiler(settings).compile(results, left_half());
  REQUIRE(compiled.pws.has_value());
  CHECK(compiled.pws->rms.has_value());
  CHECK_FALSE(compiled.pws->autoCorrelationSlope.has_value());
  CHECK_FALSE(compiled.pws->rSquared.has_value());
  CHECK_FALSE(compiled.pws->ld.has_value());
  CHECK_FALSE(compiled.pws->opd.has_value());
  CHECK(warnings.empty());
}

TEST_CASE("compiling dynamics results") {
  const auto [compiled, warnings] =
      RoiCompiler().compile(dynamics_results(), left_half());

  CHECK_FALSE(compiled.pws.has_value());
  REQUIRE(compiled.dynamics.has_value());
  const auto &dynamics = *compiled.dynamics;
  CHECK(*dynamics.meanReflectance == doctest::Approx(1.0));
  CHECK(*dynamics.rmsTSquared == doctest::Approx(0.001));
  // The low signal pixel is left out even though its value is finite.
  CHECK(*dynamics.diffusion == doctest::Approx(0.5));
  CHECK(warnings.empty());
}

TEST_CASE("roi must match the results' shape") {
  cv::Mat mask = cv::Mat::zeros(5, 5, CV_8U);
  mask.at<uchar>(2, 2) = 1;
  const Roi roi("nucleus", 3, mask);
  CHECK_THROWS_AS(static_cast<void>(RoiCompiler().compile(pws_results(), roi)),
                  InvalidParameterError);
}
