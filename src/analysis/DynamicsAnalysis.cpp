#include "analysis/DynamicsAnalysis.hpp"
#include "Logging.hpp"
#include "analysis/AnalysisWarnings.hpp"
#include "analysis/SignalProcessing.hpp"
#include "reflectance/ReflectanceModel.hpp"

#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <numbers>

namespace {
constexpr double kDustSigmaUm = 0.75;
constexpr double kWavelengthTolerance = 1e-3;
} // namespace

cv::Mat temporal_autocorrelation(const cv::Mat &rows, int lags) {
  cv::Mat values;
  rows.convertTo(values, CV_64F);
  cv::Mat mean;
  cv::reduce(values, mean, 1, cv::REDUCE_AVG, CV_64F);
  values -= cv::repeat(mean, 1, values.cols);
  cv::Mat acf = circular_autocorrelation(values, lags);
  acf /= values.cols;
  return acf;
}

DynamicsAnalysis::DynamicsAnalysis(
    DynamicsAnalysisSettings settings, RawCube reference,
    std::optional<ExtraReflectanceCube> extraReflectance)
    : settings_(std::move(settings)) {
  const auto &logger = Logger::getInstance();
  const auto &p = settings_.params();
  logger->info("Preparing dynamics analysis with reference {}",
               reference.idTag());

  if (reference.kind() != CubeKind::Dynamics ||
      !reference.metadata().wavelengthNm) {
    throw InvalidParameterError(
        "Dynamics analysis requires a time series with a known wavelength");
  }
  const int lags = p.diffusionRegressionLength + 1;
  if (reference.length() < 2 || lags > reference.length()) {
    throw InvalidParameterError(fmt::format(
        "Regression length {} needs more than the {} time points of {}",
        p.diffusionRegressionLength, reference.length(), reference.idTag()));
  }
  wavelengthNm_ = *reference.metadata().wavelengthNm;
  referenceIdTag_ = reference.idTag();

  try {
    prepareForNormalization(reference);
    if (reference.metadata().pixelSizeUm) {
      reference.filterDust(kDustSigmaUm);
    }

    double theoryR = 1.0;
    if (!p.referenceMaterial) {
      logger->warn("Ignoring reference material correction");
      setupWarnings_.push_back(
          {"Ignoring reference material",
           "No reference material was selected, results are relative to the "
           "reference rather than physical reflectance."});
    } else {
      theoryR = reflectance(*p.referenceMaterial, Material::Glass,
                            wavelengthNm_, p.numericalAperture);
    }

    if (extraReflectance) {
      const double calibrationNa = extraReflectance->metadata().numericalAperture;
      if (std::abs(calibrationNa - p.numericalAperture) > 1e-6) {
        logger->warn("Extra reflectance NA {} differs from analysis NA {}",
                     calibrationNa, p.numericalAperture);
        setupWarnings_.push_back(
            {"Numerical aperture mismatch",
             fmt::format("The extra reflectance calibration was made for NA "
                         "{} but the analysis uses NA {}.",
                         calibrationNa, p.numericalAperture)});
      }
      const int slice = extraReflectance->nearestIndex(wavelengthNm_);
      if (std::abs(extraReflectance->index()[slice] - wavelengthNm_) >
          kWavelengthTolerance) {
        logger->error("Extra reflectance {} has no slice at {} nm",
                      extraReflectance->metadata().idTag(), wavelengthNm_);
        throw InvalidParameterError(fmt::format(
            "The extra reflectance calibration holds no data at {} nm",
            wavelengthNm_));
      }
      if (extraReflectance->size() != reference.size()) {
        throw InvalidParameterError(
            "Extra reflectance and reference differ in spatial shape");
      }
      cv::Mat er;
      extraReflectance->slice(slice).convertTo(er, CV_64F);
      cv::Mat illumination;
      cv::divide(reference.meanImage(), er + theoryR, illumination);
      extraReflection_ = illumination.mul(er);
      extraReflectanceTag_ = extraReflectance->metadata().idTag();
      reference.subtractExtraReflection(extraReflection_);
    } else {
      logger->warn("Ignoring extra reflection correction");
      setupWarnings_.push_back(
          {"Ignoring extra reflection correction",
           "No extra reflectance calibration was supplied, the system's "
           "internal reflections remain in the data."});
    }

    if (!p.relativeUnits) {
      reference.divideBySpectrum(
          std::vector<double>(reference.length(), theoryR));
    }

    refMean_ = reference.meanImage();
    reference.normalizeByReference(refMean_);

    cv::Mat acf = temporal_autocorrelation(reference.data(), lags);
    cv::Mat meanAcf;
    cv::reduce(acf, meanAcf, 0, cv::REDUCE_AVG, CV_64F);
    backgroundAcf_.assign(meanAcf.begin<double>(), meanAcf.end<double>());
  } catch (const cv::Exception &e) {
    logger->error("OpenCV error while preparing the reference: {}", e.what());
    throw ProcessingError(std::string("OpenCV error: ") + e.what());
  }
  logger->info("Dynamics analysis ready, background variance {}",
               backgroundAcf_.front());
}

void DynamicsAnalysis::prepareForNormalization(RawCube &cube) const {
  if (!cube.status().cameraCorrected) {
    cube.correctCameraEffects(settings_.params().cameraCorrection);
  }
  if (!cube.status().exposureNormalized) {
    cube.normalizeByExposure();
  }
}

std::pair<DynamicsAnalysisResults, AnalysisWarnings>
DynamicsAnalysis::run(RawCube cube) const {
  const auto &logger = Logger::getInstance();
  const auto &p = settings_.params();
  logger->debug("Running dynamics analysis on {}", cube.idTag());
  const int lags = p.diffusionRegressionLength + 1;

  if (cube.kind() != CubeKind::Dynamics) {
    throw InvalidParameterError("Dynamics analysis requires a time series");
  }
  if (cube.length() < lags) {
    throw InvalidParameterError(fmt::format(
        "{} has {} time points, the regression needs {}", cube.idTag(),
        cube.length(), lags));
  }
  if (cube.metadata().wavelengthNm &&
      std::abs(*cube.metadata().wavelengthNm - wavelengthNm_) >
          kWavelengthTolerance) {
    logger->warn("{} was acquired at {} nm, the reference at {} nm",
                 cube.idTag(), *cube.metadata().wavelengthNm, wavelengthNm_);
  }

  AnalysisWarnings warnings;
  try {
    prepareForNormalization(cube);
    if (!extraReflection_.empty()) {
      cube.subtractExtraReflection(extraReflection_);
    }
    cube.normalizeByReference(refMean_);

    const cv::Mat acf = temporal_autocorrelation(cube.data(), lags);
    const double bg0 = backgroundAcf_.front();

    const cv::Mat excess = acf.col(0) - bg0;
    const cv::Mat rmsTSquared = cv::max(excess, 0.0);

    const cv::Mat meanReflectance = cube.meanImage();
    collect(warnings, check_mean_reflectance(meanReflectance, p.relativeUnits));

    // Time axis of the regression in seconds.
    const auto &times = cube.index();
    const double dt = (times.back() - times.front()) / (times.size() - 1) / 1e3;
    std::vector<double> lagTimes(lags);
    for (int i = 0; i < lags; ++i) {
      lagTimes[i] = i * dt;
    }
    const double k =
        kMediumRefractiveIndex * 2 * std::numbers::pi / (wavelengthNm_ / 1e3);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    cv::Mat values(acf.rows, lags, CV_64F, cv::Scalar(nan));
    cv::Mat mask = cv::Mat::zeros(acf.rows, 1, CV_8U);
    for (int r = 0; r < acf.rows; ++r) {
      const double *in = acf.ptr<double>(r);
      if (!std::isfinite(in[0])) {
        mask.at<uchar>(r) = static_cast<uchar>(PixelMask::NotFinite);
        continue;
      }
      if (in[0] < kDiffusionSnrThreshold * bg0) {
        mask.at<uchar>(r) = static_cast<uchar>(PixelMask::LowSignal);
        continue;
      }
      const double zeroLag = in[0] - bg0;
      double *out = values.ptr<double>(r);
      for (int i = 0; i < lags; ++i) {
        const double ac = (in[i] - backgroundAcf_[i]) / zeroLag;
        if (!std::isfinite(ac)) {
          mask.at<uchar>(r) = static_cast<uchar>(PixelMask::NotFinite);
          break;
        }
        if (ac <= 0.0) {
          mask.at<uchar>(r) = static_cast<uchar>(PixelMask::NonPositive);
          break;
        }
        out[i] = std::log(ac) / (4 * k * k);
      }
    }

    const MaskedLineFit fit = masked_fit_lines(lagTimes, values, mask);
    cv::Mat diffusion = -fit.slope;
    const int masked = cube.pixelCount() - fit.validCount;
    if (masked > 0) {
      warnings.push_back(
          {"Pixels excluded from diffusion",
           fmt::format("{} of {} pixels have too little signal or a "
                       "non-positive background subtracted autocorrelation; "
                       "their diffusion is NaN.",
                       masked, cube.pixelCount())});
    }

    DynamicsResultFields fields{
        .time = current_timestamp(),
        .reflectance = ImageCube(cube.data().clone(), cube.size(), times),
        .meanReflectance = meanReflectance,
        .rmsTSquared = pixels_to_image(rmsTSquared, cube.size()),
        .diffusion = pixels_to_image(diffusion, cube.size()),
        .diffusionMask = pixels_to_image(fit.mask, cube.size()),
        .imCubeIdTag = cube.idTag(),
        .referenceIdTag = referenceIdTag_,
        .extraReflectionTag = extraReflectanceTag_,
    };
    logger->info("Dynamics analysis of {} finished, {} pixels masked",
                 cube.idTag(), masked);
    return {DynamicsAnalysisResults::create(std::move(fields), settings_),
            std::move(warnings)};
  } catch (const cv::Exception &e) {
    logger->error("OpenCV error during dynamics analysis of {}: {}",
                  cube.idTag(), e.what());
    throw ProcessingError(std::string("OpenCV error: ") + e.what());
  }
}
