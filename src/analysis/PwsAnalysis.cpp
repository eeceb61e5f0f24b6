#include "analysis/PwsAnalysis.hpp"
#include "Logging.hpp"
#include "analysis/AnalysisWarnings.hpp"
#include "analysis/SpectralAnalysis.hpp"
#include "reflectance/ReflectanceModel.hpp"

#include <cmath>
#include <fmt/format.h>
#include <numbers>

namespace {
constexpr double kDustSigmaUm = 0.75;
constexpr int kWaveNumberFilterOrder = 2;
} // namespace

PwsAnalysis::PwsAnalysis(PwsAnalysisSettings settings, RawCube reference,
                         std::optional<ExtraReflectanceCube> extraReflectance)
    : settings_(std::move(settings)), reference_(std::move(reference)) {
  const auto &logger = Logger::getInstance();
  const auto &p = settings_.params();
  logger->info("Preparing PWS analysis with reference {}", reference_.idTag());

  if (reference_.kind() != CubeKind::Pws) {
    throw InvalidParameterError("PWS analysis requires a wavelength cube");
  }
  if (extraReflectance && !p.referenceMaterial) {
    throw InvalidParameterError(
        "An extra reflectance calibration cannot be used without a reference "
        "material");
  }

  try {
    prepareForNormalization(reference_);
    if (reference_.metadata().pixelSizeUm) {
      reference_.filterDust(kDustSigmaUm);
    }

    std::vector<double> theoryR(reference_.length(), 1.0);
    if (!p.referenceMaterial) {
      logger->warn("Ignoring reference material correction");
      setupWarnings_.push_back(
          {"Ignoring reference material",
           "No reference material was selected, results are relative to the "
           "reference rather than physical reflectance."});
    } else {
      theoryR = reflectance(*p.referenceMaterial, Material::Glass,
                            reference_.index(), p.numericalAperture);
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
      extraReflection_ =
          ExtraReflectionCube::create(*extraReflectance, theoryR, reference_);
      extraReflectanceTag_ = extraReflectance->metadata().idTag();
      reference_.subtractExtraReflection(*extraReflection_);
    } else {
      logger->warn("Ignoring extra reflection correction");
      setupWarnings_.push_back(
          {"Ignoring extra reflection correction",
           "No extra reflectance calibration was supplied, the system's "
           "internal reflections remain in the data."});
    }

    if (!p.relativeUnits) {
      reference_.divideBySpectrum(theoryR);
    }

    if (p.filterCutoff) {
      const double step = reference_.index()[1] - reference_.index()[0];
      filter_ = butterworth_lowpass(p.filterOrder, *p.filterCutoff, 1.0 / step);
    }
  } catch (const cv::Exception &e) {
    logger->error("OpenCV error while preparing the reference: {}", e.what());
    throw ProcessingError(std::string("OpenCV error: ") + e.what());
  }
  validateAgainstReference();
  logger->info("PWS analysis ready, {} setup warnings", setupWarnings_.size());
}

void PwsAnalysis::prepareForNormalization(RawCube &cube) const {
  if (!cube.status().cameraCorrected) {
    cube.correctCameraEffects(settings_.params().cameraCorrection);
  }
  if (!cube.status().exposureNormalized) {
    cube.normalizeByExposure();
  }
}

void PwsAnalysis::validateAgainstReference() const {
  const auto &p = settings_.params();
  const auto &index = reference_.index();
  if (index.size() < 2) {
    throw InvalidParameterError("The reference needs at least two wavelengths");
  }
  const double step = index[1] - index[0];
  for (size_t i = 2; i < index.size(); ++i) {
    if (std::abs((index[i] - index[i - 1]) - step) > 1e-3 * std::abs(step)) {
      Logger::getInstance()->warn(
          "Wavelengths are not evenly spaced, filtering assumes step {}",
          step);
      break;
    }
  }
  if (filter_ && reference_.length() <= filtfilt_padding(*filter_)) {
    throw InvalidParameterError(fmt::format(
        "{} wavelengths are too few for a filter of order {}",
        reference_.length(), p.filterOrder));
  }

  const int first = reference_.nearestIndex(p.wavelengthStart);
  const int last = reference_.nearestIndex(p.wavelengthStop);
  const int samples = last - first + 1;
  if (samples < 2) {
    throw InvalidParameterError(fmt::format(
        "Wavelength range [{}, {}] selects {} samples", p.wavelengthStart,
        p.wavelengthStop, samples));
  }
  if (p.polynomialOrder >= samples) {
    throw InvalidParameterError(fmt::format(
        "Polynomial order {} needs more than the {} cropped samples",
        p.polynomialOrder, samples));
  }
  if (!p.skipAdvanced && p.autoCorrStopIndex > samples) {
    throw InvalidParameterError(fmt::format(
        "Autocorrelation stop index {} exceeds the {} cropped samples",
        p.autoCorrStopIndex, samples));
  }
  if (p.waveNumberCutoff) {
    const auto filter =
        butterworth_lowpass(kWaveNumberFilterOrder, *p.waveNumberCutoff,
                            (samples - 1) /
                                (2 * std::numbers::pi / (index[first] * 1e-3) -
                                 2 * std::numbers::pi / (index[last] * 1e-3)) *
                                2 * std::numbers::pi);
    if (samples <= filtfilt_padding(filter)) {
      throw InvalidParameterError(
          "Too few samples for the wavenumber filter");
    }
  }
}

std::pair<PwsAnalysisResults, AnalysisWarnings>
PwsAnalysis::run(RawCube cube) const {
  const auto &logger = Logger::getInstance();
  const auto &p = settings_.params();
  logger->debug("Running PWS analysis on {}", cube.idTag());
  AnalysisWarnings warnings;

  try {
    if (cube.kind() != CubeKind::Pws) {
      throw InvalidParameterError("PWS analysis requires a wavelength cube");
    }
    prepareForNormalization(cube);
    if (extraReflection_) {
      cube.subtractExtraReflection(*extraReflection_);
    }
    cube.normalizeByReference(reference_);

    cv::Mat spectra;
    if (filter_) {
      spectra = filtfilt(*filter_, cube.data());
    } else {
      cube.data().convertTo(spectra, CV_64F);
    }

    const int first = cube.nearestIndex(p.wavelengthStart);
    const int last = cube.nearestIndex(p.wavelengthStop);
    const std::vector<double> wavelengths(cube.index().begin() + first,
                                          cube.index().begin() + last + 1);
    const cv::Mat cropped = spectra.colRange(first, last + 1);

    cv::Mat meanReflectance;
    cv::reduce(cropped, meanReflectance, 1, cv::REDUCE_AVG, CV_64F);
    meanReflectance = pixels_to_image(meanReflectance, cube.size());
    collect(warnings, check_mean_reflectance(meanReflectance, p.relativeUnits));

    KCube kcube = KCube::fromWavelengthData(cropped, cube.size(), wavelengths);
    cv::Mat signal = kcube.data();
    if (p.waveNumberCutoff) {
      const double fs = 2 * std::numbers::pi / kcube.wavenumberStep();
      signal = filtfilt(
          butterworth_lowpass(kWaveNumberFilterOrder, *p.waveNumberCutoff, fs),
          signal);
    }

    const cv::Mat polynomial =
        polynomial_fit(kcube.index(), signal, p.polynomialOrder);
    const cv::Mat residual = signal - polynomial;
    KCube detrended(residual, cube.size(), kcube.index());
    const cv::Mat rms = pixels_to_image(row_std(residual), cube.size());

    PwsResultFields fields{
        .time = current_timestamp(),
        .reflectance = detrended,
        .meanReflectance = meanReflectance,
        .rms = rms,
        .imCubeIdTag = cube.idTag(),
        .referenceIdTag = reference_.idTag(),
        .extraReflectionTag = extraReflectanceTag_,
    };

    if (!p.skipAdvanced) {
      fields.polynomialRms = pixels_to_image(row_std(polynomial), cube.size());

      const auto decay =
          autocorrelation_decay(detrended, p.autoCorrMinSub, p.autoCorrStopIndex);
      fields.autoCorrelationSlope = decay.slope;
      fields.rSquared = decay.rSquared;
      fields.ld = disorder_strength(rms, decay.slope);
      collect(warnings, check_r_squared(decay.rSquared));
      if (decay.maskedPixels > 0) {
        warnings.push_back(
            {"Autocorrelation not positive",
             fmt::format("{} pixels have a non-positive autocorrelation within "
                         "the first {} lags; their slope, R^2 and Ld are "
                         "masked.",
                         decay.maskedPixels, p.autoCorrStopIndex)});
      }

      auto opd = compute_opd(detrended, p.useHannWindow, p.opdIndexStop);
      cv::Mat opdValues;
      opd.values.convertTo(opdValues, CV_32F);
      fields.opd = opdValues;
      fields.opdIndex = std::move(opd.index);
    }

    logger->info("PWS analysis of {} finished with {} warnings", cube.idTag(),
                 warnings.size());
    return {PwsAnalysisResults::create(std::move(fields), settings_),
            std::move(warnings)};
  } catch (const cv::Exception &e) {
    logger->error("OpenCV error during PWS analysis of {}: {}", cube.idTag(),
                  e.what());
    throw ProcessingError(std::string("OpenCV error: ") + e.what());
  }
}
