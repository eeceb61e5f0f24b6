#include "reflectance/ReflectanceModel.hpp"
#include "Logging.hpp"
#include "core/CoreTypes.hpp"
#include "reflectance/RefractiveIndex.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <fmt/format.h>
#include <numbers>

namespace {

using Complex = std::complex<double>;

// Fresnel power reflectance for TE and TM at the given aperture sample. The
// indices are complex so absorbing media keep their extinction coefficient.
double interface_reflectance(Complex n1, Complex n2, double na) {
  const Complex cos1 = std::sqrt(1.0 - (na / n1) * (na / n1));
  const Complex cos2 = std::sqrt(1.0 - (na / n2) * (na / n2));

  const Complex te1 = n1 * cos1;
  const Complex te2 = n2 * cos2;
  const Complex tm1 = n1 / cos1;
  const Complex tm2 = n2 / cos2;

  const double rte = std::norm((te1 - te2) / (te1 + te2));
  const double rtm = std::norm((tm1 - tm2) / (tm1 + tm2));
  return 0.5 * (rte + rtm);
}

} // namespace

std::vector<double> reflectance(Material materialA, Material materialB,
                                const std::vector<double> &wavelengthsNm,
                                double numericalAperture) {
  const auto &logger = Logger::getInstance();
  logger->debug("Computing {}/{} reflectance at NA {}",
                material_name(materialA), material_name(materialB),
                numericalAperture);

  if (numericalAperture < 0) {
    throw InvalidParameterError(
        fmt::format("Numerical aperture {} is negative", numericalAperture));
  }

  const auto nA = refractive_index(materialA, wavelengthsNm);
  const auto nB = refractive_index(materialB, wavelengthsNm);

  std::vector<double> result(wavelengthsNm.size());
  for (size_t i = 0; i < wavelengthsNm.size(); ++i) {
    const Complex n1 = nA[i];
    const Complex n2 = nB[i];
    const double slowest = std::min(n1.real(), n2.real());
    if (numericalAperture >= slowest) {
      throw InvalidParameterError(fmt::format(
          "NA {} cannot propagate in a medium of index {}", numericalAperture,
          slowest));
    }

    if (numericalAperture == 0.0) {
      result[i] = interface_reflectance(n1, n2, 0.0);
    } else {
      // Trapezoid integration over the aperture disc.
      const double step = numericalAperture / (kApertureSamples - 1);
      double weighted = 0.0;
      double weights = 0.0;
      double prevR = interface_reflectance(n1, n2, 0.0);
      double prevW = 0.0;
      for (int s = 1; s < kApertureSamples; ++s) {
        const double na = s * step;
        const double w = 2 * std::numbers::pi * na;
        const double r = interface_reflectance(n1, n2, na);
        weighted += 0.5 * step * (prevR * prevW + r * w);
        weights += 0.5 * step * (prevW + w);
        prevR = r;
        prevW = w;
      }
      result[i] = weighted / weights;
    }

    if (!(result[i] >= 0.0 && result[i] <= 1.0)) {
      logger->error("Reflectance {} at {} nm is outside [0, 1]", result[i],
                    wavelengthsNm[i]);
      throw ReflectanceRangeError(fmt::format(
          "Reflectance of {}/{} at {} nm evaluated to {}",
          material_name(materialA), material_name(materialB),
          wavelengthsNm[i], result[i]));
    }
  }
  return result;
}

double reflectance(Material materialA, Material materialB, double wavelengthNm,
                   double numericalAperture) {
  return reflectance(materialA, materialB, std::vector<double>{wavelengthNm},
                     numericalAperture)
      .front();
}
