#pragma once

#include "core/Material.hpp"

#include <vector>

/**
 * @brief Number of angular samples used to integrate over the illumination
 * aperture.
 */
inline constexpr int kApertureSamples = 1000;

/**
 * @brief Theoretical reflectance of the interface between two semi-infinite
 * materials, averaged over TE and TM polarization.
 *
 * With NA == 0 the normal incidence Fresnel reflectance is returned. Otherwise
 * the reflectance is integrated over the illumination disc, each numerical
 * aperture sample na in [0, NA] weighted by the circumference 2*pi*na. Only the
 * real part of the refractive index enters the model. The result is
 * symmetric in the two materials.
 *
 * @param materialA First material.
 * @param materialB Second material.
 * @param wavelengthsNm Wavelengths, unit: nanometer.
 * @param numericalAperture Illumination NA, must be smaller than the index of
 * both materials.
 * @return Reflectance at each wavelength.
 * @throws MaterialNotFoundError if a material has no data at a wavelength.
 * @throws InvalidParameterError for a negative or unsupported NA.
 * @throws ReflectanceRangeError if a value falls outside [0, 1].
 */
std::vector<double> reflectance(Material materialA, Material materialB,
                                const std::vector<double> &wavelengthsNm,
                                double numericalAperture);

/**
 * @brief Single wavelength convenience overload.
 */
double reflectance(Material materialA, Material materialB, double wavelengthNm,
                   double numericalAperture);
