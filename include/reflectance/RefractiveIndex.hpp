#pragma once

#include "core/Material.hpp"

#include <complex>
#include <vector>

/**
 * @brief Tabulated complex refractive index n + ik of one material.
 */
struct RefractiveIndexTable {
  std::vector<double> wavelengthsNm;        ///< Ascending, unit: nanometer
  std::vector<std::complex<double>> values; ///< n + ik at each wavelength

  [[nodiscard]] double minWavelength() const { return wavelengthsNm.front(); }
  [[nodiscard]] double maxWavelength() const { return wavelengthsNm.back(); }
};

/**
 * @brief Returns the table of a material.
 *
 * Dispersive dielectrics are tabulated from their Sellmeier or Cauchy
 * dispersion formulas every 5 nm over the formula's validity range; Silicon
 * and ITO use measured values.
 */
const RefractiveIndexTable &refractive_index_table(Material material);

/**
 * @brief Refractive index linearly interpolated at the given wavelengths.
 * @throws MaterialNotFoundError if any wavelength lies outside the table.
 */
std::vector<std::complex<double>>
refractive_index(Material material, const std::vector<double> &wavelengthsNm);
