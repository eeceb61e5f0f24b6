#pragma once

#include "core/ImageCube.hpp"
#include "core/Material.hpp"

#include <map>
#include <memory>
#include <opencv2/opencv.hpp>
#include <optional>
#include <set>
#include <utility>
#include <vector>

/**
 * @brief Ordered pair of calibration materials. The first material reflects
 * more than the second.
 */
using MaterialCombo = std::pair<Material, Material>;

/**
 * @brief Theoretical material/glass reflectance, one value per wavelength.
 */
using TheoryReflectances = std::map<Material, std::vector<double>>;

/**
 * @brief Calibration cubes, keyed by the material imaged at the glass
 * interface. The cubes must be exposure normalized.
 */
using CubesByMaterial =
    std::map<Material, std::vector<std::shared_ptr<const RawCube>>>;

/**
 * @brief Two calibration cubes imaging different materials.
 */
struct CubeCombo {
  Material material1;
  Material material2;
  std::shared_ptr<const RawCube> cube1;
  std::shared_ptr<const RawCube> cube2;
};

/**
 * @brief Spectrum level extra reflectance estimate of one or several combos.
 */
struct ComboSummary {
  std::vector<double> material1Spectrum; ///< Mean spectrum of cube1
  std::vector<double> material2Spectrum; ///< Mean spectrum of cube2
  std::vector<double> rExtra;            ///< Extra reflectance
  std::vector<double> illumination;      ///< Reconstructed I0, count units
  std::vector<double> weight;            ///< Inverse variance weight
};

struct SpectraSummary {
  ComboSummary total; ///< Weighted mean over every material combo
  std::map<MaterialCombo, ComboSummary> perMaterialCombo;
  std::map<MaterialCombo, std::vector<ComboSummary>> perCubeCombo;
};

/**
 * @brief Result of generate_rextra_cubes().
 */
struct RExtraCubes {
  ExtraReflectanceCube cube; ///< Weighted mean over every material combo
  std::map<MaterialCombo, cv::Mat> perMaterialCombo; ///< pixelCount x N
};

/**
 * @brief Reflectance of every material against glass.
 */
TheoryReflectances theoretical_reflectances(const std::set<Material> &materials,
                                            const std::vector<double> &wavelengthsNm,
                                            double numericalAperture);

/**
 * @brief Every unordered pair of materials, minus the excluded pairs (in
 * either order), each ordered so that the mean ratio of the first material's
 * reflectance to the second's, over the visible range at normal incidence,
 * exceeds 1.
 */
std::vector<MaterialCombo>
generate_material_combos(const std::vector<Material> &materials,
                         const std::vector<MaterialCombo> &excluded = {});

/**
 * @brief Every pairing of a cube of the first material with a cube of the
 * second, per material combo. Combos without data are dropped.
 */
std::map<MaterialCombo, std::vector<CubeCombo>>
get_all_cube_combos(const std::vector<MaterialCombo> &materialCombos,
                    const CubesByMaterial &cubes);

/**
 * @brief Extra reflectance estimated from the mean spectra of each cube
 * combo, with weighted averages per material combo and overall.
 *
 * @param mask Optional CV_8U region the spectra are averaged over.
 * @throws InvalidParameterError if no combos are given or a theoretical
 * reflectance is missing.
 */
SpectraSummary calculate_spectra_from_combos(
    const std::map<MaterialCombo, std::vector<CubeCombo>> &cubeCombos,
    const TheoryReflectances &theoryR, const cv::Mat &mask = cv::Mat());

/**
 * @brief Per-pixel extra reflectance of one combo and its confidence weight.
 *
 * Non-finite estimates become 0 and the estimate is clipped to [0, 1].
 * Non-finite weights become 0.
 *
 * @return rExtra and weight, both pixelCount x N CV_64F.
 */
std::pair<cv::Mat, cv::Mat> generate_one_rextra_cube(const CubeCombo &combo,
                                                     const TheoryReflectances &theoryR);

/**
 * @brief Weighted mean extra reflectance cube over every combo.
 *
 * Cubes are averaged per material combo weighted by their confidence, then
 * across material combos weighted by the mean confidence of each. Elements
 * with zero total weight become 0.
 *
 * @throws InvalidParameterError if allCombos is empty.
 */
RExtraCubes
generate_rextra_cubes(const std::map<MaterialCombo, std::vector<CubeCombo>> &allCombos,
                      const TheoryReflectances &theoryR, double numericalAperture);
