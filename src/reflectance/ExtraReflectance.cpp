#include "reflectance/ExtraReflectance.hpp"
#include "Logging.hpp"
#include "core/CoreTypes.hpp"
#include "reflectance/ReflectanceModel.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace {

// Range over which material pairs are ordered by reflectance ratio.
constexpr double kComboOrderStartNm = 500.0;
constexpr double kComboOrderStopNm = 700.0;
constexpr double kComboOrderStepNm = 10.0;

cv::Mat as_row(const std::vector<double> &values) {
  return cv::Mat(values, true).reshape(1, 1);
}

std::vector<double> as_vector(const cv::Mat &row) {
  cv::Mat continuous = row.isContinuous() ? row : row.clone();
  return std::vector<double>(continuous.begin<double>(),
                             continuous.end<double>());
}

const std::vector<double> &theory_for(const TheoryReflectances &theoryR,
                                      Material material, int length) {
  auto it = theoryR.find(material);
  if (it == theoryR.end()) {
    throw InvalidParameterError(fmt::format(
        "No theoretical reflectance for {}", material_name(material)));
  }
  if (static_cast<int>(it->second.size()) != length) {
    throw InvalidParameterError(fmt::format(
        "Theoretical reflectance of {} has {} values, the cubes have {}",
        material_name(material), it->second.size(), length));
  }
  return it->second;
}

void require_matching(const CubeCombo &combo) {
  if (!combo.cube1 || !combo.cube2) {
    throw InvalidParameterError("Cube combo is missing a cube");
  }
  if (combo.cube1->size() != combo.cube2->size() ||
      combo.cube1->index() != combo.cube2->index()) {
    throw InvalidParameterError(fmt::format(
        "Cubes {} and {} differ in shape or wavelengths",
        combo.cube1->idTag(), combo.cube2->idTag()));
  }
}

// Zeroes non-finite estimates together with their weight, and non-finite
// weights. All rows share one length.
void drop_non_finite(cv::Mat &rExtra, cv::Mat &illumination, cv::Mat &weight) {
  double *r = rExtra.ptr<double>(0);
  double *i0 = illumination.ptr<double>(0);
  double *w = weight.ptr<double>(0);
  for (int c = 0; c < weight.cols; ++c) {
    if (!std::isfinite(r[c]) || !std::isfinite(i0[c])) {
      r[c] = 0.0;
      i0[c] = 0.0;
      w[c] = 0.0;
    }
    if (!std::isfinite(w[c])) {
      w[c] = 0.0;
    }
  }
}

// Element-wise weighted mean, 0 where the total weight is 0.
cv::Mat weighted_mean(const std::vector<cv::Mat> &values,
                      const std::vector<cv::Mat> &weights) {
  cv::Mat sum = cv::Mat::zeros(values.front().size(), CV_64F);
  cv::Mat weightSum = cv::Mat::zeros(values.front().size(), CV_64F);
  for (size_t i = 0; i < values.size(); ++i) {
    sum += values[i].mul(weights[i]);
    weightSum += weights[i];
  }
  cv::Mat mean;
  cv::divide(sum, weightSum, mean);
  mean.setTo(0.0, weightSum == 0.0);
  return mean;
}

cv::Mat mean_of(const std::vector<cv::Mat> &values) {
  cv::Mat sum = cv::Mat::zeros(values.front().size(), CV_64F);
  for (const auto &value : values) {
    sum += value;
  }
  return sum / static_cast<double>(values.size());
}

ComboSummary summarize(const std::vector<ComboSummary> &summaries) {
  std::vector<cv::Mat> weights;
  std::vector<cv::Mat> spectra1;
  std::vector<cv::Mat> spectra2;
  std::vector<cv::Mat> rExtra;
  std::vector<cv::Mat> illumination;
  for (const auto &s : summaries) {
    weights.push_back(as_row(s.weight));
    spectra1.push_back(as_row(s.material1Spectrum));
    spectra2.push_back(as_row(s.material2Spectrum));
    rExtra.push_back(as_row(s.rExtra));
    illumination.push_back(as_row(s.illumination));
  }
  ComboSummary mean;
  mean.material1Spectrum = as_vector(weighted_mean(spectra1, weights));
  mean.material2Spectrum = as_vector(weighted_mean(spectra2, weights));
  mean.rExtra = as_vector(weighted_mean(rExtra, weights));
  mean.illumination = as_vector(weighted_mean(illumination, weights));
  mean.weight = as_vector(mean_of(weights));
  return mean;
}

} // namespace

TheoryReflectances theoretical_reflectances(const std::set<Material> &materials,
                                            const std::vector<double> &wavelengthsNm,
                                            double numericalAperture) {
  TheoryReflectances theoryR;
  for (Material material : materials) {
    Logger::getInstance()->info("Calculating reflectance for {}",
                                material_name(material));
    theoryR.emplace(material, reflectance(material, Material::Glass,
                                          wavelengthsNm, numericalAperture));
  }
  return theoryR;
}

std::vector<MaterialCombo>
generate_material_combos(const std::vector<Material> &materials,
                         const std::vector<MaterialCombo> &excluded) {
  std::vector<double> wavelengths;
  for (double wl = kComboOrderStartNm; wl <= kComboOrderStopNm;
       wl += kComboOrderStepNm) {
    wavelengths.push_back(wl);
  }
  auto isExcluded = [&](Material a, Material b) {
    return std::any_of(excluded.begin(), excluded.end(),
                       [&](const MaterialCombo &e) {
                         return (e.first == a && e.second == b) ||
                                (e.first == b && e.second == a);
                       });
  };

  std::vector<MaterialCombo> combos;
  for (size_t i = 0; i < materials.size(); ++i) {
    for (size_t j = i + 1; j < materials.size(); ++j) {
      const Material m1 = materials[i];
      const Material m2 = materials[j];
      if (m1 == m2 || isExcluded(m1, m2)) {
        continue;
      }
      const auto r1 = reflectance(m1, Material::Glass, wavelengths, 0.0);
      const auto r2 = reflectance(m2, Material::Glass, wavelengths, 0.0);
      double ratio = 0.0;
      for (size_t k = 0; k < wavelengths.size(); ++k) {
        ratio += r1[k] / r2[k];
      }
      ratio /= static_cast<double>(wavelengths.size());
      combos.emplace_back(ratio < 1.0 ? MaterialCombo{m2, m1}
                                      : MaterialCombo{m1, m2});
    }
  }
  return combos;
}

std::map<MaterialCombo, std::vector<CubeCombo>>
get_all_cube_combos(const std::vector<MaterialCombo> &materialCombos,
                    const CubesByMaterial &cubes) {
  std::map<MaterialCombo, std::vector<CubeCombo>> all;
  for (const auto &combo : materialCombos) {
    auto first = cubes.find(combo.first);
    auto second = cubes.find(combo.second);
    if (first == cubes.end() || second == cubes.end()) {
      continue;
    }
    std::vector<CubeCombo> pairs;
    for (const auto &cube1 : first->second) {
      for (const auto &cube2 : second->second) {
        pairs.push_back({combo.first, combo.second, cube1, cube2});
      }
    }
    if (!pairs.empty()) {
      all.emplace(combo, std::move(pairs));
    }
  }
  return all;
}

SpectraSummary calculate_spectra_from_combos(
    const std::map<MaterialCombo, std::vector<CubeCombo>> &cubeCombos,
    const TheoryReflectances &theoryR, const cv::Mat &mask) {
  if (cubeCombos.empty()) {
    throw InvalidParameterError("No cube combos to calculate spectra from");
  }
  SpectraSummary summary;
  for (const auto &[materialCombo, combos] : cubeCombos) {
    if (combos.empty()) {
      continue;
    }
    auto &perCube = summary.perCubeCombo[materialCombo];
    for (const auto &combo : combos) {
      require_matching(combo);
      const int n = combo.cube1->length();
      const cv::Mat t1 = as_row(theory_for(theoryR, combo.material1, n));
      const cv::Mat t2 = as_row(theory_for(theoryR, combo.material2, n));
      const cv::Mat s1 = combo.cube1->meanSpectrum(mask);
      const cv::Mat s2 = combo.cube2->meanSpectrum(mask);

      cv::Mat difference = s1 - s2;
      cv::Mat weight;
      cv::divide(difference.mul(difference), s1.mul(s1) + s2.mul(s2), weight);
      cv::Mat rExtra;
      cv::divide(t1.mul(s2) - t2.mul(s1), difference, rExtra);
      cv::Mat illumination;
      cv::divide(s2, t2 + rExtra, illumination);

      drop_non_finite(rExtra, illumination, weight);

      perCube.push_back({as_vector(s1), as_vector(s2), as_vector(rExtra),
                         as_vector(illumination), as_vector(weight)});
    }
    summary.perMaterialCombo.emplace(materialCombo, summarize(perCube));
  }

  if (summary.perMaterialCombo.empty()) {
    throw InvalidParameterError("No cube combos to calculate spectra from");
  }
  std::vector<ComboSummary> means;
  for (const auto &[materialCombo, mean] : summary.perMaterialCombo) {
    means.push_back(mean);
  }
  summary.total = summarize(means);
  return summary;
}

std::pair<cv::Mat, cv::Mat>
generate_one_rextra_cube(const CubeCombo &combo,
                         const TheoryReflectances &theoryR) {
  require_matching(combo);
  const int n = combo.cube1->length();
  const auto &t1 = theory_for(theoryR, combo.material1, n);
  const auto &t2 = theory_for(theoryR, combo.material2, n);

  cv::Mat data1;
  cv::Mat data2;
  combo.cube1->data().convertTo(data1, CV_64F);
  combo.cube2->data().convertTo(data2, CV_64F);

  cv::Mat rExtra(data1.size(), CV_64F);
  for (int i = 0; i < n; ++i) {
    cv::Mat column = rExtra.col(i);
    cv::divide(data2.col(i) * t1[i] - data1.col(i) * t2[i],
               data1.col(i) - data2.col(i), column);
  }
  const cv::Mat difference = data1 - data2;
  cv::Mat weight;
  cv::divide(difference.mul(difference), data1.mul(data1) + data2.mul(data2),
             weight);

  for (int r = 0; r < rExtra.rows; ++r) {
    double *v = rExtra.ptr<double>(r);
    double *w = weight.ptr<double>(r);
    for (int c = 0; c < rExtra.cols; ++c) {
      v[c] = std::isfinite(v[c]) ? std::clamp(v[c], 0.0, 1.0) : 0.0;
      if (!std::isfinite(w[c])) {
        w[c] = 0.0;
      }
    }
  }
  return {rExtra, weight};
}

RExtraCubes
generate_rextra_cubes(const std::map<MaterialCombo, std::vector<CubeCombo>> &allCombos,
                      const TheoryReflectances &theoryR,
                      double numericalAperture) {
  const auto &logger = Logger::getInstance();
  std::map<MaterialCombo, cv::Mat> perCombo;
  std::vector<cv::Mat> comboMeans;
  std::vector<cv::Mat> comboWeights;
  const RawCube *sample = nullptr;
  for (const auto &[materialCombo, combos] : allCombos) {
    if (combos.empty()) {
      continue;
    }
    if (!sample) {
      sample = combos.front().cube1.get();
    }
    logger->info("Calculating extra reflectance for {} / {}",
                 material_name(materialCombo.first),
                 material_name(materialCombo.second));
    std::vector<cv::Mat> cubes;
    std::vector<cv::Mat> weights;
    for (const auto &combo : combos) {
      auto [rExtra, weight] = generate_one_rextra_cube(combo, theoryR);
      cubes.push_back(std::move(rExtra));
      weights.push_back(std::move(weight));
    }
    cv::Mat mean = weighted_mean(cubes, weights);
    comboMeans.push_back(mean);
    comboWeights.push_back(mean_of(weights));
    perCombo.emplace(materialCombo, std::move(mean));
  }

  if (comboMeans.empty() || !sample) {
    throw InvalidParameterError("No cube combos to generate extra reflectance");
  }
  cv::Mat total = weighted_mean(comboMeans, comboWeights);
  // Rounding can leave values just outside [0, 1].
  total = cv::max(total, 0.0);
  total = cv::min(total, 1.0);

  ExtraReflectanceMetadata metadata{numericalAperture,
                                    sample->metadata().systemName,
                                    sample->metadata().acquisitionTime};
  logger->info("Generated extra reflectance {} from {} material combos",
               metadata.idTag(), perCombo.size());
  return {ExtraReflectanceCube(total, sample->size(), sample->index(),
                               std::move(metadata)),
          std::move(perCombo)};
}
