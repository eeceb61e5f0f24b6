#include "reflectance/RefractiveIndex.hpp"
#include "Logging.hpp"
#include "core/CoreTypes.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <functional>
#include <map>

namespace {

using Dispersion = std::function<double(double)>;

// Samples n(lambda) every 5 nm; lambda passed to the formula in microns.
RefractiveIndexTable tabulate(double startNm, double stopNm,
                              const Dispersion &n) {
  RefractiveIndexTable table;
  for (double wl = startNm; wl <= stopNm + 1e-9; wl += 5.0) {
    table.wavelengthsNm.push_back(wl);
    table.values.emplace_back(n(wl * 1e-3), 0.0);
  }
  return table;
}

double sellmeier(double um, std::initializer_list<double> b,
                 std::initializer_list<double> c) {
  const double l2 = um * um;
  double sum = 1.0;
  auto bi = b.begin();
  for (auto ci = c.begin(); ci != c.end(); ++ci, ++bi) {
    sum += *bi * l2 / (l2 - *ci);
  }
  return std::sqrt(sum);
}

double cauchy(double um, double a, double b, double c = 0.0) {
  const double l2 = um * um;
  return a + b / l2 + c / (l2 * l2);
}

RefractiveIndexTable measured(
    std::initializer_list<std::tuple<double, double, double>> rows) {
  RefractiveIndexTable table;
  for (const auto &[wl, n, k] : rows) {
    table.wavelengthsNm.push_back(wl);
    table.values.emplace_back(n, k);
  }
  return table;
}

std::map<Material, RefractiveIndexTable> build_tables() {
  std::map<Material, RefractiveIndexTable> tables;

  // Schott N-BK7
  tables[Material::Glass] = tabulate(300, 2500, [](double um) {
    return sellmeier(um, {1.03961212, 0.231792344, 1.01046945},
                     {0.00600069867, 0.0200179144, 103.560653});
  });
  // Daimon and Masumura, 20 C
  tables[Material::Water] = tabulate(250, 1100, [](double um) {
    return sellmeier(
        um, {5.684027565e-1, 1.726177391e-1, 2.086189578e-2, 1.130748688e-1},
        {5.101829712e-3, 1.821153936e-2, 2.620722293e-2, 1.069792721e1});
  });
  // Ciddor, standard air
  tables[Material::Air] = tabulate(230, 1690, [](double um) {
    const double s = 1.0 / (um * um);
    return 1.0 + 0.05792105 / (238.0185 - s) + 0.00167917 / (57.362 - s);
  });
  tables[Material::Ethanol] = tabulate(400, 1100, [](double um) {
    return cauchy(um, 1.35265, 0.00306, 0.00002);
  });
  tables[Material::Ipa] = tabulate(
      400, 1100, [](double um) { return cauchy(um, 1.3680, 0.00330); });
  tables[Material::Oil_1_7] = tabulate(
      400, 1100, [](double um) { return cauchy(um, 1.6680, 0.0110); });
  tables[Material::Oil_1_4] = tabulate(
      400, 1100, [](double um) { return cauchy(um, 1.3900, 0.0035); });

  tables[Material::Silicon] = measured({{400, 5.570, 0.387},
                                        {450, 4.674, 0.136},
                                        {500, 4.298, 0.073},
                                        {550, 4.077, 0.043},
                                        {600, 3.939, 0.025},
                                        {650, 3.848, 0.016},
                                        {700, 3.780, 0.010},
                                        {750, 3.733, 0.0075},
                                        {800, 3.693, 0.0056},
                                        {850, 3.660, 0.0039},
                                        {900, 3.632, 0.0023},
                                        {950, 3.605, 0.0013},
                                        {1000, 3.580, 0.0006}});
  tables[Material::ITO] = measured({{400, 2.100, 0.010},
                                    {450, 2.050, 0.005},
                                    {500, 2.000, 0.003},
                                    {550, 1.960, 0.003},
                                    {600, 1.920, 0.004},
                                    {650, 1.890, 0.006},
                                    {700, 1.860, 0.009},
                                    {750, 1.830, 0.012},
                                    {800, 1.800, 0.016},
                                    {900, 1.730, 0.025},
                                    {1000, 1.660, 0.036}});
  return tables;
}

} // namespace

const RefractiveIndexTable &refractive_index_table(Material material) {
  static const std::map<Material, RefractiveIndexTable> tables =
      build_tables();
  auto it = tables.find(material);
  if (it == tables.end()) {
    throw MaterialNotFoundError(fmt::format(
        "No refractive index data for {}", material_name(material)));
  }
  return it->second;
}

std::vector<std::complex<double>>
refractive_index(Material material, const std::vector<double> &wavelengthsNm) {
  const auto &table = refractive_index_table(material);
  std::vector<std::complex<double>> out;
  out.reserve(wavelengthsNm.size());

  for (double wl : wavelengthsNm) {
    if (wl < table.minWavelength() - 1e-9 ||
        wl > table.maxWavelength() + 1e-9) {
      Logger::getInstance()->error(
          "{} nm is outside the {} table ({}-{} nm)", wl,
          material_name(material), table.minWavelength(),
          table.maxWavelength());
      throw MaterialNotFoundError(fmt::format(
          "{} has no refractive index data at {} nm (valid {}-{} nm)",
          material_name(material), wl, table.minWavelength(),
          table.maxWavelength()));
    }
    const auto &x = table.wavelengthsNm;
    auto upper = std::upper_bound(x.begin(), x.end(), wl);
    size_t i1 = std::clamp<size_t>(upper - x.begin(), 1, x.size() - 1);
    size_t i0 = i1 - 1;
    const double w = std::clamp((wl - x[i0]) / (x[i1] - x[i0]), 0.0, 1.0);
    out.push_back(table.values[i0] * (1.0 - w) + table.values[i1] * w);
  }
  return out;
}
