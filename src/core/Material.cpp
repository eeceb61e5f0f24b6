#include "core/Material.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace {
constexpr std::array<std::pair<Material, const char *>, 9> kMaterialNames{{
    {Material::Glass, "Glass"},
    {Material::Water, "Water"},
    {Material::Air, "Air"},
    {Material::Silicon, "Silicon"},
    {Material::Oil_1_7, "Oil_1_7"},
    {Material::Oil_1_4, "Oil_1_4"},
    {Material::Ipa, "Ipa"},
    {Material::Ethanol, "Ethanol"},
    {Material::ITO, "ITO"},
}};
} // namespace

const std::vector<Material> &all_materials() {
  static const std::vector<Material> materials = [] {
    std::vector<Material> out;
    for (const auto &[material, name] : kMaterialNames) {
      out.push_back(material);
    }
    return out;
  }();
  return materials;
}

std::string material_name(Material material) {
  auto it = std::find_if(kMaterialNames.begin(), kMaterialNames.end(),
                         [&](const auto &p) { return p.first == material; });
  return it->second;
}

std::optional<Material> material_from_name(std::string_view name) {
  auto it = std::find_if(kMaterialNames.begin(), kMaterialNames.end(),
                         [&](const auto &p) { return name == p.second; });
  if (it == kMaterialNames.end()) {
    return std::nullopt;
  }
  return it->first;
}
