#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Materials with tabulated refractive index data.
 */
enum class Material {
  Glass,   ///< Schott N-BK7
  Water,
  Air,
  Silicon,
  Oil_1_7, ///< Index matching oil, n_D = 1.70
  Oil_1_4, ///< Index matching oil, n_D = 1.40
  Ipa,     ///< Isopropyl alcohol
  Ethanol,
  ITO      ///< Indium tin oxide
};

/**
 * @brief Returns every known material in declaration order.
 */
const std::vector<Material> &all_materials();

/**
 * @brief Serializable name of a material ("Glass", "Oil_1_7", ...).
 */
std::string material_name(Material material);

/**
 * @brief Parses a material name produced by material_name().
 * @return The material, or std::nullopt if the name is unknown.
 */
std::optional<Material> material_from_name(std::string_view name);
