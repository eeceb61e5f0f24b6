#include "doctest/doctest.h"

#include "core/CoreTypes.hpp"
#include "core/Material.hpp"
#include "reflectance/ReflectanceModel.hpp"
#include "reflectance/RefractiveIndex.hpp"

#include <cmath>
#include <vector>

TEST_CASE("reflectance at normal incidence follows Fresnel") {
  const double n1 = refractive_index(Material::Water, {550.0})[0].real();
  const double n2 = refractive_index(Material::Glass, {550.0})[0].real();
  const double expected = std::pow((n1 - n2) / (n1 + n2), 2);

  const double r = reflectance(Material::Water, Material::Glass, 550.0, 0.0);
  CHECK(r == doctest::Approx(expected).epsilon(1e-9));
  CHECK(r > 0.003);
  CHECK(r < 0.006);
}

TEST_CASE("reflectance is symmetric in the two materials") {
  const std::vector<double> wavelengths{500.0, 550.0, 600.0, 650.0, 700.0};
  for (double na : {0.0, 0.3, 0.52}) {
    const auto forward =
        reflectance(Material::Water, Material::Glass, wavelengths, na);
    const auto backward =
        reflectance(Material::Glass, Material::Water, wavelengths, na);
    REQUIRE(forward.size() == wavelengths.size());
    for (size_t i = 0; i < forward.size(); ++i) {
      CHECK(forward[i] == doctest::Approx(backward[i]).epsilon(1e-9));
    }
  }
}

TEST_CASE("reflectance of every material against glass lies within [0, 1]") {
  const std::vector<double> wavelengths{500.0, 600.0, 700.0};
  for (Material material : all_materials()) {
    const auto r = reflectance(material, Material::Glass, wavelengths, 0.52);
    for (double value : r) {
      CHECK(value >= 0.0);
      CHECK(value <= 1.0);
    }
  }
}

TEST_CASE("identical materials do not reflect") {
  const auto r = reflectance(Material::Glass, Material::Glass,
                             std::vector<double>{550.0, 650.0}, 0.52);
  CHECK(r[0] == doctest::Approx(0.0));
  CHECK(r[1] == doctest::Approx(0.0));
}

TEST_CASE("reflectance rejects unsupported inputs") {
  SUBCASE("wavelength outside the tabulated range") {
    CHECK_THROWS_AS(reflectance(Material::Water, Material::Glass, 2000.0, 0.0),
                    MaterialNotFoundError);
  }
  SUBCASE("negative numerical aperture") {
    CHECK_THROWS_AS(reflectance(Material::Water, Material::Glass, 550.0, -0.1),
                    InvalidParameterError);
  }
  SUBCASE("aperture beyond the medium's index") {
    CHECK_THROWS_AS(reflectance(Material::Air, Material::Glass, 550.0, 1.2),
                    InvalidParameterError);
  }
}

TEST_CASE("material names round trip") {
  for (Material material : all_materials()) {
    const auto parsed = material_from_name(material_name(material));
    REQUIRE(parsed.has_value());
    CHECK(*parsed == material);
  }
  CHECK_FALSE(material_from_name("Unobtainium").has_value());
}

TEST_CASE("absorbing materials keep their extinction coefficient") {
  const auto silicon = refractive_index(Material::Silicon, {400.0, 600.0});
  CHECK(silicon[0].imag() == doctest::Approx(0.387));
  CHECK(silicon[1].imag() == doctest::Approx(0.025));

  // |(n_air - (n + ik)) / (n_air + n + ik)|^2 with n = 5.570, k = 0.387.
  // Dropping k would give 0.48375.
  CHECK(reflectance(Material::Silicon, Material::Air, 400.0, 0.0) ==
        doctest::Approx(0.485524).epsilon(1e-5));
  CHECK(reflectance(Material::Silicon, Material::Air, 600.0, 0.0) ==
        doctest::Approx(0.354006).epsilon(1e-5));

  // The aperture average of an absorbing interface stays physical.
  const double withAperture =
      reflectance(Material::Silicon, Material::Glass, 550.0, 0.52);
  CHECK(withAperture > 0.0);
  CHECK(withAperture < 1.0);
}
