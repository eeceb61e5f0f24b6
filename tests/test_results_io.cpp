#include "doctest/doctest.h"

#include "TestCubes.hpp"
#include "analysis/AnalysisResults.hpp"
#include "analysis/AnalysisSettings.hpp"
#include "core/CoreTypes.hpp"
#include "io/CubeFile.hpp"
#include "io/ResultsFile.hpp"
#include "io/SettingsJson.hpp"

#include <algorithm>
#include <filesystem>
#include <opencv2/opencv.hpp>
#include <variant>

namespace {

std::filesystem::path scratch_directory(const std::string &name) {
  const auto dir = std::filesystem::temp_directory_path() / "pws_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

PwsSettingsParams custom_params() {
  PwsSettingsParams p;
  p.filterOrder = 3;
  p.filterCutoff = 0.1;
  p.polynomialOrder = 2;
  p.extraReflectanceId = "ER_TestSystem_01-01-2024 10:00:00";
  p.referenceMaterial = Material::Ipa;
  p.wavelengthStart = 520;
  p.wavelengthStop = 680;
  p.autoCorrStopIndex = 12;
  p.autoCorrMinSub = AutocorrMinSub::PerPixel;
  p.numericalAperture = 0.35;
  p.cameraCorrection = CameraCorrection{100.5, {1.0, 1e-4}};
  p.waveNumberCutoff = 1.5;
  p.useHannWindow = true;
  p.opdIndexStop = 64;
  return p;
}

PwsAnalysisResults small_pws_results(bool advanced) {
  const cv::Size size(3, 2);
  cv::Mat rms(size, CV_64F);
  cv::randu(rms, 0.0, 0.1);
  PwsResultFields fields{
      .time = "01-01-2024 12:00:00",
      .reflectance = KCube(cv::Mat::ones(6, 4, CV_64F), size,
                           {9.0, 10.0, 11.0, 12.0}),
      .meanReflectance = cv::Mat(size, CV_64F, cv::Scalar(0.4)),
      .rms = rms,
      .imCubeIdTag = "ImCube_TestSystem_01-01-2024 12:00:00",
      .referenceIdTag = "ImCube_TestSystem_01-01-2024 11:00:00",
  };
  if (advanced) {
    fields.ld = cv::Mat(size, CV_64F, cv::Scalar(2.0));
    fields.opd = cv::Mat(6, 3, CV_32F, cv::Scalar(0.5f));
    fields.opdIndex = std::vector<double>{0.0, 0.5, 1.0};
  }
  return PwsAnalysisResults::create(std::move(fields),
                                    PwsAnalysisSettings(custom_params()));
}

} // namespace

TEST_CASE("settings dictionaries round trip") {
  SUBCASE("pws") {
    const PwsAnalysisSettings settings(custom_params());
    CHECK(PwsAnalysisSettings::fromDict(settings.toDict()) == settings);
  }
  SUBCASE("pws without optional settings") {
    PwsSettingsParams p;
    p.filterCutoff.reset();
    p.referenceMaterial.reset();
    const PwsAnalysisSettings settings(p);
    const auto dict = settings.toDict();
    CHECK(dict.count("filterCutoff") == 0);
    CHECK(dict.count("referenceMaterial") == 0);
    CHECK(PwsAnalysisSettings::fromDict(dict) == settings);
  }
  SUBCASE("dynamics through the tagged variant") {
    DynamicsSettingsParams p;
    p.diffusionRegressionLength = 7;
    p.relativeUnits = true;
    const AnalysisSettings settings = DynamicsAnalysisSettings(p);
    const auto dict = analysis_settings_to_dict(settings);
    CHECK(std::get<std::string>(dict.at("analysisType")) == "Dynamics");
    const auto restored = analysis_settings_from_dict(dict);
    REQUIRE(std::holds_alternative<DynamicsAnalysisSettings>(restored));
    CHECK(std::get<DynamicsAnalysisSettings>(restored).params() == p);
  }
}

TEST_CASE("older dictionaries carry only the minimum subtraction flag") {
  auto dict = PwsAnalysisSettings::createDefault().toDict();
  dict.erase("autoCorrMinSubMode");
  dict["autoCorrMinSub"] = true;
  CHECK(PwsAnalysisSettings::fromDict(dict).params().autoCorrMinSub ==
        AutocorrMinSub::WholeCube);
  dict["autoCorrMinSub"] = false;
  CHECK(PwsAnalysisSettings::fromDict(dict).params().autoCorrMinSub ==
        AutocorrMinSub::Disabled);
}

TEST_CASE("malformed settings dictionaries are rejected") {
  auto dict = PwsAnalysisSettings::createDefault().toDict();
  SUBCASE("missing key") {
    dict.erase("polynomialOrder");
    CHECK_THROWS_AS(PwsAnalysisSettings::fromDict(dict), InvalidParameterError);
  }
  SUBCASE("mistyped value") {
    dict["polynomialOrder"] = std::string("two");
    CHECK_THROWS_AS(PwsAnalysisSettings::fromDict(dict), InvalidParameterError);
  }
  SUBCASE("unknown material") {
    dict["referenceMaterial"] = std::string("Unobtainium");
    CHECK_THROWS_AS(PwsAnalysisSettings::fromDict(dict), InvalidParameterError);
  }
  SUBCASE("unknown analysis type") {
    dict["analysisType"] = std::string("Fluorescence");
    CHECK_THROWS_AS(analysis_settings_from_dict(dict), InvalidParameterError);
  }
  SUBCASE("values failing validation") {
    auto dynamics = DynamicsAnalysisSettings::createDefault().toDict();
    dynamics["diffusionRegressionLength"] = 25;
    CHECK_THROWS_AS(DynamicsAnalysisSettings::fromDict(dynamics),
                    InvalidParameterError);
  }
}

TEST_CASE("settings survive json encoding") {
  const PwsAnalysisSettings settings(custom_params());
  const std::string json = settings_to_json(settings.toDict());
  CHECK(json.find("\"referenceMaterial\"") != std::string::npos);

  const auto dict = settings_from_json(json);
  REQUIRE(dict.has_value());
  CHECK(PwsAnalysisSettings::fromDict(*dict) == settings);

  const auto broken = settings_from_json("{ \"filterOrder\": ");
  REQUIRE_FALSE(broken.has_value());
  CHECK(broken.error().code == IoError::Code::INVALID_FORMAT);
}

TEST_CASE("cubes round trip through files") {
  const auto dir = scratch_directory("cubes");
  auto metadata = test_metadata(25.0);
  metadata.pixelSizeUm = 0.13;
  metadata.numericalAperture = 0.52;
  metadata.cameraCorrection = CameraCorrection{2000.0, {1.0, 2e-6}};
  RawCube cube = pws_cube(cv::Size(3, 2), linspace(500.0, 700.0, 5),
                          [](int p, double wl) { return p * 100.0 + wl; },
                          metadata);
  cube.correctCameraEffects();

  const auto path = dir / "cube.yml";
  REQUIRE(save_cube(cube, path).has_value());

  const FileStorageCubeLoader loader;
  const auto loaded = loader.load(path);
  REQUIRE(loaded.has_value());
  CHECK(loaded->idTag() == cube.idTag());
  CHECK(loaded->kind() == CubeKind::Pws);
  CHECK(loaded->size() == cube.size());
  CHECK(loaded->index() == cube.index());
  CHECK(loaded->status().cameraCorrected);
  CHECK_FALSE(loaded->status().exposureNormalized);
  CHECK(loaded->metadata().pixelSizeUm == metadata.pixelSizeUm);
  CHECK(loaded->metadata().cameraCorrection == metadata.cameraCorrection);
  CHECK(cv::norm(loaded->data(), cube.data(), cv::NORM_INF) == 0.0);

  const auto missing = loader.load(dir / "absent.yml");
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().code == IoError::Code::NOT_FOUND);
}

TEST_CASE("extra reflectance cubes round trip through files") {
  const auto dir = scratch_directory("extra");
  const ExtraReflectanceCube cube(
      cv::Mat(6, 3, CV_64F, cv::Scalar(0.02)), cv::Size(3, 2),
      {500.0, 600.0, 700.0},
      ExtraReflectanceMetadata{0.52, "TestSystem", "01-01-2024 10:00:00"});

  const auto path = dir / "extra.yml";
  REQUIRE(save_extra_reflectance(cube, path).has_value());
  const auto loaded = load_extra_reflectance(path);
  REQUIRE(loaded.has_value());
  CHECK(loaded->metadata().idTag() == cube.metadata().idTag());
  CHECK(loaded->index() == cube.index());

  const auto wrongKind = FileStorageCubeLoader().load(path);
  REQUIRE_FALSE(wrongKind.has_value());
  CHECK(wrongKind.error().code == IoError::Code::INVALID_FORMAT);
}

TEST_CASE("results are persisted and loaded lazily") {
  const auto dir = scratch_directory("results");

  SUBCASE("pws") {
    const auto results = small_pws_results(true);
    const auto path = persist(results.toBundle(), dir, "cell1");
    REQUIRE(path.has_value());
    CHECK(path->filename().string().starts_with(PwsAnalysisResults::kFilePrefix));

    const auto store = FileResultStore::open(*path);
    REQUIRE(store.has_value());
    CHECK((*store)->analysisType() == "PWS");
    CHECK((*store)->softwareVersion() == software_version());
    // The settings are stored as one JSON string next to the fields.
    const auto storedSettings = settings_from_json((*store)->settingsJson());
    REQUIRE(storedSettings.has_value());
    CHECK(PwsAnalysisSettings::fromDict(*storedSettings) == results.settings());
    const auto names = (*store)->fields();
    CHECK(std::find(names.begin(), names.end(), "rms") != names.end());
    CHECK(std::find(names.begin(), names.end(), "filterOrder") == names.end());

    const auto loaded = load_results(*path);
    REQUIRE(loaded.has_value());
    REQUIRE(std::holds_alternative<PwsAnalysisResults>(*loaded));
    const auto &pws = std::get<PwsAnalysisResults>(*loaded);
    CHECK(pws.settings() == results.settings());
    CHECK(cv::norm(*pws.rms(), *results.rms(), cv::NORM_INF) < 1e-12);
    CHECK(pws.opdIndex() == results.opdIndex());
    CHECK(pws.ld().has_value());
    CHECK(pws.time() == results.time());
    CHECK_FALSE(pws.rSquared().has_value());
    CHECK_FALSE(pws.extraReflectionTag().has_value());
  }
  SUBCASE("skipped fields stay absent after loading") {
    const auto results = small_pws_results(false);
    const auto path = persist(results.toBundle(), dir, "cell2");
    REQUIRE(path.has_value());
    const auto loaded = load_results(*path);
    REQUIRE(loaded.has_value());
    const auto &pws = std::get<PwsAnalysisResults>(*loaded);
    CHECK(pws.rms().has_value());
    CHECK_FALSE(pws.ld().has_value());
    CHECK_FALSE(pws.opd().has_value());
    CHECK_FALSE(pws.opdIndex().has_value());
  }
  SUBCASE("dynamics") {
    const cv::Size size(2, 2);
    DynamicsResultFields fields{
        .time = "01-01-2024 12:00:00",
        .reflectance = ImageCube(cv::Mat::ones(4, 3, CV_32F), size,
                                 {0.0, 10.0, 20.0}),
        .meanReflectance = cv::Mat(size, CV_64F, cv::Scalar(1.0)),
        .rmsTSquared = cv::Mat(size, CV_64F, cv::Scalar(0.001)),
        .diffusion = cv::Mat(size, CV_64F, cv::Scalar(0.2)),
        .diffusionMask = cv::Mat::zeros(size, CV_8U),
        .imCubeIdTag = "DynCube_TestSystem_01-01-2024 12:00:00",
        .referenceIdTag = "DynCube_TestSystem_01-01-2024 11:00:00",
    };
    const auto results = DynamicsAnalysisResults::create(
        std::move(fields), DynamicsAnalysisSettings::createDefault());
    const auto path = persist(results.toBundle(), dir, "cell3");
    REQUIRE(path.has_value());
    CHECK(path->filename().string().starts_with(
        DynamicsAnalysisResults::kFilePrefix));

    const auto loaded = load_results(*path);
    REQUIRE(loaded.has_value());
    REQUIRE(std::holds_alternative<DynamicsAnalysisResults>(*loaded));
    const auto &dynamics = std::get<DynamicsAnalysisResults>(*loaded);
    CHECK(dynamics.settings() == results.settings());
    CHECK(dynamics.imCubeIdTag() == results.imCubeIdTag());
    CHECK(dynamics.diffusion()->at<double>(1, 1) == doctest::Approx(0.2));
    CHECK((dynamics.reflectance()->index() == std::vector<double>{0.0, 10.0, 20.0}));
  }
  SUBCASE("not a results file") {
    const auto missing = load_results(dir / "nothing.yml");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == IoError::Code::NOT_FOUND);
  }
}
