#include "doctest/doctest.h"

#include "Logging.hpp"
#include "TestCubes.hpp"
#include "batch/BatchProcessing.hpp"
#include "core/CoreTypes.hpp"

#include <cmath>
#include <mutex>
#include <numbers>
#include <set>
#include <stdexcept>

namespace {

const cv::Size kSize(3, 3);

std::vector<double> wavelengths() { return linspace(500.0, 700.0, 101); }

RawCube flat_cube() {
  return pws_cube(kSize, wavelengths(), [](int, double) { return 1000.0; });
}

RawCube sample_cube(double amplitude) {
  return pws_cube(kSize, wavelengths(), [amplitude](int, double wl) {
    return 1000.0 * (0.5 + amplitude * std::sin(2 * std::numbers::pi * 8.0 /
                                                 (wl * 1e-3)));
  });
}

std::shared_ptr<const AnalysisContext> pws_context() {
  PwsSettingsParams p;
  p.referenceMaterial.reset();
  p.relativeUnits = true;
  return AnalysisContext::create(
      "batch", PwsAnalysis(PwsAnalysisSettings(p), flat_cube()));
}

std::vector<BatchItem> items_with_one_failure() {
  std::vector<BatchItem> items;
  for (int i = 0; i < 5; ++i) {
    items.push_back({"Cell" + std::to_string(i),
                     [i]() { return sample_cube(0.01 * (i + 1)); }});
  }
  items[2].acquire = []() -> RawCube {
    throw std::runtime_error("Acquisition is corrupt");
  };
  return items;
}

} // namespace

TEST_CASE("a failing cube does not stop the batch") {
  const auto context = pws_context();
  CHECK(context->setupWarnings().size() == 2);

  for (const bool parallel : {false, true}) {
    CAPTURE(parallel);
    std::mutex mutex;
    std::set<std::string> sunk;
    const auto outcome = run_batch(
        context, items_with_one_failure(), BatchParams{parallel, 3},
        [&](const std::string &name, const AnalysisResults &results) {
          CHECK(std::holds_alternative<PwsAnalysisResults>(results));
          std::lock_guard<std::mutex> lock(mutex);
          sunk.insert(name);
        });

    CHECK(outcome.succeeded() == 4);
    CHECK(outcome.failed() == 1);
    REQUIRE(outcome.items.size() == 5);
    for (size_t i = 0; i < outcome.items.size(); ++i) {
      CHECK(outcome.items[i].name == "Cell" + std::to_string(i));
    }

    const auto &failedItem = outcome.items[2];
    CHECK_FALSE(failedItem.succeeded());
    CHECK_FALSE(failedItem.results.has_value());
    CHECK(failedItem.error == std::string("Acquisition is corrupt"));

    CHECK(sunk.size() == 4);
    CHECK(sunk.count("Cell2") == 0);

    // Larger oscillations give larger RMS values.
    const auto rms = [&](size_t i) {
      const auto &results =
          std::get<PwsAnalysisResults>(*outcome.items[i].results);
      return results.rms()->at<double>(1, 1);
    };
    CHECK(rms(0) < rms(1));
    CHECK(rms(3) < rms(4));
  }
}

TEST_CASE("a failing sink fails only its item") {
  const auto outcome = run_batch(
      pws_context(), {{"Cell0", []() { return sample_cube(0.02); }},
                      {"Cell1", []() { return sample_cube(0.02); }}},
      BatchParams{false, 1},
      [](const std::string &name, const AnalysisResults &) {
        if (name == "Cell1") {
          throw std::runtime_error("Disk full");
        }
      });
  CHECK(outcome.items[0].succeeded());
  CHECK_FALSE(outcome.items[1].succeeded());
}

TEST_CASE("cubes that do not match the reference are reported") {
  const auto outcome = run_batch(
      pws_context(),
      {{"Small", []() {
          return pws_cube(cv::Size(2, 2), wavelengths(),
                          [](int, double) { return 500.0; });
        }},
       {"Missing", {}}},
      BatchParams{false, 1});
  CHECK(outcome.failed() == 2);
  CHECK(outcome.items[1].error.has_value());
}

TEST_CASE("batch preconditions") {
  CHECK_THROWS_AS(static_cast<void>(run_batch(nullptr, {})),
                  InvalidParameterError);
  CHECK_THROWS_AS(
      static_cast<void>(run_batch(pws_context(), {}, BatchParams{true, 0})),
      InvalidParameterError);

  const auto empty = run_batch(pws_context(), {});
  CHECK(empty.items.empty());
  CHECK(empty.succeeded() == 0);
}

TEST_CASE("workers share one analysis logger") {
  const auto logger = Logger::getInstance();
  REQUIRE(logger != nullptr);
  CHECK(logger->name().starts_with("pws_analysis"));

  std::mutex mutex;
  std::set<spdlog::logger *> seen;
  const auto outcome = run_batch(
      pws_context(),
      {{"Cell0", []() { return sample_cube(0.02); }},
       {"Cell1", []() { return sample_cube(0.03); }}},
      BatchParams{true, 2}, [&](const std::string &, const AnalysisResults &) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.insert(Logger::getInstance().get());
      });
  CHECK(outcome.succeeded() == 2);
  CHECK(seen == std::set<spdlog::logger *>{logger.get()});
}
