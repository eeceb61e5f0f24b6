#include "Logging.hpp"
#include "batch/BatchProcessing.hpp"
#include "compilation/RoiCompiler.hpp"
#include "io/CubeFile.hpp"
#include "io/ResultsFile.hpp"

#include <iostream>

int main(int argc, char **argv) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0]
              << " <reference cube> <cube>... [--er <calibration>]\n";
    return 1;
  }
  const auto &logger = Logger::getInstance();

  // Reference and optional extra reflectance calibration
  const FileStorageCubeLoader loader;
  std::vector<std::filesystem::path> cubes;
  std::optional<std::filesystem::path> erPath;
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--er" && i + 1 < argc) {
      erPath = argv[++i];
    } else {
      cubes.emplace_back(arg);
    }
  }

  auto reference = loader.load(argv[1]);
  if (!reference) {
    std::cerr << reference.error().message << '\n';
    return 1;
  }

  PwsSettingsParams params;
  std::optional<ExtraReflectanceCube> extra;
  if (erPath) {
    auto loaded = load_extra_reflectance(*erPath);
    if (!loaded) {
      std::cerr << loaded.error().message << '\n';
      return 1;
    }
    params.extraReflectanceId = loaded->metadata().idTag();
    extra = std::move(*loaded);
  }

  try {
    const auto context = AnalysisContext::create(
        "example", PwsAnalysis(PwsAnalysisSettings(params),
                               std::move(*reference), std::move(extra)));
    for (const auto &warning : context->setupWarnings()) {
      std::cout << "Warning: " << warning.shortMsg << '\n';
    }

    // Each cube is loaded and analyzed on a worker thread
    std::vector<BatchItem> items;
    for (const auto &path : cubes) {
      items.push_back({path.stem().string(), [path, &loader]() {
                         auto cube = loader.load(path);
                         if (!cube) {
                           throw ProcessingError(cube.error().message);
                         }
                         return std::move(*cube);
                       }});
    }

    const RoiCompiler compiler;
    const auto outcome = run_batch(
        context, std::move(items), BatchParams{},
        [&](const std::string &name, const AnalysisResults &results) {
          const auto &pws = std::get<PwsAnalysisResults>(results);
          auto written = persist(pws.toBundle(), ".", name);
          if (!written) {
            throw ProcessingError(written.error().message);
          }

          // Whole field of view as a single region
          const auto rms = pws.rms();
          const Roi all("all", 0, cv::Mat::ones(rms->size(), CV_8U));
          const auto [compiled, warnings] = compiler.compile(results, all);
          std::cout << name << ": reflectance " << *compiled.pws->reflectance
                    << ", rms " << *compiled.pws->rms << '\n';
        });

    std::cout << outcome.succeeded() << " analyzed, " << outcome.failed()
              << " failed\n";
    return outcome.failed() == 0 ? 0 : 2;
  } catch (const PwsError &e) {
    logger->error("Analysis setup failed: {}", e.what());
    std::cerr << e.what() << '\n';
    return 1;
  }
}
