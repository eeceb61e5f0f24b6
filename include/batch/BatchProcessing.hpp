#pragma once

#include "analysis/AnalysisResults.hpp"
#include "analysis/DynamicsAnalysis.hpp"
#include "analysis/PwsAnalysis.hpp"
#include "core/CoreTypes.hpp"
#include "core/ImageCube.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

/**
 * @brief Structure to hold the batch execution parameters.
 */
struct BatchParams {
  bool use_parallel{true}; ///< Whether to analyze cubes concurrently
  int num_threads{4};      ///< Upper bound on worker threads

  [[nodiscard]] bool isValid() const noexcept { return num_threads > 0; }
};

/**
 * @brief Everything a worker needs to analyze one cube: the prepared
 * analysis (settings, normalized reference, cached extra reflection) and the
 * name results are filed under.
 *
 * A context is built once, before any worker starts, and only ever shared as
 * a pointer to const.
 */
class AnalysisContext {
  struct Token {};

public:
  using Analysis = std::variant<PwsAnalysis, DynamicsAnalysis>;

  AnalysisContext(Token, std::string analysisName, Analysis analysis)
      : analysisName_(std::move(analysisName)), analysis_(std::move(analysis)) {}

  static std::shared_ptr<const AnalysisContext> create(std::string analysisName,
                                                       Analysis analysis);

  [[nodiscard]] const std::string &analysisName() const noexcept {
    return analysisName_;
  }

  [[nodiscard]] const Analysis &analysis() const noexcept { return analysis_; }

  /**
   * @brief Warnings raised while the analysis was prepared.
   */
  [[nodiscard]] const AnalysisWarnings &setupWarnings() const noexcept;

  /**
   * @brief Runs the analysis on one cube.
   */
  [[nodiscard]] std::pair<AnalysisResults, AnalysisWarnings>
  run(RawCube cube) const;

private:
  std::string analysisName_;
  Analysis analysis_;
};

/**
 * @brief One cube of a batch. The cube is acquired inside the worker so that
 * loading runs in parallel too.
 */
struct BatchItem {
  std::string name;
  std::function<RawCube()> acquire;
};

/**
 * @brief Called by the worker with every successful result, e.g. to persist
 * it. Exceptions thrown here fail the item.
 */
using ResultSink =
    std::function<void(const std::string &, const AnalysisResults &)>;

struct BatchItemOutcome {
  std::string name;
  std::optional<AnalysisResults> results;
  AnalysisWarnings warnings;
  std::optional<std::string> error; ///< Set if the item failed

  [[nodiscard]] bool succeeded() const noexcept { return !error.has_value(); }
};

struct BatchOutcome {
  std::vector<BatchItemOutcome> items; ///< In input order

  [[nodiscard]] int succeeded() const noexcept;
  [[nodiscard]] int failed() const noexcept;
};

/**
 * @brief Analyzes every item with the shared context.
 *
 * A failing item is logged and reported in its outcome; the other items
 * still run.
 *
 * @param context Immutable analysis context.
 * @param items Cubes to analyze.
 * @param params Execution parameters.
 * @param sink Optional consumer of successful results.
 * @throws InvalidParameterError for a null context or invalid parameters.
 */
BatchOutcome run_batch(const std::shared_ptr<const AnalysisContext> &context,
                       std::vector<BatchItem> items,
                       const BatchParams &params = {},
                       const ResultSink &sink = {});
