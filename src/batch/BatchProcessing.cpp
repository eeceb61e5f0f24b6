#include "batch/BatchProcessing.hpp"
#include "Logging.hpp"

#include <algorithm>
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>

namespace {

BatchItemOutcome process_item(const AnalysisContext &context, BatchItem &item,
                              const ResultSink &sink) {
  const auto &logger = Logger::getInstance();
  BatchItemOutcome outcome{item.name, std::nullopt, {}, std::nullopt};
  try {
    if (!item.acquire) {
      throw InvalidParameterError("Batch item has no cube source");
    }
    auto [results, warnings] = context.run(item.acquire());
    for (const auto &warning : warnings) {
      logger->warn("{}: {}", item.name, warning.shortMsg);
    }
    if (sink) {
      sink(item.name, results);
    }
    outcome.results = std::move(results);
    outcome.warnings = std::move(warnings);
  } catch (const std::exception &e) {
    logger->error("Error processing {}: {}", item.name, e.what());
    outcome.error = e.what();
  }
  return outcome;
}

} // namespace

std::shared_ptr<const AnalysisContext>
AnalysisContext::create(std::string analysisName, Analysis analysis) {
  return std::make_shared<const AnalysisContext>(
      Token{}, std::move(analysisName), std::move(analysis));
}

const AnalysisWarnings &AnalysisContext::setupWarnings() const noexcept {
  return std::visit(
      [](const auto &a) -> const AnalysisWarnings & {
        return a.setupWarnings();
      },
      analysis_);
}

std::pair<AnalysisResults, AnalysisWarnings>
AnalysisContext::run(RawCube cube) const {
  return std::visit(
      [&](const auto &a) -> std::pair<AnalysisResults, AnalysisWarnings> {
        auto [results, warnings] = a.run(std::move(cube));
        return {AnalysisResults(std::move(results)), std::move(warnings)};
      },
      analysis_);
}

int BatchOutcome::succeeded() const noexcept {
  return static_cast<int>(
      std::count_if(items.begin(), items.end(),
                    [](const auto &item) { return item.succeeded(); }));
}

int BatchOutcome::failed() const noexcept {
  return static_cast<int>(items.size()) - succeeded();
}

BatchOutcome run_batch(const std::shared_ptr<const AnalysisContext> &context,
                       std::vector<BatchItem> items, const BatchParams &params,
                       const ResultSink &sink) {
  const auto &logger = Logger::getInstance();
  if (!context) {
    throw InvalidParameterError("Batch requires an analysis context");
  }
  if (!params.isValid()) {
    logger->error("Invalid batch parameters: {} threads", params.num_threads);
    throw InvalidParameterError("Invalid batch parameters");
  }
  logger->debug("Starting batch '{}' of {} cubes", context->analysisName(),
                items.size());

  BatchOutcome outcome;
  outcome.items.resize(items.size());
  if (params.use_parallel) {
    tbb::global_control limit(tbb::global_control::max_allowed_parallelism,
                              static_cast<size_t>(params.num_threads));
    tbb::parallel_for(tbb::blocked_range<size_t>(0, items.size()),
                      [&](const tbb::blocked_range<size_t> &range) {
                        for (size_t i = range.begin(); i < range.end(); ++i) {
                          outcome.items[i] =
                              process_item(*context, items[i], sink);
                        }
                      });
  } else {
    for (size_t i = 0; i < items.size(); ++i) {
      outcome.items[i] = process_item(*context, items[i], sink);
    }
  }

  logger->info("Batch '{}' completed: {} succeeded, {} failed",
               context->analysisName(), outcome.succeeded(), outcome.failed());
  return outcome;
}
