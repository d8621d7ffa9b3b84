#pragma once

#include <votergrid/core/error.hpp>
#include <votergrid/core/frame.hpp>
#include <votergrid/core/pipeline_stage.hpp>
#include <votergrid/core/recognized_text.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace votergrid::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Runs a sequence of stages; passes Frame through until a stage returns RecognizedText.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IPipelineStage> stage);

  /// Run pipeline on one card image; returns the recognized text or error.
  /// If timing_cb is non-null, it is called after each stage with (stage_index, duration_ms).
  /// Thread-safe: safe to call run() from multiple threads concurrently
  /// (stages are not modified during process()).
  [[nodiscard]] std::expected<RecognizedText, PipelineError> run(
      const Frame& input,
      const StageTimingCallback* timing_cb = nullptr);

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<IPipelineStage>> stages_;
};

}  // namespace votergrid::core
