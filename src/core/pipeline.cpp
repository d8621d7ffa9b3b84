#include <votergrid/core/pipeline.hpp>
#include <chrono>

namespace votergrid::core {

void Pipeline::add_stage(std::unique_ptr<IPipelineStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<RecognizedText, PipelineError> Pipeline::run(
    const Frame& input,
    const StageTimingCallback* timing_cb) {
  if (stages_.empty()) {
    return std::unexpected(PipelineError::InvalidConfig);
  }

  // The input is only borrowed; intermediate frames are owned here.
  const Frame* frame_ptr = &input;
  StageOutput current;

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    const auto stage_start = std::chrono::steady_clock::now();
    auto result = stages_[i]->process(*frame_ptr);
    if (timing_cb) {
      const auto stage_end = std::chrono::steady_clock::now();
      const double ms = 1e-6 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(stage_end - stage_start).count());
      (*timing_cb)(i, ms);
    }

    if (!result) {
      return std::unexpected(result.error());
    }

    current = std::move(*result);
    if (auto* text = std::get_if<RecognizedText>(&current)) {
      return std::move(*text);
    }
    frame_ptr = &std::get<Frame>(current);
  }

  return std::unexpected(PipelineError::InvalidConfig);
}

}  // namespace votergrid::core
