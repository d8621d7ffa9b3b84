#pragma once

#include <votergrid/core/error.hpp>
#include <votergrid/core/frame.hpp>
#include <votergrid/core/recognized_text.hpp>
#include <expected>
#include <memory>
#include <variant>

namespace votergrid::core {

/// Output of a pipeline stage: either pass-through Frame or final RecognizedText.
using StageOutput = std::variant<Frame, RecognizedText>;

/// Abstract pipeline stage: process one Frame, return Frame (continue) or RecognizedText (done).
/// Implementations must not mutate their own state in process(); one stage
/// instance serves every card task.
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  [[nodiscard]] virtual std::expected<StageOutput, PipelineError> process(
      const Frame& input) = 0;
};

}  // namespace votergrid::core
