#pragma once

#include <string_view>

namespace votergrid::core {

/// Pipeline error codes; used with std::expected for recoverable failures.
enum class PipelineError {
  None = 0,
  InvalidFrame,
  LoadFailed,
  InvalidGrid,
  SegmentationFailed,
  NoCards,
  OcrEngineFailed,
  NoTextRecognized,  // engine ran but returned blank text; reported, not fatal
  InvalidConfig,
  ReportFailed,
};

/// Stable human-readable message for an error code.
[[nodiscard]] std::string_view to_string(PipelineError error) noexcept;

}  // namespace votergrid::core
