#include <votergrid/core/error.hpp>

namespace votergrid::core {

std::string_view to_string(PipelineError error) noexcept {
  switch (error) {
    case PipelineError::None:
      return "no error";
    case PipelineError::InvalidFrame:
      return "invalid frame";
    case PipelineError::LoadFailed:
      return "image could not be loaded";
    case PipelineError::InvalidGrid:
      return "grid rows and cols must be positive";
    case PipelineError::SegmentationFailed:
      return "sheet is smaller than one grid cell";
    case PipelineError::NoCards:
      return "no cards produced";
    case PipelineError::OcrEngineFailed:
      return "OCR engine failed";
    case PipelineError::NoTextRecognized:
      return "no text recognized";
    case PipelineError::InvalidConfig:
      return "invalid configuration";
    case PipelineError::ReportFailed:
      return "report could not be written";
    default:
      return "unknown error";
  }
}

}  // namespace votergrid::core
