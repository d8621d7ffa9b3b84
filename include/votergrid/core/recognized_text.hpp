#pragma once

#include <string>

namespace votergrid::core {

/// Raw text returned by the OCR engine for one card, before any parsing.
struct RecognizedText {
  std::string text;             // UTF-8
  float mean_confidence{0.f};   // 0-100 as reported by the engine; 0 if unknown
  std::string language;         // e.g. "mar+eng"
};

}  // namespace votergrid::core
