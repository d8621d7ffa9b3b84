#pragma once

#include <votergrid/core/voter_record.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace votergrid::ocr {

enum class Field : std::uint8_t {
  VoterId,
  Name,
  RelativeName,
  HouseNo,
  Age,
  Gender,
};

/// Script a label is printed in; Latin anchors match case-insensitively.
enum class Script : std::uint8_t {
  Devanagari,
  Latin,
};

/// How the value is taken once its anchor has been found.
enum class ExtractionRule : std::uint8_t {
  IdWithDate,     // no anchor: ID-like token followed by a slash-separated date-like token
  PersonName,     // free text to the next label, cleaned, capped at max_words
  HouseNumber,    // digits after the label; "NA" means absent
  Age,            // digits after the label, 1-120
  GenderKeyword,  // keyword vocabulary, total
};

/// One printed label (or an OCR misreading of it) as a Boost.Regex pattern.
/// The parser only accepts a match that starts and ends on a word boundary,
/// so a label never fires inside a longer word such as a surname.
struct Anchor {
  Script script{Script::Devanagari};
  std::wstring pattern;
  std::optional<votergrid::core::Relation> relation;  // relative labels only
  /// Tried only after every regular anchor of the rule missed, and never where
  /// the match is part of another label ("नाव" inside "वडिलांचे नाव").
  bool fallback{false};
};

struct FieldRule {
  Field field{Field::Name};
  ExtractionRule rule{ExtractionRule::PersonName};
  std::vector<Anchor> anchors;  // tried in order on each line
  std::size_t max_words{0};     // PersonName only; 0 = no cap
};

/// Marathi + English label table for the state electoral-roll card layout.
/// A new language pack is a new set of anchors; the parser's control flow
/// does not change.
[[nodiscard]] const std::vector<FieldRule>& default_field_table();

}  // namespace votergrid::ocr
