#pragma once

#include <votergrid/core/voter_record.hpp>
#include <votergrid/ocr/field_table.hpp>
#include <boost/regex.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace votergrid::ocr {

/// Turns raw OCR text of one card into VoterFields using a FieldRule table.
///
/// Best effort: a field whose label is missing, or whose value cannot be
/// isolated, is left absent. parse() never throws on any input, including
/// empty or binary garbage.
///
/// Thread-safety: parse() is const and may be called concurrently.
class FieldParser {
 public:
  /// Compiles the anchors of \p table. Throws boost::regex_error if a pattern
  /// in a custom table does not compile.
  explicit FieldParser(const std::vector<FieldRule>& table = default_field_table());

  [[nodiscard]] votergrid::core::VoterFields parse(std::string_view utf8_text) const;

 private:
  struct CompiledAnchor {
    boost::wregex regex;
    std::optional<votergrid::core::Relation> relation;
    bool fallback{false};
  };
  struct CompiledRule {
    Field field;
    ExtractionRule rule;
    std::size_t max_words;
    std::vector<CompiledAnchor> anchors;
  };
  struct Located {
    std::wstring value;  // text between the anchor and the next label / end of line
    std::optional<votergrid::core::Relation> relation;
  };

  [[nodiscard]] std::optional<Located> locate(const CompiledRule& rule,
                                              const std::vector<std::wstring>& lines) const;
  [[nodiscard]] std::wstring cut_at_next_label(std::wstring_view remainder) const;
  [[nodiscard]] bool inside_regular_label(const std::wstring& line, std::size_t pos) const;
  void apply(const CompiledRule& rule,
             const std::vector<std::wstring>& lines,
             const std::wstring& full_text,
             votergrid::core::VoterFields& out) const;

  std::vector<CompiledRule> rules_;
  boost::wregex any_label_;      // every anchor of every rule
  boost::wregex regular_label_;  // same, without fallback anchors
};

/// Convenience wrapper over a process-wide FieldParser built from default_field_table().
[[nodiscard]] votergrid::core::VoterFields parse_fields(std::string_view utf8_text);

}  // namespace votergrid::ocr
