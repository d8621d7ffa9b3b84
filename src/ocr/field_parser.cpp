#include <votergrid/ocr/field_parser.hpp>
#include <votergrid/ocr/text_utils.hpp>
#include <stdexcept>

namespace votergrid::ocr {

namespace vc = votergrid::core;

namespace {

constexpr std::wstring_view kSeparators = L" \t:;.,-–—=|_";

std::wstring strip_leading_separators(std::wstring_view s) {
  const auto start = s.find_first_not_of(kSeparators);
  if (start == std::wstring_view::npos) return {};
  return std::wstring(s.substr(start));
}

std::wstring trim_spaces(std::wstring_view s) {
  const auto start = s.find_first_not_of(L" \t");
  if (start == std::wstring_view::npos) return {};
  const auto end = s.find_last_not_of(L" \t");
  return std::wstring(s.substr(start, end - start + 1));
}

std::vector<std::wstring> split_lines(const std::wstring& text) {
  std::vector<std::wstring> lines;
  std::size_t start = 0;
  while (start <= text.size()) {
    const auto end = text.find(L'\n', start);
    const auto len = (end == std::wstring::npos ? text.size() : end) - start;
    std::wstring line = trim_spaces(std::wstring_view(text).substr(start, len));
    if (!line.empty()) lines.push_back(std::move(line));
    if (end == std::wstring::npos) break;
    start = end + 1;
  }
  return lines;
}

/// Gender words that are unambiguous even without a label in front of them.
vc::Gender unlabelled_gender(const std::wstring& text) {
  static const boost::wregex english(L"\\b(female|male)\\b", boost::regex::perl | boost::regex::icase);
  if (text.find(L"तृतीयपंथी") != std::wstring::npos) return vc::Gender::Other;
  if (text.find(L"स्त्री") != std::wstring::npos || text.find(L"महिला") != std::wstring::npos) {
    return vc::Gender::Female;
  }
  if (text.find(L"पुरुष") != std::wstring::npos) return vc::Gender::Male;
  boost::wsmatch m;
  if (boost::regex_search(text, m, english)) {
    return (m[1].length() == 6) ? vc::Gender::Female : vc::Gender::Male;
  }
  return vc::Gender::Unknown;
}

// Latin letters and Devanagari letters, vowel signs and nasal marks; danda
// and Devanagari digits are not word characters.
constexpr std::wstring_view kWordChar = L"[A-Za-z\\x{0900}-\\x{0963}\\x{0971}-\\x{097F}]";

/// \p pattern restricted to matches that neither start nor end inside a word.
std::wstring on_word_boundary(const std::wstring& pattern) {
  std::wstring out = L"(?<!";
  out += kWordChar;
  out += L")(?:";
  out += pattern;
  out += L")(?!";
  out += kWordChar;
  out += L")";
  return out;
}

void append_alternative(std::wstring& alternatives, const std::wstring& pattern) {
  if (!alternatives.empty()) alternatives += L"|";
  alternatives += pattern;
}

}  // namespace

FieldParser::FieldParser(const std::vector<FieldRule>& table) {
  std::wstring all_labels;
  std::wstring regular_labels;
  for (const auto& rule : table) {
    CompiledRule compiled{rule.field, rule.rule, rule.max_words, {}};
    for (const auto& anchor : rule.anchors) {
      boost::regex::flag_type flags = boost::regex::perl;
      if (anchor.script == Script::Latin) flags |= boost::regex::icase;
      const std::wstring bounded = on_word_boundary(anchor.pattern);
      compiled.anchors.push_back({boost::wregex(bounded, flags), anchor.relation, anchor.fallback});

      append_alternative(all_labels, bounded);
      if (!anchor.fallback) append_alternative(regular_labels, bounded);
    }
    rules_.push_back(std::move(compiled));
  }
  if (!all_labels.empty()) {
    any_label_ = boost::wregex(all_labels, boost::regex::perl | boost::regex::icase);
  }
  if (!regular_labels.empty()) {
    regular_label_ = boost::wregex(regular_labels, boost::regex::perl | boost::regex::icase);
  }
}

std::wstring FieldParser::cut_at_next_label(std::wstring_view remainder) const {
  std::wstring value(remainder);
  if (any_label_.empty()) return value;
  boost::wsmatch m;
  // match_not_bol: line-start anchors must not fire at the start of the remainder.
  if (boost::regex_search(value, m, any_label_, boost::match_default | boost::match_not_bol)) {
    value.resize(static_cast<std::size_t>(m.position(std::size_t{0})));
  }
  return trim_spaces(value);
}

bool FieldParser::inside_regular_label(const std::wstring& line, std::size_t pos) const {
  if (regular_label_.empty()) return false;
  const boost::wsregex_iterator end;
  for (boost::wsregex_iterator it(line.begin(), line.end(), regular_label_); it != end; ++it) {
    const auto start = static_cast<std::size_t>(it->position(std::size_t{0}));
    if (start > pos) break;
    if (pos < start + static_cast<std::size_t>(it->length(0))) return true;
  }
  return false;
}

std::optional<FieldParser::Located> FieldParser::locate(
    const CompiledRule& rule, const std::vector<std::wstring>& lines) const {
  const auto value_after = [this](const std::wstring& line, const boost::wsmatch& m) {
    const auto end = static_cast<std::size_t>(m.position(std::size_t{0}) + m.length(0));
    return cut_at_next_label(strip_leading_separators(std::wstring_view(line).substr(end)));
  };

  for (const auto& line : lines) {
    for (const auto& anchor : rule.anchors) {
      if (anchor.fallback) continue;
      boost::wsmatch m;
      if (!boost::regex_search(line, m, anchor.regex)) continue;
      return Located{value_after(line, m), anchor.relation};
    }
  }

  for (const auto& line : lines) {
    for (const auto& anchor : rule.anchors) {
      if (!anchor.fallback) continue;
      const boost::wsregex_iterator end;
      for (boost::wsregex_iterator it(line.begin(), line.end(), anchor.regex); it != end; ++it) {
        if (inside_regular_label(line, static_cast<std::size_t>(it->position(std::size_t{0})))) {
          continue;
        }
        return Located{value_after(line, *it), anchor.relation};
      }
    }
  }
  return std::nullopt;
}

void FieldParser::apply(const CompiledRule& rule,
                        const std::vector<std::wstring>& lines,
                        const std::wstring& full_text,
                        vc::VoterFields& out) const {
  switch (rule.rule) {
    case ExtractionRule::IdWithDate: {
      static const boost::wregex id_with_date(
          L"(?:^|\\s)([A-Z0-9]{5,})\\s+([0-9]{1,4}/[0-9]{1,4}/[0-9]{1,5})(?=\\s|$)",
          boost::regex::perl);
      for (const auto& line : lines) {
        boost::wsmatch m;
        if (boost::regex_search(line, m, id_with_date)) {
          out.voter_id = narrow(m[1].str() + L" " + m[2].str());
          return;
        }
      }
      return;
    }
    case ExtractionRule::PersonName: {
      auto located = locate(rule, lines);
      if (!located) return;
      auto name = clean_person_name(located->value, rule.max_words);
      if (!name) return;
      if (rule.field == Field::RelativeName) {
        out.relative_name = narrow(*name);
        out.relation = located->relation;
      } else {
        out.name = narrow(*name);
      }
      return;
    }
    case ExtractionRule::HouseNumber: {
      auto located = locate(rule, lines);
      if (!located) return;
      if (auto house = parse_house_no(located->value)) out.house_no = narrow(*house);
      return;
    }
    case ExtractionRule::Age: {
      auto located = locate(rule, lines);
      if (!located) return;
      if (auto age = parse_age(located->value)) out.age = narrow(*age);
      return;
    }
    case ExtractionRule::GenderKeyword: {
      auto located = locate(rule, lines);
      vc::Gender gender = located ? classify_gender(located->value) : vc::Gender::Unknown;
      if (gender == vc::Gender::Unknown) gender = unlabelled_gender(full_text);
      out.gender = gender;
      return;
    }
  }
}

vc::VoterFields FieldParser::parse(std::string_view utf8_text) const {
  vc::VoterFields out;
  const std::wstring text = normalize_ocr_text(widen(utf8_text));
  const std::vector<std::wstring> lines = split_lines(text);
  if (lines.empty()) return out;

  for (const auto& rule : rules_) {
    try {
      apply(rule, lines, text, out);
    } catch (const std::runtime_error&) {
      // regex_error on pathological input: leave this field absent.
      continue;
    }
  }
  return out;
}

vc::VoterFields parse_fields(std::string_view utf8_text) {
  static const FieldParser parser;
  return parser.parse(utf8_text);
}

}  // namespace votergrid::ocr
