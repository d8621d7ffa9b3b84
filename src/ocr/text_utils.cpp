#include <votergrid/ocr/text_utils.hpp>
#include <boost/locale/encoding_utf.hpp>
#include <boost/regex.hpp>
#include <algorithm>
#include <cwctype>
#include <vector>

namespace votergrid::ocr {

namespace vc = votergrid::core;

namespace {

constexpr wchar_t kDevanagariZero = L'०';
constexpr wchar_t kDevanagariNine = L'९';
constexpr wchar_t kVisarga = L'ः';  // printed as a colon on the cards

constexpr std::wstring_view kEdgePunctuation = L" \t:;,.-_'\"`~!?()[]{}|–—।";

bool is_space(wchar_t c) { return c == L' ' || c == L'\t' || c == L'\n'; }

std::vector<std::wstring> split_words(std::wstring_view text) {
  std::vector<std::wstring> words;
  std::wstring current;
  for (wchar_t c : text) {
    if (is_space(c)) {
      if (!current.empty()) words.push_back(std::move(current));
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty()) words.push_back(std::move(current));
  return words;
}

std::wstring trim_edges(std::wstring_view s) {
  const auto start = s.find_first_not_of(kEdgePunctuation);
  if (start == std::wstring_view::npos) return {};
  const auto end = s.find_last_not_of(kEdgePunctuation);
  return std::wstring(s.substr(start, end - start + 1));
}

std::wstring ascii_lower(std::wstring_view text) {
  std::wstring out(text);
  for (auto& c : out) {
    if (c >= L'A' && c <= L'Z') c = static_cast<wchar_t>(c - L'A' + L'a');
  }
  return out;
}

/// Splits on anything that is not an ASCII letter/digit or a Devanagari code point.
std::vector<std::wstring> tokens(std::wstring_view text) {
  std::vector<std::wstring> out;
  std::wstring current;
  for (wchar_t c : text) {
    const bool keep = (c >= L'a' && c <= L'z') || (c >= L'0' && c <= L'9') ||
                      (c >= L'\u0900' && c <= L'\u097F');
    if (keep) {
      current.push_back(c);
    } else if (!current.empty()) {
      out.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) out.push_back(std::move(current));
  return out;
}

struct GenderKeyword {
  std::wstring_view word;
  vc::Gender gender;
  bool whole_token;
};

// Devanagari words first, then Latin words, then single Latin letters, so a
// stray OCR letter never overrides a printed word. Latin entries are whole
// tokens only ("mother" is not "other", "female" is not "male").
constexpr GenderKeyword kGenderVocabulary[] = {
    {L"तृतीयपंथी", vc::Gender::Other, false},
    {L"स्त्री", vc::Gender::Female, false},
    {L"स्री", vc::Gender::Female, false},
    {L"महिला", vc::Gender::Female, false},
    {L"पुरुष", vc::Gender::Male, false},
    {L"इतर", vc::Gender::Other, true},
    {L"जी", vc::Gender::Female, true},  // common misread of स्त्री
    {L"पु", vc::Gender::Male, false},
    {L"female", vc::Gender::Female, true},
    {L"male", vc::Gender::Male, true},
    {L"other", vc::Gender::Other, true},
    {L"tg", vc::Gender::Other, true},
    {L"f", vc::Gender::Female, true},
    {L"m", vc::Gender::Male, true},
    {L"t", vc::Gender::Other, true},
};

}  // namespace

std::wstring widen(std::string_view utf8) {
  return boost::locale::conv::utf_to_utf<wchar_t>(utf8.data(), utf8.data() + utf8.size());
}

std::string narrow(std::wstring_view wide) {
  return boost::locale::conv::utf_to_utf<char>(wide.data(), wide.data() + wide.size());
}

std::wstring normalize_digits(std::wstring_view text) {
  std::wstring out(text);
  for (auto& c : out) {
    if (c >= kDevanagariZero && c <= kDevanagariNine) {
      c = static_cast<wchar_t>(L'0' + (c - kDevanagariZero));
    }
  }
  return out;
}

std::string normalize_digits(std::string_view utf8) {
  return narrow(normalize_digits(widen(utf8)));
}

std::wstring normalize_ocr_text(std::wstring_view text) {
  std::wstring out;
  out.reserve(text.size());
  for (wchar_t c : normalize_digits(text)) {
    switch (c) {
      case kVisarga:
        out.push_back(L':');
        break;
      case L'\r':
      case L'\f':
      case L'\v':
        out.push_back(L'\n');
        break;
      case L'\t':
      case L'\u00A0':  // no-break space
      case L'\u2007':  // figure space
      case L'\u2009':  // thin space
      case L'\u202F':  // narrow no-break space
        out.push_back(L' ');
        break;
      case L'\u200B':  // zero-width space
      case L'\uFEFF':  // byte order mark
        break;
      default:
        out.push_back(c);
        break;
    }
  }
  return out;
}

bool has_devanagari(std::wstring_view text) noexcept {
  return std::any_of(text.begin(), text.end(), [](wchar_t c) {
    return c >= L'\u0900' && c <= L'\u097F' && !(c >= kDevanagariZero && c <= kDevanagariNine);
  });
}

std::optional<std::wstring> clean_person_name(std::wstring_view raw, std::size_t max_words) {
  static const boost::wregex box_noise(L"[|¦\\\\/<>]");
  static const boost::wregex short_latin(L"(^|\\s)[A-Za-z]{1,3}(?=\\s|$)");
  static const boost::wregex symbol_noise(L"[=&*]");

  std::wstring s = boost::regex_replace(std::wstring(raw), box_noise, L" ");
  if (has_devanagari(s)) {
    s = boost::regex_replace(s, short_latin, L"$1");
  }
  s = boost::regex_replace(s, symbol_noise, L"");

  std::vector<std::wstring> kept;
  for (auto& word : split_words(s)) {
    std::wstring w = trim_edges(word);
    if (w.empty()) continue;
    kept.push_back(std::move(w));
    if (max_words > 0 && kept.size() == max_words) break;
  }
  if (kept.empty()) return std::nullopt;

  std::wstring out;
  for (const auto& w : kept) {
    if (!out.empty()) out.push_back(L' ');
    out += w;
  }
  return out;
}

std::optional<std::wstring> first_digit_run(std::wstring_view text) {
  const auto is_digit = [](wchar_t c) { return c >= L'0' && c <= L'9'; };
  const auto begin = std::find_if(text.begin(), text.end(), is_digit);
  if (begin == text.end()) return std::nullopt;
  const auto end = std::find_if_not(begin, text.end(), is_digit);
  return std::wstring(begin, end);
}

std::optional<std::wstring> parse_age(std::wstring_view text) {
  auto digits = first_digit_run(normalize_digits(text));
  if (!digits) return std::nullopt;
  const auto first_nonzero = digits->find_first_not_of(L'0');
  if (first_nonzero == std::wstring::npos) return std::nullopt;  // "0", "00"
  const std::wstring trimmed = digits->substr(first_nonzero);
  if (trimmed.size() > 3) return std::nullopt;
  const int age = std::stoi(trimmed);
  if (age < 1 || age > 120) return std::nullopt;
  return std::to_wstring(age);
}

std::optional<std::wstring> parse_house_no(std::wstring_view text) {
  const std::wstring normalized = normalize_digits(text);
  const std::wstring head = ascii_lower(trim_edges(normalized));
  if (head.rfind(L"na", 0) == 0 && (head.size() == 2 || !std::iswalnum(head[2]))) {
    return std::nullopt;
  }
  return first_digit_run(normalized);
}

vc::Gender classify_gender(std::wstring_view text) {
  const std::wstring lowered = ascii_lower(text);
  const std::vector<std::wstring> toks = tokens(lowered);
  for (const auto& keyword : kGenderVocabulary) {
    if (keyword.whole_token) {
      if (std::find(toks.begin(), toks.end(), keyword.word) != toks.end()) {
        return keyword.gender;
      }
    } else if (lowered.find(keyword.word) != std::wstring::npos) {
      return keyword.gender;
    }
  }
  return vc::Gender::Unknown;
}

vc::Gender classify_gender(std::string_view utf8) {
  return classify_gender(widen(utf8));
}

}  // namespace votergrid::ocr
