#pragma once

#include <votergrid/core/voter_record.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace votergrid::ocr {

/// UTF-8 <-> wide conversion; invalid UTF-8 sequences are skipped, never thrown.
[[nodiscard]] std::wstring widen(std::string_view utf8);
[[nodiscard]] std::string narrow(std::wstring_view wide);

/// Devanagari digits (U+0966..U+096F) -> ASCII digits; other characters unchanged.
[[nodiscard]] std::wstring normalize_digits(std::wstring_view text);
[[nodiscard]] std::string normalize_digits(std::string_view utf8);

/// Prepares raw OCR output for matching: digits to ASCII, visarga used as a
/// colon to ':', CR and form feeds to '\n', no-break and other spaces to ' '.
[[nodiscard]] std::wstring normalize_ocr_text(std::wstring_view text);

/// True if \p text contains at least one Devanagari letter.
[[nodiscard]] bool has_devanagari(std::wstring_view text) noexcept;

/// Cleans a person name captured after a label: drops box-drawing / slash
/// noise, stray 1-3 letter Latin tokens inside Devanagari text, = & *,
/// leading and trailing punctuation; collapses whitespace and keeps at most
/// max_words words. nullopt when nothing is left.
[[nodiscard]] std::optional<std::wstring> clean_person_name(std::wstring_view raw,
                                                            std::size_t max_words);

/// First run of ASCII digits in \p text, if any.
[[nodiscard]] std::optional<std::wstring> first_digit_run(std::wstring_view text);

/// Age from the text after an age label: the first digit run, kept only if it
/// is a plausible age (1-120). Out-of-range values are discarded, not clamped.
[[nodiscard]] std::optional<std::wstring> parse_age(std::wstring_view text);

/// House number from the text after a house label: first digit run, absent
/// when the card prints "NA" or no digits.
[[nodiscard]] std::optional<std::wstring> parse_house_no(std::wstring_view text);

/// Maps any text to a gender by keyword (both scripts). Total: unmatched text
/// is Gender::Unknown.
[[nodiscard]] votergrid::core::Gender classify_gender(std::wstring_view text);
[[nodiscard]] votergrid::core::Gender classify_gender(std::string_view utf8);

}  // namespace votergrid::ocr
