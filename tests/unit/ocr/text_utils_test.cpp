#include <votergrid/core/voter_record.hpp>
#include <votergrid/ocr/text_utils.hpp>
#include <gtest/gtest.h>
#include <string>

namespace vc = votergrid::core;
namespace vo = votergrid::ocr;

TEST(TextUtils, WidenNarrowUtf8) {
  const std::string utf8 = "वय 45";
  const std::wstring wide = vo::widen(utf8);
  EXPECT_EQ(wide.size(), 5u);
  EXPECT_EQ(vo::narrow(wide), utf8);
}

TEST(TextUtils, InvalidUtf8IsSkipped) {
  const std::string bad("ab\xff\xfe" "cd");
  EXPECT_NO_THROW({
    const std::wstring w = vo::widen(bad);
    EXPECT_NE(w.find(L"ab"), std::wstring::npos);
  });
}

TEST(TextUtils, DevanagariDigitsNormalized) {
  EXPECT_EQ(vo::normalize_digits(std::wstring_view(L"वय ४५")), L"वय 45");
  EXPECT_EQ(vo::normalize_digits(std::string_view("०१२३४५६७८९")), "0123456789");
}

TEST(TextUtils, NormalizeOcrText) {
  EXPECT_EQ(vo::normalize_ocr_text(L"वयः ४२\r\nनाव"), L"वय: 42\n\nनाव");
  EXPECT_EQ(vo::normalize_ocr_text(L"a\u00A0b\tc\u200Bd"), L"a b cd");
}

TEST(TextUtils, HasDevanagari) {
  EXPECT_TRUE(vo::has_devanagari(L"abc क"));
  EXPECT_FALSE(vo::has_devanagari(L"Sunil 45"));
  EXPECT_FALSE(vo::has_devanagari(L"४५"));
}

TEST(TextUtils, CleanPersonNameDropsNoise) {
  auto name = vo::clean_person_name(L"| सुनील  रामचंद्र / पाटील abc =", 4);
  ASSERT_TRUE(name.has_value());
  EXPECT_EQ(*name, L"सुनील रामचंद्र पाटील");
}

TEST(TextUtils, CleanPersonNameKeepsShortLatinWordsInLatinNames) {
  auto name = vo::clean_person_name(L"Sunil Raj Patil", 4);
  ASSERT_TRUE(name.has_value());
  EXPECT_EQ(*name, L"Sunil Raj Patil");
}

TEST(TextUtils, CleanPersonNameCapsWords) {
  auto name = vo::clean_person_name(L"राजेश कुमार शर्मा वर्मा", 3);
  ASSERT_TRUE(name.has_value());
  EXPECT_EQ(*name, L"राजेश कुमार शर्मा");
}

TEST(TextUtils, CleanPersonNameNothingLeft) {
  EXPECT_FALSE(vo::clean_person_name(L" : - | ", 4).has_value());
  EXPECT_FALSE(vo::clean_person_name(L"", 4).has_value());
}

TEST(TextUtils, ParseAge) {
  EXPECT_EQ(vo::parse_age(L"45 लिंग"), L"45");
  EXPECT_EQ(vo::parse_age(L"०४५"), L"45");
  EXPECT_EQ(vo::parse_age(L"23/45"), L"23");
  EXPECT_EQ(vo::parse_age(L"120"), L"120");
  EXPECT_FALSE(vo::parse_age(L"150").has_value());
  EXPECT_FALSE(vo::parse_age(L"0").has_value());
  EXPECT_FALSE(vo::parse_age(L"1234").has_value());
  EXPECT_FALSE(vo::parse_age(L"abc").has_value());
}

TEST(TextUtils, ParseHouseNo) {
  EXPECT_EQ(vo::parse_house_no(L"12-B"), L"12");
  EXPECT_EQ(vo::parse_house_no(L"१२"), L"12");
  EXPECT_EQ(vo::parse_house_no(L"Nagar 5"), L"5");
  EXPECT_FALSE(vo::parse_house_no(L"NA").has_value());
  EXPECT_FALSE(vo::parse_house_no(L"na.").has_value());
  EXPECT_FALSE(vo::parse_house_no(L"--").has_value());
}

TEST(TextUtils, ClassifyGenderVocabulary) {
  EXPECT_EQ(vo::classify_gender(std::wstring_view(L"पुरुष")), vc::Gender::Male);
  EXPECT_EQ(vo::classify_gender(std::wstring_view(L"स्त्री")), vc::Gender::Female);
  EXPECT_EQ(vo::classify_gender(std::wstring_view(L"महिला")), vc::Gender::Female);
  EXPECT_EQ(vo::classify_gender(std::wstring_view(L"तृतीयपंथी")), vc::Gender::Other);
  EXPECT_EQ(vo::classify_gender(std::string_view("Female")), vc::Gender::Female);
  EXPECT_EQ(vo::classify_gender(std::string_view("MALE")), vc::Gender::Male);
  EXPECT_EQ(vo::classify_gender(std::string_view("F")), vc::Gender::Female);
  EXPECT_EQ(vo::classify_gender(std::string_view("M")), vc::Gender::Male);
  EXPECT_EQ(vo::classify_gender(std::string_view("T")), vc::Gender::Other);
}

TEST(TextUtils, ClassifyGenderPrefersWordsOverStrayLetters) {
  EXPECT_EQ(vo::classify_gender(std::wstring_view(L"स्त्री t")), vc::Gender::Female);
  EXPECT_EQ(vo::classify_gender(std::wstring_view(L"पुरुष f")), vc::Gender::Male);
  EXPECT_EQ(vo::classify_gender(std::wstring_view(L"m स्त्री")), vc::Gender::Female);
  EXPECT_EQ(vo::classify_gender(std::string_view("Female m")), vc::Gender::Female);
  EXPECT_EQ(vo::classify_gender(std::string_view("Male / F")), vc::Gender::Male);
}

TEST(TextUtils, ClassifyGenderMatchesLatinWordsWhole) {
  EXPECT_EQ(vo::classify_gender(std::string_view("Mother")), vc::Gender::Unknown);
  EXPECT_EQ(vo::classify_gender(std::string_view("Others")), vc::Gender::Unknown);
  EXPECT_EQ(vo::classify_gender(std::string_view("Other")), vc::Gender::Other);
  EXPECT_EQ(vo::classify_gender(std::string_view(": female.")), vc::Gender::Female);
}

TEST(TextUtils, ClassifyGenderIsTotal) {
  EXPECT_EQ(vo::classify_gender(std::string_view("")), vc::Gender::Unknown);
  EXPECT_EQ(vo::classify_gender(std::string_view("xyz 42")), vc::Gender::Unknown);
  EXPECT_EQ(vo::classify_gender(std::string_view("\xff\xfe")), vc::Gender::Unknown);
}
