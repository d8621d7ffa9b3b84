#include <votergrid/ocr/field_table.hpp>

namespace votergrid::ocr {

namespace {

using votergrid::core::Relation;

std::vector<FieldRule> build_default_table() {
  std::vector<FieldRule> table;

  table.push_back({Field::VoterId, ExtractionRule::IdWithDate, {}, 0});

  // Relative labels come before the voter-name label: both end in "नाव" and
  // the voter-name anchors must never claim a relative's line.
  table.push_back({Field::RelativeName,
                   ExtractionRule::PersonName,
                   {
                       {Script::Devanagari, L"(?:पतीचे|पतिचे|पवीचे|पतंतचे)\\s*नाव", Relation::Husband},
                       {Script::Devanagari, L"(?:वडिलांचे|वडीलांचे|वडिळांचे|वडिलाचे|वडिलचे)\\s*नाव",
                        Relation::Father},
                       {Script::Devanagari, L"(?:आईचे|अईचे|अइचे)\\s*नाव", Relation::Mother},
                       {Script::Devanagari, L"(?:इतरांचे|पालकाचे|पालक)\\s*(?:नाव)?", Relation::Guardian},
                       {Script::Latin, L"Husband'?s?\\s*Name", Relation::Husband},
                       {Script::Latin, L"Father'?s?\\s*Name", Relation::Father},
                       {Script::Latin, L"Mother'?s?\\s*Name", Relation::Mother},
                       {Script::Latin, L"Guardian'?s?(?:\\s*Name)?", Relation::Guardian},
                   },
                   3});

  table.push_back({Field::Name,
                   ExtractionRule::PersonName,
                   {
                       {Script::Devanagari, L"(?:मतदाराचे|मतदाराच|मतराराचे|मतदराचे)\\s*(?:पूर्ण|पुर्ण)?\\s*(?:नाव)?",
                        std::nullopt},
                       {Script::Devanagari, L"(?:मतदार|मतरार|मतदर)\\s*(?:नाव)?", std::nullopt},
                       {Script::Latin, L"^\\s*(?:Elector'?s?\\s*)?Name\\b", std::nullopt},
                       // OCR often garbles the "मतदाराचे" prefix and leaves a bare "नाव".
                       {Script::Devanagari, L"नाव", std::nullopt, true},
                   },
                   4});

  table.push_back({Field::HouseNo,
                   ExtractionRule::HouseNumber,
                   {
                       {Script::Devanagari, L"घर\\s*(?:क्रमांक|क्रमाक|क्रम|क्र\\.?|नं\\.?|न)", std::nullopt},
                       {Script::Latin, L"House\\s*(?:No\\.?|Number|#)", std::nullopt},
                   },
                   0});

  table.push_back({Field::Age,
                   ExtractionRule::Age,
                   {
                       {Script::Devanagari, L"(?:वय|वम)(?=\\s*[:0-9])", std::nullopt},
                       {Script::Latin, L"\\bAge\\b", std::nullopt},
                   },
                   0});

  table.push_back({Field::Gender,
                   ExtractionRule::GenderKeyword,
                   {
                       {Script::Devanagari, L"(?:लिंग|लिग|लखग)", std::nullopt},
                       {Script::Latin, L"\\b(?:Gender|Sex)\\b", std::nullopt},
                   },
                   0});

  return table;
}

}  // namespace

const std::vector<FieldRule>& default_field_table() {
  static const std::vector<FieldRule> table = build_default_table();
  return table;
}

}  // namespace votergrid::ocr
