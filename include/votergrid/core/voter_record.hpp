#pragma once

#include <votergrid/core/frame.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace votergrid::core {

enum class Gender : std::uint8_t {
  Unknown,
  Male,
  Female,
  Other,
};

/// Which relative label anchored relative_name on the card.
enum class Relation : std::uint8_t {
  Father,
  Husband,
  Mother,
  Guardian,
};

/// Fields recovered from one card's text. Every text field is optional:
/// std::nullopt means "not found", never an empty string.
struct VoterFields {
  std::optional<std::string> voter_id;
  std::optional<std::string> name;
  std::optional<std::string> relative_name;
  std::optional<Relation> relation;
  std::optional<std::string> house_no;  // Latin digits
  std::optional<std::string> age;       // Latin digits, 1-120
  Gender gender{Gender::Unknown};

  /// True when no text field was found (gender is Unknown too).
  [[nodiscard]] bool all_absent() const noexcept {
    return !voter_id && !name && !relative_name && !relation && !house_no && !age &&
           gender == Gender::Unknown;
  }
};

/// One row of the final report.
struct VoterRecord {
  std::uint32_t serial{0};  // 1-based, assigned in grid order by the coordinator
  std::uint32_t row{0};     // grid position of the source card
  std::uint32_t col{0};
  VoterFields fields;
  std::optional<Frame> face_image;
};

/// Bilingual display label ("पुरुष / Male"); empty for Unknown.
[[nodiscard]] std::string_view gender_label(Gender gender) noexcept;

/// Short English name, for logs and the CLI summary.
[[nodiscard]] std::string_view gender_name(Gender gender) noexcept;

}  // namespace votergrid::core
