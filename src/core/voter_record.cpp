#include <votergrid/core/voter_record.hpp>

namespace votergrid::core {

std::string_view gender_label(Gender gender) noexcept {
  switch (gender) {
    case Gender::Male:
      return "पुरुष / Male";
    case Gender::Female:
      return "महिला / Female";
    case Gender::Other:
      return "इतर / Other";
    case Gender::Unknown:
    default:
      return "";
  }
}

std::string_view gender_name(Gender gender) noexcept {
  switch (gender) {
    case Gender::Male:
      return "male";
    case Gender::Female:
      return "female";
    case Gender::Other:
      return "other";
    case Gender::Unknown:
    default:
      return "unknown";
  }
}

}  // namespace votergrid::core
