#ifndef FQDN_ERROR_DOT_HPP
#define FQDN_ERROR_DOT_HPP

#include <string>
#include <system_error>

enum class fqdn_errc : int {
  // 0 is reserved for success
  empty_label = 1,
  label_too_long,
  name_too_long,
  invalid_character,
  invalid_hyphen_placement,
  codec_failure,
  malformed_separators,

  // wire format only
  trailing_nul_missing,
  invalid_structure,
};

std::error_category const& fqdn_category() noexcept;

inline std::error_code make_error_code(fqdn_errc e) noexcept
{
  return {static_cast<int>(e), fqdn_category()};
}

namespace std {
template <>
struct is_error_code_enum<fqdn_errc> : true_type {};
} // namespace std

#endif // FQDN_ERROR_DOT_HPP
