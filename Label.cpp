#include "Label.hpp"

#include "Fqdn-error.hpp"
#include "IDN.hpp"

#include <algorithm>

namespace label {

bool check(std::string_view ascii, std::error_code& ec)
{
  if (ascii.empty()) {
    ec = fqdn_errc::empty_label;
    return false;
  }

  if (ascii.size() > Rules::max_label_length) {
    ec = fqdn_errc::label_too_long;
    return false;
  }

  if (!std::all_of(begin(ascii), end(ascii), is_valid_char)) {
    ec = fqdn_errc::invalid_character;
    return false;
  }

  if constexpr (Rules::no_edge_hyphen) {
    if (ascii.front() == '-' || ascii.back() == '-') {
      ec = fqdn_errc::invalid_hyphen_placement;
      return false;
    }
  }

  return true;
}

std::optional<std::string> parse(std::string_view text, std::error_code& ec)
{
  if (is_ascii(text)) {
    if (!check(text, ec))
      return {};
    return std::string{text};
  }

  auto ascii = IDN::encode(text, ec);
  if (!ascii)
    return {};

  if (!check(*ascii, ec))
    return {};

  return ascii;
}

} // namespace label

bool Label::is_a_label() const
{
  return canonical_.size() > IDN::ace_prefix.size() &&
         canonical_.substr(0, IDN::ace_prefix.size()) == IDN::ace_prefix;
}

std::string Label::utf8() const
{
  if (is_a_label()) {
    std::error_code ec;
    auto u_label = IDN::decode(canonical_, ec);
    if (u_label)
      return *u_label;
  }
  return std::string{canonical_};
}
