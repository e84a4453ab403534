#include "Fqdn-error.hpp"

namespace {
class fqdn_category_impl : public std::error_category {
public:
  char const* name() const noexcept override { return "fqdn"; }

  std::string message(int ev) const override
  {
    switch (static_cast<fqdn_errc>(ev)) {
    case fqdn_errc::empty_label:
      return "empty label in domain name";
    case fqdn_errc::label_too_long:
      return "domain label too long";
    case fqdn_errc::name_too_long:
      return "domain name too long";
    case fqdn_errc::invalid_character:
      return "invalid character in domain label";
    case fqdn_errc::invalid_hyphen_placement:
      return "domain label can't start or end with a hyphen";
    case fqdn_errc::codec_failure:
      return "internationalized domain label can't be encoded";
    case fqdn_errc::malformed_separators:
      return "misplaced or consecutive dots in domain name";
    case fqdn_errc::trailing_nul_missing:
      return "trailing zero octet missing from wire format name";
    case fqdn_errc::invalid_structure:
      return "invalid wire format name";
    }
    return "unknown fqdn error";
  }
};
} // namespace

std::error_category const& fqdn_category() noexcept
{
  static fqdn_category_impl const category;
  return category;
}
