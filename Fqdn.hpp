#ifndef FQDN_DOT_HPP
#define FQDN_DOT_HPP

#include "Fqdn-error.hpp"
#include "Label.hpp"
#include "Rules.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>

// A fully qualified domain name.
//
// Stored as RFC 1035 wire format: each label as a length octet
// followed by the label, ending with the zero length root label.  The
// canonical copy is folded to ASCII lower case and is the only thing
// looked at by comparison and hashing; a second copy of the same shape
// keeps the case the name was written in, for display.
//
// Immutable once built.

class Fqdn {
public:
  // The root.
  Fqdn();

  // Throws std::system_error with an fqdn_errc code.
  explicit Fqdn(std::string_view text);

  Fqdn(Fqdn const&) = default;
  Fqdn& operator=(Fqdn const&) = default;

  // The moved from Fqdn is left as the root.
  Fqdn(Fqdn&& rhs) noexcept;
  Fqdn& operator=(Fqdn&& rhs) noexcept;

  // Text form, "www.example.com." or "www.example.com".  Non-ASCII
  // labels are converted to A-labels.
  static std::optional<Fqdn> parse(std::string_view text, std::error_code& ec);

  // From individual labels, most specific first; {"www", "example",
  // "com"} is "www.example.com.".
  static std::optional<Fqdn> from_labels(std::vector<std::string_view> const& labels,
                                         std::error_code&                     ec);

  // From RFC 1035 wire format, terminal zero octet included.  No
  // message compression; every length octet is a label length.
  static std::optional<Fqdn> from_wire(std::string_view bytes, std::error_code& ec);

  bool is_root() const { return canonical_.front() == '\0'; }
  bool is_tld() const;

  // Number of labels, not counting the root.
  std::size_t depth() const;

  // Drop the leftmost label; nothing for the root.
  std::optional<Fqdn> parent() const;

  // The rightmost non-root label as an Fqdn; nothing for the root.
  std::optional<Fqdn> tld() const;

  // This name and each of its ancestors down to the TLD.
  std::vector<Fqdn> hierarchy() const;

  // True if this name is other, or other with labels prepended.
  bool is_subdomain_of(Fqdn const& other) const;

  // Views into this Fqdn; they dangle once it is gone.  Nothing from
  // label() if index is not less than depth().
  std::vector<Label>   labels() const;
  std::optional<Label> label(std::size_t index) const;

  // Lower case wire format, terminal zero included.
  std::string_view wire() const { return canonical_; }

  // Original case.  Ends with a dot when Rules::trailing_dot is set;
  // the root is always ".".
  std::string to_string() const;

  // Lower case, A-labels.
  std::string ascii() const;

  // Lower case, U-labels.
  std::string utf8() const;

  bool operator==(Fqdn const& rhs) const { return canonical_ == rhs.canonical_; }
  std::strong_ordering operator<=>(Fqdn const& rhs) const
  {
    return canonical_ <=> rhs.canonical_;
  }

private:
  Fqdn(std::string canonical, std::string display);

  static std::optional<Fqdn> build_(std::vector<std::string> const& ascii_labels,
                                    std::error_code&                ec);

  Fqdn suffix_(std::size_t offset) const;

  std::string canonical_;
  std::string display_;
};

inline std::ostream& operator<<(std::ostream& os, Fqdn const& dom)
{
  return os << dom.to_string();
}

template <>
struct fmt::formatter<Fqdn> : ostream_formatter {};

namespace std {
template <>
struct hash<Fqdn> {
  std::size_t operator()(Fqdn const& k) const
  {
    return hash<std::string_view>()(k.wire());
  }
};
} // namespace std

#endif // FQDN_DOT_HPP
