#ifndef LABEL_DOT_HPP
#define LABEL_DOT_HPP

#include "Rules.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>

class Fqdn;

// One label of an Fqdn.  A Label doesn't own anything, it's a view into
// the buffers of the Fqdn it came from and must not outlive it.

class Label {
public:
  // Original case, as parsed.
  std::string_view text() const { return display_; }

  // ASCII lower case; used for all comparisons.
  std::string_view to_lowercase_view() const { return canonical_; }

  std::size_t size() const { return canonical_.size(); }

  // An "xn--" label, i.e. the ASCII form of an internationalized label.
  bool is_a_label() const;

  // The U-label for an A-label, otherwise the lower case text.
  std::string utf8() const;

  bool operator==(Label const& rhs) const
  {
    return canonical_ == rhs.canonical_;
  }
  bool operator!=(Label const& rhs) const { return !(*this == rhs); }

private:
  friend class Fqdn;

  Label(std::string_view canonical, std::string_view display)
    : canonical_(canonical)
    , display_(display)
  {
  }

  std::string_view canonical_;
  std::string_view display_;
};

inline std::ostream& operator<<(std::ostream& os, Label const& lbl)
{
  return os << lbl.text();
}

namespace label {

constexpr bool is_ascii(char c) noexcept
{
  return (static_cast<unsigned char>(c) & 0x80) == 0;
}

constexpr bool is_ascii(std::string_view str) noexcept
{
  for (auto ch : str) {
    if (!is_ascii(ch))
      return false;
  }
  return true;
}

// Like tolower(), but ASCII only and no locale.
constexpr char to_lower(char c) noexcept
{
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c | 0x20) : c;
}

constexpr bool is_valid_char(char c) noexcept
{
  if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
      (c >= '0' && c <= '9') || (c == '-'))
    return true;
  return !Rules::restricted_charset && (c == '_');
}

// Check an ASCII label against the active rules.
bool check(std::string_view ascii, std::error_code& ec);

// Validate one label, passing a non-ASCII label through IDN first.
// Returns the ASCII form in its original case.
std::optional<std::string> parse(std::string_view text, std::error_code& ec);

} // namespace label

#endif // LABEL_DOT_HPP
