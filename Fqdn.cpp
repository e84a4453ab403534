#include "Fqdn.hpp"

#include "esc.hpp"

#include <algorithm>
#include <utility>

#include <glog/logging.h>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

namespace {
std::size_t label_length(std::string const& wire, std::size_t pos)
{
  DCHECK_LT(pos, wire.size());
  return static_cast<unsigned char>(wire[pos]);
}

std::string lower_case(std::string_view str)
{
  std::string ret(str);
  std::transform(begin(ret), end(ret), begin(ret), label::to_lower);
  return ret;
}

// Join the labels of a wire format buffer with dots.
std::string render(std::string const& wire)
{
  if (wire.front() == '\0')
    return ".";

  std::string ret;
  ret.reserve(wire.size());
  for (std::size_t pos = 0; wire[pos] != '\0';) {
    auto const len = label_length(wire, pos);
    if (pos)
      ret += '.';
    ret.append(wire, pos + 1, len);
    pos += 1 + len;
  }

  if constexpr (Rules::trailing_dot) {
    ret += '.';
  }

  return ret;
}
} // namespace

Fqdn::Fqdn()
  : canonical_(1, '\0')
  , display_(1, '\0')
{
}

Fqdn::Fqdn(std::string canonical, std::string display)
  : canonical_(std::move(canonical))
  , display_(std::move(display))
{
  DCHECK_EQ(canonical_.size(), display_.size());
  DCHECK_EQ(canonical_.back(), '\0');
}

Fqdn::Fqdn(Fqdn&& rhs) noexcept
  : canonical_(std::move(rhs.canonical_))
  , display_(std::move(rhs.display_))
{
  rhs.canonical_.assign(1, '\0');
  rhs.display_.assign(1, '\0');
}

Fqdn& Fqdn::operator=(Fqdn&& rhs) noexcept
{
  if (this != &rhs) {
    canonical_.swap(rhs.canonical_);
    display_.swap(rhs.display_);
    rhs.canonical_.assign(1, '\0');
    rhs.display_.assign(1, '\0');
  }
  return *this;
}

Fqdn::Fqdn(std::string_view text)
{
  std::error_code ec;
  auto            dom = parse(text, ec);
  if (!dom) {
    auto const what = fmt::format("«{}»", esc(text, esc_dot_option::keep));
    throw std::system_error(ec, what);
  }
  *this = std::move(*dom);
}

std::optional<Fqdn> Fqdn::parse(std::string_view text, std::error_code& ec)
{
  // A missing trailing dot is implied, with or without
  // Rules::trailing_dot; the empty string is the root.
  if (text.empty() || text == ".")
    return Fqdn{};

  if (text.back() == '.')
    text.remove_suffix(1);

  std::string const name(text);

  auto segments{std::vector<std::string>{}};
  boost::algorithm::split(segments, name, boost::algorithm::is_any_of("."));

  auto labels{std::vector<std::string>{}};
  labels.reserve(segments.size());

  // 1 for the root label
  std::size_t length = 1;

  for (auto const& segment : segments) {
    if (segment.empty()) {
      ec = fqdn_errc::malformed_separators;
      return {};
    }
    auto ascii = label::parse(segment, ec);
    if (!ascii)
      return {};
    length += 1 + ascii->size();
    if (length > Rules::max_name_length) {
      ec = fqdn_errc::name_too_long;
      return {};
    }
    labels.push_back(std::move(*ascii));
  }

  return build_(labels, ec);
}

std::optional<Fqdn>
Fqdn::from_labels(std::vector<std::string_view> const& labels,
                  std::error_code&                     ec)
{
  auto ascii_labels{std::vector<std::string>{}};
  ascii_labels.reserve(labels.size());

  for (auto const& lbl : labels) {
    auto ascii = label::parse(lbl, ec);
    if (!ascii)
      return {};
    ascii_labels.push_back(std::move(*ascii));
  }

  return build_(ascii_labels, ec);
}

std::optional<Fqdn> Fqdn::build_(std::vector<std::string> const& ascii_labels,
                                 std::error_code&                ec)
{
  std::size_t length = 1;
  for (auto const& lbl : ascii_labels)
    length += 1 + lbl.size();

  if (length > Rules::max_name_length) {
    ec = fqdn_errc::name_too_long;
    return {};
  }

  std::string display;
  display.reserve(length);
  for (auto const& lbl : ascii_labels) {
    CHECK_LE(lbl.size(), Rules::max_label_length);
    display += static_cast<char>(lbl.size());
    display += lbl;
  }
  display += '\0';

  auto canonical = lower_case(display);
  return Fqdn{std::move(canonical), std::move(display)};
}

std::optional<Fqdn> Fqdn::from_wire(std::string_view bytes, std::error_code& ec)
{
  if (bytes.empty() || bytes.back() != '\0') {
    ec = fqdn_errc::trailing_nul_missing;
    return {};
  }

  if (bytes.size() > Rules::max_name_length) {
    ec = fqdn_errc::name_too_long;
    return {};
  }

  auto const end_pos = bytes.size() - 1;
  for (std::size_t pos = 0; pos < end_pos;) {
    std::size_t const len = static_cast<unsigned char>(bytes[pos]);
    if (len == 0 || pos + 1 + len > end_pos) {
      ec = fqdn_errc::invalid_structure;
      return {};
    }
    if (!label::check(bytes.substr(pos + 1, len), ec))
      return {};
    pos += 1 + len;
  }

  return Fqdn{lower_case(bytes), std::string(bytes)};
}

Fqdn Fqdn::suffix_(std::size_t offset) const
{
  return Fqdn{canonical_.substr(offset), display_.substr(offset)};
}

bool Fqdn::is_tld() const
{
  if (is_root())
    return false;
  return canonical_[1 + label_length(canonical_, 0)] == '\0';
}

std::size_t Fqdn::depth() const
{
  std::size_t n = 0;
  for (std::size_t pos = 0; canonical_[pos] != '\0';
       pos += 1 + label_length(canonical_, pos)) {
    ++n;
  }
  return n;
}

std::optional<Fqdn> Fqdn::parent() const
{
  if (is_root())
    return {};
  return suffix_(1 + label_length(canonical_, 0));
}

std::optional<Fqdn> Fqdn::tld() const
{
  if (is_root())
    return {};
  std::size_t pos = 0;
  for (;;) {
    auto const next = pos + 1 + label_length(canonical_, pos);
    if (canonical_[next] == '\0')
      return suffix_(pos);
    pos = next;
  }
}

std::vector<Fqdn> Fqdn::hierarchy() const
{
  std::vector<Fqdn> ret;
  for (std::size_t pos = 0; canonical_[pos] != '\0';
       pos += 1 + label_length(canonical_, pos)) {
    ret.push_back(suffix_(pos));
  }
  return ret;
}

bool Fqdn::is_subdomain_of(Fqdn const& other) const
{
  auto const& suffix = other.canonical_;

  // Only suffixes starting on a label boundary count.
  for (std::size_t pos = 0;; pos += 1 + label_length(canonical_, pos)) {
    auto const remaining = canonical_.size() - pos;
    if (remaining == suffix.size())
      return canonical_.compare(pos, remaining, suffix) == 0;
    if (remaining < suffix.size())
      return false;
  }
}

std::vector<Label> Fqdn::labels() const
{
  std::vector<Label> ret;
  std::string_view const canonical{canonical_};
  std::string_view const display{display_};
  for (std::size_t pos = 0; canonical_[pos] != '\0';) {
    auto const len = label_length(canonical_, pos);
    ret.push_back(Label{canonical.substr(pos + 1, len),
                        display.substr(pos + 1, len)});
    pos += 1 + len;
  }
  return ret;
}

std::optional<Label> Fqdn::label(std::size_t index) const
{
  auto const lbls = labels();
  if (index >= lbls.size())
    return {};
  return lbls[index];
}

std::string Fqdn::to_string() const
{
  return render(display_);
}

std::string Fqdn::ascii() const
{
  return render(canonical_);
}

std::string Fqdn::utf8() const
{
  if (is_root())
    return ".";

  std::string ret;
  for (auto const& lbl : labels()) {
    if (!ret.empty())
      ret += '.';
    ret += lbl.utf8();
  }
  if constexpr (Rules::trailing_dot) {
    ret += '.';
  }
  return ret;
}
