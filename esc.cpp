#include "esc.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace {
bool needs_esc(unsigned char c, esc_dot_option dot_option)
{
  if (c == '.')
    return dot_option == esc_dot_option::quote;
  return (c < 0x21) || (c > 0x7e) || (c == '\\');
}
} // namespace

std::string esc(std::string_view str, esc_dot_option dot_option)
{
  auto nesc{std::count_if(begin(str), end(str), [dot_option](unsigned char c) {
    return needs_esc(c, dot_option);
  })};
  if (!nesc)
    return std::string(str);
  std::string ret;
  ret.reserve(str.length() + 3 * nesc);
  for (auto c : str) {
    auto const uc = static_cast<unsigned char>(c);
    if (!needs_esc(uc, dot_option)) {
      ret += c;
    }
    else if (c == '.' || c == '\\') {
      ret += '\\';
      ret += c;
    }
    else {
      ret += fmt::format("\\{:03d}", uc);
    }
  }
  return ret;
}
