#ifndef IDN_DOT_HPP
#define IDN_DOT_HPP

#include <optional>
#include <string>
#include <string_view>
#include <system_error>

// Internationalized domain labels, RFC 5890/5891 and UTS #46.  These
// work on a single label; the caller splits the name on dots.

namespace IDN {

// U-label (UTF-8) to A-label ("xn--..."), lower case.
std::optional<std::string> encode(std::string_view u_label,
                                  std::error_code& ec);

// A-label to U-label.
std::optional<std::string> decode(std::string_view a_label,
                                  std::error_code& ec);

bool is_utf8(std::string_view str);

// Normalization Form KC, see <http://unicode.org/reports/tr15/>
std::optional<std::string> nfkc(std::string_view str);

constexpr std::string_view ace_prefix{"xn--"};

} // namespace IDN

#endif // IDN_DOT_HPP
