#ifndef ESC_DOT_HPP
#define ESC_DOT_HPP

#include <string>
#include <string_view>

// RFC 1035 section 5.1 presentation format: '.' and '\' are quoted
// with a backslash, anything not printable becomes \DDD (decimal).

enum class esc_dot_option : bool { quote, keep };
std::string esc(std::string_view str,
                esc_dot_option   dot_option = esc_dot_option::quote);

#endif // ESC_DOT_HPP
