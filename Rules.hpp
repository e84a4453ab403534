#ifndef RULES_DOT_HPP
#define RULES_DOT_HPP

#include <cstddef>

// The validation rules are fixed when the library is compiled, see the
// FQDN_* options in CMakeLists.txt.  Values built under different rule
// sets never meet in one process.

#ifdef FQDN_STRICT_RFC
#ifndef FQDN_LABEL_LENGTH_63
#define FQDN_LABEL_LENGTH_63
#endif
#ifndef FQDN_NAME_LENGTH_255
#define FQDN_NAME_LENGTH_255
#endif
#ifndef FQDN_RESTRICTED_CHARSET
#define FQDN_RESTRICTED_CHARSET
#endif
#ifndef FQDN_TRAILING_DOT
#define FQDN_TRAILING_DOT
#endif
#ifndef FQDN_NO_EDGE_HYPHEN
#define FQDN_NO_EDGE_HYPHEN
#endif
#endif // FQDN_STRICT_RFC

namespace Rules {

#ifdef FQDN_LABEL_LENGTH_63
constexpr bool label_length_63 = true;
#else
constexpr bool label_length_63 = false;
#endif

#ifdef FQDN_NAME_LENGTH_255
constexpr bool name_length_255 = true;
#else
constexpr bool name_length_255 = false;
#endif

// RFC 1035 letters, digits and hyphen only; otherwise '_' is allowed too.
#ifdef FQDN_RESTRICTED_CHARSET
constexpr bool restricted_charset = true;
#else
constexpr bool restricted_charset = false;
#endif

#ifdef FQDN_TRAILING_DOT
constexpr bool trailing_dot = true;
#else
constexpr bool trailing_dot = false;
#endif

// RFC 952
#ifdef FQDN_NO_EDGE_HYPHEN
constexpr bool no_edge_hyphen = true;
#else
constexpr bool no_edge_hyphen = false;
#endif

constexpr bool strict = label_length_63 && name_length_255 &&
                        restricted_charset && trailing_dot && no_edge_hyphen;

// A label length has to fit in its length octet.
constexpr std::size_t max_label_length = label_length_63 ? 63 : 255;

// Includes the terminal zero octet.
constexpr std::size_t max_name_length = name_length_255 ? 255 : 65535;

} // namespace Rules

#endif // RULES_DOT_HPP
