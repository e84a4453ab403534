#ifndef FQDN_JSON_DOT_HPP
#define FQDN_JSON_DOT_HPP

#include "Fqdn.hpp"

#include <nlohmann/json_fwd.hpp>

// An Fqdn is written as its wire format, an array of octets:
// "foo.bar." is [3,102,111,111,3,98,97,114,0].  Either that or the
// text form is read back; both are validated, and a bad name throws
// std::system_error with an fqdn_errc code.

void to_json(nlohmann::json& j, Fqdn const& dom);
void from_json(nlohmann::json const& j, Fqdn& dom);

#endif // FQDN_JSON_DOT_HPP
