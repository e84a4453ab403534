#include "Fqdn-json.hpp"

#include "esc.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <fmt/format.h>

void to_json(nlohmann::json& j, Fqdn const& dom)
{
  auto const wire = dom.wire();
  j = std::vector<std::uint8_t>(begin(wire), end(wire));
}

void from_json(nlohmann::json const& j, Fqdn& dom)
{
  std::error_code     ec;
  std::optional<Fqdn> parsed;
  std::string         input;

  if (j.is_string()) {
    input = j.get<std::string>();
    parsed = Fqdn::parse(input, ec);
  }
  else {
    // type_error if this isn't an array of numbers
    for (auto const octet : j.get<std::vector<unsigned>>()) {
      if (octet > 0xff) {
        throw std::system_error(make_error_code(fqdn_errc::invalid_structure),
                                fmt::format("octet {} in {}", octet, j.dump()));
      }
      input += static_cast<char>(octet);
    }
    parsed = Fqdn::from_wire(input, ec);
  }

  if (!parsed) {
    auto const opt = j.is_string() ? esc_dot_option::keep : esc_dot_option::quote;
    throw std::system_error(ec, fmt::format("«{}»", esc(input, opt)));
  }

  dom = std::move(*parsed);
}
