#include "Fqdn-json.hpp"

#include <iostream>
#include <string>
#include <string_view>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include <nlohmann/json.hpp>

using namespace std::string_literals;
using json = nlohmann::json;

namespace {
void check_rejected(std::string_view text, fqdn_errc expected)
{
  auto const j = json::parse(text);
  try {
    auto const dom = j.get<Fqdn>();
    LOG(FATAL) << text << " read as " << dom;
  }
  catch (std::system_error const& ex) {
    CHECK(ex.code() == expected) << text << ": " << ex.what();
  }
}
} // namespace

int main(int argc, char* argv[])
{
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  Fqdn const foo_bar{"foo.bar"};
  json const j = foo_bar;
  CHECK(j.is_array());
  CHECK_EQ(j.dump(), "[3,102,111,111,3,98,97,114,0]"s);
  CHECK_EQ(j.get<Fqdn>(), foo_bar);

  CHECK_EQ(json(Fqdn{}).dump(), "[0]"s);
  CHECK_EQ(json::parse("[0]").get<Fqdn>(), Fqdn{});

  for (auto text : {"www.Example.COM.", "rust-lang.github.io", "黒川.日本", "."}) {
    Fqdn const dom{text};
    auto const back = json::parse(json(dom).dump()).get<Fqdn>();
    CHECK_EQ(back, dom);
    CHECK_EQ(back.wire(), dom.wire());
  }

  // The text form is read too.
  CHECK_EQ(json::parse(R"("GitHub.com.")").get<Fqdn>(), Fqdn{"github.com"});

  // Inside a larger document.
  auto const doc = json::parse(R"({"zone": [7,101,120,97,109,112,108,101,0]})");
  CHECK_EQ(doc.at("zone").get<Fqdn>(), Fqdn{"example"});

  // Read names are validated like any other.
  check_rejected("[3,102,111,111]", fqdn_errc::trailing_nul_missing);
  check_rejected("[4,102,111,111,0]", fqdn_errc::invalid_structure);
  check_rejected("[3,102,300,111,0]", fqdn_errc::invalid_structure);
  check_rejected("[3,102,64,111,0]", fqdn_errc::invalid_character);
  check_rejected(R"("a..b")", fqdn_errc::malformed_separators);
  check_rejected(R"("a b.com")", fqdn_errc::invalid_character);

  try {
    auto const dom = json(42).get<Fqdn>();
    LOG(FATAL) << "42 read as " << dom;
  }
  catch (json::type_error const& ex) {
    LOG(INFO) << ex.what();
  }

  for (auto arg = 1; arg < argc; ++arg) {
    std::error_code ec;
    auto const      dom = Fqdn::parse(argv[arg], ec);
    if (dom)
      std::cout << json(*dom).dump() << '\n';
    else
      std::cout << argv[arg] << ": " << ec.message() << '\n';
  }
}
