#include "Fqdn.hpp"

#include <initializer_list>
#include <iostream>
#include <set>
#include <string>
#include <unordered_set>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include <fmt/format.h>

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace {
std::string dotted(std::string str)
{
  if constexpr (Rules::trailing_dot) {
    str += '.';
  }
  return str;
}

void check_fails(std::string_view text, fqdn_errc expected)
{
  std::error_code ec;
  auto const      dom = Fqdn::parse(text, ec);
  CHECK(!dom) << "«" << text << "» parsed as " << *dom;
  CHECK_EQ(ec, make_error_code(expected)) << " for «" << text << "»";
}

void check_parses(std::string_view text)
{
  std::error_code ec;
  auto const      dom = Fqdn::parse(text, ec);
  CHECK(dom) << "«" << text << "» failed: " << ec.message();
}

// Either way, depending on how the library was built.
void check_rule(bool active, std::string_view text, fqdn_errc expected)
{
  if (active)
    check_fails(text, expected);
  else
    check_parses(text);
}

void check_wire_rule(bool active, std::string_view bytes, fqdn_errc expected)
{
  std::error_code ec;
  auto const      dom = Fqdn::from_wire(bytes, ec);
  if (active) {
    CHECK(!dom) << *dom;
    CHECK_EQ(ec, make_error_code(expected));
  }
  else {
    CHECK(dom) << ec.message();
    CHECK_EQ(dom->wire(), bytes);
  }
}

// Wire format with a label of 'a's for each length given.
std::string wire_of(std::initializer_list<std::size_t> lengths)
{
  std::string ret;
  for (auto len : lengths) {
    ret += static_cast<char>(len);
    ret.append(len, 'a');
  }
  ret += '\0';
  return ret;
}
} // namespace

int main(int argc, char* argv[])
{
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  std::error_code ec;

  // The root.

  Fqdn const root;
  CHECK(root.is_root());
  CHECK(!root.is_tld());
  CHECK_EQ(root.depth(), 0u);
  CHECK(!root.parent());
  CHECK(!root.tld());
  CHECK(root.hierarchy().empty());
  CHECK(root.labels().empty());
  CHECK_EQ(root.wire(), "\0"sv);
  CHECK_EQ(root.to_string(), "."s);
  CHECK_EQ(root.utf8(), "."s);
  CHECK_EQ(Fqdn{"."}, root);
  CHECK_EQ(Fqdn{""}, root);

  // Case and the trailing dot don't matter.

  Fqdn const d0{"Example.COM."};
  Fqdn const d1{"example.com."};
  Fqdn const d2{"EXAMPLE.com"};
  CHECK_EQ(d0, d1);
  CHECK_EQ(d1, d2);
  CHECK_EQ(std::hash<Fqdn>{}(d0), std::hash<Fqdn>{}(d1));
  CHECK_EQ(std::hash<Fqdn>{}(d1), std::hash<Fqdn>{}(d2));

  CHECK_EQ(d0.to_string(), dotted("Example.COM"));
  CHECK_EQ(d0.ascii(), dotted("example.com"));
  CHECK_EQ(fmt::format("{}", d2), dotted("EXAMPLE.com"));
  CHECK_EQ(d0.wire(), "\x07" "example" "\x03" "com" "\0"sv);

  // Parse what we print.

  for (auto text : {"www.Example.com.", "a.b.c", "rust-lang.github.io", "x"}) {
    Fqdn const dom{text};
    CHECK_EQ(Fqdn{dom.to_string()}, dom);
    CHECK_EQ(Fqdn{dom.ascii()}, dom);
    CHECK_EQ(Fqdn{dom.to_string()}.to_string(), dom.to_string());
  }

  // Separators.

  check_fails("github..com.", fqdn_errc::malformed_separators);
  check_fails(".github.com.", fqdn_errc::malformed_separators);
  check_fails("github.com..", fqdn_errc::malformed_separators);
  check_fails("..", fqdn_errc::malformed_separators);

  try {
    Fqdn const junk{"a..b"};
    LOG(FATAL) << "should have thrown";
  }
  catch (std::system_error const& ex) {
    CHECK(ex.code() == fqdn_errc::malformed_separators);
  }

  // Characters.

  check_fails("git@ub.com.", fqdn_errc::invalid_character);
  check_fails("git hub.com.", fqdn_errc::invalid_character);
  check_fails("git#hub.com.", fqdn_errc::invalid_character);
  check_rule(Rules::restricted_charset, "ab_c.com.",
             fqdn_errc::invalid_character);
  check_rule(Rules::restricted_charset, "_dmarc.example.com",
             fqdn_errc::invalid_character);
  check_parses("123.example.com.");

  // Hyphens.

  check_rule(Rules::no_edge_hyphen, "-abc.com.",
             fqdn_errc::invalid_hyphen_placement);
  check_rule(Rules::no_edge_hyphen, "abc-.com.",
             fqdn_errc::invalid_hyphen_placement);
  check_rule(Rules::no_edge_hyphen, "abc.-.com.",
             fqdn_errc::invalid_hyphen_placement);
  check_parses("a-b-c.com.");
  check_parses("xn--ab--c.com.");

  // Lengths.

  auto const l63 = std::string(63, 'a');
  auto const l64 = std::string(64, 'a');
  auto const l256 = std::string(256, 'a');

  check_parses(l63 + ".com.");
  check_rule(Rules::label_length_63, l64 + ".com.", fqdn_errc::label_too_long);
  check_fails(l256 + ".com.", fqdn_errc::label_too_long);

  auto const length_255 = fmt::format("{0}.{0}.{0}.{1}.", l63, std::string(61, 'a'));
  auto const length_256 = fmt::format("{0}.{0}.{0}.{1}.", l63, std::string(62, 'a'));

  check_parses(length_255);
  CHECK_EQ(Fqdn{length_255}.wire().size(), 255u);
  check_rule(Rules::name_length_255, length_256, fqdn_errc::name_too_long);

  // Same without the trailing dot.
  check_parses(length_255.substr(0, length_255.size() - 1));
  check_rule(Rules::name_length_255, length_256.substr(0, length_256.size() - 1),
             fqdn_errc::name_too_long);

  // Hierarchy.

  Fqdn const a{"rust-lang.github.com."};
  Fqdn const b{"GitHub.com."};
  Fqdn const com{"com"};

  CHECK(a.is_subdomain_of(a));
  CHECK(a.is_subdomain_of(b));
  CHECK(!b.is_subdomain_of(a));
  CHECK(a.is_subdomain_of(com));
  CHECK(a.is_subdomain_of(root));
  CHECK(root.is_subdomain_of(root));
  CHECK(!root.is_subdomain_of(com));

  CHECK(Fqdn{"www.example.com."}.is_subdomain_of(Fqdn{"example.com."}));
  CHECK(!Fqdn{"example.com."}.is_subdomain_of(Fqdn{"www.example.com."}));
  CHECK(!Fqdn{"wexample.com."}.is_subdomain_of(Fqdn{"example.com."}));
  CHECK(!Fqdn{"example.com."}.is_subdomain_of(Fqdn{"ample.com."}));
  CHECK(!Fqdn{"example.org."}.is_subdomain_of(com));

  CHECK_EQ(a.depth(), 3u);
  CHECK_EQ(b.depth(), 2u);
  CHECK(com.is_tld());
  CHECK(!b.is_tld());
  CHECK_EQ(*a.parent(), b);
  CHECK_EQ(*a.tld(), com);
  CHECK_EQ(*com.tld(), com);

  auto const hier = a.hierarchy();
  CHECK_EQ(hier.size(), 3u);
  CHECK_EQ(hier[0], a);
  CHECK_EQ(hier[1], b);
  CHECK_EQ(hier[2], com);

  // The parent keeps the original case.
  CHECK_EQ(b.parent()->to_string(), dotted("com"));
  CHECK_EQ(Fqdn{"WWW.Example.COM"}.parent()->to_string(), dotted("Example.COM"));

  // Walking up always ends at the root.
  for (auto text : {"a.b.c.d.e.f.", "x.", "www.example.com"}) {
    auto        dom = std::optional<Fqdn>{Fqdn{text}};
    auto const  depth = dom->depth();
    std::size_t steps = 0;
    while (!dom->is_root()) {
      dom = dom->parent();
      CHECK(dom);
      ++steps;
    }
    CHECK_EQ(steps, depth);
    CHECK(!dom->parent());
  }

  // Labels.

  Fqdn const www{"WWW.Example.com"};
  auto const lbls = www.labels();
  CHECK_EQ(lbls.size(), 3u);
  CHECK_EQ(lbls[0].text(), "WWW"sv);
  CHECK_EQ(lbls[0].to_lowercase_view(), "www"sv);
  CHECK_EQ(lbls[1].text(), "Example"sv);
  CHECK_EQ(lbls[2].to_lowercase_view(), "com"sv);
  CHECK_EQ(lbls[1].size(), 7u);
  CHECK(!lbls[1].is_a_label());
  CHECK(www.label(0) == Fqdn{"www.org"}.label(0));
  CHECK(www.label(1) != www.label(2));
  CHECK_EQ(www.label(2)->text(), "com"sv);
  CHECK(!www.label(3));
  CHECK(!root.label(0));

  // Builder.

  auto const built = Fqdn::from_labels({"rust-lang", "GitHub", "com"}, ec);
  CHECK(built);
  CHECK_EQ(*built, a);
  CHECK_EQ(built->to_string(), dotted("rust-lang.GitHub.com"));
  CHECK(*Fqdn::from_labels({}, ec) == root);

  ec.clear();
  CHECK(!Fqdn::from_labels({"a", ""}, ec));
  CHECK(ec == fqdn_errc::empty_label);

  ec.clear();
  CHECK(!Fqdn::from_labels({"a.b"}, ec));
  CHECK(ec == fqdn_errc::invalid_character);

  // Wire format.

  auto const github = Fqdn::from_wire("\x06" "GitHUB" "\x03" "com" "\0"sv, ec);
  CHECK(github);
  CHECK_EQ(*github, Fqdn{"github.com."});
  CHECK_EQ(github->wire(), "\x06" "github" "\x03" "com" "\0"sv);
  CHECK_EQ(github->to_string(), dotted("GitHUB.com"));
  CHECK(*Fqdn::from_wire("\x01" "a" "\x02" "fr" "\0"sv, ec) == Fqdn{"a.fr"});
  CHECK(*Fqdn::from_wire("\0"sv, ec) == root);
  CHECK(*Fqdn::from_wire(a.wire(), ec) == a);

  ec.clear();
  CHECK(!Fqdn::from_wire("\x06" "github" "\x03" "com"sv, ec));
  CHECK(ec == fqdn_errc::trailing_nul_missing);

  ec.clear();
  CHECK(!Fqdn::from_wire(""sv, ec));
  CHECK(ec == fqdn_errc::trailing_nul_missing);

  ec.clear();
  CHECK(!Fqdn::from_wire("\x06" "g|thub" "\x03" "com" "\0"sv, ec));
  CHECK(ec == fqdn_errc::invalid_character);

  ec.clear();
  CHECK(!Fqdn::from_wire("\x07" "github" "\0"sv, ec));
  CHECK(ec == fqdn_errc::invalid_structure);

  ec.clear();
  CHECK(!Fqdn::from_wire("\x01" "a" "\0" "\x01" "b" "\0"sv, ec));
  CHECK(ec == fqdn_errc::invalid_structure);

  auto const wire_255 = wire_of({63, 63, 63, 61});
  CHECK_EQ(wire_255.size(), 255u);
  CHECK(*Fqdn::from_wire(wire_255, ec) == Fqdn{length_255});
  check_wire_rule(Rules::name_length_255, wire_of({63, 63, 63, 62}),
                  fqdn_errc::name_too_long);
  check_wire_rule(Rules::label_length_63, wire_of({64, 3}),
                  fqdn_errc::label_too_long);

  ec.clear();
  auto const hyphen = Fqdn::from_wire("\x05" "-yeah" "\x03" "com" "\0"sv, ec);
  CHECK_EQ(!hyphen, Rules::no_edge_hyphen);

  // A moved from name is the root.

  Fqdn moved{"www.example.com"};
  Fqdn taken{std::move(moved)};
  CHECK_EQ(taken, Fqdn{"www.example.com."});
  CHECK(moved.is_root());
  CHECK_EQ(moved, root);
  CHECK_EQ(moved.wire(), "\0"sv);
  CHECK_EQ(moved.to_string(), "."s);
  CHECK(!moved.parent());

  Fqdn assigned{"a.b"};
  assigned = std::move(taken);
  CHECK_EQ(assigned, Fqdn{"www.example.com"});
  CHECK_EQ(assigned.to_string(), dotted("www.example.com"));
  CHECK(taken.is_root());
  CHECK_EQ(taken.depth(), 0u);
  CHECK(!taken.tld());
  CHECK_EQ(taken.ascii(), "."s);

  moved = Fqdn{"c.d"};
  CHECK_EQ(moved.depth(), 2u);

  // Ordering agrees with equality.

  CHECK_LT(Fqdn{"a.github.com."}, Fqdn{"aa.GitHub.com."});
  CHECK_GT(Fqdn{"ab.github.com."}, Fqdn{"aa.github.com."});
  CHECK_GT(Fqdn{"ab.GitHub.com."}, Fqdn{"aa.github.co."});

  auto const items = {"github.com.", "a.Github.com.", "a.GitHub.com.",
                      "a.github.com.", "aa.github.com."};
  std::set<Fqdn>           ordered;
  std::unordered_set<Fqdn> unordered;
  for (auto text : items) {
    ordered.emplace(text);
    unordered.emplace(text);
  }
  CHECK_EQ(ordered.size(), 3u);
  CHECK_EQ(unordered.size(), 3u);

  // Internationalized names.

  Fqdn const kurokawa{"黒川.日本"};
  CHECK_EQ(kurokawa, Fqdn{"xn--5rtw95l.xn--wgv71a"});
  CHECK_EQ(kurokawa.ascii(), dotted("xn--5rtw95l.xn--wgv71a"));
  CHECK_EQ(kurokawa.utf8(), dotted("黒川.日本"));
  CHECK(kurokawa.label(0)->is_a_label());
  CHECK_EQ(kurokawa.label(1)->utf8(), "日本"s);

  Fqdn const academie{"www.académie-française.fr"};
  CHECK_EQ(academie.ascii(), dotted("www.xn--acadmie-franaise-npb1a.fr"));
  CHECK_EQ(academie.utf8(), dotted("www.académie-française.fr"));
  CHECK(academie.is_subdomain_of(Fqdn{"fr"}));

  check_fails("\xff.com.", fqdn_errc::codec_failure);
  check_fails("hi⒌com", fqdn_errc::codec_failure);

  // Errors.

  auto const code = make_error_code(fqdn_errc::name_too_long);
  CHECK_EQ(code.category().name(), "fqdn"s);
  CHECK_EQ(code.message(), "domain name too long"s);

  for (auto arg = 1; arg < argc; ++arg) {
    auto const dom = Fqdn::parse(argv[arg], ec);
    if (dom)
      std::cout << *dom << " " << dom->utf8() << '\n';
    else
      std::cout << argv[arg] << ": " << ec.message() << '\n';
  }
}
