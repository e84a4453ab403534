#include "Label.hpp"

#include "Fqdn-error.hpp"

#include <string>

#include <gflags/gflags.h>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {
void check_label_fails(std::string_view text, fqdn_errc expected)
{
  std::error_code ec;
  CHECK(!label::parse(text, ec)) << "«" << text << "» accepted";
  CHECK_EQ(ec, make_error_code(expected)) << " for «" << text << "»";
}
} // namespace

int main(int argc, char* argv[])
{
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  std::error_code ec;

  CHECK(label::is_ascii("example"));
  CHECK(!label::is_ascii("académie"));

  CHECK_EQ(label::to_lower('A'), 'a');
  CHECK_EQ(label::to_lower('z'), 'z');
  CHECK_EQ(label::to_lower('-'), '-');
  CHECK_EQ(label::to_lower('\xc9'), '\xc9');

  CHECK(label::is_valid_char('a'));
  CHECK(label::is_valid_char('Z'));
  CHECK(label::is_valid_char('7'));
  CHECK(label::is_valid_char('-'));
  CHECK(!label::is_valid_char('.'));
  CHECK(!label::is_valid_char('@'));
  CHECK(!label::is_valid_char('\0'));
  CHECK_EQ(label::is_valid_char('_'), !Rules::restricted_charset);

  // Case is kept, it's the Fqdn that folds it.
  CHECK_EQ(*label::parse("GitHub", ec), "GitHub"s);
  CHECK_EQ(*label::parse("123", ec), "123"s);
  CHECK_EQ(*label::parse("a", ec), "a"s);

  check_label_fails("", fqdn_errc::empty_label);
  check_label_fails("a.b", fqdn_errc::invalid_character);
  check_label_fails("a b", fqdn_errc::invalid_character);
  check_label_fails(std::string(256, 'x'), fqdn_errc::label_too_long);

  CHECK(label::check(std::string(63, 'x'), ec));
  CHECK_EQ(label::check(std::string(64, 'x'), ec), !Rules::label_length_63);

  if constexpr (Rules::no_edge_hyphen) {
    check_label_fails("-abc", fqdn_errc::invalid_hyphen_placement);
    check_label_fails("abc-", fqdn_errc::invalid_hyphen_placement);
    check_label_fails("-", fqdn_errc::invalid_hyphen_placement);
  }
  CHECK(label::check("a-b", ec));
  CHECK(label::check("a--b", ec));

  // Non-ASCII goes through IDN and comes back as an A-label.
  CHECK_EQ(*label::parse("académie-française", ec),
           "xn--acadmie-franaise-npb1a"s);
  CHECK_EQ(*label::parse("黒川", ec), "xn--5rtw95l"s);
  check_label_fails("\xc3", fqdn_errc::codec_failure);
}
