#include "IDN.hpp"

#include "Fqdn-error.hpp"

#include <iostream>
#include <string>

#include <gflags/gflags.h>

#include <glog/logging.h>

using namespace std::string_literals;

int main(int argc, char* argv[])
{
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  std::error_code ec;

  CHECK(IDN::is_utf8("plain ascii"));
  CHECK(IDN::is_utf8("黒川"));
  CHECK(IDN::is_utf8(""));
  CHECK(!IDN::is_utf8("\xff"));
  CHECK(!IDN::is_utf8("\xc3"));         // truncated
  CHECK(!IDN::is_utf8("\xc0\xaf"));     // overlong
  CHECK(!IDN::is_utf8("\xed\xa0\x80")); // surrogate

  CHECK_EQ(*IDN::nfkc("ｆｕｌｌ"), "full"s);
  CHECK_EQ(*IDN::nfkc("hi⒌com"), "hi5.com"s);

  CHECK_EQ(*IDN::encode("黒川", ec), "xn--5rtw95l"s);
  CHECK_EQ(*IDN::encode("日本", ec), "xn--wgv71a"s);
  CHECK_EQ(*IDN::encode("académie-française", ec),
           "xn--acadmie-franaise-npb1a"s);

  CHECK_EQ(*IDN::decode("xn--5rtw95l", ec), "黒川"s);
  CHECK_EQ(*IDN::decode("xn--wgv71a", ec), "日本"s);

  for (auto u_label : {"黒川", "日本", "académie-française", "bücher"}) {
    auto const a_label = IDN::encode(u_label, ec);
    CHECK(a_label) << u_label << ": " << ec.message();
    CHECK_EQ(a_label->substr(0, 4), IDN::ace_prefix);
    CHECK_EQ(*IDN::decode(*a_label, ec), u_label);
  }

  ec.clear();
  CHECK(!IDN::encode("\xff", ec));
  CHECK(ec == fqdn_errc::codec_failure);

  // NFKC makes two labels of this one.
  ec.clear();
  CHECK(!IDN::encode("hi⒌com", ec));
  CHECK(ec == fqdn_errc::codec_failure);

  ec.clear();
  CHECK(!IDN::decode("\xff", ec));
  CHECK(ec == fqdn_errc::codec_failure);

  for (auto arg = 1; arg < argc; ++arg) {
    auto const a_label = IDN::encode(argv[arg], ec);
    if (a_label)
      std::cout << argv[arg] << " " << *a_label << '\n';
    else
      std::cout << argv[arg] << ": " << ec.message() << '\n';
  }
}
