#include "IDN.hpp"

#include "Fqdn-error.hpp"
#include "esc.hpp"

#include <cstdlib>
#include <memory>

#include <idn2.h>
#include <uninorm.h>

#include <glog/logging.h>

#include <tao/pegtl.hpp>

using namespace tao::pegtl;

namespace RFC3629 {
// clang-format off

// 4.  Syntax of UTF-8 Byte Sequences

struct UTF8_tail : range<'\x80', '\xBF'> {};

struct UTF8_1 : range<0x00, 0x7F> {};

struct UTF8_2 : seq<range<'\xC2', '\xDF'>, UTF8_tail> {};

struct UTF8_3 : sor<seq<one<'\xE0'>, range<'\xA0', '\xBF'>, UTF8_tail>,
                    seq<range<'\xE1', '\xEC'>, rep<2, UTF8_tail>>,
                    seq<one<'\xED'>, range<'\x80', '\x9F'>, UTF8_tail>,
                    seq<range<'\xEE', '\xEF'>, rep<2, UTF8_tail>>> {};

struct UTF8_4 : sor<seq<one<'\xF0'>, range<'\x90', '\xBF'>, rep<2, UTF8_tail>>,
                    seq<range<'\xF1', '\xF3'>, rep<3, UTF8_tail>>,
                    seq<one<'\xF4'>, range<'\x80', '\x8F'>, rep<2, UTF8_tail>>> {};

struct UTF8_char : sor<UTF8_1, UTF8_2, UTF8_3, UTF8_4> {};

struct UTF8_string : seq<star<UTF8_char>, eof> {};

// clang-format on
} // namespace RFC3629

namespace {
struct idn2_deleter {
  void operator()(char* p) const { idn2_free(p); }
};
using idn2_ptr = std::unique_ptr<char, idn2_deleter>;

struct free_deleter {
  void operator()(uint8_t* p) const { std::free(p); }
};
} // namespace

namespace IDN {

bool is_utf8(std::string_view str)
{
  auto in{memory_input<>(str.data(), str.size(), "label")};
  return tao::pegtl::parse<RFC3629::UTF8_string>(in);
}

std::optional<std::string> nfkc(std::string_view str)
{
  auto const udata = reinterpret_cast<uint8_t const*>(str.data());
  size_t     length = 0;
  std::unique_ptr<uint8_t, free_deleter> norm{
      u8_normalize(UNINORM_NFKC, udata, str.size(), nullptr, &length)};
  if (!norm) {
    PLOG(WARNING) << "u8_normalize failed for «" << esc(str) << "»";
    return {};
  }
  return std::string{reinterpret_cast<char const*>(norm.get()), length};
}

std::optional<std::string> encode(std::string_view u_label, std::error_code& ec)
{
  if (!is_utf8(u_label)) {
    LOG(WARNING) << "malformed UTF-8 in label «" << esc(u_label) << "»";
    ec = fqdn_errc::codec_failure;
    return {};
  }

  auto const norm = nfkc(u_label);
  if (!norm) {
    ec = fqdn_errc::codec_failure;
    return {};
  }

  // idn2_to_ascii_8z() converts (ASCII) to lower case

  char* ptr  = nullptr;
  auto  code = idn2_to_ascii_8z(norm->c_str(), &ptr, IDN2_NONTRANSITIONAL);
  idn2_ptr const ascii{ptr};
  if (code != IDN2_OK) {
    LOG(WARNING) << "can't encode label «" << u_label
                 << "»: " << idn2_strerror(code);
    ec = fqdn_errc::codec_failure;
    return {};
  }

  std::string ret{ascii.get()};

  // NFKC can turn one label into two, as in "hi⒌com".
  if (ret.empty() || ret.find('.') != std::string::npos) {
    LOG(WARNING) << "label «" << u_label << "» encodes to «" << ret << "»";
    ec = fqdn_errc::codec_failure;
    return {};
  }

  return ret;
}

std::optional<std::string> decode(std::string_view a_label, std::error_code& ec)
{
  std::string const label{a_label};

  char* ptr  = nullptr;
  auto  code = idn2_to_unicode_8z8z(label.c_str(), &ptr, IDN2_NONTRANSITIONAL);
  idn2_ptr const utf8{ptr};
  if (code != IDN2_OK) {
    LOG(WARNING) << "can't decode label «" << esc(a_label)
                 << "»: " << idn2_strerror(code);
    ec = fqdn_errc::codec_failure;
    return {};
  }

  return std::string{utf8.get()};
}

} // namespace IDN
