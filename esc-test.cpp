#include "esc.hpp"

#include <iostream>
#include <string>

#include <gflags/gflags.h>

#include <glog/logging.h>

using namespace std::string_literals;

int main(int argc, char* argv[])
{
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  auto const s0 = "no-characters_to.escape";
  CHECK_EQ(esc(s0, esc_dot_option::keep), s0);
  CHECK_EQ(esc(s0), "no-characters_to\\.escape"s);

  CHECK_EQ(esc("a\\b"), "a\\\\b"s);
  CHECK_EQ(esc("tab\there"), "tab\\009here"s);
  CHECK_EQ(esc("sp ace"), "sp\\032ace"s);
  CHECK_EQ(esc("\xc3\xa9"), "\\195\\169"s);
  CHECK_EQ(esc(std::string_view("nul\0", 4)), "nul\\000"s);
  CHECK_EQ(esc("\x7f"), "\\127"s);
  CHECK_EQ(esc(""), ""s);

  for (auto arg = 1; arg < argc; ++arg) {
    std::cout << esc(argv[arg], esc_dot_option::keep) << '\n';
  }
}
