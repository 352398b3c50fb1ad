#pragma once
#include "repocheck/consts.hpp"

#include <chrono>
#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>

namespace repocheck::cli {

class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct Options {
  std::string path;              // empty = current directory
  bool include_hidden{false};
  bool no_color{false};
  std::size_t max_workers{0};    // 0 = available processing units
  std::chrono::milliseconds timeout{consts::kDefaultTimeout};
  bool ignore_untracked{false};
  std::string git{consts::kGitExecutable};
  bool help{false};
};

// Accepts "--flag value" and "--flag=value". Throws UsageError.
auto parse_options(int argc, char **argv) -> Options;

void print_usage(std::ostream &out);

} // namespace repocheck::cli
