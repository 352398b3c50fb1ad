#include "cli/options.hpp"

#include <charconv>
#include <cmath>
#include <optional>
#include <string_view>
#include <system_error>

namespace repocheck::cli {

namespace {

auto parse_count(std::string_view flag, std::string_view v) -> std::size_t {
  std::size_t n = 0;
  const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
  if (ec != std::errc{} || ptr != v.data() + v.size() || n == 0)
    throw UsageError(std::string(flag) + " expects a positive integer, got '" + std::string(v) +
                     "'");
  return n;
}

auto parse_seconds(std::string_view flag, std::string_view v) -> std::chrono::milliseconds {
  double secs = 0;
  try {
    std::size_t used = 0;
    secs = std::stod(std::string(v), &used);
    if (used != v.size())
      throw std::invalid_argument("trailing characters");
  } catch (const std::exception &) {
    throw UsageError(std::string(flag) + " expects a number of seconds, got '" + std::string(v) +
                     "'");
  }
  if (!std::isfinite(secs) || secs <= 0)
    throw UsageError(std::string(flag) + " must be greater than zero");
  constexpr auto max_secs = std::chrono::duration<double>(consts::kMaxTimeout).count();
  if (secs > max_secs)
    throw UsageError(std::string(flag) + " must be at most " +
                     std::to_string(static_cast<long long>(max_secs)) + " seconds");
  return std::chrono::milliseconds{static_cast<long long>(std::ceil(secs * 1000.0))};
}

} // namespace

auto parse_options(int argc, char **argv) -> Options {
  Options opts;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg{argv[i]};
    std::optional<std::string_view> inline_value;
    if (const auto eq = arg.find('='); arg.rfind("--", 0) == 0 && eq != std::string_view::npos) {
      inline_value = arg.substr(eq + 1);
      arg = arg.substr(0, eq);
    }

    auto value = [&]() -> std::string_view {
      if (inline_value)
        return *inline_value;
      if (i + 1 >= argc)
        throw UsageError(std::string(arg) + " requires a value");
      return argv[++i];
    };
    auto no_value = [&] {
      if (inline_value)
        throw UsageError(std::string(arg) + " does not take a value");
    };

    if (arg == "--path") {
      opts.path = std::string(value());
    } else if (arg == "--include-hidden") {
      no_value();
      opts.include_hidden = true;
    } else if (arg == "--no-color") {
      no_value();
      opts.no_color = true;
    } else if (arg == "--max-workers") {
      opts.max_workers = parse_count(arg, value());
    } else if (arg == "--timeout") {
      opts.timeout = parse_seconds(arg, value());
    } else if (arg == "--ignore-untracked") {
      no_value();
      opts.ignore_untracked = true;
    } else if (arg == "--git") {
      opts.git = std::string(value());
      if (opts.git.empty())
        throw UsageError("--git requires a non-empty value");
    } else if (arg == "-h" || arg == "--help") {
      opts.help = true;
    } else {
      throw UsageError("unknown argument: " + std::string(arg));
    }
  }
  return opts;
}

void print_usage(std::ostream &out) {
  out << "usage: repocheck [--path <dir>] [--include-hidden] [--no-color]\n"
         "                 [--max-workers <n>] [--timeout <seconds>]\n"
         "                 [--ignore-untracked] [--git <exe>]\n\n"
         "Check immediate subfolders for Git status (branch + clean/dirty).\n\n"
         "options:\n"
         "  --path <dir>         directory to scan (default: current directory)\n"
         "  --include-hidden     include subfolders starting with a dot\n"
         "  --no-color           disable ANSI colors and live redraw\n"
         "  --max-workers <n>    parallel git checks (default: CPU count)\n"
         "  --timeout <seconds>  limit for each git call (default: 10, max: 86400)\n"
         "  --ignore-untracked   untracked files do not make a repo dirty\n"
         "  --git <exe>          git executable (default: git on PATH)\n";
}

} // namespace repocheck::cli
