#include "repocheck/inspector.hpp"

#include <cerrno>
#include <exception>
#include <system_error>
#include <utility>

namespace stdfs = std::filesystem;

namespace {

void rstrip_newlines(std::string &s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r'))
    s.pop_back();
}

std::string first_line(std::string_view sv) {
  const auto nl = sv.find('\n');
  std::string line(sv.substr(0, nl));
  rstrip_newlines(line);
  return line;
}

// Compare after resolving symlinks, so /tmp -> /private/tmp style aliases and
// trailing separators do not matter.
bool same_directory(const stdfs::path &a, const stdfs::path &b) {
  std::error_code ec;
  if (stdfs::equivalent(a, b, ec))
    return true;
  const auto ca = stdfs::weakly_canonical(a, ec);
  if (ec)
    return false;
  const auto cb = stdfs::weakly_canonical(b, ec);
  if (ec)
    return false;
  return ca == cb;
}

} // namespace

namespace repocheck {

GitInspector::GitInspector(InspectorOptions options) : options_{std::move(options)} {}

auto GitInspector::git(const stdfs::path &dir, const std::vector<std::string> &args) const
    -> ProcessResult {
  std::vector<std::string> argv{options_.git_executable, "--no-optional-locks", "-C",
                                dir.string()};
  argv.insert(argv.end(), args.begin(), args.end());
  // Untranslated messages: classification matches on git's stderr text
  static const std::vector<EnvOverride> env{{.name = "LC_ALL", .value = "C"},
                                            {.name = "LANGUAGE", .value = std::nullopt},
                                            {.name = "LC_MESSAGES", .value = std::nullopt}};
  return run_process(argv, options_.timeout, env);
}

auto GitInspector::inspect(const Candidate &candidate) const -> Outcome {
  try {
    return classify(candidate);
  } catch (const std::exception &e) {
    return Failed{.reason = e.what()};
  }
}

auto GitInspector::classify(const Candidate &candidate) const -> Outcome {
  const auto &program = options_.git_executable;

  // 1) Under git at all? A .git directory or bare repository has no work
  // tree to be clean or dirty.
  auto where = git(candidate.path, {"rev-parse", "--is-inside-git-dir", "--is-bare-repository"});
  if (!where.ok()) {
    if (!where.timed_out && !where.exec_failed && where.term_signal == 0 &&
        where.err.find(consts::kNotARepoMarker) != std::string::npos)
      return NotARepo{};
    return Failed{.reason = describe_failure(where, program)};
  }
  if (where.out.find("true") != std::string::npos)
    return NotARepo{};

  // 2) Is the candidate itself the top level of a work tree?
  auto top = git(candidate.path, {"rev-parse", "--show-toplevel"});
  if (!top.ok())
    return Failed{.reason = describe_failure(top, program)};
  rstrip_newlines(top.out);
  if (top.out.empty() || !same_directory(top.out, candidate.path))
    return NotARepo{}; // a plain folder inside an enclosing work tree

  // 3) Current branch
  RepoStatus st;
  auto head = git(candidate.path, {"rev-parse", "--abbrev-ref", "HEAD"});
  if (head.ok()) {
    rstrip_newlines(head.out);
    if (head.out == consts::kDetachedHead) {
      st.head = HeadState::Detached;
    } else {
      st.branch = std::move(head.out);
    }
  } else if (head.timed_out || head.exec_failed) {
    return Failed{.reason = describe_failure(head, program)};
  } else {
    // No commits yet: HEAD still names a branch
    auto sym = git(candidate.path, {"symbolic-ref", "--short", "HEAD"});
    if (!sym.ok())
      return Failed{.reason = describe_failure(sym, program)};
    rstrip_newlines(sym.out);
    st.branch = std::move(sym.out);
    st.head = HeadState::Unborn;
  }

  // 4) Working tree changes
  std::vector<std::string> status_args{"status", "--porcelain"};
  if (!options_.count_untracked)
    status_args.emplace_back("--untracked-files=no");
  const auto status = git(candidate.path, status_args);
  if (!status.ok())
    return Failed{.reason = describe_failure(status, program)};
  st.dirty = status.out.find_first_not_of(" \t\r\n") != std::string::npos;
  return st;
}

auto describe_failure(const ProcessResult &res, std::string_view program) -> std::string {
  if (res.timed_out)
    return std::string(consts::kLabelTimeout);
  if (res.exec_failed) {
    if (res.exec_errno == ENOENT)
      return std::string(program) + " not found";
    return "cannot run " + std::string(program) + ": " + std::generic_category().message(res.exec_errno);
  }
  if (res.term_signal != 0)
    return "killed by signal " + std::to_string(res.term_signal);
  std::string msg = first_line(res.err);
  if (msg.empty())
    msg = std::string(program) + " exited with status " + std::to_string(res.exit_code);
  return msg;
}

auto check_git_available(const InspectorOptions &options) -> std::optional<std::string> {
  try {
    const auto res = run_process({options.git_executable, "--version"}, options.timeout);
    if (res.ok())
      return std::nullopt;
    return describe_failure(res, options.git_executable);
  } catch (const std::system_error &e) {
    return std::string(e.what());
  }
}

} // namespace repocheck
