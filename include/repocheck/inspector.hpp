#pragma once
#include "repocheck/consts.hpp"
#include "repocheck/outcome.hpp"
#include "repocheck/process.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace repocheck {

// Classifies one candidate. Must be safe to call concurrently for different
// candidates; the scheduler converts anything it throws into Failed.
using inspect_fn = std::function<Outcome(const Candidate &)>;

struct InspectorOptions {
  std::string git_executable{consts::kGitExecutable};
  std::chrono::milliseconds timeout{consts::kDefaultTimeout}; // per git call
  bool count_untracked{true}; // untracked files make a repo dirty
};

class GitInspector {
public:
  explicit GitInspector(InspectorOptions options = {});

  [[nodiscard]] auto options() const -> const InspectorOptions & { return options_; }

  // Never throws: every failure is reported as Failed{reason}.
  [[nodiscard]] auto inspect(const Candidate &candidate) const -> Outcome;
  auto operator()(const Candidate &candidate) const -> Outcome { return inspect(candidate); }

private:
  [[nodiscard]] auto git(const std::filesystem::path &dir,
                         const std::vector<std::string> &args) const -> ProcessResult;
  [[nodiscard]] auto classify(const Candidate &candidate) const -> Outcome;

  InspectorOptions options_;
};

// Run `git --version` once. Returns the reason git is unusable, or nullopt.
auto check_git_available(const InspectorOptions &options) -> std::optional<std::string>;

// Short human-readable reason for a failed process run.
auto describe_failure(const ProcessResult &res, std::string_view program) -> std::string;

} // namespace repocheck
