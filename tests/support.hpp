#pragma once
// Helpers shared by the tests that build real directory trees.
#include "repocheck/process.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// Exit code CTest reports as a skipped test (SKIP_RETURN_CODE).
inline constexpr int kSkipped = 77;

inline fs::path make_temp_root(std::string_view tag) {
  const fs::path root = fs::temp_directory_path() /
                        ("repocheck_" + std::string(tag) + "_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);
  return root;
}

inline void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

inline bool git_installed() {
  try {
    return repocheck::run_process({"git", "--version"}, std::chrono::seconds(10)).ok();
  } catch (const std::exception &) {
    return false;
  }
}

// Run git in `dir` with a fixed identity; throws on failure.
inline void git_in(const fs::path &dir, const std::vector<std::string> &args) {
  std::vector<std::string> argv{"git",           "-C", dir.string(), "-c", "user.name=Test User",
                                "-c",            "user.email=test@example.com",
                                "-c",            "commit.gpgsign=false"};
  argv.insert(argv.end(), args.begin(), args.end());
  const auto res = repocheck::run_process(argv, std::chrono::seconds(30));
  if (!res.ok())
    throw std::runtime_error("git " + args.front() + " failed in " + dir.string() + ": " + res.err);
}

// A repository on branch "main" with one commit containing README.
inline void make_repo(const fs::path &dir) {
  fs::create_directories(dir);
  git_in(dir, {"init", "-q"});
  git_in(dir, {"symbolic-ref", "HEAD", "refs/heads/main"});
  write_file(dir / "README", "hello\n");
  git_in(dir, {"add", "README"});
  git_in(dir, {"commit", "-q", "-m", "initial"});
}

inline void make_executable_script(const fs::path &p, std::string_view body) {
  write_file(p, body);
  fs::permissions(p, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                         fs::perms::others_read | fs::perms::others_exec);
}
