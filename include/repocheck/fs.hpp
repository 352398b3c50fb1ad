#pragma once
#include "repocheck/outcome.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace repocheck {

// Root path missing, not a directory, or unreadable. Fatal for the whole run.
class ScanError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

namespace fs {

// List the immediate child directories of `root`, sorted by case-insensitive
// name. Hidden entries ('.' prefix) are skipped unless include_hidden is set.
// Symlinks are not followed. Throws ScanError.
auto list_candidates(const std::filesystem::path &root, bool include_hidden)
    -> std::vector<Candidate>;

[[nodiscard]] auto is_hidden(std::string_view name) -> bool;

// Expand a leading "~" and make the path absolute (lexically normalized).
auto resolve_root(const std::string &arg) -> std::filesystem::path;

} // namespace fs
} // namespace repocheck
