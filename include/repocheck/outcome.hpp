#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace repocheck {

// One immediate subdirectory of the scanned root, fixed at listing time.
struct Candidate {
  std::size_t index;          // position in the captured listing
  std::string name;           // entry name (no '/')
  std::filesystem::path path; // root / name
};

enum class HeadState : std::uint8_t { Branch, Detached, Unborn };

struct RepoStatus {
  std::string branch;
  bool dirty{false};
  HeadState head{HeadState::Branch};
};

struct NotARepo {};

struct Failed {
  std::string reason;
};

using Outcome = std::variant<RepoStatus, NotARepo, Failed>;

// Outcome is empty only in a partial snapshot taken after cancellation.
struct ResultRecord {
  Candidate candidate;
  std::optional<Outcome> outcome;
};

} // namespace repocheck
