#pragma once
#include <chrono>
#include <string_view>

namespace repocheck::consts {

// ——— Directory listing ———
inline constexpr char kHiddenPrefix = '.';

// ——— External command ———
inline constexpr std::string_view kGitExecutable = "git";
inline constexpr std::chrono::milliseconds kDefaultTimeout{10'000};
inline constexpr std::chrono::hours kMaxTimeout{24};
inline constexpr std::string_view kNotARepoMarker = "not a git repository";
inline constexpr std::string_view kDetachedHead = "HEAD";

// ——— Worker pool ———
inline constexpr unsigned kFallbackWorkers = 4; // when hardware_concurrency() is unknown

// ——— Labels ———
inline constexpr std::string_view kLabelClean     = "clean";
inline constexpr std::string_view kLabelDirty     = "dirty";
inline constexpr std::string_view kLabelNotRepo   = "not a git repo";
inline constexpr std::string_view kLabelPending   = "pending";
inline constexpr std::string_view kLabelDetached  = "detached";
inline constexpr std::string_view kLabelNoCommits = "(no commits)";
inline constexpr std::string_view kLabelError     = "error: ";
inline constexpr std::string_view kLabelTimeout   = "timeout";
inline constexpr std::string_view kSeparator      = "  ";

// ——— ANSI escapes ———
inline constexpr std::string_view kAnsiReset   = "\x1b[0m";
inline constexpr std::string_view kAnsiRed     = "\x1b[31m";
inline constexpr std::string_view kAnsiGreen   = "\x1b[32m";
inline constexpr std::string_view kAnsiYellow  = "\x1b[33m";
inline constexpr std::string_view kAnsiBlue    = "\x1b[34m";
inline constexpr std::string_view kAnsiFailure = "\x1b[1;35m"; // bold magenta
inline constexpr std::string_view kAnsiDim     = "\x1b[2m";
inline constexpr std::string_view kAnsiClearLine = "\x1b[2K";

// ——— Exit codes ———
inline constexpr int kExitOk          = 0;
inline constexpr int kExitScanError   = 1;
inline constexpr int kExitUsage       = 2;
inline constexpr int kExitInterrupted = 130;

} // namespace repocheck::consts
