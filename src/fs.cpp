#include "repocheck/fs.hpp"

#include "repocheck/consts.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <system_error>

namespace stdfs = std::filesystem;

namespace {

std::string lowercase(std::string_view sv) {
  std::string out(sv);
  std::ranges::transform(out, out.begin(),
                         [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
  return out;
}

} // namespace

namespace repocheck::fs {

bool is_hidden(std::string_view name) {
  return !name.empty() && name.front() == consts::kHiddenPrefix;
}

auto list_candidates(const stdfs::path &root, bool include_hidden) -> std::vector<Candidate> {
  std::error_code ec;
  const auto st = stdfs::status(root, ec);
  if (ec || !stdfs::exists(st))
    throw ScanError("no such directory: " + root.string());
  if (!stdfs::is_directory(st))
    throw ScanError("not a directory: " + root.string());

  stdfs::directory_iterator it{root, ec};
  if (ec)
    throw ScanError("cannot read " + root.string() + ": " + ec.message());

  struct entry {
    std::string key;
    std::string name;
    stdfs::path path;
  };
  std::vector<entry> found;
  for (; it != stdfs::directory_iterator(); it.increment(ec)) {
    if (ec)
      throw ScanError("cannot read " + root.string() + ": " + ec.message());
    std::string name = it->path().filename().string();
    if (!include_hidden && is_hidden(name))
      continue;
    // symlink_status: a link to a directory is not a candidate
    std::error_code sec;
    const auto lst = it->symlink_status(sec);
    if (sec || !stdfs::is_directory(lst))
      continue; // vanished or not a directory
    found.push_back(entry{.key = lowercase(name), .name = name, .path = it->path()});
  }

  std::ranges::sort(found, [](const entry &a, const entry &b) {
    return a.key != b.key ? a.key < b.key : a.name < b.name;
  });

  std::vector<Candidate> out;
  out.reserve(found.size());
  for (auto &e : found)
    out.push_back(Candidate{.index = out.size(), .name = std::move(e.name), .path = std::move(e.path)});
  return out;
}

auto resolve_root(const std::string &arg) -> stdfs::path {
  std::string s = arg;
  if (!s.empty() && s.front() == '~' && (s.size() == 1 || s[1] == '/')) {
    if (const char *home = std::getenv("HOME"); home && *home)
      s = std::string(home) + s.substr(1);
  }
  std::error_code ec;
  auto abs = stdfs::absolute(s, ec);
  if (ec)
    throw ScanError("cannot resolve path " + arg + ": " + ec.message());
  return abs.lexically_normal();
}

} // namespace repocheck::fs
