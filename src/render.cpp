#include "repocheck/render.hpp"

#include "repocheck/consts.hpp"

#include <algorithm>
#include <sstream>
#include <string_view>
#include <type_traits>
#include <variant>

namespace {

std::string paint(std::string_view text, std::string_view code, bool color) {
  if (!color)
    return std::string(text);
  std::string out;
  out.reserve(code.size() + text.size() + repocheck::consts::kAnsiReset.size());
  out.append(code).append(text).append(repocheck::consts::kAnsiReset);
  return out;
}

std::string branch_label(const repocheck::RepoStatus &st) {
  using repocheck::HeadState;
  switch (st.head) {
  case HeadState::Detached:
    return std::string(repocheck::consts::kLabelDetached);
  case HeadState::Unborn:
    return st.branch + " " + std::string(repocheck::consts::kLabelNoCommits);
  case HeadState::Branch:
    break;
  }
  return st.branch;
}

} // namespace

namespace repocheck {

auto name_column_width(const std::vector<ResultRecord> &records) -> std::size_t {
  std::size_t w = 0;
  for (const auto &r : records)
    w = std::max(w, r.candidate.name.size());
  return w;
}

auto outcome_label(const std::optional<Outcome> &outcome) -> std::string {
  if (!outcome)
    return std::string(consts::kLabelPending);
  return std::visit(
      [](const auto &o) -> std::string {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, RepoStatus>)
          return std::string(o.dirty ? consts::kLabelDirty : consts::kLabelClean);
        else if constexpr (std::is_same_v<T, NotARepo>)
          return std::string(consts::kLabelNotRepo);
        else
          return std::string(consts::kLabelError) + o.reason;
      },
      *outcome);
}

auto render_line(const ResultRecord &record, const RenderOptions &options) -> std::string {
  const bool color = options.color;
  std::string line = record.candidate.name;
  if (line.size() < options.name_width)
    line.append(options.name_width - line.size(), ' ');
  line.append(consts::kSeparator);

  if (!record.outcome) {
    line += paint(consts::kLabelPending, consts::kAnsiDim, color);
    return line;
  }

  std::visit(
      [&](const auto &o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, RepoStatus>) {
          line += paint(branch_label(o), consts::kAnsiBlue, color);
          line.append(consts::kSeparator);
          line += o.dirty ? paint(consts::kLabelDirty, consts::kAnsiRed, color)
                          : paint(consts::kLabelClean, consts::kAnsiGreen, color);
        } else if constexpr (std::is_same_v<T, NotARepo>) {
          line += paint(consts::kLabelNotRepo, consts::kAnsiYellow, color);
        } else {
          line += paint(std::string(consts::kLabelError) + o.reason, consts::kAnsiFailure, color);
        }
      },
      *record.outcome);
  return line;
}

void render(const std::vector<ResultRecord> &records, const RenderOptions &options,
            std::ostream &out) {
  for (const auto &r : records)
    out << render_line(r, options) << '\n';
  out.flush();
}

LiveRenderer::LiveRenderer(const std::vector<Candidate> &candidates, RenderOptions options,
                           std::ostream &out)
    : options_{options}, out_{out} {
  records_.reserve(candidates.size());
  for (const auto &c : candidates)
    records_.push_back(ResultRecord{.candidate = c, .outcome = std::nullopt});
  if (options_.name_width == 0)
    options_.name_width = name_column_width(records_);
}

void LiveRenderer::start() {
  std::lock_guard lock(mu_);
  redraw_locked();
}

void LiveRenderer::update(const ResultRecord &record) {
  std::lock_guard lock(mu_);
  if (record.candidate.index >= records_.size())
    return;
  records_[record.candidate.index].outcome = record.outcome;
  redraw_locked();
}

void LiveRenderer::finish(const std::vector<ResultRecord> &records) {
  std::lock_guard lock(mu_);
  for (const auto &r : records) {
    if (r.candidate.index < records_.size())
      records_[r.candidate.index].outcome = r.outcome;
  }
  redraw_locked();
}

void LiveRenderer::redraw_locked() {
  std::ostringstream os;
  const std::size_t n = records_.size();
  if (drawn_ && n > 0) {
    // move up over the previous block and clear it
    os << "\x1b[" << n << 'A';
    for (std::size_t i = 0; i < n; ++i)
      os << consts::kAnsiClearLine << "\r\n";
    os << "\x1b[" << n << 'A';
  }
  for (const auto &r : records_)
    os << render_line(r, options_) << '\n';
  out_ << os.str();
  out_.flush();
  drawn_ = true;
}

} // namespace repocheck
