#pragma once
#include "repocheck/outcome.hpp"

#include <cstddef>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace repocheck {

struct RenderOptions {
  bool color{true};
  std::size_t name_width{0}; // names are left-aligned to this width
};

// Widest candidate name, for RenderOptions::name_width.
auto name_column_width(const std::vector<ResultRecord> &records) -> std::size_t;

// Status label without decoration: "clean", "dirty", "not a git repo",
// "error: <reason>" or "pending".
auto outcome_label(const std::optional<Outcome> &outcome) -> std::string;

auto render_line(const ResultRecord &record, const RenderOptions &options) -> std::string;

// One line per record, in record order.
void render(const std::vector<ResultRecord> &records, const RenderOptions &options,
            std::ostream &out);

// Redraws the whole block in place as outcomes arrive. Only meaningful on a
// terminal with color enabled. update() may be called from any thread.
class LiveRenderer {
public:
  LiveRenderer(const std::vector<Candidate> &candidates, RenderOptions options, std::ostream &out);

  void start();
  void update(const ResultRecord &record);
  void finish(const std::vector<ResultRecord> &records);

private:
  void redraw_locked();

  std::mutex mu_;
  std::vector<ResultRecord> records_;
  RenderOptions options_;
  std::ostream &out_;
  bool drawn_{false};
};

} // namespace repocheck
