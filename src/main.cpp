#include "cli/options.hpp"

#include "repocheck/consts.hpp"
#include "repocheck/fs.hpp"
#include "repocheck/inspector.hpp"
#include "repocheck/render.hpp"
#include "repocheck/scheduler.hpp"

#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

repocheck::CancelToken g_cancel;

void on_interrupt(int /*sig*/) { g_cancel.request(); }

void install_interrupt_handlers() {
  struct sigaction sa{};
  sa.sa_handler = on_interrupt;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  ::sigaction(SIGINT, &sa, nullptr);
  ::sigaction(SIGTERM, &sa, nullptr);
}

bool want_color(const repocheck::cli::Options &opts) {
  if (opts.no_color)
    return false;
  if (const char *nc = std::getenv("NO_COLOR"); nc && *nc)
    return false;
  return ::isatty(STDOUT_FILENO) == 1;
}

int run(const repocheck::cli::Options &opts) {
  namespace consts = repocheck::consts;

  const auto root = repocheck::fs::resolve_root(
      opts.path.empty() ? std::filesystem::current_path().string() : opts.path);
  const auto candidates = repocheck::fs::list_candidates(root, opts.include_hidden);
  if (candidates.empty()) {
    std::cout << "No subfolders found.\n";
    return consts::kExitOk;
  }

  const repocheck::InspectorOptions inspector_opts{.git_executable = opts.git,
                                                   .timeout = opts.timeout,
                                                   .count_untracked = !opts.ignore_untracked};
  if (auto reason = repocheck::check_git_available(inspector_opts))
    std::cerr << "repocheck: warning: " << *reason << "; every repository check will fail\n";

  const repocheck::Scheduler scheduler{
      repocheck::SchedulerOptions{.max_workers = opts.max_workers},
      repocheck::GitInspector{inspector_opts}};

  install_interrupt_handlers();

  const bool color = want_color(opts);
  repocheck::RunResult result;
  if (color) {
    repocheck::LiveRenderer live{candidates, repocheck::RenderOptions{.color = true}, std::cout};
    live.start();
    result = scheduler.run(candidates, g_cancel,
                           [&live](const repocheck::ResultRecord &r) { live.update(r); });
    live.finish(result.records);
  } else {
    result = scheduler.run(candidates, g_cancel);
    repocheck::render(result.records,
                      repocheck::RenderOptions{
                          .color = false, .name_width = repocheck::name_column_width(result.records)},
                      std::cout);
  }

  if (!result.complete) {
    std::cerr << "Interrupted.\n";
    return consts::kExitInterrupted;
  }
  return consts::kExitOk;
}

} // namespace

int main(int argc, char **argv) {
  namespace consts = repocheck::consts;

  repocheck::cli::Options opts;
  try {
    opts = repocheck::cli::parse_options(argc, argv);
  } catch (const repocheck::cli::UsageError &e) {
    std::cerr << "repocheck: " << e.what() << "\n";
    repocheck::cli::print_usage(std::cerr);
    return consts::kExitUsage;
  }
  if (opts.help) {
    repocheck::cli::print_usage(std::cout);
    return consts::kExitOk;
  }

  try {
    return run(opts);
  } catch (const repocheck::ScanError &e) {
    std::cerr << "repocheck: " << e.what() << "\n";
    return consts::kExitScanError;
  } catch (const std::exception &e) {
    std::cerr << "repocheck: " << e.what() << "\n";
    return consts::kExitScanError;
  }
}
