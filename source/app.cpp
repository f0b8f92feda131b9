#include <gitchurn/app.hpp>
#include <gitchurn/cli.hpp>
#include <gitchurn/git.hpp>
#include <gitchurn/loop.hpp>

#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <exception>
#include <memory>

#ifndef GITCHURN_VERSION
#define GITCHURN_VERSION "unknown"
#endif

namespace gitchurn {

static std::atomic_bool g_stop{false};
static std::atomic<std::atomic_bool *> g_stop_target{nullptr};

static void on_signal(int sig) {
  if (sig != SIGINT && sig != SIGTERM)
    return;
  if (auto *flag = g_stop_target.load())
    flag->store(true);
}

StopSignalScope::StopSignalScope(std::atomic_bool &flag) {
  g_stop_target.store(&flag);
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
}

StopSignalScope::~StopSignalScope() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  g_stop_target.store(nullptr);
}

static void setup_logging(const Config &cfg) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  if (cfg.log_file) {
    try {
      auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          cfg.log_file->string(), cfg.log_rotate_max, cfg.log_rotate_files);
      auto logger = std::make_shared<spdlog::logger>("gitchurn", sink);
      logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
      spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex &e) {
      spdlog::warn("failed to open log file {} ({}), logging to stdout",
                   cfg.log_file->string(), e.what());
    }
  }
  spdlog::set_level(cfg.verbose ? spdlog::level::debug : spdlog::level::info);
}

int App::run(int argc, char **argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  const char *argv0 = argc > 0 ? argv[0] : "gitchurn";

  auto pr = parse_cli(argc, argv);
  if (pr.help) {
    print_usage(argv0);
    return 0;
  }
  if (pr.version) {
    fmt::print("gitchurn {}\n", GITCHURN_VERSION);
    return 0;
  }
  if (!pr.config) {
    spdlog::error("{}", pr.error);
    print_usage(argv0);
    return 2;
  }
  const Config &cfg = *pr.config;
  setup_logging(cfg);

  try {
    ActivityLoop loop(cfg, GitRepo(cfg.repo_dir));
    if (!loop.preflight())
      return 1;

    spdlog::info("gitchurn starting; repo={} assets={} remote={}",
                 cfg.repo_dir.string(), cfg.assets_dir.string(), cfg.remote);

    g_stop.store(false);
    StopSignalScope signals(g_stop);

    auto outcome = loop.run(g_stop);
    if (outcome == IterationOutcome::Fatal)
      spdlog::error("loop stopped on a fatal condition after {} iterations",
                    loop.stats().iterations);
    else
      spdlog::info("stopping after {} iterations", loop.stats().iterations);
  } catch (const std::exception &e) {
    spdlog::error("gitchurn: {}", e.what());
    return 1;
  }
  spdlog::default_logger()->flush();
  return 0;
}

} // namespace gitchurn
