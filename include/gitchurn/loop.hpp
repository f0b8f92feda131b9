#pragma once
#include <gitchurn/config.hpp>
#include <gitchurn/filler.hpp>
#include <gitchurn/git.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gitchurn {

enum class IterationOutcome { Continue, Fatal };

struct IterationReport {
  int files_requested{0};
  int files_created{0};
  std::uintmax_t bytes_written{0};
  bool staged{false};
  std::optional<std::string> commit_message;
  bool committed{false};
  std::optional<std::string> branch;
  bool pushed{false};
  int tags_requested{0};
  std::vector<std::string> tags;
  bool tags_pushed{false};
  IterationOutcome outcome{IterationOutcome::Continue};
};

struct LoopStats {
  std::uint64_t iterations{0};
  std::uint64_t files_created{0};
  std::uintmax_t bytes_written{0};
  std::uint64_t commits_ok{0};
  std::uint64_t commits_fail{0};
  std::uint64_t pushes_ok{0};
  std::uint64_t pushes_fail{0};
  std::uint64_t tags_created{0};
  std::uint64_t tags_failed{0};
  std::uint64_t tag_pushes_ok{0};
  std::uint64_t tag_pushes_fail{0};

  void add(const IterationReport &r);
};

class ActivityLoop {
public:
  // Millisecond wall clock used for commit messages; nullopt when unavailable.
  using MsClock = std::function<std::optional<std::int64_t>()>;

  // Throws std::invalid_argument when a range in cfg is empty.
  ActivityLoop(Config cfg, GitRepo repo, Random rng = Random{},
               MsClock clock = now_ms);

  // Startup checks: inside a work tree, remote registered.
  bool preflight() const;

  IterationReport run_once();

  // Iterates until a fatal iteration, stop_flag, or cfg.iterations passes.
  IterationOutcome run(const std::atomic_bool &stop_flag);

  const LoopStats &stats() const { return stats_; }
  const Config &config() const { return cfg_; }

private:
  void generate_files(IterationReport &rep);
  void create_tags(IterationReport &rep);
  std::string commit_message() const;
  void log_stats() const;

  Config cfg_;
  GitRepo repo_;
  Random rng_;
  MsClock clock_;
  LoopStats stats_;
};

} // namespace gitchurn
