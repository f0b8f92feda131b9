#include <gitchurn/crypto.hpp>
#include <gitchurn/loop.hpp>
#include <gitchurn/util.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <stdexcept>
#include <thread>

namespace gitchurn {

void LoopStats::add(const IterationReport &r) {
  iterations++;
  files_created += static_cast<std::uint64_t>(r.files_created);
  bytes_written += r.bytes_written;
  if (r.commit_message) {
    if (r.committed)
      commits_ok++;
    else
      commits_fail++;
  }
  if (r.branch) {
    if (r.pushed)
      pushes_ok++;
    else
      pushes_fail++;
  }
  tags_created += r.tags.size();
  if (r.tags_requested > static_cast<int>(r.tags.size()))
    tags_failed += static_cast<std::uint64_t>(r.tags_requested) - r.tags.size();
  if (!r.tags.empty()) {
    if (r.tags_pushed)
      tag_pushes_ok++;
    else
      tag_pushes_fail++;
  }
}

static void check_range(const Range &r, int floor, const char *what) {
  if (r.min < floor || r.min > r.max)
    throw std::invalid_argument(
        fmt::format("{}: bad range [{}, {}]", what, r.min, r.max));
}

ActivityLoop::ActivityLoop(Config cfg, GitRepo repo, Random rng,
                           MsClock clock)
    : cfg_(std::move(cfg)), repo_(std::move(repo)), rng_(std::move(rng)),
      clock_(std::move(clock)) {
  check_range(cfg_.file_count, 0, "file count");
  check_range(cfg_.file_size_kib, 0, "file size");
  check_range(cfg_.tag_count, 0, "tag count");
  if (cfg_.tag_digits == 0)
    throw std::invalid_argument("tag digits must be positive");
  if (cfg_.remote.empty())
    throw std::invalid_argument("remote name is empty");
  if (!clock_)
    throw std::invalid_argument("clock is empty");
}

bool ActivityLoop::preflight() const {
  if (!repo_.is_work_tree()) {
    spdlog::error("Not inside a git work tree: {}. Run gitchurn in a git "
                  "repository.",
                  repo_.root().string());
    return false;
  }
  if (!repo_.has_remote(cfg_.remote)) {
    spdlog::error("Remote '{}' not found. Add a remote named '{}'.",
                  cfg_.remote, cfg_.remote);
    return false;
  }
  return true;
}

std::string ActivityLoop::commit_message() const {
  std::string stamp;
  if (auto ms = clock_()) {
    stamp = std::to_string(*ms);
  } else {
    spdlog::warn("[git] millisecond clock unavailable, using seconds");
    stamp = std::to_string(static_cast<long long>(std::time(nullptr)));
  }
  return sha256_hex(stamp);
}

void ActivityLoop::generate_files(IterationReport &rep) {
  const auto assets = cfg_.resolved_assets();
  rep.files_requested = rng_.uniform(cfg_.file_count.min, cfg_.file_count.max);
  spdlog::info("[files] creating {} random files", rep.files_requested);

  for (int i = 0; i < rep.files_requested; ++i) {
    int kib = rng_.uniform(cfg_.file_size_kib.min, cfg_.file_size_kib.max);
    std::uintmax_t bytes = static_cast<std::uintmax_t>(kib) * 1024;
    auto path =
        files::filler_name(assets, now_ns().value_or(0), rng_.uniform(0, 32767));

    std::string err;
    if (files::write_random_file(path, bytes, cfg_.random_source, &err)) {
      spdlog::info("[files]   created {} ({} KB)", path.string(), kib);
      rep.files_created++;
      rep.bytes_written += bytes;
    } else {
      spdlog::warn("[files]   could not create {}: {}; skipping it",
                   path.string(), err);
    }
  }
}

void ActivityLoop::create_tags(IterationReport &rep) {
  rep.tags_requested = rng_.uniform(cfg_.tag_count.min, cfg_.tag_count.max);
  spdlog::info("[tags] creating {} random tags", rep.tags_requested);

  for (int i = 0; i < rep.tags_requested; ++i) {
    auto digits = files::random_digits(cfg_.tag_digits, cfg_.random_source);
    if (digits.empty()) {
      spdlog::warn("[tags]   could not generate random digits for tag name; "
                   "skipping tag");
      continue;
    }
    auto name = sha512_hex(digits);
    spdlog::info("[tags]   creating tag: {}", name);
    std::string err;
    if (repo_.tag(name, &err)) {
      rep.tags.push_back(std::move(name));
    } else {
      spdlog::warn("[tags]   could not create local tag {} ({}); skipping",
                   name, err);
    }
  }
}

IterationReport ActivityLoop::run_once() {
  IterationReport rep;
  spdlog::info("[loop] --- {} - starting new iteration ---", iso8601_now());

  const auto assets = cfg_.resolved_assets();
  std::string err;
  if (!files::ensure_dir(assets, &err)) {
    spdlog::error("[files] could not create directory {}: {}; skipping "
                  "iteration",
                  assets.string(), err);
    return rep;
  }

  generate_files(rep);
  if (rep.files_created == 0) {
    spdlog::warn("[files] no files were created; skipping commit and push");
    return rep;
  }

  spdlog::info("[git] adding files");
  if (!repo_.add(cfg_.assets_dir, &err)) {
    spdlog::error("[git] add failed ({}); skipping commit and push", err);
    return rep;
  }
  rep.staged = true;

  rep.commit_message = commit_message();
  spdlog::info("[git] committing with message: {}", *rep.commit_message);
  if (!repo_.commit(*rep.commit_message, &err)) {
    spdlog::warn("[git] commit failed ({}); skipping push", err);
    auto st = repo_.status_porcelain();
    if (!st)
      spdlog::warn("[git]   status probe failed as well");
    else if (!trim(*st).empty())
      spdlog::warn("[git]   status shows changes, but commit failed; "
                   "investigate manually");
    else
      spdlog::warn("[git]   status shows nothing to commit although files "
                   "were written");
    return rep;
  }
  rep.committed = true;

  rep.branch = repo_.current_branch();
  if (!rep.branch) {
    spdlog::error("[git] not on a branch; cannot push commits or tags, "
                  "stopping");
    rep.outcome = IterationOutcome::Fatal;
    return rep;
  }

  spdlog::info("[git] pushing commit to {}/{}", cfg_.remote, *rep.branch);
  if (!repo_.push(cfg_.remote, *rep.branch, &err)) {
    spdlog::error("[git] push failed ({}); continuing", err);
    return rep;
  }
  rep.pushed = true;

  create_tags(rep);
  if (rep.tags.empty()) {
    spdlog::info("[tags] no new tags were created this iteration");
  } else {
    spdlog::info("[tags] pushing {} tags", rep.tags.size());
    if (repo_.push_tags(cfg_.remote, &err)) {
      rep.tags_pushed = true;
      spdlog::info("[tags] tags pushed");
    } else {
      spdlog::error("[tags] push --tags failed ({}); continuing", err);
    }
  }

  spdlog::info("[loop] --- iteration finished ---");
  return rep;
}

void ActivityLoop::log_stats() const {
  spdlog::info("stats: iterations={} files={} bytes={} commits_ok={} "
               "commits_fail={} pushes_ok={} pushes_fail={} tags={} "
               "tags_fail={} tag_pushes_ok={} tag_pushes_fail={}",
               stats_.iterations, stats_.files_created, stats_.bytes_written,
               stats_.commits_ok, stats_.commits_fail, stats_.pushes_ok,
               stats_.pushes_fail, stats_.tags_created, stats_.tags_failed,
               stats_.tag_pushes_ok, stats_.tag_pushes_fail);
}

IterationOutcome ActivityLoop::run(const std::atomic_bool &stop_flag) {
  using namespace std::chrono;
  auto last_stats = steady_clock::now();
  std::uint64_t done = 0;
  IterationOutcome outcome = IterationOutcome::Continue;

  while (!stop_flag.load()) {
    if (cfg_.iterations != 0 && done >= cfg_.iterations)
      break;
    auto rep = run_once();
    ++done;
    stats_.add(rep);
    if (rep.outcome == IterationOutcome::Fatal) {
      outcome = IterationOutcome::Fatal;
      break;
    }

    auto tnow = steady_clock::now();
    if (cfg_.stats && tnow - last_stats >= seconds(cfg_.stats_interval_sec)) {
      log_stats();
      last_stats = tnow;
    }
    for (int waited = 0; waited < cfg_.delay_ms && !stop_flag.load();
         waited += 100) {
      std::this_thread::sleep_for(
          milliseconds(std::min(100, cfg_.delay_ms - waited)));
    }
  }

  if (cfg_.stats)
    log_stats();
  return outcome;
}

} // namespace gitchurn
