#include "test_support.hpp"

#include <gitchurn/app.hpp>
#include <gitchurn/cli.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <stdexcept>

using namespace gitchurn;

static ParseResult parse(std::vector<std::string> args) {
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &s : args)
    argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);
  return parse_cli(static_cast<int>(args.size()), argv.data());
}

static int run_app(std::vector<std::string> args) {
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &s : args)
    argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);

  // App::run reconfigures the global logger; hand the suite's back afterwards.
  auto logger = spdlog::default_logger();
  auto level = logger->level();
  int rc = App{}.run(static_cast<int>(args.size()), argv.data());
  spdlog::set_default_logger(logger);
  spdlog::set_level(level);
  return rc;
}

TEST_CASE("no arguments keeps the built-in defaults") {
  auto r = parse({"gitchurn"});
  REQUIRE(r.error.empty());
  REQUIRE(r.config.has_value());
  const auto &c = *r.config;
  REQUIRE(c.repo_dir == fs::path("."));
  REQUIRE(c.assets_dir == fs::path("./assets"));
  REQUIRE(c.remote == "origin");
  REQUIRE(c.file_count.min == 1);
  REQUIRE(c.file_count.max == 11);
  REQUIRE(c.file_size_kib.min == 24);
  REQUIRE(c.file_size_kib.max == 48);
  REQUIRE(c.tag_count.min == 1);
  REQUIRE(c.tag_count.max == 7);
  REQUIRE(c.tag_digits == 24);
  REQUIRE(c.iterations == 0);
  REQUIRE(c.delay_ms == 0);
  REQUIRE_FALSE(c.stats);
  REQUIRE_FALSE(c.log_file.has_value());
  REQUIRE_FALSE(c.verbose);
}

TEST_CASE("all flags") {
  auto r = parse({"gitchurn", "--repo", "/srv/r", "--assets", "junk",
                  "--remote", "mirror", "--iterations", "3", "--delay-ms",
                  "250", "--stats", "10", "--log-file", "/tmp/g.log",
                  "--log-rotate-max", "2048", "--log-rotate-files", "5",
                  "--verbose"});
  REQUIRE(r.error.empty());
  REQUIRE(r.config.has_value());
  const auto &c = *r.config;
  REQUIRE(c.repo_dir == fs::path("/srv/r"));
  REQUIRE(c.assets_dir == fs::path("junk"));
  REQUIRE(c.resolved_assets() == fs::path("/srv/r/junk"));
  REQUIRE(c.remote == "mirror");
  REQUIRE(c.iterations == 3);
  REQUIRE(c.delay_ms == 250);
  REQUIRE(c.stats);
  REQUIRE(c.stats_interval_sec == 10);
  REQUIRE(c.log_file == fs::path("/tmp/g.log"));
  REQUIRE(c.log_rotate_max == 2048);
  REQUIRE(c.log_rotate_files == 5);
  REQUIRE(c.verbose);
}

TEST_CASE("--stats without a number keeps the default interval") {
  auto r = parse({"gitchurn", "--stats", "--verbose"});
  REQUIRE(r.config.has_value());
  REQUIRE(r.config->stats);
  REQUIRE(r.config->stats_interval_sec == 5);
  REQUIRE(r.config->verbose);
}

TEST_CASE("absolute assets dir is not re-anchored") {
  auto r = parse({"gitchurn", "--repo", "/srv/r", "--assets", "/data/a"});
  REQUIRE(r.config->resolved_assets() == fs::path("/data/a"));
}

TEST_CASE("bad command lines") {
  REQUIRE(parse({"gitchurn", "--bogus"}).error == "unknown argument: --bogus");
  REQUIRE_FALSE(parse({"gitchurn", "--iterations", "-1"}).config);
  REQUIRE_FALSE(parse({"gitchurn", "--iterations", "3x"}).config);
  REQUIRE_FALSE(parse({"gitchurn", "--delay-ms", "soon"}).config);
  REQUIRE_FALSE(parse({"gitchurn", "--remote", ""}).config);
  REQUIRE_FALSE(parse({"gitchurn", "--iterations"}).config);
}

TEST_CASE("help and version") {
  REQUIRE(parse({"gitchurn", "--help"}).help);
  REQUIRE(parse({"gitchurn", "-h"}).help);
  REQUIRE(parse({"gitchurn", "--version"}).version);
  REQUIRE(run_app({"gitchurn", "--help"}) == 0);
  REQUIRE(run_app({"gitchurn", "--version"}) == 0);
  REQUIRE(run_app({"gitchurn", "--nope"}) == 2);
}

TEST_CASE("startup fails outside a repository") {
  auto d = make_tmpdir("gitchurn_norepo_");
  REQUIRE(run_app({"gitchurn", "--repo", d.string(), "--iterations", "1"}) ==
          1);
  REQUIRE_FALSE(fs::exists(d / "assets"));
}

TEST_CASE("running the app leaves the suite's log level alone") {
  auto before = spdlog::get_level();
  auto d = make_tmpdir("gitchurn_level_");
  REQUIRE(run_app({"gitchurn", "--repo", d.string(), "--verbose"}) == 1);
  REQUIRE(spdlog::get_level() == before);
}

TEST_CASE("stop signals set the flag and are restored on unwind") {
  std::atomic_bool flag{false};
  try {
    StopSignalScope scope(flag);
    std::raise(SIGTERM);
    REQUIRE(flag.load());
    throw std::runtime_error("unwind");
  } catch (const std::runtime_error &) {
  }
  REQUIRE(std::signal(SIGINT, SIG_DFL) == SIG_DFL);
  REQUIRE(std::signal(SIGTERM, SIG_DFL) == SIG_DFL);
}
