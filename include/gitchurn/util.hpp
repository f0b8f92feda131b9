#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitchurn {

struct CmdResult {
  int exit_code{};
  std::string out;
  std::string err;
};

// Runs argv[0] (looked up in PATH) with cwd as working directory and waits
// for it. exit_code is -1 when the child could not be started.
CmdResult run_command(const std::vector<std::string> &argv,
                      const std::filesystem::path &cwd);

std::string iso8601_now();

// Wall clock since the epoch; nullopt when the clock cannot be read.
std::optional<std::int64_t> now_ns();
std::optional<std::int64_t> now_ms();

std::string trim(std::string s);

} // namespace gitchurn
