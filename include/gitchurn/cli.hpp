#pragma once
#include <gitchurn/config.hpp>

#include <optional>
#include <string>

namespace gitchurn {

struct ParseResult {
  std::optional<Config> config;
  bool help{false};
  bool version{false};
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

void print_usage(const char *argv0);

} // namespace gitchurn
