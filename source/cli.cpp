#include <gitchurn/cli.hpp>

#include <fmt/format.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string_view>

namespace gitchurn {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

// Non-negative decimal only; rejects trailing garbage.
static bool parse_count(const char *s, long long &v) {
  if (!s || !std::isdigit(static_cast<unsigned char>(s[0])))
    return false;
  errno = 0;
  char *end = nullptr;
  v = std::strtoll(s, &end, 10);
  return errno == 0 && end && *end == '\0';
}

void print_usage(const char *argv0) {
  fmt::print("Usage:\n"
             "  {} [--repo DIR] [--assets DIR] [--remote NAME]\n"
             "     [--iterations N] [--delay-ms N]\n"
             "     [--stats [SEC]]\n"
             "     [--log-file PATH] [--log-rotate-max BYTES] "
             "[--log-rotate-files N]\n"
             "     [--verbose] [--help] [--version]\n"
             "\n"
             "Writes random filler files into the assets directory, commits "
             "them,\n"
             "pushes the commit and a batch of random tags, and repeats.\n"
             "\n",
             argv0);
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  Config cfg;

  auto bad_value = [&](std::string_view flag, const char *v) {
    r.error = fmt::format("{}: invalid value '{}'", flag, v ? v : "");
    return r;
  };

  for (int i = 1; i < argc; i++) {
    std::string_view a = argv[i];
    long long n = 0;
    if (a == "--help" || a == "-h") {
      r.help = true;
      return r;
    } else if (a == "--version") {
      r.version = true;
      return r;
    } else if (a == "--repo" && has_arg(i, argc)) {
      cfg.repo_dir = argv[++i];
    } else if (a == "--assets" && has_arg(i, argc)) {
      cfg.assets_dir = argv[++i];
    } else if (a == "--remote" && has_arg(i, argc)) {
      cfg.remote = argv[++i];
      if (cfg.remote.empty())
        return bad_value(a, argv[i]);
    } else if (a == "--iterations" && has_arg(i, argc)) {
      if (!parse_count(argv[++i], n))
        return bad_value(a, argv[i]);
      cfg.iterations = static_cast<std::uint64_t>(n);
    } else if (a == "--delay-ms" && has_arg(i, argc)) {
      if (!parse_count(argv[++i], n) || n > 86400000)
        return bad_value(a, argv[i]);
      cfg.delay_ms = static_cast<int>(n);
    } else if (a == "--stats") {
      cfg.stats = true;
      if (has_arg(i, argc) &&
          std::isdigit(static_cast<unsigned char>(argv[i + 1][0]))) {
        if (!parse_count(argv[++i], n) || n < 1 || n > 86400)
          return bad_value(a, argv[i]);
        cfg.stats_interval_sec = static_cast<int>(n);
      }
    } else if (a == "--log-file" && has_arg(i, argc)) {
      cfg.log_file = std::filesystem::path(argv[++i]);
    } else if (a == "--log-rotate-max" && has_arg(i, argc)) {
      if (!parse_count(argv[++i], n) || n < 1)
        return bad_value(a, argv[i]);
      cfg.log_rotate_max = static_cast<std::size_t>(n);
    } else if (a == "--log-rotate-files" && has_arg(i, argc)) {
      if (!parse_count(argv[++i], n))
        return bad_value(a, argv[i]);
      cfg.log_rotate_files = static_cast<std::size_t>(n);
    } else if (a == "--verbose" || a == "-v") {
      cfg.verbose = true;
    } else {
      r.error = fmt::format("unknown argument: {}", a);
      return r;
    }
  }

  r.config = cfg;
  return r;
}

} // namespace gitchurn
