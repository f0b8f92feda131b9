#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace gitchurn {

struct Range {
  int min;
  int max;
};

struct Config {
  std::filesystem::path repo_dir{"."};
  std::filesystem::path assets_dir{"./assets"};
  std::string remote{"origin"};

  Range file_count{1, 11};
  Range file_size_kib{24, 48};
  Range tag_count{1, 7};
  std::size_t tag_digits{24};
  std::filesystem::path random_source{"/dev/urandom"};

  // 0 runs until a fatal condition or a signal.
  std::uint64_t iterations{0};
  int delay_ms{0};

  bool stats{false};
  int stats_interval_sec{5};

  std::optional<std::filesystem::path> log_file;
  std::size_t log_rotate_max{10 * 1024 * 1024};
  std::size_t log_rotate_files{3};
  bool verbose{false};

  // assets_dir as seen from the process, i.e. anchored at repo_dir.
  std::filesystem::path resolved_assets() const {
    return assets_dir.is_absolute() ? assets_dir : repo_dir / assets_dir;
  }
};

} // namespace gitchurn
