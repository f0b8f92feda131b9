#pragma once
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>

namespace gitchurn {

class Random {
public:
  Random();
  explicit Random(std::uint64_t seed) : gen_(seed) {}

  // Inclusive on both ends.
  int uniform(int lo, int hi);

private:
  std::mt19937_64 gen_;
};

namespace files {

bool ensure_dir(const std::filesystem::path &p, std::string *err = nullptr);

// <dir>/file_<ns>_<token>.txt
std::filesystem::path filler_name(const std::filesystem::path &dir,
                                  std::int64_t ns, int token);

// Copies `bytes` bytes from `source` into a new file at `path`. An existing
// file is never overwritten; a partial file is removed on failure.
bool write_random_file(const std::filesystem::path &path, std::uintmax_t bytes,
                       const std::filesystem::path &source,
                       std::string *err = nullptr);

// `count` uniformly distributed decimal digits taken from `source`; empty
// when the source cannot be read.
std::string random_digits(std::size_t count,
                          const std::filesystem::path &source);

} // namespace files
} // namespace gitchurn
