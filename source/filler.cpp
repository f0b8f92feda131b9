#include <gitchurn/filler.hpp>

#include <fmt/format.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace gitchurn {

Random::Random() {
  std::random_device rd;
  std::seed_seq seq{rd(), rd(), rd(), rd()};
  gen_.seed(seq);
}

int Random::uniform(int lo, int hi) {
  std::uniform_int_distribution<int> dist(lo, hi);
  return dist(gen_);
}

namespace files {

namespace {

// Closes the descriptor on scope exit.
struct Fd {
  int fd{-1};
  explicit Fd(int f) : fd(f) {}
  ~Fd() {
    if (fd >= 0)
      ::close(fd);
  }
  Fd(const Fd &) = delete;
  Fd &operator=(const Fd &) = delete;
};

ssize_t read_some(int fd, unsigned char *buf, size_t n) {
  ssize_t r;
  do {
    r = ::read(fd, buf, n);
  } while (r < 0 && errno == EINTR);
  return r;
}

bool write_all(int fd, const unsigned char *buf, size_t n) {
  while (n > 0) {
    ssize_t w = ::write(fd, buf, n);
    if (w < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    buf += w;
    n -= static_cast<size_t>(w);
  }
  return true;
}

void set_err(std::string *err, std::string msg) {
  if (err)
    *err = std::move(msg);
}

} // namespace

bool ensure_dir(const fs::path &p, std::string *err) {
  std::error_code ec;
  if (fs::is_directory(p, ec))
    return true;
  fs::create_directories(p, ec);
  if (ec) {
    set_err(err, ec.message());
    return false;
  }
  return true;
}

fs::path filler_name(const fs::path &dir, std::int64_t ns, int token) {
  return dir / fmt::format("file_{}_{}.txt", ns, token);
}

bool write_random_file(const fs::path &path, std::uintmax_t bytes,
                       const fs::path &source, std::string *err) {
  Fd src(::open(source.c_str(), O_RDONLY | O_CLOEXEC));
  if (src.fd < 0) {
    set_err(err, fmt::format("open {}: {}", source.string(),
                             std::strerror(errno)));
    return false;
  }

  bool ok = true;
  {
    Fd dst(::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC,
                  0644));
    if (dst.fd < 0) {
      set_err(err, fmt::format("open {}: {}", path.string(),
                               std::strerror(errno)));
      return false;
    }

    std::array<unsigned char, 8192> buf{};
    std::uintmax_t left = bytes;
    while (left > 0) {
      size_t want = left < buf.size() ? static_cast<size_t>(left) : buf.size();
      ssize_t r = read_some(src.fd, buf.data(), want);
      if (r <= 0) {
        set_err(err, r == 0 ? "random source exhausted"
                            : fmt::format("read {}: {}", source.string(),
                                          std::strerror(errno)));
        ok = false;
        break;
      }
      if (!write_all(dst.fd, buf.data(), static_cast<size_t>(r))) {
        set_err(err, fmt::format("write {}: {}", path.string(),
                                 std::strerror(errno)));
        ok = false;
        break;
      }
      left -= static_cast<std::uintmax_t>(r);
    }
  }

  if (!ok) {
    std::error_code ec;
    fs::remove(path, ec);
  }
  return ok;
}

std::string random_digits(std::size_t count, const fs::path &source) {
  Fd src(::open(source.c_str(), O_RDONLY | O_CLOEXEC));
  if (src.fd < 0)
    return {};

  // 250 is the largest multiple of 10 below 256; higher bytes are dropped so
  // every digit is equally likely.
  constexpr std::size_t kMaxRead = 4096;
  std::string digits;
  digits.reserve(count);
  std::array<unsigned char, 64> buf{};
  std::size_t consumed = 0;
  while (digits.size() < count && consumed < kMaxRead) {
    ssize_t r = read_some(src.fd, buf.data(), buf.size());
    if (r <= 0)
      return {};
    consumed += static_cast<std::size_t>(r);
    for (ssize_t i = 0; i < r && digits.size() < count; ++i) {
      if (buf[i] < 250)
        digits.push_back(static_cast<char>('0' + buf[i] % 10));
    }
  }
  if (digits.size() < count)
    return {};
  return digits;
}

} // namespace files
} // namespace gitchurn
