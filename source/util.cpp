#include <gitchurn/util.hpp>

#include <array>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <ctime>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

namespace gitchurn {

static int safe_pipe(int fds[2]) { return ::pipe2(fds, O_CLOEXEC); }

static void close_pair(int fds[2]) {
  ::close(fds[0]);
  ::close(fds[1]);
}

// Reads both pipes to EOF; a child blocked on a full stderr pipe never
// closes stdout.
static void drain(int out_fd, int err_fd, std::string &out, std::string &err) {
  std::array<char, 4096> buf{};
  pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
  std::string *sinks[2] = {&out, &err};
  int open_fds = 2;
  while (open_fds > 0) {
    int n = ::poll(fds, 2, -1);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0)
        continue;
      ssize_t r = ::read(fds[i].fd, buf.data(), buf.size());
      if (r > 0) {
        sinks[i]->append(buf.data(), static_cast<size_t>(r));
      } else if (r == 0 || errno != EINTR) {
        fds[i].fd = -1;
        --open_fds;
      }
    }
  }
}

CmdResult run_command(const std::vector<std::string> &args,
                      const std::filesystem::path &cwd) {
  CmdResult res{};
  if (args.empty()) {
    res.exit_code = -1;
    res.err = "empty argv";
    return res;
  }

  int out_pipe[2], err_pipe[2];
  if (safe_pipe(out_pipe) != 0) {
    res.exit_code = -1;
    res.err = "pipe failed";
    return res;
  }
  if (safe_pipe(err_pipe) != 0) {
    close_pair(out_pipe);
    res.exit_code = -1;
    res.err = "pipe failed";
    return res;
  }

  pid_t pid = ::fork();
  if (pid == -1) {
    res.exit_code = -1;
    res.err = "fork failed";
    close_pair(out_pipe);
    close_pair(err_pipe);
    return res;
  }

  if (pid == 0) {
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0)
      _exit(126);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);

    std::vector<char *> argv_c;
    argv_c.reserve(args.size() + 1);
    for (auto &s : args)
      argv_c.push_back(const_cast<char *>(s.c_str()));
    argv_c.push_back(nullptr);

    ::execvp(argv_c[0], argv_c.data());
    _exit(127);
  }

  ::close(out_pipe[1]);
  ::close(err_pipe[1]);
  drain(out_pipe[0], err_pipe[0], res.out, res.err);
  ::close(out_pipe[0]);
  ::close(err_pipe[0]);

  int status = 0;
  pid_t w;
  do {
    w = ::waitpid(pid, &status, 0);
  } while (w == -1 && errno == EINTR);
  if (w == -1) {
    res.exit_code = -1;
    return res;
  }
  if (WIFEXITED(status))
    res.exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    res.exit_code = 128 + WTERMSIG(status);
  else
    res.exit_code = -1;
  return res;
}

std::string iso8601_now() {
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);

  char buf[64];
  strftime(buf, sizeof(buf), "%FT%TZ", &tm);
  return std::string(buf);
}

std::optional<std::int64_t> now_ns() {
  timespec ts{};
  if (::clock_gettime(CLOCK_REALTIME, &ts) != 0)
    return std::nullopt;
  return static_cast<std::int64_t>(ts.tv_sec) * 1000000000LL + ts.tv_nsec;
}

std::optional<std::int64_t> now_ms() {
  auto ns = now_ns();
  if (!ns)
    return std::nullopt;
  return *ns / 1000000LL;
}

std::string trim(std::string s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
    s.pop_back();
  size_t i = 0;
  while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])))
    ++i;
  return s.substr(i);
}

} // namespace gitchurn
