#pragma once
#include <atomic>

namespace gitchurn {

// Routes SIGINT and SIGTERM to a stop flag for its lifetime. Both signals go
// back to SIG_DFL when the scope ends, including during unwinding.
class StopSignalScope {
public:
  explicit StopSignalScope(std::atomic_bool &flag);
  ~StopSignalScope();

  StopSignalScope(const StopSignalScope &) = delete;
  StopSignalScope &operator=(const StopSignalScope &) = delete;
};

// Exit codes: 0 normal stop, 1 startup check failed, 2 bad command line.
class App {
public:
  int run(int argc, char **argv);
};

} // namespace gitchurn
