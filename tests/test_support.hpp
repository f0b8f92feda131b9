#pragma once
#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <gitchurn/git.hpp>
#include <gitchurn/util.hpp>

#include <cstdlib>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

// Every directory handed out by make_tmpdir; test_main removes them once the
// session is over.
inline std::vector<fs::path> &scratch_dirs() {
  static std::vector<fs::path> dirs;
  return dirs;
}

inline void remove_scratch_dirs() {
  for (auto &d : scratch_dirs()) {
    std::error_code ec;
    fs::remove_all(d, ec);
  }
  scratch_dirs().clear();
}

static inline fs::path make_tmpdir(const std::string &prefix) {
  fs::path base = fs::temp_directory_path() / (prefix + "XXXXXX");
  std::string s = base.string();
  std::vector<char> buf(s.begin(), s.end());
  buf.push_back('\0');
  char *p = mkdtemp(buf.data());
  REQUIRE(p != nullptr);
  scratch_dirs().emplace_back(p);
  return fs::path(p);
}

static inline bool is_lower_hex(const std::string &s) {
  for (char c : s) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
      return false;
  }
  return !s.empty();
}

// Stands in for the git binary. Replies are keyed by subcommand ("add",
// "commit", "push", "push --tags", ...); queued replies win over fixed ones,
// anything unscripted succeeds with empty output.
struct ScriptedGit {
  std::vector<std::vector<std::string>> calls;
  std::map<std::string, gitchurn::CmdResult> replies;
  std::map<std::string, std::deque<gitchurn::CmdResult>> queued;

  static std::string key_of(const std::vector<std::string> &argv) {
    if (argv.size() < 2)
      return {};
    std::string k = argv[1];
    for (size_t i = 2; i < argv.size(); ++i) {
      if (argv[i] == "--tags")
        k += " --tags";
    }
    return k;
  }

  gitchurn::CmdResult operator()(const std::vector<std::string> &argv) {
    calls.push_back(argv);
    auto k = key_of(argv);
    auto q = queued.find(k);
    if (q != queued.end() && !q->second.empty()) {
      auto r = q->second.front();
      q->second.pop_front();
      return r;
    }
    auto it = replies.find(k);
    if (it != replies.end())
      return it->second;
    return {0, "", ""};
  }

  size_t count(const std::string &k) const {
    size_t n = 0;
    for (auto &c : calls)
      if (key_of(c) == k)
        ++n;
    return n;
  }
};

static inline gitchurn::GitRepo scripted_repo(const fs::path &root,
                                              std::shared_ptr<ScriptedGit> g) {
  return gitchurn::GitRepo(
      root, [g](const std::vector<std::string> &argv, const fs::path &) {
        return (*g)(argv);
      });
}

static inline gitchurn::CmdResult git_in(const fs::path &dir,
                                         std::vector<std::string> args) {
  args.insert(args.begin(), "git");
  return gitchurn::run_command(args, dir);
}
