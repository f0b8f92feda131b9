#pragma once
#include <gitchurn/util.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gitchurn {

// All git invocations go through here, one call at a time. The runner
// executes a single command; it defaults to run_command.
class GitRepo {
public:
  using Runner = std::function<CmdResult(const std::vector<std::string> &,
                                         const std::filesystem::path &)>;

  explicit GitRepo(std::filesystem::path root, Runner runner = run_command);

  const std::filesystem::path &root() const { return root_; }

  bool is_work_tree() const;
  bool has_remote(const std::string &name) const;

  bool add(const std::filesystem::path &dir, std::string *err = nullptr) const;
  bool commit(const std::string &message, std::string *err = nullptr) const;

  // nullopt on detached HEAD or when the query itself fails.
  std::optional<std::string> current_branch() const;

  bool push(const std::string &remote, const std::string &branch,
            std::string *err = nullptr) const;
  bool tag(const std::string &name, std::string *err = nullptr) const;
  bool push_tags(const std::string &remote, std::string *err = nullptr) const;

  std::optional<std::string> status_porcelain() const;

private:
  bool run_git(const std::vector<std::string> &args, int &rc,
               std::string *out = nullptr, std::string *err = nullptr) const;

  std::filesystem::path root_;
  Runner runner_;
};

} // namespace gitchurn
