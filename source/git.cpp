#include <gitchurn/git.hpp>

#include <spdlog/spdlog.h>

namespace gitchurn {

GitRepo::GitRepo(std::filesystem::path root, Runner runner)
    : root_(std::move(root)), runner_(std::move(runner)) {}

bool GitRepo::run_git(const std::vector<std::string> &args, int &rc,
                      std::string *out, std::string *err) const {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.emplace_back("git");
  argv.insert(argv.end(), args.begin(), args.end());

  auto r = runner_(argv, root_);
  rc = r.exit_code;
  if (rc != 0) {
    spdlog::debug("[git] {} failed rc={} err={}", args.front(), rc,
                  trim(r.err.empty() ? r.out : r.err));
  }
  if (out)
    *out = std::move(r.out);
  if (err)
    *err = trim(r.err.empty() && rc != 0 ? r.out : r.err);
  return rc == 0;
}

bool GitRepo::is_work_tree() const {
  int rc = 0;
  std::string out;
  if (!run_git({"rev-parse", "--is-inside-work-tree"}, rc, &out))
    return false;
  return trim(out) == "true";
}

bool GitRepo::has_remote(const std::string &name) const {
  int rc = 0;
  return run_git({"remote", "get-url", name}, rc);
}

bool GitRepo::add(const std::filesystem::path &dir, std::string *err) const {
  std::string pathspec = dir.string();
  if (pathspec.empty() || pathspec.back() != '/')
    pathspec += '/';
  int rc = 0;
  return run_git({"add", pathspec}, rc, nullptr, err);
}

bool GitRepo::commit(const std::string &message, std::string *err) const {
  int rc = 0;
  return run_git({"commit", "-m", message}, rc, nullptr, err);
}

std::optional<std::string> GitRepo::current_branch() const {
  int rc = 0;
  std::string out;
  if (!run_git({"branch", "--show-current"}, rc, &out))
    return std::nullopt;
  out = trim(out);
  if (out.empty())
    return std::nullopt;
  return out;
}

bool GitRepo::push(const std::string &remote, const std::string &branch,
                   std::string *err) const {
  int rc = 0;
  return run_git({"push", remote, branch}, rc, nullptr, err);
}

bool GitRepo::tag(const std::string &name, std::string *err) const {
  int rc = 0;
  return run_git({"tag", name}, rc, nullptr, err);
}

bool GitRepo::push_tags(const std::string &remote, std::string *err) const {
  int rc = 0;
  return run_git({"push", remote, "--tags"}, rc, nullptr, err);
}

std::optional<std::string> GitRepo::status_porcelain() const {
  int rc = 0;
  std::string out;
  if (!run_git({"status", "--porcelain"}, rc, &out))
    return std::nullopt;
  return out;
}

} // namespace gitchurn
