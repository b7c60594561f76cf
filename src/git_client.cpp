#include "gitsaga/git_client.hpp"

#include "gitsaga/util.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace gitsaga {

namespace {

std::string join_args(const std::vector<std::string> &args) {
  std::string s = "git";
  for (const auto &a : args) {
    s += ' ';
    s += a;
  }
  return s;
}

std::string describe(const std::vector<std::string> &args, int exit_code,
                     const std::string &stderr_text) {
  std::string msg = join_args(args) + " failed (exit " + std::to_string(exit_code) + ")";
  const auto detail = strutil::trim(stderr_text);
  if (!detail.empty())
    msg += ": " + detail;
  return msg;
}

// Environment block for the child, built before fork so the child only execs.
std::vector<std::string> child_environment(
    const std::vector<std::pair<std::string, std::string>> &overrides) {
  std::vector<std::string> env;
  auto overridden = [&](std::string_view entry) {
    if (entry.starts_with("GIT_TERMINAL_PROMPT="))
      return true;
    for (const auto &[key, _] : overrides) {
      if (entry.size() > key.size() && entry.starts_with(key) && entry[key.size()] == '=')
        return true;
    }
    return false;
  };
  for (char **e = environ; e && *e; ++e) {
    if (!overridden(*e))
      env.emplace_back(*e);
  }
  env.emplace_back("GIT_TERMINAL_PROMPT=0");
  for (const auto &[key, value] : overrides)
    env.push_back(key + "=" + value);
  return env;
}

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

} // namespace

GitError::GitError(std::vector<std::string> args, int exit_code, std::string stderr_text)
    : std::runtime_error(describe(args, exit_code, stderr_text)), args_(std::move(args)),
      exit_code_(exit_code), stderr_(std::move(stderr_text)) {}

GitClient::GitClient(std::filesystem::path base_dir, std::shared_ptr<const AbortSignal> signal)
    : base_dir_(std::move(base_dir)), signal_(std::move(signal)) {}

GitResult GitClient::run(const std::vector<std::string> &args) const {
  if (signal_ && signal_->aborted())
    throw AbortedError("aborted before running " + join_args(args));

  std::vector<std::string> argv_storage;
  argv_storage.reserve(args.size() + 1);
  argv_storage.emplace_back("git");
  argv_storage.insert(argv_storage.end(), args.begin(), args.end());
  std::vector<char *> argv;
  for (auto &a : argv_storage)
    argv.push_back(a.data());
  argv.push_back(nullptr);

  auto env_storage = child_environment(env_);
  std::vector<char *> envp;
  for (auto &e : env_storage)
    envp.push_back(e.data());
  envp.push_back(nullptr);

  const std::string cwd = base_dir_.string();

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (::pipe(out_pipe) < 0)
    throw GitError(args, -1, std::string("pipe: ") + std::strerror(errno));
  if (::pipe(err_pipe) < 0) {
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    throw GitError(args, -1, std::string("pipe: ") + std::strerror(errno));
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const std::string reason = std::strerror(errno);
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    throw GitError(args, -1, "fork: " + reason);
  }

  if (pid == 0) {
    // Child
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0)
      ::dup2(devnull, STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::close(out_pipe[0]);
    ::close(err_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    if (::chdir(cwd.c_str()) != 0)
      ::_exit(127);
    ::execvpe("git", argv.data(), envp.data());
    ::_exit(127);
  }

  // Parent
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);

  GitResult result;
  bool aborted = false;
  std::array<char, 4096> buf{};
  std::array<pollfd, 2> fds{pollfd{out_pipe[0], POLLIN, 0}, pollfd{err_pipe[0], POLLIN, 0}};
  while (fds[0].fd >= 0 || fds[1].fd >= 0) {
    if (signal_ && signal_->aborted() && !aborted) {
      ::kill(pid, SIGKILL);
      aborted = true;
    }
    const int ready = ::poll(fds.data(), fds.size(), 50);
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    for (std::size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0)
        continue;
      const ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
      if (n > 0) {
        (i == 0 ? result.out : result.err).append(buf.data(), static_cast<std::size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        ::close(fds[i].fd);
        fds[i].fd = -1;
      }
    }
  }
  close_fd(out_pipe[0]);
  close_fd(err_pipe[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      throw GitError(args, -1, std::string("waitpid: ") + std::strerror(errno));
  }

  if (aborted)
    throw AbortedError("aborted while running " + join_args(args));

  if (WIFEXITED(status))
    result.exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    result.exit_code = 128 + WTERMSIG(status);
  if (result.exit_code == 127 && result.out.empty() && result.err.empty())
    result.err = "could not execute git in " + cwd;
  return result;
}

std::string GitClient::raw(const std::vector<std::string> &args) const {
  auto result = run(args);
  if (result.exit_code != 0)
    throw GitError(args, result.exit_code, std::move(result.err));
  return std::move(result.out);
}

std::string GitClient::rev_parse(const std::vector<std::string> &args) const {
  std::vector<std::string> full{"rev-parse"};
  full.insert(full.end(), args.begin(), args.end());
  return strutil::trim(raw(full));
}

void GitClient::checkout(std::string_view target) const {
  raw({"checkout", std::string(target)});
}

void GitClient::checkout_new_branch(std::string_view branch, std::string_view start_point) const {
  raw({"checkout", "-b", std::string(branch), std::string(start_point)});
}

void GitClient::delete_local_branch(std::string_view branch, bool force) const {
  raw({"branch", force ? "-D" : "-d", std::string(branch)});
}

GitClient GitClient::with_env(std::string key, std::string value) const {
  GitClient copy = *this;
  copy.env_.emplace_back(std::move(key), std::move(value));
  return copy;
}

} // namespace gitsaga
