#ifndef _WIN32

#include "warden/sandbox.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <thread>

namespace warden {

namespace {
void append_limited(std::string &dst, const char *src, ssize_t n,
                    std::size_t limit, bool &truncated) {
  if (n <= 0)
    return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take =
      std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n) || dst.size() >= limit) {
    truncated = true;
  }
}

// Drains whatever is currently readable. Returns false once the pipe is at
// EOF or broken.
bool drain(int fd, std::string &dst, std::size_t limit, bool &truncated) {
  char buf[4096];
  while (true) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
      append_limited(dst, buf, n, limit, truncated);
      continue;
    }
    if (n == 0)
      return false;
    if (errno == EINTR)
      continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

bool is_executable(const std::string &path) {
  return !path.empty() && access(path.c_str(), X_OK) == 0;
}
} // namespace

std::string resolve_executable(const std::string &name,
                               const std::string &path_env) {
  if (name.empty())
    return {};
  if (name.find('/') != std::string::npos)
    return is_executable(name) ? name : std::string{};
  std::size_t start = 0;
  while (start <= path_env.size()) {
    std::size_t end = path_env.find(':', start);
    if (end == std::string::npos)
      end = path_env.size();
    std::string dir = path_env.substr(start, end - start);
    if (dir.empty())
      dir = ".";
    const std::string candidate = dir + "/" + name;
    if (is_executable(candidate))
      return candidate;
    start = end + 1;
  }
  return {};
}

ProcessResult run_process(const ProcessSpec &spec) {
  ProcessResult result;
  const auto started = std::chrono::steady_clock::now();
  int out_pipe[2];
  int err_pipe[2];
  if (pipe(out_pipe) != 0) {
    result.error_message = "spawn_failed";
    return result;
  }
  if (pipe(err_pipe) != 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    result.error_message = "spawn_failed";
    return result;
  }

  // Build argv/envp before fork: the child must not allocate.
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char *> argv;
  argv.reserve(all.size() + 1);
  for (auto &s : all)
    argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs;
  for (const auto &[k, v] : spec.env)
    envs.push_back(k + "=" + v);
  std::vector<char *> envp;
  for (auto &e : envs)
    envp.push_back(e.data());
  envp.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    result.error_message = "spawn_failed";
    return result;
  }

  if (pid == 0) {
    setsid();
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);

    if (!spec.cwd.empty()) {
      if (chdir(spec.cwd.c_str()) != 0)
        _exit(127);
    }

    // CPU time limit derived from timeout (ceiling to seconds), a backstop
    // for the wall-clock deadline enforced by the parent.
    if (spec.timeout_ms > 0) {
      struct rlimit rl;
      rl.rlim_cur = (spec.timeout_ms + 999) / 1000;
      rl.rlim_max = rl.rlim_cur + 1;
      setrlimit(RLIMIT_CPU, &rl);
    }

    execve(spec.command.c_str(), argv.data(), envp.data());
    _exit(127);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);
  fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  const auto deadline = started + std::chrono::milliseconds(spec.timeout_ms);
  int status = 0;
  while (true) {
    drain(out_pipe[0], result.stdout_text, spec.max_output_bytes,
          result.stdout_truncated);
    drain(err_pipe[0], result.stderr_text, spec.max_output_bytes,
          result.stderr_truncated);

    pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid)
      break;
    if (std::chrono::steady_clock::now() >= deadline) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      waitpid(pid, &status, 0);
      result.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  // Grandchildren may still hold the write ends; take what is buffered and
  // stop at EAGAIN rather than waiting for EOF.
  drain(out_pipe[0], result.stdout_text, spec.max_output_bytes,
        result.stdout_truncated);
  drain(err_pipe[0], result.stderr_text, spec.max_output_bytes,
        result.stderr_truncated);
  close(out_pipe[0]);
  close(err_pipe[0]);

  if (result.stdout_truncated)
    result.stdout_text += "(truncated)";
  if (result.stderr_truncated)
    result.stderr_text += "(truncated)";

  if (result.timed_out) {
    result.exit_code = 124;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  result.duration_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)
          .count());
  return result;
}

} // namespace warden

#endif
