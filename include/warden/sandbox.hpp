#pragma once

// warden/sandbox.hpp - Bounded child processes for verification checks.
//
// Checks (test runners, linters, type checkers) run as separate processes in
// their own session so a timeout can kill the whole process group. Output is
// captured up to max_output_bytes per stream.
//
// EXIT CODES:
//   124        timed out (killed with SIGKILL)
//   127        exec failed in the child
//   128 + sig  terminated by a signal
//
// The environment is exactly ProcessSpec::env; nothing from the parent leaks
// through unless the caller copies it. POSIX only.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace warden {

struct ProcessSpec {
  std::string command;                      // absolute path, see resolve_executable()
  std::vector<std::string> argv;            // arguments after argv[0]
  std::map<std::string, std::string> env;
  std::string cwd;
  std::uint64_t timeout_ms{5000};
  std::size_t max_output_bytes{64 * 1024};
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;                // "spawn_failed" when fork/pipe failed
  std::uint64_t duration_ms{0};
};

ProcessResult run_process(const ProcessSpec& spec);

// Looks `name` up on `path_env` (colon-separated). Names containing '/' are
// returned unchanged when executable. Returns "" when nothing matches.
std::string resolve_executable(const std::string& name, const std::string& path_env);

}  // namespace warden
