// shimbridge/lsp/subprocess.hpp - Child process with piped stdin/stdout
#pragma once

#include <sys/types.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace shimbridge::lsp
{

/**
 * A spawned child process. The parent writes to the child's stdin and reads
 * from its stdout; the child's stderr is discarded unless requested.
 *
 * Destroying a Subprocess closes both pipes, waits briefly for the child to
 * exit and kills it otherwise.
 */
class Subprocess
{
public:
  struct SpawnResult
  {
    std::unique_ptr<Subprocess> process;
    std::string error;
  };

  /**
   * Launch `argv[0]` (searched in PATH) with the given arguments.
   *
   * Exec failures in the child are reported back through a close-on-exec
   * pipe, so a missing executable is an error here rather than an
   * immediately closed stdout later.
   */
  [[nodiscard]] static SpawnResult spawn(
    const std::vector<std::string> & argv, bool inherit_stderr = false);

  Subprocess(const Subprocess &) = delete;
  Subprocess & operator=(const Subprocess &) = delete;

  ~Subprocess();

  [[nodiscard]] pid_t pid() const noexcept { return pid_; }
  [[nodiscard]] int stdin_fd() const noexcept { return in_fd_; }
  [[nodiscard]] int stdout_fd() const noexcept { return out_fd_; }

  /// Close the child's stdin (signals end of input).
  void close_stdin() noexcept;

  /// Whether the child has not been reaped yet.
  [[nodiscard]] bool is_running() noexcept;

  /// Wait up to `grace` for the child to exit, then SIGKILL and reap it.
  void terminate(std::chrono::milliseconds grace) noexcept;

private:
  Subprocess(pid_t pid, int in_fd, int out_fd) : pid_(pid), in_fd_(in_fd), out_fd_(out_fd) {}

  void cleanup_fds() noexcept;

  pid_t pid_ = -1;
  int in_fd_ = -1;   // parent writes to child's stdin
  int out_fd_ = -1;  // parent reads from child's stdout
};

}  // namespace shimbridge::lsp
