// shimbridge/lsp/subprocess.cpp - fork/exec with pipes
#include "shimbridge/lsp/subprocess.hpp"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <thread>

namespace shimbridge::lsp
{

namespace
{

void close_pair(int (&fds)[2]) noexcept
{
  for (int & fd : fds) {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }
}

// Writes to a dead tool must surface as EPIPE, not kill the host compiler.
void ignore_sigpipe_once()
{
  static std::once_flag flag;
  std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

}  // namespace

Subprocess::SpawnResult Subprocess::spawn(
  const std::vector<std::string> & argv, bool inherit_stderr)
{
  SpawnResult result;
  if (argv.empty() || argv.front().empty()) {
    result.error = "no command to launch";
    return result;
  }

  ignore_sigpipe_once();

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};

  if (::pipe(in_pipe) != 0 || ::pipe(out_pipe) != 0 || ::pipe(err_pipe) != 0) {
    result.error = std::string("pipe failed: ") + std::strerror(errno);
    close_pair(in_pipe);
    close_pair(out_pipe);
    close_pair(err_pipe);
    return result;
  }
  ::fcntl(err_pipe[1], F_SETFD, FD_CLOEXEC);

  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto & a : argv) {
    c_argv.push_back(const_cast<char *>(a.c_str()));
  }
  c_argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    result.error = std::string("fork failed: ") + std::strerror(errno);
    close_pair(in_pipe);
    close_pair(out_pipe);
    close_pair(err_pipe);
    return result;
  }

  if (pid == 0) {
    // child
    ::dup2(in_pipe[0], STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    if (!inherit_stderr) {
      const int devnull = ::open("/dev/null", O_WRONLY);
      if (devnull >= 0) {
        ::dup2(devnull, STDERR_FILENO);
        ::close(devnull);
      }
    }

    ::close(in_pipe[0]);
    ::close(in_pipe[1]);
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[0]);

    ::execvp(c_argv[0], c_argv.data());

    // exec failed: report errno to the parent
    const int err = errno;
    (void)!::write(err_pipe[1], &err, sizeof(err));
    _exit(127);
  }

  // parent
  ::close(in_pipe[0]);
  ::close(out_pipe[1]);
  ::close(err_pipe[1]);

  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(err_pipe[0]);

  std::unique_ptr<Subprocess> proc(new Subprocess(pid, in_pipe[1], out_pipe[0]));
  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    result.error = "cannot launch '" + argv.front() + "': " + std::strerror(child_errno);
    proc->terminate(std::chrono::milliseconds(0));
    return result;
  }

  result.process = std::move(proc);
  return result;
}

Subprocess::~Subprocess() { terminate(std::chrono::milliseconds(200)); }

void Subprocess::close_stdin() noexcept
{
  if (in_fd_ >= 0) {
    ::close(in_fd_);
    in_fd_ = -1;
  }
}

bool Subprocess::is_running() noexcept
{
  if (pid_ <= 0) {
    return false;
  }
  int status = 0;
  const pid_t r = ::waitpid(pid_, &status, WNOHANG);
  if (r == pid_ || (r < 0 && errno == ECHILD)) {
    pid_ = -1;
    return false;
  }
  return true;
}

void Subprocess::terminate(std::chrono::milliseconds grace) noexcept
{
  close_stdin();

  if (pid_ > 0) {
    int status = 0;
    const auto deadline = std::chrono::steady_clock::now() + grace;
    for (;;) {
      const pid_t r = ::waitpid(pid_, &status, WNOHANG);
      if (r == pid_ || (r < 0 && errno != EINTR)) {
        pid_ = -1;
        break;
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        ::kill(pid_, SIGKILL);
        (void)::waitpid(pid_, &status, 0);
        pid_ = -1;
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  cleanup_fds();
}

void Subprocess::cleanup_fds() noexcept
{
  close_stdin();
  if (out_fd_ >= 0) {
    ::close(out_fd_);
    out_fd_ = -1;
  }
}

}  // namespace shimbridge::lsp
