#include "process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <system_error>
#include <thread>

extern char** environ;

namespace fleet::compute {
namespace {

void AppendLimited(std::string& dst, const char* src, ssize_t n, std::size_t limit) {
  if (n <= 0)
    return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  dst.append(src, std::min<std::size_t>(static_cast<std::size_t>(n), avail));
}

bool Scrubbed(const char* entry, const std::vector<std::string>& scrub) {
  for (const auto& name : scrub) {
    if (std::strncmp(entry, name.c_str(), name.size()) == 0 && entry[name.size()] == '=') {
      return true;
    }
  }
  return false;
}

void ClosePipe(int fds[2]) {
  for (int i = 0; i < 2; ++i) {
    if (fds[i] >= 0) {
      close(fds[i]);
      fds[i] = -1;
    }
  }
}

} // namespace

ProcessResult RunProcess(const ProcessSpec& spec) {
  // A child that exits without draining stdin must not kill us with SIGPIPE.
  static std::once_flag ignore_sigpipe;
  std::call_once(ignore_sigpipe, [] { signal(SIGPIPE, SIG_IGN); });

  // Everything the child needs is built before fork().
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.args.begin(), spec.args.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all)
    argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<char*> envp;
  for (char** e = environ; e && *e; ++e) {
    if (!Scrubbed(*e, spec.scrub_env)) {
      envp.push_back(*e);
    }
  }
  envp.push_back(nullptr);

  int in_pipe[2]  = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  // Close-on-exec so children forked concurrently by other executor threads
  // do not hold our stdin write end open; dup2 clears it on fds 0-2.
  if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0) {
    const int err = errno;
    ClosePipe(in_pipe);
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    throw std::system_error(err, std::generic_category(), "pipe2");
  }

  pid_t pid = fork();
  if (pid < 0) {
    const int err = errno;
    ClosePipe(in_pipe);
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    throw std::system_error(err, std::generic_category(), "fork " + spec.command);
  }

  if (pid == 0) {
    setsid();
    dup2(in_pipe[0], STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    execvpe(argv[0], argv.data(), envp.data());
    _exit(127);
  }

  close(in_pipe[0]);
  close(out_pipe[1]);
  close(err_pipe[1]);
  fcntl(in_pipe[1], F_SETFL, O_NONBLOCK);
  fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  ProcessResult result;
  std::size_t   written = 0;
  if (spec.stdin_data.empty()) {
    close(in_pipe[1]);
    in_pipe[1] = -1;
  }

  const auto deadline = std::chrono::steady_clock::now() + spec.timeout;
  char       buf[4096];
  int        status = 0;
  while (true) {
    if (in_pipe[1] >= 0) {
      ssize_t n = write(in_pipe[1], spec.stdin_data.data() + written, spec.stdin_data.size() - written);
      if (n > 0) {
        written += static_cast<std::size_t>(n);
      }
      if (written == spec.stdin_data.size() || (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK)) {
        close(in_pipe[1]);
        in_pipe[1] = -1;
      }
    }

    ssize_t n = read(out_pipe[0], buf, sizeof(buf));
    AppendLimited(result.stdout_text, buf, n, spec.max_output_bytes);
    n = read(err_pipe[0], buf, sizeof(buf));
    AppendLimited(result.stderr_text, buf, n, spec.max_output_bytes);

    pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid) {
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      waitpid(pid, &status, 0);
      result.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  if (in_pipe[1] >= 0) {
    close(in_pipe[1]);
  }
  while (true) {
    ssize_t n = read(out_pipe[0], buf, sizeof(buf));
    if (n <= 0)
      break;
    AppendLimited(result.stdout_text, buf, n, spec.max_output_bytes);
  }
  while (true) {
    ssize_t n = read(err_pipe[0], buf, sizeof(buf));
    if (n <= 0)
      break;
    AppendLimited(result.stderr_text, buf, n, spec.max_output_bytes);
  }
  close(out_pipe[0]);
  close(err_pipe[0]);

  if (!result.timed_out && WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (!result.timed_out && WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

} // namespace fleet::compute
