#include "evo/subprocess.h"

#include "evo/log.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace evo {
namespace {
constexpr size_t kMaxLines = 200;
constexpr int kReadPollMs = 50;
}

SubprocessRunner::~SubprocessRunner() {
  if (running_) {
    signal_group(SIGKILL);
  }
  abandon_read_ = true;
  if (reader_thread_.joinable()) {
    reader_thread_.join();
  }
}

void SubprocessRunner::append_output(const char* data, size_t size) {
  std::lock_guard<std::mutex> lock(output_mutex_);
  output_.append(data, size);
  for (size_t i = 0; i < size; ++i) {
    if (data[i] == '\n') {
      if (!pending_line_.empty() && pending_line_.back() == '\r') {
        pending_line_.pop_back();
      }
      if (!pending_line_.empty()) {
        output_lines_.push_back(pending_line_);
      }
      pending_line_.clear();
    } else {
      pending_line_.push_back(data[i]);
    }
  }
  while (output_lines_.size() > kMaxLines) {
    output_lines_.pop_front();
  }
}

std::string SubprocessRunner::output() const {
  std::lock_guard<std::mutex> lock(output_mutex_);
  return output_;
}

std::vector<std::string> SubprocessRunner::recent_lines(size_t max_lines) const {
  std::lock_guard<std::mutex> lock(output_mutex_);
  std::vector<std::string> lines(output_lines_.begin(), output_lines_.end());
  if (!pending_line_.empty()) {
    lines.push_back(pending_line_);
  }
  const size_t count = std::min(max_lines, lines.size());
  return std::vector<std::string>(lines.end() - static_cast<std::ptrdiff_t>(count), lines.end());
}

bool SubprocessRunner::start(const std::vector<std::string>& args, const std::filesystem::path& cwd) {
  if (running_) {
    error_message_ = "process already running";
    return false;
  }
  if (reader_thread_.joinable()) {
    reader_thread_.join();
  }
  error_message_.clear();
  {
    std::lock_guard<std::mutex> lock(output_mutex_);
    output_.clear();
    pending_line_.clear();
    output_lines_.clear();
  }
  finished_ = false;
  abandon_read_ = false;
  exit_code_ = -1;

  if (args.empty()) {
    error_message_ = "missing command";
    return false;
  }

  int pipefd[2];
  if (pipe(pipefd) != 0) {
    error_message_ = "pipe failed";
    return false;
  }

  pid_t pid = fork();
  if (pid == 0) {
    // Own process group: terminal signals skip the tool, and a timeout can
    // signal everything the tool spawned.
    ::setpgid(0, 0);
    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_DFL);
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      _exit(126);
    }
    ::dup2(pipefd[1], STDOUT_FILENO);
    ::dup2(pipefd[1], STDERR_FILENO);
    ::close(pipefd[0]);
    ::close(pipefd[1]);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }

    std::vector<char*> cargs;
    cargs.reserve(args.size() + 1);
    for (const auto& arg : args) {
      cargs.push_back(const_cast<char*>(arg.c_str()));
    }
    cargs.push_back(nullptr);
    ::execvp(cargs[0], cargs.data());
    _exit(127);
  }

  if (pid < 0) {
    ::close(pipefd[0]);
    ::close(pipefd[1]);
    error_message_ = std::string("fork failed: ") + std::strerror(errno);
    return false;
  }

  ::close(pipefd[1]);
  // Also set from the parent so a kill right after fork reaches the group.
  ::setpgid(pid, pid);
  read_fd_ = pipefd[0];
  pid_ = static_cast<int>(pid);
  running_ = true;
  finished_ = false;

  reader_thread_ = std::thread(&SubprocessRunner::reader_loop, this);
  return true;
}

void SubprocessRunner::signal_group(int sig) {
  if (pid_ <= 0) {
    return;
  }
  if (::kill(-pid_, sig) != 0) {
    ::kill(pid_, sig);
  }
}

void SubprocessRunner::request_stop() {
  if (running_) {
    signal_group(SIGTERM);
  }
}

bool SubprocessRunner::wait(double timeout_seconds) {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + std::chrono::duration_cast<clock::duration>(
                                           std::chrono::duration<double>(timeout_seconds));
  bool timed_out = false;
  while (!finished_) {
    if (timeout_seconds > 0.0 && clock::now() >= deadline) {
      timed_out = true;
      request_stop();
      const auto grace = clock::now() + std::chrono::seconds(2);
      while (!finished_ && clock::now() < grace) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
      }
      if (!finished_) {
        signal_group(SIGKILL);
        // A descendant that left the group can still hold the pipe open.
        const auto drain = clock::now() + std::chrono::seconds(1);
        while (!finished_ && clock::now() < drain) {
          std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        abandon_read_ = true;
      }
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (reader_thread_.joinable()) {
    reader_thread_.join();
  }
  return !timed_out;
}

void SubprocessRunner::reader_loop() {
  char buffer[4096];
  for (;;) {
    if (abandon_read_) {
      break;
    }
    pollfd pfd{};
    pfd.fd = read_fd_;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, kReadPollMs);
    if (ready == 0 || (ready < 0 && errno == EINTR)) {
      continue;
    }
    if (ready < 0) {
      break;
    }
    const ssize_t n = ::read(read_fd_, buffer, sizeof(buffer));
    if (n > 0) {
      append_output(buffer, static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    break;
  }
  ::close(read_fd_);
  read_fd_ = -1;

  int status = 0;
  if (pid_ > 0) {
    pid_t reaped = -1;
    do {
      reaped = ::waitpid(pid_, &status, 0);
    } while (reaped < 0 && errno == EINTR);
    if (reaped != pid_) {
      exit_code_ = -1;
    } else if (WIFEXITED(status)) {
      exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      exit_code_ = 128 + WTERMSIG(status);
    }
  }
  running_ = false;
  finished_ = true;
}

CommandResult run_command(const std::vector<std::string>& args, const std::filesystem::path& cwd,
                          double timeout_seconds) {
  CommandResult result;
  SubprocessRunner runner;
  if (!runner.start(args, cwd)) {
    result.error = runner.error_message();
    evo::log::warn("command failed to start: " + result.error);
    return result;
  }
  result.started = true;
  result.timed_out = !runner.wait(timeout_seconds);
  result.exit_code = runner.exit_code();
  result.output = runner.output();
  if (result.timed_out) {
    result.error = "timed out after " + std::to_string(timeout_seconds) + "s";
    evo::log::warn("command timed out: " + (args.empty() ? std::string() : args.front()));
  } else if (result.exit_code == 127) {
    result.error = "command not found: " + args.front();
  } else if (result.exit_code != 0) {
    evo::log::warn(args.front() + " exited with " + std::to_string(result.exit_code));
    for (const auto& line : runner.recent_lines(5)) {
      evo::log::warn("  | " + line);
    }
  }
  return result;
}

std::vector<std::string> split_command_line(const std::string& command) {
  std::vector<std::string> out;
  std::string current;
  bool in_token = false;
  char quote = 0;
  for (char c : command) {
    if (quote) {
      if (c == quote) {
        quote = 0;
      } else {
        current.push_back(c);
      }
      continue;
    }
    if (c == '\'' || c == '"') {
      quote = c;
      in_token = true;
      continue;
    }
    if (c == ' ' || c == '\t' || c == '\n') {
      if (in_token) {
        out.push_back(current);
        current.clear();
        in_token = false;
      }
      continue;
    }
    current.push_back(c);
    in_token = true;
  }
  if (in_token) {
    out.push_back(current);
  }
  return out;
}

std::vector<std::string> substitute_placeholder(const std::vector<std::string>& args, const std::string& key,
                                                const std::string& value) {
  const std::string token = "{" + key + "}";
  std::vector<std::string> out;
  out.reserve(args.size());
  for (auto arg : args) {
    size_t pos = 0;
    while ((pos = arg.find(token, pos)) != std::string::npos) {
      arg.replace(pos, token.size(), value);
      pos += value.size();
    }
    out.push_back(arg);
  }
  return out;
}

} // namespace evo
