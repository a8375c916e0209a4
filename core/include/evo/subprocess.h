#pragma once

#include <atomic>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace evo {

struct CommandResult {
  bool started = false;
  bool timed_out = false;
  int exit_code = -1;
  // Combined stdout+stderr, verbatim.
  std::string output;
  std::string error;

  bool ok() const { return started && !timed_out && exit_code == 0; }
};

class SubprocessRunner {
 public:
  SubprocessRunner() = default;
  ~SubprocessRunner();

  SubprocessRunner(const SubprocessRunner&) = delete;
  SubprocessRunner& operator=(const SubprocessRunner&) = delete;

  bool start(const std::vector<std::string>& args, const std::filesystem::path& cwd);
  void request_stop();
  // Blocks until the child exits. A positive timeout sends SIGTERM, then
  // SIGKILL, to the child's process group once it elapses. Returns false on
  // timeout.
  bool wait(double timeout_seconds);

  int exit_code() const { return exit_code_.load(); }
  const std::string& error_message() const { return error_message_; }

  std::string output() const;
  std::vector<std::string> recent_lines(size_t max_lines) const;

 private:
  void append_output(const char* data, size_t size);
  void reader_loop();
  void signal_group(int sig);

  std::atomic<bool> running_{false};
  std::atomic<bool> finished_{false};
  std::atomic<bool> abandon_read_{false};
  std::atomic<int> exit_code_{-1};

  std::string error_message_;

  mutable std::mutex output_mutex_;
  std::string output_;
  std::string pending_line_;
  std::deque<std::string> output_lines_;

  int read_fd_ = -1;
  int pid_ = -1;

  std::thread reader_thread_;
};

// Runs args[0] with args in cwd and collects its output.
CommandResult run_command(const std::vector<std::string>& args, const std::filesystem::path& cwd,
                          double timeout_seconds);

// Splits a command line on whitespace; single and double quotes group.
std::vector<std::string> split_command_line(const std::string& command);

// Replaces every `{key}` in each argument.
std::vector<std::string> substitute_placeholder(const std::vector<std::string>& args, const std::string& key,
                                                const std::string& value);

} // namespace evo
