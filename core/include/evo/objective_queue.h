#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace evo {

// Thread-safe LIFO of objective texts. The most recently pushed objective
// is popped first, so a correction pushed after its original runs next.
class ObjectiveQueue {
 public:
  void push(std::string objective);

  // Blocks until an objective arrives or a stop is requested.
  std::optional<std::string> pop();
  std::optional<std::string> try_pop();
  std::optional<std::string> wait_pop(std::chrono::milliseconds timeout);

  bool is_empty() const;
  size_t size() const;
  // Newest first.
  std::vector<std::string> snapshot() const;

  void request_stop();
  bool stop_requested() const { return stop_.load(); }
  // Sleeps up to `duration`; returns true if a stop cut the wait short.
  bool wait_for_stop(std::chrono::milliseconds duration);

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> items_;
  std::atomic<bool> stop_{false};
};

// Turns SIGINT/SIGTERM into ObjectiveQueue::request_stop() from a sigwait
// thread, so no handler ever touches the queue's mutex. block_signals() has to
// run before any other thread is created; threads inherit the mask.
class StopSignalWatcher {
 public:
  explicit StopSignalWatcher(ObjectiveQueue& queue);
  ~StopSignalWatcher();

  StopSignalWatcher(const StopSignalWatcher&) = delete;
  StopSignalWatcher& operator=(const StopSignalWatcher&) = delete;

  static bool block_signals();
  // Fails if the stop signals are not blocked in the calling thread.
  bool start();
  void stop();
  int signals_seen() const { return signals_seen_.load(); }

 private:
  void loop();

  ObjectiveQueue& queue_;
  std::atomic<bool> running_{false};
  std::atomic<int> signals_seen_{0};
  std::thread thread_;
};

// Turns *.txt files dropped into a directory into objectives. Consumed files
// are moved to <dir>/processed.
class ObjectiveInbox {
 public:
  ObjectiveInbox(std::filesystem::path dir, ObjectiveQueue& queue,
                 std::chrono::milliseconds poll_interval = std::chrono::milliseconds(1000));
  ~ObjectiveInbox();

  ObjectiveInbox(const ObjectiveInbox&) = delete;
  ObjectiveInbox& operator=(const ObjectiveInbox&) = delete;

  bool start();
  void stop();
  // One synchronous scan; returns the number of objectives pushed.
  size_t poll_once();

 private:
  void loop();

  std::filesystem::path dir_;
  ObjectiveQueue& queue_;
  std::chrono::milliseconds poll_interval_;
  std::atomic<bool> running_{false};
  std::mutex wake_mutex_;
  std::condition_variable wake_;
  std::thread thread_;
};

} // namespace evo
