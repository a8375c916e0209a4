#include "evo/objective_queue.h"

#include "evo/data_io.h"
#include "evo/log.h"

#include <algorithm>
#include <utility>

#include <pthread.h>
#include <signal.h>

namespace evo {
namespace fs = std::filesystem;

namespace {
std::string trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

// SIGUSR1 only wakes the watcher for shutdown.
sigset_t stop_signal_set() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  sigaddset(&set, SIGUSR1);
  return set;
}
} // namespace

void ObjectiveQueue::push(std::string objective) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.push_back(std::move(objective));
  }
  cv_.notify_one();
}

std::optional<std::string> ObjectiveQueue::pop() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !items_.empty() || stop_.load(); });
  if (items_.empty()) {
    return std::nullopt;
  }
  auto objective = std::move(items_.back());
  items_.pop_back();
  return objective;
}

std::optional<std::string> ObjectiveQueue::try_pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (items_.empty()) {
    return std::nullopt;
  }
  auto objective = std::move(items_.back());
  items_.pop_back();
  return objective;
}

std::optional<std::string> ObjectiveQueue::wait_pop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return !items_.empty() || stop_.load(); });
  if (items_.empty()) {
    return std::nullopt;
  }
  auto objective = std::move(items_.back());
  items_.pop_back();
  return objective;
}

bool ObjectiveQueue::is_empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.empty();
}

size_t ObjectiveQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.size();
}

std::vector<std::string> ObjectiveQueue::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<std::string>(items_.rbegin(), items_.rend());
}

void ObjectiveQueue::request_stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
}

bool ObjectiveQueue::wait_for_stop(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, duration, [this] { return stop_.load(); });
}

StopSignalWatcher::StopSignalWatcher(ObjectiveQueue& queue) : queue_(queue) {}

StopSignalWatcher::~StopSignalWatcher() {
  stop();
}

bool StopSignalWatcher::block_signals() {
  const sigset_t set = stop_signal_set();
  return ::pthread_sigmask(SIG_BLOCK, &set, nullptr) == 0;
}

bool StopSignalWatcher::start() {
  if (running_) {
    return true;
  }
  sigset_t current;
  sigemptyset(&current);
  if (::pthread_sigmask(SIG_BLOCK, nullptr, &current) != 0 || !sigismember(&current, SIGINT) ||
      !sigismember(&current, SIGTERM) || !sigismember(&current, SIGUSR1)) {
    log::warn("stop signals are not blocked; signal watcher not started");
    return false;
  }
  running_ = true;
  thread_ = std::thread(&StopSignalWatcher::loop, this);
  return true;
}

void StopSignalWatcher::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (thread_.joinable()) {
    ::pthread_kill(thread_.native_handle(), SIGUSR1);
    thread_.join();
  }
}

void StopSignalWatcher::loop() {
  const sigset_t set = stop_signal_set();
  while (running_) {
    int sig = 0;
    if (::sigwait(&set, &sig) != 0) {
      log::error("sigwait failed; signal watcher exiting");
      return;
    }
    if (sig == SIGUSR1) {
      continue;
    }
    ++signals_seen_;
    log::info("stop requested by signal " + std::to_string(sig) + "; finishing the current cycle");
    queue_.request_stop();
  }
}

ObjectiveInbox::ObjectiveInbox(fs::path dir, ObjectiveQueue& queue, std::chrono::milliseconds poll_interval)
    : dir_(std::move(dir)), queue_(queue), poll_interval_(poll_interval) {}

ObjectiveInbox::~ObjectiveInbox() {
  stop();
}

bool ObjectiveInbox::start() {
  if (running_) {
    return true;
  }
  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) {
    log::warn("inbox unavailable: " + dir_.string() + ": " + ec.message());
    return false;
  }
  running_ = true;
  thread_ = std::thread(&ObjectiveInbox::loop, this);
  log::info("watching inbox " + dir_.string());
  return true;
}

void ObjectiveInbox::stop() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

size_t ObjectiveInbox::poll_once() {
  std::error_code ec;
  if (!fs::is_directory(dir_, ec)) {
    return 0;
  }
  std::vector<fs::path> files;
  for (const auto& entry : fs::directory_iterator(dir_, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".txt") {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());

  size_t pushed = 0;
  const fs::path processed = dir_ / "processed";
  for (const auto& file : files) {
    const auto objective = trim(data::read_text_file(file));
    fs::create_directories(processed, ec);
    fs::rename(file, processed / file.filename(), ec);
    if (ec) {
      // Leaving it in place would re-queue it on every scan.
      fs::remove(file, ec);
    }
    if (objective.empty()) {
      continue;
    }
    log::info("inbox objective from " + file.filename().string());
    queue_.push(objective);
    ++pushed;
  }
  return pushed;
}

void ObjectiveInbox::loop() {
  while (running_) {
    poll_once();
    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_.wait_for(lock, poll_interval_, [this] { return !running_.load(); });
  }
}

} // namespace evo
