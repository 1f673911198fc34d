#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace search_cache {

// Runs `fn` on its own thread every `interval` until stop() or destruction.
class PeriodicTask {
public:
  PeriodicTask(std::string name, std::chrono::milliseconds interval,
               std::function<void()> fn);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask &) = delete;
  PeriodicTask &operator=(const PeriodicTask &) = delete;

  void start();
  void stop();
  // Wakes the thread for an immediate run.
  void poke();
  bool running() const { return thread_.joinable(); }
  const std::string &name() const { return name_; }

private:
  void loop();

  std::string name_;
  std::chrono::milliseconds interval_;
  std::function<void()> fn_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stopping_{false};
  bool poked_{false};
  std::thread thread_;
};

} // namespace search_cache
