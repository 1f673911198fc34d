#include "search_cache/periodic_task.hpp"

#include <spdlog/spdlog.h>

namespace search_cache {

PeriodicTask::PeriodicTask(std::string name,
                           std::chrono::milliseconds interval,
                           std::function<void()> fn)
    : name_(std::move(name)), interval_(interval), fn_(std::move(fn)) {}

PeriodicTask::~PeriodicTask() { stop(); }

void PeriodicTask::start() {
  if (thread_.joinable())
    return;
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = false;
  }
  thread_ = std::thread([this] { loop(); });
  spdlog::debug("{} started, interval {}ms", name_, interval_.count());
}

void PeriodicTask::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    spdlog::debug("{} stopped", name_);
  }
}

void PeriodicTask::poke() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    poked_ = true;
  }
  cv_.notify_all();
}

void PeriodicTask::loop() {
  std::unique_lock<std::mutex> lock(mu_);
  while (!stopping_) {
    cv_.wait_for(lock, interval_, [this] { return stopping_ || poked_; });
    if (stopping_)
      break;
    poked_ = false;
    lock.unlock();
    fn_();
    lock.lock();
  }
}

} // namespace search_cache
