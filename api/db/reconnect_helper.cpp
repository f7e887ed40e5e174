#include "reconnect_helper.h"
#include "db_connection.h"
#include <algorithm>
#include <iostream>

reconnect_helper::reconnect_helper(db_connection* connection, int base_delay_ms, int max_delay_ms)
  : connection_(connection)
  , running_(false)
  , base_delay_ms_(base_delay_ms)
  , max_delay_ms_(max_delay_ms)
  , attempt_count_(0)
  , current_delay_ms_(base_delay_ms)
{
}

reconnect_helper::~reconnect_helper()
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();

  if (reconnect_thread_.joinable()) {
    reconnect_thread_.join();
  }
}

void reconnect_helper::start_reconnect_loop()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }

  // A finished loop leaves a joinable thread behind
  if (reconnect_thread_.joinable()) {
    reconnect_thread_.join();
  }

  running_ = true;
  next_attempt_ = std::chrono::steady_clock::now();
  reconnect_thread_ = std::thread(&reconnect_helper::reconnect_loop, this);
}

void reconnect_helper::stop()
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();

  if (reconnect_thread_.joinable()) {
    reconnect_thread_.join();
  }
}

void reconnect_helper::reconnect_loop()
{
  while (running_) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (cv_.wait_until(lock, next_attempt_, [this] { return !running_; })) {
        break;
      }
    }

    std::cout << "[DB] Attempting reconnect (attempt " << attempt_count_ + 1 << ")..." << std::endl;

    if (connection_->reconnect()) {
      std::cout << "[DB] Reconnect successful" << std::endl;
      reset();
      std::lock_guard<std::mutex> lock(mutex_);
      running_ = false;
      break;
    }

    attempt_count_++;
    calculate_next_delay();

    int delay_ms = current_delay_ms_.load();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      next_attempt_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms);
    }
    std::cerr << "[DB] Reconnect failed: " << connection_->get_last_error()
              << ". Next attempt in " << delay_ms << " ms" << std::endl;
  }
}

void reconnect_helper::calculate_next_delay()
{
  // The first failure keeps the base delay, later ones double it
  if (attempt_count_ <= 1) {
    return;
  }
  int current = current_delay_ms_.load();
  current_delay_ms_.store(std::min(current * 2, max_delay_ms_));
}

int reconnect_helper::get_retry_after_ms() const
{
  return current_delay_ms_;
}

int reconnect_helper::get_attempt_count() const
{
  return attempt_count_;
}

bool reconnect_helper::is_running() const
{
  return running_;
}

void reconnect_helper::reset()
{
  attempt_count_.store(0);
  current_delay_ms_.store(base_delay_ms_);
}
