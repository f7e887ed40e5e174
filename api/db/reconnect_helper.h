#ifndef RECONNECT_HELPER_H
#define RECONNECT_HELPER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

class db_connection;

// Background reconnection with exponential backoff (base, 2x base, ... up
// to the cap). The loop stops by itself after the first successful
// reconnect(). The connection is not owned.
class reconnect_helper {
public:
  explicit reconnect_helper(db_connection* connection, int base_delay_ms = 1000, int max_delay_ms = 60000);
  ~reconnect_helper();

  // No-op while a loop is already running
  void start_reconnect_loop();
  void stop();

  int get_retry_after_ms() const;
  int get_attempt_count() const;
  bool is_running() const;

  // Back to the base delay, e.g. after a manual reconnect
  void reset();

private:
  void reconnect_loop();
  void calculate_next_delay();

  db_connection* connection_;
  std::thread reconnect_thread_;

  std::atomic<bool> running_;

  const int base_delay_ms_;
  const int max_delay_ms_;
  std::atomic<int> attempt_count_;
  std::atomic<int> current_delay_ms_;

  std::chrono::steady_clock::time_point next_attempt_;

  std::mutex mutex_;
  std::condition_variable cv_;
};

#endif // RECONNECT_HELPER_H
