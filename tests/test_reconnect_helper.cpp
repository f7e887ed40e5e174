#include <catch2/catch_all.hpp>
#include "../api/db/reconnect_helper.h"
#include "../api/db/db_connection.h"
#include "../api/db/db_query.h"
#include <atomic>
#include <chrono>
#include <thread>

// ============================================================================
// MOCK CONNECTION - For Unit Testing reconnect_helper
// ============================================================================

class mock_connection : public db_connection {
private:
  std::atomic<bool> connected_;
  std::atomic<int> reconnect_call_count_;
  std::atomic<bool> next_reconnect_will_succeed_;
  fin_string connection_string_;

public:
  mock_connection()
    : connected_(false)
    , reconnect_call_count_(0)
    , next_reconnect_will_succeed_(true)
  {}

  void set_connected(bool connected) { connected_ = connected; }
  void set_next_reconnect_succeeds(bool succeeds) { next_reconnect_will_succeed_ = succeeds; }
  int get_reconnect_call_count() const { return reconnect_call_count_; }
  void reset_call_count() { reconnect_call_count_ = 0; }

  bool connect(const fin_string& connection_string) override {
    connection_string_ = connection_string;
    connected_ = true;
    return true;
  }

  bool disconnect() override {
    connected_ = false;
    return true;
  }

  bool is_connected() const override {
    return connected_;
  }

  std::unique_ptr<db_query> create_query() override {
    return nullptr;
  }

  fin_string get_last_error() const override {
    return connected_ ? "" : "server closed the connection";
  }

  bool reconnect() override {
    reconnect_call_count_++;
    connected_ = next_reconnect_will_succeed_.load();
    return connected_;
  }
};

// Base 20 ms, capped at 80 ms
const int base_ms = 20;
const int cap_ms = 80;

SCENARIO("reconnect_helper restores a dropped connection in the background", "[unit][reconnect]") {

  GIVEN("A disconnected connection whose next reconnect succeeds") {
    mock_connection mock;
    mock.set_connected(false);
    mock.set_next_reconnect_succeeds(true);

    reconnect_helper helper(&mock, base_ms, cap_ms);

    WHEN("the loop is started") {
      helper.start_reconnect_loop();
      std::this_thread::sleep_for(std::chrono::milliseconds(150));

      THEN("one reconnect restores the connection and the loop ends") {
        REQUIRE(mock.get_reconnect_call_count() == 1);
        REQUIRE(mock.is_connected());
        REQUIRE_FALSE(helper.is_running());
        REQUIRE(helper.get_attempt_count() == 0);
      }
    }
  }

  GIVEN("A connection that keeps failing") {
    mock_connection mock;
    mock.set_connected(false);
    mock.set_next_reconnect_succeeds(false);

    reconnect_helper helper(&mock, base_ms, cap_ms);

    WHEN("the loop runs for several delays") {
      helper.start_reconnect_loop();
      // attempts at 0, 20, 60, 140 ms
      std::this_thread::sleep_for(std::chrono::milliseconds(300));

      THEN("attempts pile up while the loop keeps running") {
        REQUIRE(mock.get_reconnect_call_count() >= 3);
        REQUIRE(helper.get_attempt_count() >= 3);
        REQUIRE(helper.is_running());
      }

      THEN("the delay doubles up to the cap") {
        REQUIRE(helper.get_retry_after_ms() == cap_ms);
      }

      helper.stop();

      THEN("stop ends the loop") {
        REQUIRE_FALSE(helper.is_running());
      }
    }
  }

  GIVEN("A connection that fails twice then succeeds") {
    mock_connection mock;
    mock.set_connected(false);
    mock.set_next_reconnect_succeeds(false);

    reconnect_helper helper(&mock, base_ms, cap_ms);

    WHEN("the server comes back") {
      helper.start_reconnect_loop();
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      mock.set_next_reconnect_succeeds(true);
      std::this_thread::sleep_for(std::chrono::milliseconds(200));

      THEN("the connection is restored and the backoff reset") {
        REQUIRE(mock.is_connected());
        REQUIRE(helper.get_attempt_count() == 0);
        REQUIRE(helper.get_retry_after_ms() == base_ms);
        REQUIRE_FALSE(helper.is_running());
      }
    }
  }

  GIVEN("A helper with a running loop") {
    mock_connection mock;
    mock.set_connected(false);
    mock.set_next_reconnect_succeeds(false);

    reconnect_helper helper(&mock, 100, 100);

    WHEN("start_reconnect_loop is called twice") {
      helper.start_reconnect_loop();
      std::this_thread::sleep_for(std::chrono::milliseconds(30));

      mock.reset_call_count();
      helper.start_reconnect_loop();
      std::this_thread::sleep_for(std::chrono::milliseconds(150));

      THEN("only one loop is attempting") {
        // one attempt at 100 ms, a second loop would add its own immediately
        REQUIRE(mock.get_reconnect_call_count() <= 1);
      }

      helper.stop();
    }
  }

  GIVEN("A helper that finished a loop") {
    mock_connection mock;
    mock.set_connected(false);
    reconnect_helper helper(&mock, base_ms, cap_ms);
    helper.start_reconnect_loop();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    WHEN("the connection drops again") {
      mock.set_connected(false);
      helper.start_reconnect_loop();
      std::this_thread::sleep_for(std::chrono::milliseconds(50));

      THEN("a new loop reconnects it") {
        REQUIRE(mock.get_reconnect_call_count() == 2);
        REQUIRE(mock.is_connected());
      }
    }
  }
}
