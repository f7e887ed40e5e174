#include <catch2/catch_all.hpp>
#include "../api/db/pg_connection.h"
#include "../api/db/db_query.h"
#include "../api/db/db_exceptions.h"
#include "../aiprocesses/pipeline/fin_ingest_config.h"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

SCENARIO("Workers use a connection while it reconnects in the background", "[unit][db]") {
  GIVEN("A connection to a server socket that does not exist") {
    pg_connection connection;
    REQUIRE_FALSE(connection.connect("host=/nonexistent_fingest_socket port=5432 connect_timeout=1"));
    REQUIRE_FALSE(connection.get_last_error().empty());

    WHEN("Several workers create queries while the reconnect loop runs") {
      std::atomic<int> not_reachable(0);
      std::atomic<int> other_errors(0);
      std::atomic<bool> stop(false);

      std::vector<std::thread> workers;
      for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&]() {
          while (!stop) {
            try {
              auto query = connection.create_query();
              other_errors++;
            } catch (const db_not_reachable&) {
              not_reachable++;
            } catch (const std::exception&) {
              other_errors++;
            }
            connection.is_connected();
            connection.get_last_error();
          }
        });
      }

      std::this_thread::sleep_for(std::chrono::milliseconds(300));
      stop = true;
      for (auto& worker : workers) {
        worker.join();
      }

      THEN("Every attempt is refused as not reachable") {
        REQUIRE(not_reachable > 0);
        REQUIRE(other_errors == 0);
        REQUIRE_FALSE(connection.is_connected());
      }
    }
  }
}

SCENARIO("A query keeps its connection across a reconnect", "[integration][db]") {
  fin_store_settings settings = fin_store_settings::from_env();
  if (settings.database_url.empty()) {
    SKIP("DATABASE_URL is required");
  }

  GIVEN("An open connection and a prepared query") {
    pg_connection connection;
    REQUIRE(connection.connect(settings.database_url));

    auto query = connection.create_query();
    REQUIRE(query->prepare("SELECT :value::int AS answer"));
    query->bind("value", 42);

    WHEN("The connection is replaced before the query runs") {
      std::thread reconnecting([&connection]() { connection.reconnect(); });
      reconnecting.join();

      THEN("The earlier query still executes") {
        REQUIRE(query->execute());
        REQUIRE(query->next());
        REQUIRE(query->get_row()["answer"].int_value() == 42);
      }

      AND_THEN("New queries use the new connection") {
        REQUIRE(connection.is_connected());
        auto fresh = connection.create_query();
        REQUIRE(fresh->prepare("SELECT 1 AS one"));
        REQUIRE(fresh->execute());
      }
    }
  }
}
