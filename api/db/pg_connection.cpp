#include "pg_connection.h"
#include "pg_query.h"
#include "db_exceptions.h"
#include <pqxx/pqxx>
#include <iostream>

struct pg_connection::impl {
  std::shared_ptr<pqxx::connection> conn;
};

pg_connection::pg_connection()
  : pimpl_(std::make_unique<impl>())
  , verbose_sql_(false)
  , reconnect_helper_(std::make_unique<reconnect_helper>(this))
{
}

pg_connection::~pg_connection()
{
  // The helper thread calls back into this object
  reconnect_helper_->stop();
  disconnect();
}

bool pg_connection::connect(const fin_string& connection_string)
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    connection_string_ = connection_string;
  }
  try {
    auto conn = std::make_shared<pqxx::connection>(connection_string.to_std_const());
    std::lock_guard<std::mutex> lock(mutex_);
    pimpl_->conn = conn;
    last_error_ = "";
    return conn->is_open();
  } catch (const std::exception& e) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = fin_string("Connection failed: ") + e.what();
    std::cerr << "[DB] " << last_error_ << std::endl;
    return false;
  }
}

bool pg_connection::disconnect()
{
  std::shared_ptr<pqxx::connection> old;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    old.swap(pimpl_->conn);
    last_error_ = "";
  }
  // Closed here unless a query still holds it
  old.reset();
  return true;
}

bool pg_connection::is_connected() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return pimpl_->conn && pimpl_->conn->is_open();
}

bool pg_connection::reconnect()
{
  fin_string connection_string;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    connection_string = connection_string_;
  }
  if (connection_string.empty()) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = "Cannot reconnect: no connection string stored";
    return false;
  }

  std::shared_ptr<pqxx::connection> old;
  try {
    auto conn = std::make_shared<pqxx::connection>(connection_string.to_std_const());
    std::lock_guard<std::mutex> lock(mutex_);
    if (!conn->is_open()) {
      last_error_ = "Reconnection failed: connection not open";
      return false;
    }
    old = pimpl_->conn;
    pimpl_->conn = conn;
    last_error_ = "";
  } catch (const std::exception& e) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = fin_string("Reconnection failed: ") + e.what();
    return false;
  }
  return true;
}

std::unique_ptr<db_query> pg_connection::create_query()
{
  std::shared_ptr<pqxx::connection> conn;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pimpl_->conn && pimpl_->conn->is_open()) {
      conn = pimpl_->conn;
    }
  }
  if (!conn) {
    reconnect_helper_->start_reconnect_loop();
    throw db_not_reachable("Database not reachable. Reconnect in progress.",
                           reconnect_helper_->get_retry_after_ms(),
                           reconnect_helper_->get_attempt_count());
  }
  return std::make_unique<pg_query>(conn, verbose_sql_);
}

fin_string pg_connection::get_last_error() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

void pg_connection::set_verbose_sql(bool verbose)
{
  verbose_sql_ = verbose;
}
