#ifndef PG_CONNECTION_H
#define PG_CONNECTION_H

#include "db_connection.h"
#include "reconnect_helper.h"
#include <memory>
#include <mutex>

class pg_connection : public db_connection {
public:
  pg_connection();
  ~pg_connection() override;

  bool connect(const fin_string& connection_string) override;
  bool disconnect() override;
  bool is_connected() const override;
  bool reconnect() override;

  std::unique_ptr<db_query> create_query() override;

  fin_string get_last_error() const override;

  // Log every executed statement with [SQL]
  void set_verbose_sql(bool verbose);

private:
  struct impl;
  std::unique_ptr<impl> pimpl_;

  // Guards the connection handle and last_error_; the reconnect thread
  // swaps the handle while workers create queries
  mutable std::mutex mutex_;
  fin_string last_error_;
  fin_string connection_string_;
  bool verbose_sql_;
  std::unique_ptr<reconnect_helper> reconnect_helper_;
};

#endif // PG_CONNECTION_H
