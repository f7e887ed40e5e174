#ifndef DB_CONNECTION_H
#define DB_CONNECTION_H

#include "../../utils/fin_string.h"
#include <memory>

class db_query;

class db_connection {
public:
  virtual ~db_connection() = default;

  virtual bool connect(const fin_string& connection_string) = 0;
  virtual bool disconnect() = 0;
  virtual bool is_connected() const = 0;

  // Reopen with the connection string of the last connect()
  virtual bool reconnect() = 0;

  // Throws db_not_reachable while the connection is down
  virtual std::unique_ptr<db_query> create_query() = 0;

  virtual fin_string get_last_error() const = 0;
};

#endif // DB_CONNECTION_H
