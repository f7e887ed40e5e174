#ifndef DB_EXCEPTIONS_H
#define DB_EXCEPTIONS_H

#include "../../utils/fin_string.h"
#include <exception>

// db_exception (base)
// ├── db_connection_error
// │   └── db_not_reachable
// └── db_query_error

class db_exception : public std::exception {
protected:
  fin_string message_;
  fin_string sql_;
  fin_string database_error_;

public:
  explicit db_exception(const fin_string& message)
    : message_(message) {}

  db_exception(const fin_string& message, const fin_string& sql)
    : message_(message), sql_(sql) {}

  db_exception(const fin_string& message, const fin_string& sql, const fin_string& database_error)
    : message_(message), sql_(sql), database_error_(database_error) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

  fin_string get_sql() const { return sql_; }
  fin_string get_database_error() const { return database_error_; }
};

class db_connection_error : public db_exception {
public:
  explicit db_connection_error(const fin_string& message)
    : db_exception(message) {}
};

// Raised immediately while a background reconnect is running
class db_not_reachable : public db_connection_error {
  int retry_after_ms_;
  int attempts_;

public:
  db_not_reachable(const fin_string& message, int retry_after_ms, int attempts)
    : db_connection_error(message), retry_after_ms_(retry_after_ms), attempts_(attempts) {}

  int get_retry_after_ms() const { return retry_after_ms_; }
  int get_attempts() const { return attempts_; }
};

class db_query_error : public db_exception {
public:
  using db_exception::db_exception;
};

#endif // DB_EXCEPTIONS_H
