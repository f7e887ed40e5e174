#ifndef DB_QUERY_H
#define DB_QUERY_H

#include "../../utils/fin_string.h"
#include "../../utils/fin_variant.h"
#include <vector>

// One SQL statement with ":name" placeholders, executed in its own transaction
class db_query {
public:
  virtual ~db_query() = default;

  virtual bool prepare(const fin_string& sql) = 0;
  virtual bool execute() = 0;

  virtual void bind(const fin_string& name, const fin_variant& value) = 0;

  virtual bool next() = 0;
  virtual finv_map get_row() = 0;
  virtual std::vector<finv_map> get_all_rows() = 0;

  virtual int rows_affected() const = 0;
  virtual fin_string get_last_error() const = 0;
  virtual fin_string get_sql() const = 0;
};

#endif // DB_QUERY_H
