#ifndef PG_QUERY_H
#define PG_QUERY_H

#include "db_query.h"
#include <map>
#include <memory>

class pg_query : public db_query {
public:
  // conn is a pqxx::connection, shared so a reconnect cannot free it under a live query
  explicit pg_query(std::shared_ptr<void> conn, bool verbose_sql = false);
  ~pg_query() override;

  bool prepare(const fin_string& sql) override;
  bool execute() override;

  void bind(const fin_string& name, const fin_variant& value) override;

  bool next() override;
  finv_map get_row() override;
  std::vector<finv_map> get_all_rows() override;

  int rows_affected() const override;
  fin_string get_last_error() const override;
  fin_string get_sql() const override;

private:
  struct impl;
  std::unique_ptr<impl> pimpl_;

  fin_string sql_;
  std::map<fin_string, fin_variant> params_;

  size_t current_row_;
  int rows_affected_;
  fin_string last_error_;
  bool verbose_sql_;

  fin_string substitute_params(const fin_string& sql) const;
  fin_string quote_value(const fin_variant& value) const;
  finv_map row_to_variant_map(size_t row_index) const;
};

#endif // PG_QUERY_H
