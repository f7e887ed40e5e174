#include "pg_query.h"
#include <pqxx/pqxx>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iostream>

// Long vector literals are shortened to their first two values in the log
static fin_string truncate_vectors_in_sql(const fin_string& sql)
{
  std::string result = sql.to_std_const();

  size_t pos = 0;
  while ((pos = result.find("'[", pos)) != std::string::npos) {
    size_t start = pos + 2;
    size_t end = result.find("]'", start);
    if (end == std::string::npos) {
      break;
    }

    std::string content = result.substr(start, end - start);
    size_t first_comma = content.find(',');
    size_t second_comma = first_comma == std::string::npos ? std::string::npos : content.find(',', first_comma + 1);
    if (content.size() <= 100 || second_comma == std::string::npos) {
      pos = end + 2;
      continue;
    }

    size_t total = std::count(content.begin(), content.end(), ',') + 1;
    std::string replacement = "'[" + content.substr(0, second_comma) + ", ... (" +
                              std::to_string(total - 2) + " more)]'";
    result = result.substr(0, pos) + replacement + result.substr(end + 2);
    pos += replacement.size();
  }

  return result;
}

static fin_variant::state oid_to_variant_state(int oid)
{
  switch (oid) {
    case 16:   return fin_variant::bool_state;    // bool
    case 20:                                      // int8
    case 21:                                      // int2
    case 23:   return fin_variant::int_state;     // int4
    case 700:                                     // float4
    case 701:                                     // float8
    case 1700: return fin_variant::double_state;  // numeric
    default:   return fin_variant::string_state;
  }
}

static bool is_text_oid(int oid)
{
  return oid == 25 || oid == 1043 || oid == 3802 || oid == 114;  // text, varchar, jsonb, json
}

static fin_string format_double(double value)
{
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.9g", value);
  return fin_string(buffer);
}

struct pg_query::impl {
  std::shared_ptr<pqxx::connection> conn;
  std::unique_ptr<pqxx::work> work;
  std::unique_ptr<pqxx::result> result;
};

pg_query::pg_query(std::shared_ptr<void> conn, bool verbose_sql)
  : pimpl_(std::make_unique<impl>())
  , current_row_(0)
  , rows_affected_(0)
  , verbose_sql_(verbose_sql)
{
  pimpl_->conn = std::static_pointer_cast<pqxx::connection>(conn);
}

pg_query::~pg_query()
{
  if (pimpl_->work) {
    try {
      pimpl_->work->abort();
    } catch (const std::exception& e) {
      std::cerr << "[DB] Abort failed: " << e.what() << std::endl;
    }
  }
}

bool pg_query::prepare(const fin_string& sql)
{
  sql_ = sql;
  params_.clear();
  pimpl_->result.reset();
  current_row_ = 0;
  rows_affected_ = 0;
  last_error_ = "";
  return !sql_.empty();
}

bool pg_query::execute()
{
  fin_string final_sql;
  try {
    if (!pimpl_->conn || !pimpl_->conn->is_open()) {
      last_error_ = "Connection not open";
      return false;
    }

    final_sql = substitute_params(sql_);
    if (verbose_sql_) {
      std::cout << "[SQL] " << truncate_vectors_in_sql(final_sql) << std::endl;
    }

    pimpl_->work = std::make_unique<pqxx::work>(*pimpl_->conn);
    pimpl_->result = std::make_unique<pqxx::result>(pimpl_->work->exec(final_sql.to_std_const()));
    rows_affected_ = static_cast<int>(pimpl_->result->affected_rows());
    current_row_ = 0;
    pimpl_->work->commit();
    pimpl_->work.reset();

    last_error_ = "";
    return true;
  } catch (const std::exception& e) {
    last_error_ = fin_string("Execute failed: ") + e.what();
    std::cerr << "[DB] " << last_error_ << std::endl;
    if (pimpl_->work) {
      try {
        pimpl_->work->abort();
      } catch (const std::exception& abort_error) {
        std::cerr << "[DB] Abort failed: " << abort_error.what() << std::endl;
      }
      pimpl_->work.reset();
    }
    return false;
  }
}

void pg_query::bind(const fin_string& name, const fin_variant& value)
{
  params_[name] = value;
}

bool pg_query::next()
{
  if (!pimpl_->result || current_row_ >= pimpl_->result->size()) {
    return false;
  }
  current_row_++;
  return true;
}

finv_map pg_query::get_row()
{
  if (!pimpl_->result || current_row_ == 0 || current_row_ > pimpl_->result->size()) {
    return finv_map();
  }
  return row_to_variant_map(current_row_ - 1);
}

std::vector<finv_map> pg_query::get_all_rows()
{
  std::vector<finv_map> rows;
  if (!pimpl_->result) {
    return rows;
  }
  rows.reserve(pimpl_->result->size());
  for (size_t i = 0; i < pimpl_->result->size(); ++i) {
    rows.push_back(row_to_variant_map(i));
  }
  return rows;
}

int pg_query::rows_affected() const
{
  return rows_affected_;
}

fin_string pg_query::get_last_error() const
{
  return last_error_;
}

fin_string pg_query::get_sql() const
{
  return sql_;
}

fin_string pg_query::quote_value(const fin_variant& value) const
{
  if (value.is_null()) {
    return "NULL";
  }
  if (value.is_int()) {
    return fin_string(value.int_value());
  }
  if (value.is_double()) {
    return format_double(value.double_value());
  }
  if (value.is_bool()) {
    return value.bool_value() ? "true" : "false";
  }
  if (value.is_vector()) {
    // pgvector literal: '[0.1,0.2,...]'
    fin_string literal = "[";
    const finv_vector& vec = value.vector_value();
    for (size_t i = 0; i < vec.size(); ++i) {
      if (i > 0) literal += ",";
      literal += format_double(vec[i].convert(fin_variant::double_state).double_value());
    }
    literal += "]";
    return pimpl_->conn->quote(literal.to_std_const());
  }
  return pimpl_->conn->quote(value.convert(fin_variant::string_state).string_value().to_std_const());
}

// Single left-to-right pass, so text inside an inserted value is never
// scanned for placeholders again. "::" casts are copied unchanged.
fin_string pg_query::substitute_params(const fin_string& sql) const
{
  const std::string& in = sql.to_std_const();
  std::string out;
  out.reserve(in.size());

  size_t i = 0;
  while (i < in.size()) {
    char c = in[i];
    if (c != ':') {
      out += c;
      ++i;
      continue;
    }
    if (i + 1 < in.size() && in[i + 1] == ':') {
      out += "::";
      i += 2;
      continue;
    }

    size_t end = i + 1;
    while (end < in.size() && (std::isalnum(static_cast<unsigned char>(in[end])) || in[end] == '_')) {
      ++end;
    }
    auto param = params_.find(in.substr(i + 1, end - i - 1));
    if (end == i + 1 || param == params_.end()) {
      out += c;
      ++i;
      continue;
    }
    out += quote_value(param->second).to_std_const();
    i = end;
  }
  return out;
}

finv_map pg_query::row_to_variant_map(size_t row_index) const
{
  finv_map row_map;
  const auto& row = (*pimpl_->result)[static_cast<int>(row_index)];

  for (size_t col = 0; col < row.size(); ++col) {
    const auto& field = row[static_cast<int>(col)];
    fin_string column_name = field.name();

    if (field.is_null()) {
      row_map[column_name] = fin_variant();
      continue;
    }

    fin_string value_str = field.c_str();
    int oid = static_cast<int>(field.type());

    // pgvector columns come back as "[1.2,3.4,...]"
    if (!is_text_oid(oid) && value_str.starts_with("[") && value_str.ends_with("]")) {
      finv_vector vec;
      for (const auto& part : value_str.substr(1, value_str.length() - 2).split(",")) {
        vec.push_back(part.trim().to_double(0.0));
      }
      row_map[column_name] = vec;
    } else {
      row_map[column_name] = fin_variant(value_str).convert(oid_to_variant_state(oid));
    }
  }

  return row_map;
}
