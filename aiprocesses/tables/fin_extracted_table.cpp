#include "fin_extracted_table.h"
#include <algorithm>

fin_table_rows fin_extracted_table::get_rows() const
{
  fin_table_rows result;
  const finv_vector& data = rows.value();
  for (const auto& row : data) {
    std::vector<fin_string> cells;
    if (row.is_vector()) {
      for (const auto& cell : row.vector_value()) {
        cells.push_back(cell.convert(fin_variant::string_state).string_value());
      }
    }
    result.push_back(cells);
  }
  return result;
}

void fin_extracted_table::set_rows(const fin_table_rows& cells)
{
  finv_vector data;
  for (const auto& row : cells) {
    finv_vector row_data;
    for (const auto& cell : row) {
      row_data.push_back(cell);
    }
    data.push_back(row_data);
  }
  rows = data;
  markdown = rows_to_markdown(cells);
  csv = rows_to_csv(cells);
}

fin_string rows_to_markdown(const fin_table_rows& rows)
{
  if (rows.empty()) {
    return fin_string();
  }

  size_t max_cols = 0;
  for (const auto& row : rows) {
    max_cols = std::max(max_cols, row.size());
  }

  std::vector<fin_string> lines;
  for (size_t r = 0; r < rows.size(); ++r) {
    std::vector<fin_string> padded = rows[r];
    padded.resize(max_cols);
    lines.push_back("| " + fin_string(" | ").join(padded) + " |");
    if (r == 0) {
      std::vector<fin_string> separator(max_cols, "---");
      lines.push_back("| " + fin_string(" | ").join(separator) + " |");
    }
  }
  return fin_string("\n").join(lines);
}

fin_string rows_to_csv(const fin_table_rows& rows)
{
  fin_string out;
  for (const auto& row : rows) {
    for (size_t c = 0; c < row.size(); ++c) {
      if (c > 0) {
        out += ',';
      }
      const fin_string& cell = row[c];
      bool quote = cell.contains(",") || cell.contains("\"") || cell.contains("\n") || cell.contains("\r");
      if (quote) {
        fin_string escaped = cell;
        escaped.replace("\"", "\"\"");
        out += "\"" + escaped + "\"";
      } else {
        out += cell;
      }
    }
    out += "\r\n";
  }
  return out;
}
