#ifndef fin_EXTRACTED_TABLE_H
#define fin_EXTRACTED_TABLE_H

#include "../../documents/layout/fin_layout_bounds.h"
#include <vector>

typedef std::vector<std::vector<fin_string>> fin_table_rows;

// Table recovered from one page region
class fin_extracted_table : public fin_layout_bounds
{
public:
  finp_int(page_number);
  finp_vector(rows);
  finp_string(markdown);
  finp_string(csv);
  finp_string(method);  // "primary" or "ocr-fallback"

  fin_table_rows get_rows() const;

  // Store the cell matrix and both renderings
  void set_rows(const fin_table_rows& cells);

  size_t row_count() const { return rows.value().size(); }
};

// Pipe table: rows padded to the widest row, first row as header
fin_string rows_to_markdown(const fin_table_rows& rows);

// RFC 4180 CSV with CRLF line endings
fin_string rows_to_csv(const fin_table_rows& rows);

#endif // fin_EXTRACTED_TABLE_H
