#include <catch2/catch_all.hpp>
#include "fin_test_fakes.h"
#include "../aiprocesses/tables/fin_table_extractor.h"

namespace {

// Grid lines drawn as 1pt paths: horizontal rules at ys, vertical at xs
void add_grid(fin_page_record& page, const std::vector<double>& xs, const std::vector<double>& ys)
{
  for (double y : ys) {
    add_path(page, xs.front(), y - 0.5, xs.back() - xs.front(), 1.0);
  }
  for (double x : xs) {
    add_path(page, x - 0.5, ys.front(), 1.0, ys.back() - ys.front());
  }
}

} // namespace

SCENARIO("Table cells render as markdown and CSV", "[unit][table]") {
  GIVEN("A header row and a ragged data row") {
    fin_table_rows rows = {{"Region", "2023", "2022"}, {"EMEA", "4.2"}};

    THEN("Markdown pads rows and separates the header") {
      REQUIRE(rows_to_markdown(rows) ==
              "| Region | 2023 | 2022 |\n"
              "| --- | --- | --- |\n"
              "| EMEA | 4.2 |  |");
    }

    THEN("CSV keeps the cells as given") {
      REQUIRE(rows_to_csv(rows) == "Region,2023,2022\r\nEMEA,4.2\r\n");
    }
  }

  GIVEN("Cells with separators and quotes") {
    fin_table_rows rows = {{"Item", "Note"}, {"Sales, net", "so-called \"core\""}};

    THEN("CSV quotes and escapes them") {
      REQUIRE(rows_to_csv(rows) == "Item,Note\r\n\"Sales, net\",\"so-called \"\"core\"\"\"\r\n");
    }
  }

  GIVEN("No rows") {
    THEN("Both renderings are empty") {
      REQUIRE(rows_to_markdown(fin_table_rows()).empty());
      REQUIRE(rows_to_csv(fin_table_rows()).empty());
    }
  }

  GIVEN("A table record") {
    fin_extracted_table table;
    table.set_rows({{"A", "B"}, {"1", "2"}});

    THEN("Cells read back row by row") {
      fin_table_rows rows = table.get_rows();
      REQUIRE(table.row_count() == 2);
      REQUIRE(rows[1][0] == "1");
      REQUIRE(rows[1][1] == "2");
      REQUIRE(table.markdown.value().starts_with("| A | B |"));
    }
  }
}

SCENARIO("Ruled tables are read from the vector layer", "[unit][table]") {
  GIVEN("A 2x2 ruled grid with one span per cell") {
    fin_page_record page;
    letter_page(page, 4);
    add_grid(page, {50, 150, 250}, {100, 120, 140});
    add_span(page, "Region", 60, 104, 60, 12);
    add_span(page, "2023", 160, 104, 40, 12);
    add_span(page, "EMEA", 60, 124, 60, 12);
    add_span(page, "4.2", 160, 124, 40, 12);
    add_span(page, "Outside the table", 60, 300, 200, 12);

    fin_table_extractor extractor;

    WHEN("Tables are extracted") {
      fin_model_list<fin_extracted_table> tables;
      extractor.extract(page, fin_model_list<fin_layout_block>(), tables);

      THEN("One primary table with the cell texts is found") {
        REQUIRE(tables.size() == 1);
        fin_extracted_table& table = tables[0];
        REQUIRE(table.method == "primary");
        REQUIRE(table.page_number == 4);
        REQUIRE(table.get_left() == Catch::Approx(50));
        REQUIRE(table.get_bottom() == Catch::Approx(140));

        fin_table_rows rows = table.get_rows();
        REQUIRE(rows.size() == 2);
        REQUIRE(rows[0] == std::vector<fin_string>{"Region", "2023"});
        REQUIRE(rows[1] == std::vector<fin_string>{"EMEA", "4.2"});
      }
    }
  }

  GIVEN("A ruled grid with a single row") {
    fin_page_record page;
    letter_page(page, 1);
    add_grid(page, {50, 150, 250}, {100, 120});
    add_span(page, "Revenue", 60, 104, 60, 12);
    add_span(page, "4.2", 160, 104, 40, 12);

    WHEN("The minimum is two rows") {
      fin_table_extractor extractor(2, 2);
      fin_model_list<fin_extracted_table> tables;
      extractor.extract_ruled(page, tables);

      THEN("No table is reported") {
        REQUIRE(tables.empty());
      }
    }

    WHEN("The minimum is one row") {
      fin_table_extractor extractor(1, 2);
      fin_model_list<fin_extracted_table> tables;
      extractor.extract_ruled(page, tables);

      THEN("The row is extracted") {
        REQUIRE(tables.size() == 1);
        REQUIRE(tables[0].row_count() == 1);
      }
    }
  }

  GIVEN("Fewer than four rules") {
    fin_page_record page;
    letter_page(page, 1);
    add_path(page, 50, 100, 200, 1);
    add_path(page, 50, 120, 200, 1);

    THEN("Nothing is extracted") {
      fin_table_extractor extractor(1, 1);
      fin_model_list<fin_extracted_table> tables;
      extractor.extract_ruled(page, tables);
      REQUIRE(tables.empty());
    }
  }
}

SCENARIO("Table regions without rules fall back to OCR", "[unit][table]") {
  GIVEN("A rendered page with a table region and an OCR engine") {
    fin_page_record page;
    letter_page(page, 2);
    blank_raster(page);

    fin_model_list<fin_layout_block> blocks;
    blocks.add_element();
    blocks.back().set_bounds(72, 300, 400, 100);
    blocks.back().set_role(fin_block_role::table);

    fake_ocr_engine ocr;
    ocr.boxes.push_back(ocr_box("2023", 200, 10, 240, 24));
    ocr.boxes.push_back(ocr_box("Region", 10, 12, 80, 26));
    ocr.boxes.push_back(ocr_box("EMEA", 10, 50, 70, 64));
    ocr.boxes.push_back(ocr_box("4.2", 200, 52, 230, 66));
    ocr.boxes.push_back(ocr_box("smudge", 300, 52, 330, 66, 0.1));

    fin_table_extractor extractor;
    extractor.set_ocr_engine(&ocr);

    WHEN("Tables are extracted") {
      fin_model_list<fin_extracted_table> tables;
      extractor.extract(page, blocks, tables);

      THEN("The region is read row by row, left to right") {
        REQUIRE(tables.size() == 1);
        REQUIRE(tables[0].method == "ocr-fallback");
        REQUIRE(tables[0].get_top() == 300);
        fin_table_rows rows = tables[0].get_rows();
        REQUIRE(rows.size() == 2);
        REQUIRE(rows[0] == std::vector<fin_string>{"Region", "2023"});
        REQUIRE(rows[1] == std::vector<fin_string>{"EMEA", "4.2"});
      }

      THEN("The OCR threshold of the extractor is used") {
        REQUIRE(ocr.last_threshold == Catch::Approx(0.40));
      }
    }

    WHEN("The OCR engine fails") {
      ocr.throw_error = true;
      fin_model_list<fin_extracted_table> tables;
      extractor.extract(page, blocks, tables);

      THEN("No table is produced") {
        REQUIRE(tables.empty());
      }
    }
  }

  GIVEN("A page without raster") {
    fin_page_record page;
    letter_page(page, 2);
    fin_model_list<fin_layout_block> blocks;
    blocks.add_element();
    blocks.back().set_bounds(72, 300, 400, 100);
    blocks.back().set_role(fin_block_role::table);

    fake_ocr_engine ocr;
    fin_table_extractor extractor;
    extractor.set_ocr_engine(&ocr);

    THEN("OCR is not attempted") {
      fin_model_list<fin_extracted_table> tables;
      extractor.extract(page, blocks, tables);
      REQUIRE(tables.empty());
      REQUIRE(ocr.calls.load() == 0);
    }
  }
}

SCENARIO("OCR boxes are grouped into rows by vertical center", "[unit][table]") {
  GIVEN("Boxes whose centers are 4px apart and one 30px lower") {
    std::vector<fin_ocr_box> boxes = {
      ocr_box("b", 100, 40, 120, 50),  // center 45
      ocr_box("a", 10, 8, 30, 20),     // center 14
      ocr_box("c", 50, 12, 70, 24),    // center 18
    };

    WHEN("Rows are clustered with the default tolerance") {
      fin_table_rows rows = fin_table_extractor::cluster_rows(boxes);

      THEN("Rows are ordered top-down and cells left-right") {
        REQUIRE(rows.size() == 2);
        REQUIRE(rows[0] == std::vector<fin_string>{"a", "c"});
        REQUIRE(rows[1] == std::vector<fin_string>{"b"});
      }
    }

    WHEN("The tolerance is smaller than the gap") {
      fin_table_rows rows = fin_table_extractor::cluster_rows(boxes, 3);

      THEN("Every box is its own row") {
        REQUIRE(rows.size() == 3);
      }
    }
  }
}
