#include <catch2/catch_all.hpp>
#include "../aiprocesses/quality/fin_quality_gate.h"
#include "../aiprocesses/tables/fin_extracted_table.h"

namespace {

void add_text(fin_model_list<fin_chunk>& chunks, const fin_string& text)
{
  chunks.add_element();
  chunks.back().set_kind(fin_chunk_kind::text);
  chunks.back().text = text;
  chunks.back().content_hash = text;
}

void add_table(fin_model_list<fin_chunk>& chunks, const fin_table_rows& rows)
{
  chunks.add_element();
  chunks.back().set_kind(fin_chunk_kind::table);
  chunks.back().markdown = rows_to_markdown(rows);
  chunks.back().content_hash = rows_to_markdown(rows);
}

} // namespace

SCENARIO("Text chunks are checked for length, content and repetition", "[unit][quality]") {
  fin_quality_gate gate(30, 8000, 2);

  GIVEN("Ordinary prose") {
    fin_chunk chunk;
    chunk.set_kind(fin_chunk_kind::text);
    chunk.text = "Operating profit increased to 1.2 billion euros in the third quarter.";

    THEN("It is accepted") {
      fin_quality_verdict verdict = gate.validate(chunk);
      REQUIRE(verdict.accepted);
      REQUIRE(verdict.reason == "OK");
    }
  }

  GIVEN("Text shorter than the minimum") {
    fin_chunk chunk;
    chunk.set_kind(fin_chunk_kind::text);
    chunk.text = "   Revenue up 4%   ";

    THEN("It is rejected as too short, after stripping") {
      fin_quality_verdict verdict = gate.validate_text(chunk);
      REQUIRE_FALSE(verdict.accepted);
      REQUIRE(verdict.reason == "Too short (13 chars)");
    }
  }

  GIVEN("Text longer than the maximum") {
    fin_quality_gate strict(5, 40, 2);
    fin_chunk chunk;
    chunk.set_kind(fin_chunk_kind::text);
    chunk.text = "Cash flow from operations was strong in every single segment.";

    THEN("It is rejected as too long") {
      REQUIRE(strict.validate_text(chunk).reason.starts_with("Too long"));
    }
  }

  GIVEN("Mostly punctuation") {
    fin_chunk chunk;
    chunk.set_kind(fin_chunk_kind::text);
    chunk.text = "..... ----- ..... ----- ..... ----- ab cd ef gh";

    THEN("The alphanumeric ratio rejects it") {
      REQUIRE(gate.validate_text(chunk).reason.starts_with("Low alphanumeric ratio"));
    }
  }

  GIVEN("The same word over and over") {
    fin_chunk chunk;
    chunk.set_kind(fin_chunk_kind::text);
    chunk.text = "total total total total total total total total";

    THEN("It is rejected as repetitive") {
      REQUIRE(gate.validate_text(chunk).reason == "Repetitive content detected");
    }
  }

  GIVEN("Repetition checks on their own") {
    THEN("Fewer than five words always count as repetitive") {
      REQUIRE(fin_quality_gate::is_repetitive("Q3 revenue rose 4%"));
    }
    THEN("Mostly distinct words do not") {
      REQUIRE_FALSE(fin_quality_gate::is_repetitive("net sales grew in every region"));
    }
    THEN("Half distinct words are at the threshold and pass") {
      REQUIRE_FALSE(fin_quality_gate::is_repetitive("a b c a b c"));
      REQUIRE(fin_quality_gate::is_repetitive("a b a b a b a b a"));
    }
  }
}

SCENARIO("Table chunks need enough rows", "[unit][quality]") {
  fin_quality_gate gate(30, 8000, 2);

  GIVEN("A table with one row and many columns") {
    fin_model_list<fin_chunk> chunks;
    add_table(chunks, {{"Revenue", "4.2", "3.9", "3.7", "3.1", "2.8"}});

    THEN("It is always rejected") {
      fin_quality_verdict verdict = gate.validate(chunks[0]);
      REQUIRE_FALSE(verdict.accepted);
      REQUIRE(verdict.reason == "Too few rows (1)");
    }
  }

  GIVEN("A header and one data row") {
    fin_model_list<fin_chunk> chunks;
    add_table(chunks, {{"Region", "2023"}, {"EMEA", "4.2"}});

    THEN("It is accepted") {
      REQUIRE(gate.validate(chunks[0]).accepted);
    }
  }

  GIVEN("An empty table") {
    fin_chunk chunk;
    chunk.set_kind(fin_chunk_kind::table);

    THEN("It is rejected") {
      REQUIRE(gate.validate(chunk).reason == "Empty table");
    }
  }
}

SCENARIO("Figure chunks need some text", "[unit][quality]") {
  fin_quality_gate gate;

  GIVEN("A figure with a caption") {
    fin_chunk chunk;
    chunk.set_kind(fin_chunk_kind::figure);
    chunk.caption = "Net debt";

    THEN("It is accepted") {
      REQUIRE(gate.validate(chunk).accepted);
    }
  }

  GIVEN("A figure with nothing but a one-character OCR result") {
    fin_chunk chunk;
    chunk.set_kind(fin_chunk_kind::figure);
    chunk.ocr_text = "%";

    THEN("Its labelled text is long enough") {
      REQUIRE(gate.validate(chunk).accepted);
    }
  }
}

SCENARIO("Unknown kinds pass the gate", "[unit][quality]") {
  GIVEN("A chunk without kind") {
    fin_chunk chunk;
    fin_quality_gate gate;

    THEN("It is accepted") {
      fin_quality_verdict verdict = gate.validate(chunk);
      REQUIRE(verdict.accepted);
      REQUIRE(verdict.reason == "unknown type");
    }
  }
}

SCENARIO("Filtering partitions the input", "[unit][quality]") {
  fin_quality_gate gate(30, 8000, 2);

  GIVEN("A mix of good and bad chunks") {
    fin_model_list<fin_chunk> chunks;
    add_text(chunks, "Operating profit increased to 1.2 billion euros in the third quarter.");
    add_text(chunks, "short");
    add_table(chunks, {{"Revenue", "4.2"}});
    add_text(chunks, "Free cash flow covered the dividend twice over during the year.");
    add_table(chunks, {{"Region", "2023"}, {"EMEA", "4.2"}});

    WHEN("The chunks are filtered") {
      fin_model_list<fin_chunk> accepted;
      fin_model_list<fin_chunk> rejected;
      gate.filter(chunks, accepted, rejected);

      THEN("Every chunk lands in exactly one list") {
        REQUIRE(accepted.size() + rejected.size() == chunks.size());
        REQUIRE(accepted.size() == 3);
        REQUIRE(rejected.size() == 2);
      }

      THEN("Input order is kept within each list") {
        REQUIRE(accepted[0].text.value().starts_with("Operating profit"));
        REQUIRE(accepted[1].text.value().starts_with("Free cash flow"));
        REQUIRE(accepted[2].get_kind() == fin_chunk_kind::table);
        REQUIRE(rejected[0].text == "short");
      }
    }

    WHEN("The same chunks are filtered in reverse order") {
      fin_model_list<fin_chunk> reversed;
      for (size_t i = chunks.size(); i > 0; --i) {
        reversed.push_back(chunks[i - 1]);
      }
      fin_model_list<fin_chunk> accepted;
      fin_model_list<fin_chunk> rejected;
      gate.filter(reversed, accepted, rejected);

      THEN("The same chunks are accepted") {
        REQUIRE(accepted.size() == 3);
        REQUIRE(rejected.size() == 2);
        REQUIRE(accepted[0].get_kind() == fin_chunk_kind::table);
      }
    }
  }

  GIVEN("No chunks") {
    fin_model_list<fin_chunk> chunks;
    fin_model_list<fin_chunk> accepted;
    fin_model_list<fin_chunk> rejected;
    gate.filter(chunks, accepted, rejected);

    THEN("Both lists are empty") {
      REQUIRE(accepted.empty());
      REQUIRE(rejected.empty());
    }
  }
}
