#include <catch2/catch_all.hpp>
#include "fin_test_fakes.h"
#include "../aiprocesses/vision/fin_chart_classifier.h"
#include "../aiprocesses/vision/fin_chart_describer.h"

SCENARIO("Chart types are recognised from caption and OCR keywords", "[unit][figure]") {
  fin_keyword_chart_classifier classifier;

  GIVEN("Captions naming a chart family") {
    THEN("The matching type is returned") {
      REQUIRE(classifier.classify("Figure 4: Revenue split (pie chart)", "") == fin_figure_type::pie_chart);
      REQUIRE(classifier.classify("Exhibit 2: Stacked bar of segment EBIT", "") == fin_figure_type::stacked_bar_chart);
      REQUIRE(classifier.classify("Chart: Net debt by quarter, column view", "") == fin_figure_type::bar_chart);
      REQUIRE(classifier.classify("EBITDA bridge (waterfall)", "") == fin_figure_type::waterfall);
      REQUIRE(classifier.classify("Correlation HEATMAP of returns", "") == fin_figure_type::heatmap);
      REQUIRE(classifier.classify("Returns box plot", "") == fin_figure_type::box_whisker);
      REQUIRE(classifier.classify("Daily OHLC prices", "") == fin_figure_type::candlestick);
    }
  }

  GIVEN("Line charts") {
    THEN("Two line mentions make a multi-line chart") {
      REQUIRE(classifier.classify("Price line vs. volume line", "") == fin_figure_type::multi_line_chart);
      REQUIRE(classifier.classify("Multi-line chart of yields", "") == fin_figure_type::multi_line_chart);
    }
    THEN("A single mention makes a line chart") {
      REQUIRE(classifier.classify("Share price", "trend line") == fin_figure_type::line_chart);
    }
  }

  GIVEN("Keywords only in the OCR text") {
    THEN("They are used as well") {
      REQUIRE(classifier.classify("Figure 9", "scatter of margin vs growth") == fin_figure_type::scatter_chart);
    }
  }

  GIVEN("No keyword at all") {
    THEN("The type is unknown") {
      REQUIRE(classifier.classify("Figure 1: Our headquarters", "") == fin_figure_type::unknown);
      REQUIRE(classifier.classify("", "") == fin_figure_type::unknown);
    }
  }

  GIVEN("Words that only contain a keyword") {
    THEN("They do not match") {
      REQUIRE(classifier.classify("Barcelona office", "") == fin_figure_type::unknown);
    }
  }
}

SCENARIO("Figures are described from caption and OCR text", "[unit][figure]") {
  cv::Mat image;

  GIVEN("The fallback describer") {
    fin_fallback_chart_describer describer;

    THEN("Caption and OCR text are combined") {
      REQUIRE(describer.describe(image, "Net debt", "2021 2022") ==
              "This figure is captioned: \"Net debt\". Text visible in the chart: 2021 2022");
    }
    THEN("A missing part is left out") {
      REQUIRE(describer.describe(image, "", "2021 2022") == "Text visible in the chart: 2021 2022");
      REQUIRE(describer.describe(image, "Net debt", "") == "This figure is captioned: \"Net debt\".");
      REQUIRE(describer.describe(image, "", "").empty());
    }
  }

  GIVEN("An LLM describer over a fake API") {
    fake_llm_api api;
    fin_llm_chart_describer describer(api, "gpt-4o-mini", 200);

    WHEN("The model answers") {
      fin_string text = describer.describe(image, "Revenue by region", "EMEA 4.2 APAC 3.1");

      THEN("The answer is returned") {
        REQUIRE(text == "Revenue grew steadily across all regions.");
      }

      THEN("The prompt carries caption, OCR text and settings") {
        REQUIRE(api.last_prompt.contains("Caption: Revenue by region"));
        REQUIRE(api.last_prompt.contains("Text visible in the chart:\nEMEA 4.2 APAC 3.1"));
        REQUIRE(api.last_settings.at("model").convert(fin_variant::string_state).string_value() == "gpt-4o-mini");
        REQUIRE(api.last_settings.at("max_tokens").convert(fin_variant::int_state).int_value() == 200);
      }
    }

    WHEN("The model returns nothing") {
      api.fail_chat = true;

      THEN("The fallback description is used") {
        REQUIRE(describer.describe(image, "Net debt", "") == "This figure is captioned: \"Net debt\".");
      }
    }

    WHEN("The request throws") {
      api.throw_chat = true;

      THEN("The fallback description is used") {
        REQUIRE(describer.describe(image, "", "2021") == "Text visible in the chart: 2021");
      }
    }

    WHEN("There is neither caption nor OCR text") {
      api.reply = "should not be asked";

      THEN("The model is not called") {
        REQUIRE(describer.describe(image, "", "").empty());
        REQUIRE(api.last_prompt.empty());
      }
    }
  }
}

SCENARIO("Without a digitizer model no series is recovered", "[unit][figure]") {
  GIVEN("The null digitizer") {
    fin_null_chart_digitizer digitizer;

    THEN("It never produces data") {
      finv_map series;
      REQUIRE_FALSE(digitizer.digitize(cv::Mat(), series));
      REQUIRE(series.empty());
    }
  }
}

SCENARIO("Figure types have stable names", "[unit][figure]") {
  THEN("Names map back to their type") {
    REQUIRE(figure_type_name(fin_figure_type::stacked_bar_chart) == "stacked_bar_chart");
    REQUIRE(figure_type_from_name("Heatmap") == fin_figure_type::heatmap);
    REQUIRE(figure_type_from_name("sankey") == fin_figure_type::unknown);
  }
}
