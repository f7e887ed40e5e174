#include <catch2/catch_all.hpp>
#include "fin_test_fakes.h"
#include "../aiprocesses/figures/fin_figure_extractor.h"
#include "../aiprocesses/layout/fin_layout_segmenter.h"

SCENARIO("Overlapping figure candidates collapse into one", "[unit][figure]") {
  GIVEN("Two embedded images whose boxes have IoU 0.5") {
    fin_page_record page;
    letter_page(page, 1);
    add_image(page, 100, 100, 300, 200);
    add_image(page, 200, 100, 300, 200);  // intersection 200x200, union 400x200

    fin_layout_bounds a(100, 100, 300, 200);
    fin_layout_bounds b(200, 100, 300, 200);
    REQUIRE(a.iou(b) == Catch::Approx(0.5));

    fin_figure_extractor extractor(100, 0.02, 0.3);

    WHEN("Candidates are collected from the images alone") {
      fin_model_list<fin_layout_bounds> candidates;
      extractor.collect_candidates(page, fin_model_list<fin_layout_block>(), candidates);

      THEN("A single candidate remains, the first image") {
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].get_left() == 100);
      }
    }

    WHEN("The segmenter has already turned both images into figure blocks") {
      fin_layout_segmenter segmenter(0.01);
      fin_model_list<fin_layout_block> blocks;
      segmenter.segment(page, blocks);
      REQUIRE(blocks.size() == 2);

      fin_model_list<fin_layout_bounds> candidates;
      extractor.collect_candidates(page, blocks, candidates);

      THEN("The figure blocks are deduplicated as well") {
        REQUIRE(candidates.size() == 1);
      }
    }
  }

  GIVEN("Two images side by side") {
    fin_page_record page;
    letter_page(page, 1);
    add_image(page, 50, 100, 200, 200);
    add_image(page, 300, 100, 200, 200);

    THEN("Both are candidates") {
      fin_figure_extractor extractor;
      fin_model_list<fin_layout_bounds> candidates;
      extractor.collect_candidates(page, fin_model_list<fin_layout_block>(), candidates);
      REQUIRE(candidates.size() == 2);
    }
  }

  GIVEN("A vector drawing cluster and a tiny image") {
    fin_page_record page;
    letter_page(page, 1);
    page.drawings.add_element();
    page.drawings.back().set_bounds(72, 400, 300, 200);
    page.drawings.back().path_count = 12LL;
    add_image(page, 500, 700, 20, 20);

    THEN("The drawing is a candidate and the image is too small") {
      fin_figure_extractor extractor;
      fin_model_list<fin_layout_bounds> candidates;
      extractor.collect_candidates(page, fin_model_list<fin_layout_block>(), candidates);
      REQUIRE(candidates.size() == 1);
      REQUIRE(candidates[0].get_top() == 400);
    }
  }
}

SCENARIO("Figures are linked to the nearest caption", "[unit][figure]") {
  GIVEN("Caption blocks above and far below a figure") {
    fin_model_list<fin_layout_block> blocks;
    blocks.add_element();
    blocks.back().set_bounds(72, 80, 300, 12);
    blocks.back().set_role(fin_block_role::caption);
    blocks.back().text = "Figure 2: Net debt";
    blocks.add_element();
    blocks.back().set_bounds(72, 700, 300, 12);
    blocks.back().set_role(fin_block_role::caption);
    blocks.back().text = "Source: company filings";
    blocks.add_element();
    blocks.back().set_bounds(72, 96, 300, 12);
    blocks.back().set_role(fin_block_role::paragraph);
    blocks.back().text = "Not a caption";

    fin_layout_bounds figure(72, 100, 300, 150);

    THEN("The closer caption wins") {
      REQUIRE(fin_figure_extractor::nearest_caption(figure, blocks) == "Figure 2: Net debt");
    }

    THEN("Without caption blocks the caption is empty") {
      REQUIRE(fin_figure_extractor::nearest_caption(figure, fin_model_list<fin_layout_block>()).empty());
    }
  }
}

SCENARIO("Figure crops are written below the resources directory", "[unit][figure]") {
  GIVEN("A rendered page with one chart image") {
    std::filesystem::path storage = scratch_dir("figures");
    std::filesystem::path resources = storage / "resources";

    fin_page_record page;
    letter_page(page, 3);
    blank_raster(page);
    add_image(page, 72, 200, 300, 200);

    fin_model_list<fin_layout_block> blocks;
    blocks.add_element();
    blocks.back().set_bounds(72, 410, 300, 12);
    blocks.back().set_role(fin_block_role::caption);
    blocks.back().text = "Chart 1: Revenue by quarter";

    fin_figure_extractor extractor(100, 0.02, 0.3, resources.string(), storage.string());
    fin_string doc_id = "0123456789abcdef0123456789abcdef";

    WHEN("Figures are extracted") {
      fin_model_list<fin_extracted_figure> figures;
      extractor.extract(page, blocks, doc_id, figures);

      THEN("The crop is saved as page_3_fig_1.png in the document folder") {
        REQUIRE(figures.size() == 1);
        fin_extracted_figure& figure = figures[0];
        REQUIRE(figure.page_number == 3);
        REQUIRE(figure.figure_index == 1);
        REQUIRE(figure.caption == "Chart 1: Revenue by quarter");
        REQUIRE(figure.image_path == "resources/0123456789abcdef/page_3_fig_1.png");
        REQUIRE(std::filesystem::exists(resources / "0123456789abcdef" / "page_3_fig_1.png"));
      }

      THEN("The PNG bytes decode to the cropped region") {
        cv::Mat image = figures[0].decode_image();
        REQUIRE_FALSE(image.empty());
        REQUIRE(image.cols == Catch::Approx(300 * 100 / 72.0).margin(2));
        REQUIRE(image.rows == Catch::Approx(200 * 100 / 72.0).margin(2));
      }
    }

    WHEN("The page has no raster") {
      page.release_raster();
      fin_model_list<fin_extracted_figure> figures;
      extractor.extract(page, blocks, doc_id, figures);

      THEN("No figure is produced") {
        REQUIRE(figures.empty());
      }
    }

    std::error_code ec;
    std::filesystem::remove_all(storage, ec);
  }
}
