#include <catch2/catch_all.hpp>
#include "fin_test_fakes.h"
#include "../documents/layout/fin_page_record.h"

SCENARIO("fin_layout_bounds provides basic geometry operations", "[unit][layout]") {
    GIVEN("A layout bounds with position and size") {
        fin_layout_bounds bounds(10, 20, 100, 50);

        WHEN("Checking basic properties") {
            THEN("Properties should be set correctly") {
                REQUIRE(bounds.x == 10.0);
                REQUIRE(bounds.y == 20.0);
                REQUIRE(bounds.width == 100.0);
                REQUIRE(bounds.height == 50.0);
            }
        }

        WHEN("Calculating edge positions") {
            THEN("Edge calculations should be correct") {
                REQUIRE(bounds.get_left() == 10);
                REQUIRE(bounds.get_right() == 110);
                REQUIRE(bounds.get_top() == 20);
                REQUIRE(bounds.get_bottom() == 70);
                REQUIRE(bounds.get_center_x() == 60);
                REQUIRE(bounds.get_center_y() == 45);
                REQUIRE(bounds.area() == 5000);
            }
        }

        WHEN("Testing point containment") {
            THEN("Should correctly identify contained points") {
                REQUIRE(bounds.contains_point(50, 40) == true);
                REQUIRE(bounds.contains_point(10, 20) == true);  // Edge case
                REQUIRE(bounds.contains_point(5, 40) == false);
                REQUIRE(bounds.contains_point(115, 40) == false);
            }
        }

        WHEN("Testing bounds intersection") {
            fin_layout_bounds overlapping(80, 40, 50, 20);
            fin_layout_bounds separate(200, 200, 10, 10);

            THEN("Should correctly identify intersections") {
                REQUIRE(bounds.intersects_bounds(overlapping) == true);
                REQUIRE(bounds.intersects_bounds(separate) == false);
            }
        }

        WHEN("Uniting with another box") {
            fin_layout_bounds other(100, 60, 40, 40);
            bounds.unite(other);

            THEN("The box covers both") {
                REQUIRE(bounds.get_left() == 10);
                REQUIRE(bounds.get_top() == 20);
                REQUIRE(bounds.get_right() == 140);
                REQUIRE(bounds.get_bottom() == 100);
            }
        }
    }

    GIVEN("Two boxes overlapping by half their width") {
        fin_layout_bounds a(100, 100, 200, 200);
        fin_layout_bounds b(200, 100, 200, 200);

        THEN("IoU is one third") {
            REQUIRE(a.iou(b) == Catch::Approx(1.0 / 3.0));
            REQUIRE(b.iou(a) == Catch::Approx(1.0 / 3.0));
        }

        THEN("A box has IoU 1 with itself and 0 with a distant box") {
            fin_layout_bounds far(1000, 1000, 10, 10);
            REQUIRE(a.iou(a) == Catch::Approx(1.0));
            REQUIRE(a.iou(far) == 0.0);
        }
    }

    GIVEN("Two boxes 8pt apart") {
        fin_layout_bounds a(0, 0, 50, 50);
        fin_layout_bounds b(58, 0, 50, 50);

        THEN("They are near within a 10pt gap but not within 5pt") {
            REQUIRE(a.near(b, 10.0));
            REQUIRE_FALSE(a.near(b, 5.0));
        }
    }
}

SCENARIO("Vector paths are clustered into drawings", "[unit][layout]") {
    GIVEN("Six touching bars of a chart and two stray rules") {
        fin_model_list<fin_layout_path> paths;
        for (int i = 0; i < 6; ++i) {
            paths.add_element();
            paths.back().set_bounds(100 + i * 20, 300, 15, 80);
        }
        paths.add_element();
        paths.back().set_bounds(400, 600, 100, 1);  // hairline, too thin
        paths.add_element();
        paths.back().set_bounds(500, 100, 10, 10);

        WHEN("Clustering with a 10pt gap and at least 5 paths") {
            fin_model_list<fin_layout_drawing> clusters;
            cluster_drawings(paths, 10.0, 5, clusters);

            THEN("Only the chart survives") {
                REQUIRE(clusters.size() == 1);
                REQUIRE(clusters[0].path_count == 6);
                REQUIRE(clusters[0].get_left() == 100);
                REQUIRE(clusters[0].get_right() == Catch::Approx(215));
                REQUIRE(clusters[0].has_stroke.value());
            }
        }

        WHEN("Clustering with a minimum above the bar count") {
            fin_model_list<fin_layout_drawing> clusters;
            cluster_drawings(paths, 10.0, 7, clusters);

            THEN("Nothing is kept") {
                REQUIRE(clusters.empty());
            }
        }
    }
}

SCENARIO("Page records derive their text layer from the spans", "[unit][layout]") {
    GIVEN("A page with spans totalling more than 20 characters") {
        fin_page_record page;
        letter_page(page, 1);
        add_span(page, "  Annual Report 2023 ", 72, 72, 200, 14);
        add_span(page, "", 72, 90, 10, 10);
        add_span(page, "Group results", 72, 110, 200, 12);

        WHEN("The text layer is computed") {
            page.update_text_layer();

            THEN("Raw text joins the stripped non-empty spans with single spaces") {
                REQUIRE(page.raw_text == "Annual Report 2023 Group results");
                REQUIRE(page.has_text_layer.value());
            }
        }
    }

    GIVEN("A page with only a page number") {
        fin_page_record page;
        letter_page(page, 7);
        add_span(page, "Page 7 of 120", 300, 760, 60, 10);

        WHEN("The text layer is computed") {
            page.update_text_layer();

            THEN("The page has no usable text layer") {
                REQUIRE_FALSE(page.has_text_layer.value());
            }
        }
    }

    GIVEN("A page with a rendered raster") {
        fin_page_record page;
        letter_page(page, 1);
        blank_raster(page);
        REQUIRE_FALSE(page.raster.empty());

        WHEN("The raster is released") {
            page.release_raster();

            THEN("The raster is empty") {
                REQUIRE(page.raster.empty());
                REQUIRE(page.area() == Catch::Approx(612.0 * 792.0));
            }
        }
    }
}
