#include "fin_layout_segmenter.h"
#include <algorithm>
#include <iostream>
#include <regex>

namespace {
  const double heading_font_ratio = 1.25;
  const double header_y_ratio = 0.06;
  const double footer_y_ratio = 0.92;
  const size_t bold_heading_max_words = 15;

  const std::regex caption_pattern(R"(^(figure|fig\.?|table|exhibit|chart|graph|source|note)\s)",
                                   std::regex::icase);
}

fin_layout_segmenter::fin_layout_segmenter(double image_min_area_ratio)
  : image_min_area_ratio(image_min_area_ratio), region_detector(nullptr)
{
}

void fin_layout_segmenter::set_region_detector(fin_region_detector* detector)
{
  region_detector = detector;
}

double fin_layout_segmenter::median_font_size(const fin_page_record& page)
{
  std::vector<double> sizes;
  for (size_t i = 0; i < page.spans.size(); ++i) {
    double size = page.spans[i].font_size.value();
    if (size > 0) {
      sizes.push_back(size);
    }
  }
  if (sizes.empty()) {
    return 12.0;
  }
  std::sort(sizes.begin(), sizes.end());
  return sizes[sizes.size() / 2];
}

fin_block_role fin_layout_segmenter::classify(const fin_layout_span& span, double median, double page_height) const
{
  double rel_y = page_height > 0 ? span.get_center_y() / page_height : 0.5;

  if (rel_y < header_y_ratio) {
    return fin_block_role::header;
  }
  if (rel_y > footer_y_ratio) {
    return fin_block_role::footnote;
  }

  std::string stripped = span.text.value().trim().to_std_const();
  if (std::regex_search(stripped, caption_pattern)) {
    return fin_block_role::caption;
  }

  if (span.font_size.value() >= median * heading_font_ratio ||
      (span.bold.value() && span.text.value().words().size() < bold_heading_max_words)) {
    return fin_block_role::heading;
  }

  return fin_block_role::paragraph;
}

void fin_layout_segmenter::segment(const fin_page_record& page, fin_model_list<fin_layout_block>& blocks) const
{
  double median = median_font_size(page);
  double page_height = page.height.value();
  long long page_number = page.page_number.value();

  for (size_t i = 0; i < page.spans.size(); ++i) {
    const fin_layout_span& span = page.spans[i];
    if (span.text.value().trim().empty()) {
      continue;
    }
    blocks.add_element();
    fin_layout_block& block = blocks.back();
    block.set_bounds(span);
    block.set_role(classify(span, median, page_height));
    block.text = span.text.value();
    block.page_number = page_number;
    block.confidence = 1.0;
  }

  double page_area = page.area();
  for (size_t i = 0; i < page.images.size(); ++i) {
    const fin_layout_image& image = page.images[i];
    double ratio = page_area > 0 ? image.area() / page_area : 0.0;
    if (ratio < image_min_area_ratio) {
      continue;  // icons and bullets
    }
    blocks.add_element();
    fin_layout_block& block = blocks.back();
    block.set_bounds(image);
    block.set_role(fin_block_role::figure);
    block.text = "";
    block.page_number = page_number;
    block.confidence = 1.0;
  }

  if (region_detector != nullptr) {
    fin_model_list<fin_layout_block> regions;
    try {
      region_detector->detect(page, regions);
    } catch (const std::exception& e) {
      std::cerr << "[LAYOUT] region detector failed on page " << page_number << ": " << e.what() << std::endl;
      regions.clear();
    }
    for (size_t i = 0; i < regions.size(); ++i) {
      fin_layout_block& region = regions[i];
      region.page_number = page_number;
      blocks.push_back(region);
    }
  }
}

void fin_layout_segmenter::group_paragraphs(const fin_model_list<fin_layout_block>& blocks,
                                            fin_model_list<fin_layout_block>& merged)
{
  bool run_open = false;

  for (size_t i = 0; i < blocks.size(); ++i) {
    const fin_layout_block& block = blocks[i];
    if (block.is(fin_block_role::paragraph)) {
      if (run_open) {
        fin_layout_block& current = merged.back();
        current.text = current.text.value() + " " + block.text.value();
        current.unite(block);
      } else {
        merged.push_back(block);
        run_open = true;
      }
    } else {
      merged.push_back(block);
      run_open = false;
    }
  }
}
