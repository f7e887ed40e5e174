#include "fin_figure_extractor.h"
#include "../vision/fin_ocr_engine.h"
#include <opencv2/imgcodecs.hpp>
#include <filesystem>
#include <iostream>
#include <limits>

namespace {
  // Crops smaller than this (pixels) in either dimension are noise
  const int min_crop_pixels = 20;
}

cv::Mat fin_extracted_figure::decode_image() const
{
  const fin_string& bytes = image_bytes.value();
  if (bytes.empty()) {
    return cv::Mat();
  }
  std::vector<unsigned char> buffer(bytes.data(), bytes.data() + bytes.size());
  return cv::imdecode(buffer, cv::IMREAD_COLOR);
}

fin_figure_extractor::fin_figure_extractor(int dpi, double min_area_ratio, double iou_threshold,
                                           const fin_string& resources_dir, const fin_string& storage_dir)
  : dpi(dpi), min_area_ratio(min_area_ratio), iou_threshold(iou_threshold),
    resources_dir(resources_dir), storage_dir(storage_dir)
{
}

bool fin_figure_extractor::is_covered(const fin_layout_bounds& box, const fin_model_list<fin_layout_bounds>& candidates) const
{
  for (size_t i = 0; i < candidates.size(); ++i) {
    if (box.iou(candidates[i]) > iou_threshold) {
      return true;
    }
  }
  return false;
}

void fin_figure_extractor::collect_candidates(const fin_page_record& page, const fin_model_list<fin_layout_block>& blocks,
                                              fin_model_list<fin_layout_bounds>& candidates) const
{
  double page_area = std::max(page.area(), 1.0);

  for (size_t i = 0; i < blocks.size(); ++i) {
    const fin_layout_block& block = blocks[i];
    if (block.is(fin_block_role::figure) && !is_covered(block, candidates)) {
      candidates.add_element();
      candidates.back().set_bounds(block);
    }
  }

  for (size_t i = 0; i < page.images.size(); ++i) {
    const fin_layout_image& image = page.images[i];
    if (is_covered(image, candidates)) {
      continue;
    }
    if (image.area() / page_area >= min_area_ratio) {
      candidates.add_element();
      candidates.back().set_bounds(image);
    }
  }

  for (size_t i = 0; i < page.drawings.size(); ++i) {
    const fin_layout_drawing& drawing = page.drawings[i];
    if (is_covered(drawing, candidates)) {
      continue;
    }
    if (drawing.area() / page_area >= min_area_ratio) {
      candidates.add_element();
      candidates.back().set_bounds(drawing);
    }
  }
}

fin_string fin_figure_extractor::nearest_caption(const fin_layout_bounds& figure, const fin_model_list<fin_layout_block>& blocks)
{
  fin_string best_caption;
  double best_dist = std::numeric_limits<double>::infinity();
  for (size_t i = 0; i < blocks.size(); ++i) {
    const fin_layout_block& block = blocks[i];
    if (!block.is(fin_block_role::caption)) {
      continue;
    }
    double dist = figure.center_distance(block);
    if (dist < best_dist) {
      best_dist = dist;
      best_caption = block.text.value();
    }
  }
  return best_caption;
}

void fin_figure_extractor::extract(const fin_page_record& page, const fin_model_list<fin_layout_block>& blocks,
                                   const fin_string& doc_id, fin_model_list<fin_extracted_figure>& figures) const
{
  if (page.raster.empty()) {
    return;
  }

  fin_model_list<fin_layout_bounds> candidates;
  collect_candidates(page, blocks, candidates);
  if (candidates.empty()) {
    return;
  }

  std::filesystem::path out_dir = std::filesystem::path(resources_dir.to_std_const()) / doc_id.left(16).to_std_const();
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  if (ec) {
    std::cerr << "[FIGURE] cannot create " << out_dir.string() << ": " << ec.message() << std::endl;
  }

  long long page_number = page.page_number.value();
  for (size_t i = 0; i < candidates.size(); ++i) {
    const fin_layout_bounds& box = candidates[i];
    long long idx = static_cast<long long>(i) + 1;

    cv::Mat crop = crop_region(page.raster, box, dpi);
    if (crop.empty() || crop.cols < min_crop_pixels || crop.rows < min_crop_pixels) {
      continue;
    }

    std::vector<unsigned char> png;
    if (!cv::imencode(".png", crop, png)) {
      std::cerr << "[FIGURE] page " << page_number << " figure " << idx << ": PNG encoding failed" << std::endl;
      continue;
    }

    std::filesystem::path save_path = out_dir / ("page_" + std::to_string(page_number) + "_fig_" + std::to_string(idx) + ".png");
    fin_string image_path;
    if (cv::imwrite(save_path.string(), crop)) {
      std::filesystem::path rel = save_path.lexically_relative(std::filesystem::path(storage_dir.to_std_const()));
      image_path = (rel.empty() || rel.string().rfind("..", 0) == 0) ? save_path.string() : rel.string();
    } else {
      std::cerr << "[FIGURE] cannot write " << save_path.string() << std::endl;
    }

    figures.add_element();
    fin_extracted_figure& figure = figures.back();
    figure.set_bounds(box);
    figure.page_number = page_number;
    figure.figure_index = idx;
    figure.image_bytes = fin_string(reinterpret_cast<const char*>(png.data()), png.size());
    figure.image_path = image_path;
    figure.caption = nearest_caption(box, blocks);
  }
}
