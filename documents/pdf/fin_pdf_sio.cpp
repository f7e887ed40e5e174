#include "fin_pdf_sio.h"
#include "fin_pdf_page_reader.h"
#include <podofo/podofo.h>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>

using namespace PoDoFo;

fin_pdf_sio::fin_pdf_sio(int render_dpi, int page_limit)
  : m_pdf(nullptr), dpi(render_dpi), max_pages(page_limit), merge_gap(10.0), min_paths(5) {
}

fin_pdf_sio::~fin_pdf_sio() {
  clear();
}

void fin_pdf_sio::set_drawing_clustering(double gap, long long paths) {
  merge_gap = gap;
  min_paths = paths;
}

void fin_pdf_sio::clear() {
  if (m_pdf != nullptr) {
    delete m_pdf;
    m_pdf = nullptr;
  }
  pdf_data_buffer.clear();
  if (!temp_dir.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(temp_dir, ec);
    temp_dir.clear();
  }
}

bool fin_pdf_sio::parse(fin_string &data) {
  clear();
  try {
    m_pdf = new PdfMemDocument();

    // The buffer must outlive the document, XObjects are resolved lazily
    pdf_data_buffer.reserve(data.size());
    pdf_data_buffer.assign(data.c_str(), data.c_str() + data.size());

    bufferview buffer(pdf_data_buffer.data(), pdf_data_buffer.size());
    m_pdf->LoadFromBuffer(buffer);
  } catch (const std::exception& e) {
    last_error = fin_string("PDF loading failed: ") + e.what();
    std::cerr << "[PDF] " << last_error << std::endl;
    clear();
    return false;
  }

  // pdftoppm needs the document on disk
  // Unique per instance, several documents may render at once
  static std::atomic<unsigned long> instance_counter(0);
  long long timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
  temp_dir = std::filesystem::temp_directory_path() /
             ("fin_pdf_render_" + std::to_string(timestamp) + "_" + std::to_string(instance_counter++));
  try {
    std::filesystem::create_directories(temp_dir);
    std::ofstream outfile(temp_dir / "input.pdf", std::ios::binary);
    if (!outfile.is_open()) {
      std::cerr << "[PDF] cannot write render input, pages will have no raster" << std::endl;
    } else {
      outfile.write(data.c_str(), data.size());
    }
  } catch (const std::filesystem::filesystem_error& e) {
    std::cerr << "[PDF] cannot create render directory: " << e.what() << std::endl;
  }

  std::cout << "[PDF] loaded " << page_count() << " pages" << std::endl;
  return true;
}

int fin_pdf_sio::page_count() const {
  if (m_pdf == nullptr) {
    return 0;
  }
  int count = static_cast<int>(m_pdf->GetPages().GetCount());
  if (max_pages > 0 && count > max_pages) {
    return max_pages;
  }
  return count;
}

bool fin_pdf_sio::load_page(int index, fin_page_record& page) {
  if (m_pdf == nullptr || index < 0 || index >= page_count()) {
    last_error = "page index out of range: " + fin_string(index);
    return false;
  }

  try {
    const PdfPage& pdf_page = m_pdf->GetPages().GetPageAt(static_cast<unsigned>(index));
    Rect rect = pdf_page.GetRect();
    page.page_number = static_cast<long long>(index + 1);
    page.width = rect.Width;
    page.height = rect.Height;

    fin_pdf_page_reader reader;
    if (!reader.read_page(pdf_page, page)) {
      // Keep whatever was read before the failure; OCR covers the rest
      std::cerr << "[PDF] page " << (index + 1) << " partially read: " << reader.get_last_error() << std::endl;
    }
  } catch (const std::exception& e) {
    last_error = fin_string("cannot read page ") + fin_string(index + 1) + ": " + e.what();
    std::cerr << "[PDF] " << last_error << std::endl;
    return false;
  }

  cluster_drawings(page.paths, merge_gap, min_paths, page.drawings);
  page.update_text_layer();

  if (!render_page(index, page.raster)) {
    std::cerr << "[PDF] page " << (index + 1) << " rendered no raster" << std::endl;
  }
  return true;
}

bool fin_pdf_sio::render_page(int index, cv::Mat& output) {
  output.release();
  if (temp_dir.empty()) {
    return false;
  }

  std::filesystem::path temp_pdf = temp_dir / "input.pdf";
  std::filesystem::path prefix = temp_dir / ("page_" + std::to_string(index + 1));
  std::string page_no = std::to_string(index + 1);

  // Use pdftoppm to convert one page to an image
  std::string cmd = "pdftoppm -png -r " + std::to_string(dpi) + " -f " + page_no + " -l " + page_no +
                    " -singlefile '" + temp_pdf.string() + "' '" + prefix.string() + "'";
  int result = system(cmd.c_str());
  if (result != 0) {
    return false;
  }

  std::filesystem::path image_path = prefix.string() + ".png";
  output = cv::imread(image_path.string(), cv::IMREAD_COLOR);

  std::error_code ec;
  std::filesystem::remove(image_path, ec);
  return !output.empty();
}
