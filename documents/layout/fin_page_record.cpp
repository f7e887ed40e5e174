#include "fin_page_record.h"

namespace {
  // Below this many characters the native text layer is treated as missing
  const size_t min_text_layer_chars = 20;
}

double fin_page_record::area() const
{
  return width.value() * height.value();
}

void fin_page_record::update_text_layer()
{
  std::vector<fin_string> parts;
  for (size_t i = 0; i < spans.size(); ++i) {
    fin_string text = spans[i].text.value().trim();
    if (!text.empty()) {
      parts.push_back(text);
    }
  }
  raw_text = fin_string(" ").join(parts);
  has_text_layer = raw_text.value().trim().length() > min_text_layer_chars;
}

void fin_page_record::release_raster()
{
  raster.release();
}
