#ifndef fin_TEST_FAKES_H
#define fin_TEST_FAKES_H

#include "../aiprocesses/chat/fin_llm_api.h"
#include "../aiprocesses/vision/fin_ocr_engine.h"
#include "../api/store/fin_memory_chunk_store.h"
#include "../documents/fin_doc_sio.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>

// ============================================================================
// PAGE HELPERS
// ============================================================================

inline void add_span(fin_page_record& page, const fin_string& text, double x, double y, double w, double h,
                     double font_size = 10.0, bool bold = false)
{
  page.spans.add_element();
  fin_layout_span& span = page.spans.back();
  span.set_bounds(x, y, w, h);
  span.text = text;
  span.font_size = font_size;
  span.bold = bold;
  span.font_family = "Helvetica";
}

inline void add_image(fin_page_record& page, double x, double y, double w, double h)
{
  page.images.add_element();
  fin_layout_image& image = page.images.back();
  image.set_bounds(x, y, w, h);
  image.pixel_width = static_cast<long long>(w * 2);
  image.pixel_height = static_cast<long long>(h * 2);
}

inline void add_path(fin_page_record& page, double x, double y, double w, double h)
{
  page.paths.add_element();
  fin_layout_path& path = page.paths.back();
  path.set_bounds(x, y, w, h);
  path.has_stroke = true;
  path.has_fill = false;
}

// US Letter page rendered at dpi as a blank white raster
inline void blank_raster(fin_page_record& page, int dpi = 100)
{
  int cols = static_cast<int>(page.width.value() * dpi / 72.0);
  int rows = static_cast<int>(page.height.value() * dpi / 72.0);
  page.raster = cv::Mat(rows, cols, CV_8UC3, cv::Scalar(255, 255, 255));
}

inline void letter_page(fin_page_record& page, long long number)
{
  page.page_number = number;
  page.width = 612.0;
  page.height = 792.0;
}

// Unique scratch directory below the system temp directory
inline std::filesystem::path scratch_dir(const std::string& name)
{
  static std::atomic<unsigned long> counter(0);
  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  std::filesystem::path dir = std::filesystem::temp_directory_path() /
    ("fingest_test_" + name + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
  std::filesystem::create_directories(dir);
  return dir;
}

inline fin_string write_file(const std::filesystem::path& path, const std::string& content)
{
  std::ofstream out(path, std::ios::binary);
  out << content;
  return path.string();
}

// ============================================================================
// FAKE PAGE SOURCE - pages built in code, file content only hashed
// ============================================================================

typedef std::function<void(fin_page_record&)> fake_page_builder;

class fake_page_source : public fin_doc_sio {
public:
  explicit fake_page_source(const std::vector<fake_page_builder>& builders, bool fail_parse = false)
    : builders_(builders), fail_parse_(fail_parse) {}

  // Called after each page was loaded, with its 0-based index
  std::function<void(int)> on_page_loaded;

  bool parse(fin_string& data) override {
    if (fail_parse_) {
      last_error = "not a PDF (" + fin_string(static_cast<unsigned long>(data.size())) + " bytes)";
      return false;
    }
    return true;
  }

  int page_count() const override { return static_cast<int>(builders_.size()); }

  bool load_page(int index, fin_page_record& page) override {
    if (index < 0 || index >= page_count()) {
      last_error = "page index out of range";
      return false;
    }
    letter_page(page, index + 1);
    builders_[index](page);
    page.update_text_layer();
    if (on_page_loaded) {
      on_page_loaded(index);
    }
    return true;
  }

private:
  std::vector<fake_page_builder> builders_;
  bool fail_parse_;
};

// ============================================================================
// FAKE OCR ENGINE
// ============================================================================

class fake_ocr_engine : public fin_ocr_engine {
public:
  std::vector<fin_ocr_box> boxes;
  bool throw_error = false;
  std::atomic<int> calls{0};
  double last_threshold = -1.0;

  std::vector<fin_ocr_box> recognize(const cv::Mat&, double confidence_threshold) override {
    calls++;
    last_threshold = confidence_threshold;
    if (throw_error) {
      throw std::runtime_error("engine crashed");
    }
    std::vector<fin_ocr_box> result;
    for (const auto& box : boxes) {
      if (box.confidence >= confidence_threshold) {
        result.push_back(box);
      }
    }
    sort_reading_order(result);
    return result;
  }
};

inline fin_ocr_box ocr_box(const fin_string& text, int x0, int y0, int x1, int y1, double confidence = 0.9)
{
  fin_ocr_box box;
  box.text = text;
  box.confidence = confidence;
  box.x0 = x0;
  box.y0 = y0;
  box.x1 = x1;
  box.y1 = y1;
  return box;
}

// ============================================================================
// FAKE LLM API
// ============================================================================

class fake_llm_message : public fin::llm::i_llm_message {
public:
  fake_llm_message(fin::llm::message_role role, const fin_string& content) : role_(role), content_(content) {}

  fin::llm::message_role get_role() const noexcept override { return role_; }
  const fin_string& get_content() const override { return content_; }
  const finv_map& get_data() const noexcept override { return data_; }
  std::unique_ptr<fin::llm::i_llm_message> clone() const override {
    return std::make_unique<fake_llm_message>(role_, content_);
  }

private:
  fin::llm::message_role role_;
  fin_string content_;
  finv_map data_;
};

class fake_chat_context : public fin::llm::i_llm_chat_context {
public:
  void set_settings(const finv_map& settings) override { settings_ = settings; }
  void add_message(std::unique_ptr<fin::llm::i_llm_message> message) override {
    messages_.push_back(std::move(message));
  }
  const std::vector<std::unique_ptr<fin::llm::i_llm_message>>& get_messages() const noexcept override {
    return messages_;
  }
  const finv_map& get_settings() const { return settings_; }

private:
  finv_map settings_;
  std::vector<std::unique_ptr<fin::llm::i_llm_message>> messages_;
};

// Answers chats with a fixed reply and embeds text as
// [length, vowels, digits, 1.0]
class fake_llm_api : public fin::llm::i_llm_api {
public:
  fin_string reply = "Revenue grew steadily across all regions.";
  bool fail_chat = false;
  bool throw_chat = false;
  bool fail_embeddings = false;
  fin_string last_prompt;
  finv_map last_settings;
  std::vector<size_t> batch_sizes;

  std::unique_ptr<fin::llm::i_llm_chat_context> create_chat_context() override {
    return std::make_unique<fake_chat_context>();
  }

  std::unique_ptr<fin::llm::i_llm_message> create_message(fin::llm::message_role role,
                                                           const fin_string& content) override {
    return std::make_unique<fake_llm_message>(role, content);
  }

  std::unique_ptr<fin::llm::i_llm_message> generate_response(fin::llm::i_llm_chat_context& context) override {
    if (throw_chat) {
      throw std::runtime_error("connection reset");
    }
    const auto& messages = context.get_messages();
    if (!messages.empty()) {
      last_prompt = messages.back()->get_content();
    }
    fake_chat_context* fake = dynamic_cast<fake_chat_context*>(&context);
    if (fake != nullptr) {
      last_settings = fake->get_settings();
    }
    if (fail_chat) {
      return nullptr;
    }
    return std::make_unique<fake_llm_message>(fin::llm::message_role::ASSISTANT, reply);
  }

  bool embedding(const fin_string& text, finv_vector& result) override {
    if (fail_embeddings) {
      return false;
    }
    result = embed(text);
    return true;
  }

  bool embeddings(const std::vector<fin_string>& texts, std::vector<finv_vector>& result) override {
    batch_sizes.push_back(texts.size());
    if (fail_embeddings) {
      return false;
    }
    result.clear();
    for (const auto& text : texts) {
      result.push_back(embed(text));
    }
    return true;
  }

  static finv_vector embed(const fin_string& text) {
    double vowels = 0;
    double digits = 0;
    for (char c : text.lower().to_std_const()) {
      if (c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u') {
        vowels++;
      } else if (c >= '0' && c <= '9') {
        digits++;
      }
    }
    return finv_vector{static_cast<double>(text.size()), vowels, digits, 1.0};
  }
};

// ============================================================================
// FLAKY STORE - in-memory store whose first upserts fail
// ============================================================================

class flaky_chunk_store : public fin_chunk_store {
public:
  explicit flaky_chunk_store(int failures) : failures_left_(failures) {}

  size_t upsert(const fin_model_list<fin_chunk>& chunks) override {
    std::lock_guard<std::mutex> lock(mutex_);
    attempts_++;
    if (failures_left_ > 0) {
      failures_left_--;
      throw fin_store_error("database not reachable");
    }
    return inner_.upsert(chunks);
  }

  void query(const fin_string& text, int k, const fin_string& collection,
             fin_model_list<fin_search_hit>& hits) override {
    inner_.query(text, k, collection, hits);
  }

  bool exists_by_doc_id(const fin_string& doc_id) override {
    if (fail_lookup) {
      throw fin_store_error("lookup failed");
    }
    return inner_.exists_by_doc_id(doc_id);
  }

  int attempts() const { return attempts_; }
  size_t size() const { return inner_.size(); }

  bool fail_lookup = false;

private:
  fin_memory_chunk_store inner_;
  int failures_left_;
  int attempts_ = 0;
  std::mutex mutex_;
};

#endif // fin_TEST_FAKES_H
