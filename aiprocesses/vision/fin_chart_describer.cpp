#include "fin_chart_describer.h"
#include <iostream>

fin_string fin_fallback_chart_describer::describe(const cv::Mat&, const fin_string& caption, const fin_string& ocr_text)
{
  std::vector<fin_string> parts;
  if (!caption.empty()) {
    parts.push_back("This figure is captioned: \"" + caption + "\".");
  }
  if (!ocr_text.empty()) {
    parts.push_back("Text visible in the chart: " + ocr_text);
  }
  return fin_string(" ").join(parts);
}

fin_llm_chart_describer::fin_llm_chart_describer(fin::llm::i_llm_api& api, const fin_string& model, int max_tokens)
  : api(api), model(model), max_tokens(max_tokens)
{
}

fin_string fin_llm_chart_describer::describe(const cv::Mat& image, const fin_string& caption, const fin_string& ocr_text)
{
  using fin::llm::message_role;

  if (caption.empty() && ocr_text.empty()) {
    return fallback.describe(image, caption, ocr_text);
  }

  try {
    auto context = api.create_chat_context();
    finv_map settings;
    settings["model"] = model;
    settings["max_tokens"] = max_tokens;
    context->set_settings(settings);

    context->add_message(api.create_message(message_role::SYSTEM,
      "You summarise charts taken from financial and macroeconomic reports. "
      "Answer with plain prose, no lists."));

    fin_string prompt = "Describe the following chart in 2-3 sentences, highlighting trends, "
                        "comparisons, and key values.\n";
    prompt += "Caption: " + caption + "\n";
    prompt += "Text visible in the chart:\n" + ocr_text;
    context->add_message(api.create_message(message_role::USER, prompt));

    auto answer = api.generate_response(*context);
    if (answer) {
      fin_string text = answer->get_content().trim();
      if (!text.empty()) {
        return text;
      }
    }
    std::cerr << "[FIGURE] Chart description request returned nothing, using caption/OCR" << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "[FIGURE] Chart description failed: " << e.what() << std::endl;
  }
  return fallback.describe(image, caption, ocr_text);
}
