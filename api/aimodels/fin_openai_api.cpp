// fin_openai_api.cpp
#include "fin_openai_api.h"
#include "../client/fin_http_request.h"
#include "../json/fin_json.h"
#include <chrono>
#include <iostream>

namespace fin::llm {
  static fin_string role_to_string(message_role role) {
    switch (role) {
      case message_role::SYSTEM: return "system";
      case message_role::USER: return "user";
      case message_role::ASSISTANT: return "assistant";
    }
    return "";
  }

  static message_role role_from_string(const fin_string& role) {
    if (role == "system") return message_role::SYSTEM;
    if (role == "user") return message_role::USER;
    if (role == "assistant") return message_role::ASSISTANT;
    throw std::runtime_error("Unknown message role: " + role.to_std_const());
  }

  openai_message::openai_message(const finv_map& data) : data(data)
  {
    auto it = data.find("role");
    if (it == data.end() || !it->second.is_string()) {
      throw std::runtime_error("Message without role");
    }
    role = role_from_string(it->second.string_value());
  }

  openai_message::openai_message(message_role r, const fin_string& text) : role(r)
  {
    data["role"] = role_to_string(r);
    data["content"] = text;
  }

  const fin_string& openai_message::get_content() const {
    auto it = data.find("content");
    if (it != data.end() && it->second.is_string()) {
      return it->second.string_value();
    }
    throw std::runtime_error("Content not found or not a string in message data");
  }

  openai_api::openai_api(const fin_string& key, const fin_string& base_url,
                         const fin_string& embedding_model, int embedding_dimensions)
    : api_key(key), base_url(base_url), embedding_model(embedding_model),
      embedding_dimensions(embedding_dimensions)
  {
    while (this->base_url.ends_with("/")) {
      this->base_url = this->base_url.left(this->base_url.length() - 1);
    }
  }

  std::unique_ptr<i_llm_chat_context> openai_api::create_chat_context() {
    return std::make_unique<openai_chat_context>();
  }

  std::unique_ptr<i_llm_message> openai_api::create_message(message_role role, const fin_string& content) {
    return std::make_unique<openai_message>(role, content);
  }

  bool openai_api::post_json(const fin_string& path, finv_map& body, finv_map& response)
  {
    fin_json request_json(&body);
    fin_string json_body = request_json.create();
    if (json_body.empty()) {
      std::cerr << "[API] Failed to create JSON request body" << std::endl;
      return false;
    }

    fin_http_request request(base_url + path);
    request.set_method("POST");
    request.set_header("Content-Type", "application/json");
    request.set_header("Authorization", "Bearer " + api_key);
    request.set_body(json_body);

    auto started = std::chrono::steady_clock::now();
    bool ok = request.send();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    if (!ok) {
      std::cerr << "[API] POST " << path << " failed after " << elapsed.count() << " ms: "
                << request.get_error_message() << std::endl;
      return false;
    }

    fin_json response_json(&response);
    if (!response_json.parse(request.get_response_body())) {
      std::cerr << "[API] " << response_json.get_last_error() << std::endl;
      return false;
    }
    return true;
  }

  std::unique_ptr<i_llm_message> openai_api::generate_response(i_llm_chat_context& context)
  {
    auto* openai_ctx = dynamic_cast<openai_chat_context*>(&context);
    if (!openai_ctx) return nullptr;

    const auto& settings = openai_ctx->get_settings();
    if (!settings.count("model")) {
      std::cerr << "[API] Chat request without model setting" << std::endl;
      return nullptr;
    }

    finv_map body;
    body["model"] = settings.at("model");
    if (settings.count("max_tokens")) {
      body["max_tokens"] = settings.at("max_tokens");
    }
    if (settings.count("temperature")) {
      body["temperature"] = settings.at("temperature");
    }

    finv_vector messages;
    for (const auto& msg : openai_ctx->get_messages()) {
      messages.push_back(msg->get_data());
    }
    body["messages"] = messages;

    finv_map response;
    if (!post_json("/v1/chat/completions", body, response)) {
      return nullptr;
    }

    if (!response["choices"].is_vector() || response["choices"].vector_value().empty()) {
      return nullptr;
    }
    fin_variant& choice = response["choices"].to_vector()[0];
    if (!choice.is_map()) return nullptr;
    fin_variant& message = choice.to_map()["message"];
    if (!message.is_map()) return nullptr;

    return std::make_unique<openai_message>(message.map_value());
  }

  bool openai_api::embedding(const fin_string& text, finv_vector& embedding) {
    std::vector<finv_vector> result;
    if (!embeddings({text}, result) || result.empty()) {
      return false;
    }
    embedding = result[0];
    return true;
  }

  bool openai_api::embeddings(const std::vector<fin_string>& texts, std::vector<finv_vector>& result) {
    result.clear();
    if (texts.empty()) {
      return true;
    }

    finv_vector input;
    for (const auto& text : texts) {
      input.push_back(text);
    }

    finv_map body;
    body["model"] = embedding_model;
    body["input"] = input;
    if (embedding_dimensions > 0) {
      body["dimensions"] = embedding_dimensions;
    }

    finv_map response;
    if (!post_json("/v1/embeddings", body, response)) {
      return false;
    }
    if (!response["data"].is_vector()) {
      std::cerr << "[API] Embedding response without data" << std::endl;
      return false;
    }

    // Entries carry their input position in "index"
    const finv_vector& data = response["data"].vector_value();
    result.resize(texts.size());
    size_t filled = 0;
    for (size_t i = 0; i < data.size(); ++i) {
      if (!data[i].is_map()) continue;
      const finv_map& entry = data[i].map_value();
      auto index_it = entry.find("index");
      auto vector_it = entry.find("embedding");
      if (vector_it == entry.end() || !vector_it->second.is_vector()) continue;
      long long index = index_it != entry.end() ? index_it->second.convert(fin_variant::int_state).int_value()
                                                : static_cast<long long>(i);
      if (index < 0 || index >= static_cast<long long>(texts.size())) continue;
      result[static_cast<size_t>(index)] = vector_it->second.vector_value();
      filled++;
    }

    if (filled != texts.size()) {
      std::cerr << "[API] Expected " << texts.size() << " embeddings, got " << filled << std::endl;
      result.clear();
      return false;
    }
    return true;
  }

} // namespace fin::llm
