// fin_openai_api.h
#ifndef FIN_OPENAI_API_H
#define FIN_OPENAI_API_H

#include "../../aiprocesses/chat/fin_llm_api.h"

namespace fin::llm {
  class openai_message final : public i_llm_message {
    message_role role;
    finv_map data;
  public:
    explicit openai_message(const finv_map& data);
    openai_message(message_role r, const fin_string& text);
    message_role get_role() const noexcept override { return role; }
    const fin_string& get_content() const override;
    const finv_map& get_data() const noexcept override { return data; }
    std::unique_ptr<i_llm_message> clone() const override {
      return std::make_unique<openai_message>(data);
    }
  };

  class openai_chat_context final : public i_llm_chat_context {
    finv_map settings;
    std::vector<std::unique_ptr<i_llm_message>> messages;
  public:
    void set_settings(const finv_map& s) override { settings = s; }
    const finv_map& get_settings() const { return settings; }
    void add_message(std::unique_ptr<i_llm_message> message) override { messages.push_back(std::move(message)); }
    const std::vector<std::unique_ptr<i_llm_message>>& get_messages() const noexcept override { return messages; }
  };

  // OpenAI-compatible REST client: chat completions and embeddings under
  // {base_url}/v1/
  class openai_api final : public i_llm_api {
    fin_string api_key;
    fin_string base_url;
    fin_string embedding_model;
    int embedding_dimensions;
  public:
    openai_api(const fin_string& key,
               const fin_string& base_url = "https://api.openai.com",
               const fin_string& embedding_model = "text-embedding-3-small",
               int embedding_dimensions = 1536);

    std::unique_ptr<i_llm_chat_context> create_chat_context() override;
    std::unique_ptr<i_llm_message> create_message(message_role role, const fin_string& content) override;

    std::unique_ptr<i_llm_message> generate_response(i_llm_chat_context& context) override;

    bool embedding(const fin_string& text, finv_vector& embedding) override;
    bool embeddings(const std::vector<fin_string>& texts, std::vector<finv_vector>& result) override;

  private:
    bool post_json(const fin_string& path, finv_map& body, finv_map& response);
  };

} // namespace fin::llm

#endif // FIN_OPENAI_API_H
