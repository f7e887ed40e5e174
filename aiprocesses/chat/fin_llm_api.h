#ifndef FIN_LLM_API_H
#define FIN_LLM_API_H

#include "../../utils/fin_variant.h"
#include "fin_llm_chat_interfaces.h"

namespace fin::llm {
  class i_llm_api {
  public:
    virtual ~i_llm_api() = default;

    virtual std::unique_ptr<i_llm_chat_context> create_chat_context() = 0;
    virtual std::unique_ptr<i_llm_message> create_message(message_role role, const fin_string& content) = 0;

    // nullptr when the request failed
    virtual std::unique_ptr<i_llm_message> generate_response(i_llm_chat_context& context) = 0;

    virtual bool embedding(const fin_string& text, finv_vector& embedding) = 0;

    // One vector per input text, in input order
    virtual bool embeddings(const std::vector<fin_string>& texts, std::vector<finv_vector>& result) = 0;
  };

} // namespace fin::llm

#endif // FIN_LLM_API_H
