#ifndef FIN_LLM_CHAT_INTERFACES_H
#define FIN_LLM_CHAT_INTERFACES_H

#include "../../utils/fin_variant.h"
#include <memory>

namespace fin::llm {
  enum class message_role {
    SYSTEM,
    USER,
    ASSISTANT
  };

  class i_llm_message {
  public:
    virtual ~i_llm_message() = default;
    virtual message_role get_role() const noexcept = 0;
    virtual const fin_string& get_content() const = 0;
    virtual const finv_map& get_data() const noexcept = 0;
    virtual std::unique_ptr<i_llm_message> clone() const = 0;
  };

  class i_llm_chat_context {
  public:
    virtual ~i_llm_chat_context() = default;
    virtual void set_settings(const finv_map& settings) = 0;
    virtual void add_message(std::unique_ptr<i_llm_message> message) = 0;
    virtual const std::vector<std::unique_ptr<i_llm_message>>& get_messages() const noexcept = 0;
  };
}

#endif // FIN_LLM_CHAT_INTERFACES_H
