#pragma once

#include <format>
#include <stdexcept>
#include <string>
#include <utility>

#include "../helpers/api_keys.hpp"
#include "../helpers/chat_client.hpp"
#include "../helpers/debug.hpp"
#include "../helpers/fetch.hpp"
#include "content_generation.hpp"

namespace itinera::services {

    struct llm_settings {
        std::string api_key;
        std::string base_url{helpers::ApiKeys::open_ai_base};
        std::string model{helpers::ApiKeys::default_model};
        float temperature{0.3f};
        long timeout_seconds{60};

        static llm_settings from_environment() {
            llm_settings settings;
            settings.api_key = helpers::ApiKeys::get_llm_api_key();
            settings.base_url = helpers::ApiKeys::get_llm_base_url();
            settings.model = helpers::ApiKeys::get_llm_model();
            settings.temperature = helpers::ApiKeys::get_llm_temperature();
            return settings;
        }
    };

    /**
     * Content generation backed by an OpenAI-compatible chat completion
     * endpoint. Every call starts a fresh conversation.
     */
    class llm_content_service : public content_generation_service {
    public:
        explicit llm_content_service(llm_settings settings)
            : settings_(std::move(settings)),
              client_(settings_.api_key, settings_.base_url),
              http_(settings_.timeout_seconds) {
            if (settings_.api_key.empty()) {
                throw std::invalid_argument("Content generation needs ITINERA_LLM_API_KEY to be set");
            }
            LLM_INFO_FMT("Using model {} at {}", settings_.model, settings_.base_url);
        }

        std::string generate(const std::string& context, const output_schema& schema) override {
            auto conversation = client_.new_conversation();
            conversation.add_instructions(std::format(
                "You are a travel planning assistant. Answer with a single JSON object "
                "named {} that validates against this JSON schema, and nothing else:\n{}",
                schema.name, schema.json_schema));

            LLM_DEBUG_FMT("Requesting {} ({} bytes of context)", schema.name, context.size());
            return conversation.sendMessage(
                context,
                [this](const std::string& url, const std::string& body, auto header_setter) {
                    return http_.post(url, body, header_setter);
                },
                settings_.model,
                settings_.temperature);
        }

    private:
        llm_settings settings_;
        llm::chat_client client_;
        http::fetch http_;
    };
}
