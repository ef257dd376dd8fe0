#pragma once

#include <string>

#include "platform_utils.hpp"

namespace itinera::helpers {
    /**
     * Centralized access to the content-generation service settings
     * taken from the environment.
     */
    class ApiKeys {
    public:
        static constexpr auto open_ai_base = "https://api.openai.com/v1";
        static constexpr auto default_model = "gpt-4o-mini";

        /**
         * Get the LLM API key from the environment variable
         * @return The API key as a string, or empty string if not set
         */
        static std::string get_llm_api_key() {
            return platform::get_env("ITINERA_LLM_API_KEY");
        }

        // Base URL of an OpenAI-compatible chat completions endpoint
        static std::string get_llm_base_url() {
            return platform::get_env_or("ITINERA_LLM_BASE_URL", open_ai_base);
        }

        static std::string get_llm_model() {
            return platform::get_env_or("ITINERA_LLM_MODEL", default_model);
        }

        static float get_llm_temperature() {
            auto value = platform::get_env_number("ITINERA_LLM_TEMPERATURE");
            return value ? static_cast<float>(*value) : 0.3f;
        }
    };
}
