#pragma once

#include <chrono>
#include <format>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <glaze/glaze.hpp>

#include "debug.hpp"

namespace itinera::llm
{
    struct Message {
        std::string role;
        std::string content;
    };

    struct ChatCompletionMessage {
        std::string role;
        std::string content;
    };

    struct ChatCompletionChoice {
        int index{};
        ChatCompletionMessage message;
        std::string finish_reason;
    };

    struct UsageInfo {
        int prompt_tokens{};
        int completion_tokens{};
        int total_tokens{};
    };

    struct ChatCompletion {
        std::string id;
        std::string model;
        std::vector<ChatCompletionChoice> choices;
        UsageInfo usage;
    };

    // Asks the endpoint for a JSON object instead of free text
    struct ResponseFormat {
        std::string type = "json_object";
    };

    struct Payload {
        std::string model;
        std::vector<Message> messages;
        float temperature;
        std::optional<ResponseFormat> response_format;
    };
}

// Define glaze schema for all structures
template <>
struct glz::meta<itinera::llm::Message> {
    using T = itinera::llm::Message;
    static constexpr auto value = object(
        "role", &T::role,
        "content", &T::content
    );
};

template <>
struct glz::meta<itinera::llm::ChatCompletionMessage> {
    using T = itinera::llm::ChatCompletionMessage;
    static constexpr auto value = object(
        "role", &T::role,
        "content", &T::content
    );
};

template <>
struct glz::meta<itinera::llm::ChatCompletionChoice> {
    using T = itinera::llm::ChatCompletionChoice;
    static constexpr auto value = object(
        "index", &T::index,
        "message", &T::message,
        "finish_reason", &T::finish_reason
    );
};

template <>
struct glz::meta<itinera::llm::UsageInfo> {
    using T = itinera::llm::UsageInfo;
    static constexpr auto value = object(
        "prompt_tokens", &T::prompt_tokens,
        "completion_tokens", &T::completion_tokens,
        "total_tokens", &T::total_tokens
    );
};

template <>
struct glz::meta<itinera::llm::ChatCompletion> {
    using T = itinera::llm::ChatCompletion;
    static constexpr auto value = object(
        "id", &T::id,
        "model", &T::model,
        "choices", &T::choices,
        "usage", &T::usage
    );
};

template <>
struct glz::meta<itinera::llm::ResponseFormat> {
    using T = itinera::llm::ResponseFormat;
    static constexpr auto value = object(
        "type", &T::type
    );
};

template <>
struct glz::meta<itinera::llm::Payload> {
    using T = itinera::llm::Payload;
    static constexpr auto value = object(
        "model", &T::model,
        "messages", &T::messages,
        "temperature", &T::temperature,
        "response_format", &T::response_format
    );
};

namespace itinera::llm
{
    /**
     * Minimal client for OpenAI-compatible chat completion endpoints.
     * Keeps the conversation so follow-up messages see earlier turns.
     */
    class chat_client
    {
    public:
        chat_client(const std::string &api_key, const std::string &base_url) : api_key_(api_key), base_url_{base_url} {}

        chat_client new_conversation() const {
            return chat_client(api_key_, base_url_);
        }

        void add_instructions(std::string_view instructions, std::string_view role = "system")
        {
            conversation.push_back({std::string(role), std::string(instructions)});
        }

        // Send a message and return the assistant's reply text
        std::string sendMessage(
            std::string_view message,
            auto do_post,
            std::string_view model,
            float temperature,
            bool json_reply = true,
            std::string_view role = "user")
        {
            wait_min_time();
            conversation.push_back({std::string(role), std::string(message)});

            Payload payload{
                std::string(model),
                conversation,
                temperature,
                json_reply ? std::optional<ResponseFormat>{ResponseFormat{}} : std::nullopt
            };

            auto url = std::format("{}/chat/completions", base_url_);
            std::string body;
            auto error = glz::write_json(payload, body);
            if (error) {
                throw std::runtime_error("Failed to serialize payload: " + glz::format_error(error));
            }

            auto r = do_post(url, body, [this](auto header_setter){
                header_setter("Authorization: Bearer " + api_key_);
                header_setter("Content-Type: application/json");
            });

            ChatCompletion response;
            auto read_error = glz::read<glz::opts{.error_on_unknown_keys = false}>(response, r);
            if (read_error) {
                throw std::runtime_error("Failed to parse response: " + glz::format_error(read_error, r));
            }
            if (response.choices.empty()) {
                throw std::runtime_error("Chat completion returned no choices");
            }

            LLM_TRACE_FMT("Completion {} used {} tokens", response.id, response.usage.total_tokens);

            std::string reply = response.choices[0].message.content;
            conversation.push_back({"assistant", reply});
            return reply;
        }

        auto const &get_conversation() const
        {
            return conversation;
        }

    private:
        std::string api_key_;
        std::vector<Message> conversation;
        std::string base_url_;

        static std::chrono::steady_clock::duration min_time_between_requests() {
            return std::chrono::milliseconds(500);
        }

        // Simple client-side rate limit shared by every conversation
        static void wait_min_time() {
            static std::mutex mutex;
            std::lock_guard lock(mutex);
            static auto last_request = std::chrono::steady_clock::now() - min_time_between_requests();
            auto now = std::chrono::steady_clock::now();
            auto elapsed = now - last_request;
            if (elapsed < min_time_between_requests()) {
                std::this_thread::sleep_for(min_time_between_requests() - elapsed);
            }
            last_request = std::chrono::steady_clock::now();
        }
    };
}
