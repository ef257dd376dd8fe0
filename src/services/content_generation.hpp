#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>

#include <glaze/glaze.hpp>

#include "../helpers/debug.hpp"
#include "../planner/errors.hpp"

namespace itinera::services {

    // JSON shape a generation call must answer with
    struct output_schema {
        std::string name;
        std::string json_schema;
    };

    /**
     * Text generator behind the planner's creative subtasks (themes, day
     * schedules, fares). Implementations return raw JSON text; validation
     * and retries happen in generate_structured.
     */
    class content_generation_service {
    public:
        virtual ~content_generation_service() = default;

        virtual std::string generate(const std::string& context, const output_schema& schema) = 0;
    };

    struct retry_policy {
        int max_attempts{3};
    };

    /**
     * Ask the service for a T, retrying malformed or rejected output.
     * `check` returns an error description for a parsed value it will not
     * accept, or nullopt. Throws collaborator_failure when attempts run out.
     */
    template <typename T, typename Check>
    T generate_structured(content_generation_service& service,
                          std::string_view call_site,
                          const std::string& context,
                          const output_schema& schema,
                          const retry_policy& policy,
                          Check check) {
        const int attempts = policy.max_attempts > 0 ? policy.max_attempts : 1;
        std::string last_error = "no attempt made";

        for (int attempt = 1; attempt <= attempts; ++attempt) {
            std::string raw;
            try {
                raw = service.generate(context, schema);
            } catch (const std::exception& e) {
                last_error = e.what();
                LLM_WARN_FMT("{} attempt {}/{} failed: {}", call_site, attempt, attempts, last_error);
                continue;
            }

            T value{};
            auto error = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, raw);
            if (error) {
                last_error = glz::format_error(error, raw);
                LLM_WARN_FMT("{} attempt {}/{} returned malformed JSON: {}", call_site, attempt, attempts, last_error);
                continue;
            }

            if (auto rejected = check(value)) {
                last_error = *rejected;
                LLM_WARN_FMT("{} attempt {}/{} rejected: {}", call_site, attempt, attempts, last_error);
                continue;
            }

            LLM_DEBUG_FMT("{} succeeded on attempt {}", call_site, attempt);
            return value;
        }

        LLM_ERROR_FMT("{} gave up after {} attempt(s)", call_site, attempts);
        throw planner::collaborator_failure(std::string(call_site), attempts, last_error);
    }

    template <typename T>
    T generate_structured(content_generation_service& service,
                          std::string_view call_site,
                          const std::string& context,
                          const output_schema& schema,
                          const retry_policy& policy) {
        return generate_structured<T>(service, call_site, context, schema, policy,
                                      [](const T&) { return std::optional<std::string>{}; });
    }
}
