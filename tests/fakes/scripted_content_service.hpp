#pragma once

#include <deque>
#include <format>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "services/content_generation.hpp"

namespace itinera::test_support {

    /**
     * Content generation double. Replies are scripted per schema name:
     * queued replies are used first, in order, then the handler if any.
     * Every request context is recorded.
     */
    class scripted_content_service : public services::content_generation_service {
    public:
        using handler = std::function<std::string(const std::string& context)>;

        void queue(const std::string& schema_name, std::string reply) {
            queued_[schema_name].push_back(std::move(reply));
        }

        void queue_failure(const std::string& schema_name) {
            queued_[schema_name].push_back(failure_marker);
        }

        void on(const std::string& schema_name, handler h) {
            handlers_[schema_name] = std::move(h);
        }

        std::string generate(const std::string& context, const services::output_schema& schema) override {
            contexts_[schema.name].push_back(context);

            auto& queued = queued_[schema.name];
            if (!queued.empty()) {
                auto reply = std::move(queued.front());
                queued.pop_front();
                if (reply == failure_marker) {
                    throw std::runtime_error(std::format("scripted failure for {}", schema.name));
                }
                return reply;
            }

            auto it = handlers_.find(schema.name);
            if (it != handlers_.end()) {
                return it->second(context);
            }
            throw std::runtime_error(std::format("no scripted reply for {}", schema.name));
        }

        int calls(const std::string& schema_name) const {
            auto it = contexts_.find(schema_name);
            return it == contexts_.end() ? 0 : static_cast<int>(it->second.size());
        }

        const std::vector<std::string>& contexts(const std::string& schema_name) {
            return contexts_[schema_name];
        }

    private:
        static constexpr const char* failure_marker = "<scripted failure>";

        std::map<std::string, std::deque<std::string>> queued_;
        std::map<std::string, handler> handlers_;
        std::map<std::string, std::vector<std::string>> contexts_;
    };

    /**
     * Handler that schedules, from 09:00 in two-hour steps, every place of
     * `ids` that the request context offers as a candidate.
     */
    inline scripted_content_service::handler schedule_offered(std::vector<std::string> ids) {
        return [ids = std::move(ids)](const std::string& context) {
            std::string activities;
            int hour = 9;
            for (const auto& id : ids) {
                if (context.find(std::format("\"place_id\":\"{}\"", id)) == std::string::npos) {
                    continue;
                }
                if (!activities.empty()) activities += ",";
                activities += std::format(R"({{"place_id":"{}","start_time":"{:02}:00","duration_hours":1.5}})",
                                          id, hour % 24);
                hour += 2;
            }
            return std::format(R"({{"activities":[{}]}})", activities);
        };
    }
}
