// 1. Standard includes in alphabetic order
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

// 2. Libraries used in the project, in alphabetic order
// None in this file

// 3. All other includes
#include "helpers/debug.hpp"
#include "io/itinerary_json.hpp"
#include "planner/errors.hpp"
#include "planner/orchestrator.hpp"
#include "services/llm_content_service.hpp"
#include "services/place_discovery.hpp"

namespace {

constexpr int exit_ok = 0;
constexpr int exit_build_failed = 1;
constexpr int exit_usage = 2;

struct command_line {
    std::string trip_path;
    std::string catalog_path;
    itinera::planner::planner_options options;
};

void print_usage(std::string_view program) {
    std::cerr << "Usage: " << program << " <trip.json> <catalog.json> [--max-replans N] [--strict-budget]\n"
              << "\n"
              << "Environment:\n"
              << "  ITINERA_LLM_API_KEY      API key of the chat completion endpoint (required)\n"
              << "  ITINERA_LLM_BASE_URL     endpoint base URL (default " << itinera::helpers::ApiKeys::open_ai_base << ")\n"
              << "  ITINERA_LLM_MODEL        model name (default " << itinera::helpers::ApiKeys::default_model << ")\n"
              << "  ITINERA_LLM_TEMPERATURE  sampling temperature (default 0.3)\n";
}

std::optional<command_line> parse_command_line(int argc, char** argv) {
    command_line cmd;
    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--strict-budget") {
            cmd.options.fail_when_over_budget = true;
        } else if (arg == "--max-replans") {
            if (i + 1 >= argc) {
                std::cerr << "--max-replans needs a value\n";
                return std::nullopt;
            }
            try {
                cmd.options.max_replan_attempts = std::stoi(argv[++i]);
            } catch (const std::logic_error&) {
                std::cerr << "--max-replans expects a number, got '" << argv[i] << "'\n";
                return std::nullopt;
            }
            if (cmd.options.max_replan_attempts < 0) {
                std::cerr << "--max-replans must not be negative\n";
                return std::nullopt;
            }
        } else if (arg.starts_with("--")) {
            std::cerr << "Unknown option " << arg << "\n";
            return std::nullopt;
        } else if (positional == 0) {
            cmd.trip_path = arg;
            ++positional;
        } else if (positional == 1) {
            cmd.catalog_path = arg;
            ++positional;
        } else {
            std::cerr << "Unexpected argument " << arg << "\n";
            return std::nullopt;
        }
    }
    if (positional != 2) {
        return std::nullopt;
    }
    return cmd;
}

}

int main(int argc, char** argv) {
    auto cmd = parse_command_line(argc, argv);
    if (!cmd) {
        print_usage(argc > 0 ? argv[0] : "itinera");
        return exit_usage;
    }

    try {
        auto trip = itinera::io::parse_trip_request(itinera::io::read_text_file(cmd->trip_path));
        auto discovery = itinera::services::catalog_place_discovery::from_json(
            itinera::io::read_text_file(cmd->catalog_path));
        auto places = itinera::services::discover_all(discovery, trip.destination);

        itinera::services::llm_content_service content(itinera::services::llm_settings::from_environment());
        itinera::planner::itinerary_orchestrator orchestrator(content, cmd->options);

        auto itinerary = orchestrator.build(trip, places);
        std::cout << itinera::io::write_itinerary(itinerary) << std::endl;
        return exit_ok;
    } catch (const itinera::planner::input_invalid& e) {
        SYS_ERROR_FMT("Invalid input: {}", e.what());
        return exit_usage;
    } catch (const itinera::planner::build_failure& e) {
        SYS_ERROR(e.what());
        return exit_build_failed;
    } catch (const std::invalid_argument& e) {
        // Missing or unusable configuration
        SYS_ERROR_FMT("Configuration error: {}", e.what());
        return exit_usage;
    } catch (const std::exception& e) {
        SYS_ERROR_FMT("Unexpected error: {}", e.what());
        return exit_build_failed;
    }
}
