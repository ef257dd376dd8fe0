#pragma once

// 1. Standard includes in alphabetic order
#include <format>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

// 2. Libraries used in the project, in alphabetic order
// None in this file

// 3. All other includes
// None in this file

// Define logging levels
#define LOG_LEVEL_NONE 0
#define LOG_LEVEL_ERROR 1
#define LOG_LEVEL_WARN 2
#define LOG_LEVEL_INFO 3
#define LOG_LEVEL_DEBUG 4
#define LOG_LEVEL_TRACE 5

// Set default log level if not defined (can be overridden with -D compiler flag)
#ifndef ITINERA_LOG_LEVEL
#ifdef NDEBUG
    // In release builds, only show errors by default
    #define ITINERA_LOG_LEVEL LOG_LEVEL_ERROR
#else
    #define ITINERA_LOG_LEVEL LOG_LEVEL_TRACE
#endif
#endif

// Convenience macro for component logging. Everything goes to stderr so that
// stdout stays reserved for the itinerary document.
#define LOG_COMPONENT(component, level, message) \
    if (level <= ITINERA_LOG_LEVEL) { \
        std::cerr << "[" << component << "][" << \
        (level == LOG_LEVEL_ERROR ? "ERROR" : \
         level == LOG_LEVEL_WARN ? "WARN" : \
         level == LOG_LEVEL_INFO ? "INFO" : \
         level == LOG_LEVEL_DEBUG ? "DEBUG" : "TRACE") \
        << "] " << message << std::endl; \
    }

// Orchestrator / state machine
#define PLAN_ERROR(message) LOG_COMPONENT("PLAN", LOG_LEVEL_ERROR, message)
#define PLAN_WARN(message) LOG_COMPONENT("PLAN", LOG_LEVEL_WARN, message)
#define PLAN_INFO(message) LOG_COMPONENT("PLAN", LOG_LEVEL_INFO, message)
#define PLAN_DEBUG(message) LOG_COMPONENT("PLAN", LOG_LEVEL_DEBUG, message)
#define PLAN_TRACE(message) LOG_COMPONENT("PLAN", LOG_LEVEL_TRACE, message)

// Place selection
#define SELECT_WARN(message) LOG_COMPONENT("SELECT", LOG_LEVEL_WARN, message)
#define SELECT_INFO(message) LOG_COMPONENT("SELECT", LOG_LEVEL_INFO, message)
#define SELECT_DEBUG(message) LOG_COMPONENT("SELECT", LOG_LEVEL_DEBUG, message)
#define SELECT_TRACE(message) LOG_COMPONENT("SELECT", LOG_LEVEL_TRACE, message)

// Theme planning and assignment
#define THEME_WARN(message) LOG_COMPONENT("THEME", LOG_LEVEL_WARN, message)
#define THEME_INFO(message) LOG_COMPONENT("THEME", LOG_LEVEL_INFO, message)
#define THEME_DEBUG(message) LOG_COMPONENT("THEME", LOG_LEVEL_DEBUG, message)

// Day schedule construction
#define SCHEDULE_ERROR(message) LOG_COMPONENT("SCHEDULE", LOG_LEVEL_ERROR, message)
#define SCHEDULE_WARN(message) LOG_COMPONENT("SCHEDULE", LOG_LEVEL_WARN, message)
#define SCHEDULE_INFO(message) LOG_COMPONENT("SCHEDULE", LOG_LEVEL_INFO, message)
#define SCHEDULE_DEBUG(message) LOG_COMPONENT("SCHEDULE", LOG_LEVEL_DEBUG, message)

// Routing and travel segments
#define ROUTE_WARN(message) LOG_COMPONENT("ROUTE", LOG_LEVEL_WARN, message)
#define ROUTE_INFO(message) LOG_COMPONENT("ROUTE", LOG_LEVEL_INFO, message)
#define ROUTE_DEBUG(message) LOG_COMPONENT("ROUTE", LOG_LEVEL_DEBUG, message)
#define ROUTE_TRACE(message) LOG_COMPONENT("ROUTE", LOG_LEVEL_TRACE, message)

// Budget validation
#define BUDGET_WARN(message) LOG_COMPONENT("BUDGET", LOG_LEVEL_WARN, message)
#define BUDGET_INFO(message) LOG_COMPONENT("BUDGET", LOG_LEVEL_INFO, message)
#define BUDGET_DEBUG(message) LOG_COMPONENT("BUDGET", LOG_LEVEL_DEBUG, message)

// Content generation collaborator
#define LLM_ERROR(message) LOG_COMPONENT("LLM", LOG_LEVEL_ERROR, message)
#define LLM_WARN(message) LOG_COMPONENT("LLM", LOG_LEVEL_WARN, message)
#define LLM_INFO(message) LOG_COMPONENT("LLM", LOG_LEVEL_INFO, message)
#define LLM_DEBUG(message) LOG_COMPONENT("LLM", LOG_LEVEL_DEBUG, message)
#define LLM_TRACE(message) LOG_COMPONENT("LLM", LOG_LEVEL_TRACE, message)

// Place discovery
#define DISCOVERY_ERROR(message) LOG_COMPONENT("DISCOVERY", LOG_LEVEL_ERROR, message)
#define DISCOVERY_INFO(message) LOG_COMPONENT("DISCOVERY", LOG_LEVEL_INFO, message)
#define DISCOVERY_DEBUG(message) LOG_COMPONENT("DISCOVERY", LOG_LEVEL_DEBUG, message)

// System/app logging macros
#define SYS_ERROR(message) LOG_COMPONENT("SYSTEM", LOG_LEVEL_ERROR, message)
#define SYS_WARN(message) LOG_COMPONENT("SYSTEM", LOG_LEVEL_WARN, message)
#define SYS_INFO(message) LOG_COMPONENT("SYSTEM", LOG_LEVEL_INFO, message)
#define SYS_DEBUG(message) LOG_COMPONENT("SYSTEM", LOG_LEVEL_DEBUG, message)

namespace debug {
    // Helper function for format-based logging
    template<typename... Args>
    inline std::string format_log(std::format_string<Args...> fmt, Args&&... args) {
        return std::format(fmt, std::forward<Args>(args)...);
    }
}

// Convenience macros with format support
#define PLAN_ERROR_FMT(fmt, ...) PLAN_ERROR(debug::format_log(fmt, __VA_ARGS__))
#define PLAN_WARN_FMT(fmt, ...) PLAN_WARN(debug::format_log(fmt, __VA_ARGS__))
#define PLAN_INFO_FMT(fmt, ...) PLAN_INFO(debug::format_log(fmt, __VA_ARGS__))
#define PLAN_DEBUG_FMT(fmt, ...) PLAN_DEBUG(debug::format_log(fmt, __VA_ARGS__))
#define PLAN_TRACE_FMT(fmt, ...) PLAN_TRACE(debug::format_log(fmt, __VA_ARGS__))

#define SELECT_WARN_FMT(fmt, ...) SELECT_WARN(debug::format_log(fmt, __VA_ARGS__))
#define SELECT_INFO_FMT(fmt, ...) SELECT_INFO(debug::format_log(fmt, __VA_ARGS__))
#define SELECT_DEBUG_FMT(fmt, ...) SELECT_DEBUG(debug::format_log(fmt, __VA_ARGS__))
#define SELECT_TRACE_FMT(fmt, ...) SELECT_TRACE(debug::format_log(fmt, __VA_ARGS__))

#define THEME_WARN_FMT(fmt, ...) THEME_WARN(debug::format_log(fmt, __VA_ARGS__))
#define THEME_INFO_FMT(fmt, ...) THEME_INFO(debug::format_log(fmt, __VA_ARGS__))
#define THEME_DEBUG_FMT(fmt, ...) THEME_DEBUG(debug::format_log(fmt, __VA_ARGS__))

#define SCHEDULE_ERROR_FMT(fmt, ...) SCHEDULE_ERROR(debug::format_log(fmt, __VA_ARGS__))
#define SCHEDULE_WARN_FMT(fmt, ...) SCHEDULE_WARN(debug::format_log(fmt, __VA_ARGS__))
#define SCHEDULE_INFO_FMT(fmt, ...) SCHEDULE_INFO(debug::format_log(fmt, __VA_ARGS__))
#define SCHEDULE_DEBUG_FMT(fmt, ...) SCHEDULE_DEBUG(debug::format_log(fmt, __VA_ARGS__))

#define ROUTE_WARN_FMT(fmt, ...) ROUTE_WARN(debug::format_log(fmt, __VA_ARGS__))
#define ROUTE_INFO_FMT(fmt, ...) ROUTE_INFO(debug::format_log(fmt, __VA_ARGS__))
#define ROUTE_DEBUG_FMT(fmt, ...) ROUTE_DEBUG(debug::format_log(fmt, __VA_ARGS__))
#define ROUTE_TRACE_FMT(fmt, ...) ROUTE_TRACE(debug::format_log(fmt, __VA_ARGS__))

#define BUDGET_WARN_FMT(fmt, ...) BUDGET_WARN(debug::format_log(fmt, __VA_ARGS__))
#define BUDGET_INFO_FMT(fmt, ...) BUDGET_INFO(debug::format_log(fmt, __VA_ARGS__))
#define BUDGET_DEBUG_FMT(fmt, ...) BUDGET_DEBUG(debug::format_log(fmt, __VA_ARGS__))

#define LLM_ERROR_FMT(fmt, ...) LLM_ERROR(debug::format_log(fmt, __VA_ARGS__))
#define LLM_WARN_FMT(fmt, ...) LLM_WARN(debug::format_log(fmt, __VA_ARGS__))
#define LLM_INFO_FMT(fmt, ...) LLM_INFO(debug::format_log(fmt, __VA_ARGS__))
#define LLM_DEBUG_FMT(fmt, ...) LLM_DEBUG(debug::format_log(fmt, __VA_ARGS__))
#define LLM_TRACE_FMT(fmt, ...) LLM_TRACE(debug::format_log(fmt, __VA_ARGS__))

#define DISCOVERY_ERROR_FMT(fmt, ...) DISCOVERY_ERROR(debug::format_log(fmt, __VA_ARGS__))
#define DISCOVERY_INFO_FMT(fmt, ...) DISCOVERY_INFO(debug::format_log(fmt, __VA_ARGS__))
#define DISCOVERY_DEBUG_FMT(fmt, ...) DISCOVERY_DEBUG(debug::format_log(fmt, __VA_ARGS__))

#define SYS_ERROR_FMT(fmt, ...) SYS_ERROR(debug::format_log(fmt, __VA_ARGS__))
#define SYS_WARN_FMT(fmt, ...) SYS_WARN(debug::format_log(fmt, __VA_ARGS__))
#define SYS_INFO_FMT(fmt, ...) SYS_INFO(debug::format_log(fmt, __VA_ARGS__))
#define SYS_DEBUG_FMT(fmt, ...) SYS_DEBUG(debug::format_log(fmt, __VA_ARGS__))
