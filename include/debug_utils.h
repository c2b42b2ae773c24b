// include/debug_utils.h
#pragma once

#include <string>
#include <sstream>
#include <iostream>
#include <utility>

// --- Logging Macros ---

// Helper function for the variadic template macro.
// The line is assembled first so concurrent threads do not interleave fragments.
template<typename... Args>
void print_log_line(std::ostream& os, const char* tag, Args&&... args) {
    std::ostringstream line;
    line << tag;
    (line << ... << std::forward<Args>(args));
    line << '\n';
    os << line.str() << std::flush;
}

// #define LAKESTORE_DEBUG_LOG

#ifdef LAKESTORE_DEBUG_LOG
    #define LOG_DEBUG(level, ...) \
        do { \
            print_log_line(std::cout, "[" #level "] ", __VA_ARGS__); \
        } while(0)
    #define LOG_TRACE(...) do { print_log_line(std::cout, "[TRACE] ", __VA_ARGS__); } while(0)
#else
    #define LOG_DEBUG(level, ...) do { } while(0)
    #define LOG_TRACE(...) do { } while(0)
#endif

#define LOG_INFO(...) do { print_log_line(std::cout, "[INFO] ", __VA_ARGS__); } while(0)
#define LOG_WARN(...) do { print_log_line(std::cerr, "[WARN] ", __VA_ARGS__); } while(0)
#define LOG_ERROR(...) do { print_log_line(std::cerr, "[ERROR] ", __VA_ARGS__); } while(0)
#define LOG_FATAL(...) do { print_log_line(std::cerr, "[FATAL] ", __VA_ARGS__); } while(0)
