#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "async_logger.hpp"
#include <algorithm>
#include <string>

// Top-level sections (startup, command summaries)
#define LOG_THREAD_SECTION_HEADER(title) log_message("+-- " + std::string(title), "")
#define LOG_THREAD_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_THREAD_SUBCONTENT(msg) log_message("|     " + std::string(msg), "")
#define LOG_THREAD_SEPARATOR() log_message("|", "")
#define LOG_THREAD_SECTION_FOOTER() log_message("+-- ", "")

// Two-column table used for startup configuration and batch summaries
#define TABLE_HEADER_30(title, subtitle) do { \
    LOG_THREAD_CONTENT("┌───────────────────┬────────────────────────────────┐"); \
    LOG_THREAD_CONTENT("│ " + std::string(title).substr(0,17) + std::string(17 - std::min(17, (int)std::string(title).length()), ' ') + " │ " + std::string(subtitle).substr(0,30) + std::string(30 - std::min(30, (int)std::string(subtitle).length()), ' ') + " │"); \
    LOG_THREAD_CONTENT("├───────────────────┼────────────────────────────────┤"); \
} while(0)

#define TABLE_ROW_30(label, value) do { \
    std::string label_str = std::string(label).substr(0,17); \
    std::string value_str = std::string(value).substr(0,30); \
    LOG_THREAD_CONTENT("│ " + label_str + std::string(17 - label_str.length(), ' ') + " │ " + value_str + std::string(30 - value_str.length(), ' ') + " │"); \
} while(0)

#define TABLE_SEPARATOR_30() do { \
    LOG_THREAD_CONTENT("├───────────────────┼────────────────────────────────┤"); \
} while(0)

#define TABLE_FOOTER_30() do { \
    LOG_THREAD_CONTENT("└───────────────────┴────────────────────────────────┘"); \
} while(0)

#endif // LOGGING_MACROS_HPP
