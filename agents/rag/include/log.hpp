#pragma once
#include <sstream>
#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3 };

void set_log_level(LogLevel level);
LogLevel log_level();
LogLevel parse_log_level(const std::string& name);

// Writes "<asctime> - LEVEL [tag] message" to stderr.
void log_line(LogLevel level, const std::string& tag, const std::string& message);

#define RAG_LOG(level, tag, expr)                                  \
    do {                                                           \
        if (static_cast<int>(level) >= static_cast<int>(log_level())) { \
            std::ostringstream rag_log_os_;                        \
            rag_log_os_ << expr;                                   \
            log_line(level, tag, rag_log_os_.str());               \
        }                                                          \
    } while (0)

#define RAG_DEBUG(tag, expr) RAG_LOG(LogLevel::Debug, tag, expr)
#define RAG_INFO(tag, expr) RAG_LOG(LogLevel::Info, tag, expr)
#define RAG_WARN(tag, expr) RAG_LOG(LogLevel::Warning, tag, expr)
#define RAG_ERROR(tag, expr) RAG_LOG(LogLevel::Error, tag, expr)
