#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization,
    Configuration,
    Network,
    Dispatch,
    Batch,
    Unknown
};

// Ordered: draining with a minimum severity keeps everything at or above it.
enum class ErrorSeverity
{
    Info,
    Warning,
    Error,
    Fatal
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // shown to the user as is
    std::string technical_details; // logs only
    std::string timestamp;
};

/**
 * @brief Process-wide sink for problems that are not tied to a single exchange.
 *
 * Every report is logged through plog right away and kept in a bounded queue
 * until the front end drains it. Exchange failures never go through here; they
 * travel inside ExchangeResult.
 */
class ErrorReporter
{
public:
    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                       const std::string& technical_details = "");

    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    // Removes and returns queued reports at or above min_severity. Lower ones are dropped.
    static std::vector<ErrorReport> TakePending(ErrorSeverity min_severity = ErrorSeverity::Info);

    static std::size_t PendingCount();

    static const char* CategoryName(ErrorCategory category);

    static constexpr std::size_t kMaxQueued = 100;

private:
    static std::string Timestamp();

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_queue;
};

} // namespace utils
