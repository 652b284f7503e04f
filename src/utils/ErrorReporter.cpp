#include "ErrorReporter.hpp"

#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_queue;

void ErrorReporter::Report(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                           const std::string& technical_details)
{
    std::string line = std::string("[") + CategoryName(category) + "] " + user_message;
    if (!technical_details.empty())
        line += " | Details: " + technical_details;

    switch (severity)
    {
    case ErrorSeverity::Info:
        PLOG_INFO << line;
        break;
    case ErrorSeverity::Warning:
        PLOG_WARNING << line;
        break;
    case ErrorSeverity::Error:
        PLOG_ERROR << line;
        break;
    case ErrorSeverity::Fatal:
        PLOG_FATAL << line;
        break;
    }

    ErrorReport report{ category, severity, user_message, technical_details, Timestamp() };

    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.push_back(std::move(report));
    if (s_queue.size() > kMaxQueued)
        s_queue.erase(s_queue.begin());
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    Report(category, ErrorSeverity::Error, user_message, technical_details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    Report(category, ErrorSeverity::Warning, user_message, technical_details);
}

std::vector<ErrorReport> ErrorReporter::TakePending(ErrorSeverity min_severity)
{
    std::vector<ErrorReport> drained;
    {
        std::lock_guard<std::mutex> lock(s_mutex);
        drained.swap(s_queue);
    }

    std::vector<ErrorReport> kept;
    for (auto& report : drained)
    {
        if (report.severity >= min_severity)
            kept.push_back(std::move(report));
    }
    return kept;
}

std::size_t ErrorReporter::PendingCount()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_queue.size();
}

const char* ErrorReporter::CategoryName(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Network:
        return "Network";
    case ErrorCategory::Dispatch:
        return "Dispatch";
    case ErrorCategory::Batch:
        return "Batch";
    case ErrorCategory::Unknown:
        break;
    }
    return "Unknown";
}

std::string ErrorReporter::Timestamp()
{
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace utils
