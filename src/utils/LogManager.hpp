#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// plog instance receiving one line per finished exchange
inline constexpr int kTrafficLogInstance = 1;

// [logging] in config.toml
struct LogSettings
{
    std::string directory = "logs";
    plog::Severity level = plog::info;
    bool append = true;
    bool console = true;
};

// One rolling file, optionally mirrored to the console.
struct LogSink
{
    std::string file_name;
    std::optional<plog::Severity> level;
    bool console = false;
    std::size_t max_file_size = 10 * 1024 * 1024;
    int backup_count = 3;
};

class LogManager
{
public:
    // Never fails: a missing file or a parse error leaves the defaults in place.
    static LogSettings ReadSettings(const std::string& config_path);

    // Accepts plog names ("debug", "warning", ...) or their numeric values 0-6.
    static std::optional<plog::Severity> ParseLevel(const std::string& text);

    static bool Initialize(const LogSettings& settings);

    // Attaches a sink to plog instance InstanceId. Initialize() must have run.
    template <int InstanceId = 0>
    static bool AddSink(const LogSink& sink);

    static std::string SinkPath(const LogSink& sink);

private:
    LogManager() = default;

    static bool s_initialized;
    static LogSettings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
