#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <toml++/toml.h>

namespace utils
{

bool LogManager::s_initialized = false;
LogSettings LogManager::s_settings;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

LogSettings LogManager::ReadSettings(const std::string& config_path)
{
    LogSettings settings;

    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec))
        return settings;

    toml::table doc;
    try
    {
        doc = toml::parse_file(config_path);
    }
    catch (const toml::parse_error& pe)
    {
        // ConfigManager reports the full error once logging is up.
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Logging settings ignored: config parse error",
                                     std::string(pe.description()));
        return settings;
    }

    const toml::table* logging = doc["logging"].as_table();
    if (!logging)
        return settings;

    if (auto dir = (*logging)["directory"].value<std::string>(); dir && !dir->empty())
        settings.directory = *dir;
    if (auto append = (*logging)["append"].value<bool>())
        settings.append = *append;
    if (auto console = (*logging)["console"].value<bool>())
        settings.console = *console;

    std::optional<plog::Severity> level;
    if (auto name = (*logging)["level"].value<std::string>())
        level = ParseLevel(*name);
    else if (auto number = (*logging)["level"].value<int64_t>())
        level = ParseLevel(std::to_string(*number));

    if (level)
        settings.level = *level;
    else if ((*logging).contains("level"))
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unknown logging.level, keeping 'info'");

    return settings;
}

std::optional<plog::Severity> LogManager::ParseLevel(const std::string& text)
{
    if (text.size() == 1 && text[0] >= '0' && text[0] <= '6')
        return static_cast<plog::Severity>(text[0] - '0');

    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::pair<const char*, plog::Severity> kNames[] = {
        { "none", plog::none },   { "fatal", plog::fatal }, { "error", plog::error },    { "warning", plog::warning },
        { "warn", plog::warning }, { "info", plog::info },  { "debug", plog::debug },    { "verbose", plog::verbose },
    };
    for (const auto& [name, severity] : kNames)
    {
        if (lower == name)
            return severity;
    }
    return std::nullopt;
}

bool LogManager::Initialize(const LogSettings& settings)
{
    if (s_initialized)
        return true;

    std::error_code ec;
    std::filesystem::create_directories(settings.directory, ec);
    if (ec)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Unable to create log directory",
                                   settings.directory + ": " + ec.message());
        return false;
    }

    s_settings = settings;
    s_initialized = true;
    return true;
}

std::string LogManager::SinkPath(const LogSink& sink)
{
    return (std::filesystem::path(s_settings.directory) / sink.file_name).string();
}

template <int InstanceId>
bool LogManager::AddSink(const LogSink& sink)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Log sink added before LogManager::Initialize",
                                   sink.file_name);
        return false;
    }

    const std::string path = SinkPath(sink);
    try
    {
        if (!s_settings.append)
            std::ofstream(path, std::ios::trunc).close();

        auto file = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(path.c_str(), sink.max_file_size,
                                                                                     sink.backup_count);
        auto& logger = plog::init<InstanceId>(sink.level.value_or(s_settings.level), file.get());
        s_appenders.push_back(std::move(file));

        if (sink.console)
        {
            auto console = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger.addAppender(console.get());
            s_appenders.push_back(std::move(console));
        }
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to open log file " + path, ex.what());
        return false;
    }
}

template bool LogManager::AddSink<0>(const LogSink&);
template bool LogManager::AddSink<kTrafficLogInstance>(const LogSink&);

} // namespace utils
