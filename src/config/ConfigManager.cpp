#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <filesystem>

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
{
}

bool ConfigManager::registerSection(const std::string& name, SectionHandler handler)
{
    for (const auto& entry : sections_)
    {
        if (entry.first == name)
        {
            last_error_ = "Section '" + name + "' already has a handler";
            PLOG_ERROR << last_error_;
            return false;
        }
    }

    sections_.emplace_back(name, std::move(handler));
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();

    std::error_code ec;
    if (!std::filesystem::exists(config_path_, ec))
    {
        PLOG_INFO << "No config file at " << config_path_ << ", using defaults";
        document_ = toml::table{};
        dispatchSections();
        return true;
    }

    try
    {
        document_ = toml::parse_file(config_path_);
    }
    catch (const toml::parse_error& pe)
    {
        const auto line = pe.source().begin.line;
        last_error_ = "config parse error: " + std::string(pe.description());
        PLOG_WARNING << last_error_;

        std::string details = line > 0 ? "Line " + std::to_string(line) + ": " : std::string();
        details += std::string(pe.description()) + "\nFile: " + config_path_;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.", details);
        return false;
    }

    PLOG_INFO << "Loaded config from " << config_path_;
    dispatchSections();
    return true;
}

void ConfigManager::dispatchSections() const
{
    static const toml::table empty;

    for (const auto& [name, handler] : sections_)
    {
        if (!handler)
            continue;

        if (name.empty())
        {
            handler(document_);
            continue;
        }

        const toml::table* section = document_[name].as_table();
        if (!section && document_.contains(name))
            PLOG_WARNING << "Config key '" << name << "' is not a table, ignoring it";
        handler(section ? *section : empty);
    }
}
