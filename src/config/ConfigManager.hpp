#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <toml++/toml.h>

using SectionHandler = std::function<void(const toml::table& section)>;

/**
 * @brief Reads config.toml once and routes each top-level section to the object that owns it.
 *
 * Owners register before load(). A section missing from the file reaches its
 * handler as an empty table, so handlers always see a complete pass.
 */
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");

    // Empty name receives the whole document. Returns false when the name is taken.
    bool registerSection(const std::string& name, SectionHandler handler);

    // A missing file is not an error. On a parse error no handler runs and false is returned.
    bool load();

    const toml::table& document() const { return document_; }
    const std::string& path() const { return config_path_; }
    const std::string& lastError() const { return last_error_; }

private:
    void dispatchSections() const;

    std::string config_path_;
    std::string last_error_;
    std::vector<std::pair<std::string, SectionHandler>> sections_;
    toml::table document_;
};
