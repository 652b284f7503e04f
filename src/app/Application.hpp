#pragma once

#include <memory>
#include <string>
#include <vector>

class ConfigManager;
class HammerSettings;
class ServiceContext;

namespace http
{
struct RequestSpec;
}

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    enum class Command
    {
        Send,
        Batch,
        Help,
        Version
    };

    struct Options
    {
        Command command = Command::Help;
        std::string config_path = "config.toml";
        std::string method = "GET";
        std::vector<std::string> urls;
        std::vector<std::string> headers;
        std::string body;
        bool has_body = false;
        std::string bearer;
        std::string basic;
        std::string api_key;
        int timeout_ms = 0;
        int concurrency = 0;
        bool preview = false;
    };

    bool parseCommandLineArgs();
    bool initializeLogging();
    void initializeConfig();
    bool buildRequestSpec(const std::string& url, http::RequestSpec& spec);

    int runSend();
    int runBatch();
    void printUsage() const;
    void cleanup();

    int argc_;
    char** argv_;
    Options options_;
    std::string last_error_;

    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<HammerSettings> settings_;
    std::unique_ptr<ServiceContext> services_;
};
