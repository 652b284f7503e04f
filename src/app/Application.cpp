#include "Application.hpp"
#include "ServiceContext.hpp"
#include "batch/BatchOrchestrator.hpp"
#include "config/ConfigManager.hpp"
#include "config/HammerSettings.hpp"
#include "dispatch/Dispatcher.hpp"
#include "dispatch/UiState.hpp"
#include "http/RequestBuilder.hpp"
#include "http/RequestSpec.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <future>
#include <iostream>
#include <mutex>

#ifndef HAMMER_VERSION_STRING
#define HAMMER_VERSION_STRING "0.0.0"
#endif

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

bool splitPair(const std::string& text, char sep, std::string& first, std::string& second)
{
    auto pos = text.find(sep);
    if (pos == std::string::npos || pos == 0)
        return false;
    first = text.substr(0, pos);
    second = text.substr(pos + 1);
    while (!second.empty() && second.front() == ' ')
        second.erase(second.begin());
    return true;
}

bool parseInt(const char* text, int& out)
{
    char* end = nullptr;
    long v = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || v < 0 || v > 1000000000L)
        return false;
    out = static_cast<int>(v);
    return true;
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

int Application::run()
{
    if (!parseCommandLineArgs())
    {
        std::cerr << "hammer: " << last_error_ << "\n\n";
        printUsage();
        return kExitUsage;
    }

    if (options_.command == Command::Help)
    {
        printUsage();
        return kExitOk;
    }
    if (options_.command == Command::Version)
    {
        std::cout << "hammer " << HAMMER_VERSION_STRING << std::endl;
        return kExitOk;
    }

    if (!initializeLogging())
        return kExitFailed;

    initializeConfig();
    services_ = std::make_unique<ServiceContext>(*settings_);

    int rc = options_.command == Command::Send ? runSend() : runBatch();

    for (const auto& report : utils::ErrorReporter::TakePending(utils::ErrorSeverity::Error))
        std::cerr << "error: " << report.user_message << std::endl;

    cleanup();
    return rc;
}

bool Application::parseCommandLineArgs()
{
    if (argc_ < 2)
    {
        options_.command = Command::Help;
        return true;
    }

    const std::string cmd = argv_[1];
    if (cmd == "send")
        options_.command = Command::Send;
    else if (cmd == "batch")
        options_.command = Command::Batch;
    else if (cmd == "help" || cmd == "-h" || cmd == "--help")
        options_.command = Command::Help;
    else if (cmd == "--version")
        options_.command = Command::Version;
    else
    {
        last_error_ = "unknown command '" + cmd + "'";
        return false;
    }

    for (int i = 2; i < argc_; ++i)
    {
        const std::string arg = argv_[i];
        auto next = [&](const char* what) -> const char* {
            if (i + 1 >= argc_)
            {
                last_error_ = std::string("missing value for ") + what;
                return nullptr;
            }
            return argv_[++i];
        };

        if (arg == "-X" || arg == "--request")
        {
            const char* v = next("-X");
            if (!v)
                return false;
            options_.method = v;
        }
        else if (arg == "-H" || arg == "--header")
        {
            const char* v = next("-H");
            if (!v)
                return false;
            options_.headers.emplace_back(v);
        }
        else if (arg == "-d" || arg == "--data")
        {
            const char* v = next("-d");
            if (!v)
                return false;
            options_.body = v;
            options_.has_body = true;
        }
        else if (arg == "--bearer")
        {
            const char* v = next("--bearer");
            if (!v)
                return false;
            options_.bearer = v;
        }
        else if (arg == "--basic")
        {
            const char* v = next("--basic");
            if (!v)
                return false;
            options_.basic = v;
        }
        else if (arg == "--api-key")
        {
            const char* v = next("--api-key");
            if (!v)
                return false;
            options_.api_key = v;
        }
        else if (arg == "--timeout")
        {
            const char* v = next("--timeout");
            if (!v)
                return false;
            if (!parseInt(v, options_.timeout_ms))
            {
                last_error_ = std::string("invalid --timeout value '") + v + "'";
                return false;
            }
        }
        else if (arg == "--concurrency")
        {
            const char* v = next("--concurrency");
            if (!v)
                return false;
            if (!parseInt(v, options_.concurrency) || options_.concurrency == 0)
            {
                last_error_ = std::string("invalid --concurrency value '") + v + "'";
                return false;
            }
        }
        else if (arg == "--config")
        {
            const char* v = next("--config");
            if (!v)
                return false;
            options_.config_path = v;
        }
        else if (arg == "--preview")
        {
            options_.preview = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            last_error_ = "unknown option '" + arg + "'";
            return false;
        }
        else
        {
            options_.urls.push_back(arg);
        }
    }

    int auth_modes = !options_.bearer.empty() + !options_.basic.empty() + !options_.api_key.empty();
    if (auth_modes > 1)
    {
        last_error_ = "--bearer, --basic and --api-key are mutually exclusive";
        return false;
    }

    if (options_.command == Command::Send && options_.urls.size() != 1)
    {
        last_error_ = "send expects exactly one URL";
        return false;
    }
    if (options_.command == Command::Batch && options_.urls.empty())
    {
        last_error_ = "batch expects at least one URL";
        return false;
    }
    return true;
}

bool Application::initializeLogging()
{
    const utils::LogSettings log_settings = utils::LogManager::ReadSettings(options_.config_path);
    if (!utils::LogManager::Initialize(log_settings))
    {
        std::cerr << "hammer: failed to initialize logging in '" << log_settings.directory << "'" << std::endl;
        return false;
    }

    (void)utils::LogManager::AddSink<0>(
        { .file_name = "run.log", .level = std::nullopt, .console = log_settings.console });
    (void)utils::LogManager::AddSink<utils::kTrafficLogInstance>({ .file_name = "traffic.log", .level = plog::info });

    PLOG_INFO << "hammer " << HAMMER_VERSION_STRING << " starting";
    return true;
}

void Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>(options_.config_path);
    settings_ = std::make_unique<HammerSettings>();
    settings_->registerConfigHandler(*config_);

    if (!config_->load())
    {
        PLOG_WARNING << "Continuing with default settings: " << config_->lastError();
        settings_->applyDefaults();
    }
}

bool Application::buildRequestSpec(const std::string& url, http::RequestSpec& spec)
{
    spec.name = url;
    spec.url = url;
    spec.method = options_.method;
    spec.timeout_ms = options_.timeout_ms;

    for (const auto& raw : options_.headers)
    {
        std::string name;
        std::string value;
        if (!splitPair(raw, ':', name, value))
        {
            last_error_ = "malformed header '" + raw + "', expected 'Name: value'";
            return false;
        }
        spec.headers.push_back({ name, value, true });
    }

    if (options_.has_body)
        spec.body = options_.body;

    if (!options_.bearer.empty())
    {
        spec.auth.type = http::AuthType::Bearer;
        spec.auth.token = options_.bearer;
    }
    else if (!options_.basic.empty())
    {
        spec.auth.type = http::AuthType::Basic;
        if (!splitPair(options_.basic, ':', spec.auth.username, spec.auth.password))
            spec.auth.username = options_.basic;
    }
    else if (!options_.api_key.empty())
    {
        spec.auth.type = http::AuthType::ApiKey;
        if (!splitPair(options_.api_key, ':', spec.auth.api_key_header, spec.auth.api_key_value))
        {
            last_error_ = "--api-key expects HEADER:VALUE";
            return false;
        }
    }
    return true;
}

int Application::runSend()
{
    http::RequestSpec spec;
    if (!buildRequestSpec(options_.urls.front(), spec))
    {
        std::cerr << "hammer: " << last_error_ << std::endl;
        return kExitUsage;
    }

    if (options_.preview)
    {
        auto preview = http::buildRequestPreview(spec);
        std::cout << preview.text() << "\n" << preview.authentication << "\n\n";
    }

    auto& ui = services_->ui();
    auto& dispatcher = services_->dispatcher();

    // The notice is queued behind the exchange's last view mutation, so seeing it means the view is final.
    std::mutex out_mutex;
    std::condition_variable notice_cv;
    bool notice_seen = false;
    ui.setNoticeHandler([&](const dispatch::Notice& notice) {
        {
            std::lock_guard<std::mutex> lock(out_mutex);
            std::cerr << "[" << notice.title << "] " << notice.message << std::endl;
            notice_seen = true;
        }
        notice_cv.notify_all();
    });

    dispatcher.start();
    (void)dispatcher.queueUiUpdate(dispatch::UiMutation{ dispatch::SetStatusText{ "Sending..." }, "Status text" });

    std::promise<dispatch::ResponseReady> done;
    auto future = done.get_future();
    auto on_complete = [&done](const dispatch::ResponseReady& ready) { done.set_value(ready); };
    const auto id = dispatcher.queueHttpRequest(spec, utils::CancellationToken(), on_complete);

    const dispatch::ResponseReady ready = future.get();

    {
        std::unique_lock<std::mutex> lock(out_mutex);
        if (!notice_cv.wait_for(lock, std::chrono::seconds(2), [&notice_seen] { return notice_seen; }))
            PLOG_WARNING << "No notice for request " << id << " before printing the response";
        std::cout << ready.body << std::endl;
    }

    services_->shutdown();
    return ready.success ? kExitOk : kExitFailed;
}

int Application::runBatch()
{
    std::vector<http::RequestSpec> specs;
    for (const auto& url : options_.urls)
    {
        http::RequestSpec spec;
        if (!buildRequestSpec(url, spec))
        {
            std::cerr << "hammer: " << last_error_ << std::endl;
            return kExitUsage;
        }
        specs.push_back(std::move(spec));
    }

    int concurrency = options_.concurrency > 0 ? options_.concurrency : services_->defaultConcurrency();

    utils::CancellationSource cancel;
    auto result = services_->batch().runAll(specs, cancel.token(), concurrency, [](const batch::BatchProgress& p) {
        std::cout << "[" << p.current << "/" << p.total << "] " << p.request_name << ": " << p.status << std::endl;
    });

    std::cout << "\nBatch finished in " << result.total_elapsed.count() << " ms: " << result.completed_requests << "/"
              << result.total_requests << " completed, " << result.successful_requests << " succeeded, "
              << result.failed_requests << " failed, " << result.cancelled_requests << " cancelled" << std::endl;
    for (const auto& error : result.errors)
        std::cout << "  " << error << std::endl;

    return (result.failed_requests == 0 && !result.cancelled) ? kExitOk : kExitFailed;
}

void Application::printUsage() const
{
    std::cout << "Usage:\n"
                 "  hammer send <url> [-X METHOD] [-H \"Name: value\"]... [-d BODY]\n"
                 "              [--bearer TOKEN | --basic USER:PASS | --api-key HEADER:VALUE]\n"
                 "              [--timeout MS] [--preview] [--config PATH]\n"
                 "  hammer batch <url>... [--concurrency N] [--config PATH]\n"
                 "  hammer --version\n";
}

void Application::cleanup()
{
    if (services_)
    {
        services_->shutdown();
        services_.reset();
    }
    settings_.reset();
    config_.reset();
}
