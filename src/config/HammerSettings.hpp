#pragma once

#include <cstddef>
#include <string>

#include <toml++/toml.h>

class ConfigManager;

struct DispatchSettings
{
    int shutdown_timeout_ms = 5000;
    int ui_flush_interval_ms = 300;
    std::size_t display_limit_bytes = 10 * 1024;
};

struct HttpSettings
{
    int connect_timeout_ms = 10000;
    int default_timeout_ms = 300000;
    std::size_t chunk_size_bytes = 16 * 1024;
    std::size_t streaming_capture_bytes = 10 * 1024 * 1024;
    std::size_t single_shot_capture_bytes = 100 * 1024 * 1024;
    std::size_t format_limit_bytes = 1000000;
    std::string user_agent = "APIHammer/1.0";
    bool verify_tls = true;
};

struct BatchSettings
{
    int max_concurrency = 5;
};

// Tunables read from config.toml. Every key is optional; out-of-range values keep the default.
class HammerSettings
{
public:
    HammerSettings() { applyDefaults(); }

    void applyDefaults();
    void registerConfigHandler(ConfigManager& config);

    // Applies [dispatch], [http] and [batch] from a parsed document root. Absent sections reset to defaults.
    void deserialize(const toml::table& root);

    const DispatchSettings& dispatch() const { return dispatch_; }
    const HttpSettings& http() const { return http_; }
    const BatchSettings& batch() const { return batch_; }

private:
    void readDispatch(const toml::table& section);
    void readHttp(const toml::table& section);
    void readBatch(const toml::table& section);

    DispatchSettings dispatch_;
    HttpSettings http_;
    BatchSettings batch_;
};
