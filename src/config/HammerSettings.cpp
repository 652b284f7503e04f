#include "HammerSettings.hpp"
#include "ConfigManager.hpp"

#include <plog/Log.h>

namespace
{

template <typename T>
bool readPositive(const toml::table& table, const char* key, T& out)
{
    auto v = table[key].value<int64_t>();
    if (!v)
        return false;

    if (*v <= 0)
    {
        PLOG_WARNING << "Ignoring non-positive config value " << key << " = " << *v;
        return false;
    }

    out = static_cast<T>(*v);
    return true;
}

} // namespace

void HammerSettings::applyDefaults()
{
    dispatch_ = DispatchSettings{};
    http_ = HttpSettings{};
    batch_ = BatchSettings{};
}

void HammerSettings::registerConfigHandler(ConfigManager& config)
{
    (void)config.registerSection("dispatch", [this](const toml::table& t) { readDispatch(t); });
    (void)config.registerSection("http", [this](const toml::table& t) { readHttp(t); });
    (void)config.registerSection("batch", [this](const toml::table& t) { readBatch(t); });
}

void HammerSettings::deserialize(const toml::table& root)
{
    static const toml::table empty;
    auto section = [&root](const char* name) -> const toml::table& {
        const toml::table* t = root[name].as_table();
        return t ? *t : empty;
    };

    readDispatch(section("dispatch"));
    readHttp(section("http"));
    readBatch(section("batch"));
}

void HammerSettings::readDispatch(const toml::table& d)
{
    dispatch_ = DispatchSettings{};
    readPositive(d, "shutdown_timeout_ms", dispatch_.shutdown_timeout_ms);
    readPositive(d, "ui_flush_interval_ms", dispatch_.ui_flush_interval_ms);
    readPositive(d, "display_limit_bytes", dispatch_.display_limit_bytes);
}

void HammerSettings::readHttp(const toml::table& h)
{
    http_ = HttpSettings{};
    readPositive(h, "connect_timeout_ms", http_.connect_timeout_ms);
    readPositive(h, "chunk_size_bytes", http_.chunk_size_bytes);
    readPositive(h, "streaming_capture_bytes", http_.streaming_capture_bytes);
    readPositive(h, "single_shot_capture_bytes", http_.single_shot_capture_bytes);
    readPositive(h, "format_limit_bytes", http_.format_limit_bytes);

    // 0 disables the client-wide timeout
    if (auto v = h["default_timeout_ms"].value<int64_t>())
    {
        if (*v >= 0)
            http_.default_timeout_ms = static_cast<int>(*v);
    }
    if (auto v = h["user_agent"].value<std::string>())
    {
        if (!v->empty())
            http_.user_agent = *v;
    }
    if (auto v = h["verify_tls"].value<bool>())
        http_.verify_tls = *v;
}

void HammerSettings::readBatch(const toml::table& b)
{
    batch_ = BatchSettings{};
    readPositive(b, "max_concurrency", batch_.max_concurrency);
}
