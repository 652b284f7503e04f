#include "CprTransport.hpp"

#include <cpr/cpr.h>
#include <plog/Log.h>

#include <cctype>
#include <cstdlib>

namespace
{

struct ExchangeState
{
    const http::TransportCallbacks* callbacks = nullptr;
    http::ResponseHead head;
    bool head_sent = false;
    bool aborted = false;
};

std::string trim(std::string_view s)
{
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return std::string(s.substr(begin, end - begin));
}

// Each header block (redirects, 100 Continue) starts with a status line and replaces the previous one.
void parseHeaderLine(std::string_view line, http::ResponseHead& head)
{
    if (line.rfind("HTTP/", 0) == 0)
    {
        head = http::ResponseHead{};
        auto sp = line.find(' ');
        if (sp == std::string_view::npos)
            return;
        auto rest = line.substr(sp + 1);
        head.status_code = std::atoi(std::string(rest.substr(0, 3)).c_str());
        if (rest.size() > 4)
            head.reason = trim(rest.substr(4));
        return;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0)
        return;

    head.headers.push_back({ trim(line.substr(0, colon)), trim(line.substr(colon + 1)) });
}

void emitHead(ExchangeState& state)
{
    if (state.head_sent)
        return;
    state.head_sent = true;
    if (state.callbacks->onResponseHead)
        state.callbacks->onResponseHead(state.head);
}

inline cpr::Header make_header(const std::vector<http::WireHeader>& headers)
{
    cpr::Header h;
    for (const auto& kv : headers)
        h.emplace(kv.name, kv.value);
    return h;
}

} // namespace

namespace http
{

CprTransport::CprTransport(CprTransportConfig config)
    : config_(std::move(config))
{
}

TransportOutcome CprTransport::perform(const WireRequest& request, const TransportCallbacks& callbacks)
{
    ExchangeState state;
    state.callbacks = &callbacks;

    cpr::Session s;
    s.SetUrl(cpr::Url{ request.url });
    s.SetHeader(make_header(request.headers));
    s.SetUserAgent(cpr::UserAgent{ config_.user_agent });
    s.SetConnectTimeout(cpr::ConnectTimeout{ config_.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ config_.timeout_ms });
    s.SetVerifySsl(cpr::VerifySsl{ config_.verify_tls });
    if (request.body)
        s.SetBody(cpr::Body{ *request.body });

    s.SetHeaderCallback(cpr::HeaderCallback(
        [&state](std::string_view header, intptr_t) -> bool {
            parseHeaderLine(header, state.head);
            return true;
        }));

    s.SetWriteCallback(cpr::WriteCallback(
        [&state](std::string_view data, intptr_t) -> bool {
            emitHead(state);
            if (state.callbacks->onData && !state.callbacks->onData(data))
            {
                state.aborted = true;
                return false;
            }
            return true;
        }));

    s.SetProgressCallback(cpr::ProgressCallback(
        [&state](cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, intptr_t) -> bool {
            if (state.callbacks->shouldAbort && state.callbacks->shouldAbort())
            {
                state.aborted = true;
                return false;
            }
            return true;
        }));

    cpr::Response r;
    switch (request.verb)
    {
    case Verb::Get:
        r = s.Get();
        break;
    case Verb::Post:
        r = s.Post();
        break;
    case Verb::Put:
        r = s.Put();
        break;
    case Verb::Delete:
        r = s.Delete();
        break;
    case Verb::Patch:
        r = s.Patch();
        break;
    case Verb::Head:
        r = s.Head();
        break;
    case Verb::Options:
        r = s.Options();
        break;
    }

    TransportOutcome outcome;
    if (state.aborted)
    {
        outcome.aborted = true;
        return outcome;
    }

    if (r.error)
    {
        outcome.error = r.error.message.empty() ? std::string("transport error") : r.error.message;
        PLOG_DEBUG << "cpr error " << static_cast<int>(r.error.code) << " for " << request.url << ": "
                   << outcome.error;
        return outcome;
    }

    // Bodyless responses never reach the write callback.
    if (!state.head_sent)
    {
        if (state.head.status_code == 0)
            state.head.status_code = static_cast<int>(r.status_code);
        emitHead(state);
    }

    outcome.ok = true;
    return outcome;
}

} // namespace http
