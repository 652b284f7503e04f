#include "UiState.hpp"

#include <plog/Log.h>

#include <type_traits>

namespace dispatch
{

template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

const char* viewStateName(ViewState state)
{
    switch (state)
    {
    case ViewState::Idle:
        return "Idle";
    case ViewState::Loading:
        return "Loading";
    case ViewState::Completed:
        return "Completed";
    case ViewState::Failed:
        return "Failed";
    case ViewState::Cancelled:
        return "Cancelled";
    }
    return "Idle";
}

std::string ResponseView::text() const
{
    if (replaced_text)
        return *replaced_text;

    std::string out = head;
    for (const auto& slice : body_slices)
        out += slice;
    return out;
}

UiState::UiState(std::size_t display_limit_bytes, std::size_t max_notices)
    : display_limit_bytes_(display_limit_bytes)
    , max_notices_(max_notices)
{
}

ResponseView& UiState::viewFor(ViewId id) { return views_[id]; }

// Oldest slices go first; the newest slice always stays visible.
void UiState::trimSlices(ResponseView& view)
{
    while (view.displayed_bytes > display_limit_bytes_ && view.body_slices.size() > 1)
    {
        view.displayed_bytes -= view.body_slices.front().size();
        view.body_slices.pop_front();
    }
}

void UiState::apply(const UiMutation& mutation)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ++applied_;

    std::visit(overloaded{
                   [this](const BeginExchange& cmd) {
                       ResponseView& v = viewFor(cmd.view_id);
                       v = ResponseView{};
                       v.state = ViewState::Loading;
                       v.method = cmd.method;
                       v.url = cmd.url;
                   },
                   [this](const ShowResponseHead& cmd) { viewFor(cmd.view_id).head = cmd.head_text; },
                   [this](const AppendBodySlice& cmd) {
                       ResponseView& v = viewFor(cmd.view_id);
                       v.displayed_bytes += cmd.data.size();
                       v.body_slices.push_back(cmd.data);
                       trimSlices(v);
                   },
                   [this](const ReplaceBody& cmd) {
                       ResponseView& v = viewFor(cmd.view_id);
                       v.body_slices.clear();
                       v.displayed_bytes = 0;
                       v.replaced_text = cmd.text;
                   },
                   [this](const CompleteExchange& cmd) {
                       ResponseView& v = viewFor(cmd.view_id);
                       v.state = ViewState::Completed;
                       v.status_code = cmd.status_code;
                       v.elapsed = cmd.elapsed;
                       v.byte_size = cmd.byte_size;
                       v.truncated = cmd.truncated;
                   },
                   [this](const FailExchange& cmd) {
                       ResponseView& v = viewFor(cmd.view_id);
                       v.state = cmd.kind == http::ErrorKind::Cancelled ? ViewState::Cancelled : ViewState::Failed;
                       v.error_kind = cmd.kind;
                       v.error = cmd.message;
                       v.elapsed = cmd.elapsed;
                       v.body_slices.clear();
                       v.displayed_bytes = 0;
                       v.replaced_text = cmd.text;
                   },
                   [this](const SetStatusText& cmd) { status_text_ = cmd.text; },
               },
               mutation.command);

    PLOG_VERBOSE << "Applied UI mutation: " << mutation.description;
}

void UiState::deliverNotice(const Notice& notice)
{
    NoticeHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        notices_.push_back(notice);
        while (notices_.size() > max_notices_)
            notices_.pop_front();
        handler = notice_handler_;
    }

    if (handler)
        handler(notice);
}

void UiState::setNoticeHandler(NoticeHandler handler)
{
    std::lock_guard<std::mutex> lock(mutex_);
    notice_handler_ = std::move(handler);
}

std::optional<ResponseView> UiState::view(ViewId id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = views_.find(id);
    if (it == views_.end())
        return std::nullopt;
    return it->second;
}

std::size_t UiState::viewCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return views_.size();
}

std::string UiState::statusText() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return status_text_;
}

std::vector<Notice> UiState::notices() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Notice>(notices_.begin(), notices_.end());
}

std::size_t UiState::appliedCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return applied_;
}

} // namespace dispatch
