#pragma once

#include "UiMutation.hpp"
#include "WorkItem.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dispatch
{

enum class ViewState
{
    Idle,
    Loading,
    Completed,
    Failed,
    Cancelled
};

const char* viewStateName(ViewState state);

struct ResponseView
{
    ViewState state = ViewState::Idle;
    std::string method;
    std::string url;
    std::string head;
    std::deque<std::string> body_slices;
    std::size_t displayed_bytes = 0;
    // Set by ReplaceBody or FailExchange; takes precedence over head + slices.
    std::optional<std::string> replaced_text;

    int status_code = 0;
    std::chrono::milliseconds elapsed{ 0 };
    std::size_t byte_size = 0;
    bool truncated = false;
    http::ErrorKind error_kind = http::ErrorKind::None;
    std::string error;

    std::string text() const;
};

/**
 * @brief State the UI layer renders from.
 *
 * Mutations and notices are applied on the dispatcher's UI thread only.
 * Readers on other threads get copies through view(), statusText() and notices().
 */
class UiState
{
public:
    using NoticeHandler = std::function<void(const Notice&)>;

    explicit UiState(std::size_t display_limit_bytes = 10 * 1024, std::size_t max_notices = 100);

    void apply(const UiMutation& mutation);
    void deliverNotice(const Notice& notice);

    // Invoked on the UI thread for every delivered notice.
    void setNoticeHandler(NoticeHandler handler);

    std::optional<ResponseView> view(ViewId id) const;
    std::size_t viewCount() const;
    std::string statusText() const;
    std::vector<Notice> notices() const;
    std::size_t appliedCount() const;

private:
    ResponseView& viewFor(ViewId id);
    void trimSlices(ResponseView& view);

    const std::size_t display_limit_bytes_;
    const std::size_t max_notices_;

    mutable std::mutex mutex_;
    std::unordered_map<ViewId, ResponseView> views_;
    std::string status_text_;
    std::deque<Notice> notices_;
    std::size_t applied_ = 0;
    NoticeHandler notice_handler_;
};

} // namespace dispatch
