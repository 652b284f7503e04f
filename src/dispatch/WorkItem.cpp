#include "WorkItem.hpp"

#include <atomic>

namespace dispatch
{

std::uint64_t nextWorkItemId()
{
    static std::atomic<std::uint64_t> counter{ 0 };
    return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

WorkItem makeWorkItem(Payload payload, int priority)
{
    WorkItem item;
    item.id = nextWorkItemId();
    item.created_at = std::chrono::steady_clock::now();
    item.priority = priority;
    item.payload = std::move(payload);
    return item;
}

const char* payloadName(const Payload& payload)
{
    switch (payload.index())
    {
    case 0:
        return "OutboundRequest";
    case 1:
        return "ResponseReady";
    case 2:
        return "UiMutation";
    case 3:
        return "Notice";
    default:
        return "Unknown";
    }
}

} // namespace dispatch
