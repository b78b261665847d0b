#include "push_debouncer.hpp"

#include <algorithm>

namespace tabsync::daemon
{

PushDebouncer::PushDebouncer(std::chrono::milliseconds window) : window_(window) {}

void PushDebouncer::request_routine(SessionKey session, TimePoint now)
{
    auto [it, inserted] = due_.try_emplace(session, now + window_);
    if (!inserted)
        ++coalesced_;
}

void PushDebouncer::note_immediate(SessionKey session)
{
    due_.erase(session);
}

void PushDebouncer::remove_session(SessionKey session)
{
    due_.erase(session);
}

std::vector<PushDebouncer::SessionKey> PushDebouncer::collect_due(TimePoint now)
{
    std::vector<SessionKey> ready;
    for (auto it = due_.begin(); it != due_.end();)
    {
        if (it->second <= now)
        {
            ready.push_back(it->first);
            it = due_.erase(it);
        }
        else
        {
            ++it;
        }
    }
    std::sort(ready.begin(), ready.end());
    return ready;
}

std::optional<PushDebouncer::TimePoint> PushDebouncer::next_due() const
{
    if (due_.empty())
        return std::nullopt;
    auto it = std::min_element(due_.begin(),
                               due_.end(),
                               [](const auto& a, const auto& b) { return a.second < b.second; });
    return it->second;
}

bool PushDebouncer::has_pending(SessionKey session) const
{
    return due_.count(session) != 0;
}

}   // namespace tabsync::daemon
