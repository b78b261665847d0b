#include "suppression_window.hpp"

#include <tabsync/logger.hpp>

namespace tabsync
{

SuppressionWindow::SuppressionWindow(EventLoop& loop, std::chrono::milliseconds timeout)
    : loop_(loop), timeout_(timeout)
{
}

SuppressionWindow::~SuppressionWindow()
{
    clear();
}

void SuppressionWindow::arm()
{
    if (timer_ != EventLoop::INVALID_TIMER)
        loop_.cancel(timer_);

    expires_at_ = loop_.now() + timeout_;
    timer_      = loop_.schedule(timeout_, [this] { expire(); });
    TABSYNC_LOG_TRACE("store", "suppression armed for {} ms (timer {})", timeout_.count(), timer_);
}

void SuppressionWindow::clear()
{
    if (timer_ == EventLoop::INVALID_TIMER)
        return;
    loop_.cancel(timer_);
    timer_ = EventLoop::INVALID_TIMER;
    TABSYNC_LOG_TRACE("store", "suppression cleared");
}

std::optional<EventLoop::TimePoint> SuppressionWindow::expires_at() const
{
    if (!active())
        return std::nullopt;
    return expires_at_;
}

void SuppressionWindow::expire()
{
    // The loop already dropped the timer entry.
    timer_ = EventLoop::INVALID_TIMER;
    TABSYNC_LOG_DEBUG("store", "suppression window expired after {} ms", timeout_.count());
    if (on_expired_)
        on_expired_();
}

}   // namespace tabsync
