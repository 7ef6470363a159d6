#include "heartbeat_monitor.hpp"
#include <utility>

namespace stomp {
namespace internal {

HeartbeatMonitor::HeartbeatMonitor(ITimerService& timers,
                                   std::function<void()> send_heartbeat,
                                   std::function<void()> on_timeout,
                                   uint32_t margin_ms)
    : timers_(timers)
    , send_heartbeat_(std::move(send_heartbeat))
    , on_timeout_(std::move(on_timeout))
    , margin_ms_(margin_ms)
    , running_(false)
    , outgoing_timer_(INVALID_TIMER_HANDLE)
    , incoming_timer_(INVALID_TIMER_HANDLE)
{}

HeartbeatMonitor::~HeartbeatMonitor() {
    Stop();
}

void HeartbeatMonitor::Start(const HeartbeatIntervals& intervals) {
    Stop();
    intervals_ = intervals;
    running_ = true;
    ResetOutgoing();
    ResetIncoming();
}

void HeartbeatMonitor::Stop() {
    running_ = false;
    timers_.Cancel(outgoing_timer_);
    timers_.Cancel(incoming_timer_);
    outgoing_timer_ = INVALID_TIMER_HANDLE;
    incoming_timer_ = INVALID_TIMER_HANDLE;
}

void HeartbeatMonitor::ResetOutgoing() {
    if (!running_ || intervals_.outgoing_ms == 0) {
        return;
    }

    timers_.Cancel(outgoing_timer_);
    outgoing_timer_ = timers_.Schedule(intervals_.outgoing_ms, [this]() {
        OnOutgoingTimer();
    });
}

void HeartbeatMonitor::ResetIncoming() {
    if (!running_ || intervals_.incoming_ms == 0) {
        return;
    }

    timers_.Cancel(incoming_timer_);
    incoming_timer_ = timers_.Schedule(uint64_t{intervals_.incoming_ms} + margin_ms_, [this]() {
        OnIncomingTimer();
    });
}

void HeartbeatMonitor::OnOutgoingTimer() {
    outgoing_timer_ = INVALID_TIMER_HANDLE;
    if (!running_) {
        return;
    }

    // The heartbeat write rearms the timer through ResetOutgoing()
    send_heartbeat_();
}

void HeartbeatMonitor::OnIncomingTimer() {
    incoming_timer_ = INVALID_TIMER_HANDLE;
    if (!running_) {
        return;
    }

    Stop();
    on_timeout_();
}

} // namespace internal
} // namespace stomp
