#ifndef STOMP_HEARTBEAT_MONITOR_HPP
#define STOMP_HEARTBEAT_MONITOR_HPP

#include "stomp/heartbeat.hpp"
#include "stomp/timer_service.hpp"
#include <cstdint>
#include <functional>

namespace stomp {
namespace internal {

/// Outgoing and incoming heart-beat timers of one session
/// Each timer is a one-shot that is replaced on every rearm, so at most one
/// of each is pending. Timers are cancelled on Stop() and on destruction.
class HeartbeatMonitor {
public:
    /// @param send_heartbeat Writes a heartbeat EOL; called when the outgoing timer fires
    /// @param on_timeout Called once when the broker stayed silent too long
    HeartbeatMonitor(ITimerService& timers,
                     std::function<void()> send_heartbeat,
                     std::function<void()> on_timeout,
                     uint32_t margin_ms);
    ~HeartbeatMonitor();

    // Delete copy operations
    HeartbeatMonitor(const HeartbeatMonitor&) = delete;
    HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

    /// Arm both timers for the negotiated intervals (0 leaves a timer inert)
    void Start(const HeartbeatIntervals& intervals);

    /// Cancel both timers; later resets are ignored until Start()
    void Stop();

    /// Rearm the outgoing timer after any write to the broker
    void ResetOutgoing();

    /// Rearm the incoming timer after any data from the broker
    void ResetIncoming();

    bool IsRunning() const { return running_; }
    const HeartbeatIntervals& GetIntervals() const { return intervals_; }

private:
    void OnOutgoingTimer();
    void OnIncomingTimer();

    ITimerService& timers_;
    std::function<void()> send_heartbeat_;
    std::function<void()> on_timeout_;
    uint32_t margin_ms_;
    HeartbeatIntervals intervals_;
    bool running_;
    TimerHandle outgoing_timer_;
    TimerHandle incoming_timer_;
};

} // namespace internal
} // namespace stomp

#endif // STOMP_HEARTBEAT_MONITOR_HPP
