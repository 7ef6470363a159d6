#ifndef STOMP_TIMER_SERVICE_HPP
#define STOMP_TIMER_SERVICE_HPP

#include "types.hpp"

#include <cstdint>
#include <functional>

namespace stomp {

constexpr TimerHandle INVALID_TIMER_HANDLE = 0;

/// One-shot timer scheduling used by the heartbeat monitor
class ITimerService {
public:
    virtual ~ITimerService() = default;

    /// Run callback once after delay_ms
    /// @return Handle usable with Cancel(); never INVALID_TIMER_HANDLE
    virtual TimerHandle Schedule(uint64_t delay_ms, std::function<void()> callback) = 0;

    /// Cancel a pending timer; unknown or already fired handles are ignored
    virtual void Cancel(TimerHandle handle) = 0;
};

} // namespace stomp

#endif // STOMP_TIMER_SERVICE_HPP
