#ifndef STOMP_ASIO_TIMER_SERVICE_HPP
#define STOMP_ASIO_TIMER_SERVICE_HPP

#include "stomp/asio.hpp"
#include "stomp/timer_service.hpp"
#include <memory>

namespace stomp {
namespace internal {

/// Timer service backed by asio::steady_timer
class AsioTimerService : public ITimerService {
public:
    explicit AsioTimerService(asio::io_context& io_context);
    ~AsioTimerService();

    // Delete copy operations
    AsioTimerService(const AsioTimerService&) = delete;
    AsioTimerService& operator=(const AsioTimerService&) = delete;

    TimerHandle Schedule(uint64_t delay_ms, std::function<void()> callback) override;
    void Cancel(TimerHandle handle) override;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace internal
} // namespace stomp

#endif // STOMP_ASIO_TIMER_SERVICE_HPP
