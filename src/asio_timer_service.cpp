#include "asio_timer_service.hpp"
#include <chrono>
#include <iostream>
#include <map>

namespace stomp {
namespace internal {

class AsioTimerService::Impl {
public:
    asio::io_context& io_context_;
    std::map<TimerHandle, std::unique_ptr<asio::steady_timer>> timers_;
    TimerHandle next_handle_;

    explicit Impl(asio::io_context& io_context)
        : io_context_(io_context)
        , next_handle_(1)
    {}

    void CancelAll() {
        for (auto& [handle, timer] : timers_) {
            timer->cancel();
        }
        timers_.clear();
    }
};

AsioTimerService::AsioTimerService(asio::io_context& io_context)
    : impl_(std::make_shared<Impl>(io_context))
{}

AsioTimerService::~AsioTimerService() {
    impl_->CancelAll();
}

TimerHandle AsioTimerService::Schedule(uint64_t delay_ms, std::function<void()> callback) {
    TimerHandle handle = impl_->next_handle_++;

    auto timer = std::make_unique<asio::steady_timer>(impl_->io_context_);
    timer->expires_after(std::chrono::milliseconds(delay_ms));

    // The handler only holds a weak reference: a destroyed service never calls back
    std::weak_ptr<Impl> weak_impl = impl_;
    timer->async_wait([weak_impl, handle, callback = std::move(callback)](const AsioErrorCode& error) {
        if (error == asio::error::operation_aborted) {
            return;
        }

        auto impl = weak_impl.lock();
        if (!impl) {
            return;
        }

        // A cancelled handle is gone from the map even if the wait already completed
        auto it = impl->timers_.find(handle);
        if (it == impl->timers_.end()) {
            return;
        }
        impl->timers_.erase(it);

        if (error) {
            std::cerr << "Timer error: " << error.message() << std::endl;
            return;
        }
        callback();
    });

    impl_->timers_.emplace(handle, std::move(timer));
    return handle;
}

void AsioTimerService::Cancel(TimerHandle handle) {
    auto it = impl_->timers_.find(handle);
    if (it == impl_->timers_.end()) {
        return;
    }

    it->second->cancel();
    impl_->timers_.erase(it);
}

} // namespace internal
} // namespace stomp
