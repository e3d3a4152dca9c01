#include "mirrorsync/server/timeout_supervisor.hpp"

#include <asio/steady_timer.hpp>

#include <cstdint>
#include <mutex>

namespace mirrorsync::server
{

    struct TimeoutSupervisor::State
    {
        State(asio::io_context &scheduler, std::function<void()> callback)
            : timer(scheduler), on_expire(std::move(callback)) {}

        mutable std::mutex mutex;
        asio::steady_timer timer;
        std::function<void()> on_expire;
        std::uint64_t generation{0};
        bool armed{false};
        bool expired{false};
    };

    TimeoutSupervisor::TimeoutSupervisor(asio::io_context &scheduler, std::function<void()> on_expire)
        : state_(std::make_shared<State>(scheduler, std::move(on_expire))) {}

    TimeoutSupervisor::~TimeoutSupervisor()
    {
        clear();
    }

    void TimeoutSupervisor::set(std::chrono::milliseconds duration)
    {
        std::lock_guard lock(state_->mutex);
        const auto generation = ++state_->generation;
        state_->armed = true;
        state_->timer.expires_after(duration);
        state_->timer.async_wait([state = state_, generation](const std::error_code &ec)
                                 {
            if (ec == asio::error::operation_aborted)
            {
                return;
            }
            std::lock_guard lock(state->mutex);
            if (!state->armed || state->generation != generation)
            {
                return;
            }
            state->armed = false;
            state->expired = true;
            state->on_expire(); });
    }

    void TimeoutSupervisor::clear()
    {
        std::lock_guard lock(state_->mutex);
        ++state_->generation;
        state_->armed = false;
        state_->timer.cancel();
    }

    bool TimeoutSupervisor::expired() const
    {
        std::lock_guard lock(state_->mutex);
        return state_->expired;
    }

} // namespace mirrorsync::server
