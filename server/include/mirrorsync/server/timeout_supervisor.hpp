#pragma once

#include <asio/io_context.hpp>

#include <chrono>
#include <functional>
#include <memory>

namespace mirrorsync::server
{

    // One cancellable delayed action bound to a connection. The action runs on
    // the scheduler's threads, never on the caller's, and must not call back
    // into the supervisor.
    //
    // Rescheduling and cancelling are atomic with respect to a firing action:
    // once set() or clear() returns, an action scheduled before it will not run.
    class TimeoutSupervisor
    {
    public:
        TimeoutSupervisor(asio::io_context &scheduler, std::function<void()> on_expire);
        ~TimeoutSupervisor();

        TimeoutSupervisor(const TimeoutSupervisor &) = delete;
        TimeoutSupervisor &operator=(const TimeoutSupervisor &) = delete;

        void set(std::chrono::milliseconds duration);

        void clear();

        // True once the action has fired. Stays true.
        bool expired() const;

    private:
        struct State;
        std::shared_ptr<State> state_;
    };

} // namespace mirrorsync::server
