#pragma once

#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mirrorsync::server
{

    class Session;

    // Tracks live sessions by connection identity so the server can stop them
    // on shutdown and wait for their workers to finish.
    class SessionManager
    {
    public:
        void register_session(const std::shared_ptr<Session> &session);

        // Called by a worker after its session has been destroyed. Must be the
        // worker's last access to the manager.
        void release(const std::string &identity);

        void stop_all();

        void wait_for_idle();

        std::size_t active_count();

    private:
        void prune_locked();

        std::mutex mutex_;
        std::condition_variable idle_;
        std::map<std::string, std::vector<std::weak_ptr<Session>>> sessions_;
        std::size_t running_{0};
    };

} // namespace mirrorsync::server
