#include "mirrorsync/server/session_manager.hpp"

#include <algorithm>
#include <iterator>

#include "mirrorsync/server/session.hpp"

namespace mirrorsync::server
{

    void SessionManager::register_session(const std::shared_ptr<Session> &session)
    {
        std::lock_guard lock(mutex_);
        prune_locked();
        sessions_[session->identity()].push_back(session);
        ++running_;
    }

    void SessionManager::release(const std::string &identity)
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(identity);
        if (it != sessions_.end())
        {
            auto &list = it->second;
            list.erase(std::remove_if(list.begin(), list.end(),
                                      [](const std::weak_ptr<Session> &weak)
                                      { return weak.expired(); }),
                       list.end());
            if (list.empty())
            {
                sessions_.erase(it);
            }
        }
        if (running_ > 0)
        {
            --running_;
        }
        idle_.notify_all();
    }

    void SessionManager::stop_all()
    {
        std::vector<std::shared_ptr<Session>> live;
        {
            std::lock_guard lock(mutex_);
            for (const auto &[identity, list] : sessions_)
            {
                for (const auto &weak : list)
                {
                    if (auto session = weak.lock())
                    {
                        live.push_back(std::move(session));
                    }
                }
            }
        }
        for (const auto &session : live)
        {
            session->stop();
        }
    }

    void SessionManager::wait_for_idle()
    {
        std::unique_lock lock(mutex_);
        idle_.wait(lock, [this]
                   { return running_ == 0; });
    }

    std::size_t SessionManager::active_count()
    {
        std::lock_guard lock(mutex_);
        return running_;
    }

    void SessionManager::prune_locked()
    {
        for (auto it = sessions_.begin(); it != sessions_.end();)
        {
            auto &list = it->second;
            list.erase(std::remove_if(list.begin(), list.end(),
                                      [](const std::weak_ptr<Session> &weak)
                                      { return weak.expired(); }),
                       list.end());
            it = list.empty() ? sessions_.erase(it) : std::next(it);
        }
    }

} // namespace mirrorsync::server
