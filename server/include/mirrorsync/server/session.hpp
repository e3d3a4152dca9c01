#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "mirrorsync/protocol.hpp"
#include "mirrorsync/server/catalog.hpp"
#include "mirrorsync/server/message_stream.hpp"
#include "mirrorsync/server/timeout_supervisor.hpp"

namespace mirrorsync::server
{

    // Read-only state shared by every session of a server run.
    struct SessionContext
    {
        const FileCatalog &catalog;
        const std::vector<std::string> &managed_directories;
        std::filesystem::path root;
        asio::io_context &scheduler;
        std::chrono::milliseconds idle_timeout{protocol::kDefaultIdleTimeout};
        std::chrono::milliseconds transfer_timeout{protocol::kTransferIdleTimeout};
        std::optional<std::filesystem::path> connection_log_dir;
    };

    // Serves one connection with blocking I/O on the calling thread. run()
    // returns after EXIT, an unknown message, the idle timeout, or a transport
    // failure; the socket is closed by then.
    class Session
    {
    public:
        Session(asio::ip::tcp::socket socket, SessionContext context);
        ~Session();

        Session(const Session &) = delete;
        Session &operator=(const Session &) = delete;

        void run();

        // Safe from any thread. The worker sees a transport failure.
        void stop();

        const std::string &identity() const noexcept { return identity_; }

    private:
        enum class State
        {
            Running,
            Closing
        };

        State dispatch(const std::string &message);

        void handle_handshake();
        void handle_unknown_message(const std::string &message);
        void handle_sync_files();
        void handle_get_managed_directories();
        void handle_get_number_of_managed_files();

        void transfer_file(const std::string &path);

        bool matches(const std::string &message, protocol::MessageKind kind) const;

        void on_timeout();
        void shutdown_transport();
        void teardown();

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        SessionContext context_;
        std::string endpoint_;
        std::string identity_;
        std::shared_ptr<spdlog::logger> logger_;
        MessageStream stream_;
        std::mutex transport_mutex_;
        bool transport_closed_{false};
        TimeoutSupervisor timeout_;
    };

} // namespace mirrorsync::server
