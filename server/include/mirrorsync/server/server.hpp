#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include "mirrorsync/server/catalog.hpp"
#include "mirrorsync/server/config.hpp"
#include "mirrorsync/server/session_manager.hpp"

namespace mirrorsync::server
{

    // Accepts connections and hands each one to a Session running on its own
    // thread. The io_context threads run the acceptor, the signal set and
    // every session's idle timer.
    class Server
    {
    public:
        Server(ServerConfig config, FileCatalog catalog);

        void run();

        // Thread-safe; run() returns once every session has closed.
        void shutdown();

        std::uint16_t local_port() const;

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void start_session(asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;
        FileCatalog catalog_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        SessionManager session_manager_;

        std::vector<std::thread> workers_;
    };

} // namespace mirrorsync::server
