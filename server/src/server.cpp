#include "mirrorsync/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/post.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "mirrorsync/server/session.hpp"

namespace mirrorsync::server
{

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

    } // namespace

    Server::Server(ServerConfig config, FileCatalog catalog)
        : config_(std::move(config)),
          catalog_(std::move(catalog)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_)
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} serving {} files from {}", config_.address, config_.port, catalog_.size(),
                     config_.root.string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }

        session_manager_.stop_all();
        session_manager_.wait_for_idle();
        spdlog::info("All connections closed");
    }

    void Server::shutdown()
    {
        asio::post(io_context_, [this]
                   { handle_signal(); });
    }

    std::uint16_t Server::local_port() const
    {
        return acceptor_.local_endpoint().port();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            try
            {
                start_session(std::move(socket));
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Failed to start session: {}", ex.what());
            }
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::start_session(asio::ip::tcp::socket socket)
    {
        SessionContext context{
            .catalog = catalog_,
            .managed_directories = config_.managed_directories,
            .root = config_.root,
            .scheduler = io_context_,
            .idle_timeout = config_.idle_timeout,
            .transfer_timeout = config_.transfer_timeout,
            .connection_log_dir = config_.connection_log_dir,
        };
        auto session = std::make_shared<Session>(std::move(socket), std::move(context));
        session_manager_.register_session(session);
        spdlog::debug("Accepted new connection {}", session->identity());

        std::thread([this, session = std::move(session)]() mutable
                    {
            const auto identity = session->identity();
            session->run();
            session.reset();
            session_manager_.release(identity); })
            .detach();
    }

    void Server::handle_signal()
    {
        std::error_code ec;
        acceptor_.close(ec);
        session_manager_.stop_all();
        io_context_.stop();
        spdlog::info("Signal received, shutting down");
    }

} // namespace mirrorsync::server
