#include "mirrorsync/server/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <string>

#include "mirrorsync/server/connection_logger.hpp"

namespace mirrorsync::server
{

    namespace
    {

        std::string remote_address(const asio::ip::tcp::socket &socket)
        {
            std::error_code ec;
            const auto endpoint = socket.remote_endpoint(ec);
            if (ec)
            {
                return "unknown";
            }
            try
            {
                return endpoint.address().to_string();
            }
            catch (const std::exception &)
            {
                return "unknown";
            }
        }

    } // namespace

    Session::Session(asio::ip::tcp::socket socket, SessionContext context)
        : socket_(std::move(socket)),
          context_(std::move(context)),
          endpoint_(remote_endpoint()),
          identity_(connection_identity(remote_address(socket_))),
          logger_(make_connection_logger(identity_, context_.connection_log_dir)),
          stream_(socket_),
          timeout_(context_.scheduler, [this]
                   { on_timeout(); }) {}

    Session::~Session()
    {
        teardown();
    }

    void Session::run()
    {
        logger_->info("Connection established with {}", endpoint_);

        auto state = State::Running;
        while (state == State::Running)
        {
            std::optional<std::string> message;
            try
            {
                timeout_.set(context_.idle_timeout);
                message = stream_.read_message();
            }
            catch (const TransportError &ex)
            {
                if (timeout_.expired())
                {
                    logger_->info("Client {} closed by timeout", endpoint_);
                }
                else
                {
                    logger_->info("Client {} disconnected ({})", endpoint_, ex.code().message());
                }
                break;
            }
            catch (const ProtocolError &ex)
            {
                logger_->debug("Discarding unreadable message ({}): {}", mirrorsync::to_string(ex.code()), ex.what());
                continue;
            }

            if (!message)
            {
                logger_->debug("Received null message, this should not happen");
                continue;
            }

            logger_->info("Received message: {}, from client: {}", *message, endpoint_);
            try
            {
                state = dispatch(*message);
            }
            catch (const TransportError &ex)
            {
                if (timeout_.expired())
                {
                    logger_->info("Client {} closed by timeout", endpoint_);
                }
                else
                {
                    logger_->warn("Failed to write to client {}: {}", endpoint_, ex.what());
                }
                state = State::Closing;
            }
            catch (const std::exception &ex)
            {
                logger_->error("Failed to handle {} from {}: {}", *message, endpoint_, ex.what());
                state = State::Closing;
            }
        }

        logger_->info("Closing connection with {}", endpoint_);
        teardown();
    }

    Session::State Session::dispatch(const std::string &message)
    {
        // always sent first by a well-behaved peer, but not enforced
        if (matches(message, protocol::MessageKind::Handshake))
        {
            handle_handshake();
            return State::Running;
        }

        const auto kind = protocol::message_kind_from_literal(message);
        if (!kind)
        {
            handle_unknown_message(message);
            return State::Closing;
        }

        switch (*kind)
        {
        case protocol::MessageKind::SyncFiles:
            handle_sync_files();
            break;
        case protocol::MessageKind::GetManagedDirectories:
            handle_get_managed_directories();
            break;
        case protocol::MessageKind::GetNumberOfManagedFiles:
            handle_get_number_of_managed_files();
            break;
        case protocol::MessageKind::Exit:
            logger_->info("Client requested exit, sync process complete for {}", endpoint_);
            return State::Closing;
        case protocol::MessageKind::Handshake:
            handle_handshake();
            break;
        }
        return State::Running;
    }

    void Session::handle_handshake()
    {
        logger_->info("Sending message vocabulary");
        stream_.write_frame(protocol::make_vocabulary_message());
        stream_.flush();
    }

    void Session::handle_unknown_message(const std::string &message)
    {
        logger_->warn("Unknown message received from {}", endpoint_);
        try
        {
            stream_.write_frame(protocol::UnknownMessageError{.received = message});
            stream_.flush();
        }
        catch (const TransportError &ex)
        {
            logger_->warn("Failed to write error to client {}: {}", endpoint_, ex.what());
        }
    }

    void Session::handle_get_managed_directories()
    {
        stream_.write_frame(context_.managed_directories);
        stream_.flush();
    }

    void Session::handle_get_number_of_managed_files()
    {
        const auto count = context_.catalog.size();
        const auto field = protocol::file_count_field(count);
        if (static_cast<std::size_t>(field) != count)
        {
            logger_->error("Catalog of {} files does not fit the count field, sending {}", count, field);
        }
        stream_.write_int32(field);
        stream_.flush();
    }

    bool Session::matches(const std::string &message, protocol::MessageKind kind) const
    {
        return message == protocol::literal(kind);
    }

    void Session::stop()
    {
        logger_->info("Stopping connection with {}", endpoint_);
        shutdown_transport();
    }

    void Session::on_timeout()
    {
        logger_->info("Client connection timed out, closing {}", endpoint_);
        shutdown_transport();
    }

    void Session::shutdown_transport()
    {
        std::lock_guard lock(transport_mutex_);
        if (transport_closed_)
        {
            return;
        }
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    }

    void Session::teardown()
    {
        timeout_.clear();
        std::lock_guard lock(transport_mutex_);
        if (transport_closed_)
        {
            return;
        }
        transport_closed_ = true;
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return remote_address(socket_) + ":" + std::to_string(endpoint.port());
    }

} // namespace mirrorsync::server
