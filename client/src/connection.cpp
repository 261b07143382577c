#include "miniadb/client/connection.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "miniadb/errors.hpp"

namespace miniadb::client
{

    namespace
    {
        HandshakeOptions handshake_options(const ClientConfig &config)
        {
            return HandshakeOptions{
                .banner = config.banner.empty() ? default_banner() : config.banner,
                .max_payload = config.max_payload,
                .accept_unauthenticated = config.accept_unauthenticated,
            };
        }
    } // namespace

    Connection::Connection(std::shared_ptr<Transport> transport, ClientConfig config, KeyStore keys, Logger logger)
        : transport_(std::move(transport)),
          config_(std::move(config)),
          logger_(std::move(logger)),
          machine_(handshake_options(config_), std::move(keys), logger_),
          multiplexer_([this](const protocol::Message &message)
                       { send(message); },
                       logger_)
    {
        if (!transport_)
        {
            throw std::invalid_argument("Connection requires a transport");
        }
    }

    Connection::~Connection()
    {
        close();
    }

    void Connection::connect(std::stop_token stop)
    {
        connect(config_.handshake_timeout, std::move(stop));
    }

    void Connection::connect(std::chrono::milliseconds handshake_timeout, std::stop_token stop)
    {
        if (state() != ConnectionState::Disconnected)
        {
            throw std::logic_error("connect() called while " + std::string(to_string(state())));
        }
        if (reader_.joinable())
        {
            reader_.join();
        }

        protocol::Message hello;
        {
            std::lock_guard lock(state_mutex_);
            failure_ = nullptr;
            key_offered_at_.reset();
            closing_ = false;
            hello = machine_.start();
        }
        logger_.log("connection", "connecting, max_payload=", config_.max_payload);

        reader_ = std::thread(&Connection::reader_loop, this);
        try
        {
            send(hello);
        }
        catch (const ConnectionError &)
        {
            close();
            throw;
        }

        const auto started = Clock::now();
        std::unique_lock lock(state_mutex_);
        auto outcome = ConnectionFault::Timeout;
        for (;;)
        {
            // A key offer moves the deadline, so it is recomputed on every wakeup.
            auto deadline = started + handshake_timeout;
            if (key_offered_at_)
            {
                deadline = std::max(deadline, *key_offered_at_ + config_.auth_timeout);
            }
            if (Clock::now() >= deadline)
            {
                break;
            }
            const bool done = state_changed_.wait_until(lock, stop, deadline, [&]
                                                        { return failure_ || machine_.state() == ConnectionState::Connected; });
            if (done)
            {
                break;
            }
            if (stop.stop_requested())
            {
                outcome = ConnectionFault::Cancelled;
                break;
            }
        }

        if (failure_)
        {
            auto error = failure_;
            lock.unlock();
            close();
            std::rethrow_exception(error);
        }
        if (machine_.state() == ConnectionState::Connected)
        {
            logger_.log("connection", "connected to ", machine_.banner(), " (max_payload=", machine_.max_payload(),
                        ", signatures=", machine_.signatures_sent(), ")");
            return;
        }

        const auto reached = machine_.state();
        lock.unlock();
        close();
        logger_.warn("connection", "handshake ", to_string(outcome), " in state ", to_string(reached));
        throw ConnectionError(outcome, "handshake stopped in state " + std::string(to_string(reached)));
    }

    void Connection::close() noexcept
    {
        closing_ = true;
        close_transport();
        if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id())
        {
            reader_.join();
        }
        {
            std::lock_guard lock(state_mutex_);
            machine_.reset();
        }
        multiplexer_.fail_all("connection closed");
        state_changed_.notify_all();
    }

    void Connection::replace_transport(std::shared_ptr<Transport> transport)
    {
        if (!transport)
        {
            throw std::invalid_argument("Connection requires a transport");
        }
        if (state() != ConnectionState::Disconnected)
        {
            throw std::logic_error("transport can only be replaced while disconnected");
        }
        if (reader_.joinable())
        {
            reader_.join();
        }
        transport_ = std::move(transport);
    }

    ConnectionState Connection::state() const
    {
        std::lock_guard lock(state_mutex_);
        return machine_.state();
    }

    std::uint32_t Connection::max_payload() const
    {
        std::lock_guard lock(state_mutex_);
        return machine_.max_payload();
    }

    std::string Connection::banner() const
    {
        std::lock_guard lock(state_mutex_);
        return machine_.banner();
    }

    DeviceInfo Connection::device_info() const
    {
        return parse_banner(banner());
    }

    std::size_t Connection::signatures_sent() const
    {
        std::lock_guard lock(state_mutex_);
        return machine_.signatures_sent();
    }

    bool Connection::auth_key_offered() const
    {
        std::lock_guard lock(state_mutex_);
        return machine_.auth_key_offered();
    }

    std::size_t Connection::open_streams() const
    {
        return multiplexer_.stream_count();
    }

    Stream Connection::open(const std::string &destination)
    {
        return open(destination, deadline_after(config_.stream_timeout));
    }

    Stream Connection::open(const std::string &destination, Deadline deadline, std::stop_token stop)
    {
        if (state() != ConnectionState::Connected)
        {
            throw ConnectionError(ConnectionFault::NotConnected, "cannot open " + destination);
        }
        const auto handle = multiplexer_.open(destination, deadline, std::move(stop));
        return Stream(multiplexer_, handle, config_.stream_timeout);
    }

    void Connection::reader_loop()
    {
        try
        {
            for (;;)
            {
                handle(receive());
            }
        }
        catch (const TransportError &ex)
        {
            fail(std::make_exception_ptr(ConnectionError(ConnectionFault::TransportLost, ex.what())), ex.what());
        }
        catch (const std::exception &ex)
        {
            fail(std::current_exception(), ex.what());
        }
    }

    protocol::Message Connection::receive()
    {
        const auto header_bytes = read_exact(protocol::kHeaderSize);
        const auto header = protocol::decode_header(header_bytes);

        std::uint32_t limit = protocol::kMaxPayload;
        {
            std::lock_guard lock(state_mutex_);
            if (machine_.state() == ConnectionState::Connected)
            {
                limit = machine_.max_payload();
            }
        }
        if (header.data_length > limit)
        {
            throw ProtocolError(ProtocolFault::OversizedPayload, header.command, header.arg0, header.arg1,
                                std::to_string(header.data_length) + " bytes exceeds " + std::to_string(limit));
        }

        auto payload = header.data_length > 0 ? read_exact(header.data_length) : protocol::Bytes{};
        protocol::verify_payload(header, payload);
        return protocol::Message{
            .command = static_cast<protocol::Command>(header.command),
            .arg0 = header.arg0,
            .arg1 = header.arg1,
            .payload = std::move(payload),
        };
    }

    protocol::Bytes Connection::read_exact(std::size_t count)
    {
        protocol::Bytes buffer;
        buffer.reserve(count);
        while (buffer.size() < count)
        {
            auto chunk = transport_->read(count - buffer.size());
            if (chunk.empty())
            {
                throw TransportError("transport returned no data");
            }
            buffer.insert(buffer.end(), chunk.begin(), chunk.end());
        }
        return buffer;
    }

    void Connection::handle(const protocol::Message &message)
    {
        if (message.command == protocol::Command::Cnxn || message.command == protocol::Command::Auth)
        {
            std::optional<protocol::Message> reply;
            {
                std::lock_guard lock(state_mutex_);
                const auto before = machine_.state();
                reply = machine_.on_message(message);
                if (reply && reply->command == protocol::Command::Auth &&
                    reply->arg0 == static_cast<std::uint32_t>(protocol::AuthType::RsaPublicKey))
                {
                    key_offered_at_ = Clock::now();
                    logger_.log("connection", "public key offered, confirm the prompt on the device");
                }
                if (before != ConnectionState::Connected && machine_.state() == ConnectionState::Connected)
                {
                    // Before connect() can observe Connected, so no stream slips in ahead of it.
                    multiplexer_.reset(machine_.max_payload());
                }
            }
            if (reply)
            {
                send(*reply);
            }
            state_changed_.notify_all();
            return;
        }

        if (state() != ConnectionState::Connected)
        {
            logger_.warn("connection", "dropping ", protocol::to_string(message.command), " before handshake");
            return;
        }
        multiplexer_.dispatch(message);
    }

    void Connection::send(const protocol::Message &message)
    {
        const auto frame = protocol::encode_message(message);
        std::lock_guard lock(write_mutex_);
        try
        {
            transport_->write(frame);
        }
        catch (const TransportError &ex)
        {
            close_transport();
            throw ConnectionError(ConnectionFault::TransportLost, ex.what());
        }
    }

    void Connection::fail(std::exception_ptr error, const std::string &reason)
    {
        std::exception_ptr first;
        {
            std::lock_guard lock(state_mutex_);
            if (!failure_)
            {
                failure_ = std::move(error);
            }
            first = failure_;
            machine_.reset();
        }
        multiplexer_.fail_all(first);
        state_changed_.notify_all();
        if (closing_)
        {
            logger_.debug("connection", "reader stopped: ", reason);
            return;
        }
        logger_.warn("connection", "connection lost: ", reason);
        close_transport();
    }

    void Connection::close_transport() noexcept
    {
        try
        {
            transport_->close();
        }
        catch (const std::exception &ex)
        {
            logger_.warn("connection", "closing transport failed: ", ex.what());
        }
    }

} // namespace miniadb::client
