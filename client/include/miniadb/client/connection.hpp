#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include "miniadb/client/config.hpp"
#include "miniadb/client/connection_state.hpp"
#include "miniadb/client/key_store.hpp"
#include "miniadb/client/logger.hpp"
#include "miniadb/client/stream.hpp"
#include "miniadb/client/stream_multiplexer.hpp"
#include "miniadb/client/transport.hpp"
#include "miniadb/message.hpp"

namespace miniadb::client
{

    // One physical link to a device. A single reader thread owns the inbound
    // side of the transport: it drives the handshake state machine and then
    // hands stream traffic to the multiplexer. Outbound messages from any
    // thread are serialised through one write path.
    class Connection
    {
    public:
        Connection(std::shared_ptr<Transport> transport, ClientConfig config, KeyStore keys, Logger logger);
        ~Connection();

        Connection(const Connection &) = delete;
        Connection &operator=(const Connection &) = delete;

        // Blocks until Connected. Bounded by handshake_timeout, extended by
        // auth_timeout once a public key has been offered to the device.
        void connect(std::stop_token stop = {});
        void connect(std::chrono::milliseconds handshake_timeout, std::stop_token stop = {});

        void close() noexcept;

        // Swaps in a fresh transport so a Disconnected connection can start over.
        void replace_transport(std::shared_ptr<Transport> transport);

        ConnectionState state() const;
        std::uint32_t max_payload() const;
        std::string banner() const;
        DeviceInfo device_info() const;
        std::size_t signatures_sent() const;
        bool auth_key_offered() const;
        std::size_t open_streams() const;

        Stream open(const std::string &destination);
        Stream open(const std::string &destination, Deadline deadline, std::stop_token stop = {});

        const ClientConfig &config() const noexcept { return config_; }
        Logger &logger() noexcept { return logger_; }

    private:
        void reader_loop();
        protocol::Message receive();
        protocol::Bytes read_exact(std::size_t count);
        void handle(const protocol::Message &message);
        void send(const protocol::Message &message);
        void fail(std::exception_ptr error, const std::string &reason);
        void close_transport() noexcept;

        std::shared_ptr<Transport> transport_;
        ClientConfig config_;
        Logger logger_;
        ConnectionStateMachine machine_;
        StreamMultiplexer multiplexer_;
        std::mutex write_mutex_;
        mutable std::mutex state_mutex_;
        std::condition_variable_any state_changed_;
        std::exception_ptr failure_;
        std::optional<Clock::time_point> key_offered_at_;
        std::atomic<bool> closing_{false};
        std::thread reader_;
    };

} // namespace miniadb::client
