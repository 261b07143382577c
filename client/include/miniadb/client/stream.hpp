#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <span>
#include <stop_token>
#include <string_view>

#include "miniadb/client/stream_multiplexer.hpp"
#include "miniadb/message.hpp"

namespace miniadb::client
{

    // Owning handle to one open stream. Closing happens on destruction unless
    // close() was called already. Calls without an explicit deadline use the
    // stream's default timeout per call.
    class Stream
    {
    public:
        using ChunkCallback = std::function<void(std::span<const std::uint8_t>)>;

        Stream(StreamMultiplexer &multiplexer, StreamHandle handle, std::chrono::milliseconds timeout);
        Stream(Stream &&other) noexcept;
        Stream &operator=(Stream &&other) noexcept;
        Stream(const Stream &) = delete;
        Stream &operator=(const Stream &) = delete;
        ~Stream();

        void write(std::span<const std::uint8_t> data);
        void write(std::span<const std::uint8_t> data, Deadline deadline, std::stop_token stop = {});
        void write(std::string_view text);

        protocol::Bytes read();
        protocol::Bytes read(Deadline deadline, std::stop_token stop = {});

        // Delivers every payload until the device closes the stream.
        void read_until_close(const ChunkCallback &on_chunk, Deadline deadline, std::stop_token stop = {});
        protocol::Bytes read_until_close(Deadline deadline, std::stop_token stop = {});

        void close();

        bool closed() const;
        StreamHandle handle() const noexcept { return handle_; }
        std::uint32_t local_id() const noexcept { return handle_.local_id; }
        std::uint32_t remote_id() const;
        std::uint32_t max_payload() const;
        std::chrono::milliseconds timeout() const noexcept { return timeout_; }

    private:
        StreamMultiplexer &multiplexer() const;

        StreamMultiplexer *multiplexer_;
        StreamHandle handle_;
        std::chrono::milliseconds timeout_;
    };

} // namespace miniadb::client
