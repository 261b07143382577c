#include "miniadb/client/stream.hpp"

#include <stdexcept>
#include <utility>

#include "miniadb/errors.hpp"

namespace miniadb::client
{

    Stream::Stream(StreamMultiplexer &multiplexer, StreamHandle handle, std::chrono::milliseconds timeout)
        : multiplexer_(&multiplexer), handle_(handle), timeout_(timeout)
    {
    }

    Stream::Stream(Stream &&other) noexcept
        : multiplexer_(std::exchange(other.multiplexer_, nullptr)), handle_(other.handle_), timeout_(other.timeout_)
    {
    }

    Stream &Stream::operator=(Stream &&other) noexcept
    {
        if (this != &other)
        {
            if (multiplexer_)
            {
                multiplexer_->release(handle_);
            }
            multiplexer_ = std::exchange(other.multiplexer_, nullptr);
            handle_ = other.handle_;
            timeout_ = other.timeout_;
        }
        return *this;
    }

    Stream::~Stream()
    {
        if (multiplexer_)
        {
            multiplexer_->release(handle_);
        }
    }

    void Stream::write(std::span<const std::uint8_t> data)
    {
        write(data, deadline_after(timeout_));
    }

    void Stream::write(std::span<const std::uint8_t> data, Deadline deadline, std::stop_token stop)
    {
        multiplexer().write(handle_, data, deadline, std::move(stop));
    }

    void Stream::write(std::string_view text)
    {
        const auto bytes = protocol::to_bytes(text);
        write(bytes);
    }

    protocol::Bytes Stream::read()
    {
        return read(deadline_after(timeout_));
    }

    protocol::Bytes Stream::read(Deadline deadline, std::stop_token stop)
    {
        return multiplexer().read(handle_, deadline, std::move(stop));
    }

    void Stream::read_until_close(const ChunkCallback &on_chunk, Deadline deadline, std::stop_token stop)
    {
        for (;;)
        {
            protocol::Bytes chunk;
            try
            {
                chunk = read(deadline, stop);
            }
            catch (const StreamError &ex)
            {
                if (ex.kind() != StreamFault::Closed)
                {
                    throw;
                }
                return;
            }
            on_chunk(chunk);
        }
    }

    protocol::Bytes Stream::read_until_close(Deadline deadline, std::stop_token stop)
    {
        protocol::Bytes output;
        read_until_close([&output](std::span<const std::uint8_t> chunk)
                         { output.insert(output.end(), chunk.begin(), chunk.end()); },
                         deadline, std::move(stop));
        return output;
    }

    void Stream::close()
    {
        if (multiplexer_)
        {
            multiplexer_->close(handle_);
        }
    }

    bool Stream::closed() const
    {
        return !multiplexer_ || multiplexer_->is_closed(handle_);
    }

    std::uint32_t Stream::remote_id() const
    {
        return multiplexer().remote_id(handle_);
    }

    std::uint32_t Stream::max_payload() const
    {
        return multiplexer().max_payload();
    }

    StreamMultiplexer &Stream::multiplexer() const
    {
        if (!multiplexer_)
        {
            throw std::logic_error("use of a moved-from Stream");
        }
        return *multiplexer_;
    }

} // namespace miniadb::client
