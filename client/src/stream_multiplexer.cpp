#include "miniadb/client/stream_multiplexer.hpp"

#include <algorithm>
#include <utility>

#include "miniadb/errors.hpp"

namespace miniadb::client
{

    namespace
    {
        protocol::Message make_message(protocol::Command command, std::uint32_t arg0, std::uint32_t arg1,
                                       protocol::Bytes payload = {})
        {
            return protocol::Message{
                .command = command,
                .arg0 = arg0,
                .arg1 = arg1,
                .payload = std::move(payload),
            };
        }
    } // namespace

    StreamMultiplexer::StreamMultiplexer(SendFunction send, Logger logger)
        : send_(std::move(send)), logger_(std::move(logger))
    {
    }

    void StreamMultiplexer::reset(std::uint32_t max_payload)
    {
        std::lock_guard lock(mutex_);
        for (auto &[id, state] : streams_)
        {
            state->closed = true;
            state->changed.notify_all();
        }
        streams_.clear();
        abandoned_.clear();
        max_payload_ = max_payload;
        failure_ = nullptr;
    }

    std::uint32_t StreamMultiplexer::max_payload() const
    {
        std::lock_guard lock(mutex_);
        return max_payload_;
    }

    StreamHandle StreamMultiplexer::open(const std::string &destination, Deadline deadline, std::stop_token stop)
    {
        std::unique_lock lock(mutex_);
        throw_if_failed();
        auto state = std::make_shared<StreamState>();
        state->local_id = allocate_local_id();
        state->destination = destination;
        streams_.emplace(state->local_id, state);
        lock.unlock();

        logger_.debug("stream", "OPEN ", state->local_id, " -> ", destination);
        try
        {
            send_(make_message(protocol::Command::Open, state->local_id, 0, protocol::to_cstring_bytes(destination)));
        }
        catch (const std::exception &)
        {
            lock.lock();
            streams_.erase(state->local_id);
            throw;
        }

        lock.lock();
        const auto result = wait(lock, *state, deadline, stop, [&]
                                 { return state->opened || state->rejected || failure_; });
        throw_if_failed();
        if (result != WaitResult::Ready)
        {
            // A late OKAY for this id is answered with CLSE by on_okay().
            state->abandoned = true;
            state->closed = true;
            remember_abandoned(state->local_id);
            const auto kind = result == WaitResult::Cancelled ? StreamFault::Cancelled : StreamFault::Timeout;
            logger_.warn("stream", "OPEN ", state->local_id, " (", destination, ") ", to_string(kind));
            throw StreamError(kind, state->local_id, "no answer to OPEN " + destination);
        }
        if (state->rejected)
        {
            streams_.erase(state->local_id);
            logger_.log("stream", "device refused ", destination);
            throw StreamError(StreamFault::Rejected, state->local_id, "device refused " + destination);
        }
        logger_.debug("stream", "stream ", state->local_id, " open, remote_id=", state->remote_id);
        return StreamHandle{state->local_id};
    }

    void StreamMultiplexer::write(StreamHandle handle, std::span<const std::uint8_t> data, Deadline deadline,
                                  std::stop_token stop)
    {
        auto state = [&]
        {
            std::lock_guard lock(mutex_);
            return lookup(handle);
        }();
        std::lock_guard writer(state->writer);

        const auto window_open = [&]
        { return state->send_window || state->closed || failure_; };

        std::size_t offset = 0;
        while (offset < data.size())
        {
            std::unique_lock lock(mutex_);
            const auto result = wait(lock, *state, deadline, stop, window_open);
            throw_if_failed();
            if (state->closed)
            {
                throw StreamError(StreamFault::Closed, handle.local_id,
                                  "closed after " + std::to_string(offset) + " of " + std::to_string(data.size()) +
                                      " bytes");
            }
            if (result != WaitResult::Ready)
            {
                abort_stream(lock, state, result, "write");
            }
            const auto chunk = std::min<std::size_t>(max_payload_, data.size() - offset);
            state->send_window = false;
            const auto remote_id = state->remote_id;
            lock.unlock();

            const auto piece = data.subspan(offset, chunk);
            send_(make_message(protocol::Command::Wrte, handle.local_id, remote_id,
                               protocol::Bytes(piece.begin(), piece.end())));
            offset += chunk;
        }

        std::unique_lock lock(mutex_);
        const auto result = wait(lock, *state, deadline, stop, window_open);
        throw_if_failed();
        if (!state->send_window && state->closed)
        {
            throw StreamError(StreamFault::Closed, handle.local_id, "closed before the last write was acknowledged");
        }
        if (result != WaitResult::Ready)
        {
            abort_stream(lock, state, result, "write");
        }
    }

    protocol::Bytes StreamMultiplexer::read(StreamHandle handle, Deadline deadline, std::stop_token stop)
    {
        std::unique_lock lock(mutex_);
        auto state = lookup(handle);
        const auto result = wait(lock, *state, deadline, stop, [&]
                                 { return !state->inbound.empty() || state->closed || failure_; });
        if (!state->inbound.empty())
        {
            auto data = std::move(state->inbound.front());
            state->inbound.pop_front();
            return data;
        }
        throw_if_failed();
        if (state->closed)
        {
            throw StreamError(StreamFault::Closed, handle.local_id, state->destination);
        }
        abort_stream(lock, state, result, "read");
    }

    void StreamMultiplexer::close(StreamHandle handle)
    {
        std::unique_lock lock(mutex_);
        auto it = streams_.find(handle.local_id);
        if (it == streams_.end())
        {
            return;
        }
        auto state = it->second;
        streams_.erase(it);
        const bool notify_device = state->opened && !state->closed_by_device && !failure_;
        state->closed = true;
        state->changed.notify_all();
        const auto remote_id = state->remote_id;
        lock.unlock();

        logger_.debug("stream", "CLSE ", handle.local_id, " (", state->destination, ")");
        if (notify_device)
        {
            send_(make_message(protocol::Command::Clse, handle.local_id, remote_id));
        }
    }

    void StreamMultiplexer::release(StreamHandle handle) noexcept
    {
        try
        {
            close(handle);
        }
        catch (const std::exception &ex)
        {
            logger_.warn("stream", "closing stream ", handle.local_id, " failed: ", ex.what());
        }
    }

    bool StreamMultiplexer::is_closed(StreamHandle handle) const
    {
        std::lock_guard lock(mutex_);
        auto it = streams_.find(handle.local_id);
        return it == streams_.end() || it->second->closed;
    }

    std::uint32_t StreamMultiplexer::remote_id(StreamHandle handle) const
    {
        std::lock_guard lock(mutex_);
        return lookup(handle)->remote_id;
    }

    std::string StreamMultiplexer::destination(StreamHandle handle) const
    {
        std::lock_guard lock(mutex_);
        return lookup(handle)->destination;
    }

    std::size_t StreamMultiplexer::stream_count() const
    {
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(std::count_if(streams_.begin(), streams_.end(), [](const auto &entry)
                                                      { return !entry.second->abandoned; }));
    }

    void StreamMultiplexer::dispatch(const protocol::Message &message)
    {
        switch (message.command)
        {
        case protocol::Command::Okay:
            on_okay(message);
            break;
        case protocol::Command::Wrte:
            on_write(message);
            break;
        case protocol::Command::Clse:
            on_close(message);
            break;
        case protocol::Command::Open:
            // Reverse services are not offered by this host.
            logger_.warn("stream", "refusing device-initiated OPEN from remote_id=", message.arg0);
            send_(make_message(protocol::Command::Clse, 0, message.arg0));
            break;
        default:
            logger_.warn("stream", "dropping ", protocol::to_string(message.command), " arg0=", message.arg0,
                         " arg1=", message.arg1);
            break;
        }
    }

    void StreamMultiplexer::fail_all(const std::string &reason)
    {
        fail_all(std::make_exception_ptr(ConnectionError(ConnectionFault::TransportLost, reason)));
    }

    void StreamMultiplexer::fail_all(std::exception_ptr error)
    {
        std::lock_guard lock(mutex_);
        if (!failure_)
        {
            failure_ = std::move(error);
        }
        for (auto &[id, state] : streams_)
        {
            state->closed = true;
            state->changed.notify_all();
        }
        streams_.clear();
        abandoned_.clear();
    }

    StreamMultiplexer::StatePtr StreamMultiplexer::lookup(StreamHandle handle) const
    {
        throw_if_failed();
        auto it = streams_.find(handle.local_id);
        if (it == streams_.end() || it->second->abandoned)
        {
            throw StreamError(StreamFault::Closed, handle.local_id, "unknown or closed stream");
        }
        return it->second;
    }

    void StreamMultiplexer::throw_if_failed() const
    {
        if (failure_)
        {
            std::rethrow_exception(failure_);
        }
    }

    std::uint32_t StreamMultiplexer::allocate_local_id()
    {
        for (;;)
        {
            const auto candidate = next_local_id_++;
            if (next_local_id_ == 0)
            {
                next_local_id_ = 1;
            }
            if (candidate != 0 && !streams_.contains(candidate))
            {
                return candidate;
            }
        }
    }

    void StreamMultiplexer::remember_abandoned(std::uint32_t local_id)
    {
        abandoned_.push_back(local_id);
        while (abandoned_.size() > kMaxAbandonedOpens)
        {
            const auto oldest = abandoned_.front();
            abandoned_.pop_front();
            auto it = streams_.find(oldest);
            if (it != streams_.end() && it->second->abandoned)
            {
                logger_.debug("stream", "forgetting unanswered OPEN ", oldest, " (", it->second->destination, ")");
                streams_.erase(it);
            }
        }
    }

    void StreamMultiplexer::abort_stream(std::unique_lock<std::mutex> &lock, const StatePtr &state, WaitResult reason,
                                         const char *operation)
    {
        const auto kind = reason == WaitResult::Cancelled ? StreamFault::Cancelled : StreamFault::Timeout;
        const auto local_id = state->local_id;
        const auto remote_id = state->remote_id;
        const bool notify_device = state->opened && !state->closed_by_device && !failure_;
        streams_.erase(local_id);
        state->closed = true;
        state->changed.notify_all();
        lock.unlock();

        logger_.warn("stream", operation, " on stream ", local_id, " ", to_string(kind), ", closing it");
        if (notify_device)
        {
            send_(make_message(protocol::Command::Clse, local_id, remote_id));
        }
        throw StreamError(kind, local_id, std::string(operation) + " gave up on " + state->destination);
    }

    void StreamMultiplexer::on_okay(const protocol::Message &message)
    {
        std::unique_lock lock(mutex_);
        auto it = streams_.find(message.arg1);
        if (it == streams_.end())
        {
            logger_.warn("stream", "dropping OKAY for unknown local_id=", message.arg1);
            return;
        }
        auto state = it->second;
        if (state->abandoned)
        {
            streams_.erase(it);
            lock.unlock();
            logger_.debug("stream", "closing abandoned stream ", message.arg1);
            send_(make_message(protocol::Command::Clse, message.arg1, message.arg0));
            return;
        }
        if (!state->opened)
        {
            state->opened = true;
            state->remote_id = message.arg0;
            state->send_window = true;
        }
        else if (message.arg0 != state->remote_id)
        {
            logger_.warn("stream", "dropping OKAY for stream ", message.arg1, " from remote_id=", message.arg0,
                         ", expected ", state->remote_id);
            return;
        }
        else
        {
            state->send_window = true;
        }
        state->changed.notify_all();
    }

    void StreamMultiplexer::on_write(const protocol::Message &message)
    {
        std::unique_lock lock(mutex_);
        auto it = streams_.find(message.arg1);
        if (it == streams_.end() || it->second->abandoned || !it->second->opened)
        {
            logger_.warn("stream", "dropping WRTE for unknown local_id=", message.arg1, " (", message.payload.size(),
                         " bytes)");
            return;
        }
        auto state = it->second;
        if (message.arg0 != state->remote_id)
        {
            logger_.warn("stream", "dropping WRTE for stream ", message.arg1, " from remote_id=", message.arg0);
            return;
        }
        state->inbound.push_back(message.payload);
        state->changed.notify_all();
        const auto local_id = state->local_id;
        const auto remote_id = state->remote_id;
        lock.unlock();

        send_(make_message(protocol::Command::Okay, local_id, remote_id));
    }

    void StreamMultiplexer::on_close(const protocol::Message &message)
    {
        std::lock_guard lock(mutex_);
        auto it = streams_.find(message.arg1);
        if (it == streams_.end())
        {
            logger_.warn("stream", "dropping CLSE for unknown local_id=", message.arg1);
            return;
        }
        auto state = it->second;
        if (state->abandoned)
        {
            streams_.erase(it);
            return;
        }
        if (!state->opened)
        {
            state->rejected = true;
        }
        else
        {
            state->closed = true;
            state->closed_by_device = true;
            logger_.debug("stream", "device closed stream ", message.arg1, " (", state->destination, ")");
        }
        state->changed.notify_all();
    }

} // namespace miniadb::client
