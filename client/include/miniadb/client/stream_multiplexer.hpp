#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <stop_token>
#include <string>
#include <unordered_map>

#include "miniadb/client/logger.hpp"
#include "miniadb/message.hpp"

namespace miniadb::client
{

    using Clock = std::chrono::steady_clock;
    using Deadline = Clock::time_point;

    inline Deadline deadline_after(std::chrono::milliseconds timeout)
    {
        return Clock::now() + timeout;
    }

    struct StreamHandle
    {
        std::uint32_t local_id{};
    };

    // Carries any number of logical streams over one authenticated
    // connection. The reader loop feeds dispatch(); open/write/read/close may
    // be called from any thread. Blocking calls wait per stream, so a stalled
    // stream never holds up another one.
    class StreamMultiplexer
    {
    public:
        static constexpr std::size_t kMaxAbandonedOpens = 64;

        using SendFunction = std::function<void(const protocol::Message &)>;

        StreamMultiplexer(SendFunction send, Logger logger);

        // Starts a new session at the negotiated payload size.
        void reset(std::uint32_t max_payload);

        std::uint32_t max_payload() const;

        StreamHandle open(const std::string &destination, Deadline deadline, std::stop_token stop = {});

        // Returns once every chunk has been acknowledged by the device.
        void write(StreamHandle handle, std::span<const std::uint8_t> data, Deadline deadline,
                   std::stop_token stop = {});

        protocol::Bytes read(StreamHandle handle, Deadline deadline, std::stop_token stop = {});

        void close(StreamHandle handle);

        // close() for destructors: transport failures are logged, not thrown.
        void release(StreamHandle handle) noexcept;

        bool is_closed(StreamHandle handle) const;
        std::uint32_t remote_id(StreamHandle handle) const;
        std::string destination(StreamHandle handle) const;
        std::size_t stream_count() const;

        void dispatch(const protocol::Message &message);

        // Connection failed: wakes every waiter and rethrows `error` from every call until reset().
        void fail_all(std::exception_ptr error);
        void fail_all(const std::string &reason);

    private:
        struct StreamState
        {
            std::uint32_t local_id{};
            std::uint32_t remote_id{};
            std::string destination;
            bool opened{false};
            bool rejected{false};
            bool abandoned{false};
            bool send_window{false};
            bool closed{false};
            bool closed_by_device{false};
            std::deque<protocol::Bytes> inbound;
            std::condition_variable_any changed;
            std::mutex writer;
        };

        using StatePtr = std::shared_ptr<StreamState>;

        enum class WaitResult
        {
            Ready,
            TimedOut,
            Cancelled
        };

        template <typename Predicate>
        WaitResult wait(std::unique_lock<std::mutex> &lock, StreamState &state, Deadline deadline,
                        std::stop_token stop, Predicate predicate)
        {
            if (state.changed.wait_until(lock, stop, deadline, predicate))
            {
                return WaitResult::Ready;
            }
            return stop.stop_requested() ? WaitResult::Cancelled : WaitResult::TimedOut;
        }

        StatePtr lookup(StreamHandle handle) const;
        void throw_if_failed() const;
        std::uint32_t allocate_local_id();
        void remember_abandoned(std::uint32_t local_id);
        [[noreturn]] void abort_stream(std::unique_lock<std::mutex> &lock, const StatePtr &state, WaitResult reason,
                                       const char *operation);

        void on_okay(const protocol::Message &message);
        void on_write(const protocol::Message &message);
        void on_close(const protocol::Message &message);

        SendFunction send_;
        Logger logger_;
        mutable std::mutex mutex_;
        std::unordered_map<std::uint32_t, StatePtr> streams_;
        // Timed-out OPENs still waiting for a late OKAY or CLSE, oldest first.
        std::deque<std::uint32_t> abandoned_;
        std::uint32_t next_local_id_{1};
        std::uint32_t max_payload_{protocol::kLegacyMaxPayload};
        std::exception_ptr failure_;
    };

} // namespace miniadb::client
