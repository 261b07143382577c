#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "miniadb/client/logger.hpp"
#include "miniadb/client/stream.hpp"
#include "miniadb/message.hpp"
#include "miniadb/sync_protocol.hpp"

namespace miniadb::client
{

    enum class TransferMode : std::uint8_t
    {
        Push,
        Pull
    };

    std::string_view to_string(TransferMode mode) noexcept;

    struct TransferReport
    {
        TransferMode mode{TransferMode::Push};
        std::string remote_path;
        std::size_t chunk_size{};
        std::uint64_t bytes_transferred{};
        std::uint32_t mtime{};
    };

    // (remote_path, bytes so far, total bytes or -1 when unknown)
    using ProgressCallback = std::function<void(const std::string &, std::uint64_t, std::int64_t)>;

    // Filesync session over an open "sync:" stream. Operations run one at a
    // time; outgoing packets are batched into WRTEs of at most max_payload
    // bytes and always flushed before the next response is read.
    class FileSync
    {
    public:
        FileSync(Stream &stream, Logger logger);

        TransferReport push(std::istream &source, const std::string &remote_path,
                            std::uint32_t mode = protocol::kDefaultPushMode, std::uint32_t mtime = 0,
                            const ProgressCallback &progress = {});
        TransferReport push(std::span<const std::uint8_t> data, const std::string &remote_path,
                            std::uint32_t mode = protocol::kDefaultPushMode, std::uint32_t mtime = 0,
                            const ProgressCallback &progress = {});

        // With a progress callback the file is STATed first to learn its size.
        TransferReport pull(const std::string &remote_path, std::ostream &sink, const ProgressCallback &progress = {});

        // std::nullopt when the path does not exist.
        std::optional<protocol::DeviceFile> stat(const std::string &remote_path);

        std::vector<protocol::DeviceFile> list(const std::string &remote_path);

        void quit();

        std::size_t chunk_size() const noexcept { return chunk_size_; }

    private:
        using ChunkSource = std::function<std::size_t(protocol::Bytes &)>;

        TransferReport push_chunks(const ChunkSource &next_chunk, std::int64_t total, const std::string &remote_path,
                                   std::uint32_t mode, std::uint32_t mtime, const ProgressCallback &progress);

        void send_packet(protocol::SyncId id, std::span<const std::uint8_t> data);
        void send_header(protocol::SyncId id, std::uint32_t length);
        void reserve(std::size_t bytes);
        void flush();

        protocol::Bytes read_exact(std::size_t count);
        protocol::SyncId read_id(std::span<const std::uint8_t> header);
        std::string read_failure(std::uint32_t length);

        Stream &stream_;
        Logger logger_;
        std::size_t max_payload_;
        std::size_t chunk_size_;
        protocol::Bytes send_buffer_;
        protocol::Bytes recv_buffer_;
    };

} // namespace miniadb::client
