#include "miniadb/client/filesync.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

#include "miniadb/byte_order.hpp"
#include "miniadb/errors.hpp"

namespace miniadb::client
{

    namespace
    {
        using protocol::SyncId;

        void check_path(const std::string &remote_path)
        {
            if (remote_path.size() > protocol::kSyncMaxPathLength)
            {
                throw TransferError(TransferFault::PathTooLong, remote_path.substr(0, 64) + "...",
                                    std::to_string(remote_path.size()) + " bytes, limit is " +
                                        std::to_string(protocol::kSyncMaxPathLength));
            }
        }

        std::uint32_t now_seconds()
        {
            const auto now = std::chrono::system_clock::now().time_since_epoch();
            return static_cast<std::uint32_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
        }

        std::int64_t remaining_size(std::istream &source)
        {
            const auto start = source.tellg();
            if (start < 0)
            {
                source.clear();
                return -1;
            }
            source.seekg(0, std::ios::end);
            const auto end = source.tellg();
            source.clear();
            source.seekg(start);
            if (end < start)
            {
                return -1;
            }
            return static_cast<std::int64_t>(end - start);
        }
    } // namespace

    std::string_view to_string(TransferMode mode) noexcept
    {
        return mode == TransferMode::Push ? "push" : "pull";
    }

    FileSync::FileSync(Stream &stream, Logger logger)
        : stream_(stream), logger_(std::move(logger)), max_payload_(stream.max_payload()), chunk_size_(0)
    {
        if (max_payload_ <= protocol::kSyncHeaderSize)
        {
            throw std::invalid_argument("max_payload too small for filesync: " + std::to_string(max_payload_));
        }
        chunk_size_ = std::min<std::size_t>(max_payload_ - protocol::kSyncHeaderSize, protocol::kSyncDataMax);
        send_buffer_.reserve(max_payload_);
    }

    TransferReport FileSync::push(std::istream &source, const std::string &remote_path, std::uint32_t mode,
                                  std::uint32_t mtime, const ProgressCallback &progress)
    {
        const auto total = progress ? remaining_size(source) : -1;
        const ChunkSource next_chunk = [&](protocol::Bytes &chunk) -> std::size_t
        {
            chunk.resize(chunk_size_);
            source.read(reinterpret_cast<char *>(chunk.data()), static_cast<std::streamsize>(chunk_size_));
            if (source.bad())
            {
                throw TransferError(TransferFault::ShortWrite, remote_path, "reading the local source failed");
            }
            return static_cast<std::size_t>(source.gcount());
        };
        return push_chunks(next_chunk, total, remote_path, mode, mtime, progress);
    }

    TransferReport FileSync::push(std::span<const std::uint8_t> data, const std::string &remote_path,
                                  std::uint32_t mode, std::uint32_t mtime, const ProgressCallback &progress)
    {
        std::size_t offset = 0;
        const ChunkSource next_chunk = [&](protocol::Bytes &chunk) -> std::size_t
        {
            const auto count = std::min(chunk_size_, data.size() - offset);
            chunk.assign(data.begin() + static_cast<std::ptrdiff_t>(offset),
                         data.begin() + static_cast<std::ptrdiff_t>(offset + count));
            offset += count;
            return count;
        };
        return push_chunks(next_chunk, static_cast<std::int64_t>(data.size()), remote_path, mode, mtime, progress);
    }

    TransferReport FileSync::push_chunks(const ChunkSource &next_chunk, std::int64_t total,
                                         const std::string &remote_path, std::uint32_t mode, std::uint32_t mtime,
                                         const ProgressCallback &progress)
    {
        check_path(remote_path);
        TransferReport report{
            .mode = TransferMode::Push,
            .remote_path = remote_path,
            .chunk_size = chunk_size_,
            .bytes_transferred = 0,
            .mtime = mtime == 0 ? now_seconds() : mtime,
        };
        logger_.debug("sync", "SEND ", remote_path, " mode=", spdlog::fmt_lib::format("{:#o}", mode));

        try
        {
            send_packet(SyncId::Send, protocol::to_bytes(protocol::make_send_target(remote_path, mode)));

            protocol::Bytes chunk;
            chunk.reserve(chunk_size_);
            for (;;)
            {
                const auto count = next_chunk(chunk);
                if (count == 0)
                {
                    break;
                }
                send_packet(SyncId::Data, std::span<const std::uint8_t>(chunk.data(), count));
                report.bytes_transferred += count;
                if (progress)
                {
                    progress(remote_path, report.bytes_transferred, total);
                }
            }

            // DONE has no payload; its length field carries the mtime.
            send_header(SyncId::Done, report.mtime);
            const auto header = read_exact(protocol::kSyncHeaderSize);
            const auto id = read_id(header);
            if (id == SyncId::Fail)
            {
                auto message = read_failure(protocol::read_u32_le(header, 4));
                logger_.warn("sync", "push ", remote_path, " failed: ", message);
                throw PushFailedError(remote_path, std::move(message));
            }
            if (id != SyncId::Okay)
            {
                throw TransferError(TransferFault::UnexpectedResponse, remote_path,
                                    "expected OKAY or FAIL after DONE, got " + std::string(protocol::to_string(id)));
            }
        }
        catch (const StreamError &ex)
        {
            if (ex.kind() != StreamFault::Closed)
            {
                throw;
            }
            throw TransferError(TransferFault::ShortWrite, remote_path,
                                "stream closed after " + std::to_string(report.bytes_transferred) + " bytes");
        }

        logger_.log("sync", "pushed ", remote_path, " (", report.bytes_transferred, " bytes)");
        return report;
    }

    TransferReport FileSync::pull(const std::string &remote_path, std::ostream &sink, const ProgressCallback &progress)
    {
        check_path(remote_path);
        std::int64_t total = -1;
        if (progress)
        {
            if (const auto info = stat(remote_path))
            {
                total = info->size;
            }
        }

        TransferReport report{
            .mode = TransferMode::Pull,
            .remote_path = remote_path,
            .chunk_size = chunk_size_,
            .bytes_transferred = 0,
            .mtime = 0,
        };
        logger_.debug("sync", "RECV ", remote_path);

        try
        {
            send_packet(SyncId::Recv, protocol::to_bytes(remote_path));
            for (;;)
            {
                const auto header = read_exact(protocol::kSyncHeaderSize);
                const auto id = read_id(header);
                const auto length = protocol::read_u32_le(header, 4);
                if (id == SyncId::Done)
                {
                    break;
                }
                if (id == SyncId::Fail)
                {
                    auto message = read_failure(length);
                    logger_.warn("sync", "pull ", remote_path, " failed: ", message);
                    throw PullFailedError(remote_path, std::move(message));
                }
                if (id != SyncId::Data)
                {
                    throw TransferError(TransferFault::UnexpectedResponse, remote_path,
                                        "expected DATA, DONE or FAIL, got " + std::string(protocol::to_string(id)));
                }
                if (length > protocol::kSyncDataMax)
                {
                    throw TransferError(TransferFault::UnexpectedResponse, remote_path,
                                        "DATA packet of " + std::to_string(length) + " bytes");
                }

                const auto data = read_exact(length);
                sink.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
                if (!sink)
                {
                    throw TransferError(TransferFault::Incomplete, remote_path, "writing the local sink failed");
                }
                report.bytes_transferred += length;
                if (progress)
                {
                    progress(remote_path, report.bytes_transferred, total);
                }
            }
        }
        catch (const StreamError &ex)
        {
            if (ex.kind() != StreamFault::Closed)
            {
                throw;
            }
            throw TransferError(TransferFault::Incomplete, remote_path,
                                "stream closed after " + std::to_string(report.bytes_transferred) + " bytes");
        }

        logger_.log("sync", "pulled ", remote_path, " (", report.bytes_transferred, " bytes)");
        return report;
    }

    std::optional<protocol::DeviceFile> FileSync::stat(const std::string &remote_path)
    {
        check_path(remote_path);
        try
        {
            send_packet(SyncId::Stat, protocol::to_bytes(remote_path));
            const auto header = read_exact(protocol::kSyncHeaderSize);
            const auto id = read_id(header);
            if (id == SyncId::Fail)
            {
                throw TransferError(TransferFault::UnexpectedResponse, remote_path,
                                    read_failure(protocol::read_u32_le(header, 4)));
            }
            if (id != SyncId::Stat)
            {
                throw TransferError(TransferFault::UnexpectedResponse, remote_path,
                                    "expected STAT, got " + std::string(protocol::to_string(id)));
            }
            const auto rest = read_exact(protocol::kSyncStatSize - protocol::kSyncHeaderSize);
            protocol::DeviceFile file{
                .name = remote_path,
                .mode = protocol::read_u32_le(header, 4),
                .size = protocol::read_u32_le(rest, 0),
                .mtime = protocol::read_u32_le(rest, 4),
            };
            if (file.mode == 0 && file.size == 0 && file.mtime == 0)
            {
                return std::nullopt;
            }
            return file;
        }
        catch (const StreamError &ex)
        {
            if (ex.kind() != StreamFault::Closed)
            {
                throw;
            }
            throw TransferError(TransferFault::Incomplete, remote_path, "stream closed during STAT");
        }
    }

    std::vector<protocol::DeviceFile> FileSync::list(const std::string &remote_path)
    {
        check_path(remote_path);
        std::vector<protocol::DeviceFile> files;
        try
        {
            send_packet(SyncId::List, protocol::to_bytes(remote_path));
            for (;;)
            {
                const auto header = read_exact(protocol::kSyncHeaderSize);
                const auto id = read_id(header);
                if (id == SyncId::Fail)
                {
                    throw TransferError(TransferFault::UnexpectedResponse, remote_path,
                                        read_failure(protocol::read_u32_le(header, 4)));
                }
                if (id != SyncId::Dent && id != SyncId::Done)
                {
                    throw TransferError(TransferFault::UnexpectedResponse, remote_path,
                                        "expected DENT or DONE, got " + std::string(protocol::to_string(id)));
                }
                // DONE is padded to the size of a DENT record.
                const auto rest = read_exact(protocol::kSyncDentSize - protocol::kSyncHeaderSize);
                if (id == SyncId::Done)
                {
                    break;
                }
                const auto name_length = protocol::read_u32_le(rest, 8);
                if (name_length > protocol::kSyncMaxPathLength)
                {
                    throw TransferError(TransferFault::UnexpectedResponse, remote_path,
                                        "DENT name of " + std::to_string(name_length) + " bytes");
                }
                const auto name = read_exact(name_length);
                files.push_back(protocol::DeviceFile{
                    .name = std::string(name.begin(), name.end()),
                    .mode = protocol::read_u32_le(header, 4),
                    .size = protocol::read_u32_le(rest, 0),
                    .mtime = protocol::read_u32_le(rest, 4),
                });
            }
        }
        catch (const StreamError &ex)
        {
            if (ex.kind() != StreamFault::Closed)
            {
                throw;
            }
            throw TransferError(TransferFault::Incomplete, remote_path, "stream closed during LIST");
        }
        logger_.debug("sync", "LIST ", remote_path, ": ", files.size(), " entries");
        return files;
    }

    void FileSync::quit()
    {
        send_header(SyncId::Quit, 0);
        flush();
    }

    void FileSync::send_packet(protocol::SyncId id, std::span<const std::uint8_t> data)
    {
        reserve(protocol::kSyncHeaderSize + data.size());
        protocol::append_sync_packet(send_buffer_, id, data);
    }

    void FileSync::send_header(protocol::SyncId id, std::uint32_t length)
    {
        reserve(protocol::kSyncHeaderSize);
        protocol::append_sync_header(send_buffer_, id, length);
    }

    void FileSync::reserve(std::size_t bytes)
    {
        if (send_buffer_.size() + bytes > max_payload_)
        {
            flush();
        }
    }

    void FileSync::flush()
    {
        if (send_buffer_.empty())
        {
            return;
        }
        stream_.write(send_buffer_);
        send_buffer_.clear();
    }

    protocol::Bytes FileSync::read_exact(std::size_t count)
    {
        flush();
        while (recv_buffer_.size() < count)
        {
            const auto data = stream_.read();
            recv_buffer_.insert(recv_buffer_.end(), data.begin(), data.end());
        }
        protocol::Bytes out(recv_buffer_.begin(), recv_buffer_.begin() + static_cast<std::ptrdiff_t>(count));
        recv_buffer_.erase(recv_buffer_.begin(), recv_buffer_.begin() + static_cast<std::ptrdiff_t>(count));
        return out;
    }

    protocol::SyncId FileSync::read_id(std::span<const std::uint8_t> header)
    {
        const auto raw = protocol::read_u32_le(header, 0);
        const auto id = protocol::sync_id_from_wire(raw);
        if (!id)
        {
            throw TransferError(TransferFault::UnexpectedResponse, {},
                                "unknown sync id " + protocol::describe_command(raw));
        }
        return *id;
    }

    std::string FileSync::read_failure(std::uint32_t length)
    {
        if (length > protocol::kMaxPayload)
        {
            throw TransferError(TransferFault::UnexpectedResponse, {},
                                "FAIL message of " + std::to_string(length) + " bytes");
        }
        const auto message = read_exact(length);
        return std::string(message.begin(), message.end());
    }

} // namespace miniadb::client
