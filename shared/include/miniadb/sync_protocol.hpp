/**
 * MiniADB - Filesync sub-protocol packets carried inside "sync:" stream writes.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "miniadb/byte_order.hpp"
#include "miniadb/message.hpp"

namespace miniadb::protocol
{

    enum class SyncId : std::uint32_t
    {
        Stat = make_tag("STAT"),
        List = make_tag("LIST"),
        Send = make_tag("SEND"),
        Recv = make_tag("RECV"),
        Dent = make_tag("DENT"),
        Done = make_tag("DONE"),
        Data = make_tag("DATA"),
        Okay = make_tag("OKAY"),
        Fail = make_tag("FAIL"),
        Quit = make_tag("QUIT")
    };

    // id + length
    constexpr std::size_t kSyncHeaderSize = 8;
    // id + mode + size + mtime
    constexpr std::size_t kSyncStatSize = 16;
    // id + mode + size + mtime + name length
    constexpr std::size_t kSyncDentSize = 20;
    constexpr std::size_t kSyncMaxPathLength = 1024;
    // adbd refuses larger DATA packets whatever max_payload was negotiated.
    constexpr std::size_t kSyncDataMax = 64 * 1024;
    // S_IFREG | S_IRWXU | S_IRWXG
    constexpr std::uint32_t kDefaultPushMode = 0100770;

    std::string_view to_string(SyncId id) noexcept;
    std::optional<SyncId> sync_id_from_wire(std::uint32_t value) noexcept;

    void append_sync_header(Bytes &out, SyncId id, std::uint32_t length);
    void append_sync_packet(Bytes &out, SyncId id, std::span<const std::uint8_t> data);

    // SEND carries "<path>,<decimal mode>".
    std::string make_send_target(std::string_view remote_path, std::uint32_t mode);

    struct DeviceFile
    {
        std::string name;
        std::uint32_t mode{};
        std::uint32_t size{};
        std::uint32_t mtime{};

        bool is_directory() const noexcept;
        bool is_regular_file() const noexcept;
    };

    void to_json(nlohmann::json &json, const DeviceFile &file);
    void from_json(const nlohmann::json &json, DeviceFile &file);

} // namespace miniadb::protocol
