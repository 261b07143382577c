#include "miniadb/sync_protocol.hpp"

#include <array>

namespace miniadb::protocol
{

    namespace
    {
        struct SyncIdMapping
        {
            SyncId id;
            std::string_view label;
        };

        constexpr std::array<SyncIdMapping, 10> kSyncIdMappings{{
            {SyncId::Stat, "STAT"},
            {SyncId::List, "LIST"},
            {SyncId::Send, "SEND"},
            {SyncId::Recv, "RECV"},
            {SyncId::Dent, "DENT"},
            {SyncId::Done, "DONE"},
            {SyncId::Data, "DATA"},
            {SyncId::Okay, "OKAY"},
            {SyncId::Fail, "FAIL"},
            {SyncId::Quit, "QUIT"},
        }};

        constexpr std::uint32_t kFileTypeMask = 0170000;
        constexpr std::uint32_t kDirectoryType = 0040000;
        constexpr std::uint32_t kRegularType = 0100000;
    } // namespace

    std::string_view to_string(SyncId id) noexcept
    {
        for (const auto &mapping : kSyncIdMappings)
        {
            if (mapping.id == id)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<SyncId> sync_id_from_wire(std::uint32_t value) noexcept
    {
        for (const auto &mapping : kSyncIdMappings)
        {
            if (static_cast<std::uint32_t>(mapping.id) == value)
            {
                return mapping.id;
            }
        }
        return std::nullopt;
    }

    void append_sync_header(Bytes &out, SyncId id, std::uint32_t length)
    {
        append_u32_le(out, static_cast<std::uint32_t>(id));
        append_u32_le(out, length);
    }

    void append_sync_packet(Bytes &out, SyncId id, std::span<const std::uint8_t> data)
    {
        append_sync_header(out, id, static_cast<std::uint32_t>(data.size()));
        out.insert(out.end(), data.begin(), data.end());
    }

    std::string make_send_target(std::string_view remote_path, std::uint32_t mode)
    {
        std::string target(remote_path);
        target.push_back(',');
        target.append(std::to_string(mode));
        return target;
    }

    bool DeviceFile::is_directory() const noexcept
    {
        return (mode & kFileTypeMask) == kDirectoryType;
    }

    bool DeviceFile::is_regular_file() const noexcept
    {
        return (mode & kFileTypeMask) == kRegularType;
    }

    void to_json(nlohmann::json &json, const DeviceFile &file)
    {
        json = {
            {"name", file.name},
            {"mode", file.mode},
            {"size", file.size},
            {"mtime", file.mtime},
        };
    }

    void from_json(const nlohmann::json &json, DeviceFile &file)
    {
        json.at("name").get_to(file.name);
        file.mode = json.value("mode", 0U);
        file.size = json.value("size", 0U);
        file.mtime = json.value("mtime", 0U);
    }

} // namespace miniadb::protocol
