/**
 * MiniADB - Little-endian word helpers shared by the ADB and filesync codecs.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace miniadb::protocol
{

    inline std::uint32_t read_u32_le(std::span<const std::uint8_t> buffer, std::size_t offset = 0)
    {
        return static_cast<std::uint32_t>(buffer[offset]) |
               (static_cast<std::uint32_t>(buffer[offset + 1]) << 8) |
               (static_cast<std::uint32_t>(buffer[offset + 2]) << 16) |
               (static_cast<std::uint32_t>(buffer[offset + 3]) << 24);
    }

    inline void append_u32_le(std::vector<std::uint8_t> &out, std::uint32_t value)
    {
        out.push_back(static_cast<std::uint8_t>(value & 0xFF));
        out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
        out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
        out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
    }

    // Packs a four character ASCII tag the way adbd does: first character in the low byte.
    constexpr std::uint32_t make_tag(const char (&tag)[5]) noexcept
    {
        return static_cast<std::uint32_t>(static_cast<unsigned char>(tag[0])) |
               (static_cast<std::uint32_t>(static_cast<unsigned char>(tag[1])) << 8) |
               (static_cast<std::uint32_t>(static_cast<unsigned char>(tag[2])) << 16) |
               (static_cast<std::uint32_t>(static_cast<unsigned char>(tag[3])) << 24);
    }

} // namespace miniadb::protocol
