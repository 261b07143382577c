/**
 * MiniADB - ADB message framing: the 24-byte header and its payload.
 *
 * Wire layout (all fields little-endian u32):
 *   command | arg0 | arg1 | data_length | data_checksum | magic
 * followed by data_length payload bytes. magic is ~command and data_checksum
 * is the byte sum of the payload modulo 2^32.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "miniadb/byte_order.hpp"

namespace miniadb::protocol
{

    using Bytes = std::vector<std::uint8_t>;

    enum class Command : std::uint32_t
    {
        Sync = make_tag("SYNC"),
        Cnxn = make_tag("CNXN"),
        Auth = make_tag("AUTH"),
        Open = make_tag("OPEN"),
        Okay = make_tag("OKAY"),
        Clse = make_tag("CLSE"),
        Wrte = make_tag("WRTE")
    };

    enum class AuthType : std::uint32_t
    {
        Token = 1,
        Signature = 2,
        RsaPublicKey = 3
    };

    constexpr std::uint32_t kVersion = 0x01000000;
    constexpr std::uint32_t kLegacyMaxPayload = 4096;
    constexpr std::uint32_t kMaxPayload = 1024 * 1024;
    constexpr std::size_t kHeaderSize = 24;

    struct MessageHeader
    {
        std::uint32_t command{};
        std::uint32_t arg0{};
        std::uint32_t arg1{};
        std::uint32_t data_length{};
        std::uint32_t data_checksum{};
        std::uint32_t magic{};
    };

    struct Message
    {
        Command command{Command::Okay};
        std::uint32_t arg0{};
        std::uint32_t arg1{};
        Bytes payload{};
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_wire(std::uint32_t value) noexcept;

    // Printable form of a raw command word, used in diagnostics for unknown tags too.
    std::string describe_command(std::uint32_t value);

    std::uint32_t checksum(std::span<const std::uint8_t> payload) noexcept;

    Bytes encode_message(Command command, std::uint32_t arg0, std::uint32_t arg1,
                         std::span<const std::uint8_t> payload = {});
    Bytes encode_message(const Message &message);

    // Validates magic and command; payload checks are left to verify_payload.
    MessageHeader decode_header(std::span<const std::uint8_t> buffer);

    void verify_payload(const MessageHeader &header, std::span<const std::uint8_t> payload);

    Message decode_message(std::span<const std::uint8_t> buffer);

    Bytes to_bytes(std::string_view text);

    // Service strings and banners are NUL terminated on the wire.
    Bytes to_cstring_bytes(std::string_view text);

} // namespace miniadb::protocol
