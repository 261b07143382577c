#include "miniadb/message.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <numeric>

#include "miniadb/errors.hpp"

namespace miniadb::protocol
{

    namespace
    {
        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 7> kCommandMappings{{
            {Command::Sync, "SYNC"},
            {Command::Cnxn, "CNXN"},
            {Command::Auth, "AUTH"},
            {Command::Open, "OPEN"},
            {Command::Okay, "OKAY"},
            {Command::Clse, "CLSE"},
            {Command::Wrte, "WRTE"},
        }};

        MessageHeader make_header(std::uint32_t command, std::uint32_t arg0, std::uint32_t arg1,
                                  std::span<const std::uint8_t> payload)
        {
            return MessageHeader{
                .command = command,
                .arg0 = arg0,
                .arg1 = arg1,
                .data_length = static_cast<std::uint32_t>(payload.size()),
                .data_checksum = checksum(payload),
                .magic = command ^ 0xFFFFFFFFu,
            };
        }
    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_wire(std::uint32_t value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (static_cast<std::uint32_t>(mapping.command) == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string describe_command(std::uint32_t value)
    {
        if (auto command = command_from_wire(value))
        {
            return std::string(to_string(*command));
        }
        std::string tag;
        bool printable = true;
        for (int shift = 0; shift < 32; shift += 8)
        {
            const auto ch = static_cast<unsigned char>((value >> shift) & 0xFF);
            printable = printable && std::isprint(ch) != 0;
            tag.push_back(static_cast<char>(ch));
        }
        std::array<char, 11> hex{};
        std::snprintf(hex.data(), hex.size(), "0x%08x", value);
        return printable ? tag + " (" + hex.data() + ")" : std::string(hex.data());
    }

    std::uint32_t checksum(std::span<const std::uint8_t> payload) noexcept
    {
        return std::accumulate(payload.begin(), payload.end(), std::uint32_t{0},
                               [](std::uint32_t sum, std::uint8_t byte)
                               { return sum + byte; });
    }

    Bytes encode_message(Command command, std::uint32_t arg0, std::uint32_t arg1,
                         std::span<const std::uint8_t> payload)
    {
        if (payload.size() > kMaxPayload)
        {
            throw std::length_error("ADB payload exceeds " + std::to_string(kMaxPayload) + " bytes");
        }
        const auto header = make_header(static_cast<std::uint32_t>(command), arg0, arg1, payload);
        Bytes frame;
        frame.reserve(kHeaderSize + payload.size());
        append_u32_le(frame, header.command);
        append_u32_le(frame, header.arg0);
        append_u32_le(frame, header.arg1);
        append_u32_le(frame, header.data_length);
        append_u32_le(frame, header.data_checksum);
        append_u32_le(frame, header.magic);
        frame.insert(frame.end(), payload.begin(), payload.end());
        return frame;
    }

    Bytes encode_message(const Message &message)
    {
        return encode_message(message.command, message.arg0, message.arg1, message.payload);
    }

    MessageHeader decode_header(std::span<const std::uint8_t> buffer)
    {
        if (buffer.size() < kHeaderSize)
        {
            throw ProtocolError(ProtocolFault::Truncated, 0, 0, 0,
                                "header needs " + std::to_string(kHeaderSize) + " bytes, got " +
                                    std::to_string(buffer.size()));
        }
        MessageHeader header{
            .command = read_u32_le(buffer, 0),
            .arg0 = read_u32_le(buffer, 4),
            .arg1 = read_u32_le(buffer, 8),
            .data_length = read_u32_le(buffer, 12),
            .data_checksum = read_u32_le(buffer, 16),
            .magic = read_u32_le(buffer, 20),
        };
        if (header.magic != (header.command ^ 0xFFFFFFFFu))
        {
            throw ProtocolError(ProtocolFault::InvalidMagic, header.command, header.arg0, header.arg1,
                                "magic " + std::to_string(header.magic) + " is not the complement of the command");
        }
        if (!command_from_wire(header.command))
        {
            throw ProtocolError(ProtocolFault::UnknownCommand, header.command, header.arg0, header.arg1,
                                "unrecognised command word");
        }
        return header;
    }

    void verify_payload(const MessageHeader &header, std::span<const std::uint8_t> payload)
    {
        if (payload.size() < header.data_length)
        {
            throw ProtocolError(ProtocolFault::Truncated, header.command, header.arg0, header.arg1,
                                "declared " + std::to_string(header.data_length) + " payload bytes, got " +
                                    std::to_string(payload.size()));
        }
        const auto actual = checksum(payload.first(header.data_length));
        if (actual != header.data_checksum)
        {
            throw ProtocolError(ProtocolFault::ChecksumMismatch, header.command, header.arg0, header.arg1,
                                "received checksum " + std::to_string(header.data_checksum) + " != computed " +
                                    std::to_string(actual));
        }
    }

    Message decode_message(std::span<const std::uint8_t> buffer)
    {
        const auto header = decode_header(buffer);
        const auto payload = buffer.subspan(kHeaderSize);
        verify_payload(header, payload);
        const auto body = payload.first(header.data_length);
        return Message{
            .command = static_cast<Command>(header.command),
            .arg0 = header.arg0,
            .arg1 = header.arg1,
            .payload = Bytes(body.begin(), body.end()),
        };
    }

    Bytes to_bytes(std::string_view text)
    {
        return Bytes(text.begin(), text.end());
    }

    Bytes to_cstring_bytes(std::string_view text)
    {
        auto bytes = to_bytes(text);
        bytes.push_back(0);
        return bytes;
    }

} // namespace miniadb::protocol
