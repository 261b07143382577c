/**
 * MiniADB - Error kinds for each protocol layer.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace miniadb
{

    enum class ProtocolFault : std::uint8_t
    {
        InvalidMagic = 0,
        ChecksumMismatch = 1,
        Truncated = 2,
        UnknownCommand = 3,
        OversizedPayload = 4
    };

    enum class ConnectionFault : std::uint8_t
    {
        TransportLost = 0,
        AuthRequired = 1,
        AuthPolicyViolation = 2,
        UnexpectedResponse = 3,
        Timeout = 4,
        Cancelled = 5,
        NotConnected = 6
    };

    enum class StreamFault : std::uint8_t
    {
        Rejected = 0,
        Timeout = 1,
        Cancelled = 2,
        Closed = 3
    };

    enum class TransferFault : std::uint8_t
    {
        ShortWrite = 0,
        Incomplete = 1,
        UnexpectedResponse = 2,
        PathTooLong = 3,
        PushFailed = 4,
        PullFailed = 5
    };

    std::string_view to_string(ProtocolFault fault) noexcept;
    std::string_view to_string(ConnectionFault fault) noexcept;
    std::string_view to_string(StreamFault fault) noexcept;
    std::string_view to_string(TransferFault fault) noexcept;

} // namespace miniadb
