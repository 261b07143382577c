#include "miniadb/error_codes.hpp"

#include <array>

namespace miniadb
{

    namespace
    {
        template <typename Fault>
        struct FaultDescription
        {
            Fault fault;
            std::string_view description;
        };

        constexpr std::array<FaultDescription<ProtocolFault>, 5> kProtocolDescriptions{{
            {ProtocolFault::InvalidMagic, "invalid_magic"},
            {ProtocolFault::ChecksumMismatch, "checksum_mismatch"},
            {ProtocolFault::Truncated, "truncated"},
            {ProtocolFault::UnknownCommand, "unknown_command"},
            {ProtocolFault::OversizedPayload, "oversized_payload"},
        }};

        constexpr std::array<FaultDescription<ConnectionFault>, 7> kConnectionDescriptions{{
            {ConnectionFault::TransportLost, "transport_lost"},
            {ConnectionFault::AuthRequired, "auth_required"},
            {ConnectionFault::AuthPolicyViolation, "auth_policy_violation"},
            {ConnectionFault::UnexpectedResponse, "unexpected_response"},
            {ConnectionFault::Timeout, "timeout"},
            {ConnectionFault::Cancelled, "cancelled"},
            {ConnectionFault::NotConnected, "not_connected"},
        }};

        constexpr std::array<FaultDescription<StreamFault>, 4> kStreamDescriptions{{
            {StreamFault::Rejected, "rejected"},
            {StreamFault::Timeout, "timeout"},
            {StreamFault::Cancelled, "cancelled"},
            {StreamFault::Closed, "closed"},
        }};

        constexpr std::array<FaultDescription<TransferFault>, 6> kTransferDescriptions{{
            {TransferFault::ShortWrite, "short_write"},
            {TransferFault::Incomplete, "incomplete"},
            {TransferFault::UnexpectedResponse, "unexpected_response"},
            {TransferFault::PathTooLong, "path_too_long"},
            {TransferFault::PushFailed, "push_failed"},
            {TransferFault::PullFailed, "pull_failed"},
        }};

        template <typename Fault, std::size_t N>
        std::string_view describe(const std::array<FaultDescription<Fault>, N> &table, Fault fault) noexcept
        {
            for (const auto &entry : table)
            {
                if (entry.fault == fault)
                {
                    return entry.description;
                }
            }
            return "unknown";
        }
    } // namespace

    std::string_view to_string(ProtocolFault fault) noexcept
    {
        return describe(kProtocolDescriptions, fault);
    }

    std::string_view to_string(ConnectionFault fault) noexcept
    {
        return describe(kConnectionDescriptions, fault);
    }

    std::string_view to_string(StreamFault fault) noexcept
    {
        return describe(kStreamDescriptions, fault);
    }

    std::string_view to_string(TransferFault fault) noexcept
    {
        return describe(kTransferDescriptions, fault);
    }

} // namespace miniadb
