#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "miniadb/client/key_store.hpp"
#include "miniadb/client/logger.hpp"
#include "miniadb/message.hpp"

namespace miniadb::client
{

    enum class ConnectionState : std::uint8_t
    {
        Disconnected,
        AwaitingAuth,
        AwaitingSignature,
        Connected
    };

    std::string_view to_string(ConnectionState state) noexcept;

    // Device banner "<state>::<key>=<value>;..." split into its parts.
    struct DeviceInfo
    {
        std::string state;
        std::map<std::string, std::string> properties;
        std::vector<std::string> features;
    };

    DeviceInfo parse_banner(std::string_view banner);

    struct HandshakeOptions
    {
        std::string banner;
        std::uint32_t max_payload{protocol::kLegacyMaxPayload};
        bool accept_unauthenticated{true};
    };

    // Host side of the CNXN/AUTH exchange. Pure: it consumes inbound messages
    // and hands back the reply to send, the caller owns the wire.
    class ConnectionStateMachine
    {
    public:
        ConnectionStateMachine(HandshakeOptions options, KeyStore keys, Logger logger);

        // Disconnected -> AwaitingAuth; returns the CNXN to send.
        protocol::Message start();

        // Throws ConnectionError when the device cannot be satisfied.
        std::optional<protocol::Message> on_message(const protocol::Message &message);

        void reset() noexcept;

        ConnectionState state() const noexcept { return state_; }
        std::uint32_t max_payload() const noexcept { return max_payload_; }
        const std::string &banner() const noexcept { return banner_; }
        bool auth_key_offered() const noexcept { return auth_key_offered_; }
        std::size_t signatures_sent() const noexcept { return signatures_sent_; }

    private:
        std::optional<protocol::Message> on_connect(const protocol::Message &message);
        protocol::Message on_token(const protocol::Message &message);

        HandshakeOptions options_;
        KeyStore keys_;
        Logger logger_;
        ConnectionState state_{ConnectionState::Disconnected};
        std::uint32_t max_payload_{protocol::kLegacyMaxPayload};
        std::string banner_;
        bool auth_key_offered_{false};
        bool all_signers_tried_{false};
        std::size_t next_signer_{0};
        std::size_t signatures_sent_{0};
    };

} // namespace miniadb::client
