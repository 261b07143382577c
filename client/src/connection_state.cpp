#include "miniadb/client/connection_state.hpp"

#include <algorithm>
#include <utility>

#include "miniadb/errors.hpp"

namespace miniadb::client
{

    namespace
    {
        std::string payload_text(const protocol::Bytes &payload)
        {
            std::string text(payload.begin(), payload.end());
            while (!text.empty() && text.back() == '\0')
            {
                text.pop_back();
            }
            return text;
        }

        std::vector<std::string> split(std::string_view input, char separator)
        {
            std::vector<std::string> parts;
            std::size_t start = 0;
            while (start <= input.size())
            {
                const auto end = input.find(separator, start);
                const auto part = input.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
                if (!part.empty())
                {
                    parts.emplace_back(part);
                }
                if (end == std::string_view::npos)
                {
                    break;
                }
                start = end + 1;
            }
            return parts;
        }
    } // namespace

    std::string_view to_string(ConnectionState state) noexcept
    {
        switch (state)
        {
        case ConnectionState::Disconnected:
            return "disconnected";
        case ConnectionState::AwaitingAuth:
            return "awaiting_auth";
        case ConnectionState::AwaitingSignature:
            return "awaiting_signature";
        case ConnectionState::Connected:
            return "connected";
        }
        return "unknown";
    }

    DeviceInfo parse_banner(std::string_view banner)
    {
        DeviceInfo info;
        const auto state_end = banner.find(':');
        info.state = std::string(banner.substr(0, state_end));
        const auto props_begin = banner.find("::");
        if (props_begin == std::string_view::npos)
        {
            return info;
        }
        for (const auto &entry : split(banner.substr(props_begin + 2), ';'))
        {
            const auto eq = entry.find('=');
            if (eq == std::string::npos)
            {
                continue;
            }
            info.properties[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
        if (auto it = info.properties.find("features"); it != info.properties.end())
        {
            info.features = split(it->second, ',');
        }
        return info;
    }

    ConnectionStateMachine::ConnectionStateMachine(HandshakeOptions options, KeyStore keys, Logger logger)
        : options_(std::move(options)), keys_(std::move(keys)), logger_(std::move(logger))
    {
    }

    protocol::Message ConnectionStateMachine::start()
    {
        reset();
        state_ = ConnectionState::AwaitingAuth;
        logger_.debug("handshake", "sending CNXN, host max_payload=", options_.max_payload);
        return protocol::Message{
            .command = protocol::Command::Cnxn,
            .arg0 = protocol::kVersion,
            .arg1 = options_.max_payload,
            .payload = protocol::to_cstring_bytes("host::" + options_.banner),
        };
    }

    std::optional<protocol::Message> ConnectionStateMachine::on_message(const protocol::Message &message)
    {
        switch (message.command)
        {
        case protocol::Command::Cnxn:
            return on_connect(message);
        case protocol::Command::Auth:
            if (state_ != ConnectionState::AwaitingAuth && state_ != ConnectionState::AwaitingSignature)
            {
                logger_.warn("handshake", "ignoring AUTH in state ", to_string(state_));
                return std::nullopt;
            }
            return on_token(message);
        default:
            logger_.warn("handshake", "ignoring ", protocol::to_string(message.command), " in state ",
                         to_string(state_));
            return std::nullopt;
        }
    }

    std::optional<protocol::Message> ConnectionStateMachine::on_connect(const protocol::Message &message)
    {
        if (state_ == ConnectionState::Disconnected || state_ == ConnectionState::Connected)
        {
            logger_.warn("handshake", "ignoring CNXN in state ", to_string(state_));
            return std::nullopt;
        }
        if (state_ == ConnectionState::AwaitingAuth && !options_.accept_unauthenticated)
        {
            throw ConnectionError(ConnectionFault::AuthPolicyViolation,
                                  "device accepted the connection without authentication");
        }

        const auto device_payload = message.arg1 == 0 ? protocol::kLegacyMaxPayload : message.arg1;
        max_payload_ = std::min(options_.max_payload, device_payload);
        banner_ = payload_text(message.payload);
        const bool authenticated = state_ == ConnectionState::AwaitingSignature;
        state_ = ConnectionState::Connected;
        logger_.log("handshake", "connected (", authenticated ? "authenticated" : "unauthenticated",
                    ") max_payload=", max_payload_, " banner=", banner_);
        return std::nullopt;
    }

    protocol::Message ConnectionStateMachine::on_token(const protocol::Message &message)
    {
        if (message.arg0 != static_cast<std::uint32_t>(protocol::AuthType::Token))
        {
            throw ConnectionError(ConnectionFault::UnexpectedResponse,
                                  "unknown AUTH type " + std::to_string(message.arg0));
        }
        if (keys_.empty())
        {
            throw ConnectionError(ConnectionFault::AuthRequired, "device requires authentication, no keys available");
        }
        state_ = ConnectionState::AwaitingSignature;

        if (all_signers_tried_ && !auth_key_offered_)
        {
            auth_key_offered_ = true;
            logger_.log("handshake", "no key accepted, offering public key; confirm on the device");
            auto key = keys_.at(0).public_key();
            key.push_back(0);
            return protocol::Message{
                .command = protocol::Command::Auth,
                .arg0 = static_cast<std::uint32_t>(protocol::AuthType::RsaPublicKey),
                .arg1 = 0,
                .payload = std::move(key),
            };
        }

        const auto &signer = keys_.at(next_signer_);
        next_signer_ = (next_signer_ + 1) % keys_.size();
        if (next_signer_ == 0)
        {
            all_signers_tried_ = true;
        }
        ++signatures_sent_;
        logger_.debug("handshake", "answering AUTH token #", signatures_sent_);
        return protocol::Message{
            .command = protocol::Command::Auth,
            .arg0 = static_cast<std::uint32_t>(protocol::AuthType::Signature),
            .arg1 = 0,
            .payload = signer.sign(message.payload),
        };
    }

    void ConnectionStateMachine::reset() noexcept
    {
        state_ = ConnectionState::Disconnected;
        max_payload_ = protocol::kLegacyMaxPayload;
        banner_.clear();
        auth_key_offered_ = false;
        all_signers_tried_ = false;
        next_signer_ = 0;
        signatures_sent_ = 0;
    }

} // namespace miniadb::client
