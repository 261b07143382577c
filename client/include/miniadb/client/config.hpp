#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "miniadb/message.hpp"

namespace miniadb::client
{

    struct ClientConfig
    {
        // Sent as "host::<banner>"; empty means the local host name.
        std::string banner;
        std::uint32_t max_payload{protocol::kLegacyMaxPayload};
        std::chrono::milliseconds handshake_timeout{std::chrono::seconds{10}};
        // Extra wait once a public key has been offered and the device shows its dialog.
        std::chrono::milliseconds auth_timeout{std::chrono::seconds{30}};
        std::chrono::milliseconds stream_timeout{std::chrono::seconds{30}};
        bool accept_unauthenticated{true};
        std::optional<std::filesystem::path> log_path;
    };

    std::string default_banner();

    ClientConfig config_from_json(const nlohmann::json &json);

    void to_json(nlohmann::json &json, const ClientConfig &config);

    ClientConfig load_config(const std::filesystem::path &path);

} // namespace miniadb::client
