#include "miniadb/client/config.hpp"

#include <array>
#include <fstream>
#include <stdexcept>
#include <string>

#include <unistd.h>

namespace miniadb::client
{

    namespace
    {
        constexpr std::uint32_t kMinPayload = 256;

        std::chrono::milliseconds read_millis(const nlohmann::json &json, const char *key,
                                              std::chrono::milliseconds fallback)
        {
            if (!json.contains(key))
            {
                return fallback;
            }
            const auto value = json.at(key).get<std::int64_t>();
            if (value <= 0)
            {
                throw std::invalid_argument(std::string(key) + " must be positive");
            }
            return std::chrono::milliseconds{value};
        }
    } // namespace

    std::string default_banner()
    {
        std::array<char, 256> name{};
        if (::gethostname(name.data(), name.size() - 1) != 0 || name[0] == '\0')
        {
            return "miniadb";
        }
        return std::string(name.data());
    }

    ClientConfig config_from_json(const nlohmann::json &json)
    {
        if (!json.is_object())
        {
            throw std::invalid_argument("client configuration must be a JSON object");
        }

        ClientConfig config;
        try
        {
            config.banner = json.value("banner", config.banner);
            config.max_payload = json.value("max_payload", config.max_payload);
            config.handshake_timeout = read_millis(json, "handshake_timeout_ms", config.handshake_timeout);
            config.auth_timeout = read_millis(json, "auth_timeout_ms", config.auth_timeout);
            config.stream_timeout = read_millis(json, "stream_timeout_ms", config.stream_timeout);
            config.accept_unauthenticated = json.value("accept_unauthenticated", config.accept_unauthenticated);
            if (auto it = json.find("log_file"); it != json.end() && !it->is_null())
            {
                config.log_path = std::filesystem::path(it->get<std::string>());
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::invalid_argument(std::string("invalid client configuration: ") + ex.what());
        }

        if (config.max_payload < kMinPayload || config.max_payload > protocol::kMaxPayload)
        {
            throw std::invalid_argument("max_payload must be between " + std::to_string(kMinPayload) + " and " +
                                        std::to_string(protocol::kMaxPayload));
        }
        return config;
    }

    void to_json(nlohmann::json &json, const ClientConfig &config)
    {
        json = {
            {"banner", config.banner},
            {"max_payload", config.max_payload},
            {"handshake_timeout_ms", config.handshake_timeout.count()},
            {"auth_timeout_ms", config.auth_timeout.count()},
            {"stream_timeout_ms", config.stream_timeout.count()},
            {"accept_unauthenticated", config.accept_unauthenticated},
        };
        if (config.log_path)
        {
            json["log_file"] = config.log_path->string();
        }
    }

    ClientConfig load_config(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Failed to open client configuration: " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw std::invalid_argument("Malformed client configuration " + path.string() + ": " + ex.what());
        }
        return config_from_json(json);
    }

} // namespace miniadb::client
