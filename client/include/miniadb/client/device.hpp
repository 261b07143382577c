#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <stop_token>
#include <string>
#include <vector>

#include "miniadb/client/config.hpp"
#include "miniadb/client/connection.hpp"
#include "miniadb/client/filesync.hpp"
#include "miniadb/client/key_store.hpp"
#include "miniadb/client/logger.hpp"
#include "miniadb/client/stream.hpp"
#include "miniadb/client/transport.hpp"
#include "miniadb/sync_protocol.hpp"

namespace miniadb::client
{

    struct InstallOptions
    {
        std::string destination_dir{"/data/local/tmp/"};
        bool replace_existing{true};
        bool grant_permissions{false};
    };

    // Everyday device operations on top of one connection. Each call opens
    // its own stream, so independent calls may run from different threads.
    class Device
    {
    public:
        Device(std::shared_ptr<Transport> transport, ClientConfig config, KeyStore keys, Logger logger);

        void connect(std::stop_token stop = {});
        void close() noexcept;

        Connection &connection() noexcept { return connection_; }
        DeviceInfo info() const { return connection_.device_info(); }

        std::string shell(const std::string &command);
        std::string shell(const std::string &command, std::chrono::milliseconds timeout, std::stop_token stop = {});
        void streaming_shell(const std::string &command, const Stream::ChunkCallback &on_chunk,
                             std::chrono::milliseconds timeout, std::stop_token stop = {});
        void logcat(const std::string &options, const Stream::ChunkCallback &on_chunk,
                    std::chrono::milliseconds timeout, std::stop_token stop = {});

        // The device drops the link while rebooting; nothing is read back.
        void reboot(const std::string &target = {});
        void reboot_bootloader();
        std::string remount();
        std::string root();
        std::string enable_verity();
        std::string disable_verity();

        // Directories are created with mkdir and pushed entry by entry.
        std::vector<TransferReport> push(const std::filesystem::path &local_path, const std::string &remote_path,
                                         std::optional<std::uint32_t> mode = std::nullopt, std::uint32_t mtime = 0,
                                         const ProgressCallback &progress = {});
        TransferReport push(std::istream &source, const std::string &remote_path,
                            std::uint32_t mode = protocol::kDefaultPushMode, std::uint32_t mtime = 0,
                            const ProgressCallback &progress = {});

        TransferReport pull(const std::string &remote_path, const std::filesystem::path &local_path,
                            const ProgressCallback &progress = {});
        TransferReport pull(const std::string &remote_path, std::ostream &sink, const ProgressCallback &progress = {});

        std::optional<protocol::DeviceFile> stat(const std::string &remote_path);
        std::vector<protocol::DeviceFile> list(const std::string &remote_path);

        // Returns the output of pm install.
        std::string install(const std::filesystem::path &apk_path, const InstallOptions &options = {},
                            const ProgressCallback &progress = {});
        std::string uninstall(const std::string &package, bool keep_data = false);

    private:
        std::string service(const std::string &destination, std::chrono::milliseconds timeout,
                            std::stop_token stop = {});

        template <typename Operation>
        auto with_sync(Operation &&operation);

        void push_tree(const std::filesystem::path &local_path, const std::string &remote_path,
                       std::optional<std::uint32_t> mode, std::uint32_t mtime, const ProgressCallback &progress,
                       std::vector<TransferReport> &reports);

        ClientConfig config_;
        Logger logger_;
        Connection connection_;
    };

} // namespace miniadb::client
