#include "miniadb/client/device.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>

#include "miniadb/version.hpp"

namespace miniadb::client
{

    namespace
    {
        // Single-quoted for the device shell; embedded quotes become '\''.
        std::string shell_quote(const std::string &text)
        {
            std::string quoted = "'";
            for (const char c : text)
            {
                if (c == '\'')
                {
                    quoted += "'\\''";
                }
                else
                {
                    quoted += c;
                }
            }
            quoted += '\'';
            return quoted;
        }

        std::string join_remote(const std::string &directory, const std::string &name)
        {
            if (directory.empty() || directory.back() == '/')
            {
                return directory + name;
            }
            return directory + "/" + name;
        }

        std::string to_text(const protocol::Bytes &bytes)
        {
            return std::string(bytes.begin(), bytes.end());
        }
    } // namespace

    template <typename Operation>
    auto Device::with_sync(Operation &&operation)
    {
        auto stream = connection_.open("sync:");
        FileSync sync(stream, logger_);
        auto result = operation(sync);
        sync.quit();
        stream.close();
        return result;
    }

    Device::Device(std::shared_ptr<Transport> transport, ClientConfig config, KeyStore keys, Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          connection_(std::move(transport), config_, std::move(keys), logger_)
    {
    }

    void Device::connect(std::stop_token stop)
    {
        logger_.log("device", "miniadb ", version(), " connecting");
        connection_.connect(std::move(stop));
        const auto info = connection_.device_info();
        logger_.log("device", "device state=", info.state, ", features=", info.features.size());
    }

    void Device::close() noexcept
    {
        connection_.close();
    }

    std::string Device::shell(const std::string &command)
    {
        return shell(command, config_.stream_timeout);
    }

    std::string Device::shell(const std::string &command, std::chrono::milliseconds timeout, std::stop_token stop)
    {
        return service("shell:" + command, timeout, std::move(stop));
    }

    void Device::streaming_shell(const std::string &command, const Stream::ChunkCallback &on_chunk,
                                 std::chrono::milliseconds timeout, std::stop_token stop)
    {
        const auto deadline = deadline_after(timeout);
        auto stream = connection_.open("shell:" + command, deadline, stop);
        stream.read_until_close(on_chunk, deadline, std::move(stop));
    }

    void Device::logcat(const std::string &options, const Stream::ChunkCallback &on_chunk,
                        std::chrono::milliseconds timeout, std::stop_token stop)
    {
        streaming_shell("logcat " + options, on_chunk, timeout, std::move(stop));
    }

    void Device::reboot(const std::string &target)
    {
        logger_.log("device", "reboot ", target.empty() ? "system" : target);
        auto stream = connection_.open("reboot:" + target);
        stream.close();
    }

    void Device::reboot_bootloader()
    {
        reboot("bootloader");
    }

    std::string Device::remount()
    {
        return service("remount:", config_.stream_timeout);
    }

    std::string Device::root()
    {
        return service("root:", config_.stream_timeout);
    }

    std::string Device::enable_verity()
    {
        return service("enable-verity:", config_.stream_timeout);
    }

    std::string Device::disable_verity()
    {
        return service("disable-verity:", config_.stream_timeout);
    }

    std::vector<TransferReport> Device::push(const std::filesystem::path &local_path, const std::string &remote_path,
                                             std::optional<std::uint32_t> mode, std::uint32_t mtime,
                                             const ProgressCallback &progress)
    {
        std::vector<TransferReport> reports;
        push_tree(local_path, remote_path, mode, mtime, progress, reports);
        return reports;
    }

    TransferReport Device::push(std::istream &source, const std::string &remote_path, std::uint32_t mode,
                                std::uint32_t mtime, const ProgressCallback &progress)
    {
        return with_sync([&](FileSync &sync)
                         { return sync.push(source, remote_path, mode, mtime, progress); });
    }

    TransferReport Device::pull(const std::string &remote_path, const std::filesystem::path &local_path,
                                const ProgressCallback &progress)
    {
        std::ofstream sink(local_path, std::ios::binary | std::ios::trunc);
        if (!sink)
        {
            throw std::filesystem::filesystem_error("cannot open local file for writing", local_path,
                                                    std::make_error_code(std::errc::io_error));
        }
        try
        {
            return pull(remote_path, sink, progress);
        }
        catch (const std::exception &ex)
        {
            sink.close();
            std::error_code ec;
            std::filesystem::remove(local_path, ec);
            logger_.warn("device", "removed partial ", local_path.string(), ": ", ex.what());
            throw;
        }
    }

    TransferReport Device::pull(const std::string &remote_path, std::ostream &sink, const ProgressCallback &progress)
    {
        return with_sync([&](FileSync &sync)
                         { return sync.pull(remote_path, sink, progress); });
    }

    std::optional<protocol::DeviceFile> Device::stat(const std::string &remote_path)
    {
        return with_sync([&](FileSync &sync)
                         { return sync.stat(remote_path); });
    }

    std::vector<protocol::DeviceFile> Device::list(const std::string &remote_path)
    {
        return with_sync([&](FileSync &sync)
                         { return sync.list(remote_path); });
    }

    std::string Device::install(const std::filesystem::path &apk_path, const InstallOptions &options,
                                const ProgressCallback &progress)
    {
        const auto destination_dir = options.destination_dir.empty() ? InstallOptions{}.destination_dir
                                                                      : options.destination_dir;
        const auto remote_path = join_remote(destination_dir, apk_path.filename().string());
        push(apk_path, remote_path, std::nullopt, 0, progress);

        std::string command = "pm install";
        if (options.grant_permissions)
        {
            command += " -g";
        }
        if (options.replace_existing)
        {
            command += " -r";
        }
        command += " " + shell_quote(remote_path);
        auto output = shell(command);
        shell("rm " + shell_quote(remote_path));
        logger_.log("device", "installed ", apk_path.filename().string());
        return output;
    }

    std::string Device::uninstall(const std::string &package, bool keep_data)
    {
        std::string command = "pm uninstall";
        if (keep_data)
        {
            command += " -k";
        }
        command += " " + shell_quote(package);
        return shell(command);
    }

    std::string Device::service(const std::string &destination, std::chrono::milliseconds timeout,
                                std::stop_token stop)
    {
        const auto deadline = deadline_after(timeout);
        auto stream = connection_.open(destination, deadline, stop);
        return to_text(stream.read_until_close(deadline, std::move(stop)));
    }

    void Device::push_tree(const std::filesystem::path &local_path, const std::string &remote_path,
                           std::optional<std::uint32_t> mode, std::uint32_t mtime, const ProgressCallback &progress,
                           std::vector<TransferReport> &reports)
    {
        if (std::filesystem::is_directory(local_path))
        {
            shell("mkdir " + shell_quote(remote_path));
            std::vector<std::filesystem::path> entries;
            for (const auto &entry : std::filesystem::directory_iterator(local_path))
            {
                entries.push_back(entry.path());
            }
            std::sort(entries.begin(), entries.end());
            for (const auto &entry : entries)
            {
                push_tree(entry, join_remote(remote_path, entry.filename().string()), mode, mtime, progress, reports);
            }
            return;
        }

        std::ifstream source(local_path, std::ios::binary);
        if (!source)
        {
            throw std::filesystem::filesystem_error("cannot open local file", local_path,
                                                    std::make_error_code(std::errc::no_such_file_or_directory));
        }
        reports.push_back(push(source, remote_path, mode.value_or(protocol::kDefaultPushMode), mtime, progress));
    }

} // namespace miniadb::client
