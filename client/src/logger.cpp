#include "miniadb/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <vector>

namespace miniadb::client
{

    Logger::Logger() : Logger(std::nullopt) {}

    Logger::Logger(const std::optional<std::filesystem::path> &path, spdlog::level::level_enum level)
    {
        try
        {
            std::vector<spdlog::sink_ptr> sinks;
            if (path)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), true));
            }
            else
            {
                sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
            }
            logger_ = std::make_shared<spdlog::logger>("miniadb", sinks.begin(), sinks.end());
            logger_->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
            logger_->set_level(level);
        }
        catch (const spdlog::spdlog_ex &)
        {
            // An unwritable log file disables logging rather than the client.
            logger_.reset();
        }
    }

    Logger::Logger(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

} // namespace miniadb::client
