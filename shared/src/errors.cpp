#include "miniadb/errors.hpp"

#include <utility>

#include "miniadb/message.hpp"

namespace miniadb
{

    namespace
    {
        std::string format_message(std::string_view layer, std::string_view kind, const std::string &detail)
        {
            std::string message;
            message.reserve(layer.size() + kind.size() + detail.size() + 6);
            message.append("[").append(layer).append("] ").append(kind);
            if (!detail.empty())
            {
                message.append(": ").append(detail);
            }
            return message;
        }

        std::string framing_detail(const std::string &detail, std::uint32_t command, std::uint32_t arg0,
                                   std::uint32_t arg1)
        {
            return detail + " (command=" + protocol::describe_command(command) + " arg0=" + std::to_string(arg0) +
                   " arg1=" + std::to_string(arg1) + ")";
        }
    } // namespace

    AdbError::AdbError(std::string_view layer, const std::string &message)
        : std::runtime_error(message), layer_(layer)
    {
    }

    TransportError::TransportError(const std::string &message)
        : AdbError("transport", format_message("transport", "io_error", message))
    {
    }

    ProtocolError::ProtocolError(ProtocolFault kind, std::uint32_t command, std::uint32_t arg0, std::uint32_t arg1,
                                 const std::string &detail)
        : AdbError("protocol", format_message("protocol", to_string(kind), framing_detail(detail, command, arg0, arg1))),
          kind_(kind),
          command_(command),
          arg0_(arg0),
          arg1_(arg1)
    {
    }

    ConnectionError::ConnectionError(ConnectionFault kind, const std::string &detail)
        : AdbError("connection", format_message("connection", to_string(kind), detail)), kind_(kind)
    {
    }

    StreamError::StreamError(StreamFault kind, std::uint32_t local_id, const std::string &detail)
        : AdbError("stream", format_message("stream", to_string(kind),
                                            "local_id=" + std::to_string(local_id) + (detail.empty() ? "" : " " + detail))),
          kind_(kind),
          local_id_(local_id)
    {
    }

    TransferError::TransferError(TransferFault kind, std::string remote_path, const std::string &detail)
        : AdbError("filesync", format_message("filesync", to_string(kind), remote_path + ": " + detail)),
          kind_(kind),
          remote_path_(std::move(remote_path))
    {
    }

    PushFailedError::PushFailedError(std::string remote_path, std::string device_message)
        : TransferError(TransferFault::PushFailed, std::move(remote_path), "device said: " + device_message),
          device_message_(std::move(device_message))
    {
    }

    PullFailedError::PullFailedError(std::string remote_path, std::string device_message)
        : TransferError(TransferFault::PullFailed, std::move(remote_path), "device said: " + device_message),
          device_message_(std::move(device_message))
    {
    }

} // namespace miniadb
