/**
 * MiniADB - Exception types for every layer of the stack.
 *
 * Each type maps to one propagation boundary:
 *  - ProtocolError and ConnectionError end the connection,
 *  - StreamError affects only the stream it names,
 *  - TransferError and its subclasses end one filesync operation.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "miniadb/error_codes.hpp"

namespace miniadb
{

    class AdbError : public std::runtime_error
    {
    public:
        AdbError(std::string_view layer, const std::string &message);

        std::string_view layer() const noexcept { return layer_; }

    private:
        std::string layer_;
    };

    // Thrown by Transport implementations; the connection reports it as TransportLost.
    class TransportError : public AdbError
    {
    public:
        explicit TransportError(const std::string &message);
    };

    class ProtocolError : public AdbError
    {
    public:
        ProtocolError(ProtocolFault kind, std::uint32_t command, std::uint32_t arg0, std::uint32_t arg1,
                      const std::string &detail);

        ProtocolFault kind() const noexcept { return kind_; }
        std::uint32_t command() const noexcept { return command_; }
        std::uint32_t arg0() const noexcept { return arg0_; }
        std::uint32_t arg1() const noexcept { return arg1_; }

    private:
        ProtocolFault kind_;
        std::uint32_t command_;
        std::uint32_t arg0_;
        std::uint32_t arg1_;
    };

    class ConnectionError : public AdbError
    {
    public:
        ConnectionError(ConnectionFault kind, const std::string &detail);

        ConnectionFault kind() const noexcept { return kind_; }

    private:
        ConnectionFault kind_;
    };

    class StreamError : public AdbError
    {
    public:
        StreamError(StreamFault kind, std::uint32_t local_id, const std::string &detail);

        StreamFault kind() const noexcept { return kind_; }
        std::uint32_t local_id() const noexcept { return local_id_; }

    private:
        StreamFault kind_;
        std::uint32_t local_id_;
    };

    class TransferError : public AdbError
    {
    public:
        TransferError(TransferFault kind, std::string remote_path, const std::string &detail);

        TransferFault kind() const noexcept { return kind_; }
        const std::string &remote_path() const noexcept { return remote_path_; }

    private:
        TransferFault kind_;
        std::string remote_path_;
    };

    class PushFailedError : public TransferError
    {
    public:
        PushFailedError(std::string remote_path, std::string device_message);

        // FAIL payload exactly as the device sent it.
        const std::string &device_message() const noexcept { return device_message_; }

    private:
        std::string device_message_;
    };

    class PullFailedError : public TransferError
    {
    public:
        PullFailedError(std::string remote_path, std::string device_message);

        const std::string &device_message() const noexcept { return device_message_; }

    private:
        std::string device_message_;
    };

} // namespace miniadb
