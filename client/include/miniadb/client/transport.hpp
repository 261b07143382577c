#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace miniadb::client
{

    // Byte pipe to one device endpoint, typically a pair of USB bulk
    // endpoints. Failures are reported by throwing miniadb::TransportError.
    class Transport
    {
    public:
        virtual ~Transport() = default;

        // Blocks until at least one and at most max_bytes bytes are available.
        virtual std::vector<std::uint8_t> read(std::size_t max_bytes) = 0;

        // Writes the whole buffer or throws.
        virtual void write(std::span<const std::uint8_t> data) = 0;

        // Must unblock a concurrent read(), which then throws.
        virtual void close() = 0;
    };

} // namespace miniadb::client
