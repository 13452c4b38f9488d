#pragma once

#include <opf/core/types.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace opf::transport {

struct Address {
    enum class Scheme { Unix, Tcp };

    Scheme scheme = Scheme::Unix;
    // Socket path for Unix, host name or IP literal for Tcp.
    std::string host;
    uint16_t port = 0;

    std::string toString() const;
};

/**
 * Parse "unix:///path/to.sock" or "tcp://host:port".
 * IPv6 hosts are written in brackets: "tcp://[::1]:9000".
 */
Result<Address> parseAddress(std::string_view address);

} // namespace opf::transport
