#include <opf/transport/address.h>

#include <charconv>

namespace opf::transport {

namespace {

constexpr std::string_view kUnixPrefix = "unix://";
constexpr std::string_view kTcpPrefix = "tcp://";

Error invalid(std::string_view address, std::string_view why) {
    return Error{ErrorCode::InvalidAddress,
                 "invalid address '" + std::string(address) + "': " + std::string(why)};
}

} // namespace

std::string Address::toString() const {
    if (scheme == Scheme::Unix) {
        return std::string(kUnixPrefix) + host;
    }
    const bool v6 = host.find(':') != std::string::npos;
    return std::string(kTcpPrefix) + (v6 ? "[" + host + "]" : host) + ":" + std::to_string(port);
}

Result<Address> parseAddress(std::string_view address) {
    if (address.starts_with(kUnixPrefix)) {
        auto path = address.substr(kUnixPrefix.size());
        if (path.empty()) {
            return invalid(address, "missing socket path");
        }
        return Address{Address::Scheme::Unix, std::string(path), 0};
    }

    if (!address.starts_with(kTcpPrefix)) {
        return invalid(address, "expected unix:// or tcp:// scheme");
    }

    auto rest = address.substr(kTcpPrefix.size());
    std::string_view host;
    std::string_view portText;
    if (rest.starts_with('[')) {
        auto close = rest.find(']');
        if (close == std::string_view::npos || close + 1 >= rest.size() ||
            rest[close + 1] != ':') {
            return invalid(address, "malformed IPv6 host");
        }
        host = rest.substr(1, close - 1);
        portText = rest.substr(close + 2);
    } else {
        auto colon = rest.rfind(':');
        if (colon == std::string_view::npos) {
            return invalid(address, "missing port");
        }
        host = rest.substr(0, colon);
        portText = rest.substr(colon + 1);
    }

    if (host.empty()) {
        return invalid(address, "missing host");
    }

    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
    if (portText.empty() || ec != std::errc{} || ptr != portText.data() + portText.size() ||
        port > 65535) {
        return invalid(address, "bad port");
    }

    return Address{Address::Scheme::Tcp, std::string(host), static_cast<uint16_t>(port)};
}

} // namespace opf::transport
