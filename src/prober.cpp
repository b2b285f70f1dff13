// filename: src/prober.cpp
#include "core/prober.hpp"

const char* probe_target_rejection(const std::string& address) {
    if (address.empty()) return "empty address";

    boost::system::error_code ec;
    const auto ip = boost::asio::ip::make_address(address, ec);
    if (ec) return "not an IP address";
    if (ip.is_loopback()) return "loopback address";
    if (ip.is_multicast()) return "multicast address";
    if (ip.is_unspecified()) return "unspecified address";
    if (ip.is_v6()) {
        if (ip.to_v6().is_link_local()) return "link-local address";
        // IcmpProber speaks ICMPv4 echo only.
        return "IPv6 targets are not supported";
    }

    const auto bytes = ip.to_v4().to_bytes();
    if (bytes[0] == 169 && bytes[1] == 254) return "link-local address";
    return nullptr;
}
