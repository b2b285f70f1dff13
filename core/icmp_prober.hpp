// filename: core/icmp_prober.hpp
#pragma once
#include "core/prober.hpp"
#include <array>
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

// ICMP echo over a raw IPv4 socket (needs root or CAP_NET_RAW). One echo
// request per probe; the socket is opened lazily and kept between probes.
class IcmpProber : public Prober, public std::enable_shared_from_this<IcmpProber> {
public:
    IcmpProber(Strand strand, std::chrono::milliseconds timeout);

    void async_probe(const std::string& address, Handler handler) override;
    void cancel() override;

private:
    void do_receive(std::uint16_t seq);
    bool is_our_reply(std::size_t n) const;
    void finish(std::uint16_t seq, ProbeResult result);

    Strand strand_;
    boost::asio::ip::icmp::socket socket_;
    boost::asio::steady_timer timeout_timer_;
    std::chrono::milliseconds timeout_;

    boost::asio::ip::address_v4 target_;
    std::uint16_t identifier_;
    std::uint16_t sequence_{0};
    std::vector<unsigned char> request_;
    std::array<unsigned char, 1500> reply_{};
    std::chrono::steady_clock::time_point sent_at_{};
    Handler handler_;
};
