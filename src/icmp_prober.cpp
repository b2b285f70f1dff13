// filename: src/icmp_prober.cpp
#include "core/icmp_prober.hpp"
#include <atomic>
#include <unistd.h>

namespace {
    constexpr unsigned char kEchoRequest = 8;
    constexpr unsigned char kEchoReply = 0;
    constexpr unsigned char kProtoIcmp = 1;
    constexpr std::size_t kIcmpHeaderLen = 8;
    constexpr char kPayload[] = "netmon-liveness";

    // Raw ICMP sockets see every reply on the host, so each prober gets its
    // own identifier.
    std::uint16_t next_identifier() {
        static std::atomic<std::uint16_t> counter{static_cast<std::uint16_t>(::getpid())};
        return counter.fetch_add(1, std::memory_order_relaxed);
    }

    // RFC 1071 internet checksum.
    std::uint16_t checksum(const unsigned char* data, std::size_t len) {
        std::uint32_t sum = 0;
        for (std::size_t i = 0; i + 1 < len; i += 2) {
            sum += (static_cast<std::uint32_t>(data[i]) << 8) | data[i + 1];
        }
        if (len & 1) sum += static_cast<std::uint32_t>(data[len - 1]) << 8;
        while (sum >> 16) sum = (sum & 0xFFFF) + (sum >> 16);
        return static_cast<std::uint16_t>(~sum);
    }

    void encode_echo_request(std::vector<unsigned char>& out, std::uint16_t id, std::uint16_t seq) {
        out.assign(kIcmpHeaderLen, 0);
        out[0] = kEchoRequest;
        out[4] = static_cast<unsigned char>(id >> 8);
        out[5] = static_cast<unsigned char>(id & 0xFF);
        out[6] = static_cast<unsigned char>(seq >> 8);
        out[7] = static_cast<unsigned char>(seq & 0xFF);
        out.insert(out.end(), kPayload, kPayload + sizeof(kPayload) - 1);
        const std::uint16_t sum = checksum(out.data(), out.size());
        out[2] = static_cast<unsigned char>(sum >> 8);
        out[3] = static_cast<unsigned char>(sum & 0xFF);
    }
}

IcmpProber::IcmpProber(Strand strand, std::chrono::milliseconds timeout)
    : strand_(strand),
      socket_(strand),
      timeout_timer_(strand),
      timeout_(timeout),
      identifier_(next_identifier())
{}

void IcmpProber::async_probe(const std::string& address, Handler handler) {
    handler_ = std::move(handler);
    const std::uint16_t seq = ++sequence_;
    auto self = shared_from_this();

    boost::system::error_code ec;
    target_ = boost::asio::ip::make_address_v4(address, ec);
    if (!ec && !socket_.is_open()) socket_.open(boost::asio::ip::icmp::v4(), ec);
    if (ec) {
        // e.g. permission denied without CAP_NET_RAW; still complete asynchronously
        boost::asio::post(strand_, [self, seq, ec] {
            self->finish(seq, ProbeResult{std::chrono::nanoseconds(0), ec});
        });
        return;
    }

    encode_echo_request(request_, identifier_, seq);
    sent_at_ = std::chrono::steady_clock::now();
    socket_.async_send_to(
        boost::asio::buffer(request_),
        boost::asio::ip::icmp::endpoint(target_, 0),
        [self, seq](const boost::system::error_code& sec, std::size_t) {
            if (sec) self->finish(seq, ProbeResult{std::chrono::nanoseconds(0), sec});
        });
    do_receive(seq);

    timeout_timer_.expires_after(timeout_);
    timeout_timer_.async_wait([self, seq](const boost::system::error_code& tec) {
        if (tec == boost::asio::error::operation_aborted) return;
        self->finish(seq, ProbeResult{std::chrono::nanoseconds(0),
                                      make_error_code(boost::asio::error::timed_out)});
    });
}

void IcmpProber::cancel() {
    finish(sequence_, ProbeResult{std::chrono::nanoseconds(0),
                                  make_error_code(boost::asio::error::operation_aborted)});
}

void IcmpProber::do_receive(std::uint16_t seq) {
    auto self = shared_from_this();
    socket_.async_receive(
        boost::asio::buffer(reply_),
        [self, seq](const boost::system::error_code& ec, std::size_t n) {
            if (ec || seq != self->sequence_ || !self->handler_) return;
            if (!self->is_our_reply(n)) {
                self->do_receive(seq);
                return;
            }
            const auto rtt = std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::steady_clock::now() - self->sent_at_);
            self->finish(seq, ProbeResult{rtt, {}});
        });
}

bool IcmpProber::is_our_reply(std::size_t n) const {
    // IPv4 raw sockets deliver the IP header in front of the ICMP message.
    if (n < 20) return false;
    const std::size_t ihl = static_cast<std::size_t>(reply_[0] & 0x0F) * 4;
    if (ihl < 20 || n < ihl + kIcmpHeaderLen) return false;
    if (reply_[9] != kProtoIcmp) return false;

    const boost::asio::ip::address_v4::bytes_type src{reply_[12], reply_[13], reply_[14], reply_[15]};
    if (boost::asio::ip::address_v4(src) != target_) return false;

    const unsigned char* icmp = reply_.data() + ihl;
    const std::uint16_t id = static_cast<std::uint16_t>((icmp[4] << 8) | icmp[5]);
    const std::uint16_t seq = static_cast<std::uint16_t>((icmp[6] << 8) | icmp[7]);
    return icmp[0] == kEchoReply && id == identifier_ && seq == sequence_;
}

void IcmpProber::finish(std::uint16_t seq, ProbeResult result) {
    if (seq != sequence_ || !handler_) return;
    boost::system::error_code ignore;
    timeout_timer_.cancel();
    socket_.cancel(ignore);
    auto handler = std::move(handler_);
    handler_ = nullptr;
    handler(result);
}
