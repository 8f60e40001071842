#include "call_errno.hpp"
#include "make_unique_ptr_closer.hpp"
#include "now_unixtime.hpp"
#include "ping_prober.hpp"
#include "wire_layout.hpp"

#include <pcap/pcap.h>
#include <poll.h>

#include <algorithm>
#include <cstring>
#include <limits>
#include <random>
#include <stdexcept>

namespace {
struct uptimeping_icmp_payload {
    uint64_t probe_cookie;
    double probe_send_unixtime;
} __attribute__((__packed__));

struct uptimeping_icmp_packet : wire_header<icmp_echo_header, uptimeping_icmp_payload> {
};

uint64_t uint64_random() {
    static thread_local std::mt19937_64 random_engine{std::random_device{}()};
    static thread_local std::uniform_int_distribution<uint64_t> distro{
            std::numeric_limits<std::uint64_t>::min(),
            std::numeric_limits<std::uint64_t>::max()};
    return distro(random_engine);
}

struct echo_reply_wait {
    size_t link_header_length;
    uint64_t probe_cookie;
    uint16_t probe_seq;
    double probe_send_unixtime;
    std::optional<double> reply_rtt_ms;

    void note_packet(const struct pcap_pkthdr *h, const u_char *bytes) {
        if (reply_rtt_ms || h->caplen < link_header_length) { return; }
        auto ip_bytes = bytes + link_header_length;
        auto ip_caplen = h->caplen - link_header_length;
        auto ip = wire_header<ip_header>::header_from_packet(ip_bytes, ip_caplen);
        if (!ip || ip->ip_p != (uint8_t) ip_protocol::ICMP || ip->ip_header_length() < sizeof(ip_header) || ip->ip_header_length() > ip_caplen) { return; }
        auto reply = uptimeping_icmp_packet::header_from_packet(ip_bytes + ip->ip_header_length(), ip_caplen - ip->ip_header_length());
        if (!reply || reply->icmp_type != (uint8_t) icmp_type::ECHOREPLY) { return; }
        if (reply->probe_cookie != probe_cookie || ntohs(reply->icmp_echo_seq) != probe_seq) { return; }

        auto received = timeval_to_unixtime(h->ts);
        if (received < probe_send_unixtime) { received = now_unixtime(); }
        reply_rtt_ms = (received - probe_send_unixtime) * 1000.0;
    }
};

class icmp_pcap_prober : public ping_prober {
  public:
    explicit icmp_pcap_prober(uptimeping_config const &config)
        : pcap_interface(config.pcap_interface), ping_count(config.ping_count), ping_timeout_seconds(config.ping_timeout_seconds) {}

    [[nodiscard]] int probe_packets_sent() const override { return ping_count; }

  protected:
    probe_result probe_attempts(std::string const &address) override {
        auto dest_sockaddr = sockaddr_resolve_ipv4(address);
        auto dest_numeric = str(dest_sockaddr);

        char errbuf[PCAP_ERRBUF_SIZE];
        auto pcap = make_unique_ptr_closer(pcap_create(pcap_interface.c_str(), errbuf), [](pcap_t *p) {
            if (p) { pcap_close(p); }
        });
        if (!pcap) { throw std::runtime_error(str("pcap_create ", pcap_interface, ": ", errbuf)); }
        pcap_set_snaplen(pcap.get(), 256);
        pcap_set_promisc(pcap.get(), 0);
        pcap_set_timeout(pcap.get(), 1);
        pcap_set_immediate_mode(pcap.get(), 1);
        if (pcap_activate(pcap.get()) < 0) { throw std::runtime_error(str("pcap_activate ", pcap_interface, ": ", pcap_geterr(pcap.get()))); }

        auto link_header_length = pcap_link_header_length(pcap_datalink(pcap.get()));
        if (!link_header_length) { throw std::runtime_error(str("icmp_pcap_prober unsupported datalink ", pcap_datalink(pcap.get()), " on ", pcap_interface)); }

        bpf_program filter;
        auto filter_text = str("icmp and src host ", dest_numeric);
        if (pcap_compile(pcap.get(), &filter, filter_text.c_str(), 1 /* optimize */, PCAP_NETMASK_UNKNOWN) != 0) {
            throw std::runtime_error(str("pcap_compile ", filter_text, ": ", pcap_geterr(pcap.get())));
        }
        auto set_filter = pcap_setfilter(pcap.get(), &filter);
        pcap_freecode(&filter);
        if (set_filter != 0) { throw std::runtime_error(str("pcap_setfilter ", filter_text, ": ", pcap_geterr(pcap.get()))); }
        if (pcap_setnonblock(pcap.get(), 1, errbuf) != 0) { throw std::runtime_error(str("pcap_setnonblock ", pcap_interface, ": ", errbuf)); }
        auto selectable_fd = pcap_get_selectable_fd(pcap.get());

        unique_fd_closer ping_socket{CALL_ERRNO_MINUS_1(socket, AF_INET, SOCK_RAW, (int) ip_protocol::ICMP)};
        auto cookie = uint64_random();
        std::vector<double> rtts;

        for (int seq = 0; ping_count > seq; ++seq) {
            uptimeping_icmp_packet packet;
            std::memset(&packet, 0, sizeof(packet));
            packet.icmp_type = (uint8_t) icmp_type::ECHO;
            packet.icmp_echo_id = htons(static_cast<uint16_t>(cookie));
            packet.icmp_echo_seq = htons(static_cast<uint16_t>(seq));
            packet.probe_cookie = cookie;
            packet.probe_send_unixtime = now_unixtime();
            packet.icmp_cksum = icmp_checksum_endian_safe(&packet, sizeof(packet));

            echo_reply_wait wait{*link_header_length, cookie, static_cast<uint16_t>(seq), packet.probe_send_unixtime, std::nullopt};
            auto sent_size = CALL_ERRNO_MINUS_1(sendto, ping_socket.fd, &packet, sizeof(packet), 0, &dest_sockaddr, sizeof(dest_sockaddr));
            if (sent_size != sizeof(packet)) { throw std::runtime_error(str("icmp_pcap_prober ICMP packet to ", dest_sockaddr, " not fully sent")); }

            auto deadline = packet.probe_send_unixtime + ping_timeout_seconds;
            while (!wait.reply_rtt_ms) {
                auto ret = pcap_dispatch(
                        pcap.get(),
                        -1 /*cnt*/,
                        [](u_char *user, const struct pcap_pkthdr *h, const u_char *bytes) {
                            ((echo_reply_wait *) user)->note_packet(h, bytes);
                        },
                        (u_char *) &wait);
                if (ret == -1) { throw std::runtime_error(str("pcap_dispatch ", pcap_interface, ": ", pcap_geterr(pcap.get()))); }
                if (wait.reply_rtt_ms) { break; }
                auto remaining = deadline - now_unixtime();
                if (remaining <= 0) { break; }
                if (selectable_fd == -1) { continue; }
                pollfd pfd{selectable_fd, POLLIN, 0};
                CALL_ERRNO_MINUS_1_RETRY_EINTR(poll, &pfd, 1, std::clamp(static_cast<int>(remaining * 1000), 1, 10));
            }
            if (wait.reply_rtt_ms) { rtts.push_back(*wait.reply_rtt_ms); }
        }

        auto loss = 100.0 * (ping_count - static_cast<int>(rtts.size())) / ping_count;
        return probe_result_from_rtts(rtts, ping_count, loss);
    }

  private:
    std::string pcap_interface;
    int ping_count;
    double ping_timeout_seconds;
};
} // namespace

std::unique_ptr<ping_prober> icmp_pcap_prober_create(uptimeping_config const &config) {
    return std::make_unique<icmp_pcap_prober>(config);
}
