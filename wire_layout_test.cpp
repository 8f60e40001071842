#include "uptimeping_test.hpp"
#include "wire_layout.hpp"

#include <cstring>
#include <stdexcept>

TEST(wire_layout_suite, link_header_lengths) {
    uptimeping_test_check(pcap_link_header_length(DLT_EN10MB).value_or(99), ==, 14u);
    uptimeping_test_check(pcap_link_header_length(DLT_LINUX_SLL).value_or(99), ==, 16u);
    uptimeping_test_check(pcap_link_header_length(DLT_RAW).value_or(99), ==, 0u);
    uptimeping_test_check(pcap_link_header_length(DLT_IEEE802_11).has_value(), ==, false);
}

TEST(wire_layout_suite, icmp_checksum_verifies) {
    alignas(icmp_echo_header) unsigned char packet[sizeof(icmp_echo_header) + 5];
    std::memset(packet, 0, sizeof(packet));
    auto header = reinterpret_cast<icmp_echo_header *>(packet);
    header->icmp_type = static_cast<uint8_t>(icmp_type::ECHO);
    header->icmp_echo_id = htons(0x1234);
    header->icmp_echo_seq = htons(7);
    std::memcpy(packet + sizeof(icmp_echo_header), "hello", 5);

    header->icmp_cksum = icmp_checksum_endian_safe(packet, sizeof(packet));
    uptimeping_test_check(header->icmp_cksum, !=, 0);
    // summing a packet that carries its own checksum gives zero
    uptimeping_test_check(icmp_checksum_endian_safe(packet, sizeof(packet)), ==, 0);
}

TEST(wire_layout_suite, header_from_short_capture) {
    alignas(ip_header) unsigned char bytes[sizeof(ip_header)] = {0x45};
    using ip_only = wire_header<ip_header>;
    uptimeping_test_check(ip_only::header_from_packet(bytes, sizeof(bytes) - 1) == nullptr, ==, true);
    auto header = ip_only::header_from_packet(bytes, sizeof(bytes));
    uptimeping_test_check(header != nullptr, ==, true);
    uptimeping_test_check(header->ip_header_length(), ==, 20u);
}

TEST(wire_layout_suite, resolve_addresses) {
    auto numeric = sockaddr_resolve_ipv4("192.168.1.20");
    uptimeping_test_check(str(numeric), ==, "192.168.1.20");
    uptimeping_test_check(reinterpret_cast<sockaddr_in const &>(numeric).sin_family, ==, AF_INET);

    // from the hosts file, no DNS needed
    auto local = sockaddr_resolve_ipv4("localhost");
    uptimeping_test_check(str(local), ==, "127.0.0.1");
}
