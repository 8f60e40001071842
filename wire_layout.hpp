#pragma once

#include "str.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <pcap/pcap.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

enum class ip_protocol : uint8_t {
    ICMP = 1,
};

enum class icmp_type : uint8_t {
    ECHOREPLY = 0,
    ECHO = 8,
};

std::ostream &operator<<(std::ostream &os, sockaddr const &s);

struct alignas(u_int16_t) ip_header {
    u_int8_t ip_vhl;
    u_int8_t ip_tos;
    u_int16_t ip_len;
    u_int16_t ip_id;
    u_int16_t ip_off;
    u_int8_t ip_ttl;
    u_int8_t ip_p;
    u_int16_t ip_sum;
    struct in_addr ip_src, ip_dst;

    [[nodiscard]] inline size_t ip_header_length() const { return (ip_vhl & 0x0f) * 4; }
} __attribute__((__packed__));

// echo request and echo reply only; id and seq are in network order
struct alignas(u_int16_t) icmp_echo_header {
    u_int8_t icmp_type;
    u_int8_t icmp_code;
    u_int16_t icmp_cksum;
    u_int16_t icmp_echo_id;
    u_int16_t icmp_echo_seq;
} __attribute__((__packed__));

template <typename... packet_types> struct wire_header : packet_types... {
    template <typename pointer> static wire_header<packet_types...> const *header_from_packet(pointer *bytes, size_t caplen) {
        if (sizeof(wire_header<packet_types...>) > caplen) { return nullptr; }
        return reinterpret_cast<wire_header<packet_types...> const *>(bytes);
    }
};

// bytes before the IP header for the capture's link type, or nullopt when not supported
std::optional<size_t> pcap_link_header_length(int datalink);

uint16_t icmp_checksum_endian_safe(void const *buf, size_t length);

// first IPv4 address for a host name or numeric address; throws when it does not resolve
sockaddr sockaddr_resolve_ipv4(const std::string &host);

inline double timeval_to_unixtime(timeval const &tv) { return tv.tv_sec + tv.tv_usec / 1e6; }
