#include "wire_layout.hpp"
#include "call_errno.hpp"
#include "make_unique_ptr_closer.hpp"
#include "str.hpp"

#include <netdb.h>

#include <cstring>
#include <stdexcept>

std::ostream &operator<<(std::ostream &os, const sockaddr &s) {
    char str[INET6_ADDRSTRLEN + INET_ADDRSTRLEN];
    if (auto ret = getnameinfo(&s, sizeof(s), str, sizeof(str),
                               nullptr, 0, NI_NUMERICHOST | NI_NUMERICSERV)) {
        return os << "getnameinfo failed " << gai_strerror(ret);
    } else {
        return os << str;
    }
}

std::optional<size_t> pcap_link_header_length(int datalink) {
    switch (datalink) {
        case DLT_EN10MB:
            return 14;
        case DLT_LINUX_SLL:
            return 16;
#ifdef DLT_LINUX_SLL2
        case DLT_LINUX_SLL2:
            return 20;
#endif
        case DLT_NULL:
        case DLT_LOOP:
            return 4;
        case DLT_RAW:
            return 0;
        default:
            return std::nullopt;
    }
}

uint16_t icmp_checksum_endian_safe(void const *buf, size_t length) {
    auto buffer = (uint16_t const *) buf;
    uint32_t sum;

    for (sum = 0; length > 1; length -= 2) {
        sum += *buffer++;
    }

    if (length == 1) {
        sum += *(uint8_t const *) buffer;
    }

    sum = (sum >> 16) + (sum & 0xFFFF); /* add high 16 to low 16 */
    sum += (sum >> 16);                 /* add carry */
    return static_cast<uint16_t>(~sum);
}

sockaddr sockaddr_resolve_ipv4(const std::string &host) {
    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    addrinfo *found = nullptr;
    if (auto ret = getaddrinfo(host.c_str(), nullptr, &hints, &found)) {
        throw std::runtime_error(str("sockaddr_resolve_ipv4 ", host, ": ", gai_strerror(ret)));
    }
    auto found_holder = make_unique_ptr_closer(found, [](addrinfo *a) { freeaddrinfo(a); });
    for (auto a = found; a; a = a->ai_next) {
        if (a->ai_family == AF_INET && a->ai_addrlen <= sizeof(sockaddr)) {
            sockaddr resolved;
            std::memset(&resolved, 0, sizeof(resolved));
            std::memcpy(&resolved, a->ai_addr, a->ai_addrlen);
            return resolved;
        }
    }
    throw std::runtime_error(str("sockaddr_resolve_ipv4 ", host, ": no IPv4 address"));
}
