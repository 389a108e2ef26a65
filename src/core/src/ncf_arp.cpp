/**
 * @file ncf_arp.cpp
 * @brief ARP frame codec and address helpers
 */

#include "ncf_arp.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>

#include <arpa/inet.h>

namespace ncf {

// ─── Wire layout ─────────────────────────────────────────────────────────────

#pragma pack(push, 1)
struct ARPPacket {
    // Ethernet header
    uint8_t  eth_dst[6];
    uint8_t  eth_src[6];
    uint16_t eth_type;       // 0x0806 for ARP

    // ARP header
    uint16_t hw_type;        // 0x0001 for Ethernet
    uint16_t proto_type;     // 0x0800 for IPv4
    uint8_t  hw_len;         // 6 for MAC
    uint8_t  proto_len;      // 4 for IPv4
    uint16_t opcode;         // 1=request, 2=reply

    // ARP payload
    uint8_t  sender_mac[6];
    uint8_t  sender_ip[4];
    uint8_t  target_mac[6];
    uint8_t  target_ip[4];
};
#pragma pack(pop)

static_assert(sizeof(ARPPacket) == ARP_FRAME_LEN, "ARPPacket must be 42 bytes");

static constexpr uint16_t ETH_TYPE_ARP  = 0x0806;
static constexpr uint16_t ARP_HW_ETHER  = 0x0001;
static constexpr uint16_t ARP_PROTO_IP  = 0x0800;

// ─── ArpFrame ───────────────────────────────────────────────────────────────

std::vector<uint8_t> ArpFrame::encode() const {
    ARPPacket pkt{};

    std::copy(eth_dst.begin(), eth_dst.end(), pkt.eth_dst);
    std::copy(eth_src.begin(), eth_src.end(), pkt.eth_src);
    pkt.eth_type = htons(ETH_TYPE_ARP);

    pkt.hw_type    = htons(ARP_HW_ETHER);
    pkt.proto_type = htons(ARP_PROTO_IP);
    pkt.hw_len     = 6;
    pkt.proto_len  = 4;
    pkt.opcode     = htons(opcode);

    std::copy(sender_mac.begin(), sender_mac.end(), pkt.sender_mac);
    std::copy(sender_ip.begin(),  sender_ip.end(),  pkt.sender_ip);
    std::copy(target_mac.begin(), target_mac.end(), pkt.target_mac);
    std::copy(target_ip.begin(),  target_ip.end(),  pkt.target_ip);

    const auto* raw = reinterpret_cast<const uint8_t*>(&pkt);
    return std::vector<uint8_t>(raw, raw + sizeof(pkt));
}

std::optional<ArpFrame> ArpFrame::decode(const uint8_t* data, size_t len) {
    // Short frames are padded to 60 bytes on the wire, so only a lower bound
    if (!data || len < sizeof(ARPPacket)) return std::nullopt;

    ARPPacket pkt;
    std::memcpy(&pkt, data, sizeof(pkt));

    if (ntohs(pkt.eth_type) != ETH_TYPE_ARP)     return std::nullopt;
    if (ntohs(pkt.hw_type) != ARP_HW_ETHER)      return std::nullopt;
    if (ntohs(pkt.proto_type) != ARP_PROTO_IP)   return std::nullopt;
    if (pkt.hw_len != 6 || pkt.proto_len != 4)   return std::nullopt;

    ArpFrame f;
    std::copy(pkt.eth_dst, pkt.eth_dst + 6, f.eth_dst.begin());
    std::copy(pkt.eth_src, pkt.eth_src + 6, f.eth_src.begin());
    f.opcode = ntohs(pkt.opcode);
    std::copy(pkt.sender_mac, pkt.sender_mac + 6, f.sender_mac.begin());
    std::copy(pkt.sender_ip,  pkt.sender_ip + 4,  f.sender_ip.begin());
    std::copy(pkt.target_mac, pkt.target_mac + 6, f.target_mac.begin());
    std::copy(pkt.target_ip,  pkt.target_ip + 4,  f.target_ip.begin());
    return f;
}

ArpFrame ArpFrame::reply(const MACAddress& our_mac,
                         const MACAddress& claimed_mac, const IPv4Address& claimed_ip,
                         const MACAddress& dst_mac, const IPv4Address& dst_ip) {
    ArpFrame f;
    f.eth_dst    = dst_mac;
    f.eth_src    = our_mac;
    f.opcode     = ARP_OP_REPLY;
    f.sender_mac = claimed_mac;
    f.sender_ip  = claimed_ip;
    f.target_mac = dst_mac;
    f.target_ip  = dst_ip;
    return f;
}

ArpFrame ArpFrame::request(const MACAddress& our_mac, const IPv4Address& our_ip,
                           const IPv4Address& wanted_ip) {
    ArpFrame f;
    f.eth_dst    = kBroadcastMAC;
    f.eth_src    = our_mac;
    f.opcode     = ARP_OP_REQUEST;
    f.sender_mac = our_mac;
    f.sender_ip  = our_ip;
    f.target_mac = kZeroMAC;
    f.target_ip  = wanted_ip;
    return f;
}

bool ArpFrame::operator==(const ArpFrame& other) const {
    return eth_dst == other.eth_dst && eth_src == other.eth_src &&
           opcode == other.opcode &&
           sender_mac == other.sender_mac && sender_ip == other.sender_ip &&
           target_mac == other.target_mac && target_ip == other.target_ip;
}

// ─── Text helpers ────────────────────────────────────────────────────────────

std::string mac_to_string(const MACAddress& mac) {
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
                  mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
    return std::string(buf);
}

std::optional<MACAddress> parse_mac(const std::string& str) {
    if (str.size() != 17) return std::nullopt;

    const char sep = str[2];
    if (sep != ':' && sep != '-') return std::nullopt;

    MACAddress mac{};
    for (size_t i = 0; i < 6; ++i) {
        size_t pos = i * 3;
        if (i > 0 && str[pos - 1] != sep) return std::nullopt;
        char hi = str[pos];
        char lo = str[pos + 1];
        if (!std::isxdigit(static_cast<unsigned char>(hi)) ||
            !std::isxdigit(static_cast<unsigned char>(lo))) {
            return std::nullopt;
        }
        mac[i] = static_cast<uint8_t>(std::stoul(str.substr(pos, 2), nullptr, 16));
    }
    return mac;
}

std::optional<std::string> normalize_mac(const std::string& str) {
    auto mac = parse_mac(str);
    if (!mac) return std::nullopt;
    return mac_to_string(*mac);
}

std::string ip_to_string(const IPv4Address& ip) {
    char buf[INET_ADDRSTRLEN];
    if (!inet_ntop(AF_INET, ip.data(), buf, sizeof(buf))) return std::string();
    return std::string(buf);
}

std::optional<IPv4Address> parse_ip(const std::string& str) {
    IPv4Address ip{};
    if (inet_pton(AF_INET, str.c_str(), ip.data()) != 1) return std::nullopt;
    return ip;
}

IPv4Address network_address(const IPv4Address& ip, uint8_t prefix_len) {
    uint32_t host_order = (uint32_t(ip[0]) << 24) | (uint32_t(ip[1]) << 16) |
                          (uint32_t(ip[2]) << 8)  |  uint32_t(ip[3]);
    uint32_t mask = prefix_len == 0 ? 0u
                  : prefix_len >= 32 ? 0xFFFFFFFFu
                  : 0xFFFFFFFFu << (32 - prefix_len);
    host_order &= mask;
    return {static_cast<uint8_t>(host_order >> 24), static_cast<uint8_t>(host_order >> 16),
            static_cast<uint8_t>(host_order >> 8),  static_cast<uint8_t>(host_order)};
}

uint8_t prefix_length(const IPv4Address& netmask) {
    uint8_t bits = 0;
    for (uint8_t octet : netmask) {
        for (int b = 7; b >= 0; --b) {
            if (!(octet & (1u << b))) return bits;
            ++bits;
        }
    }
    return bits;
}

} // namespace ncf
