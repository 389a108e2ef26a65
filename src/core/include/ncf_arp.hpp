#pragma once

/**
 * @file ncf_arp.hpp
 * @brief ARP frame codec and address helpers
 *
 * Everything the spoof engine and the transport exchange on the wire is an
 * ArpFrame: one Ethernet II header followed by an Ethernet/IPv4 ARP body.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ncf {

/**
 * @brief MAC address type (6 bytes)
 */
using MACAddress = std::array<uint8_t, 6>;

/**
 * @brief IPv4 address type (4 bytes, network order)
 */
using IPv4Address = std::array<uint8_t, 4>;

constexpr MACAddress kBroadcastMAC = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
constexpr MACAddress kZeroMAC      = {0x00, 0x00, 0x00, 0x00, 0x00, 0x00};

constexpr uint16_t ARP_OP_REQUEST = 0x0001;
constexpr uint16_t ARP_OP_REPLY   = 0x0002;

/// Ethernet header (14) + ARP body (28)
constexpr size_t ARP_FRAME_LEN = 42;

/**
 * @brief One host seen on the subnet
 */
struct ARPEntry {
    MACAddress  mac{};
    IPv4Address ip{};
};

/**
 * @brief Ethernet + ARP frame, host-side representation
 */
struct ArpFrame {
    MACAddress  eth_dst{};
    MACAddress  eth_src{};
    uint16_t    opcode = ARP_OP_REPLY;
    MACAddress  sender_mac{};
    IPv4Address sender_ip{};
    MACAddress  target_mac{};
    IPv4Address target_ip{};

    /**
     * @brief Serialize to the 42-byte wire format
     */
    std::vector<uint8_t> encode() const;

    /**
     * @brief Parse wire bytes
     * @return std::nullopt unless the buffer holds an Ethernet/IPv4 ARP packet
     */
    static std::optional<ArpFrame> decode(const uint8_t* data, size_t len);

    /**
     * @brief ARP reply unicast to @p dst_mac claiming @p claimed_ip is at @p claimed_mac
     *
     * The Ethernet source is always @p our_mac; only the ARP body carries
     * the claimed mapping.
     */
    static ArpFrame reply(const MACAddress& our_mac,
                          const MACAddress& claimed_mac, const IPv4Address& claimed_ip,
                          const MACAddress& dst_mac, const IPv4Address& dst_ip);

    /**
     * @brief Broadcast who-has @p wanted_ip from @p our_mac / @p our_ip
     */
    static ArpFrame request(const MACAddress& our_mac, const IPv4Address& our_ip,
                            const IPv4Address& wanted_ip);

    bool operator==(const ArpFrame& other) const;
};

/**
 * @brief "AA:BB:CC:DD:EE:FF"
 */
std::string mac_to_string(const MACAddress& mac);

/**
 * @brief Parse "aa:bb:cc:dd:ee:ff" or "AA-BB-CC-DD-EE-FF"
 */
std::optional<MACAddress> parse_mac(const std::string& str);

/**
 * @brief Canonical uppercase, colon separated form
 * @return std::nullopt if @p str is not a MAC address
 */
std::optional<std::string> normalize_mac(const std::string& str);

std::string ip_to_string(const IPv4Address& ip);
std::optional<IPv4Address> parse_ip(const std::string& str);

/// @p ip with the host bits of a /@p prefix_len network cleared
IPv4Address network_address(const IPv4Address& ip, uint8_t prefix_len);

/// Number of leading one bits in a dotted netmask (255.255.255.0 -> 24)
uint8_t prefix_length(const IPv4Address& netmask);

} // namespace ncf
