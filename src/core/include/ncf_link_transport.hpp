#pragma once

/**
 * @file ncf_link_transport.hpp
 * @brief Link-layer transport: raw ARP frames on one interface
 */

#include "ncf_arp.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Forward declaration for pcap_t
struct pcap;
typedef struct pcap pcap_t;

namespace ncf {

struct pcap_handle_deleter {
    void operator()(pcap_t* p) const noexcept;
};

using PcapHandle = std::unique_ptr<pcap_t, pcap_handle_deleter>;

/**
 * @brief Identity of the interface we transmit on
 */
struct InterfaceInfo {
    std::string name;
    MACAddress  mac{};
    IPv4Address ip{};
    IPv4Address netmask{};
};

/**
 * @brief Abstract link-layer transport
 *
 * Consumed by DeviceDirectory (subnet scans) and SpoofEngine (frame
 * injection, gateway lookup). Implementations must allow send_arp() to be
 * called from the spoof thread while a scan runs on another thread.
 */
class ILinkTransport {
public:
    virtual ~ILinkTransport() = default;

    virtual InterfaceInfo interface_info() const = 0;

    /**
     * @brief Inject one frame
     * @return false on a send error (transient, caller decides whether to retry)
     */
    virtual bool send_arp(const ArpFrame& frame) = 0;

    /**
     * @brief Broadcast who-has for every host of network/prefix_len and
     *        collect replies until @p timeout elapses
     */
    virtual std::vector<ARPEntry> arp_scan(const IPv4Address& network,
                                           uint8_t prefix_len,
                                           std::chrono::milliseconds timeout) = 0;

    /// IPv4 next hop of the default route on this interface
    virtual std::optional<IPv4Address> default_gateway() = 0;

    /// Hardware address currently answering for @p ip
    virtual std::optional<MACAddress> lookup_mac(const IPv4Address& ip) = 0;
};

/**
 * @brief ILinkTransport over libpcap (Linux)
 *
 * Usage:
 *   PcapTransport link("wlan0");
 *   link.open();            // throws std::runtime_error without CAP_NET_RAW
 *   link.send_arp(frame);
 */
class PcapTransport : public ILinkTransport {
public:
    explicit PcapTransport(std::string iface);
    ~PcapTransport() override;

    PcapTransport(const PcapTransport&) = delete;
    PcapTransport& operator=(const PcapTransport&) = delete;

    /**
     * @brief Read the interface identity and open the injection handle
     * @throws std::runtime_error if the interface has no IPv4 address or
     *         the capture device cannot be activated
     */
    void open();
    bool is_open() const;

    InterfaceInfo interface_info() const override;
    bool send_arp(const ArpFrame& frame) override;
    std::vector<ARPEntry> arp_scan(const IPv4Address& network,
                                   uint8_t prefix_len,
                                   std::chrono::milliseconds timeout) override;
    std::optional<IPv4Address> default_gateway() override;
    std::optional<MACAddress> lookup_mac(const IPv4Address& ip) override;

    /**
     * @brief Interface that carries the IPv4 default route
     * @return empty string if /proc/net/route has no default route
     */
    static std::string default_route_interface();

    /**
     * @brief Parse /proc/net/route content
     * @param iface Interface to match, or empty for any
     */
    static std::optional<IPv4Address> parse_route_table(const std::string& content,
                                                        const std::string& iface);

    /**
     * @brief Parse /proc/net/arp content for a complete entry for @p ip
     */
    static std::optional<MACAddress> parse_neighbour_table(const std::string& content,
                                                           const IPv4Address& ip);

private:
    PcapHandle open_handle(const char* filter) const;

    std::string        iface_;
    InterfaceInfo      info_;
    PcapHandle         send_handle_;
    mutable std::mutex send_mu_;
    std::string        last_error_;
};

} // namespace ncf
