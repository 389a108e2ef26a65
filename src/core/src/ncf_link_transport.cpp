/**
 * @file ncf_link_transport.cpp
 * @brief PcapTransport: ARP injection and subnet scanning over libpcap
 *
 * One persistent handle is used for the spoof loop's injections; every
 * scan or directed lookup opens its own short-lived capture handle with a
 * BPF filter so replies never interleave with another reader.
 */

#include "ncf_link_transport.hpp"
#include "ncf_logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

#include <arpa/inet.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <pcap/pcap.h>

namespace ncf {

void pcap_handle_deleter::operator()(pcap_t* p) const noexcept {
    if (p) pcap_close(p);
}

namespace {

constexpr const char* kReplyFilter = "arp and arp[6:2] = 2";
constexpr int kSnapLen = 128;
constexpr int kReadTimeoutMs = 100;
constexpr std::chrono::milliseconds kDirectedLookupTimeout{2000};
constexpr uint8_t kMinScanPrefix = 16;
constexpr unsigned kRouteFlagGateway = 0x2;
constexpr unsigned kArpFlagComplete = 0x2;

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return std::string();
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

struct DefaultRoute {
    std::string iface;
    IPv4Address gateway{};
};

std::optional<DefaultRoute> find_default_route(const std::string& content,
                                               const std::string& iface) {
    std::istringstream lines(content);
    std::string line;
    std::getline(lines, line);  // header

    while (std::getline(lines, line)) {
        std::istringstream cols(line);
        std::string name, dest_hex, gw_hex, flags_hex;
        if (!(cols >> name >> dest_hex >> gw_hex >> flags_hex)) continue;
        if (!iface.empty() && name != iface) continue;

        unsigned long dest = 0, gw = 0, flags = 0;
        try {
            dest  = std::stoul(dest_hex, nullptr, 16);
            gw    = std::stoul(gw_hex, nullptr, 16);
            flags = std::stoul(flags_hex, nullptr, 16);
        } catch (const std::exception&) {
            continue;
        }
        if (dest != 0 || !(flags & kRouteFlagGateway) || gw == 0) continue;

        // The kernel prints the raw in_addr as a native integer
        uint32_t raw = static_cast<uint32_t>(gw);
        DefaultRoute route;
        route.iface = name;
        std::memcpy(route.gateway.data(), &raw, 4);
        return route;
    }
    return std::nullopt;
}

bool ioctl_addr(int fd, const std::string& iface, unsigned long request, IPv4Address& out) {
    struct ifreq ifr{};
    std::strncpy(ifr.ifr_name, iface.c_str(), IFNAMSIZ - 1);
    if (ioctl(fd, request, &ifr) != 0) return false;
    auto* addr = reinterpret_cast<struct sockaddr_in*>(&ifr.ifr_addr);
    std::memcpy(out.data(), &addr->sin_addr, 4);
    return true;
}

} // namespace

// ─── Construction ───────────────────────────────────────────────────────────

PcapTransport::PcapTransport(std::string iface)
    : iface_(std::move(iface))
{
    info_.name = iface_;
}

PcapTransport::~PcapTransport() = default;

void PcapTransport::open() {
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        throw std::runtime_error("PcapTransport: socket() failed: " +
                                 std::string(std::strerror(errno)));
    }

    bool have_ip = ioctl_addr(fd, iface_, SIOCGIFADDR, info_.ip);
    if (!ioctl_addr(fd, iface_, SIOCGIFNETMASK, info_.netmask)) {
        info_.netmask = {255, 255, 255, 0};
    }

    struct ifreq ifr{};
    std::strncpy(ifr.ifr_name, iface_.c_str(), IFNAMSIZ - 1);
    bool have_mac = ioctl(fd, SIOCGIFHWADDR, &ifr) == 0;
    if (have_mac) {
        std::memcpy(info_.mac.data(), ifr.ifr_hwaddr.sa_data, 6);
    }
    close(fd);

    if (!have_ip) {
        throw std::runtime_error("PcapTransport: interface '" + iface_ +
                                 "' has no IPv4 address");
    }
    if (!have_mac) {
        throw std::runtime_error("PcapTransport: cannot read MAC of '" + iface_ + "'");
    }

    PcapHandle handle = open_handle(nullptr);
    {
        std::lock_guard<std::mutex> lock(send_mu_);
        send_handle_ = std::move(handle);
    }

    NCF_LOG_INFO("Link " << iface_ << ": " << ip_to_string(info_.ip)
                 << "/" << int(prefix_length(info_.netmask))
                 << " " << mac_to_string(info_.mac));
}

bool PcapTransport::is_open() const {
    std::lock_guard<std::mutex> lock(send_mu_);
    return static_cast<bool>(send_handle_);
}

PcapHandle PcapTransport::open_handle(const char* filter) const {
    char errbuf[PCAP_ERRBUF_SIZE] = {};
    PcapHandle handle(pcap_create(iface_.c_str(), errbuf));
    if (!handle) {
        throw std::runtime_error(std::string("pcap_create failed: ") + errbuf);
    }

    pcap_set_snaplen(handle.get(), kSnapLen);
    pcap_set_promisc(handle.get(), 0);
    pcap_set_timeout(handle.get(), kReadTimeoutMs);
    pcap_set_immediate_mode(handle.get(), 1);

    int rc = pcap_activate(handle.get());
    if (rc < 0) {
        throw std::runtime_error("pcap_activate on '" + iface_ + "' failed: " +
                                 std::string(pcap_geterr(handle.get())));
    }
    if (pcap_datalink(handle.get()) != DLT_EN10MB) {
        throw std::runtime_error("interface '" + iface_ + "' is not Ethernet (DLT_EN10MB)");
    }

    if (filter) {
        struct bpf_program prog{};
        if (pcap_compile(handle.get(), &prog, filter, 1, PCAP_NETMASK_UNKNOWN) != 0) {
            throw std::runtime_error("pcap_compile failed: " +
                                     std::string(pcap_geterr(handle.get())));
        }
        int set_rc = pcap_setfilter(handle.get(), &prog);
        pcap_freecode(&prog);
        if (set_rc != 0) {
            throw std::runtime_error("pcap_setfilter failed: " +
                                     std::string(pcap_geterr(handle.get())));
        }
    }
    return handle;
}

// ─── ILinkTransport ─────────────────────────────────────────────────────────

InterfaceInfo PcapTransport::interface_info() const {
    return info_;
}

bool PcapTransport::send_arp(const ArpFrame& frame) {
    std::vector<uint8_t> wire = frame.encode();

    std::lock_guard<std::mutex> lock(send_mu_);
    if (!send_handle_) {
        last_error_ = "send handle not open";
        return false;
    }
    if (pcap_sendpacket(send_handle_.get(), wire.data(), static_cast<int>(wire.size())) != 0) {
        last_error_ = pcap_geterr(send_handle_.get());
        NCF_LOG_DEBUG("pcap_sendpacket: " << last_error_);
        return false;
    }
    return true;
}

std::vector<ARPEntry> PcapTransport::arp_scan(const IPv4Address& network,
                                              uint8_t prefix_len,
                                              std::chrono::milliseconds timeout) {
    if (prefix_len < kMinScanPrefix) {
        NCF_LOG_WARN("Refusing to sweep a /" << int(prefix_len) << ", scanning /"
                     << int(kMinScanPrefix) << " instead");
        prefix_len = kMinScanPrefix;
    }
    if (prefix_len > 30) prefix_len = 30;

    PcapHandle handle = open_handle(kReplyFilter);
    const IPv4Address base = network_address(network, prefix_len);

    uint32_t base_host = (uint32_t(base[0]) << 24) | (uint32_t(base[1]) << 16) |
                         (uint32_t(base[2]) << 8)  |  uint32_t(base[3]);
    uint32_t host_count = (1u << (32 - prefix_len)) - 2;

    size_t send_failures = 0;
    for (uint32_t h = 1; h <= host_count; ++h) {
        uint32_t addr = base_host + h;
        IPv4Address ip = {static_cast<uint8_t>(addr >> 24), static_cast<uint8_t>(addr >> 16),
                          static_cast<uint8_t>(addr >> 8),  static_cast<uint8_t>(addr)};
        if (ip == info_.ip) continue;

        std::vector<uint8_t> wire = ArpFrame::request(info_.mac, info_.ip, ip).encode();
        if (pcap_sendpacket(handle.get(), wire.data(), static_cast<int>(wire.size())) != 0) {
            ++send_failures;
        }
    }
    if (send_failures > 0) {
        NCF_LOG_WARN("ARP sweep: " << send_failures << " requests failed to send");
    }

    std::vector<ARPEntry> found;
    std::set<IPv4Address> seen;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (std::chrono::steady_clock::now() < deadline) {
        struct pcap_pkthdr* hdr = nullptr;
        const u_char* data = nullptr;
        int res = pcap_next_ex(handle.get(), &hdr, &data);
        if (res == 0) continue;
        if (res < 0) {
            NCF_LOG_WARN("ARP sweep capture ended early: " << pcap_geterr(handle.get()));
            break;
        }

        auto frame = ArpFrame::decode(data, hdr->caplen);
        if (!frame || frame->opcode != ARP_OP_REPLY) continue;
        if (frame->target_ip != info_.ip) continue;
        if (network_address(frame->sender_ip, prefix_len) != base) continue;
        if (!seen.insert(frame->sender_ip).second) continue;

        found.push_back(ARPEntry{frame->sender_mac, frame->sender_ip});
    }

    return found;
}

std::optional<IPv4Address> PcapTransport::default_gateway() {
    return parse_route_table(read_file("/proc/net/route"), iface_);
}

std::optional<MACAddress> PcapTransport::lookup_mac(const IPv4Address& ip) {
    if (auto cached = parse_neighbour_table(read_file("/proc/net/arp"), ip)) {
        return cached;
    }

    // Not in the kernel cache: ask directly
    PcapHandle handle = open_handle(kReplyFilter);
    std::vector<uint8_t> wire = ArpFrame::request(info_.mac, info_.ip, ip).encode();
    if (pcap_sendpacket(handle.get(), wire.data(), static_cast<int>(wire.size())) != 0) {
        NCF_LOG_WARN("who-has " << ip_to_string(ip) << " failed: " << pcap_geterr(handle.get()));
        return std::nullopt;
    }

    auto deadline = std::chrono::steady_clock::now() + kDirectedLookupTimeout;
    while (std::chrono::steady_clock::now() < deadline) {
        struct pcap_pkthdr* hdr = nullptr;
        const u_char* data = nullptr;
        int res = pcap_next_ex(handle.get(), &hdr, &data);
        if (res == 0) continue;
        if (res < 0) break;

        auto frame = ArpFrame::decode(data, hdr->caplen);
        if (frame && frame->opcode == ARP_OP_REPLY && frame->sender_ip == ip) {
            return frame->sender_mac;
        }
    }
    return std::nullopt;
}

// ─── /proc parsers ──────────────────────────────────────────────────────────

std::string PcapTransport::default_route_interface() {
    auto route = find_default_route(read_file("/proc/net/route"), std::string());
    return route ? route->iface : std::string();
}

std::optional<IPv4Address> PcapTransport::parse_route_table(const std::string& content,
                                                            const std::string& iface) {
    auto route = find_default_route(content, iface);
    if (!route) return std::nullopt;
    return route->gateway;
}

std::optional<MACAddress> PcapTransport::parse_neighbour_table(const std::string& content,
                                                               const IPv4Address& ip) {
    const std::string wanted = ip_to_string(ip);

    std::istringstream lines(content);
    std::string line;
    std::getline(lines, line);  // header

    while (std::getline(lines, line)) {
        std::istringstream cols(line);
        std::string addr, hw_type, flags_hex, hw_addr;
        if (!(cols >> addr >> hw_type >> flags_hex >> hw_addr)) continue;
        if (addr != wanted) continue;

        unsigned long flags = 0;
        try {
            flags = std::stoul(flags_hex, nullptr, 16);
        } catch (const std::exception&) {
            continue;
        }
        if (!(flags & kArpFlagComplete)) continue;

        auto mac = parse_mac(hw_addr);
        if (mac && *mac != kZeroMAC) return mac;
    }
    return std::nullopt;
}

} // namespace ncf
