#include "ncf_device_directory.hpp"
#include "ncf_logger.hpp"

#include <exception>

namespace ncf {

DeviceDirectory::DeviceDirectory(std::shared_ptr<ILinkTransport> link,
                                 std::chrono::milliseconds scan_timeout)
    : link_(std::move(link))
    , scan_timeout_(scan_timeout)
{}

std::vector<ARPEntry> DeviceDirectory::sweep() {
    const InterfaceInfo info = link_->interface_info();
    const IPv4Address network = network_address(info.ip, kScanPrefix);

    NCF_LOG_INFO("Scanning network " << ip_to_string(network) << "/" << int(kScanPrefix));

    std::vector<ARPEntry> entries;
    try {
        entries = link_->arp_scan(network, kScanPrefix, scan_timeout_);
    } catch (const std::exception& e) {
        NCF_LOG_ERROR("Network scan failed: " << e.what());
        return {};
    }

    NCF_LOG_INFO("Found " << entries.size() << " devices");
    return entries;
}

std::optional<IPv4Address> DeviceDirectory::resolve_ip(const std::string& mac) {
    auto wanted = parse_mac(mac);
    if (!wanted) {
        NCF_LOG_WARN("resolve_ip: '" << mac << "' is not a MAC address");
        return std::nullopt;
    }

    // MACAddress compares bytes, so the text case never matters here
    for (const auto& entry : sweep()) {
        if (entry.mac == *wanted) {
            return entry.ip;
        }
    }
    return std::nullopt;
}

std::vector<DeviceRecord> DeviceDirectory::list_devices() {
    std::vector<DeviceRecord> out;
    for (const auto& entry : sweep()) {
        out.push_back(DeviceRecord{mac_to_string(entry.mac), ip_to_string(entry.ip)});
    }
    return out;
}

} // namespace ncf
