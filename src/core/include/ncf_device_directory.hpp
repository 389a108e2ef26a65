#pragma once

/**
 * @file ncf_device_directory.hpp
 * @brief MAC -> IP resolution by live subnet sweep
 */

#include "ncf_arp.hpp"
#include "ncf_link_transport.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ncf {

struct DeviceRecord {
    std::string mac;   ///< Normalized "AA:BB:CC:DD:EE:FF"
    std::string ip;
};

/**
 * @brief Stateless device lookup
 *
 * Every call sweeps the /24 around the interface address (host bits
 * zeroed) with a fixed timeout. Nothing is cached between calls.
 */
class DeviceDirectory {
public:
    static constexpr uint8_t kScanPrefix = 24;

    DeviceDirectory(std::shared_ptr<ILinkTransport> link,
                    std::chrono::milliseconds scan_timeout);

    /**
     * @brief Current IP of @p mac (case-insensitive match)
     * @return std::nullopt when the device did not answer within the timeout
     */
    std::optional<IPv4Address> resolve_ip(const std::string& mac);

    /// Unfiltered sweep results, in reply order
    std::vector<DeviceRecord> list_devices();

    std::chrono::milliseconds scan_timeout() const { return scan_timeout_; }

private:
    std::vector<ARPEntry> sweep();

    std::shared_ptr<ILinkTransport> link_;
    std::chrono::milliseconds scan_timeout_;
};

} // namespace ncf
