#pragma once

/**
 * @file ncf_spoof_engine.hpp
 * @brief Block state machine and the background ARP spoof loop
 */

#include "ncf_arp.hpp"
#include "ncf_device_directory.hpp"
#include "ncf_link_transport.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ncf {

enum class BlockStatus {
    Idle,
    Blocking
};

const char* to_string(BlockStatus status);

/**
 * @brief Loop cadence and shutdown bounds
 */
struct SpoofTiming {
    std::chrono::milliseconds interval{1000};      ///< Between spoof rounds
    std::chrono::milliseconds backoff{2000};       ///< After a failed send
    std::chrono::milliseconds stop_timeout{5000};  ///< Join bound in stop()
    int restore_count = 5;                          ///< Restore frames per direction
};

/**
 * @brief Addresses resolved once when a session starts
 */
struct SessionAddresses {
    MACAddress  our_mac{};
    MACAddress  target_mac{};
    IPv4Address target_ip{};
    IPv4Address gateway_ip{};
    MACAddress  gateway_mac{};
};

struct SpoofStats {
    uint64_t sessions_started    = 0;
    uint64_t spoof_frames_sent   = 0;
    uint64_t send_failures       = 0;
    uint64_t restore_frames_sent = 0;
};

/**
 * @brief One-shot cancellation signal that can also be slept on
 */
class CancellationToken {
public:
    void cancel();
    bool cancelled() const;

    /**
     * @brief Sleep up to @p d, waking early on cancel()
     * @return true if cancelled
     */
    bool wait_for(std::chrono::milliseconds d) const;

private:
    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

/**
 * @brief Idle/Blocking state machine owning at most one spoof loop
 *
 * start() resolves the target IP (subnet sweep) and the gateway IP/MAC,
 * caches them for the session and launches the loop. Each round tells the
 * target that the gateway IP is at our MAC and tells the gateway that the
 * target IP is at our MAC; we never forward, so the target is cut off.
 * On cancellation the loop sends restore_count correct replies to each
 * side before exiting.
 *
 * start() and stop() are serialized by one mutex. The loop itself only
 * reads its own copy of the session and the cancellation token.
 */
class SpoofEngine {
public:
    SpoofEngine(std::shared_ptr<ILinkTransport> link,
                DeviceDirectory& directory,
                SpoofTiming timing = SpoofTiming{});
    ~SpoofEngine();

    SpoofEngine(const SpoofEngine&) = delete;
    SpoofEngine& operator=(const SpoofEngine&) = delete;

    /**
     * @brief Begin blocking @p target_mac
     * @return true if blocking (including "already blocking"); false on a
     *         resolution failure, in which case the engine stays Idle
     */
    bool start(const std::string& target_mac);

    /**
     * @brief Cancel the loop and wait up to SpoofTiming::stop_timeout
     *
     * Always ends Idle.
     * @return false only if the loop did not acknowledge in time
     */
    bool stop();

    BlockStatus status() const;
    bool is_blocking() const { return status() == BlockStatus::Blocking; }

    /// Cached addresses of the live session, if any
    std::optional<SessionAddresses> session() const;

    SpoofStats stats() const;
    const SpoofTiming& timing() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ncf
