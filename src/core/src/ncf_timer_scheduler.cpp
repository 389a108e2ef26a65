#include "ncf_timer_scheduler.hpp"
#include "ncf_logger.hpp"

#include <algorithm>
#include <ctime>
#include <exception>

namespace ncf {

std::chrono::system_clock::time_point
next_daily_occurrence(std::chrono::system_clock::time_point now, TimeOfDay at) {
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&t, &local);

    local.tm_hour  = at.hour;
    local.tm_min   = at.minute;
    local.tm_sec   = 0;
    local.tm_isdst = -1;

    std::time_t candidate = std::mktime(&local);
    auto tp = std::chrono::system_clock::from_time_t(candidate);
    if (tp > now) return tp;

    // Re-normalise through mktime so a DST switch keeps the wall-clock time
    local.tm_mday += 1;
    local.tm_hour  = at.hour;
    local.tm_min   = at.minute;
    local.tm_sec   = 0;
    local.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&local));
}

DailyTimerScheduler::DailyTimerScheduler(NowFn now, std::chrono::milliseconds resync)
    : now_(std::move(now)), resync_(resync) {}

DailyTimerScheduler::~DailyTimerScheduler() {
    stop();
}

void DailyTimerScheduler::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread(&DailyTimerScheduler::run, this);
}

void DailyTimerScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!running_.exchange(false)) return;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

bool DailyTimerScheduler::is_running() const {
    return running_.load();
}

void DailyTimerScheduler::schedule(const std::string& id, TimeOfDay at, Callback cb) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        Job job;
        job.at   = at;
        job.cb   = std::move(cb);
        job.next = next_daily_occurrence(now_(), at);
        job.seq  = next_seq_++;
        jobs_[id] = std::move(job);
    }
    cv_.notify_all();
}

void DailyTimerScheduler::clear() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        jobs_.clear();
    }
    cv_.notify_all();
}

std::map<std::string, DailyTimerScheduler::Job>::const_iterator
DailyTimerScheduler::soonest_locked() const {
    auto best = jobs_.end();
    for (auto it = jobs_.begin(); it != jobs_.end(); ++it) {
        if (best == jobs_.end() ||
            it->second.next < best->second.next ||
            (it->second.next == best->second.next && it->second.seq < best->second.seq)) {
            best = it;
        }
    }
    return best;
}

std::optional<ScheduledFire> DailyTimerScheduler::next_fire() const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = soonest_locked();
    if (it == jobs_.end()) return std::nullopt;
    return ScheduledFire{it->first, it->second.next};
}

size_t DailyTimerScheduler::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return jobs_.size();
}

void DailyTimerScheduler::run() {
    std::unique_lock<std::mutex> lock(mu_);
    while (running_.load()) {
        auto soonest = soonest_locked();
        if (soonest == jobs_.end()) {
            cv_.wait(lock);
            continue;
        }

        const auto due = soonest->second.next;
        const auto now = now_();
        if (now < due) {
            // Woken by schedule()/clear()/stop() or the resync period: re-evaluate
            cv_.wait_for(lock, std::min<Clock::duration>(due - now, resync_));
            continue;
        }

        auto it = jobs_.find(soonest->first);
        std::string id = it->first;
        Callback cb = it->second.cb;
        it->second.next = next_daily_occurrence(now, it->second.at);

        lock.unlock();
        NCF_LOG_DEBUG("Trigger " << id << " fired");
        try {
            if (cb) cb();
        } catch (const std::exception& e) {
            NCF_LOG_ERROR("Trigger " << id << " failed: " << e.what());
        }
        lock.lock();
    }
}

} // namespace ncf
