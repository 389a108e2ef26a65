#pragma once

/**
 * @file ncf_timer_scheduler.hpp
 * @brief Recurring daily triggers
 */

#include "ncf_schedule.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace ncf {

/**
 * @brief Soonest upcoming fire of a trigger table
 */
struct ScheduledFire {
    std::string id;
    std::chrono::system_clock::time_point when;
};

/**
 * @brief Trigger table abstraction used by PresetScheduler
 */
class ITriggerScheduler {
public:
    using Callback = std::function<void()>;

    virtual ~ITriggerScheduler() = default;

    /// Register (or replace) a trigger firing every day at @p at local time
    virtual void schedule(const std::string& id, TimeOfDay at, Callback cb) = 0;

    /// Drop every trigger; does not wait for a callback already running
    virtual void clear() = 0;

    virtual std::optional<ScheduledFire> next_fire() const = 0;
    virtual size_t size() const = 0;
};

/**
 * @brief Next local-time occurrence of @p at strictly after @p now
 */
std::chrono::system_clock::time_point
next_daily_occurrence(std::chrono::system_clock::time_point now, TimeOfDay at);

/**
 * @brief ITriggerScheduler backed by one timer thread
 *
 * Callbacks run on the timer thread, outside the table lock, so a callback
 * may call back into schedule()/clear(). Triggers due at the same instant
 * fire in the order they were registered.
 *
 * The thread never sleeps longer than @p resync at a time and re-reads
 * the clock on every wake, so a wall-clock step is picked up within
 * that period.
 */
class DailyTimerScheduler : public ITriggerScheduler {
public:
    using Clock = std::chrono::system_clock;
    using NowFn = std::function<Clock::time_point()>;

    explicit DailyTimerScheduler(NowFn now = &Clock::now,
                                 std::chrono::milliseconds resync = std::chrono::seconds(30));
    ~DailyTimerScheduler() override;

    DailyTimerScheduler(const DailyTimerScheduler&) = delete;
    DailyTimerScheduler& operator=(const DailyTimerScheduler&) = delete;

    void start();
    void stop();
    bool is_running() const;

    void schedule(const std::string& id, TimeOfDay at, Callback cb) override;
    void clear() override;
    std::optional<ScheduledFire> next_fire() const override;
    size_t size() const override;

private:
    struct Job {
        TimeOfDay         at;
        Callback          cb;
        Clock::time_point next;
        uint64_t          seq = 0;
    };

    void run();

    // Soonest job, ties broken by registration order; table lock held
    std::map<std::string, Job>::const_iterator soonest_locked() const;

    NowFn                      now_;
    std::chrono::milliseconds  resync_;
    std::map<std::string, Job> jobs_;
    uint64_t                   next_seq_ = 0;
    mutable std::mutex         mu_;
    std::condition_variable    cv_;
    std::atomic<bool>          running_{false};
    std::thread                thread_;
};

} // namespace ncf
