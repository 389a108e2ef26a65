#include <gtest/gtest.h>
#include "ncf_errors.hpp"
#include "ncf_preset_scheduler.hpp"
#include "fakes.hpp"

using namespace ncf;
using namespace ncf::testing_fakes;
using namespace std::chrono_literals;

namespace {

SpoofTiming fast_timing() {
    SpoofTiming t;
    t.interval      = 10ms;
    t.backoff       = 20ms;
    t.stop_timeout  = 2000ms;
    t.restore_count = 5;
    return t;
}

} // namespace

class PresetSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        link = std::make_shared<FakeLinkTransport>();
        link->add_device("aa:bb:cc:dd:ee:ff", "192.168.1.50");
        directory = std::make_unique<DeviceDirectory>(link, 10ms);
        engine = std::make_unique<SpoofEngine>(link, *directory, fast_timing());
        scheduler = std::make_unique<PresetScheduler>(state, *engine, triggers);
    }

    void TearDown() override {
        engine->stop();
    }

    void set_target() {
        std::lock_guard<std::mutex> lock(state.mu);
        state.target = BlockTarget{"AA:BB:CC:DD:EE:FF", std::string("Tablet")};
    }

    std::string active_mode() {
        std::lock_guard<std::mutex> lock(state.mu);
        return state.active_mode;
    }

    AppState state;
    FakeTriggerScheduler triggers;
    std::shared_ptr<FakeLinkTransport> link;
    std::unique_ptr<DeviceDirectory> directory;
    std::unique_ptr<SpoofEngine> engine;
    std::unique_ptr<PresetScheduler> scheduler;
};

// ==================== reconfigure ====================

TEST_F(PresetSchedulerTest, TwoTriggersPerEnabledPreset) {
    scheduler->reconfigure(default_presets());
    EXPECT_EQ(triggers.size(), 8u);
    EXPECT_EQ(triggers.clear_calls(), 1);

    auto regs = triggers.registered();
    for (size_t i = 0; i < regs.size(); i += 2) {
        const std::string& start_id = regs[i].first;
        const std::string& end_id = regs[i + 1].first;
        ASSERT_GE(start_id.size(), 6u);
        EXPECT_EQ(start_id.substr(start_id.size() - 6), "_start");
        EXPECT_EQ(end_id.substr(0, end_id.size() - 4) + "_start", start_id);
    }
}

TEST_F(PresetSchedulerTest, DisabledPresetsGetNoTriggers) {
    PresetTable presets = default_presets();
    presets["Lunch"].enabled = false;
    presets["Dinner"].enabled = false;

    scheduler->reconfigure(presets);
    EXPECT_EQ(triggers.size(), 4u);
    EXPECT_FALSE(triggers.fire("Lunch_start"));
    EXPECT_TRUE(triggers.fire("Bedtime_start"));
}

TEST_F(PresetSchedulerTest, ReconfigureReplacesWholeTable) {
    scheduler->reconfigure(default_presets());

    PresetTable only_one;
    only_one["Nap"] = PresetWindow{"Nap", {14, 0}, {15, 0}, true};
    scheduler->reconfigure(only_one);

    auto regs = triggers.registered();
    ASSERT_EQ(regs.size(), 2u);
    EXPECT_EQ(regs[0].first, "Nap_start");
    EXPECT_EQ(regs[0].second, (TimeOfDay{14, 0}));
    EXPECT_EQ(regs[1].first, "Nap_end");
    EXPECT_EQ(regs[1].second, (TimeOfDay{15, 0}));
}

TEST_F(PresetSchedulerTest, ZeroLengthWindowStillRegistersBothEdges) {
    PresetTable presets;
    presets["Blink"] = PresetWindow{"Blink", {10, 0}, {10, 0}, true};
    scheduler->reconfigure(presets);

    auto regs = triggers.registered();
    ASSERT_EQ(regs.size(), 2u);
    EXPECT_EQ(regs[0].first, "Blink_start");
    EXPECT_EQ(regs[1].first, "Blink_end");
}

TEST_F(PresetSchedulerTest, TriggerIds) {
    EXPECT_EQ(PresetScheduler::trigger_id("Bedtime", PresetEdge::Start), "Bedtime_start");
    EXPECT_EQ(PresetScheduler::trigger_id("Bedtime", PresetEdge::End), "Bedtime_end");
}

// ==================== apply_preset ====================

TEST_F(PresetSchedulerTest, StartEdgeBlocksAndSetsMode) {
    set_target();
    scheduler->reconfigure(default_presets());

    ASSERT_TRUE(triggers.fire("Lunch_start"));
    EXPECT_TRUE(engine->is_blocking());
    EXPECT_EQ(active_mode(), "Lunch");

    ASSERT_TRUE(triggers.fire("Lunch_end"));
    EXPECT_FALSE(engine->is_blocking());
    EXPECT_EQ(active_mode(), kManualMode);
}

TEST_F(PresetSchedulerTest, StaleEndEdgeLeavesOtherModeAlone) {
    set_target();
    scheduler->reconfigure(default_presets());

    ASSERT_TRUE(triggers.fire("Dinner_start"));
    ASSERT_TRUE(triggers.fire("Lunch_end"));
    EXPECT_TRUE(engine->is_blocking());
    EXPECT_EQ(active_mode(), "Dinner");
}

TEST_F(PresetSchedulerTest, LaterPresetTakesOverActiveMode) {
    set_target();
    scheduler->reconfigure(default_presets());

    ASSERT_TRUE(triggers.fire("Dinner_start"));
    ASSERT_TRUE(triggers.fire("Bedtime_start"));
    EXPECT_EQ(active_mode(), "Bedtime");

    // Dinner's end no longer owns the block
    ASSERT_TRUE(triggers.fire("Dinner_end"));
    EXPECT_TRUE(engine->is_blocking());

    ASSERT_TRUE(triggers.fire("Bedtime_end"));
    EXPECT_FALSE(engine->is_blocking());
}

TEST_F(PresetSchedulerTest, StartWithoutTargetOnlySetsMode) {
    scheduler->reconfigure(default_presets());
    ASSERT_TRUE(triggers.fire("Breakfast_start"));
    EXPECT_EQ(active_mode(), "Breakfast");
    EXPECT_FALSE(engine->is_blocking());
    EXPECT_EQ(link->scan_calls(), 0);
}

TEST_F(PresetSchedulerTest, ZeroLengthWindowEndsUnblocked) {
    set_target();
    PresetTable presets;
    presets["Blink"] = PresetWindow{"Blink", {10, 0}, {10, 0}, true};
    scheduler->reconfigure(presets);

    // Same instant: fired in registration order
    for (const auto& [id, at] : triggers.registered()) {
        ASSERT_TRUE(triggers.fire(id));
    }
    EXPECT_FALSE(engine->is_blocking());
    EXPECT_EQ(active_mode(), kManualMode);
}

TEST_F(PresetSchedulerTest, UnresolvableTargetKeepsModeButStaysIdle) {
    {
        std::lock_guard<std::mutex> lock(state.mu);
        state.target = BlockTarget{"11:22:33:44:55:66", std::nullopt};
    }
    scheduler->apply_preset("Lunch", PresetEdge::Start);
    EXPECT_EQ(active_mode(), "Lunch");
    EXPECT_FALSE(engine->is_blocking());
}

// ==================== set_mode ====================

TEST_F(PresetSchedulerTest, SetModeInsideWindowBlocks) {
    set_target();
    ModeResult r = scheduler->set_mode("Bedtime", TimeOfDay{23, 0});
    EXPECT_EQ(r.active_mode, "Bedtime");
    EXPECT_TRUE(r.should_block);
    EXPECT_TRUE(r.is_blocking);
    EXPECT_TRUE(engine->is_blocking());
}

TEST_F(PresetSchedulerTest, SetModeOutsideWindowUnblocks) {
    set_target();
    ASSERT_TRUE(engine->start("AA:BB:CC:DD:EE:FF"));

    ModeResult r = scheduler->set_mode("Lunch", TimeOfDay{23, 0});
    EXPECT_EQ(r.active_mode, "Lunch");
    EXPECT_FALSE(r.should_block);
    EXPECT_FALSE(r.is_blocking);
    EXPECT_FALSE(engine->is_blocking());
}

TEST_F(PresetSchedulerTest, SetModeWithoutTargetReportsShouldBlockOnly) {
    ModeResult r = scheduler->set_mode("Bedtime", TimeOfDay{2, 0});
    EXPECT_TRUE(r.should_block);
    EXPECT_FALSE(r.is_blocking);
    EXPECT_EQ(active_mode(), "Bedtime");
}

TEST_F(PresetSchedulerTest, ManualLeavesBlockingUntouched) {
    set_target();
    ASSERT_TRUE(engine->start("AA:BB:CC:DD:EE:FF"));
    {
        std::lock_guard<std::mutex> lock(state.mu);
        state.active_mode = "Dinner";
    }

    ModeResult r = scheduler->set_mode(kManualMode, TimeOfDay{12, 0});
    EXPECT_EQ(r.active_mode, kManualMode);
    EXPECT_TRUE(r.is_blocking);
    EXPECT_TRUE(engine->is_blocking());
    EXPECT_EQ(active_mode(), kManualMode);
}

TEST_F(PresetSchedulerTest, UnknownModeIsRejected) {
    EXPECT_THROW(scheduler->set_mode("Recess", TimeOfDay{12, 0}), ValidationError);
    EXPECT_EQ(active_mode(), kManualMode);
}

// ==================== next_scheduled_action ====================

TEST_F(PresetSchedulerTest, NextActionFormatsIdAndTime) {
    EXPECT_FALSE(scheduler->next_scheduled_action().has_value());

    triggers.set_next(ScheduledFire{"Lunch_start", local_time(12, 0)});
    auto next = scheduler->next_scheduled_action();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, "Lunch_start at 12:00");
}
