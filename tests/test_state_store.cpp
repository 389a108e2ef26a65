#include <gtest/gtest.h>
#include "ncf_errors.hpp"
#include "ncf_state_store.hpp"

#include <cstdio>
#include <fstream>
#include <string>

using namespace ncf;
using json = nlohmann::json;

class StateStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path = ::testing::TempDir() + "ncf_state_" + info->name() + ".json";
        std::remove(path.c_str());
    }

    void TearDown() override {
        std::remove(path.c_str());
    }

    void write(const std::string& content) {
        std::ofstream out(path, std::ios::trunc);
        out << content;
    }

    std::string path;
};

TEST_F(StateStoreTest, MissingFileGivesDefaults) {
    StateStore store(path);
    PersistedState s = store.load();
    EXPECT_EQ(s.presets, default_presets());
    EXPECT_FALSE(s.target.has_value());
}

TEST_F(StateStoreTest, SaveThenLoad) {
    StateStore store(path);

    PersistedState s;
    s.presets["Lunch"] = PresetWindow{"Lunch", {11, 45}, {12, 30}, false};
    s.target = BlockTarget{"AA:BB:CC:DD:EE:FF", std::string("Kid's tablet")};
    ASSERT_TRUE(store.save(s));

    PersistedState loaded = store.load();
    EXPECT_EQ(loaded.presets, s.presets);
    ASSERT_TRUE(loaded.target.has_value());
    EXPECT_EQ(*loaded.target, *s.target);
}

TEST_F(StateStoreTest, SavedDocumentShape) {
    StateStore store(path);
    PersistedState s;
    ASSERT_TRUE(store.save(s));

    std::ifstream in(path);
    json doc = json::parse(in);
    EXPECT_TRUE(doc.at("target_mac").is_null());
    EXPECT_TRUE(doc.at("target_name").is_null());
    EXPECT_EQ(doc.at("presets").at("Bedtime"),
              (json{{"start", "21:00"}, {"end", "06:00"}, {"enabled", true}}));
}

TEST_F(StateStoreTest, MissingTopLevelKeysTakeDefaults) {
    write(R"({"target_mac": "aa-bb-cc-dd-ee-ff"})");
    PersistedState s = StateStore(path).load();
    EXPECT_EQ(s.presets, default_presets());
    ASSERT_TRUE(s.target.has_value());
    EXPECT_EQ(s.target->mac, "AA:BB:CC:DD:EE:FF");
    EXPECT_FALSE(s.target->name.has_value());
}

TEST_F(StateStoreTest, PresetsKeyReplacesWholeTable) {
    write(R"({"presets": {"Nap": {"start": "14:00", "end": "15:00"}}})");
    PersistedState s = StateStore(path).load();
    ASSERT_EQ(s.presets.size(), 1u);
    const PresetWindow& nap = s.presets.at("Nap");
    EXPECT_EQ(nap.name, "Nap");
    EXPECT_EQ(nap.start, (TimeOfDay{14, 0}));
    EXPECT_EQ(nap.end, (TimeOfDay{15, 0}));
    EXPECT_TRUE(nap.enabled);
}

TEST_F(StateStoreTest, InvalidJsonFailsLoad) {
    write("{ not json");
    EXPECT_THROW(StateStore(path).load(), ConfigError);
}

TEST_F(StateStoreTest, SchemaViolationsNameTheField) {
    const std::pair<const char*, const char*> cases[] = {
        {R"([1, 2, 3])",                                                  "object"},
        {R"({"presets": []})",                                            "presets"},
        {R"({"presets": {"Lunch": {"end": "13:00"}}})",                   "presets.Lunch.start"},
        {R"({"presets": {"Lunch": {"start": "12:00", "end": "25:00"}}})", "presets.Lunch.end"},
        {R"({"presets": {"Lunch": {"start": 12, "end": "13:00"}}})",      "presets.Lunch.start"},
        {R"({"presets": {"Lunch": {"start": "12:00", "end": "13:00", "enabled": "yes"}}})",
                                                                          "presets.Lunch.enabled"},
        {R"({"target_mac": 42})",                                         "target_mac"},
        {R"({"target_mac": "nope"})",                                     "target_mac"},
        {R"({"target_mac": "aa:bb:cc:dd:ee:ff", "target_name": 7})",      "target_name"},
    };

    for (const auto& [doc, field] : cases) {
        write(doc);
        try {
            StateStore(path).load();
            ADD_FAILURE() << "accepted: " << doc;
        } catch (const ConfigError& e) {
            EXPECT_NE(std::string(e.what()).find(field), std::string::npos)
                << doc << " -> " << e.what();
        }
    }
}

TEST_F(StateStoreTest, NullTargetMeansNoTarget) {
    write(R"({"target_mac": null, "target_name": "ignored"})");
    PersistedState s = StateStore(path).load();
    EXPECT_FALSE(s.target.has_value());
}

TEST_F(StateStoreTest, SaveToUnwritablePathFails) {
    StateStore store(::testing::TempDir() + "no_such_dir/state.json");
    EXPECT_FALSE(store.save(PersistedState{}));
}

TEST(PresetJsonTest, Shape) {
    PresetWindow w{"Dinner", {19, 0}, {20, 0}, true};
    EXPECT_EQ(preset_to_json(w), (json{{"start", "19:00"}, {"end", "20:00"}, {"enabled", true}}));

    json all = presets_to_json(default_presets());
    EXPECT_EQ(all.size(), 4u);
    EXPECT_TRUE(all.contains("Breakfast"));
}
