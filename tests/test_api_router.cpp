#include <gtest/gtest.h>
#include "ncf_api_router.hpp"
#include "control_harness.hpp"

using namespace ncf;
using namespace ncf::testing_fakes;
using json = nlohmann::json;

class ApiRouterTest : public ControlHarness {
protected:
    void SetUp() override {
        ControlHarness::SetUp();
        router = std::make_unique<ApiRouter>(*control);
    }

    ApiResponse get(const std::string& path) { return router->handle("GET", path, ""); }
    ApiResponse post(const std::string& path, const json& body) {
        return router->handle("POST", path, body.dump());
    }

    std::unique_ptr<ApiRouter> router;
};

// ==================== Routing ====================

TEST_F(ApiRouterTest, HealthCheck) {
    ApiResponse r = get("/");
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body.at("status"), "ok");
}

TEST_F(ApiRouterTest, UnknownPathAndMethod) {
    EXPECT_EQ(get("/nope").status, 404);
    EXPECT_EQ(router->handle("PUT", "/status", "").status, 405);
    EXPECT_EQ(get("/toggle_block").status, 405);
}

TEST_F(ApiRouterTest, PathNormalisation) {
    EXPECT_EQ(ApiRouter::normalize_path("/status/"), "/status");
    EXPECT_EQ(ApiRouter::normalize_path("/status?verbose=1"), "/status");
    EXPECT_EQ(ApiRouter::normalize_path(""), "/");
    EXPECT_EQ(get("/status/").status, 200);
}

TEST_F(ApiRouterTest, Preflight) {
    ApiResponse r = router->handle("OPTIONS", "/target", "");
    EXPECT_EQ(r.status, 204);
    EXPECT_TRUE(r.body.is_null());

    const std::string allow = router->allowed_methods("/target");
    EXPECT_NE(allow.find("POST"), std::string::npos);
    EXPECT_NE(allow.find("DELETE"), std::string::npos);
    EXPECT_NE(allow.find("OPTIONS"), std::string::npos);
    EXPECT_TRUE(router->allowed_methods("/nope").empty());
}

// ==================== Request validation ====================

TEST_F(ApiRouterTest, MalformedBodiesAre422) {
    EXPECT_EQ(router->handle("POST", "/toggle_block", "{oops").status, 422);
    EXPECT_EQ(post("/toggle_block", json::object()).status, 422);
    EXPECT_EQ(post("/toggle_block", json{{"block", "yes"}}).status, 422);
    EXPECT_EQ(post("/set_mode", json{{"mode", 3}}).status, 422);
    EXPECT_EQ(post("/update_schedule", json{{"preset", "Lunch"}, {"start", "12:00"}}).status, 422);
    EXPECT_EQ(post("/target", json{{"name", "x"}}).status, 422);
    EXPECT_EQ(post("/target", json{{"mac", "AA:BB:CC:DD:EE:FF"}, {"name", 5}}).status, 422);
}

TEST_F(ApiRouterTest, DomainErrorsAre400) {
    ApiResponse no_target = post("/toggle_block", json{{"block", true}});
    EXPECT_EQ(no_target.status, 400);
    EXPECT_EQ(no_target.body.at("detail"), "No target MAC address set");

    EXPECT_EQ(post("/set_mode", json{{"mode", "Recess"}}).status, 400);
    EXPECT_EQ(post("/update_schedule",
                   json{{"preset", "Lunch"}, {"start", "12:00"}, {"end", "99:00"}}).status, 400);
    EXPECT_EQ(post("/target", json{{"mac", "zz"}}).status, 400);
}

// ==================== Endpoints ====================

TEST_F(ApiRouterTest, StatusShape) {
    ApiResponse r = get("/status");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.body.at("is_blocking"), false);
    EXPECT_EQ(r.body.at("active_mode"), "Manual");
    EXPECT_TRUE(r.body.at("target_mac").is_null());
    EXPECT_TRUE(r.body.at("target_name").is_null());
    EXPECT_TRUE(r.body.at("next_scheduled_action").is_null());
    EXPECT_EQ(r.body.at("presets").at("Bedtime").at("start"), "21:00");
}

TEST_F(ApiRouterTest, TargetLifecycle) {
    ApiResponse set = post("/target", json{{"mac", "aa:bb:cc:dd:ee:ff"}, {"name", "Tablet"}});
    ASSERT_EQ(set.status, 200);
    EXPECT_EQ(set.body.at("target_mac"), "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(set.body.at("target_name"), "Tablet");

    ApiResponse on = post("/toggle_block", json{{"block", true}});
    ASSERT_EQ(on.status, 200);
    EXPECT_EQ(on.body.at("is_blocking"), true);
    EXPECT_EQ(on.body.at("message"), "Target BLOCKED");

    EXPECT_EQ(get("/status").body.at("is_blocking"), true);

    ApiResponse cleared = router->handle("DELETE", "/target", "");
    ASSERT_EQ(cleared.status, 200);
    EXPECT_EQ(cleared.body.at("success"), true);
    EXPECT_FALSE(engine->is_blocking());
    EXPECT_TRUE(get("/status").body.at("target_mac").is_null());
}

TEST_F(ApiRouterTest, ToggleFailureIs500) {
    post("/target", json{{"mac", "11:22:33:44:55:66"}});
    ApiResponse r = post("/toggle_block", json{{"block", true}});
    EXPECT_EQ(r.status, 500);
    EXPECT_EQ(r.body.at("detail"), "Failed to toggle block");
}

TEST_F(ApiRouterTest, SetMode) {
    ApiResponse manual = post("/set_mode", json{{"mode", "Manual"}});
    ASSERT_EQ(manual.status, 200);
    EXPECT_EQ(manual.body.at("active_mode"), "Manual");
    EXPECT_FALSE(manual.body.contains("is_blocking"));

    ApiResponse lunch = post("/set_mode", json{{"mode", "Lunch"}});
    ASSERT_EQ(lunch.status, 200);
    EXPECT_EQ(lunch.body.at("active_mode"), "Lunch");
    EXPECT_TRUE(lunch.body.contains("is_blocking"));
    EXPECT_EQ(lunch.body.at("message").get<std::string>().rfind("Mode set to Lunch", 0), 0u);
}

TEST_F(ApiRouterTest, UpdateSchedule) {
    ApiResponse r = post("/update_schedule",
                         json{{"preset", "Dinner"}, {"start", "18:30"}, {"end", "19:30"}});
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.body.at("preset"), "Dinner");
    EXPECT_EQ(r.body.at("schedule"),
              (json{{"start", "18:30"}, {"end", "19:30"}, {"enabled", true}}));

    EXPECT_EQ(get("/presets").body.at("Dinner").at("start"), "18:30");
}

TEST_F(ApiRouterTest, Devices) {
    post("/target", json{{"mac", "AA:BB:CC:DD:EE:FF"}, {"name", "Tablet"}});
    ApiResponse r = get("/devices");
    ASSERT_EQ(r.status, 200);
    ASSERT_TRUE(r.body.is_array());
    ASSERT_EQ(r.body.size(), 2u);
    EXPECT_EQ(r.body[0].at("mac"), "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(r.body[0].at("ip"), "192.168.1.50");
    EXPECT_EQ(r.body[0].at("name"), "Tablet");
    EXPECT_TRUE(r.body[1].at("name").is_null());
}

TEST_F(ApiRouterTest, Presets) {
    ApiResponse r = get("/presets");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.body.size(), 4u);
    EXPECT_EQ(r.body.at("Lunch").at("enabled"), true);
}
