#include <gtest/gtest.h>
#include "ncf_config.hpp"

#include <cstdio>
#include <fstream>

using namespace ncf;

TEST(ConfigTest, Defaults) {
    Config cfg;
    EXPECT_EQ(cfg.get("network.interface"), "auto");
    EXPECT_EQ(cfg.get("api.host"), "127.0.0.1");
    EXPECT_EQ(cfg.getInt("api.port"), 8000);
    EXPECT_EQ(cfg.get("state.file"), "netcurfew_state.json");
    EXPECT_EQ(cfg.getMillis("scan.timeout_ms", 0), std::chrono::milliseconds(3000));
    EXPECT_EQ(cfg.getMillis("spoof.interval_ms", 0), std::chrono::milliseconds(1000));
    EXPECT_EQ(cfg.getMillis("spoof.backoff_ms", 0), std::chrono::milliseconds(2000));
    EXPECT_EQ(cfg.getMillis("spoof.stop_timeout_ms", 0), std::chrono::milliseconds(5000));
    EXPECT_EQ(cfg.getInt("spoof.restore_count"), 5);
    EXPECT_EQ(cfg.get("log.level"), "info");
    EXPECT_TRUE(cfg.getBool("log.console"));
    EXPECT_EQ(cfg.get("log.file"), "");
}

TEST(ConfigTest, LoadFromFileOverridesAndSkipsComments) {
    const std::string path = ::testing::TempDir() + "ncf_config_test.conf";
    {
        std::ofstream out(path);
        out << "# comment\n"
            << "; another comment\n"
            << "\n"
            << "api.port = 9090\n"
            << "  network.interface\t=  wlan0  \n"
            << "log.console=off\r\n"
            << "line without equals\n";
    }

    Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(path));
    EXPECT_EQ(cfg.getInt("api.port"), 9090);
    EXPECT_EQ(cfg.get("network.interface"), "wlan0");
    EXPECT_FALSE(cfg.getBool("log.console", true));
    EXPECT_EQ(cfg.get("api.host"), "127.0.0.1");
    EXPECT_EQ(cfg.get("line without equals", "absent"), "absent");
    std::remove(path.c_str());
}

TEST(ConfigTest, MissingFileReportsFalse) {
    Config cfg;
    EXPECT_FALSE(cfg.loadFromFile(::testing::TempDir() + "does_not_exist.conf"));
    EXPECT_EQ(cfg.getInt("api.port"), 8000);
}

TEST(ConfigTest, MalformedNumbersThrow) {
    Config cfg;
    cfg.set("api.port", "eighty");
    EXPECT_THROW(cfg.getInt("api.port"), ConfigError);
    cfg.set("api.port", "80x");
    EXPECT_THROW(cfg.getInt("api.port"), ConfigError);
    cfg.set("spoof.interval_ms", "-5");
    EXPECT_THROW(cfg.getMillis("spoof.interval_ms", 1000), ConfigError);
}

TEST(ConfigTest, EmptyValueFallsBackToDefault) {
    Config cfg;
    cfg.set("api.port", "");
    EXPECT_EQ(cfg.getInt("api.port", 1234), 1234);
    EXPECT_EQ(cfg.getInt("unknown.key", 7), 7);
}

TEST(ConfigTest, BoolSpellings) {
    Config cfg;
    for (const char* v : {"true", "TRUE", "1", "yes", "On"}) {
        cfg.set("flag", v);
        EXPECT_TRUE(cfg.getBool("flag")) << v;
    }
    for (const char* v : {"false", "0", "no", "off", "maybe"}) {
        cfg.set("flag", v);
        EXPECT_FALSE(cfg.getBool("flag", true)) << v;
    }
}
