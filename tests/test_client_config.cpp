#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "ClientConfig.h"

using namespace X32Sync;
using namespace std::chrono_literals;

TEST(ClientConfig, Defaults) {
    ClientConfig config;
    EXPECT_TRUE(config.deviceHost.empty());
    EXPECT_EQ(config.devicePort, 10023);
    EXPECT_EQ(config.localPort, 10300);
    EXPECT_EQ(config.timeout, 10000ms);
    EXPECT_EQ(config.keepAlivePath, "/xremote");
    EXPECT_EQ(config.keepAliveInterval, 7000ms);
    EXPECT_EQ(config.sendPacing, 1ms);
    EXPECT_TRUE(config.verifyWrites);
    EXPECT_EQ(config.decimalDigits, 4);
    EXPECT_TRUE(config.validate());
}

TEST(ClientConfig, JsonOverlaysKnownKeys) {
    ClientConfig config;
    ASSERT_TRUE(config.loadFromJsonString(R"({
        "deviceHost": "192.168.1.50",
        "devicePort": 10024,
        "localPort": 0,
        "timeoutMs": 2500,
        "resendIntervalMs": 100,
        "verifyWrites": false,
        "decimalDigits": 2,
        "unknownKey": "ignored"
    })"));

    EXPECT_EQ(config.deviceHost, "192.168.1.50");
    EXPECT_EQ(config.devicePort, 10024);
    EXPECT_EQ(config.localPort, 0);
    EXPECT_EQ(config.timeout, 2500ms);
    EXPECT_EQ(config.resendInterval, 100ms);
    EXPECT_FALSE(config.verifyWrites);
    EXPECT_EQ(config.decimalDigits, 2);
    // Untouched keys keep their values
    EXPECT_EQ(config.keepAlivePath, "/xremote");
    EXPECT_TRUE(config.validate());
}

TEST(ClientConfig, RejectsMalformedJson) {
    ClientConfig config;
    EXPECT_FALSE(config.loadFromJsonString("{ not json"));
    EXPECT_FALSE(config.loadFromJsonString("[1, 2]"));
    EXPECT_FALSE(config.loadFromJsonString(R"({"devicePort": "high"})"));
    EXPECT_FALSE(config.loadFromJsonString(R"({"timeoutMs": 1.5})"));
    EXPECT_FALSE(config.loadFromJsonString(R"({"decimalDigits": "four"})"));
}

TEST(ClientConfig, DecimalDigitsFromJsonAreValidated) {
    ClientConfig config;
    ASSERT_TRUE(config.loadFromJsonString(R"({"decimalDigits": 12})"));
    EXPECT_EQ(config.decimalDigits, 12);

    std::string error;
    EXPECT_FALSE(config.validate(&error));
    EXPECT_NE(error.find("decimalDigits"), std::string::npos);
}

TEST(ClientConfig, ValidationReportsFirstError) {
    ClientConfig config;
    std::string error;

    config.devicePort = 70000;
    EXPECT_FALSE(config.validate(&error));
    EXPECT_NE(error.find("devicePort"), std::string::npos);

    config = ClientConfig();
    config.timeout = 0ms;
    EXPECT_FALSE(config.validate(&error));
    EXPECT_NE(error.find("timeout"), std::string::npos);

    config = ClientConfig();
    config.keepAlivePath = "xremote";
    EXPECT_FALSE(config.validate(&error));
    EXPECT_NE(error.find("keepAlivePath"), std::string::npos);
}

TEST(ClientConfig, LoadFromFile) {
    std::string path = ::testing::TempDir() + "x32sync_config_test.json";
    {
        std::ofstream file(path);
        file << R"({"deviceHost": "10.0.0.2", "keepAliveIntervalMs": 5000})";
    }

    ClientConfig config;
    EXPECT_TRUE(config.loadFromFile(path));
    EXPECT_EQ(config.deviceHost, "10.0.0.2");
    EXPECT_EQ(config.keepAliveInterval, 5000ms);
    std::remove(path.c_str());

    EXPECT_FALSE(config.loadFromFile(::testing::TempDir() + "missing/x32sync_config.json"));
}

TEST(DiscoveryConfig, Defaults) {
    DiscoveryConfig config;
    EXPECT_EQ(config.ports, (std::vector<int>{kX32Port, kXAirPort}));
    EXPECT_EQ(config.firstHost, 1);
    EXPECT_EQ(config.lastHost, 254);
    EXPECT_EQ(config.probePath, "/info");
    EXPECT_EQ(config.maxPasses, 0);
}

TEST(DiscoveryConfig, ValidationReportsFirstError) {
    EXPECT_TRUE(DiscoveryConfig().validate());

    DiscoveryConfig config;
    std::string error;

    config.firstHost = 200;
    config.lastHost = 10;
    EXPECT_FALSE(config.validate(&error));
    EXPECT_NE(error.find("lastHost"), std::string::npos);

    config = DiscoveryConfig();
    config.firstHost = 0;
    EXPECT_FALSE(config.validate(&error));
    EXPECT_NE(error.find("firstHost"), std::string::npos);

    config = DiscoveryConfig();
    config.lastHost = 255;
    EXPECT_FALSE(config.validate(&error));
    EXPECT_NE(error.find("lastHost"), std::string::npos);

    config = DiscoveryConfig();
    config.ports.clear();
    EXPECT_FALSE(config.validate(&error));
    EXPECT_NE(error.find("port"), std::string::npos);

    config = DiscoveryConfig();
    config.ports = {10023, 70000};
    EXPECT_FALSE(config.validate(&error));
    EXPECT_NE(error.find("70000"), std::string::npos);

    config = DiscoveryConfig();
    config.probeTimeout = 0ms;
    EXPECT_FALSE(config.validate(&error));
    EXPECT_NE(error.find("probeTimeout"), std::string::npos);

    config = DiscoveryConfig();
    config.maxPasses = -1;
    EXPECT_FALSE(config.validate(&error));
    EXPECT_NE(error.find("maxPasses"), std::string::npos);

    config = DiscoveryConfig();
    config.probePath = "info";
    EXPECT_FALSE(config.validate(&error));
    EXPECT_NE(error.find("probePath"), std::string::npos);

    config = DiscoveryConfig();
    config.firstHost = 7;
    config.lastHost = 7;
    EXPECT_TRUE(config.validate());
}
