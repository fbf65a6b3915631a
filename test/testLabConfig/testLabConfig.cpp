/**
 * @file testLabConfig.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 */
#include "labnet/lab_config.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <boost/filesystem.hpp>
#include <cstdlib>
#include <fstream>
#include <optional>

using ::testing::ElementsAre;

using namespace labnet;
using namespace std::chrono;

namespace {

const char* const LAB_JSON = R"({
    "devices": {
        "plug-1": {
            "name": "plug1",
            "friendly_name": "Bench Plug",
            "ip": "192.168.2.5",
            "device_type": "tasmota_device"
        },
        "imx8-01": {
            "friendly_name": "iMX8 Board 1",
            "ip": "192.168.2.31",
            "hostname": "imx8-01.lab",
            "ssh_user": "fio",
            "ports": { "ssh": 2222 },
            "device_type": "development_board",
            "power_switch": "plug-1",
            "relay": true,
            "password_env": "LABNET_TEST_IMX_PASSWORD",
            "tags": [ "imx8", "ci" ]
        },
        "dmm": {
            "name": "Bench DMM",
            "device_type": "test_equipment",
            "model": "34465A",
            "manufacturer": "Keysight"
        },
        "your-device": {
            "ip": "192.168.2.250",
            "status": "template"
        },
        "sample": {
            "ip": "192.168.2.251",
            "device_type": "example"
        }
    },
    "lab_infrastructure": {
        "network_access": {
            "target_network": "10.10.0.0/24",
            "lab_networks": [ "10.10.0.0/24", "10.10.1.0/24" ]
        },
        "relay_gateway": {
            "host": "gateway.lab",
            "user": "relay",
            "port": 6000,
            "password_env": "LABNET_TEST_RELAY_PASSWORD"
        }
    },
    "discovery": {
        "principals": [ "root", "pi" ],
        "scan_width": 32,
        "probe_timeout_ms": 250,
        "identity_expiry_hours": 48,
        "liveness_expiry_minutes": 5,
        "identity_file": "/home/lab/.ssh/lab_ed25519"
    }
})";

/// Sets an environment variable for the lifetime of the guard
class EnvGuard
{
public:
    EnvGuard(const char* name, const char* value) :
        m_name(name)
    {
        if (const char* old = std::getenv(name))
        {
            m_old = old;
        }
        ::setenv(name, value, 1);
    }

    ~EnvGuard()
    {
        if (m_old)
        {
            ::setenv(m_name, m_old->c_str(), 1);
        }
        else
        {
            ::unsetenv(m_name);
        }
    }

private:
    const char* m_name;
    std::optional<std::string> m_old;
};

} // namespace

TEST(testLabConfig, parsesDevices)
{
    auto lab = LabConfig::parse(LAB_JSON);
    ASSERT_EQ(lab.devices().size(), 3u);

    const auto* imx = lab.find("imx8-01");
    ASSERT_NE(imx, nullptr);
    EXPECT_EQ(imx->address, "192.168.2.31");
    EXPECT_EQ(imx->principal, "fio");
    EXPECT_EQ(imx->ssh_port, 2222);
    EXPECT_EQ(imx->power_switch, "plug-1");
    EXPECT_TRUE(imx->relay_eligible);
    EXPECT_THAT(imx->tags, ElementsAre("imx8", "ci"));
    EXPECT_EQ(imx->classification_hint(), Classification::GENERIC);

    const auto* plug = lab.find("plug-1");
    ASSERT_NE(plug, nullptr);
    EXPECT_EQ(plug->principal, "root");
    EXPECT_EQ(plug->ssh_port, DEFAULT_SSH_PORT);
    EXPECT_EQ(plug->classification_hint(), Classification::POWER_SWITCH);
    EXPECT_EQ(plug->display_name(), "Bench Plug");

    const auto* dmm = lab.find("dmm");
    ASSERT_NE(dmm, nullptr);
    EXPECT_TRUE(dmm->address.empty());
    EXPECT_EQ(dmm->classification_hint(), Classification::INSTRUMENT);
    EXPECT_EQ(dmm->display_name(), "Bench DMM");
}

TEST(testLabConfig, skipsTemplateEntries)
{
    auto lab = LabConfig::parse(LAB_JSON);
    EXPECT_EQ(lab.find("your-device"), nullptr);
    EXPECT_EQ(lab.find("sample"), nullptr);
    EXPECT_EQ(lab.find_by_address("192.168.2.250"), nullptr);
}

TEST(testLabConfig, findsByAnyName)
{
    auto lab = LabConfig::parse(LAB_JSON);
    EXPECT_EQ(lab.find("IMX8 BOARD 1")->id, "imx8-01");
    EXPECT_EQ(lab.find("imx8-01.LAB")->id, "imx8-01");
    EXPECT_EQ(lab.find("plug1")->id, "plug-1");
    EXPECT_EQ(lab.find("192.168.2.5")->id, "plug-1");
    EXPECT_EQ(lab.find_by_address("192.168.2.31")->id, "imx8-01");
    EXPECT_EQ(lab.find(""), nullptr);
    EXPECT_EQ(lab.find("nothing"), nullptr);
}

TEST(testLabConfig, powerRelationships)
{
    auto lab = LabConfig::parse(LAB_JSON);
    EXPECT_THAT(lab.controlled_by("plug-1"), ElementsAre("imx8-01"));
    EXPECT_TRUE(lab.controlled_by("imx8-01").empty());

    auto prober = lab.prober_config();
    ASSERT_EQ(prober.controls.count("192.168.2.5"), 1u);
    EXPECT_THAT(prober.controls["192.168.2.5"], ElementsAre("imx8-01"));
    EXPECT_THAT(prober.relay_addresses, ElementsAre("192.168.2.31"));
    EXPECT_THAT(prober.principals, ElementsAre("root", "pi"));
}

TEST(testLabConfig, parsesInfrastructureAndDiscovery)
{
    EnvGuard password("LABNET_TEST_RELAY_PASSWORD", "hunter2");
    auto lab = LabConfig::parse(LAB_JSON);
    EXPECT_EQ(lab.target_network(), "10.10.0.0/24");
    EXPECT_THAT(lab.lab_networks(), ElementsAre("10.10.0.0/24", "10.10.1.0/24"));

    ASSERT_TRUE(lab.relay_gateway());
    EXPECT_EQ(lab.relay_gateway()->host, "gateway.lab");
    EXPECT_EQ(lab.relay_gateway()->principal, "relay");
    EXPECT_EQ(lab.relay_gateway()->port, 6000);
    EXPECT_EQ(lab.relay_gateway()->password, std::optional<std::string>("hunter2"));

    const auto& discovery = lab.discovery();
    EXPECT_EQ(discovery.scan_width, 32u);
    EXPECT_EQ(discovery.probe_timeout, milliseconds(250));
    EXPECT_EQ(discovery.identity_width, 10u);
    EXPECT_EQ(discovery.cache.identity_expiry, hours(48));
    EXPECT_EQ(discovery.cache.liveness_expiry, minutes(5));
}

TEST(testLabConfig, devicePasswordComesFromEnvironment)
{
    auto lab = LabConfig::parse(LAB_JSON);
    const auto* imx = lab.find("imx8-01");
    ASSERT_NE(imx, nullptr);
    EXPECT_EQ(imx->password_env, "LABNET_TEST_IMX_PASSWORD");
    {
        EnvGuard unset("LABNET_TEST_IMX_PASSWORD", "");
        EXPECT_FALSE(imx->password().has_value());
    }
    EnvGuard password("LABNET_TEST_IMX_PASSWORD", "fio-secret");
    EXPECT_EQ(imx->password(), std::optional<std::string>("fio-secret"));
    EXPECT_FALSE(lab.find("plug-1")->password().has_value());
}

TEST(testLabConfig, identityFileReachesProber)
{
    auto lab = LabConfig::parse(LAB_JSON);
    EXPECT_EQ(lab.discovery().identity_file, std::optional<std::string>("/home/lab/.ssh/lab_ed25519"));
    EXPECT_EQ(lab.prober_config().identity_file, std::optional<std::string>("/home/lab/.ssh/lab_ed25519"));
    EXPECT_FALSE(LabConfig::parse("{}").prober_config().identity_file.has_value());
}

TEST(testLabConfig, defaultsWhenSectionsAreMissing)
{
    auto lab = LabConfig::parse("{}");
    EXPECT_TRUE(lab.devices().empty());
    EXPECT_EQ(lab.target_network(), DEFAULT_TARGET_NETWORK);
    EXPECT_FALSE(lab.relay_gateway());
    EXPECT_THAT(lab.discovery().principals, ElementsAre("fio", "root"));
}

TEST(testLabConfig, malformedTextIsConfigError)
{
    EXPECT_THROW(LabConfig::parse("{ \"devices\": "), ConfigError);
    EXPECT_THROW(LabConfig::parse("[ 1, 2 ]"), ConfigError);
    EXPECT_THROW(LabConfig::parse(R"({ "devices": { "x": { "ip": 12 } } })"), ConfigError);
}

TEST(testLabConfig, loadFromFile)
{
    const auto dir = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("labnet-config-%%%%%%");
    boost::filesystem::create_directories(dir);
    const auto path = (dir / "lab_devices.json").string();

    // Missing file is an empty directory
    EXPECT_TRUE(LabConfig::load(path).devices().empty());

    {
        std::ofstream out(path);
        out << LAB_JSON;
    }
    EXPECT_EQ(LabConfig::load(path).devices().size(), 3u);

    {
        std::ofstream out(path);
        out << "not json";
    }
    EXPECT_THROW(LabConfig::load(path), ConfigError);
    boost::filesystem::remove_all(dir);
}

TEST(testLabConfig, environmentOverrides)
{
    const auto dir = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("labnet-env-%%%%%%");
    boost::filesystem::create_directories(dir);
    const auto path = (dir / "lab.json").string();
    {
        std::ofstream out(path);
        out << LAB_JSON;
    }

    EnvGuard config("LABNET_CONFIG", path.c_str());
    EnvGuard cache("LABNET_CACHE", (dir / "cache.json").string().c_str());
    EnvGuard network("TARGET_NETWORK", "172.16.0.0/24");

    auto settings = Settings::from_environment();
    EXPECT_EQ(settings.config_path, path);
    EXPECT_EQ(settings.cache_path, (dir / "cache.json").string());

    auto lab = load_lab_config(settings);
    EXPECT_EQ(lab.devices().size(), 3u);
    EXPECT_EQ(lab.target_network(), "172.16.0.0/24");
    boost::filesystem::remove_all(dir);
}

TEST(testLabConfig, settingsFallBackToHome)
{
    EnvGuard home("HOME", "/home/tester");
    EnvGuard root("LABNET_ROOT", "");
    EnvGuard config("LABNET_CONFIG", "");
    EnvGuard cache("LABNET_CACHE", "");

    auto settings = Settings::from_environment();
    EXPECT_EQ(settings.config_path, "/home/tester/.config/labnet/config/lab_devices.json");
    EXPECT_EQ(settings.cache_path, "/home/tester/.cache/labnet/device_cache.json");
}
