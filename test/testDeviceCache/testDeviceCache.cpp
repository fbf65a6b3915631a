/**
 * @file testDeviceCache.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 */
#include "mocks.hpp"
#include "labnet/device_cache.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

using namespace labnet;
using namespace std::chrono;
namespace fs = std::filesystem;

namespace {

class TempDir
{
public:
    TempDir()
    {
        std::string pattern = (fs::temp_directory_path() / "labnet-cache-XXXXXX").string();
        char* made = ::mkdtemp(pattern.data());
        if (made == nullptr)
        {
            throw std::runtime_error("mkdtemp failed");
        }
        m_path = made;
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::permissions(m_path, fs::perms::owner_all, ec);
        fs::remove_all(m_path, ec);
    }
    std::string file(const std::string& name) const { return (m_path / name).string(); }
    const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

DeviceIdentity board(const std::string& address, const std::string& hostname)
{
    DeviceIdentity identity;
    identity.address = address;
    identity.hostname = hostname;
    identity.unique_id = hostname + "-id";
    identity.principal = "fio";
    identity.classification = Classification::GENERIC;
    return identity;
}

std::string read_file(const std::string& path)
{
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

TEST(testDeviceCache, memoryPutGetRemove)
{
    MemoryDeviceCache cache;
    EXPECT_FALSE(cache.get("192.168.2.10").has_value());

    cache.put("192.168.2.10", board("192.168.2.10", "eink-01"));
    auto entry = cache.get("192.168.2.10");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->hostname, "eink-01");
    EXPECT_NE(entry->cached_at, system_clock::time_point{});

    EXPECT_TRUE(cache.remove("192.168.2.10"));
    EXPECT_FALSE(cache.remove("192.168.2.10"));
    EXPECT_TRUE(cache.all().empty());
}

TEST(testDeviceCache, atMostOneEntryPerAddress)
{
    MemoryDeviceCache cache;
    cache.put("192.168.2.10", board("192.168.2.10", "first"));
    cache.put("192.168.2.10", board("192.168.2.10", "second"));
    EXPECT_EQ(cache.all().size(), 1u);
    EXPECT_EQ(cache.get("192.168.2.10")->hostname, "second");
}

TEST(testDeviceCache, putKeysByAddressArgument)
{
    MemoryDeviceCache cache;
    cache.put("192.168.2.11", board("10.0.0.1", "moved"));
    ASSERT_TRUE(cache.get("192.168.2.11").has_value());
    EXPECT_EQ(cache.get("192.168.2.11")->address, "192.168.2.11");
}

TEST(testDeviceCache, entriesExpireAfterIdentityExpiry)
{
    ManualClock clock;
    CacheConfig config;
    config.identity_expiry = hours(24 * 7);
    MemoryDeviceCache cache(config, clock.function());

    cache.put("192.168.2.10", board("192.168.2.10", "eink-01"));
    clock.advance(hours(24 * 7) - minutes(1));
    EXPECT_TRUE(cache.get("192.168.2.10").has_value());

    clock.advance(minutes(2));
    EXPECT_FALSE(cache.get("192.168.2.10").has_value());
    // Still present until compacted
    EXPECT_EQ(cache.all().size(), 1u);
    EXPECT_EQ(cache.compact(), 1u);
    EXPECT_TRUE(cache.all().empty());
}

TEST(testDeviceCache, contactFreshness)
{
    DeviceIdentity identity = board("192.168.2.10", "eink-01");
    const auto now = system_clock::now();
    EXPECT_FALSE(is_contact_fresh(identity, now, minutes(10)));
    identity.last_contact = now - minutes(5);
    EXPECT_TRUE(is_contact_fresh(identity, now, minutes(10)));
    identity.last_contact = now - minutes(11);
    EXPECT_FALSE(is_contact_fresh(identity, now, minutes(10)));
}

TEST(testDeviceCache, fileSurvivesRestart)
{
    TempDir dir;
    const auto path = dir.file("device_cache.json");
    {
        FileDeviceCache cache(path);
        auto identity = board("192.168.2.10", "eink-01");
        identity.firmware_version = "4.0.1";
        PowerSwitchAttributes power;
        power.power_on = true;
        power.power_watts = 12.5;
        power.switch_name = "bench";
        DeviceIdentity sw;
        sw.classification = Classification::POWER_SWITCH;
        sw.power_switch = power;
        sw.controls = { "eink-01" };
        cache.put("192.168.2.10", identity);
        cache.put("192.168.2.30", sw);
    }
    FileDeviceCache reloaded(path);
    EXPECT_FALSE(reloaded.was_corrupt());
    ASSERT_EQ(reloaded.all().size(), 2u);
    auto entry = reloaded.get("192.168.2.10");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->hostname, "eink-01");
    EXPECT_EQ(entry->firmware_version, "4.0.1");
    EXPECT_EQ(entry->classification, Classification::GENERIC);

    auto sw = reloaded.get("192.168.2.30");
    ASSERT_TRUE(sw.has_value());
    ASSERT_TRUE(sw->power_switch.has_value());
    EXPECT_EQ(sw->power_switch->power_on, std::optional<bool>(true));
    EXPECT_DOUBLE_EQ(*sw->power_switch->power_watts, 12.5);
    EXPECT_EQ(sw->controls, std::vector<std::string>{ "eink-01" });
}

TEST(testDeviceCache, missingAndEmptyFilesStartEmpty)
{
    TempDir dir;
    FileDeviceCache missing(dir.file("absent.json"));
    EXPECT_TRUE(missing.all().empty());
    EXPECT_FALSE(missing.was_corrupt());

    const auto empty_path = dir.file("empty.json");
    std::ofstream(empty_path) << "  \n";
    FileDeviceCache empty(empty_path);
    EXPECT_TRUE(empty.all().empty());
    EXPECT_FALSE(empty.was_corrupt());
}

TEST(testDeviceCache, corruptFileIsBackedUpAndReset)
{
    TempDir dir;
    const auto path = dir.file("device_cache.json");
    std::ofstream(path) << "{ \"192.168.2.10\": { \"hostname\": ";

    std::vector<std::string> errors;
    auto log = [&errors](const std::string& msg, uint32_t level)
        {
            if (level == LOG_LVL_ERROR)
            {
                errors.push_back(msg);
            }
        };
    FileDeviceCache cache(path, CacheConfig{}, log);
    EXPECT_TRUE(cache.was_corrupt());
    EXPECT_EQ(cache.load_status(), ErrorKind::CACHE_CORRUPT);
    EXPECT_TRUE(cache.all().empty());
    EXPECT_FALSE(errors.empty());
    ASSERT_TRUE(fs::exists(cache.backup_path()));
    EXPECT_EQ(read_file(cache.backup_path()), "{ \"192.168.2.10\": { \"hostname\": ");

    // Usable after the reset
    cache.put("192.168.2.10", board("192.168.2.10", "eink-01"));
    FileDeviceCache reloaded(path);
    EXPECT_FALSE(reloaded.was_corrupt());
    EXPECT_EQ(reloaded.load_status(), ErrorKind::NONE);
    EXPECT_EQ(reloaded.all().size(), 1u);
}

TEST(testDeviceCache, staleTemporaryFileIsIgnored)
{
    TempDir dir;
    const auto path = dir.file("device_cache.json");
    {
        FileDeviceCache cache(path);
        cache.put("192.168.2.10", board("192.168.2.10", "eink-01"));
    }
    // Simulate a crash part way through writing the next snapshot
    std::ofstream(path + ".tmp") << "{ \"192.168.2.10\": { \"hostna";

    FileDeviceCache reloaded(path);
    EXPECT_FALSE(reloaded.was_corrupt());
    ASSERT_TRUE(reloaded.get("192.168.2.10").has_value());
    EXPECT_EQ(reloaded.get("192.168.2.10")->hostname, "eink-01");
}

TEST(testDeviceCache, failedWriteKeepsDurableFileAndThrows)
{
    if (::geteuid() == 0)
    {
        GTEST_SKIP() << "directory permissions are not enforced for root";
    }
    TempDir dir;
    const auto path = dir.file("device_cache.json");
    FileDeviceCache cache(path);
    cache.put("192.168.2.10", board("192.168.2.10", "eink-01"));
    const auto before = read_file(path);

    fs::permissions(dir.path(), fs::perms::owner_read | fs::perms::owner_exec);
    EXPECT_THROW(cache.put("192.168.2.11", board("192.168.2.11", "eink-02")), CacheError);
    fs::permissions(dir.path(), fs::perms::owner_all);

    EXPECT_EQ(read_file(path), before);
    EXPECT_FALSE(fs::exists(path + ".tmp"));
    // Memory stays consistent with the durable file
    EXPECT_FALSE(cache.get("192.168.2.11").has_value());
}

TEST(testDeviceCache, clearEmptiesDurableFile)
{
    TempDir dir;
    const auto path = dir.file("device_cache.json");
    FileDeviceCache cache(path);
    cache.put("192.168.2.10", board("192.168.2.10", "eink-01"));
    cache.clear();
    FileDeviceCache reloaded(path);
    EXPECT_TRUE(reloaded.all().empty());
}

TEST(testDeviceCache, concurrentPutsAreAllKept)
{
    TempDir dir;
    FileDeviceCache cache(dir.file("device_cache.json"));
    std::vector<std::thread> writers;
    for (int i = 0; i < 8; ++i)
    {
        writers.emplace_back([&cache, i]()
            {
                const auto address = "192.168.2." + std::to_string(10 + i);
                cache.put(address, board(address, "host" + std::to_string(i)));
            });
    }
    for (auto& t : writers)
    {
        t.join();
    }
    FileDeviceCache reloaded(cache.path());
    EXPECT_EQ(reloaded.all().size(), 8u);
}
