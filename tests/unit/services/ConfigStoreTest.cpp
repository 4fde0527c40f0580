/**
 * @file ConfigStoreTest.cpp
 * @brief Unit tests for ConfigStore parsing, validation and reload
 */

#include <gtest/gtest.h>

#include "fixtures/TestFixtures.hpp"
#include "services/ConfigStore.hpp"
#include "util/AtomicFile.hpp"

#include <atomic>

class ConfigStoreTest : public TempDirFixture {
protected:
    std::filesystem::path config_path;

    void SetUp() override {
        TempDirFixture::SetUp();
        config_path = temp_dir / "conf" / "drivewatch.conf";
    }

    void WriteConfig(const std::string& text) {
        ASSERT_TRUE(util::write_file_atomic(config_path, text).has_value());
    }
};

// ============================================================================
// Parsing
// ============================================================================

TEST_F(ConfigStoreTest, Parse_EmptyTextGivesDefaults) {
    auto config = ConfigStore::parse("");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(*config, Config{});
    EXPECT_EQ(config->general.update_interval_ms, 2000);
    EXPECT_EQ(config->general.smart_interval_sec, 300);
    EXPECT_TRUE(config->notifications.notify_critical);
    EXPECT_FALSE(config->notifications.notify_warning);
}

TEST_F(ConfigStoreTest, Parse_ReadsAllGroups) {
    auto config = ConfigStore::parse(R"(
[general]
update_interval_ms=1000
smart_interval_sec=60

[alerts]
cooldown_hours=2
disabled_rules=latency;nfs-latency

[thresholds]
temperature_warn_hdd=45
temperature_crit_hdd=55
filesystem_warn_pct=80

[devices]
exclude=loop*;zram*

[notifications]
webhook_url=https://hooks.example.org/drive
notify_warning=true

[aliases]
sda=system disk
)");

    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->general.update_interval_ms, 1000);
    EXPECT_EQ(config->general.smart_interval_sec, 60);
    EXPECT_EQ(config->cooldown, std::chrono::hours{2});
    EXPECT_FALSE(config->is_rule_enabled(RuleKind::Latency));
    EXPECT_FALSE(config->is_rule_enabled(RuleKind::NfsLatency));
    EXPECT_TRUE(config->is_rule_enabled(RuleKind::ThresholdTemp));
    EXPECT_EQ(config->thresholds.temperature_hdd, (ThresholdPair{45, 55}));
    EXPECT_EQ(config->thresholds.filesystem_pct, (ThresholdPair{80, 95}));
    EXPECT_EQ(config->exclude, (std::vector<std::string>{"loop*", "zram*"}));
    EXPECT_EQ(config->notifications.webhook_url, "https://hooks.example.org/drive");
    EXPECT_TRUE(config->notifications.notify_warning);
    EXPECT_EQ(config->alias_for("sda"), "system disk");
    EXPECT_EQ(config->alias_for("sdb"), "");
}

// Test: cooldown_sec takes precedence over cooldown_hours
TEST_F(ConfigStoreTest, Parse_CooldownSecondsOverridesHours) {
    auto config = ConfigStore::parse("[alerts]\ncooldown_hours=5\ncooldown_sec=90\n");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->cooldown, std::chrono::seconds{90});
}

TEST_F(ConfigStoreTest, Parse_NonNumericValueIsConfigInvalid) {
    auto config = ConfigStore::parse("[general]\nsmart_interval_sec=often\n");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().kind, util::ErrorKind::ConfigInvalid);
    EXPECT_NE(config.error().message.find("smart_interval_sec"), std::string::npos);
}

TEST_F(ConfigStoreTest, Parse_UnknownDisabledRuleIsConfigInvalid) {
    auto config = ConfigStore::parse("[alerts]\ndisabled_rules=threshold-temp;made-up\n");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().kind, util::ErrorKind::ConfigInvalid);
}

TEST_F(ConfigStoreTest, Parse_SyntaxErrorIsConfigInvalid) {
    auto config = ConfigStore::parse("[general\nthis is not ini");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().kind, util::ErrorKind::ConfigInvalid);
}

TEST_F(ConfigStoreTest, Serialize_ParsesBackToSameConfig) {
    Config config;
    config.general.fetch_timeout_ms = 2500;
    config.general.data_dir = "/var/lib/drivewatch";
    config.cooldown = std::chrono::seconds{600};
    config.disabled_rules = {RuleKind::FsFillRate};
    config.thresholds.latency_ms = {30.5, 120};
    config.exclude = {"loop*"};
    config.notifications.desktop = true;
    config.aliases = {{"nvme0n1", "fast"}, {"sdb", "archive"}};

    auto parsed = ConfigStore::parse(ConfigStore::serialize(config));
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ(*parsed, config);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigStoreTest, Validate_Defaults) {
    EXPECT_TRUE(Config{}.validate().has_value());
}

TEST_F(ConfigStoreTest, Validate_RejectsNonPositiveInterval) {
    Config config;
    config.general.update_interval_ms = 0;
    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::ConfigInvalid);
    EXPECT_NE(result.error().message.find("update_interval_ms"), std::string::npos);
}

TEST_F(ConfigStoreTest, Validate_RejectsWarnAboveCrit) {
    Config config;
    config.thresholds.temperature_ssd = {80, 70};
    EXPECT_FALSE(config.validate().has_value());
}

TEST_F(ConfigStoreTest, Validate_RejectsPercentAbove100) {
    Config config;
    config.thresholds.filesystem_pct = {90, 101};
    EXPECT_FALSE(config.validate().has_value());
}

TEST_F(ConfigStoreTest, Validate_RejectsTemperatureAbove150) {
    Config config;
    config.thresholds.temperature_hdd = {60, 151};
    EXPECT_FALSE(config.validate().has_value());
}

// Test: fill-rate days are inverted, crit must not exceed warn
TEST_F(ConfigStoreTest, Validate_FillDaysOrdering) {
    Config config;
    config.thresholds.fill_days = {3, 14};
    EXPECT_FALSE(config.validate().has_value());

    config.thresholds.fill_days = {0, 14};
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(ConfigStoreTest, Validate_RejectsNonHttpWebhook) {
    Config config;
    config.notifications.webhook_url = "ftp://example.org/hook";
    EXPECT_FALSE(config.validate().has_value());

    config.notifications.webhook_url = "http://localhost:8080/hook";
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(ConfigStoreTest, Validate_RejectsEmptyExcludePattern) {
    Config config;
    config.exclude.push_back("");
    EXPECT_FALSE(config.validate().has_value());
}

TEST_F(ConfigStoreTest, IsExcluded_MatchesGlobs) {
    Config config;
    EXPECT_TRUE(config.is_excluded("loop0"));
    EXPECT_TRUE(config.is_excluded("sr0"));
    EXPECT_FALSE(config.is_excluded("sda"));
    EXPECT_FALSE(config.is_excluded("nvme0n1"));
}

TEST_F(ConfigStoreTest, TemperatureThresholds_PerDeviceKind) {
    Config config;
    EXPECT_EQ(config.temperature_thresholds(DeviceKind::HDD), (ThresholdPair{50, 60}));
    EXPECT_EQ(config.temperature_thresholds(DeviceKind::SSD), (ThresholdPair{55, 70}));
    EXPECT_EQ(config.temperature_thresholds(DeviceKind::NVMe), (ThresholdPair{55, 70}));
}

// ============================================================================
// Load and reload
// ============================================================================

TEST_F(ConfigStoreTest, Load_MissingFileWritesDefaults) {
    ConfigStore store(config_path);

    ASSERT_TRUE(store.load().has_value());
    EXPECT_EQ(*store.current(), Config{});
    ASSERT_TRUE(std::filesystem::exists(config_path));

    auto written = util::read_file(config_path);
    ASSERT_TRUE(written.has_value());
    auto reparsed = ConfigStore::parse(*written);
    ASSERT_TRUE(reparsed.has_value());
    EXPECT_EQ(*reparsed, Config{});
}

TEST_F(ConfigStoreTest, Load_MalformedFileKeepsDefaults) {
    WriteConfig("[thresholds]\ntemperature_warn_hdd=70\ntemperature_crit_hdd=60\n");
    ConfigStore store(config_path);

    auto result = store.load();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::ConfigInvalid);
    EXPECT_EQ(*store.current(), Config{});
}

TEST_F(ConfigStoreTest, Reload_UnchangedFileReturnsFalse) {
    WriteConfig("[general]\nsmart_interval_sec=120\n");
    ConfigStore store(config_path);
    ASSERT_TRUE(store.load().has_value());

    auto result = store.reload();
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(*result);
}

TEST_F(ConfigStoreTest, Reload_PublishesNewSnapshotAndNotifies) {
    WriteConfig("[general]\nsmart_interval_sec=120\n");
    ConfigStore store(config_path);
    ASSERT_TRUE(store.load().has_value());

    auto before = store.current();
    std::atomic<int> notified{0};
    store.subscribe([&notified](const std::shared_ptr<const Config>& config) {
        EXPECT_EQ(config->general.smart_interval_sec, 60);
        ++notified;
    });

    WriteConfig("[general]\nsmart_interval_sec=60\n");
    auto result = store.reload();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(*result);
    EXPECT_EQ(notified.load(), 1);
    EXPECT_EQ(store.current()->general.smart_interval_sec, 60);

    // Readers holding the old snapshot keep a consistent view
    EXPECT_EQ(before->general.smart_interval_sec, 120);
}

TEST_F(ConfigStoreTest, Reload_RejectedFileKeepsPreviousSnapshot) {
    WriteConfig("[general]\nsmart_interval_sec=120\n");
    ConfigStore store(config_path);
    ASSERT_TRUE(store.load().has_value());
    LogCapture logs;

    WriteConfig("[general]\nsmart_interval_sec=-5\n");
    auto result = store.reload();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::ConfigInvalid);
    EXPECT_EQ(store.current()->general.smart_interval_sec, 120);
    EXPECT_TRUE(logs.Contains(util::LogLevel::WARNING, "reload rejected"));
}

TEST_F(ConfigStoreTest, Replace_ValidatesBeforePublishing) {
    ConfigStore store(config_path);
    Config bad;
    bad.general.fs_interval_sec = 0;

    auto result = store.replace(bad);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::ConfigInvalid);
    EXPECT_EQ(store.current()->general.fs_interval_sec, 5);
}

TEST_F(ConfigStoreTest, ReloadTimer_PicksUpChanges) {
    WriteConfig("[general]\nnfs_interval_sec=5\n");
    ConfigStore store(config_path);
    ASSERT_TRUE(store.load().has_value());
    store.start_reload_timer(std::chrono::milliseconds{20});

    WriteConfig("[general]\nnfs_interval_sec=9\n");
    EXPECT_TRUE(ThreadingTestHelper::WaitUntil(
        [&store] { return store.current()->general.nfs_interval_sec == 9; }));

    store.stop_reload_timer();
}
