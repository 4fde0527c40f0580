/**
 * @file DBusServiceTest.cpp
 * @brief Unit tests for DBusService method dispatch without a bus connection
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "daemon/DBusService.hpp"
#include "fixtures/TestFixtures.hpp"
#include "mocks/MockReadingProvider.hpp"
#include "models/JsonCodec.hpp"

using testdata::MakeIdentity;
using testdata::MakeSnapshot;
using testing::_;
using testing::Return;

class DBusServiceTest : public TempDirFixture {
protected:
    std::shared_ptr<MockReadingProvider> provider;
    std::shared_ptr<MonitorService> monitor;
    std::unique_ptr<DBusService> service;

    void SetUp() override {
        TempDirFixture::SetUp();
        provider = MockReadingProvider::CreateNiceMock({MakeIdentity("sda"), MakeIdentity("sdb")});
        ON_CALL(*provider, fetch_smart(_, _))
            .WillByDefault(Return(util::Result<SmartSnapshot>(MakeSnapshot(4))));
        monitor = std::make_shared<MonitorService>(
            MakeConfigStore(), provider,
            std::make_shared<PersistenceLayer>(temp_dir / "data"),
            std::vector<std::shared_ptr<INotificationChannel>>{});
        ASSERT_TRUE(monitor->initialize().has_value());
        ASSERT_TRUE(monitor->scheduler()->refresh_devices().has_value());
        service = std::make_unique<DBusService>(monitor);
    }

    void TearDown() override {
        service.reset();
        monitor.reset();
        TempDirFixture::TearDown();
    }

    // Calls a method and returns the JSON carried by its "(s)" reply
    auto CallJson(std::string_view method, GVariant* parameters) -> Json::Value {
        auto result = service->call(method, parameters);
        EXPECT_TRUE(result.has_value()) << method;
        if (!result) {
            return Json::Value();
        }
        GVariant* reply = g_variant_ref_sink(*result);
        const gchar* text = nullptr;
        g_variant_get(reply, "(&s)", &text);
        auto parsed = codec::parse(text);
        g_variant_unref(reply);
        EXPECT_TRUE(parsed.has_value());
        return parsed.value_or(Json::Value());
    }

    auto CallError(std::string_view method, GVariant* parameters) -> util::ErrorKind {
        auto result = service->call(method, parameters);
        EXPECT_FALSE(result.has_value()) << method;
        if (result) {
            g_variant_unref(g_variant_ref_sink(*result));
            return util::ErrorKind::NotFound;
        }
        return result.error().kind;
    }

    // Floating parameter tuples are consumed by the call; sink them here
    struct Params {
        GVariant* value;
        explicit Params(GVariant* v) : value(g_variant_ref_sink(v)) {}
        ~Params() { g_variant_unref(value); }
        Params(const Params&) = delete;
        Params& operator=(const Params&) = delete;
    };
};

// ============================================================================
// Introspection and naming
// ============================================================================

TEST_F(DBusServiceTest, IntrospectionXml_ParsesWithAllMethods) {
    GError* error = nullptr;
    GDBusNodeInfo* node = g_dbus_node_info_new_for_xml(DBusService::introspection_xml(), &error);
    ASSERT_NE(node, nullptr) << (error != nullptr ? error->message : "");
    g_clear_error(&error);

    GDBusInterfaceInfo* iface = g_dbus_node_info_lookup_interface(node, DBusService::INTERFACE_NAME);
    ASSERT_NE(iface, nullptr);
    for (const auto* method : {"ListDevices", "GetDevice", "GetAlerts", "GetHealthHistory",
                               "GetAnomalies", "GetBaselineDiff", "GetSelfTestLog", "Acknowledge",
                               "AcknowledgeAll", "SaveBaseline", "ScheduleSelfTest",
                               "ClearAnomalies", "Repoll", "TestWebhook"}) {
        EXPECT_NE(g_dbus_interface_info_lookup_method(iface, method), nullptr) << method;
    }
    g_dbus_node_info_unref(node);
}

TEST_F(DBusServiceTest, ErrorName_UsesErrorKind) {
    EXPECT_EQ(DBusService::error_name(util::ErrorKind::NotFound), "io.drivewatch.Error.NotFound");
    EXPECT_EQ(DBusService::error_name(util::ErrorKind::InvalidArgument),
              "io.drivewatch.Error.InvalidArgument");
}

TEST_F(DBusServiceTest, IsBlocking_OnlyLongRunningMethods) {
    EXPECT_TRUE(DBusService::is_blocking("ScheduleSelfTest"));
    EXPECT_TRUE(DBusService::is_blocking("Repoll"));
    EXPECT_TRUE(DBusService::is_blocking("TestWebhook"));
    EXPECT_FALSE(DBusService::is_blocking("ListDevices"));
    EXPECT_FALSE(DBusService::is_blocking("Acknowledge"));
}

// ============================================================================
// Queries
// ============================================================================

TEST_F(DBusServiceTest, ListDevices_ReturnsJsonArray) {
    auto devices = CallJson("ListDevices", nullptr);

    ASSERT_TRUE(devices.isArray());
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0]["id"].asString(), "sda");
    EXPECT_EQ(devices[1]["id"].asString(), "sdb");
}

TEST_F(DBusServiceTest, GetDevice_UnknownIsNotFound) {
    Params params(g_variant_new("(s)", "sdz"));
    EXPECT_EQ(CallError("GetDevice", params.value), util::ErrorKind::NotFound);
}

TEST_F(DBusServiceTest, GetDevice_ReturnsState) {
    Params params(g_variant_new("(s)", "sdb"));
    auto state = CallJson("GetDevice", params.value);
    EXPECT_EQ(state["id"].asString(), "sdb");
}

TEST_F(DBusServiceTest, GetAlerts_FiltersActiveBySeverity) {
    ASSERT_TRUE(monitor->scheduler()->poll_once(Domain::Smart).has_value());

    Params warn(g_variant_new("(bxss)", TRUE, static_cast<gint64>(0), "warn", ""));
    auto alerts = CallJson("GetAlerts", warn.value);
    ASSERT_TRUE(alerts.isArray());
    EXPECT_EQ(alerts.size(), 2u);

    Params crit(g_variant_new("(bxss)", TRUE, static_cast<gint64>(0), "crit", ""));
    EXPECT_EQ(CallJson("GetAlerts", crit.value).size(), 0u);

    Params search(g_variant_new("(bxss)", FALSE, static_cast<gint64>(0), "", "SDB"));
    auto found = CallJson("GetAlerts", search.value);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0]["device"].asString(), "sdb");
}

TEST_F(DBusServiceTest, GetAlerts_UnknownSeverityRejected) {
    Params params(g_variant_new("(bxss)", FALSE, static_cast<gint64>(0), "severe", ""));
    EXPECT_EQ(CallError("GetAlerts", params.value), util::ErrorKind::InvalidArgument);
}

TEST_F(DBusServiceTest, GetHealthHistory_NonPositiveDaysRejected) {
    Params params(g_variant_new("(si)", "sda", 0));
    EXPECT_EQ(CallError("GetHealthHistory", params.value), util::ErrorKind::InvalidArgument);
}

TEST_F(DBusServiceTest, GetBaselineDiff_WithoutBaselineIsNotFound) {
    ASSERT_TRUE(monitor->scheduler()->poll_once(Domain::Smart).has_value());
    Params params(g_variant_new("(s)", "sda"));
    EXPECT_EQ(CallError("GetBaselineDiff", params.value), util::ErrorKind::NotFound);
}

// ============================================================================
// Commands
// ============================================================================

TEST_F(DBusServiceTest, Acknowledge_UnknownIdIsNotFound) {
    Params params(g_variant_new("(t)", static_cast<guint64>(999)));
    EXPECT_EQ(CallError("Acknowledge", params.value), util::ErrorKind::NotFound);
}

TEST_F(DBusServiceTest, AcknowledgeAll_ReportsCount) {
    ASSERT_TRUE(monitor->scheduler()->poll_once(Domain::Smart).has_value());

    auto result = service->call("AcknowledgeAll", nullptr);

    ASSERT_TRUE(result.has_value());
    GVariant* reply = g_variant_ref_sink(*result);
    guint32 count = 0;
    g_variant_get(reply, "(u)", &count);
    g_variant_unref(reply);
    EXPECT_EQ(count, 2u);
}

TEST_F(DBusServiceTest, SaveBaseline_ThenDiffSucceeds) {
    ASSERT_TRUE(monitor->scheduler()->poll_once(Domain::Smart).has_value());
    Params params(g_variant_new("(s)", "sda"));

    auto baseline = CallJson("SaveBaseline", params.value);
    EXPECT_EQ(baseline["device"].asString(), "sda");

    auto diff = CallJson("GetBaselineDiff", params.value);
    EXPECT_EQ(diff["device"].asString(), "sda");
}

TEST_F(DBusServiceTest, ScheduleSelfTest_UnknownDeviceIsNotFound) {
    Params params(g_variant_new("(sbbu)", "sdz", FALSE, FALSE, 0u));
    EXPECT_EQ(CallError("ScheduleSelfTest", params.value), util::ErrorKind::NotFound);
}

TEST_F(DBusServiceTest, ScheduleSelfTest_WithoutWaitReturnsRunning) {
    Params params(g_variant_new("(sbbu)", "sda", TRUE, FALSE, 0u));
    auto status = CallJson("ScheduleSelfTest", params.value);
    EXPECT_EQ(status["state"].asString(), "running");
}

TEST_F(DBusServiceTest, TestWebhook_WithoutChannelIsNotFound) {
    EXPECT_EQ(CallError("TestWebhook", nullptr), util::ErrorKind::NotFound);
}

TEST_F(DBusServiceTest, UnknownMethodRejected) {
    EXPECT_EQ(CallError("Reboot", nullptr), util::ErrorKind::InvalidArgument);
}
