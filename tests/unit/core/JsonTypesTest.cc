#include "fleet/core/JsonTypes.hh"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace fleet {

class JsonTypesTest : public ::testing::Test {};

TEST_F(JsonTypesTest, DescriptorPathIsNullWhenAbsent) {
    nlohmann::json bare = HandlerDescriptor{"cron", "Cleanup", std::nullopt};
    EXPECT_EQ(bare["type"], "cron");
    EXPECT_EQ(bare["class"], "Cleanup");
    EXPECT_TRUE(bare["path"].is_null());

    nlohmann::json pathed = HandlerDescriptor{"cron", "Cleanup", std::string("modules/acme")};
    EXPECT_EQ(pathed["path"], "modules/acme");
}

TEST_F(JsonTypesTest, SiteFields) {
    Site site{4, "delta", "https://delta.example", {10, 11}};
    EXPECT_TRUE(site.inGroup(11));
    EXPECT_FALSE(site.inGroup(12));

    nlohmann::json j = site;
    EXPECT_EQ(j["id"], 4);
    EXPECT_EQ(j["name"], "delta");
    EXPECT_EQ(j["url"], "https://delta.example");
    EXPECT_EQ(j["groups"], nlohmann::json::array({10, 11}));
}

TEST_F(JsonTypesTest, HandlerSnapshotFields) {
    HandlerSnapshot h;
    h.id = "task_0001";
    h.className = "Cleanup";
    h.state = HandlerState::Failed;
    h.started = fromEpochSeconds(10.0);
    h.completed = fromEpochSeconds(12.5);
    h.message = "disk full";
    h.success = false;

    nlohmann::json j = h;
    EXPECT_EQ(j["class"], "Cleanup");
    EXPECT_EQ(j["id"], "task_0001");
    EXPECT_EQ(j["state"], "failed");
    EXPECT_DOUBLE_EQ(j["started"].get<double>(), 10.0);
    EXPECT_DOUBLE_EQ(j["completed"].get<double>(), 12.5);
    EXPECT_EQ(j["message"], "disk full");
    EXPECT_EQ(j["success"], false);
}

TEST_F(JsonTypesTest, PendingSnapshotHasNullTimestamps) {
    HandlerSnapshot h;
    h.className = "Queued";
    nlohmann::json j = h;
    EXPECT_EQ(j["state"], "pending");
    EXPECT_TRUE(j["started"].is_null());
    EXPECT_TRUE(j["completed"].is_null());
}

TEST_F(JsonTypesTest, EventSnapshotAlwaysHasThreeBuckets) {
    EventSnapshot s;
    s.type = "deploy";
    nlohmann::json j = s;

    EXPECT_EQ(j["type"], "deploy");
    ASSERT_TRUE(j["handlers"].is_object());
    EXPECT_EQ(j["handlers"].size(), 3u);
    EXPECT_TRUE(j["handlers"]["incomplete"].is_array());
    EXPECT_TRUE(j["handlers"]["complete"].is_array());
    EXPECT_TRUE(j["handlers"]["failed"].is_array());
}

TEST_F(JsonTypesTest, DispatchSummaryFields) {
    nlohmann::json j = DispatchSummary{3, 2, 1, false};
    EXPECT_EQ(j["executed"], 3);
    EXPECT_EQ(j["completed"], 2);
    EXPECT_EQ(j["failed"], 1);
    EXPECT_EQ(j["halted"], false);
}

} // namespace fleet
