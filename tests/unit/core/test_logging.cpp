/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging
 */

#include <gtest/gtest.h>

#include <matchops/sync/core/logging.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace matchops::sync::test {

// =============================================================================
// Migration Log Context Tests
// =============================================================================

class MigrationLogContextTest : public ::testing::Test {};

TEST_F(MigrationLogContextTest, EmptyContextToJson) {
    migration_log_context ctx;

    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(MigrationLogContextTest, AllFieldsToJson) {
    migration_log_context ctx;
    ctx.session_id = "session-001";
    ctx.phase = "transferring";
    ctx.resource = "roster";
    ctx.items_processed = 40;
    ctx.total_items = 100;
    ctx.progress_percent = 40.0;
    ctx.items_per_second = 12.5;
    ctx.duration_ms = 3200;
    ctx.attempt = 2;
    ctx.error_message = "Test error";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"session_id\":\"session-001\""), std::string::npos);
    EXPECT_NE(json.find("\"phase\":\"transferring\""), std::string::npos);
    EXPECT_NE(json.find("\"resource\":\"roster\""), std::string::npos);
    EXPECT_NE(json.find("\"items_processed\":40"), std::string::npos);
    EXPECT_NE(json.find("\"total_items\":100"), std::string::npos);
    EXPECT_NE(json.find("\"progress_percent\":40.00"), std::string::npos);
    EXPECT_NE(json.find("\"duration_ms\":3200"), std::string::npos);
    EXPECT_NE(json.find("\"attempt\":2"), std::string::npos);
    EXPECT_NE(json.find("\"error_message\":\"Test error\""), std::string::npos);
}

TEST_F(MigrationLogContextTest, JsonEscaping) {
    migration_log_context ctx;
    ctx.session_id = "id-with-\"quotes\"";
    ctx.error_message = "Error:\nLine break\tand\ttabs";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\\\""), std::string::npos);
    EXPECT_NE(json.find("\\n"), std::string::npos);
    EXPECT_NE(json.find("\\t"), std::string::npos);
}

// =============================================================================
// Structured Log Entry Tests
// =============================================================================

class StructuredLogEntryTest : public ::testing::Test {};

TEST_F(StructuredLogEntryTest, EntryWithContext) {
    structured_log_entry entry;
    entry.timestamp = "2026-03-01T10:30:00.000Z";
    entry.level = log_level::warn;
    entry.category = std::string(log_category::engine);
    entry.message = "Retrying count source";

    migration_log_context ctx;
    ctx.attempt = 1;
    entry.context = ctx;

    auto json = entry.to_json();

    EXPECT_NE(json.find("\"level\":\"WARN\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"matchops_sync.engine\""), std::string::npos);
    EXPECT_NE(json.find("\"message\":\"Retrying count source\""), std::string::npos);
    EXPECT_NE(json.find("\"attempt\":1"), std::string::npos);
}

TEST_F(StructuredLogEntryTest, TimestampFormat) {
    auto now = std::chrono::system_clock::now();

    auto utc = detail::format_timestamp(now, true);
    ASSERT_EQ(utc.size(), 24u);
    EXPECT_EQ(utc[10], 'T');
    EXPECT_EQ(utc.back(), 'Z');

    auto local = detail::format_timestamp(now, false);
    ASSERT_EQ(local.size(), 23u);
    EXPECT_EQ(local[10], ' ');
    EXPECT_EQ(local[19], '.');
}

// =============================================================================
// Logger Tests
// =============================================================================

class SyncLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_level_ = get_logger().get_level();
        get_logger().set_sink_enabled(false);
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_json_callback(nullptr);
        get_logger().set_output_format(log_output_format::text);
        get_logger().set_level(previous_level_);
        get_logger().set_sink_enabled(true);
    }

    log_level previous_level_{log_level::info};
};

TEST_F(SyncLoggerTest, LevelFiltering) {
    get_logger().set_level(log_level::warn);

    EXPECT_FALSE(get_logger().is_enabled(log_level::debug));
    EXPECT_FALSE(get_logger().is_enabled(log_level::info));
    EXPECT_TRUE(get_logger().is_enabled(log_level::warn));
    EXPECT_TRUE(get_logger().is_enabled(log_level::error));
}

TEST_F(SyncLoggerTest, CallbackReceivesRecords) {
    get_logger().set_level(log_level::debug);

    std::vector<std::string> messages;
    std::vector<std::string> categories;
    get_logger().set_callback([&](log_level, std::string_view category,
                                  std::string_view message, const migration_log_context*) {
        categories.emplace_back(category);
        messages.emplace_back(message);
    });

    MS_LOG_INFO(log_category::lock, "granted");
    MS_LOG_TRACE(log_category::lock, "filtered out");

    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], "granted");
    EXPECT_EQ(categories[0], "matchops_sync.lock");
}

TEST_F(SyncLoggerTest, CallbackReceivesContext) {
    get_logger().set_level(log_level::debug);

    std::optional<uint64_t> seen;
    get_logger().set_callback([&](log_level, std::string_view, std::string_view,
                                  const migration_log_context* ctx) {
        if (ctx) seen = ctx->items_processed;
    });

    migration_log_context ctx;
    ctx.items_processed = 17;
    MS_LOG_INFO_CTX(log_category::engine, "batch saved", ctx);

    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(*seen, 17u);
}

TEST_F(SyncLoggerTest, JsonCallbackInJsonMode) {
    get_logger().set_level(log_level::debug);
    get_logger().set_output_format(log_output_format::json);

    std::string captured;
    get_logger().set_json_callback([&](const structured_log_entry& entry, const std::string& json) {
        EXPECT_EQ(entry.category, "matchops_sync.checkpoint");
        captured = json;
    });

    MS_LOG_WARN(log_category::checkpoint, "checkpoint expired");

    EXPECT_NE(captured.find("\"message\":\"checkpoint expired\""), std::string::npos);
    EXPECT_NE(captured.find("\"source\":{"), std::string::npos);
}

}  // namespace matchops::sync::test
