/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and sensitive information masking
 */

#include <gtest/gtest.h>

#include <kcenon/tree_transfer/core/logging.h>

#include <regex>
#include <string>
#include <tuple>
#include <vector>

namespace kcenon::tree_transfer::test {

// =============================================================================
// Masking Config Tests
// =============================================================================

class MaskingConfigTest : public ::testing::Test {};

TEST_F(MaskingConfigTest, DefaultConfig) {
    masking_config config;

    EXPECT_FALSE(config.mask_paths);
    EXPECT_FALSE(config.mask_hosts);
    EXPECT_FALSE(config.mask_filenames);
    EXPECT_EQ(config.mask_char, "*");
    EXPECT_EQ(config.visible_chars, 4u);
}

TEST_F(MaskingConfigTest, AllMaskedConfig) {
    auto config = masking_config::all_masked();

    EXPECT_TRUE(config.mask_paths);
    EXPECT_TRUE(config.mask_hosts);
    EXPECT_TRUE(config.mask_filenames);
}

// =============================================================================
// Sensitive Info Masker Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {};

TEST_F(SensitiveInfoMaskerTest, NoMaskingByDefault) {
    sensitive_info_masker masker;
    std::string input = "Saved /home/user/secret.txt to 192.168.1.100";

    EXPECT_EQ(masker.mask(input), input);
}

TEST_F(SensitiveInfoMaskerTest, MaskHostAddress) {
    masking_config config;
    config.mask_hosts = true;
    sensitive_info_masker masker(config);

    // 192.168.1 = 9 chars -> *********
    EXPECT_EQ(masker.mask_host("192.168.1.100"), "*********.100");
    EXPECT_EQ(masker.mask_host("files.example.org"), "*************.org");
    EXPECT_EQ(masker.mask_host("localhost"), "*********");
}

TEST_F(SensitiveInfoMaskerTest, MaskAddressesInText) {
    masking_config config;
    config.mask_hosts = true;
    sensitive_info_masker masker(config);

    auto result = masker.mask("Could not connect to '10.0.0.1': refused");

    EXPECT_EQ(result.find("10.0.0.1"), std::string::npos);
    EXPECT_NE(result.find("******.1"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MaskFilePathKeepsName) {
    masking_config config;
    config.mask_paths = true;
    sensitive_info_masker masker(config);

    auto result = masker.mask_path("/home/user/documents/secret.txt");

    EXPECT_NE(result.find("secret.txt"), std::string::npos);
    EXPECT_EQ(result.find("/home/"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MaskFilePathWithFilename) {
    masking_config config;
    config.mask_paths = true;
    config.mask_filenames = true;
    sensitive_info_masker masker(config);

    auto result = masker.mask_path("/srv/upload/secretfile.txt");

    EXPECT_NE(result.find("/secr******.txt"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MaskPathsInText) {
    masking_config config;
    config.mask_paths = true;
    sensitive_info_masker masker(config);

    auto result = masker.mask("Created directory \"/home/user/backup\"");

    EXPECT_EQ(result.find("/home/user/"), std::string::npos);
    EXPECT_NE(result.find("backup"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, EmptyInput) {
    sensitive_info_masker masker(masking_config::all_masked());

    EXPECT_EQ(masker.mask(""), "");
    EXPECT_EQ(masker.mask_path(""), "");
    EXPECT_EQ(masker.mask_host(""), "");
}

TEST_F(SensitiveInfoMaskerTest, UpdateConfig) {
    sensitive_info_masker masker;
    std::string host = "192.168.1.100";

    EXPECT_EQ(masker.mask_host(host), host);

    masker.set_config(masking_config::all_masked());
    EXPECT_NE(masker.mask_host(host), host);
}

// =============================================================================
// Transfer Log Context Tests
// =============================================================================

class TransferLogContextTest : public ::testing::Test {};

TEST_F(TransferLogContextTest, EmptyContextToJson) {
    transfer_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(TransferLogContextTest, AllFieldsToJson) {
    transfer_log_context ctx;
    ctx.source = "/home/user/a.txt";
    ctx.destination = "/upload/a.txt";
    ctx.file_size = 1048576;
    ctx.bytes_transferred = 524288;
    ctx.progress_percent = 50.0;
    ctx.rate_bps = 2048;
    ctx.duration_ms = 1000;
    ctx.error_message = "Test error";
    ctx.protocol = "file";
    ctx.host = "192.168.1.100";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"source\":\"/home/user/a.txt\""), std::string::npos);
    EXPECT_NE(json.find("\"destination\":\"/upload/a.txt\""), std::string::npos);
    EXPECT_NE(json.find("\"size\":1048576"), std::string::npos);
    EXPECT_NE(json.find("\"bytes_transferred\":524288"), std::string::npos);
    EXPECT_NE(json.find("\"progress_percent\":50.00"), std::string::npos);
    EXPECT_NE(json.find("\"rate_bps\":2048"), std::string::npos);
    EXPECT_NE(json.find("\"duration_ms\":1000"), std::string::npos);
    EXPECT_NE(json.find("\"error_message\":\"Test error\""), std::string::npos);
    EXPECT_NE(json.find("\"protocol\":\"file\""), std::string::npos);
    EXPECT_NE(json.find("\"host\":\"192.168.1.100\""), std::string::npos);
}

TEST_F(TransferLogContextTest, JsonWithMasking) {
    transfer_log_context ctx;
    ctx.source = "/home/user/file.txt";
    ctx.host = "192.168.1.100";
    ctx.error_message = "Error accessing /home/user/file.txt";

    sensitive_info_masker masker(masking_config{true, true, false, "*", 4});

    auto json = ctx.to_json_with_masking(&masker);

    EXPECT_EQ(json.find("192.168.1.100"), std::string::npos);
    EXPECT_NE(json.find(".100"), std::string::npos);
    EXPECT_EQ(json.find("/home/user/"), std::string::npos);
    EXPECT_NE(json.find("file.txt"), std::string::npos);
}

TEST_F(TransferLogContextTest, JsonEscaping) {
    transfer_log_context ctx;
    ctx.source = "dir/with \"quotes\"";
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

TEST_F(StructuredLogEntryTest, EntryWithContextIsFlattened) {
    structured_log_entry entry;
    entry.timestamp = "2026-01-10T10:30:00.000Z";
    entry.level = log_level::info;
    entry.category = std::string(log_category::engine);
    entry.message = "Saved file";

    transfer_log_context ctx;
    ctx.file_size = 35;
    entry.context = ctx;

    auto json = entry.to_json();

    EXPECT_NE(json.find("\"timestamp\":\"2026-01-10T10:30:00.000Z\""), std::string::npos);
    EXPECT_NE(json.find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"tree_transfer.engine\""), std::string::npos);
    EXPECT_NE(json.find("\"message\":\"Saved file\""), std::string::npos);
    EXPECT_NE(json.find(",\"size\":35"), std::string::npos);
}

TEST_F(StructuredLogEntryTest, EntryWithSourceLocation) {
    structured_log_entry entry;
    entry.level = log_level::error;
    entry.message = "Could not scan directory";
    entry.source_file = "transfer_engine.cpp";
    entry.source_line = 42;
    entry.function_name = "send_dir";

    auto json = entry.to_json();

    EXPECT_NE(json.find("\"source_location\":{"), std::string::npos);
    EXPECT_NE(json.find("\"line\":42"), std::string::npos);
    EXPECT_NE(json.find("\"function\":\"send_dir\""), std::string::npos);
}

// =============================================================================
// Log Entry Builder Tests
// =============================================================================

class LogEntryBuilderTest : public ::testing::Test {};

TEST_F(LogEntryBuilderTest, BuilderWithContextFields) {
    auto entry = log_entry_builder()
        .with_level(log_level::info)
        .with_category(log_category::engine)
        .with_message("Saved file")
        .with_source("/home/user/a.txt")
        .with_destination("/upload/a.txt")
        .with_file_size(1024)
        .with_bytes_transferred(1024)
        .build();

    EXPECT_EQ(entry.category, log_category::engine);
    ASSERT_TRUE(entry.context.has_value());
    EXPECT_EQ(entry.context->source, "/home/user/a.txt");
    EXPECT_EQ(entry.context->destination, "/upload/a.txt");
    EXPECT_EQ(entry.context->file_size.value(), 1024u);
    EXPECT_EQ(entry.context->bytes_transferred.value(), 1024u);
}

TEST_F(LogEntryBuilderTest, BuilderWithoutContextFieldsHasNoContext) {
    auto entry = log_entry_builder()
        .with_level(log_level::debug)
        .with_category(log_category::session)
        .with_message("Reloaded")
        .build();

    EXPECT_FALSE(entry.context.has_value());
}

TEST_F(LogEntryBuilderTest, TimestampFormat) {
    auto entry = log_entry_builder().with_message("Test").build();

    std::regex iso8601_regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)");
    EXPECT_TRUE(std::regex_match(entry.timestamp, iso8601_regex));
}

TEST_F(LogEntryBuilderTest, LogLevelToString) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

// =============================================================================
// Logger Tests
// =============================================================================

class TreeTransferLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().initialize();
        get_logger().set_level(log_level::trace);
        get_logger().enable_json_output(false);
        get_logger().enable_masking(false);
        get_logger().set_console_output(false);
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_level(log_level::info);
        get_logger().set_console_output(true);
    }
};

TEST_F(TreeTransferLoggerTest, SetOutputFormat) {
    get_logger().enable_json_output(true);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::json);

    get_logger().enable_json_output(false);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::text);
}

TEST_F(TreeTransferLoggerTest, EnableMasking) {
    get_logger().enable_masking(true);
    EXPECT_TRUE(get_logger().get_masking_config().mask_hosts);

    get_logger().enable_masking(false);
    EXPECT_FALSE(get_logger().get_masking_config().mask_paths);
}

TEST_F(TreeTransferLoggerTest, CallbackReceivesRecords) {
    std::vector<std::tuple<log_level, std::string, std::string>> captured;
    get_logger().set_callback([&](log_level level, std::string_view category,
                                  std::string_view message, const transfer_log_context*) {
        captured.emplace_back(level, std::string(category), std::string(message));
    });

    TT_LOG_WARN(log_category::session, "Disconnecting from host...");

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(std::get<0>(captured[0]), log_level::warn);
    EXPECT_EQ(std::get<1>(captured[0]), log_category::session);
    EXPECT_EQ(std::get<2>(captured[0]), "Disconnecting from host...");
}

TEST_F(TreeTransferLoggerTest, CallbackReceivesContext) {
    std::optional<uint64_t> size;
    get_logger().set_callback([&](log_level, std::string_view, std::string_view,
                                  const transfer_log_context* ctx) {
        if (ctx) {
            size = ctx->file_size;
        }
    });

    transfer_log_context ctx;
    ctx.file_size = 77;
    TT_LOG_INFO_CTX(log_category::engine, "Saved file", ctx);

    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, 77u);
}

TEST_F(TreeTransferLoggerTest, LevelFiltering) {
    int count = 0;
    get_logger().set_callback([&](log_level, std::string_view, std::string_view,
                                  const transfer_log_context*) { ++count; });

    get_logger().set_level(log_level::warn);
    TT_LOG_DEBUG(log_category::engine, "hidden");
    TT_LOG_INFO(log_category::engine, "hidden");
    TT_LOG_ERROR(log_category::engine, "shown");

    EXPECT_EQ(count, 1);
    EXPECT_FALSE(get_logger().is_enabled(log_level::info));
    EXPECT_TRUE(get_logger().is_enabled(log_level::fatal));
}

}  // namespace kcenon::tree_transfer::test
