#include <gtest/gtest.h>
#include "core/config.hpp"
#include "core/logger.hpp"
#include "storage/error.hpp"
#include "storage/store_config.hpp"
#include "test_util.hpp"
#include <cstdlib>
#include <fstream>

using namespace tabula;

TEST(DotenvTest, ParsesKeyValueLines) {
    auto entry = core::config::parse_dotenv_line("TABULA_DATA_DIR=/var/lib/tabula");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->first, "TABULA_DATA_DIR");
    EXPECT_EQ(entry->second, "/var/lib/tabula");
}

TEST(DotenvTest, StripsExportQuotesAndWhitespace) {
    auto entry = core::config::parse_dotenv_line("  export KEY = \"quoted value\"  ");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->first, "KEY");
    EXPECT_EQ(entry->second, "quoted value");

    entry = core::config::parse_dotenv_line("KEY='single'");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->second, "single");
}

TEST(DotenvTest, SkipsCommentsAndJunk) {
    EXPECT_FALSE(core::config::parse_dotenv_line("").has_value());
    EXPECT_FALSE(core::config::parse_dotenv_line("   ").has_value());
    EXPECT_FALSE(core::config::parse_dotenv_line("# comment=1").has_value());
    EXPECT_FALSE(core::config::parse_dotenv_line("no_equals_sign").has_value());
    EXPECT_FALSE(core::config::parse_dotenv_line("=value").has_value());
}

TEST(ParseU64Test, AcceptsDecimalOnly) {
    EXPECT_EQ(core::config::parse_u64("0"), 0u);
    EXPECT_EQ(core::config::parse_u64("10485760"), 10485760u);
    EXPECT_EQ(core::config::parse_u64("18446744073709551615"), UINT64_MAX);
    EXPECT_FALSE(core::config::parse_u64("18446744073709551616").has_value());
    EXPECT_FALSE(core::config::parse_u64("").has_value());
    EXPECT_FALSE(core::config::parse_u64("-1").has_value());
    EXPECT_FALSE(core::config::parse_u64("12k").has_value());
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(core::log_level_from_string("debug"), spdlog::level::debug);
    EXPECT_EQ(core::log_level_from_string("warn"), spdlog::level::warn);
    EXPECT_FALSE(core::log_level_from_string("loud").has_value());
}

class StoreConfigEnvTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        unsetenv(storage::kEnvDataDir);
        unsetenv(storage::kEnvEncryptionKey);
        unsetenv(storage::kEnvMaxFileSize);
    }
};

TEST_F(StoreConfigEnvTest, DefaultsWhenUnset) {
    storage::StoreConfig config = storage::load_store_config();
    EXPECT_EQ(config.data_dir, std::filesystem::path("./data"));
    EXPECT_FALSE(config.encryption_key.has_value());
    EXPECT_EQ(config.max_file_size, 10u * 1024 * 1024);
}

TEST_F(StoreConfigEnvTest, EnvironmentOverridesDefaults) {
    auto key = storage::Crypto::generate_key();
    setenv(storage::kEnvDataDir, "/tmp/tabula-env", 1);
    setenv(storage::kEnvEncryptionKey, storage::Crypto::key_to_hex(key).c_str(), 1);
    setenv(storage::kEnvMaxFileSize, "4096", 1);

    storage::StoreConfig config = storage::load_store_config();
    EXPECT_EQ(config.data_dir, std::filesystem::path("/tmp/tabula-env"));
    ASSERT_TRUE(config.encryption_key.has_value());
    EXPECT_EQ(*config.encryption_key, key);
    EXPECT_EQ(config.max_file_size, 4096u);
}

TEST_F(StoreConfigEnvTest, MalformedValuesAreConfigErrors) {
    setenv(storage::kEnvEncryptionKey, "abcd", 1);
    try {
        storage::load_store_config();
        FAIL() << "expected StoreError";
    } catch (const storage::StoreError& e) {
        EXPECT_EQ(e.code(), storage::ErrorCode::CONFIG);
    }

    unsetenv(storage::kEnvEncryptionKey);
    setenv(storage::kEnvMaxFileSize, "ten megabytes", 1);
    EXPECT_THROW(storage::load_store_config(), storage::StoreError);
}

TEST(KeyFileTest, CreatesOnceThenReuses) {
    test::TempDir dir;
    auto path = dir.path() / "demo" / "demo.key";

    auto key = storage::load_or_create_key_file(path);
    EXPECT_EQ(key.size(), storage::Crypto::kKeySize);
    ASSERT_TRUE(std::filesystem::exists(path));

    EXPECT_EQ(storage::load_or_create_key_file(path), key);
}

TEST(KeyFileTest, MalformedKeyFileIsConfigError) {
    test::TempDir dir;
    auto path = dir.path() / "demo.key";
    std::ofstream(path) << "not-a-key\n";

    try {
        storage::load_or_create_key_file(path);
        FAIL() << "expected StoreError";
    } catch (const storage::StoreError& e) {
        EXPECT_EQ(e.code(), storage::ErrorCode::CONFIG);
    }
}
