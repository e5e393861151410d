#include "drive/config.hpp"

#include "drive/errors.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <ctime>
#include <filesystem>
#include <fstream>

namespace tgdrive {
namespace {

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("tgdrive_config_test_" + std::to_string(std::time(nullptr)));
        fs::create_directories(dir_);
        path_ = dir_ / "config.json";
    }

    void TearDown() override { fs::remove_all(dir_); }

    void write(const std::string& content) {
        std::ofstream out(path_);
        out << content;
    }

    fs::path dir_;
    fs::path path_;
};

TEST_F(ConfigTest, DefaultsForMissingKeys) {
    auto config = config_from_json(nlohmann::json::object());

    EXPECT_EQ(config.provider.mode, ProviderMode::OFFICIAL);
    EXPECT_EQ(config.provider.api_base_url, "https://api.telegram.org");
    EXPECT_EQ(config.chunk_size_bytes, kDefaultChunkSize);
    EXPECT_EQ(config.upload_concurrency, 1);
    EXPECT_EQ(config.download_concurrency, 2);
    EXPECT_EQ(config.reserved_disk_bytes, kDefaultReservedDiskBytes);
    EXPECT_EQ(config.upload_session_ttl_hours, 24);
    EXPECT_FALSE(config.has_credentials());
}

TEST_F(ConfigTest, NumericChatIdIsAccepted) {
    auto config = config_from_json(nlohmann::json{{"bot_token", "1:x"}, {"storage_chat_id", -1001234}});
    EXPECT_EQ(config.provider.storage_chat_id, "-1001234");
    EXPECT_TRUE(config.has_credentials());
}

TEST_F(ConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(config_from_json(nlohmann::json{{"upload_concurrency", 0}}), ValidationException);
    EXPECT_THROW(config_from_json(nlohmann::json{{"chunk_size_bytes", -5}}), ValidationException);
    EXPECT_THROW(config_from_json(nlohmann::json{{"reserved_disk_bytes", -1}}), ValidationException);
    EXPECT_THROW(config_from_json(nlohmann::json{{"mode", "cloud"}}), ValidationException);
    EXPECT_THROW(config_from_json(nlohmann::json{{"download_concurrency", "two"}}), ValidationException);
    EXPECT_THROW(config_from_json(nlohmann::json::array()), ValidationException);
}

TEST_F(ConfigTest, SaveAndLoad) {
    DriveConfig config;
    config.provider.bot_token = "123:abc";
    config.provider.storage_chat_id = "-100500";
    config.provider.mode = ProviderMode::SELF_HOSTED;
    config.provider.api_base_url = "http://localhost:8081";
    config.chunk_size_bytes = 4 * 1024 * 1024;
    config.upload_concurrency = 3;
    config.staging_dir = "/srv/staging";

    save_config(config, path_);
    auto loaded = load_config(path_);

    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->provider.bot_token, "123:abc");
    EXPECT_EQ(loaded->provider.storage_chat_id, "-100500");
    EXPECT_EQ(loaded->provider.mode, ProviderMode::SELF_HOSTED);
    EXPECT_EQ(loaded->provider.api_base_url, "http://localhost:8081");
    EXPECT_EQ(loaded->chunk_size_bytes, 4 * 1024 * 1024);
    EXPECT_EQ(loaded->upload_concurrency, 3);
    EXPECT_EQ(loaded->resolved_staging_dir(), fs::path("/srv/staging"));
}

TEST_F(ConfigTest, LoadMissingFile) { EXPECT_FALSE(load_config(dir_ / "absent.json").has_value()); }

TEST_F(ConfigTest, LoadMalformedFile) {
    write("{ not json");
    EXPECT_FALSE(load_config(path_).has_value());

    write(R"({"upload_concurrency": -2})");
    EXPECT_FALSE(load_config(path_).has_value());
}

TEST_F(ConfigTest, RuntimeSettingsMirrorConfig) {
    DriveConfig config;
    config.upload_concurrency = 4;
    config.download_concurrency = 6;
    config.reserved_disk_bytes = 1024;

    auto settings = config.runtime_settings();
    EXPECT_EQ(settings.upload_concurrency, 4);
    EXPECT_EQ(settings.download_concurrency, 6);
    EXPECT_EQ(settings.reserved_disk_bytes, 1024);
}

}  // namespace
}  // namespace tgdrive
