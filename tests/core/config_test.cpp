#include "chsync/core/config.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using chsync::Settings;

namespace {

fs::path write_temp_config(const std::string& content) {
    static std::atomic<std::uint64_t> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto path = fs::temp_directory_path() /
                ("chsync_config_test_" + std::to_string(stamp) + "_" + std::to_string(counter++) + ".json");
    std::ofstream output(path, std::ios::trunc);
    output << content;
    return path;
}

const std::string kToken = "123456789:AAbbCCddEEffGGhhIIjjKKllMMnnOOppQQr";

} // namespace

TEST(SettingsTest, DefaultsAreValid) {
    Settings settings;
    EXPECT_TRUE(settings.validate().is_ok());
    EXPECT_EQ(settings.max_tree_depth, 50u);
    EXPECT_EQ(settings.max_payload_bytes, 10u * 1024 * 1024);
    EXPECT_EQ(settings.max_object_size, 2ULL * 1024 * 1024 * 1024);
}

TEST(SettingsTest, LoadFileOverridesDefaults) {
    const auto path = write_temp_config(R"({
        "index_server_url": "https://index.example.com/",
        "api_timeout": 12,
        "retry_base_delay_ms": 250,
        "per_file_attempts": 4,
        "max_payload_bytes": 2048,
        "unknown_key": true
    })");

    auto loaded = Settings::load_file(path);
    fs::remove(path);

    ASSERT_TRUE(loaded.is_ok()) << loaded.error();
    const auto& settings = loaded.value();
    EXPECT_EQ(settings.index_server_url, "https://index.example.com");
    EXPECT_EQ(settings.api_timeout, std::chrono::seconds{12});
    EXPECT_EQ(settings.retry.base_delay, std::chrono::milliseconds{250});
    EXPECT_EQ(settings.per_file_attempts, 4);
    EXPECT_EQ(settings.max_payload_bytes, 2048u);
    EXPECT_EQ(settings.transfer_api_url, "https://api.telegram.org");
}

TEST(SettingsTest, LoadFileRejectsWrongTypes) {
    const auto path = write_temp_config(R"({"api_timeout": "thirty"})");
    auto loaded = Settings::load_file(path);
    fs::remove(path);

    ASSERT_TRUE(loaded.is_error());
    EXPECT_NE(loaded.error().find("api_timeout"), std::string::npos);
}

TEST(SettingsTest, LoadFileRejectsMalformedJson) {
    const auto path = write_temp_config("{not json");
    auto loaded = Settings::load_file(path);
    fs::remove(path);

    ASSERT_TRUE(loaded.is_error());
}

TEST(SettingsTest, LoadFileIgnoresCredential) {
    const auto path = write_temp_config(R"({"credential": "123456789:secret"})");
    auto loaded = Settings::load_file(path);
    fs::remove(path);

    ASSERT_TRUE(loaded.is_ok());
    EXPECT_TRUE(loaded.value().credential.empty());
}

TEST(SettingsTest, MissingFileIsAnError) {
    auto loaded = Settings::load_file("/nonexistent/chsync/settings.json");
    ASSERT_TRUE(loaded.is_error());
    EXPECT_NE(loaded.error().find("Cannot open config file"), std::string::npos);
}

TEST(SettingsTest, EnvironmentOverridesEndpointsAndCredential) {
    ::setenv("CHSYNC_SERVER_URL", "http://127.0.0.1:9000/", 1);
    ::setenv("CHSYNC_BOT_TOKEN", kToken.c_str(), 1);

    Settings settings;
    settings.apply_environment();

    ::unsetenv("CHSYNC_SERVER_URL");
    ::unsetenv("CHSYNC_BOT_TOKEN");

    EXPECT_EQ(settings.index_server_url, "http://127.0.0.1:9000");
    EXPECT_EQ(settings.credential, kToken);
}

TEST(SettingsTest, ValidateRejectsInconsistentValues) {
    Settings bad_url;
    bad_url.index_server_url = "ftp://server";
    EXPECT_TRUE(bad_url.validate().is_error());

    Settings inverted;
    inverted.transfer_timeout_min = std::chrono::seconds{100};
    inverted.transfer_timeout_max = std::chrono::seconds{10};
    EXPECT_TRUE(inverted.validate().is_error());

    Settings no_attempts;
    no_attempts.per_file_attempts = 0;
    EXPECT_TRUE(no_attempts.validate().is_error());

    Settings prefix;
    prefix.index_api_prefix = "api";
    EXPECT_TRUE(prefix.validate().is_error());
}

TEST(CredentialFormatTest, AcceptsBotTokenShape) {
    EXPECT_TRUE(chsync::is_valid_credential(kToken));
    EXPECT_FALSE(chsync::is_valid_credential(""));
    EXPECT_FALSE(chsync::is_valid_credential("1234:short"));
    EXPECT_FALSE(chsync::is_valid_credential("abcdefghi:AAbbCCddEEffGGhhIIjjKKllMMnnOOppQQr"));
}

TEST(DestinationFormatTest, AcceptsChannelNamesAndNumericIds) {
    EXPECT_TRUE(chsync::is_valid_destination_id("@my_channel"));
    EXPECT_TRUE(chsync::is_valid_destination_id("-1001234567890"));
    EXPECT_FALSE(chsync::is_valid_destination_id("@abc"));
    EXPECT_FALSE(chsync::is_valid_destination_id("my_channel"));
    EXPECT_FALSE(chsync::is_valid_destination_id("-1234567890"));
}
