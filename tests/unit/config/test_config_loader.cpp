/**
 * @file test_config_loader.cpp
 * @brief Unit tests for YAML and JSON configuration loading
 */

#include <gtest/gtest.h>

#include <kcenon/sftp_stress/config/config_loader.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>

namespace kcenon::sftp_stress::test {

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("sftp_stress_config_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto write_file(const std::string& name, const std::string& content)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream(path) << content;
        return path;
    }

    config_loader loader_;
    std::filesystem::path test_dir_;
};

// =============================================================================
// Parsing
// =============================================================================

TEST_F(ConfigLoaderTest, ParsesAllKeys) {
    auto cfg = loader_.parse_string(R"({
        "host": "10.0.0.7",
        "port": 2222,
        "username": "stress",
        "root_dir": "/upload",
        "ssh_private_key_path": "/keys/id_rsa",
        "ssh_private_key_passphrase": "secret",
        "min_test_file_size_bytes": 1000,
        "max_test_file_size_bytes": 5000,
        "num_test_files": 12,
        "connect_timeout_seconds": 5,
        "transfer_timeout_seconds": -1,
        "sftp_threads": 4,
        "sftp_sleep_interval": 0.5,
        "keep_alive_enabled": true,
        "retry_attempts": 2
    })");

    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    const auto& c = cfg.value();
    EXPECT_EQ(c.host, "10.0.0.7");
    EXPECT_EQ(c.port, 2222);
    EXPECT_EQ(c.username, "stress");
    EXPECT_EQ(c.remote_root, "/upload");
    EXPECT_EQ(c.private_key_path, "/keys/id_rsa");
    EXPECT_EQ(c.private_key_passphrase, "secret");
    EXPECT_EQ(c.min_file_size, 1000u);
    EXPECT_EQ(c.max_file_size, 5000u);
    EXPECT_EQ(c.num_files, 12u);
    EXPECT_EQ(c.connect_timeout_seconds, 5);
    EXPECT_EQ(c.transfer_timeout_seconds, -1);
    EXPECT_EQ(c.concurrency, 4);
    EXPECT_DOUBLE_EQ(c.sleep_interval_seconds, 0.5);
    EXPECT_TRUE(c.keep_alive);
    EXPECT_EQ(c.retry_attempts, 2);
}

TEST_F(ConfigLoaderTest, AbsentKeysKeepDefaults) {
    auto cfg = loader_.parse_string(R"({"host": "sftp.example.com"})");

    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg.value().host, "sftp.example.com");
    EXPECT_EQ(cfg.value().min_file_size, 6000u);
    EXPECT_EQ(cfg.value().concurrency, 1);
}

TEST_F(ConfigLoaderTest, EmptyDocumentGivesBase) {
    run_config base;
    base.host = "base-host";

    auto cfg = loader_.parse_string("  \n", base);
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg.value().host, "base-host");

    auto null_doc = loader_.parse_string("null", base);
    ASSERT_TRUE(null_doc.has_value());
    EXPECT_EQ(null_doc.value().host, "base-host");
}

TEST_F(ConfigLoaderTest, KeepAliveAcceptsZeroOrOne) {
    auto on = loader_.parse_string(R"({"keep_alive_enabled": 1})");
    auto off = loader_.parse_string(R"({"keep_alive_enabled": 0})");
    auto bad = loader_.parse_string(R"({"keep_alive_enabled": 2})");

    ASSERT_TRUE(on.has_value());
    ASSERT_TRUE(off.has_value());
    EXPECT_TRUE(on.value().keep_alive);
    EXPECT_FALSE(off.value().keep_alive);
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, error_code::config_invalid);
}

TEST_F(ConfigLoaderTest, NullPassphraseClearsIt) {
    run_config base;
    base.private_key_passphrase = "old";

    auto cfg = loader_.parse_string(R"({"ssh_private_key_passphrase": null})", base);
    ASSERT_TRUE(cfg.has_value());
    EXPECT_FALSE(cfg.value().private_key_passphrase.has_value());
}

TEST_F(ConfigLoaderTest, IntegerSleepAccepted) {
    auto cfg = loader_.parse_string(R"({"sftp_sleep_interval": 2})");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_DOUBLE_EQ(cfg.value().sleep_interval_seconds, 2.0);
}

// =============================================================================
// YAML documents
// =============================================================================

TEST_F(ConfigLoaderTest, ParsesBlockYaml) {
    auto cfg = loader_.parse_string(R"(# stress profile
host: 10.0.0.7
port: 2222
username: stress
root_dir: /upload
ssh_private_key_path: /keys/id_rsa
ssh_private_key_passphrase: "secret"
min_test_file_size_bytes: 1000
max_test_file_size_bytes: 5000
num_test_files: 12
connect_timeout_seconds: 5
transfer_timeout_seconds: -1
sftp_threads: 4
sftp_sleep_interval: 0.5
keep_alive_enabled: true
retry_attempts: 2
)");

    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    const auto& c = cfg.value();
    EXPECT_EQ(c.host, "10.0.0.7");
    EXPECT_EQ(c.port, 2222);
    EXPECT_EQ(c.username, "stress");
    EXPECT_EQ(c.remote_root, "/upload");
    EXPECT_EQ(c.private_key_path, "/keys/id_rsa");
    EXPECT_EQ(c.private_key_passphrase, "secret");
    EXPECT_EQ(c.min_file_size, 1000u);
    EXPECT_EQ(c.max_file_size, 5000u);
    EXPECT_EQ(c.num_files, 12u);
    EXPECT_EQ(c.connect_timeout_seconds, 5);
    EXPECT_EQ(c.transfer_timeout_seconds, -1);
    EXPECT_EQ(c.concurrency, 4);
    EXPECT_DOUBLE_EQ(c.sleep_interval_seconds, 0.5);
    EXPECT_TRUE(c.keep_alive);
    EXPECT_EQ(c.retry_attempts, 2);
}

TEST_F(ConfigLoaderTest, YamlBooleanWords) {
    auto on = loader_.parse_string("keep_alive_enabled: yes\n");
    auto off = loader_.parse_string("keep_alive_enabled: Off\n");

    ASSERT_TRUE(on.has_value()) << on.error().message;
    ASSERT_TRUE(off.has_value()) << off.error().message;
    EXPECT_TRUE(on.value().keep_alive);
    EXPECT_FALSE(off.value().keep_alive);
}

TEST_F(ConfigLoaderTest, YamlEmptyValueIsNull) {
    run_config base;
    base.private_key_passphrase = "old";

    auto cfg = loader_.parse_string("ssh_private_key_passphrase:\nhost: h\n", base);
    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    EXPECT_FALSE(cfg.value().private_key_passphrase.has_value());
    EXPECT_EQ(cfg.value().host, "h");
}

TEST_F(ConfigLoaderTest, YamlQuotedNumberIsString) {
    auto cfg = loader_.parse_string("port: \"2222\"\n");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().code, error_code::config_type_mismatch);
}

TEST_F(ConfigLoaderTest, YamlNumericPasswordNeedsQuotes) {
    auto plain = loader_.parse_string("ssh_private_key_passphrase: 1234\n");
    auto quoted = loader_.parse_string("ssh_private_key_passphrase: '1234'\n");

    ASSERT_FALSE(plain.has_value());
    EXPECT_EQ(plain.error().code, error_code::config_type_mismatch);
    ASSERT_TRUE(quoted.has_value());
    EXPECT_EQ(quoted.value().private_key_passphrase, "1234");
}

TEST_F(ConfigLoaderTest, YamlFlowMappingAccepted) {
    auto cfg = loader_.parse_string("{host: flow-host, sftp_threads: 3}");
    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    EXPECT_EQ(cfg.value().host, "flow-host");
    EXPECT_EQ(cfg.value().concurrency, 3);
}

TEST_F(ConfigLoaderTest, MalformedYamlIsParseError) {
    auto cfg = loader_.parse_string("host: [unclosed\nport: 22\n");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().code, error_code::config_parse_error);
}

TEST_F(ConfigLoaderTest, YamlScalarDocumentRejected) {
    auto cfg = loader_.parse_string("just a string\n");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().code, error_code::config_type_mismatch);
}

TEST_F(ConfigLoaderTest, YamlUnknownKeyRejected) {
    auto cfg = loader_.parse_string("hostname: typo\n");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().code, error_code::config_unknown_key);
}

// =============================================================================
// Rejections
// =============================================================================

TEST_F(ConfigLoaderTest, MalformedJsonIsParseError) {
    auto cfg = loader_.parse_string(R"({"host": )");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().code, error_code::config_parse_error);
}

TEST_F(ConfigLoaderTest, TopLevelMustBeObject) {
    auto cfg = loader_.parse_string("[1, 2]");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().code, error_code::config_type_mismatch);
}

TEST_F(ConfigLoaderTest, UnknownKeyRejectedByDefault) {
    auto cfg = loader_.parse_string(R"({"hostname": "typo"})");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().code, error_code::config_unknown_key);
    EXPECT_NE(cfg.error().message.find("hostname"), std::string::npos);
}

TEST_F(ConfigLoaderTest, UnknownKeyIgnoredWhenConfigured) {
    config_loader lenient(unknown_key_policy::ignore);
    auto cfg = lenient.parse_string(R"({"hostname": "typo", "host": "real"})");

    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg.value().host, "real");
}

TEST_F(ConfigLoaderTest, TypeMismatchRejected) {
    auto cfg = loader_.parse_string(R"({"num_test_files": "ten"})");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().code, error_code::config_type_mismatch);
}

TEST_F(ConfigLoaderTest, NegativeSizeRejected) {
    auto cfg = loader_.parse_string(R"({"min_test_file_size_bytes": -5})");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().code, error_code::config_invalid);
}

TEST_F(ConfigLoaderTest, PortOutOfRangeRejected) {
    auto cfg = loader_.parse_string(R"({"port": 70000})");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().code, error_code::config_invalid);
}

// =============================================================================
// Files
// =============================================================================

TEST_F(ConfigLoaderTest, LoadYamlFile) {
    auto path = write_file("config.yml",
                           "host: yaml-host\n"
                           "num_test_files: 4\n"
                           "keep_alive_enabled: no\n");

    auto cfg = loader_.load_file(path);
    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    EXPECT_EQ(cfg.value().host, "yaml-host");
    EXPECT_EQ(cfg.value().num_files, 4u);
    EXPECT_FALSE(cfg.value().keep_alive);
}

TEST_F(ConfigLoaderTest, LoadFile) {
    auto path = write_file("config.json", R"({"host": "file-host", "num_test_files": 3})");

    auto cfg = loader_.load_file(path);
    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    EXPECT_EQ(cfg.value().host, "file-host");
    EXPECT_EQ(cfg.value().num_files, 3u);
}

TEST_F(ConfigLoaderTest, MissingFileIsFileError) {
    auto cfg = loader_.load_file(test_dir_ / "absent.json");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().code, error_code::config_file_error);
}

TEST_F(ConfigLoaderTest, FileErrorsNameThePath) {
    auto path = write_file("broken.json", R"({"sftp_threads": "four"})");

    auto cfg = loader_.load_file(path);
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().message.find(path.string()), std::string::npos);
}

TEST_F(ConfigLoaderTest, KnownKeysListed) {
    auto keys = config_loader::known_keys();

    EXPECT_EQ(keys.size(), 15u);
    EXPECT_NE(std::find(keys.begin(), keys.end(), "keep_alive_enabled"), keys.end());
}

}  // namespace kcenon::sftp_stress::test
