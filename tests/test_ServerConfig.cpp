#include <gtest/gtest.h>
#include "config/ServerConfig.hpp"
#include "TestSupport.hpp"

using namespace secure_fs;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

class ServerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        fs::create_directories(dir_ / "data");
        data_ = (dir_ / "data").string();
    }

    secure_fs::testing::TempDir dir_{"config"};
    std::string data_;
};

}

TEST_F(ServerConfigTest, MinimalConfigGetsDefaults) {
    ServerConfig cfg = ServerConfig::from_json({{"allowedDirectories", {data_}}});
    ASSERT_EQ(cfg.allowed_directories.size(), 1u);
    EXPECT_EQ(cfg.allowed_directories[0], data_);
    EXPECT_TRUE(cfg.backup_directory.empty());
    EXPECT_FALSE(cfg.case_insensitive_paths);
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_FALSE(cfg.network.enabled);
    EXPECT_EQ(cfg.network.host, "localhost");
    EXPECT_EQ(cfg.network.port, 3002);
}

TEST_F(ServerConfigTest, ReadsEveryField) {
    json j = {
        {"allowedDirectories", {data_}},
        {"backupDirectory", (dir_ / "bk").string()},
        {"caseInsensitivePaths", true},
        {"logLevel", "DEBUG"},
        {"network", {
            {"enabled", true},
            {"host", "0.0.0.0"},
            {"port", 8080},
            {"allowedIPs", {"127.0.0.1"}},
            {"allowedSubnets", {"10.0.0.0/8"}}
        }}
    };
    ServerConfig cfg = ServerConfig::from_json(j);
    EXPECT_EQ(cfg.backup_directory, (dir_ / "bk").string());
    EXPECT_TRUE(cfg.case_insensitive_paths);
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_TRUE(cfg.network.enabled);
    EXPECT_EQ(cfg.network.host, "0.0.0.0");
    EXPECT_EQ(cfg.network.port, 8080);
    EXPECT_EQ(cfg.network.allowed_ips, std::vector<std::string>{"127.0.0.1"});
    EXPECT_EQ(cfg.network.allowed_subnets, std::vector<std::string>{"10.0.0.0/8"});
}

TEST_F(ServerConfigTest, RelativeDirectoriesBecomeAbsolute) {
    fs::path previous = fs::current_path();
    fs::current_path(dir_.path());
    ServerConfig cfg = ServerConfig::from_json({{"allowedDirectories", {"./data/"}}});
    fs::current_path(previous);
    EXPECT_EQ(cfg.allowed_directories[0], data_);
}

TEST_F(ServerConfigTest, RejectsBadConfigs) {
    EXPECT_THROW(ServerConfig::from_json(json::object()), ConfigError);
    EXPECT_THROW(ServerConfig::from_json({{"allowedDirectories", json::array()}}), ConfigError);
    EXPECT_THROW(ServerConfig::from_json({{"allowedDirectories", {(dir_ / "missing").string()}}}), ConfigError);

    secure_fs::testing::write_text(dir_ / "plain.txt", "x");
    EXPECT_THROW(ServerConfig::from_json({{"allowedDirectories", {(dir_ / "plain.txt").string()}}}), ConfigError);

    EXPECT_THROW(ServerConfig::from_json({{"allowedDirectories", {data_}}, {"logLevel", "chatty"}}), ConfigError);
    EXPECT_THROW(ServerConfig::from_json({{"allowedDirectories", {data_}},
                                          {"network", {{"allowedSubnets", {"10.0.0.0"}}}}}),
                 ConfigError);
    EXPECT_THROW(ServerConfig::from_json({{"allowedDirectories", {data_}}, {"network", {{"port", "http"}}}}),
                 ConfigError);
}

TEST_F(ServerConfigTest, LoadFileRecordsSource) {
    fs::path file = dir_ / "config.json";
    secure_fs::testing::write_text(file, json{{"allowedDirectories", {data_}}}.dump());
    ServerConfig cfg = ServerConfig::load(file.string());
    EXPECT_EQ(cfg.source_path, file.string());
    EXPECT_EQ(cfg.allowed_directories[0], data_);
}

TEST_F(ServerConfigTest, LoadFileRejectsInvalidJson) {
    fs::path file = dir_ / "broken.json";
    secure_fs::testing::write_text(file, "{ allowedDirectories: ");
    EXPECT_THROW(ServerConfig::load_file(file.string()), ConfigError);
    EXPECT_THROW(ServerConfig::load_file((dir_ / "absent.json").string()), ConfigError);
}

TEST_F(ServerConfigTest, DefaultJsonRoundTripsThroughValidation) {
    ServerConfig cfg = ServerConfig::from_json(ServerConfig::default_json(data_));
    EXPECT_EQ(cfg.allowed_directories[0], data_);
    EXPECT_EQ(cfg.network.port, 3002);
}
