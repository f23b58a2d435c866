#include <gtest/gtest.h>
#include "service_config.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace matchcast;

class ServiceConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() /
                 ("matchcast_config_" + std::to_string(::getpid()) + ".json")).string();
    }

    void TearDown() override {
        std::filesystem::remove(path_);
    }

    void write(const std::string& body) {
        std::ofstream out(path_);
        out << body;
    }

    std::string path_;
};

TEST_F(ServiceConfigTest, Defaults) {
    ServiceConfig config;
    EXPECT_TRUE(config.valid());
    EXPECT_EQ(config.model_name, "poisson_dc");
    EXPECT_EQ(config.cache_ttl(), std::chrono::seconds(60));
    EXPECT_EQ(config.server_port, 8090);
    EXPECT_EQ(config.unsettled_horizon(), std::chrono::hours(72));

    const CalibrationGates gates = config.gates();
    EXPECT_DOUBLE_EQ(gates.accuracy_floor, 0.45);
    EXPECT_DOUBLE_EQ(gates.ece_ceil, 0.08);
    EXPECT_EQ(gates.window_days, 7);
    EXPECT_EQ(gates.min_samples, 50u);

    const ArbitrageSettings arb = config.arbitrage();
    EXPECT_EQ(arb.freshness, std::chrono::seconds(300));
    EXPECT_EQ(to_fixed_string(arb.total_stake), "100.00");
}

TEST_F(ServiceConfigTest, PartialFileKeepsOtherDefaults) {
    write(R"({"cache_ttl_seconds": 15, "arbitrage_total_stake": 250.555, "log_dir": "/tmp/mc"})");
    ServiceConfig config;
    ASSERT_TRUE(config.load(path_));
    EXPECT_EQ(config.cache_ttl_seconds, 15);
    EXPECT_EQ(config.log_dir, "/tmp/mc");
    EXPECT_EQ(to_fixed_string(config.arbitrage().total_stake), "250.56");
    EXPECT_EQ(config.worker_threads, 4);
    EXPECT_EQ(config.hash_salt, "matchcast");
}

TEST_F(ServiceConfigTest, UnsettledHorizonMustBePositive) {
    ServiceConfig config;
    write(R"({"unsettled_horizon_hours": 0})");
    EXPECT_FALSE(config.load(path_));
    EXPECT_EQ(config.unsettled_horizon_hours, 72);

    write(R"({"unsettled_horizon_hours": 24})");
    ASSERT_TRUE(config.load(path_));
    EXPECT_EQ(config.unsettled_horizon(), std::chrono::hours(24));
}

TEST_F(ServiceConfigTest, MissingFileKeepsDefaults) {
    ServiceConfig config;
    EXPECT_FALSE(config.load(path_ + ".missing"));
    EXPECT_EQ(config.cache_ttl_seconds, 60);
}

TEST_F(ServiceConfigTest, MalformedFileKeepsPreviousValues) {
    ServiceConfig config;
    config.cache_ttl_seconds = 30;

    write("{ \"cache_ttl_seconds\": ");
    EXPECT_FALSE(config.load(path_));
    EXPECT_EQ(config.cache_ttl_seconds, 30);

    write("[1, 2, 3]");
    EXPECT_FALSE(config.load(path_));
}

TEST_F(ServiceConfigTest, WrongTypeRejectedAsAWhole) {
    ServiceConfig config;
    EXPECT_FALSE(config.load(nlohmann::json{{"cache_ttl_seconds", 5}, {"worker_threads", "four"}}));
    EXPECT_EQ(config.cache_ttl_seconds, 60);
    EXPECT_EQ(config.worker_threads, 4);
}

TEST_F(ServiceConfigTest, OutOfRangeValuesRejected) {
    ServiceConfig config;
    EXPECT_FALSE(config.load(nlohmann::json{{"cache_ttl_seconds", 0}}));
    EXPECT_FALSE(config.load(nlohmann::json{{"accuracy_floor", 1.5}}));
    EXPECT_FALSE(config.load(nlohmann::json{{"server_port", 70000}}));
    EXPECT_FALSE(config.load(nlohmann::json{{"model_name", ""}}));
    EXPECT_TRUE(config.valid());
    EXPECT_EQ(config.cache_ttl_seconds, 60);
}

TEST_F(ServiceConfigTest, ShippedConfigLoads) {
    ServiceConfig config;
    const std::string shipped = std::string(MATCHCAST_SOURCE_DIR) + "/config/matchcast.json";
    ASSERT_TRUE(config.load(shipped));
    EXPECT_EQ(config.registry_state_path, "logs/registry.json");
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
