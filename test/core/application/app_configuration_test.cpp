/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include <fstream>
#include <iterator>

#include "application/impl/app_configuration_impl.hpp"
#include "log/logger.hpp"
#include "testutil/prepare_loggers.hpp"

using ratemon::application::AppConfiguration;
using ratemon::application::AppConfigurationImpl;

class AppConfigurationTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  boost::filesystem::path tmp_dir = boost::filesystem::temp_directory_path()
                                  / boost::filesystem::unique_path();
  std::string config_path = (tmp_dir / "config.json").native();
  std::string invalid_config_path = (tmp_dir / "invalid_config.json").native();
  std::string damaged_config_path = (tmp_dir / "damaged_config.json").native();

  static constexpr char const *file_content =
      R"({
        "general" : {
          "log" : ["debug", "metrics=trace"]
        },
        "metrics" : {
          "prometheus-host" : "127.0.0.1",
          "prometheus-port" : 9000
        },
        "pipeline" : {
          "rate-interval" : 2.5,
          "tick-every" : 50,
          "events" : 1000
        }
      })";
  static constexpr char const *invalid_file_content =
      R"({
        "general" : {
          "log" : 7
        },
        "metrics" : {
          "prometheus-host" : 1,
          "prometheus-port" : "AWESOME_PORT"
        },
        "pipeline" : {
          "rate-interval" : "fast",
          "tick-every" : -1,
          "events" : "many"
        }
      })";
  static constexpr char const *damaged_file_content =
      R"({
        "metrics" : {
          "prometheus-host" : "127.0.0.1",
        "pipeline" : nterval" : 2.5
        }
      })";

  boost::asio::ip::tcp::endpoint get_endpoint(char const *host, uint16_t port) {
    return {boost::asio::ip::make_address(host), port};
  }

  void SetUp() override {
    boost::filesystem::create_directory(tmp_dir);
    ASSERT_TRUE(boost::filesystem::exists(tmp_dir));

    auto spawn_file = [](std::string const &path,
                         std::string const &file_content) {
      std::ofstream file(path, std::ofstream::out | std::ofstream::trunc);
      file << file_content;
    };

    spawn_file(config_path, file_content);
    spawn_file(invalid_config_path, invalid_file_content);
    spawn_file(damaged_config_path, damaged_file_content);

    auto logger = ratemon::log::createLogger("AppConfigTest", "testing");
    app_config_ = std::make_shared<AppConfigurationImpl>(logger);
  }

  void TearDown() override {
    app_config_.reset();
    boost::system::error_code ec;
    boost::filesystem::remove_all(tmp_dir, ec);
  }

  std::shared_ptr<AppConfigurationImpl> app_config_;
};

/**
 * @given new created AppConfigurationImpl
 * @when no arguments provided
 * @then default values are used
 */
TEST_F(AppConfigurationTest, DefaultValuesTest) {
  char const *args[] = {"ratemon_node"};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->openmetricsHttpEndpoint(),
            get_endpoint("0.0.0.0", 9615));
  EXPECT_DOUBLE_EQ(app_config_->rateIntervalSecs(), 1.0);
  EXPECT_EQ(app_config_->tickEvery(), 1000u);
  EXPECT_EQ(app_config_->eventsLimit(), 0u);
  EXPECT_TRUE(app_config_->log().empty());
}

/**
 * @given new created AppConfigurationImpl
 * @when every option is given on the command line
 * @then the given values are used
 */
TEST_F(AppConfigurationTest, CommandLineTest) {
  char const *args[] = {"ratemon_node",
                        "--prometheus-host",
                        "127.0.0.1",
                        "--prometheus-port",
                        "9000",
                        "--rate-interval",
                        "0.5",
                        "--tick-every",
                        "10",
                        "--events",
                        "100",
                        "-lmetrics=debug",
                        "-l",
                        "rate=trace"};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->openmetricsHttpEndpoint(),
            get_endpoint("127.0.0.1", 9000));
  EXPECT_DOUBLE_EQ(app_config_->rateIntervalSecs(), 0.5);
  EXPECT_EQ(app_config_->tickEvery(), 10u);
  EXPECT_EQ(app_config_->eventsLimit(), 100u);
  EXPECT_EQ(app_config_->log(),
            (std::vector<std::string>{"metrics=debug", "rate=trace"}));
}

/**
 * @given new created AppConfigurationImpl
 * @when --prometheus-external is given along with a host
 * @then the exposer listens on every interface
 */
TEST_F(AppConfigurationTest, PrometheusExternalTest) {
  char const *args[] = {"ratemon_node",
                        "--prometheus-host",
                        "127.0.0.1",
                        "--prometheus-external"};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->openmetricsHttpEndpoint(),
            get_endpoint("0.0.0.0", 9615));
}

/**
 * @given new created AppConfigurationImpl
 * @when --no-prometheus is given
 * @then there is no exposer endpoint
 */
TEST_F(AppConfigurationTest, NoPrometheusTest) {
  char const *args[] = {"ratemon_node", "--no-prometheus"};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_FALSE(app_config_->openmetricsHttpEndpoint().has_value());
}

/**
 * @given new created AppConfigurationImpl
 * @when a host which is not an ip address is given
 * @then initialization fails
 */
TEST_F(AppConfigurationTest, InvalidHostTest) {
  char const *args[] = {"ratemon_node", "--prometheus-host", "not-an-ip"};
  ASSERT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}

/**
 * @given new created AppConfigurationImpl
 * @when a non positive sampling interval is given
 * @then initialization fails
 */
TEST_F(AppConfigurationTest, InvalidIntervalTest) {
  char const *args[] = {"ratemon_node", "--rate-interval", "0"};
  ASSERT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}

/**
 * @given new created AppConfigurationImpl
 * @when a sampling interval beyond the range of the clock is given
 * @then initialization fails
 */
TEST_F(AppConfigurationTest, TooLargeIntervalTest) {
  char const *args[] = {"ratemon_node", "--rate-interval", "1e10"};
  ASSERT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}

/**
 * @given new created AppConfigurationImpl
 * @when a tick interval of zero is given
 * @then initialization fails
 */
TEST_F(AppConfigurationTest, ZeroTickEveryTest) {
  char const *args[] = {"ratemon_node", "--tick-every", "0"};
  ASSERT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}

/**
 * @given new created AppConfigurationImpl
 * @when a malformed number is given
 * @then initialization fails
 */
TEST_F(AppConfigurationTest, MalformedNumberTest) {
  char const *args[] = {"ratemon_node", "--prometheus-port", "port"};
  ASSERT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}

/**
 * @given new created AppConfigurationImpl
 * @when a config file is given
 * @then the values of the file are used
 */
TEST_F(AppConfigurationTest, ConfigFileTest) {
  char const *args[] = {
      "ratemon_node", "--config-file", config_path.c_str()};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->openmetricsHttpEndpoint(),
            get_endpoint("127.0.0.1", 9000));
  EXPECT_DOUBLE_EQ(app_config_->rateIntervalSecs(), 2.5);
  EXPECT_EQ(app_config_->tickEvery(), 50u);
  EXPECT_EQ(app_config_->eventsLimit(), 1000u);
  EXPECT_EQ(app_config_->log(),
            (std::vector<std::string>{"debug", "metrics=trace"}));
}

/**
 * @given new created AppConfigurationImpl
 * @when a config file and command line options are given
 * @then the command line options take precedence
 */
TEST_F(AppConfigurationTest, CommandLineOverridesConfigFileTest) {
  char const *args[] = {"ratemon_node",
                        "--config-file",
                        config_path.c_str(),
                        "--prometheus-port",
                        "9100",
                        "--tick-every",
                        "7"};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->openmetricsHttpEndpoint(),
            get_endpoint("127.0.0.1", 9100));
  EXPECT_EQ(app_config_->tickEvery(), 7u);
  EXPECT_DOUBLE_EQ(app_config_->rateIntervalSecs(), 2.5);
}

/**
 * @given new created AppConfigurationImpl
 * @when a config file with values of wrong types is given
 * @then the wrong values are ignored and defaults are used
 */
TEST_F(AppConfigurationTest, InvalidConfigFileTest) {
  char const *args[] = {
      "ratemon_node", "--config-file", invalid_config_path.c_str()};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->openmetricsHttpEndpoint(),
            get_endpoint("0.0.0.0", 9615));
  EXPECT_DOUBLE_EQ(app_config_->rateIntervalSecs(), 1.0);
  EXPECT_EQ(app_config_->tickEvery(), 1000u);
  EXPECT_EQ(app_config_->eventsLimit(), 0u);
  EXPECT_TRUE(app_config_->log().empty());
}

/**
 * @given new created AppConfigurationImpl
 * @when a config file which is not valid JSON is given
 * @then initialization fails
 */
TEST_F(AppConfigurationTest, DamagedConfigFileTest) {
  char const *args[] = {
      "ratemon_node", "--config-file", damaged_config_path.c_str()};
  ASSERT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}

/**
 * @given new created AppConfigurationImpl
 * @when a config file which does not exist is given
 * @then initialization fails
 */
TEST_F(AppConfigurationTest, MissingConfigFileTest) {
  auto missing = (tmp_dir / "missing.json").native();
  char const *args[] = {"ratemon_node", "--config-file", missing.c_str()};
  ASSERT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}
