/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <gtest/gtest.h>
#include <iterator>

#include "log/configurator.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using ratemon::log::Error;
using ratemon::log::Level;
using ratemon::log::parseLevelDirective;
using ratemon::log::str2lvl;

class LoggerTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }
};

/**
 * @given level names and their short forms
 * @when parsing them
 * @then the matching levels are returned, unknown names fail
 */
TEST_F(LoggerTest, StrToLevel) {
  EXPECT_OUTCOME_TRUE(trace, str2lvl("trace"));
  EXPECT_EQ(trace, Level::TRACE);
  EXPECT_OUTCOME_TRUE(warn, str2lvl("warn"));
  EXPECT_EQ(warn, Level::WARN);
  EXPECT_OUTCOME_TRUE(off, str2lvl("no"));
  EXPECT_EQ(off, Level::OFF);
  EXPECT_EC(str2lvl("loud"), Error::WRONG_LEVEL);
}

/**
 * @given `--log` values
 * @when parsing them as level directives
 * @then a bare level has no group, `group=level` names one, and malformed
 * values fail
 */
TEST_F(LoggerTest, ParseDirective) {
  EXPECT_OUTCOME_TRUE(root, parseLevelDirective("debug"));
  EXPECT_FALSE(root.group.has_value());
  EXPECT_EQ(root.level, Level::DEBUG);

  EXPECT_OUTCOME_TRUE(grouped, parseLevelDirective("rate=crit"));
  ASSERT_TRUE(grouped.group.has_value());
  EXPECT_EQ(*grouped.group, "rate");
  EXPECT_EQ(grouped.level, Level::CRITICAL);

  EXPECT_EC(parseLevelDirective("rate=loud"), Error::WRONG_LEVEL);
  EXPECT_EC(parseLevelDirective("=info"), Error::MALFORMED_DIRECTIVE);
  EXPECT_EC(parseLevelDirective("a=b=info"), Error::MALFORMED_DIRECTIVE);
}

/**
 * @given a logger of group "metrics"
 * @when tuning the group by level directives
 * @then the logger follows the level of the group, and invalid directives
 * change nothing
 */
TEST_F(LoggerTest, TuneGroup) {
  auto logger = ratemon::log::createLogger("TuneGroup", "metrics");

  ratemon::log::tuneLoggingSystem({"metrics=trace"});
  EXPECT_EQ(logger->level(), Level::TRACE);

  ratemon::log::tuneLoggingSystem({"metrics=unknown", "nogroup=debug"});
  EXPECT_EQ(logger->level(), Level::TRACE);

  EXPECT_OUTCOME_TRUE_1(ratemon::log::resetLevelOfGroup("metrics"));
  EXPECT_EC(ratemon::log::setLevelOfGroup("nogroup", Level::DEBUG),
            Error::WRONG_GROUP);
}

/**
 * @given command line arguments with and without `--logcfg`
 * @when looking for the logging configuration file
 * @then the path is found only where it is given
 */
TEST_F(LoggerTest, LogConfigFile) {
  char const *with_cfg[] = {
      "ratemon_node", "--tick-every", "5", "--logcfg", "/tmp/log.yaml"};
  auto path = ratemon::log::Configurator::getLogConfigFile(std::size(with_cfg),
                                                            with_cfg);
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(path->string(), "/tmp/log.yaml");

  char const *without_cfg[] = {"ratemon_node", "-l", "debug"};
  EXPECT_FALSE(ratemon::log::Configurator::getLogConfigFile(
                   std::size(without_cfg), without_cfg)
                   .has_value());

  char const *no_value[] = {"ratemon_node", "--logcfg"};
  EXPECT_FALSE(ratemon::log::Configurator::getLogConfigFile(std::size(no_value),
                                                            no_value)
                   .has_value());
}
