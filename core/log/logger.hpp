/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

#include "outcome/outcome.hpp"

namespace ratemon::log {

  using Level = soralog::Level;
  using Logger = std::shared_ptr<soralog::Logger>;

  enum class Error : uint8_t {
    WRONG_LEVEL = 1,
    WRONG_GROUP,
    MALFORMED_DIRECTIVE,
  };

  /// Root group of every logger of the project
  static const std::string defaultGroupName("ratemon");

  /**
   * One `--log` value: a bare level applies to the root group, `group=level`
   * to the named one
   */
  struct LevelDirective {
    std::optional<std::string> group;
    Level level;
  };

  outcome::result<Level> str2lvl(std::string_view str);

  outcome::result<LevelDirective> parseLevelDirective(std::string_view str);

  /// Must be called once before any logger is created
  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system);

  /**
   * Applies `--log` directives in order. A directive which can't be parsed or
   * names an unknown group is reported and skipped.
   */
  void tuneLoggingSystem(const std::vector<std::string> &directives);

  [[nodiscard]] Logger createLogger(const std::string &tag);

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group);

  outcome::result<void> setLevelOfGroup(const std::string &group_name,
                                        Level level);

  outcome::result<void> resetLevelOfGroup(const std::string &group_name);

}  // namespace ratemon::log

OUTCOME_HPP_DECLARE_ERROR(ratemon::log, Error);
