/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <array>
#include <stdexcept>
#include <utility>

OUTCOME_CPP_DEFINE_CATEGORY(ratemon::log, Error, e) {
  using E = ratemon::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
    case E::WRONG_GROUP:
      return "Unknown group";
    case E::MALFORMED_DIRECTIVE:
      return "Expected <level> or <group>=<level>";
  }
  return "Unknown log::Error";
}

namespace ratemon::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::weak_ptr<soralog::LoggingSystem> logging_system_;

    std::shared_ptr<soralog::LoggingSystem> loggingSystem() {
      auto logging_system = logging_system_.lock();
      if (not logging_system) {
        throw std::logic_error(
            "Logging system is not ready, "
            "ratemon::log::setLoggingSystem() must be called first");
      }
      return logging_system;
    }

    constexpr std::array<std::pair<std::string_view, Level>, 14> kLevelNames{{
        {"trace", Level::TRACE},
        {"debug", Level::DEBUG},
        {"verbose", Level::VERBOSE},
        {"info", Level::INFO},
        {"inf", Level::INFO},
        {"warning", Level::WARN},
        {"warn", Level::WARN},
        {"error", Level::ERROR},
        {"err", Level::ERROR},
        {"critical", Level::CRITICAL},
        {"crit", Level::CRITICAL},
        {"off", Level::OFF},
        {"no", Level::OFF},
        {"none", Level::OFF},
    }};
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    for (auto &[name, level] : kLevelNames) {
      if (name == str) {
        return level;
      }
    }
    return Error::WRONG_LEVEL;
  }

  outcome::result<LevelDirective> parseLevelDirective(std::string_view str) {
    auto eq = str.find('=');
    if (eq == std::string_view::npos) {
      OUTCOME_TRY(level, str2lvl(str));
      return LevelDirective{std::nullopt, level};
    }
    auto group = str.substr(0, eq);
    if (group.empty() or str.find('=', eq + 1) != std::string_view::npos) {
      return Error::MALFORMED_DIRECTIVE;
    }
    OUTCOME_TRY(level, str2lvl(str.substr(eq + 1)));
    return LevelDirective{std::string{group}, level};
  }

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = std::move(logging_system);
  }

  void tuneLoggingSystem(const std::vector<std::string> &directives) {
    auto logger = createLogger("LoggingSystem");

    for (const auto &directive : directives) {
      auto parsed = parseLevelDirective(directive);
      if (parsed.has_error()) {
        SL_WARN(logger,
                "Log level directive '{}' is ignored: {}",
                directive,
                parsed.error().message());
        continue;
      }
      const auto &[group, level] = parsed.value();
      auto res = setLevelOfGroup(group.value_or(defaultGroupName), level);
      if (res.has_error()) {
        SL_WARN(logger,
                "Log level directive '{}' is ignored: {}",
                directive,
                res.error().message());
      }
    }
  }

  Logger createLogger(const std::string &tag) {
    return createLogger(tag, defaultGroupName);
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    return std::static_pointer_cast<soralog::LoggerFactory>(loggingSystem())
        ->getLogger(tag, group);
  }

  outcome::result<void> setLevelOfGroup(const std::string &group_name,
                                        Level level) {
    if (not loggingSystem()->setLevelOfGroup(group_name, level)) {
      return Error::WRONG_GROUP;
    }
    return outcome::success();
  }

  outcome::result<void> resetLevelOfGroup(const std::string &group_name) {
    if (not loggingSystem()->resetLevelOfGroup(group_name)) {
      return Error::WRONG_GROUP;
    }
    return outcome::success();
  }

}  // namespace ratemon::log
