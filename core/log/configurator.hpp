/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace ratemon::log {

  /**
   * YAML configurator of the logging system. The embedded configuration
   * declares the sinks and the groups `ratemon`, `application`, `metrics`
   * and `rate`; a custom file is applied over it.
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
   public:
    Configurator();

    explicit Configurator(std::filesystem::path custom_config);

    /**
     * Finds the value of `--logcfg` in the command line, ignoring every other
     * option. A malformed command line yields nothing: reporting it is up to
     * the main parser.
     */
    static std::optional<std::filesystem::path> getLogConfigFile(
        int argc, const char **argv);
  };

}  // namespace ratemon::log
