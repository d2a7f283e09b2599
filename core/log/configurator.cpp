/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/configurator.hpp"

#include <boost/program_options.hpp>

namespace ratemon::log {

  namespace {
    const std::string kEmbeddedConfig(R"(
sinks:
  - name: console
    type: console
    stream: stderr
    thread: name
    color: false
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: ratemon
        children:
          - name: application
          - name: metrics
          - name: rate
)");
  }  // namespace

  Configurator::Configurator() : ConfiguratorFromYAML(kEmbeddedConfig) {}

  Configurator::Configurator(std::filesystem::path custom_config)
      : ConfiguratorFromYAML(
          std::make_shared<soralog::ConfiguratorFromYAML>(kEmbeddedConfig),
          std::move(custom_config)) {}

  std::optional<std::filesystem::path> Configurator::getLogConfigFile(
      int argc, const char **argv) {
    namespace po = boost::program_options;

    po::options_description desc;
    desc.add_options()
        // `--log` is declared so that it is not taken for an abbreviation
        ("logcfg", po::value<std::string>())(
            "log", po::value<std::vector<std::string>>());

    po::variables_map vm;
    try {
      po::store(po::command_line_parser(argc, argv)
                    .options(desc)
                    .allow_unregistered()
                    .run(),
                vm);
    } catch (const po::error &) {
      return std::nullopt;
    }

    if (vm.count("logcfg") == 0) {
      return std::nullopt;
    }
    return vm["logcfg"].as<std::string>();
  }

}  // namespace ratemon::log
