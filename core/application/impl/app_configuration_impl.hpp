/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <rapidjson/document.h>
#include <boost/program_options/options_description.hpp>

#include "log/logger.hpp"

namespace ratemon::application {

  // clang-format off
  /**
   * Reads app configuration from multiple sources with the given priority:
   *
   *      COMMAND LINE ARGUMENTS          <- max priority
   *                V
   *       JSON CONFIGURATION FILE
   *                V
   *          DEFAULT VALUES              <- low priority
   *
   * The file consists of the segments "general", "metrics" and "pipeline",
   * keyed by the names of the command line options. A value of a wrong type
   * is skipped.
   */
  // clang-format on
  class AppConfigurationImpl final : public AppConfiguration {
   public:
    explicit AppConfigurationImpl(log::Logger logger);

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    /**
     * @return false if the node should not run: on `--help`, on malformed
     * options, or on an invalid configuration
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    const std::vector<std::string> &log() const override {
      return log_directives_;
    }

    std::optional<boost::asio::ip::tcp::endpoint> openmetricsHttpEndpoint()
        const override;

    double rateIntervalSecs() const override {
      return rate_interval_secs_;
    }

    uint32_t tickEvery() const override {
      return tick_every_;
    }

    uint64_t eventsLimit() const override {
      return events_limit_;
    }

   private:
    using SegmentParser =
        void (AppConfigurationImpl::*)(const rapidjson::Value &);

    static boost::program_options::options_description optionsDescription();

    bool read_config_from_file(const std::string &filepath);

    void parse_general_segment(const rapidjson::Value &segment);
    void parse_metrics_segment(const rapidjson::Value &segment);
    void parse_pipeline_segment(const rapidjson::Value &segment);

    bool validate_config();

    log::Logger logger_;

    std::vector<std::string> log_directives_;
    std::string openmetrics_http_host_;
    uint16_t openmetrics_http_port_;
    bool no_prometheus_ = false;
    boost::asio::ip::tcp::endpoint openmetrics_http_endpoint_;

    double rate_interval_secs_;
    uint32_t tick_every_;
    uint64_t events_limit_;
  };

}  // namespace ratemon::application
