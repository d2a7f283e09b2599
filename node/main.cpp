/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <iostream>

#include <libp2p/common/final_action.hpp>
#include <soralog/util.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "clock/impl/clock_impl.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"
#include "metrics/metrics.hpp"
#include "metrics/metrics_server.hpp"
#include "rate/rate_logger_registry.hpp"
#include "stream/do_at.hpp"
#include "stream/rate_gauge.hpp"

using ratemon::application::AppConfiguration;
using ratemon::application::AppConfigurationImpl;

namespace {
  const std::string kEventsTag = "events";

  /**
   * Emits sequence numbers, samples their rate into the metrics registry and
   * drains the pipeline.
   */
  outcome::result<size_t> run_pipeline(
      const AppConfiguration &configuration,
      ratemon::metrics::Registry &registry,
      const ratemon::log::Logger &logger) {
    namespace metrics = ratemon::metrics;
    namespace rate = ratemon::rate;
    namespace stream = ratemon::stream;

    OUTCOME_TRY(events_total,
                metrics::makeCounter(registry,
                                     "ratemon_events_total",
                                     "Number of events processed"));
    OUTCOME_TRY(events_rate,
                metrics::makeGauge(registry,
                                   "ratemon_events_per_second",
                                   "Rate of processed events per second"));
    OUTCOME_TRY(position,
                metrics::makeGauge(registry,
                                   "ratemon_events_position",
                                   "Sequence number of the last tapped event"));

    OUTCOME_TRY(details,
                rate::LoggerDetailsBuilder{}
                    .label("Pipeline")
                    .tag(kEventsTag)
                    .action("processed")
                    .unit("events")
                    .intervalSecs(configuration.rateIntervalSecs())
                    .counter(events_total)
                    .gauge(events_rate)
                    .build());

    rate::RateLoggerRegistry loggers;
    OUTCOME_TRY(loggers.add(kEventsTag, std::move(details)));

    auto events = ratemon::stream::iterate<uint64_t>(
        0, [](uint64_t event) { return event + 1; });
    if (configuration.eventsLimit() != 0) {
      events = stream::take(std::move(events), configuration.eventsLimit());
    }

    auto mark_position =
        [position, &logger](
            const uint64_t &event) -> outcome::result<void> {
      position->set(static_cast<double>(event));
      SL_DEBUG(logger, "Reached event #{}", event);
      return outcome::success();
    };
    OUTCOME_TRY(tapped,
                stream::doAt(configuration.tickEvery(),
                             std::move(mark_position),
                             std::move(events)));

    OUTCOME_TRY(gauged,
                stream::finiteWithRateGauge(
                    loggers,
                    kEventsTag,
                    std::make_shared<ratemon::clock::SteadyClockImpl>(),
                    std::move(tapped)));

    return stream::drain(std::move(gauged));
  }

  int run_node(int argc, const char **argv) {
    auto logger = ratemon::log::createLogger("Main");

    auto configuration = std::make_shared<AppConfigurationImpl>(
        ratemon::log::createLogger("AppConfiguration", "application"));

    if (not configuration->initializeFromArgs(argc, argv)) {
      return EXIT_FAILURE;
    }

    ratemon::log::tuneLoggingSystem(configuration->log());

    auto registry = ratemon::metrics::createRegistry();

    std::shared_ptr<ratemon::metrics::Exposer> exposer;
    if (auto endpoint = configuration->openmetricsHttpEndpoint()) {
      auto res = ratemon::metrics::initMetricsServer(
          ratemon::metrics::Exposer::Configuration{*endpoint}, *registry);
      if (res.has_error()) {
        SL_CRITICAL(logger,
                    "Metrics server failed to start: {}",
                    res.error().message());
        return EXIT_FAILURE;
      }
      exposer = std::move(res.value());
    }

    SL_INFO(logger, "Ratemon started");

    auto processed = run_pipeline(*configuration, *registry, logger);

    if (exposer) {
      exposer->stop();
    }

    if (processed.has_error()) {
      SL_ERROR(logger, "Pipeline failed: {}", processed.error().message());
      return EXIT_FAILURE;
    }

    SL_INFO(logger, "Ratemon stopped after {} events", processed.value());
    logger->flush();

    return EXIT_SUCCESS;
  }

}  // namespace

int main(int argc, const char **argv) {
  setvbuf(stdout, nullptr, _IOLBF, 0);
  setvbuf(stderr, nullptr, _IOLBF, 0);

  libp2p::common::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  soralog::util::setThreadName("ratemon");

  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        ratemon::log::Configurator::getLogConfigFile(argc, argv);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto ratemon_log_configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<ratemon::log::Configurator>(
                  custom_log_config_path.value())
            : std::make_shared<ratemon::log::Configurator>();

    return std::make_shared<soralog::LoggingSystem>(
        std::move(ratemon_log_configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  ratemon::log::setLoggingSystem(logging_system);

  auto exit_code = run_node(argc, argv);

  auto logger = ratemon::log::createLogger("Main");
  SL_INFO(logger, "All components are stopped");
  logger->flush();

  return exit_code;
}
