/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <array>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <limits>
#include <memory>
#include <type_traits>

#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>
#include <boost/program_options.hpp>

#include "rate/logger_details.hpp"

namespace po = boost::program_options;

namespace {
  const std::string kAnyHost = "0.0.0.0";
  const uint16_t kDefaultOpenmetricsPort = 9615;
  const double kDefaultRateIntervalSecs = 1.0;
  const uint32_t kDefaultTickEvery = 1000;
  const uint64_t kDefaultEventsLimit = 0;

  /// Value given explicitly on the command line
  template <typename T>
  std::optional<T> cliValue(const po::variables_map &vm, const char *name) {
    auto it = vm.find(name);
    if (it != vm.end() and not it->second.defaulted()) {
      return it->second.as<T>();
    }
    return std::nullopt;
  }

  /// Member `name` of a JSON object, if it is present and of type T
  template <typename T>
  std::optional<T> jsonValue(const rapidjson::Value &object, const char *name) {
    auto it = object.FindMember(name);
    if (it == object.MemberEnd()) {
      return std::nullopt;
    }
    const auto &value = it->value;
    if constexpr (std::is_same_v<T, bool>) {
      if (value.IsBool()) {
        return value.GetBool();
      }
    } else if constexpr (std::is_same_v<T, std::string>) {
      if (value.IsString()) {
        return std::string{value.GetString(), value.GetStringLength()};
      }
    } else if constexpr (std::is_same_v<T, double>) {
      if (value.IsNumber()) {
        return value.GetDouble();
      }
    } else if constexpr (std::is_same_v<T, uint64_t>) {
      if (value.IsUint64()) {
        return value.GetUint64();
      }
    } else {
      static_assert(std::is_unsigned_v<T> and sizeof(T) <= sizeof(uint32_t),
                    "unsupported type of a configuration value");
      if (value.IsUint()
          and value.GetUint() <= unsigned{std::numeric_limits<T>::max()}) {
        return static_cast<T>(value.GetUint());
      }
    }
    return std::nullopt;
  }

  /// A string or an array of strings, non-string items are skipped
  std::vector<std::string> jsonStrings(const rapidjson::Value &object,
                                       const char *name) {
    std::vector<std::string> strings;
    auto it = object.FindMember(name);
    if (it == object.MemberEnd()) {
      return strings;
    }
    if (it->value.IsString()) {
      strings.emplace_back(it->value.GetString(), it->value.GetStringLength());
    } else if (it->value.IsArray()) {
      for (const auto &item : it->value.GetArray()) {
        if (item.IsString()) {
          strings.emplace_back(item.GetString(), item.GetStringLength());
        }
      }
    }
    return strings;
  }

  template <typename T>
  void assignIfSet(T &target, std::optional<T> value) {
    if (value.has_value()) {
      target = std::move(value.value());
    }
  }
}  // namespace

namespace ratemon::application {

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : logger_(std::move(logger)),
        openmetrics_http_host_(kAnyHost),
        openmetrics_http_port_(kDefaultOpenmetricsPort),
        rate_interval_secs_(kDefaultRateIntervalSecs),
        tick_every_(kDefaultTickEvery),
        events_limit_(kDefaultEventsLimit) {}

  std::optional<boost::asio::ip::tcp::endpoint>
  AppConfigurationImpl::openmetricsHttpEndpoint() const {
    if (no_prometheus_) {
      return std::nullopt;
    }
    return openmetrics_http_endpoint_;
  }

  po::options_description AppConfigurationImpl::optionsDescription() {
    // clang-format off
    po::options_description general("General options");
    general.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<group>=<level>`, e.g. -lmetrics=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all groups log `info`.\n"
          "The level of every group can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Filepath of YAML logging configuration")
        ("config-file,c", po::value<std::string>(), "Filepath of JSON configuration")
        ;

    po::options_description metrics("Metrics options");
    metrics.add_options()
        ("prometheus-host", po::value<std::string>(), "address for OpenMetrics over HTTP")
        ("prometheus-port", po::value<uint16_t>(), "port for OpenMetrics over HTTP")
        ("prometheus-external", po::bool_switch(), "alias for \"--prometheus-host 0.0.0.0\"")
        ("no-prometheus", po::bool_switch(), "do not expose OpenMetrics over HTTP")
        ;

    po::options_description pipeline("Pipeline options");
    pipeline.add_options()
        ("rate-interval", po::value<double>(), "sampling interval of the rate logger <seconds>")
        ("tick-every", po::value<uint32_t>(), "number of events between two position marks")
        ("events", po::value<uint64_t>(), "number of synthetic events to emit, 0 for unbounded")
        ;
    // clang-format on

    general.add(metrics).add(pipeline);
    return general;
  }

  void AppConfigurationImpl::parse_general_segment(
      const rapidjson::Value &segment) {
    auto directives = jsonStrings(segment, "log");
    log_directives_.insert(log_directives_.end(),
                           std::make_move_iterator(directives.begin()),
                           std::make_move_iterator(directives.end()));
  }

  void AppConfigurationImpl::parse_metrics_segment(
      const rapidjson::Value &segment) {
    assignIfSet(openmetrics_http_host_,
                jsonValue<std::string>(segment, "prometheus-host"));
    assignIfSet(openmetrics_http_port_,
                jsonValue<uint16_t>(segment, "prometheus-port"));
    if (jsonValue<bool>(segment, "prometheus-external").value_or(false)) {
      openmetrics_http_host_ = kAnyHost;
    }
    assignIfSet(no_prometheus_, jsonValue<bool>(segment, "no-prometheus"));
  }

  void AppConfigurationImpl::parse_pipeline_segment(
      const rapidjson::Value &segment) {
    assignIfSet(rate_interval_secs_,
                jsonValue<double>(segment, "rate-interval"));
    assignIfSet(tick_every_, jsonValue<uint32_t>(segment, "tick-every"));
    assignIfSet(events_limit_, jsonValue<uint64_t>(segment, "events"));
  }

  bool AppConfigurationImpl::read_config_from_file(
      const std::string &filepath) {
    std::unique_ptr<std::FILE, decltype(&std::fclose)> file(
        std::fopen(filepath.c_str(), "r"), &std::fclose);
    if (not file) {
      SL_ERROR(logger_, "Configuration file {} can't be opened", filepath);
      return false;
    }

    std::array<char, 1024> buffer{};
    rapidjson::FileReadStream input(file.get(), buffer.data(), buffer.size());

    rapidjson::Document document;
    document.ParseStream(input);
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Configuration file {} is malformed at offset {}: {}",
               filepath,
               document.GetErrorOffset(),
               rapidjson::GetParseError_En(document.GetParseError()));
      return false;
    }
    if (not document.IsObject()) {
      SL_ERROR(
          logger_, "Configuration file {} must hold a JSON object", filepath);
      return false;
    }

    const std::array<std::pair<const char *, SegmentParser>, 3> segments{{
        {"general", &AppConfigurationImpl::parse_general_segment},
        {"metrics", &AppConfigurationImpl::parse_metrics_segment},
        {"pipeline", &AppConfigurationImpl::parse_pipeline_segment},
    }};
    for (const auto &[name, parse] : segments) {
      auto it = document.FindMember(name);
      if (it != document.MemberEnd() and it->value.IsObject()) {
        (this->*parse)(it->value);
      }
    }
    return true;
  }

  bool AppConfigurationImpl::validate_config() {
    if (not std::isfinite(rate_interval_secs_) or rate_interval_secs_ <= 0.0
        or rate_interval_secs_ > rate::kMaxIntervalSecs) {
      SL_ERROR(logger_,
               "Rate interval must be a positive number of seconds up to {}, "
               "got {}",
               rate::kMaxIntervalSecs,
               rate_interval_secs_);
      return false;
    }
    if (tick_every_ == 0) {
      SL_ERROR(logger_, "Number of events between marks must be positive");
      return false;
    }

    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(openmetrics_http_host_, ec);
    if (ec) {
      SL_ERROR(logger_,
               "OpenMetrics address '{}' is invalid",
               openmetrics_http_host_);
      return false;
    }
    openmetrics_http_endpoint_ = {address, openmetrics_http_port_};
    return true;
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    auto desc = optionsDescription();

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    } catch (const po::error &e) {
      SL_ERROR(logger_, "Command line is malformed: {}", e.what());
      std::cerr << "Try run with option '--help' for more information\n";
      return false;
    }

    if (vm.count("help") > 0) {
      std::cout << desc << std::endl;
      return false;
    }

    if (auto path = cliValue<std::string>(vm, "config-file")) {
      if (not read_config_from_file(*path)) {
        return false;
      }
    }

    if (auto directives = cliValue<std::vector<std::string>>(vm, "log")) {
      log_directives_.insert(
          log_directives_.end(), directives->begin(), directives->end());
    }
    assignIfSet(openmetrics_http_host_,
                cliValue<std::string>(vm, "prometheus-host"));
    if (cliValue<bool>(vm, "prometheus-external").value_or(false)) {
      openmetrics_http_host_ = kAnyHost;
    }
    assignIfSet(openmetrics_http_port_,
                cliValue<uint16_t>(vm, "prometheus-port"));
    if (cliValue<bool>(vm, "no-prometheus").value_or(false)) {
      no_prometheus_ = true;
    }
    assignIfSet(rate_interval_secs_, cliValue<double>(vm, "rate-interval"));
    assignIfSet(tick_every_, cliValue<uint32_t>(vm, "tick-every"));
    assignIfSet(events_limit_, cliValue<uint64_t>(vm, "events"));

    return validate_config();
  }

}  // namespace ratemon::application
