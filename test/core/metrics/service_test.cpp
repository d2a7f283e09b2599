/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast.hpp>
#include <boost/beast/http/string_body.hpp>
#include <memory>

#include "metrics/impl/exposer_impl.hpp"
#include "metrics/impl/prometheus/handler_impl.hpp"
#include "metrics/metrics.hpp"
#include "metrics/metrics_server.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

namespace http = boost::beast::http;

using ratemon::metrics::Exposer;
using ratemon::metrics::ExposerError;
using ratemon::metrics::ExposerImpl;
using ratemon::metrics::PrometheusHandler;
using ratemon::metrics::ServerError;
using ratemon::metrics::Session;

class HttpClient {
  boost::asio::io_context ioc_;
  boost::beast::tcp_stream stream_;
  boost::asio::ip::tcp::endpoint endpoint_;

 public:
  explicit HttpClient(uint16_t port)
      : ioc_{},
        stream_{ioc_},
        endpoint_{boost::asio::ip::make_address("127.0.0.1"), port} {}

  ~HttpClient() {
    boost::system::error_code ec;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  }

  boost::system::error_code connect() {
    boost::system::error_code ec;
    stream_.connect(endpoint_, ec);
    return ec;
  }

  outcome::result<http::response<http::string_body>> query(
      http::verb method, const std::string &target) {
    boost::system::error_code ec;
    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, "localhost");
    http::write(stream_, req, ec);
    if (ec) {
      return static_cast<std::error_code>(ec);
    }
    boost::beast::flat_buffer buffer{};
    http::response<http::string_body> res{};
    http::read(stream_, buffer, res, ec);
    if (ec) {
      return static_cast<std::error_code>(ec);
    }
    return res;
  }
};

class ServiceTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    registry_ = ratemon::metrics::createRegistry();
    EXPECT_OUTCOME_TRUE(
        counter,
        ratemon::metrics::makeCounter(
            *registry_, "service_counter", "It's simple counter!"));
    counter_ = counter;

    auto res = ratemon::metrics::initMetricsServer(0, *registry_);
    ASSERT_TRUE(res.has_value()) << res.error().message();
    exposer_ = std::move(res.value());
  }

  void TearDown() override {
    if (exposer_) {
      exposer_->stop();
    }
  }

 protected:
  ratemon::metrics::RegistryPtr registry_;
  ratemon::metrics::Counter *counter_ = nullptr;
  std::shared_ptr<Exposer> exposer_;
};

/**
 * @given a metrics server serving a registry with a counter
 * @when scraping /metrics
 * @then the response carries the text exposition of the counter
 */
TEST_F(ServiceTest, ScrapeMetrics) {
  counter_->inc();

  HttpClient client(exposer_->port());
  ASSERT_FALSE(client.connect());
  EXPECT_OUTCOME_TRUE(res, client.query(http::verb::get, "/metrics"));

  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(res[http::field::content_type],
            "text/plain; version=0.0.4; charset=utf-8");
  std::string expected(R"(# HELP service_counter It's simple counter!
# TYPE service_counter counter
service_counter 1
)");
  EXPECT_NE(res.body().find(expected), std::string::npos) << res.body();
}

/**
 * @given a metrics server serving a registry with a counter
 * @when scraping the root path advertised at startup
 * @then the response carries the same text exposition as /metrics
 */
TEST_F(ServiceTest, ScrapeRoot) {
  counter_->inc();

  HttpClient client(exposer_->port());
  ASSERT_FALSE(client.connect());
  EXPECT_OUTCOME_TRUE(res, client.query(http::verb::get, "/"));

  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_NE(res.body().find("# TYPE service_counter counter"),
            std::string::npos)
      << res.body();
}

/**
 * @given a running metrics server
 * @when requesting a path other than / and /metrics
 * @then the server answers 404
 */
TEST_F(ServiceTest, UnknownPath) {
  HttpClient client(exposer_->port());
  ASSERT_FALSE(client.connect());
  EXPECT_OUTCOME_TRUE(res, client.query(http::verb::get, "/unknown"));
  EXPECT_EQ(res.result(), http::status::not_found);
}

/**
 * @given a running metrics server
 * @when posting to /metrics
 * @then the server answers 405
 */
TEST_F(ServiceTest, WrongMethod) {
  HttpClient client(exposer_->port());
  ASSERT_FALSE(client.connect());
  EXPECT_OUTCOME_TRUE(res, client.query(http::verb::post, "/metrics"));
  EXPECT_EQ(res.result(), http::status::method_not_allowed);
}

/**
 * @given a port that is already taken by a running metrics server
 * @when another server is started on it
 * @then the start fails
 */
TEST_F(ServiceTest, PortInUse) {
  Exposer::Configuration config;
  config.endpoint = {boost::asio::ip::address_v4::any(), exposer_->port()};
  EXPECT_EC(ratemon::metrics::initMetricsServer(config, *registry_),
            ServerError::PREPARE_FAILED);
}

/**
 * @given an exposer whose listener is not bound
 * @when starting it
 * @then the start fails
 */
TEST_F(ServiceTest, StartWithoutPrepare) {
  auto exposer = std::make_shared<ExposerImpl>(Exposer::Configuration{},
                                               Session::Configuration{});
  exposer->setHandler(std::make_shared<PrometheusHandler>());
  EXPECT_EC(exposer->start(), ExposerError::NOT_PREPARED);
}

/**
 * @given a bound exposer without a request handler
 * @when starting it
 * @then the start fails
 */
TEST_F(ServiceTest, StartWithoutHandler) {
  auto exposer = std::make_shared<ExposerImpl>(Exposer::Configuration{},
                                               Session::Configuration{});
  EXPECT_OUTCOME_TRUE_1(exposer->prepare());
  EXPECT_NE(exposer->port(), 0);
  EXPECT_EC(exposer->start(), ExposerError::NO_HANDLER);
}
