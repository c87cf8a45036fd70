#include "catch2/catch_test_macros.hpp"
#include "mrv_dnld/config.hpp"
#include <chrono>
#include <stdexcept>

TEST_CASE("default download config is accepted", "[Config]") { CHECK_NOTHROW(mrvlink::validate(mrvlink::DownloadConfig{})); }

TEST_CASE("unusable download config is rejected", "[Config]") {
  using namespace std::chrono_literals;

  mrvlink::DownloadConfig config{};

  SECTION("zero timeout") {
    config.timeout_ = 0ms;
    CHECK_THROWS_AS(mrvlink::validate(config), std::invalid_argument);
  }

  SECTION("negative timeout") {
    config.timeout_ = -1ms;
    CHECK_THROWS_AS(mrvlink::validate(config), std::invalid_argument);
  }

  SECTION("negative backoff") {
    config.backoff_ = -5ms;
    CHECK_THROWS_AS(mrvlink::validate(config), std::invalid_argument);
  }

  SECTION("no attempt allowed") {
    config.max_retry_ = 0;
    CHECK_THROWS_AS(mrvlink::validate(config), std::invalid_argument);
  }
}

TEST_CASE("smallest usable settings are accepted", "[Config]") {
  using namespace std::chrono_literals;

  mrvlink::DownloadConfig config{};
  config.timeout_   = 1ms;
  config.backoff_   = 0ms;
  config.max_retry_ = 1;
  CHECK_NOTHROW(mrvlink::validate(config));
}
