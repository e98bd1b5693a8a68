#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <vector>
#include "balancer/core/quantize.hpp"

using namespace balancer::core;

TEST(QuantizeFlows, ProportionalWithExactTotal) {
  std::vector<double> rates {1.5, 2.5, 1.0};
  auto q = quantize_flows(rates, 10);
  EXPECT_EQ(q, (std::vector<Flow>{3, 5, 2}));
}

TEST(QuantizeFlows, LastEntryAbsorbsRounding) {
  std::vector<double> rates {1.0, 1.0, 1.0};
  auto q = quantize_flows(rates, 10);
  EXPECT_EQ(q, (std::vector<Flow>{3, 3, 4}));
  EXPECT_EQ(std::accumulate(q.begin(), q.end(), Flow{0}), 10);
}

TEST(QuantizeFlows, FractionalRatesScaleDown) {
  std::vector<double> rates {22.5, 37.5, 60.0};
  auto q = quantize_flows(rates, 100);
  EXPECT_EQ(q, (std::vector<Flow>{18, 31, 51}));
}

TEST(QuantizeFlows, SingleRateTakesEverything) {
  std::vector<double> rates {7.25};
  EXPECT_EQ(quantize_flows(rates, 4), (std::vector<Flow>{4}));
}

TEST(QuantizeFlows, SingleZeroRateTakesTarget) {
  std::vector<double> rates {0.0};
  EXPECT_EQ(quantize_flows(rates, 5), (std::vector<Flow>{5}));
  EXPECT_EQ(quantize_flows(rates, 0), (std::vector<Flow>{0}));
}

TEST(QuantizeFlows, EmptyInput) {
  std::vector<double> rates;
  EXPECT_TRUE(quantize_flows(rates, 0).empty());
}

TEST(QuantizeFlows, ZeroRatesWithZeroTarget) {
  std::vector<double> rates {0.0, 0.0};
  EXPECT_EQ(quantize_flows(rates, 0), (std::vector<Flow>{0, 0}));
}

TEST(QuantizeFlows, InvalidArgumentsThrow) {
  std::vector<double> negative {1.0, -1.0};
  std::vector<double> nan {std::numeric_limits<double>::quiet_NaN()};
  std::vector<double> zeros {0.0, 0.0};
  std::vector<double> ok {1.0};
  EXPECT_THROW((void)quantize_flows(negative, 5), std::invalid_argument);
  EXPECT_THROW((void)quantize_flows(nan, 5), std::invalid_argument);
  EXPECT_THROW((void)quantize_flows(zeros, 5), std::invalid_argument);
  EXPECT_THROW((void)quantize_flows(ok, -1), std::invalid_argument);
}
