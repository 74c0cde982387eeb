#include <gtest/gtest.h>
#include <limits>
#include "client/latency_estimator.h"

using namespace syncroom::engine;

TEST(LatencyEstimatorTest, EmptyUntilFirstSample) {
    LatencyEstimator estimator;
    EXPECT_FALSE(estimator.has_estimate());
    EXPECT_DOUBLE_EQ(estimator.latency_ms(), 0.0);
    EXPECT_DOUBLE_EQ(estimator.latency_sec(), 0.0);
}

TEST(LatencyEstimatorTest, FirstSampleSeedsEstimate) {
    LatencyEstimator estimator;
    ASSERT_TRUE(estimator.add_sample(300.0));
    EXPECT_TRUE(estimator.has_estimate());
    EXPECT_DOUBLE_EQ(estimator.latency_ms(), 150.0);
    EXPECT_DOUBLE_EQ(estimator.latency_sec(), 0.15);
}

TEST(LatencyEstimatorTest, LaterSamplesAreSmoothed) {
    LatencyEstimator estimator(0.8);
    estimator.add_sample(200.0);   // 100
    estimator.add_sample(400.0);   // 100 * 0.8 + 200 * 0.2 = 120
    EXPECT_NEAR(estimator.latency_ms(), 120.0, 1e-9);
    estimator.add_sample(0.0);     // 120 * 0.8 = 96
    EXPECT_NEAR(estimator.latency_ms(), 96.0, 1e-9);
    EXPECT_EQ(estimator.sample_count(), 3u);
}

TEST(LatencyEstimatorTest, RejectsNegativeAndNonFiniteSamples) {
    LatencyEstimator estimator;
    EXPECT_FALSE(estimator.add_sample(-5.0));
    EXPECT_FALSE(estimator.add_sample(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_FALSE(estimator.add_sample(std::numeric_limits<double>::infinity()));
    EXPECT_FALSE(estimator.has_estimate());

    estimator.add_sample(100.0);
    EXPECT_FALSE(estimator.add_sample(-1.0));
    EXPECT_DOUBLE_EQ(estimator.latency_ms(), 50.0);
}

TEST(LatencyEstimatorTest, ResetClearsEstimate) {
    LatencyEstimator estimator;
    estimator.add_sample(100.0);
    estimator.reset();
    EXPECT_FALSE(estimator.has_estimate());
    estimator.add_sample(40.0);
    EXPECT_DOUBLE_EQ(estimator.latency_ms(), 20.0);
}
