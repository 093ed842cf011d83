#include "Softmax.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <iterator>
#include <cmath>
#include <random>
#include <stdexcept>

namespace {

float sumOf(const std::vector<float>& values) {
    double sum = 0.0;
    for (float v : values) sum += v;
    return static_cast<float>(sum);
}

} // namespace

/**
 * Test softmax properties on the canonical example
 */
TEST(SoftmaxTest, MathematicalProperties) {
    std::vector<float> logits{1.0f, 4.0f, 2.0f, 3.0f};

    auto probs = SoftmaxUtils::softmax(logits);

    ASSERT_EQ(probs.size(), 4u);
    EXPECT_NEAR(sumOf(probs), 1.0f, 1e-6f);

    // All probabilities in [0, 1]
    for (float p : probs) {
        EXPECT_GE(p, 0.0f);
        EXPECT_LE(p, 1.0f);
    }

    // Monotonic: higher logit → higher prob
    EXPECT_GT(probs[1], probs[3]);
    EXPECT_GT(probs[3], probs[2]);
    EXPECT_GT(probs[2], probs[0]);

    EXPECT_NEAR(probs[0], 0.0321f, 1e-4f);
    EXPECT_NEAR(probs[1], 0.6439f, 1e-4f);
    EXPECT_NEAR(probs[2], 0.0871f, 1e-4f);
    EXPECT_NEAR(probs[3], 0.2369f, 1e-4f);
}

/**
 * Base 2: [2, 16, 4, 8] / 30
 */
TEST(SoftmaxTest, CustomBase) {
    auto probs = SoftmaxUtils::softmax({1.0f, 4.0f, 2.0f, 3.0f}, 2.0);

    ASSERT_EQ(probs.size(), 4u);
    EXPECT_NEAR(probs[0], 1.0f / 15.0f, 1e-6f);
    EXPECT_NEAR(probs[1], 8.0f / 15.0f, 1e-6f);
    EXPECT_NEAR(probs[2], 2.0f / 15.0f, 1e-6f);
    EXPECT_NEAR(probs[3], 4.0f / 15.0f, 1e-6f);
}

/**
 * Random logits, random bases: output always non-negative and sums to 1
 */
TEST(SoftmaxTest, SumsToOneForRandomInputs) {
    std::mt19937 rng(42);
    std::uniform_real_distribution<float> logitDist(-10.0f, 10.0f);
    std::uniform_real_distribution<double> baseDist(1.1, 5.0);
    std::uniform_int_distribution<int> sizeDist(2, 20);

    for (int trial = 0; trial < 200; ++trial) {
        std::vector<float> logits(sizeDist(rng));
        for (auto& x : logits) x = logitDist(rng);

        auto probs = SoftmaxUtils::softmax(logits, baseDist(rng));

        ASSERT_EQ(probs.size(), logits.size());
        for (float p : probs) {
            EXPECT_GE(p, 0.0f);
        }
        EXPECT_NEAR(sumOf(probs), 1.0f, 1e-6f);
    }
}

TEST(SoftmaxTest, EmptyInput) {
    EXPECT_TRUE(SoftmaxUtils::softmax({}).empty());
    EXPECT_TRUE(SoftmaxUtils::stableSoftmax({}).empty());
}

TEST(SoftmaxTest, RejectsInvalidBase) {
    std::vector<float> logits{1.0f, 2.0f};
    EXPECT_THROW(SoftmaxUtils::softmax(logits, 0.0), std::invalid_argument);
    EXPECT_THROW(SoftmaxUtils::softmax(logits, -2.0), std::invalid_argument);
    EXPECT_THROW(SoftmaxUtils::softmax(logits, INFINITY), std::invalid_argument);
    EXPECT_THROW(SoftmaxUtils::stableSoftmax(logits, NAN), std::invalid_argument);
}

/**
 * Test numerical stability of the shifted variant
 *
 * Plain softmax overflows on these; stableSoftmax must not.
 */
TEST(SoftmaxTest, NumericalStability) {
    // Extreme values that would overflow naive implementation
    std::vector<float> logits{1000.0f, 1001.0f, 999.0f};

    auto probs = SoftmaxUtils::stableSoftmax(logits);

    ASSERT_EQ(probs.size(), 3u);
    EXPECT_NEAR(sumOf(probs), 1.0f, 1e-5f);

    // Check argmax is correct
    auto maxIt = std::max_element(probs.begin(), probs.end());
    EXPECT_EQ(std::distance(probs.begin(), maxIt), 1);  // 1001 is largest

    // Check no NaN or Inf
    for (float p : probs) {
        EXPECT_FALSE(std::isnan(p));
        EXPECT_FALSE(std::isinf(p));
    }

    // The unshifted version leaves overflow to the caller
    auto naive = SoftmaxUtils::softmax(logits);
    EXPECT_TRUE(std::isnan(naive[0]));
}

TEST(SoftmaxTest, StableMatchesPlain) {
    std::vector<float> logits{-1.5f, 0.25f, 3.0f, 2.0f, -0.75f};

    for (double base : {SoftmaxUtils::kDefaultBase, 2.0, 10.0}) {
        auto plain = SoftmaxUtils::softmax(logits, base);
        auto stable = SoftmaxUtils::stableSoftmax(logits, base);
        ASSERT_EQ(plain.size(), stable.size());
        for (size_t i = 0; i < plain.size(); ++i) {
            EXPECT_NEAR(plain[i], stable[i], 1e-6f);
        }
    }
}

TEST(SoftmaxTest, AliasesForwardToUtils) {
    std::vector<float> logits{0.5f, -0.5f, 1.5f};
    EXPECT_EQ(Softmax::compute(logits), SoftmaxUtils::softmax(logits));
    EXPECT_EQ(Softmax::computeStable(logits, 2.0), SoftmaxUtils::stableSoftmax(logits, 2.0));
}

TEST(TopKTest, ReturnsHighestFirst) {
    std::vector<float> probs{0.1f, 0.3f, 0.05f, 0.5f, 0.05f};

    auto top3 = SoftmaxUtils::topk(probs, 3);

    ASSERT_EQ(top3.size(), 3u);
    EXPECT_EQ(top3[0], 3);
    EXPECT_EQ(top3[1], 1);
    EXPECT_EQ(top3[2], 0);
}

TEST(TopKTest, ClampsK) {
    std::vector<float> probs{0.4f, 0.6f};
    EXPECT_EQ(Softmax::topK(probs, 5), (std::vector<int>{1, 0}));
    EXPECT_TRUE(SoftmaxUtils::topk(probs, 0).empty());
    EXPECT_TRUE(SoftmaxUtils::topk(probs, -1).empty());
}

TEST(TopKTest, RejectsNaN) {
    std::vector<float> scores{0.5f, NAN, 0.25f};

    EXPECT_THROW(SoftmaxUtils::topk(scores, 1), std::invalid_argument);
    // Nothing to order when k <= 0
    EXPECT_TRUE(SoftmaxUtils::topk(scores, 0).empty());
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
