/**
 * =============================================================================
 * Uncertainty.cpp - Implementation of the Uncertainty Sampling Metrics
 * =============================================================================
 *
 * @file Uncertainty.cpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#include "Uncertainty.hpp"
#include "Softmax.hpp"     // SoftmaxUtils::topk

#include <algorithm>       // std::max_element
#include <cmath>           // std::log2
#include <stdexcept>       // std::invalid_argument, std::domain_error
#include <string>
#include <utility>         // std::pair

namespace UncertaintyUtils {

namespace {

/**
 * Every metric needs at least two labels: margin and ratio read the
 * runner-up, least confidence divides by N - 1, entropy by log2(N).
 */
void requireTwoLabels(const std::vector<float>& probs, const char* function) {
    if (probs.size() < 2) {
        throw std::invalid_argument(
            std::string(function) + ": need at least 2 probabilities, got "
            + std::to_string(probs.size()));
    }
}

/**
 * Top two probabilities as (p1, p2).
 *
 * When the caller says the vector is sorted we take the first two
 * entries; otherwise topk() finds them through an index array, which
 * leaves probs in its original order.
 */
std::pair<double, double> topTwo(const std::vector<float>& probs, bool sorted) {
    if (sorted) {
        return {probs[0], probs[1]};
    }
    std::vector<int> best = SoftmaxUtils::topk(probs, 2);
    return {probs[best[0]], probs[best[1]]};
}

} // namespace

/**
 * Margin of confidence.
 *
 *   1 - (p1 - p2)
 *
 * A big gap between the two best labels means the model has made up its
 * mind, so the score drops toward 0.
 */
float marginConfidence(const std::vector<float>& probs, bool sorted) {
    requireTwoLabels(probs, "marginConfidence");

    auto top = topTwo(probs, sorted);
    double difference = top.first - top.second;
    return static_cast<float>(1.0 - difference);
}

/**
 * Ratio of confidence.
 *
 *   p2 / p1
 *
 * Same idea as the margin, but relative: 0.4 vs 0.5 and 0.04 vs 0.05
 * both score 0.8.
 */
float ratioConfidence(const std::vector<float>& probs, bool sorted) {
    requireTwoLabels(probs, "ratioConfidence");

    auto top = topTwo(probs, sorted);

    // p1 is the largest entry, so p1 == 0 means no usable distribution
    if (top.first == 0.0) {
        throw std::domain_error("ratioConfidence: top probability is 0");
    }
    return static_cast<float>(top.second / top.first);
}

/**
 * Least confidence.
 *
 *   (1 - p_max) * N / (N - 1)
 *
 * 1 - p_max alone tops out at (N - 1) / N for the uniform distribution;
 * the N / (N - 1) factor stretches that to exactly 1.0.
 */
float leastConfidence(const std::vector<float>& probs, bool sorted) {
    requireTwoLabels(probs, "leastConfidence");

    // Most confident prediction. With sorted == true the caller vouches
    // that probs[0] is the max; it is not re-checked.
    double maxProb = sorted
        ? probs[0]
        : *std::max_element(probs.begin(), probs.end());

    const double numLabels = static_cast<double>(probs.size());
    return static_cast<float>((1.0 - maxProb) * (numLabels / (numLabels - 1.0)));
}

/**
 * Normalized Shannon entropy.
 *
 *   H = -Σ p_i · log2(p_i),   score = H / log2(N)
 *
 * log2(N) is the entropy of the uniform distribution over N labels,
 * the largest H can be.
 */
float entropyScore(const std::vector<float>& probs) {
    requireTwoLabels(probs, "entropyScore");

    double rawEntropy = 0.0;
    for (float p : probs) {
        // 0 · log2(0) counts as 0. Only exact zeros are skipped: a NaN
        // or negative entry still reaches log2 and poisons the result.
        if (p != 0.0f) {
            rawEntropy -= static_cast<double>(p) * std::log2(static_cast<double>(p));
        }
    }

    return static_cast<float>(rawEntropy / std::log2(static_cast<double>(probs.size())));
}

bool isSortedDescending(const std::vector<float>& probs) {
    return std::is_sorted(probs.begin(), probs.end(),
                          [](float a, float b) { return a > b; });
}

} // namespace UncertaintyUtils
