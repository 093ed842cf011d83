/**
 * =============================================================================
 * Softmax.cpp - Implementation of Softmax and Top-K Functions
 * =============================================================================
 *
 * This file implements the softmax function (plain and max-shifted) and
 * the top-k selection used by the uncertainty metrics.
 *
 * @file Softmax.cpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#include "Softmax.hpp"   // Our header file with declarations

#include <cmath>         // std::pow, std::isfinite
#include <algorithm>     // std::max_element, std::partial_sort
#include <numeric>       // std::iota - fills vector with sequential values
#include <stdexcept>     // std::invalid_argument
#include <string>        // std::to_string for error messages

namespace SoftmaxUtils {

namespace {

void checkBase(double base) {
    if (!std::isfinite(base) || base <= 0.0) {
        throw std::invalid_argument(
            "softmax: base must be finite and positive, got " + std::to_string(base));
    }
}

/**
 * Shared body of softmax() and stableSoftmax().
 *
 * Exponentials and their sum are accumulated in double, then narrowed
 * to float once normalized.
 *
 * @param shift Value subtracted from every score before exponentiating
 */
std::vector<float> normalize(const std::vector<float>& scores, double base, double shift) {
    std::vector<double> exps;
    exps.reserve(scores.size());
    double sum = 0.0;

    for (float score : scores) {
        double e = std::pow(base, static_cast<double>(score) - shift);
        exps.push_back(e);
        sum += e;
    }

    std::vector<float> probabilities(scores.size());
    for (size_t i = 0; i < exps.size(); ++i) {
        probabilities[i] = static_cast<float>(exps[i] / sum);
    }
    return probabilities;
}

} // namespace

/**
 * Plain softmax.
 *
 * SOFTMAX FORMULA:
 *   softmax(x_i) = base^x_i / Σ base^x_j
 *
 * Nothing is shifted here: an overflowing base^x gives inf/inf = NaN.
 * See stableSoftmax() for the shifted variant.
 */
std::vector<float> softmax(const std::vector<float>& scores, double base) {
    checkBase(base);

    // Handle empty input gracefully
    if (scores.empty()) {
        return {};
    }

    return normalize(scores, base, 0.0);
}

/**
 * Softmax with the max-subtraction trick.
 *
 *   softmax(x_i) = base^(x_i - max) / Σ base^(x_j - max)
 *
 * PROOF OF EQUIVALENCE:
 *   base^(x_i - max) / Σ base^(x_j - max)
 * = base^x_i * base^-max / (base^-max * Σ base^x_j)
 * = base^x_i / Σ base^x_j  ← original formula!
 */
std::vector<float> stableSoftmax(const std::vector<float>& scores, double base) {
    checkBase(base);

    if (scores.empty()) {
        return {};
    }

    float maxScore = *std::max_element(scores.begin(), scores.end());
    return normalize(scores, base, static_cast<double>(maxScore));
}

/**
 * Find the indices of the k largest elements.
 *
 * ALGORITHM: Partial Sort
 * - Create index array [0, 1, 2, ..., n-1]
 * - Partially sort to put k largest at the front
 * - Return those k indices
 *
 * Only the index array is reordered; scores is left untouched.
 * Ties keep whichever order std::partial_sort produces.
 * NaN scores are rejected with std::invalid_argument.
 */
std::vector<int> topk(const std::vector<float>& scores, int k) {
    if (k <= 0) {
        return {};
    }

    // NaN breaks the ordering partial_sort relies on
    for (size_t i = 0; i < scores.size(); ++i) {
        if (std::isnan(scores[i])) {
            throw std::invalid_argument(
                "topk: score at index " + std::to_string(i) + " is NaN");
        }
    }

    std::vector<int> indices(scores.size());
    std::iota(indices.begin(), indices.end(), 0);  // Fill with 0, 1, 2, ...

    const int count = std::min(k, static_cast<int>(scores.size()));

    /**
     * [&scores]: Capture scores by reference
     * Returns true if scores[a] > scores[b], meaning a should come first.
     * This gives us descending order (highest scores first).
     */
    std::partial_sort(
        indices.begin(),
        indices.begin() + count,
        indices.end(),
        [&scores](int a, int b) { return scores[a] > scores[b]; }
    );

    indices.resize(count);
    return indices;
}

} // namespace SoftmaxUtils
