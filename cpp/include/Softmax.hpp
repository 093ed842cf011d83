/**
 * =============================================================================
 * Softmax.hpp - Score Normalization Utilities
 * =============================================================================
 *
 * This file provides functions to convert raw model scores (logits) into
 * a probability distribution using the softmax function.
 *
 * SOFTMAX FUNCTION EXPLAINED:
 * ---------------------------
 * A classifier outputs "logits" - raw, unbounded scores, one per label.
 * Example: A model might output [1.0, 4.0, 2.0, 3.0] for 4 labels.
 *
 * The uncertainty metrics need probabilities that:
 * 1. Are all non-negative
 * 2. Sum to 1.0
 * 3. Preserve the relative ordering (highest logit → highest probability)
 *
 * Softmax achieves this:
 *
 *   P(label_i) = base^logit_i / Σ base^logit_j
 *
 * The base is usually e. A larger base sharpens the distribution,
 * a base closer to 1 flattens it.
 *
 * NUMERICAL EXAMPLE (base 2):
 * Logits: [1, 4, 2, 3]
 * After 2^x: [2, 16, 4, 8]
 * Sum: 30
 * After normalization: [0.067, 0.533, 0.133, 0.267]  (sums to 1.0)
 *
 * @file Softmax.hpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#ifndef SOFTMAX_HPP    // Include guard - prevents double inclusion
#define SOFTMAX_HPP

#include <vector>      // std::vector for dynamic arrays

namespace SoftmaxUtils {

    /**
     * Default exponent base for softmax: Euler's number e.
     */
    constexpr double kDefaultBase = 2.718281828459045;

    /**
     * Apply softmax normalization to convert logits to probabilities.
     *
     * ALGORITHM:
     * 1. Compute base^x for each score
     * 2. Sum the exponentials
     * 3. Divide each exponential by the sum
     *
     * OVERFLOW:
     * No shift is applied, so base^x can overflow for large scores or
     * bases. Callers with large logits should use stableSoftmax() or
     * subtract the maximum themselves.
     *
     * @param scores Input logits (any real numbers)
     * @param base   Exponent base (default e), must be finite and > 0
     * @return Probabilities (non-negative, sum to 1.0), empty for empty input
     *
     * @throws std::invalid_argument if base is not finite or not positive
     *
     * @example
     * std::vector<float> logits = {1.0f, 4.0f, 2.0f, 3.0f};
     * auto probs = SoftmaxUtils::softmax(logits);
     * // probs ≈ [0.032, 0.644, 0.087, 0.237]
     */
    std::vector<float> softmax(const std::vector<float>& scores,
                               double base = kDefaultBase);

    /**
     * Overflow-safe softmax.
     *
     * Subtracts max(scores) before exponentiating. The max cancels out
     * in the division, so the result equals softmax() wherever softmax()
     * does not overflow, but the largest term is always base^0 = 1.
     *
     * @param scores Input logits
     * @param base   Exponent base (default e), must be finite and > 0
     * @return Probabilities (non-negative, sum to 1.0)
     *
     * @throws std::invalid_argument if base is not finite or not positive
     */
    std::vector<float> stableSoftmax(const std::vector<float>& scores,
                                     double base = kDefaultBase);

    /**
     * Get indices of top-k highest scoring elements.
     *
     * The uncertainty metrics use this to find the two most likely
     * labels without reordering the caller's vector.
     *
     * ALGORITHM:
     * Uses std::partial_sort which is O(n log k) - more efficient than
     * full sort O(n log n) when k << n.
     *
     * @param scores Array of scores (typically probabilities)
     * @param k Number of top indices to return
     * @return Vector of indices, sorted by score (highest first)
     *
     * @throws std::invalid_argument if any score is NaN (k > 0 only)
     *
     * @example
     * std::vector<float> probs = {0.1, 0.3, 0.05, 0.5, 0.05};
     * auto top3 = SoftmaxUtils::topk(probs, 3);
     * // top3 = [3, 1, 0]  (indices with probs 0.5, 0.3, 0.1)
     */
    std::vector<int> topk(const std::vector<float>& scores, int k);
}

/**
 * Convenience namespace with simpler function names.
 *
 * Aliases SoftmaxUtils functions for cleaner calling code.
 * Example: Softmax::compute() instead of SoftmaxUtils::softmax()
 */
namespace Softmax {
    /**
     * Compute softmax probabilities from logits.
     * Alias for SoftmaxUtils::softmax().
     */
    inline std::vector<float> compute(const std::vector<float>& logits,
                                      double base = SoftmaxUtils::kDefaultBase) {
        return SoftmaxUtils::softmax(logits, base);
    }

    /**
     * Compute max-shifted softmax probabilities from logits.
     * Alias for SoftmaxUtils::stableSoftmax().
     */
    inline std::vector<float> computeStable(const std::vector<float>& logits,
                                            double base = SoftmaxUtils::kDefaultBase) {
        return SoftmaxUtils::stableSoftmax(logits, base);
    }

    /**
     * Get top-K prediction indices.
     * Alias for SoftmaxUtils::topk().
     */
    inline std::vector<int> topK(const std::vector<float>& scores, int k) {
        return SoftmaxUtils::topk(scores, k);
    }
}

#endif // SOFTMAX_HPP
