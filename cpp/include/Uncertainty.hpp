/**
 * =============================================================================
 * Uncertainty.hpp - Uncertainty Sampling Metrics
 * =============================================================================
 *
 * Active learning picks the unlabeled examples the model is least sure
 * about and sends those to a human for labeling. This file provides the
 * four classic ways of turning one probability distribution into a
 * single "how unsure is the model" number.
 *
 * ALL METRICS RETURN A SCORE IN [0, 1]:
 *   1.0 = maximally uncertain (label this next!)
 *   0.0 = maximally confident
 *
 * WORKED EXAMPLE:
 * Distribution: [0.0321, 0.6439, 0.0871, 0.2369]
 * Sorted:       [0.6439, 0.2369, 0.0871, 0.0321]
 *
 *   Margin:          1 - (0.6439 - 0.2369)      = 0.5930
 *   Ratio:           0.2369 / 0.6439            = 0.3679
 *   Least:           (1 - 0.6439) * (4 / 3)     = 0.4748
 *   Entropy:         -Σ p·log2(p) / log2(4)     = 0.6835
 *
 * INPUT REQUIREMENTS:
 * - At least 2 labels (N >= 2); fewer raises std::invalid_argument
 * - Values in [0, 1] summing to 1.0 (not checked here, see
 *   UncertaintyScorer for the validating wrapper)
 *
 * The caller's vector is never modified. Every function is pure and
 * safe to call from many threads at once.
 *
 * @file Uncertainty.hpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#ifndef UNCERTAINTY_HPP
#define UNCERTAINTY_HPP

#include <vector>      // std::vector for dynamic arrays

namespace UncertaintyUtils {

    /**
     * Margin of confidence: how close the top two labels are.
     *
     *   score = 1 - (p1 - p2)
     *
     * where p1, p2 are the largest and second-largest probabilities.
     *
     * @param probs  Probability distribution (N >= 2)
     * @param sorted true if probs is already sorted largest first;
     *               probs[0] and probs[1] are then used as-is
     * @return Score in [0, 1]. Near 1 when the top two are nearly tied.
     *
     * @throws std::invalid_argument if probs has fewer than 2 entries,
     *         or (sorted == false) contains NaN
     */
    float marginConfidence(const std::vector<float>& probs, bool sorted = false);

    /**
     * Ratio of confidence: second-best over best.
     *
     *   score = p2 / p1
     *
     * @param probs  Probability distribution (N >= 2)
     * @param sorted true if probs is already sorted largest first
     * @return Score in (0, 1]. 1.0 when the top two are equal.
     *
     * @throws std::invalid_argument if probs has fewer than 2 entries,
     *         or (sorted == false) contains NaN
     * @throws std::domain_error if the top probability is 0
     */
    float ratioConfidence(const std::vector<float>& probs, bool sorted = false);

    /**
     * Least confidence: normalized complement of the top probability.
     *
     *   score = (1 - p_max) * N / (N - 1)
     *
     * The N / (N - 1) factor rescales so a uniform distribution
     * (p_max = 1/N) scores exactly 1.0.
     *
     * NOTE: with sorted == true, probs[0] is TRUSTED to be the maximum.
     * Passing an unsorted vector with sorted == true gives a wrong score.
     *
     * @param probs  Probability distribution (N >= 2)
     * @param sorted true if probs is already sorted largest first
     * @return Score in [0, 1]
     *
     * @throws std::invalid_argument if probs has fewer than 2 entries
     */
    float leastConfidence(const std::vector<float>& probs, bool sorted = false);

    /**
     * Normalized Shannon entropy (base 2).
     *
     *   H     = -Σ p_i · log2(p_i)
     *   score = H / log2(N)
     *
     * Zero-probability entries contribute 0 (the 0·log(0) = 0
     * convention), so a one-hot distribution scores 0.0, not NaN.
     * Any other non-finite or negative entry makes the result NaN.
     *
     * @param probs Probability distribution (N >= 2)
     * @return Score in [0, 1]. 1.0 for the uniform distribution.
     *
     * @throws std::invalid_argument if probs has fewer than 2 entries
     */
    float entropyScore(const std::vector<float>& probs);

    /**
     * Check whether probs is sorted largest first (non-increasing).
     *
     * Empty and single-element vectors count as sorted.
     */
    bool isSortedDescending(const std::vector<float>& probs);
}

#endif // UNCERTAINTY_HPP
