/**
 * =============================================================================
 * UncertaintyScorer.hpp - Configured Uncertainty Scoring
 * =============================================================================
 *
 * UncertaintyUtils gives the raw metrics. UncertaintyScorer bundles one
 * chosen metric with its settings so the active-learning host can build
 * a scorer once (e.g. from a method name in its own config) and call
 * score() for every unlabeled example.
 *
 * It adds two optional safety checks the plain functions skip:
 * - validateSorted: verify a caller's "already sorted" claim
 * - validateDistribution: verify values are in [0, 1] and sum to 1
 *
 * USAGE EXAMPLE:
 * ```cpp
 * ScorerConfig config;
 * config.method = UncertaintyScorer::parseMethod("entropy");
 * UncertaintyScorer scorer(config);
 *
 * float u = scorer.scoreLogits({1.0f, 4.0f, 2.0f, 3.0f});
 * ```
 *
 * THREAD SAFETY:
 * A scorer never changes after construction, so one instance can be
 * shared between threads without locking.
 *
 * @file UncertaintyScorer.hpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#ifndef UNCERTAINTY_SCORER_HPP
#define UNCERTAINTY_SCORER_HPP

#include "Softmax.hpp"   // SoftmaxUtils::kDefaultBase

#include <string>
#include <vector>

/**
 * Which uncertainty metric a scorer applies.
 */
enum class Method {
    Margin,   ///< 1 - (p1 - p2)
    Ratio,    ///< p2 / p1
    Least,    ///< (1 - p_max) * N / (N - 1)
    Entropy   ///< H / log2(N)
};

/**
 * Scorer settings. Every field has a usable default.
 */
struct ScorerConfig {
    /** Metric applied by score() and scoreLogits() */
    Method method = Method::Least;

    /** Exponent base used by scoreLogits() */
    double softmaxBase = SoftmaxUtils::kDefaultBase;

    /** scoreLogits() subtracts the max logit before exponentiating */
    bool stableSoftmax = true;

    /** Reject score(probs, true) when probs is not sorted largest first */
    bool validateSorted = false;

    /** Reject inputs with values outside [0, 1] or a sum off by more than tolerance */
    bool validateDistribution = false;

    /** Allowed |sum - 1| when validateDistribution is set */
    double tolerance = 1e-4;

    /** Print the configuration to std::cout on construction */
    bool verbose = false;
};

class UncertaintyScorer {
public:
    /**
     * Build a scorer.
     *
     * @throws std::invalid_argument if softmaxBase is not finite and
     *         positive, or tolerance is negative
     */
    explicit UncertaintyScorer(const ScorerConfig& config = ScorerConfig());

    /**
     * Score a probability distribution with the configured metric.
     *
     * @param probs  Probability distribution (N >= 2)
     * @param sorted true if probs is already sorted largest first.
     *               Ignored by the entropy metric.
     * @return Uncertainty score in [0, 1]
     *
     * @throws std::invalid_argument on fewer than 2 entries, or when an
     *         enabled validation check fails
     * @throws std::domain_error for the ratio metric when the top
     *         probability is 0
     */
    float score(const std::vector<float>& probs, bool sorted = false) const;

    /**
     * Apply softmax to raw logits, then score the result.
     *
     * @param logits Raw model outputs (N >= 2)
     * @return Uncertainty score in [0, 1]
     *
     * @throws std::invalid_argument if a logit is NaN or infinite
     * @throws std::overflow_error if the unshifted softmax overflowed
     * @throws std::underflow_error if every unshifted term underflowed to 0
     *         (both only possible with stableSoftmax disabled)
     */
    float scoreLogits(const std::vector<float>& logits) const;

    Method method() const { return config_.method; }
    const ScorerConfig& config() const { return config_; }

    /**
     * Canonical lowercase name: "margin", "ratio", "least" or "entropy".
     */
    static std::string methodName(Method method);

    /**
     * Parse a method name (case-insensitive).
     *
     * @throws std::invalid_argument for an unknown name
     */
    static Method parseMethod(const std::string& name);

private:
    void checkDistribution(const std::vector<float>& probs) const;

    ScorerConfig config_;
};

#endif // UNCERTAINTY_SCORER_HPP
