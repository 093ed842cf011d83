/**
 * =============================================================================
 * UncertaintyScorer.cpp - Configured Uncertainty Scoring Implementation
 * =============================================================================
 *
 * @file UncertaintyScorer.cpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#include "UncertaintyScorer.hpp"
#include "Softmax.hpp"
#include "Uncertainty.hpp"

#include <algorithm>   // std::transform, std::max_element
#include <cctype>      // std::tolower
#include <cmath>       // std::isfinite, std::fabs, std::pow
#include <iostream>    // std::cout, std::cerr
#include <stdexcept>   // std::invalid_argument, std::overflow_error, std::underflow_error

// ============================================================================
// CONSTRUCTOR
// ============================================================================

UncertaintyScorer::UncertaintyScorer(const ScorerConfig& config) : config_(config) {
    if (!std::isfinite(config_.softmaxBase) || config_.softmaxBase <= 0.0) {
        throw std::invalid_argument(
            "UncertaintyScorer: softmaxBase must be finite and positive, got "
            + std::to_string(config_.softmaxBase));
    }
    if (!(config_.tolerance >= 0.0)) {
        throw std::invalid_argument(
            "UncertaintyScorer: tolerance must be non-negative, got "
            + std::to_string(config_.tolerance));
    }

    if (config_.verbose) {
        std::cout << "UncertaintyScorer configured" << std::endl;
        std::cout << "  Method: " << methodName(config_.method) << std::endl;
        std::cout << "  Softmax base: " << config_.softmaxBase
                  << (config_.stableSoftmax ? " (stable)" : "") << std::endl;
        std::cout << "  Validate sorted: " << (config_.validateSorted ? "yes" : "no") << std::endl;
        std::cout << "  Validate distribution: "
                  << (config_.validateDistribution ? "yes" : "no") << std::endl;
    }
}

// ============================================================================
// SCORING
// ============================================================================

float UncertaintyScorer::score(const std::vector<float>& probs, bool sorted) const {
    if (config_.validateDistribution) {
        checkDistribution(probs);
    }

    /**
     * The plain metrics trust the sorted flag. Here we check the claim
     * first when asked to, turning a silently wrong score into an error.
     */
    if (sorted && config_.validateSorted && !UncertaintyUtils::isSortedDescending(probs)) {
        throw std::invalid_argument(
            "UncertaintyScorer::score: sorted=true but probabilities are not in descending order");
    }

    switch (config_.method) {
        case Method::Margin:
            return UncertaintyUtils::marginConfidence(probs, sorted);
        case Method::Ratio:
            return UncertaintyUtils::ratioConfidence(probs, sorted);
        case Method::Least:
            return UncertaintyUtils::leastConfidence(probs, sorted);
        case Method::Entropy:
            return UncertaintyUtils::entropyScore(probs);
    }
    throw std::invalid_argument("UncertaintyScorer::score: unknown method");
}

float UncertaintyScorer::scoreLogits(const std::vector<float>& logits) const {
    for (size_t i = 0; i < logits.size(); ++i) {
        if (!std::isfinite(logits[i])) {
            throw std::invalid_argument(
                "UncertaintyScorer::scoreLogits: logit at index " + std::to_string(i)
                + " is not finite");
        }
    }

    std::vector<float> probs = config_.stableSoftmax
        ? SoftmaxUtils::stableSoftmax(logits, config_.softmaxBase)
        : SoftmaxUtils::softmax(logits, config_.softmaxBase);

    /**
     * With finite logits a non-finite probability means the unshifted sum
     * was inf/inf (overflow) or 0/0 (underflow). The largest term tells
     * which: base^max is 0 only when every term underflowed.
     */
    for (float p : probs) {
        if (!std::isfinite(p)) {
            float maxLogit = *std::max_element(logits.begin(), logits.end());
            bool underflow = std::pow(config_.softmaxBase, static_cast<double>(maxLogit)) == 0.0;
            const char* kind = underflow ? "underflowed" : "overflowed";

            std::cerr << "Error: softmax " << kind << " (base " << config_.softmaxBase
                      << ", " << logits.size() << " logits); enable stableSoftmax"
                      << " or shift the logits" << std::endl;

            std::string message = std::string("UncertaintyScorer::scoreLogits: softmax ")
                                  + kind + " to a non-finite value";
            if (underflow) {
                throw std::underflow_error(message);
            }
            throw std::overflow_error(message);
        }
    }

    return score(probs, false);
}

// ============================================================================
// VALIDATION
// ============================================================================

void UncertaintyScorer::checkDistribution(const std::vector<float>& probs) const {
    double sum = 0.0;
    for (size_t i = 0; i < probs.size(); ++i) {
        // Written as !(in range) so NaN fails too
        if (!(probs[i] >= 0.0f && probs[i] <= 1.0f)) {
            throw std::invalid_argument(
                "UncertaintyScorer: probability at index " + std::to_string(i)
                + " is outside [0, 1]: " + std::to_string(probs[i]));
        }
        sum += probs[i];
    }

    if (std::fabs(sum - 1.0) > config_.tolerance) {
        throw std::invalid_argument(
            "UncertaintyScorer: probabilities sum to " + std::to_string(sum) + ", expected 1.0");
    }
}

// ============================================================================
// METHOD NAMES
// ============================================================================

std::string UncertaintyScorer::methodName(Method method) {
    switch (method) {
        case Method::Margin:  return "margin";
        case Method::Ratio:   return "ratio";
        case Method::Least:   return "least";
        case Method::Entropy: return "entropy";
    }
    return "unknown";
}

Method UncertaintyScorer::parseMethod(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "margin")  return Method::Margin;
    if (lower == "ratio")   return Method::Ratio;
    if (lower == "least")   return Method::Least;
    if (lower == "entropy") return Method::Entropy;

    throw std::invalid_argument("Unknown uncertainty method: '" + name
                                + "' (expected margin, ratio, least or entropy)");
}
