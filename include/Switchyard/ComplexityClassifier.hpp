// =================================================================
// include/Switchyard/ComplexityClassifier.hpp
// =================================================================
// Header for request complexity scoring.

#pragma once

#include "Switchyard/RoutingTypes.hpp"
#include <string>
#include <vector>
#include <regex>

namespace Switchyard {

/**
 * @brief Weights and keyword rules for complexity scoring
 */
struct ClassifierConfig {
    double length_weight;            ///< Weight of the prompt length feature
    double code_weight;              ///< Weight of the code marker feature
    double structure_weight;         ///< Weight of the structured-output marker feature
    double keyword_weight;           ///< Weight of the complex keyword feature
    double simple_keyword_penalty;   ///< Subtracted once per simple keyword hit
    size_t long_prompt_words;        ///< Word count at which the length feature saturates
    std::vector<std::string> complex_keywords;
    std::vector<std::string> simple_keywords;
    std::vector<std::string> structure_keywords;
    std::vector<std::string> code_keywords;

    ClassifierConfig();
};

/**
 * @brief Scores the computational difficulty of a request
 *
 * Pure function of the request content and its explicit hints. Never throws:
 * malformed input yields the minimum score with the degraded flag set.
 * Safe to call concurrently; the classifier holds no mutable state.
 */
class ComplexityClassifier {
public:
    /**
     * @brief Construct a classifier
     * @param config Feature weights and keyword lists
     */
    explicit ComplexityClassifier(const ClassifierConfig& config = ClassifierConfig());

    /**
     * @brief Score a request
     * @param request Request whose prompt and metadata are analyzed
     * @return Score in [0, 1] with its feature breakdown
     */
    ComplexityScore score(const Request& request) const;

    const ClassifierConfig& getConfig() const { return m_config; }

    /**
     * @brief Parse an explicit complexity hint
     * @param hint "low", "medium", "high" or a number in [0, 1]
     * @return Hint value, or throws RoutingError(CLASSIFICATION_DEGRADED) when malformed
     */
    static double parseHint(const std::string& hint);

private:
    ClassifierConfig m_config;
    std::vector<std::regex> m_code_patterns;

    ComplexityScore scoreUnchecked(const Request& request) const;

    double lengthFeature(size_t word_count) const;
    double codeFeature(const std::string& raw, const std::string& normalized) const;
    double structureFeature(const std::string& normalized) const;
    size_t countKeywordHits(const std::string& normalized, const std::vector<std::string>& keywords) const;

    /**
     * @brief Lowercase, replace punctuation with spaces and pad with single spaces
     * @param text Input text
     * @return Normalized text suitable for whole-word matching
     */
    static std::string normalizeText(const std::string& text);

    static size_t countWords(const std::string& normalized);
};

} // namespace Switchyard
