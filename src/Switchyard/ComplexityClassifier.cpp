// =================================================================
// src/Switchyard/ComplexityClassifier.cpp
// =================================================================
// Implementation for request complexity scoring.

#include "Switchyard/ComplexityClassifier.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace Switchyard {

namespace {

// Bounds on the text handed to std::regex, whose matcher recurses per character
constexpr size_t MAX_SCANNED_LINES = 200;
constexpr size_t MAX_SCANNED_LINE_LENGTH = 512;

} // anonymous namespace

ClassifierConfig::ClassifierConfig()
    : length_weight(0.30), code_weight(0.25), structure_weight(0.15),
      keyword_weight(0.30), simple_keyword_penalty(0.10), long_prompt_words(50) {
    complex_keywords = {
        "analyze", "analysis", "design", "develop", "implement", "architecture",
        "algorithm", "optimize", "optimization", "integration", "framework",
        "database", "strategy", "technical", "detailed", "complex", "enterprise",
        "production", "system design", "business strategy", "market analysis",
        "build api", "step by step", "prove", "compare"
    };

    simple_keywords = {
        "hello", "hi", "hey", "thanks", "thank you", "what is", "who is",
        "when", "where", "quick", "simple", "basic", "summary", "list", "define"
    };

    structure_keywords = {
        "json", "yaml", "xml", "csv", "table", "schema", "markdown",
        "bullet points", "numbered list", "format as", "output format", "template"
    };

    code_keywords = {
        "code", "function", "class", "method", "script", "python", "javascript",
        "typescript", "java", "c++", "rust", "golang", "sql", "regex", "compile",
        "refactor", "debug", "unit test", "api"
    };
}

ComplexityClassifier::ComplexityClassifier(const ClassifierConfig& config)
    : m_config(config) {
    // Structural code markers that keywords alone miss, matched one line at a time
    m_code_patterns = {
        std::regex(R"(```)"),
        std::regex(R"(^\s*(def|class|fn|func|public|private|import|#include)\b)"),
        std::regex(R"(\w+\([^()]*\)\s*[{;:])"),
        std::regex(R"([{};]\s*$)")
    };
}

ComplexityScore ComplexityClassifier::score(const Request& request) const {
    try {
        return scoreUnchecked(request);
    } catch (const std::exception&) {
        // Unknown is treated as simple so routing is never blocked
        ComplexityScore degraded;
        degraded.value = 0.0;
        degraded.degraded = true;
        degraded.features["degraded"] = 1.0;
        return degraded;
    }
}

ComplexityScore ComplexityClassifier::scoreUnchecked(const Request& request) const {
    ComplexityScore result;

    auto hint_it = request.metadata.find("complexity");
    if (hint_it != request.metadata.end()) {
        double hint = parseHint(hint_it->second);
        result.value = hint;
        result.features["hint"] = hint;
        return result;
    }

    if (request.prompt.empty()) {
        result.features["length"] = 0.0;
        return result;
    }

    std::string normalized = normalizeText(request.prompt);
    size_t word_count = countWords(normalized);

    double length = lengthFeature(word_count);
    double code = codeFeature(request.prompt, normalized);
    double structure = structureFeature(normalized);

    size_t complex_hits = countKeywordHits(normalized, m_config.complex_keywords);
    size_t simple_hits = countKeywordHits(normalized, m_config.simple_keywords);
    double keywords = std::min(1.0, static_cast<double>(complex_hits) / 2.0);
    double penalty = static_cast<double>(simple_hits) * m_config.simple_keyword_penalty;

    double value = length * m_config.length_weight +
                   code * m_config.code_weight +
                   structure * m_config.structure_weight +
                   keywords * m_config.keyword_weight -
                   penalty;

    result.value = std::clamp(value, 0.0, 1.0);
    result.features["length"] = length;
    result.features["code"] = code;
    result.features["structure"] = structure;
    result.features["keywords"] = keywords;
    result.features["simple_penalty"] = penalty;

    return result;
}

double ComplexityClassifier::parseHint(const std::string& hint) {
    std::string lowered = hint;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    lowered.erase(0, lowered.find_first_not_of(" \t\n\r"));
    lowered.erase(lowered.find_last_not_of(" \t\n\r") + 1);

    if (lowered == "low") return 0.0;
    if (lowered == "medium") return 0.5;
    if (lowered == "high") return 1.0;

    double value = 0.0;
    std::istringstream iss(lowered);
    iss >> value;
    if (lowered.empty() || iss.fail() || !iss.eof() || !std::isfinite(value) ||
        value < 0.0 || value > 1.0) {
        throw RoutingError(ErrorKind::CLASSIFICATION_DEGRADED, "Malformed complexity hint: " + hint);
    }

    return value;
}

double ComplexityClassifier::lengthFeature(size_t word_count) const {
    if (m_config.long_prompt_words == 0) {
        return 1.0;
    }
    return std::min(1.0, static_cast<double>(word_count) / m_config.long_prompt_words);
}

double ComplexityClassifier::codeFeature(const std::string& raw, const std::string& normalized) const {
    size_t hits = countKeywordHits(normalized, m_config.code_keywords);

    std::vector<bool> matched(m_code_patterns.size(), false);
    std::istringstream lines(raw);
    std::string line;
    size_t scanned = 0;

    while (scanned < MAX_SCANNED_LINES && std::getline(lines, line)) {
        scanned++;
        if (line.size() > MAX_SCANNED_LINE_LENGTH) {
            line.resize(MAX_SCANNED_LINE_LENGTH);
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        for (size_t i = 0; i < m_code_patterns.size(); ++i) {
            if (!matched[i] && std::regex_search(line, m_code_patterns[i])) {
                matched[i] = true;
                hits++;
            }
        }
    }

    return std::min(1.0, static_cast<double>(hits) / 2.0);
}

double ComplexityClassifier::structureFeature(const std::string& normalized) const {
    size_t hits = countKeywordHits(normalized, m_config.structure_keywords);
    return std::min(1.0, static_cast<double>(hits) / 2.0);
}

size_t ComplexityClassifier::countKeywordHits(const std::string& normalized,
                                              const std::vector<std::string>& keywords) const {
    size_t hits = 0;
    for (const auto& keyword : keywords) {
        std::string needle = normalizeText(keyword);
        if (needle.size() <= 2) {
            continue; // nothing but padding
        }
        if (normalized.find(needle) != std::string::npos) {
            hits++;
        }
    }
    return hits;
}

std::string ComplexityClassifier::normalizeText(const std::string& text) {
    std::string normalized;
    normalized.reserve(text.size() + 2);
    normalized.push_back(' ');

    for (unsigned char c : text) {
        // '+' is kept so "c++" survives as a token
        char mapped = (std::isalnum(c) || c == '+' || c >= 0x80)
            ? static_cast<char>(std::tolower(c)) : ' ';
        if (mapped == ' ' && normalized.back() == ' ') {
            continue;
        }
        normalized.push_back(mapped);
    }

    if (normalized.back() != ' ') {
        normalized.push_back(' ');
    }

    return normalized;
}

size_t ComplexityClassifier::countWords(const std::string& normalized) {
    std::istringstream iss(normalized);
    std::string word;
    size_t count = 0;
    while (iss >> word) {
        count++;
    }
    return count;
}

} // namespace Switchyard
