#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace presence_mcp {

/**
 * @brief Deterministic string helpers shared by the analysis tools
 *
 * Operates on bytes. Non-ASCII bytes are kept inside tokens and never
 * case-folded, so UTF-8 input passes through unchanged.
 */
class TextAnalysis {
public:
    /**
     * @brief Trim both ends and collapse inner whitespace runs to one space
     */
    static std::string normalize_whitespace(std::string_view text);

    /**
     * @brief ASCII lowercase copy
     */
    static std::string to_lower(std::string_view text);

    /**
     * @brief Split into lowercase word tokens
     *
     * A token is a run of letters, digits, '-' or non-ASCII bytes.
     * Leading and trailing '-' are stripped; empty tokens are dropped.
     */
    static std::vector<std::string> tokenize(std::string_view text);

    /**
     * @brief Stable pseudo-score in [40, 90]
     *
     * 40 + (sum of byte values mod 51). Equal input always gives equal
     * output across runs and platforms.
     */
    static int stable_score(std::string_view text);

    /**
     * @brief Count tokens found in a word list (duplicates counted)
     */
    static std::size_t count_matches(const std::vector<std::string>& tokens,
                                     const std::set<std::string>& terms);

    /**
     * @brief Distinct tokens that are neither stopwords nor generic terms
     */
    static std::size_t distinct_content_words(const std::vector<std::string>& tokens);

    /**
     * @brief Case-insensitive substring test on normalized text
     */
    static bool contains_phrase(std::string_view haystack, std::string_view needle);

    /**
     * @brief Strong / Moderate / Weak with the given exclusive thresholds
     */
    static std::string strength_band(int score, int strong_above = 70, int moderate_above = 55);

    /**
     * @brief Clamp to the documented 0-100 range
     */
    static int clamp_score(int score);

    /**
     * @brief Integer percentage, 0 when total is zero
     */
    static int percentage(std::size_t part, std::size_t total);
};

} // namespace presence_mcp
