#pragma once

#include <set>
#include <string>

namespace presence_mcp {

/**
 * @brief Static word lists used by the analysis tools
 *
 * All entries are lowercase ASCII and compared against tokens produced
 * by TextAnalysis::tokenize().
 */
class Lexicon {
public:
    /// Marketing filler that carries no distinguishing information
    static const std::set<std::string>& generic_terms();

    /// Function words ignored when counting descriptive detail
    static const std::set<std::string>& stopwords();

    /// Verbs and nouns that say what a business does
    static const std::set<std::string>& offering_terms();

    /// Words that name who a business serves
    static const std::set<std::string>& audience_terms();

    /// Words that name a concrete benefit or result
    static const std::set<std::string>& outcome_terms();
};

} // namespace presence_mcp
