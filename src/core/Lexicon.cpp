#include "core/Lexicon.hpp"

namespace presence_mcp {

const std::set<std::string>& Lexicon::generic_terms() {
    static const std::set<std::string> terms = {
        "amazing", "awesome", "best", "cutting-edge", "disruptive", "easiest",
        "excellent", "world-class", "great", "innovative", "leading", "next-gen",
        "next-generation", "number-one", "premier", "premium", "quality",
        "revolutionary", "seamless", "simple", "smart", "solution", "solutions",
        "synergy", "top", "ultimate", "unique", "world"
    };
    return terms;
}

const std::set<std::string>& Lexicon::stopwords() {
    static const std::set<std::string> terms = {
        "a", "an", "and", "are", "as", "at", "be", "by", "for", "from", "in",
        "is", "it", "its", "of", "on", "or", "our", "that", "the", "their",
        "this", "to", "way", "we", "with", "you", "your"
    };
    return terms;
}

const std::set<std::string>& Lexicon::offering_terms() {
    static const std::set<std::string> terms = {
        "agency", "analyze", "app", "audit", "automate", "build", "builds",
        "consultancy", "connect", "create", "deliver", "delivers", "design",
        "develop", "host", "hosting", "make", "makes", "manage", "manages",
        "marketplace", "monitor", "optimize", "plan", "platform", "provide",
        "provides", "sell", "sells", "service", "services", "software", "store",
        "studio", "track", "tracks"
    };
    return terms;
}

const std::set<std::string>& Lexicon::audience_terms() {
    static const std::set<std::string> terms = {
        "agencies", "b2b", "brands", "businesses", "clients", "companies",
        "consumers", "customers", "developers", "engineers", "enterprises",
        "families", "founders", "freelancers", "homeowners", "marketers",
        "owners", "retailers", "smbs", "startups", "students", "teams"
    };
    return terms;
}

const std::set<std::string>& Lexicon::outcome_terms() {
    static const std::set<std::string> terms = {
        "conversion", "conversions", "cost", "costs", "cut", "faster", "grow",
        "growth", "increase", "leads", "profit", "reduce", "results", "revenue",
        "roi", "save", "saves", "sales", "time", "traffic", "visibility"
    };
    return terms;
}

} // namespace presence_mcp
