#include "tools/CitationCheckTool.hpp"
#include "core/TextAnalysis.hpp"
#include <spdlog/spdlog.h>

namespace presence_mcp {

ToolDescriptor CitationCheckTool::get_info() {
    return {
        "citation_check",
        "Check whether and how AI models cite your brand as a credible source. "
        "Returns citation likelihood, content gaps, and actionable recommendations "
        "to improve how often AI references your brand in answers.",
        {
            {"brand_name", ParamType::String, "Brand name to check citation status for", true, 0, 200},
            {"topics", ParamType::StringArray,
             "Topics you want to be cited for (e.g. ['AI SEO', 'brand visibility', 'MCP servers'])",
             true, 100, 500}
        }
    };
}

CitationCheckTool::Request CitationCheckTool::parse(const json& args) {
    Request request;
    request.brand_name = TextAnalysis::normalize_whitespace(args.at("brand_name").get<std::string>());
    for (const auto& topic : args.at("topics")) {
        request.topics.push_back(TextAnalysis::normalize_whitespace(topic.get<std::string>()));
    }
    return request;
}

AuditResult CitationCheckTool::execute(const json& args) const {
    return run(parse(args));
}

AuditResult CitationCheckTool::run(const Request& request) const {
    spdlog::debug("CitationCheckTool: {} topics for '{}'", request.topics.size(), request.brand_name);

    const std::string& brand = request.brand_name;

    AuditResult result;
    result.tool = "citation_check";
    result.title = "Citation Check";
    result.brand = brand;

    std::size_t cited = 0;
    json uncited_topics = json::array();

    for (const auto& topic : request.topics) {
        const int likelihood = TextAnalysis::stable_score(brand + topic);
        const bool is_cited = likelihood > kCitedThreshold;

        Finding finding;
        finding.subject = topic.empty() ? std::string("(empty topic)") : topic;
        if (is_cited) {
            ++cited;
            finding.observation = "Likely cited: AI already associates " + brand + " with " + topic + ".";
        } else {
            uncited_topics.push_back(topic);
            finding.observation = "Not cited: AI answers about " + topic +
                                  " are unlikely to reference " + brand + ".";
        }
        finding.evidence = {
            {"topic", topic},
            {"cited", is_cited},
            {"likelihood", likelihood},
            {"rationale", is_cited
                ? "Existing content signals tie the brand to this topic."
                : "Too few authoritative sources connect the brand to this topic."},
            {"action", is_cited
                ? "Maintain with fresh content updates"
                : "Create cornerstone content + get backlinks from authoritative sources"}
        };
        result.findings.push_back(std::move(finding));
    }

    const std::size_t total = request.topics.size();
    result.score = TextAnalysis::percentage(cited, total);
    result.rating = std::to_string(cited) + "/" + std::to_string(total) + " topics cited";
    result.summary = "When AI models answer questions about these topics they pull from sources "
        "they have learned to trust. Every uncited topic is a moment where " + brand +
        " is invisible to someone asking for a recommendation.";

    result.recommendations = {
        "Write the definitive guide for each uncited topic: 2,000+ words with original data or frameworks",
        "Earn editorial links from publications AI models trust (industry blogs, news sites, .edu/.gov where applicable)",
        "Repeat your core claims consistently across your site, social profiles, and PR",
        "Always use the same brand name format: " + brand
    };

    result.details = {
        {"cited_count", cited},
        {"total_topics", total},
        {"citation_rate", result.score},
        {"uncited_topics", uncited_topics},
        {"velocity_tip", "Content published now typically shows up in AI citations within 3-6 months "
                         "as models retrain or retrieve fresher data."}
    };

    return result;
}

} // namespace presence_mcp
