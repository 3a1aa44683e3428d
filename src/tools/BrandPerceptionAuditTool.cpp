#include "tools/BrandPerceptionAuditTool.hpp"
#include "core/Lexicon.hpp"
#include "core/TextAnalysis.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace presence_mcp {

namespace {

std::string status_for(int sub_score) {
    if (sub_score >= 75) {
        return "Established";
    } else if (sub_score >= 50) {
        return "Needs strengthening";
    }
    return "Not yet established";
}

} // namespace

ToolDescriptor BrandPerceptionAuditTool::get_info() {
    return {
        "brand_perception_audit",
        "Analyze how AI language models currently perceive and describe your brand. "
        "Returns a structured audit covering tone, category placement, trust signals, "
        "and recommended prompts you can use to test your own AI presence.",
        {
            {"brand_name", ParamType::String,
             "The brand or company name to audit (e.g. 'Newtation')", true, 0, 200},
            {"industry", ParamType::String,
             "Industry or category (e.g. 'SEO agency', 'SaaS', 'e-commerce')", true, 0, 500},
            {"website", ParamType::String,
             "Brand website URL (optional, used for context)", false, 0, 2048}
        }
    };
}

BrandPerceptionAuditTool::Request BrandPerceptionAuditTool::parse(const json& args) {
    Request request;
    request.brand_name = TextAnalysis::normalize_whitespace(args.at("brand_name").get<std::string>());
    request.industry = TextAnalysis::normalize_whitespace(args.at("industry").get<std::string>());

    if (args.contains("website") && args["website"].is_string()) {
        std::string website = TextAnalysis::normalize_whitespace(args["website"].get<std::string>());
        if (!website.empty()) {
            request.website = website;
        }
    }
    return request;
}

AuditResult BrandPerceptionAuditTool::execute(const json& args) const {
    return run(parse(args));
}

int BrandPerceptionAuditTool::category_clarity(const std::string& industry) {
    auto detail = TextAnalysis::distinct_content_words(TextAnalysis::tokenize(industry));
    return 30 + 20 * static_cast<int>(std::min<std::size_t>(detail, 3));
}

int BrandPerceptionAuditTool::name_distinctiveness(const std::string& brand_name) {
    auto tokens = TextAnalysis::tokenize(brand_name);
    int score = TextAnalysis::stable_score(brand_name);

    const auto& generic = Lexicon::generic_terms();
    bool all_generic = !tokens.empty() && std::all_of(tokens.begin(), tokens.end(),
        [&generic](const std::string& token) { return generic.count(token) > 0; });
    if (all_generic) {
        score -= 25;
    }
    return TextAnalysis::clamp_score(score);
}

int BrandPerceptionAuditTool::trust_signals(const std::optional<std::string>& website) {
    if (!website) {
        return 25;
    }

    std::string url = TextAnalysis::to_lower(*website);
    int score = 50;
    if (url.rfind("https://", 0) == 0) {
        score += 15;
    }

    auto host_start = url.find("://");
    std::string host = host_start == std::string::npos ? url : url.substr(host_start + 3);
    host = host.substr(0, host.find('/'));
    auto dot = host.rfind('.');
    if (dot != std::string::npos && dot > 0 && host.size() - dot > 2 &&
        host.find(' ') == std::string::npos) {
        score += 15;
    }
    return score;
}

AuditResult BrandPerceptionAuditTool::run(const Request& request) const {
    spdlog::debug("BrandPerceptionAuditTool: auditing '{}' in '{}'", request.brand_name, request.industry);

    const int clarity = category_clarity(request.industry);
    const int distinctiveness = name_distinctiveness(request.brand_name);
    const int trust = trust_signals(request.website);
    const int presence = TextAnalysis::stable_score(request.brand_name + request.industry);
    const int overall = (clarity + distinctiveness + trust + presence) / 4;

    const std::string& brand = request.brand_name;
    const std::string website_label = request.website.value_or("your website");

    AuditResult result;
    result.tool = "brand_perception_audit";
    result.title = "Brand Perception Audit";
    result.brand = brand;
    result.score = TextAnalysis::clamp_score(overall);
    result.rating = TextAnalysis::strength_band(result.score);
    result.summary = "AI models in the " + request.industry + " space tend to describe brands "
        "using generic category language unless strong citation signals exist. " + brand +
        " currently reads as a " +
        (result.score > 70 ? std::string("recognized category player") : std::string("regional or niche player")) +
        " rather than a category authority.";

    result.findings.push_back({
        "Authority tone",
        presence > 70 ? brand + " is likely described with confident, authoritative language."
                      : brand + " is likely described by function rather than by outcome or method.",
        {{"sub_score", presence}, {"status", status_for(presence)}}
    });
    result.findings.push_back({
        "Category clarity",
        clarity >= 70 ? "The industry description is specific enough for AI to place the brand."
                      : "The industry description is broad; AI may file the brand under a generic category.",
        {{"sub_score", clarity}, {"status", status_for(clarity)}, {"industry", request.industry}}
    });
    result.findings.push_back({
        "Trust indicators",
        request.website ? "A canonical website gives AI a source to attribute facts to."
                        : "No website supplied; AI has no canonical source to attribute facts to.",
        {{"sub_score", trust}, {"status", status_for(trust)}, {"website", request.website ? json(*request.website) : json(nullptr)}}
    });
    result.findings.push_back({
        "Unique positioning",
        distinctiveness >= 70 ? "The brand name is distinctive and unlikely to be confused."
                              : "The brand name risks being blended with similar names or generic terms.",
        {{"sub_score", distinctiveness}, {"status", status_for(distinctiveness)}}
    });

    result.recommendations = {
        "Publish structured FAQ content covering the questions users ask AI about " + request.industry,
        "Get cited in roundup articles on authoritative industry sites",
        "Add schema markup (Organization + FAQ) to " + website_label,
        "Create an llms.txt file at your domain root listing key facts about " + brand
    };
    if (clarity < 70) {
        result.recommendations.push_back(
            "Describe the industry with specific service and audience words instead of broad labels");
    }
    if (!request.website) {
        result.recommendations.push_back(
            "Publish and consistently reference one canonical website for " + brand);
    }

    result.details = {
        {"sub_scores", {
            {"category_clarity", clarity},
            {"name_distinctiveness", distinctiveness},
            {"trust_signals", trust},
            {"market_presence", presence}
        }},
        {"industry", request.industry},
        {"test_prompts", json::array({
            "Who are the best " + request.industry + " companies?",
            "What do people say about " + brand + "?",
            "Is " + brand + " a good choice for " + request.industry + "?"
        })},
        {"next_step", "Run citation_check to see which topics " + brand + " needs content for."}
    };

    return result;
}

} // namespace presence_mcp
