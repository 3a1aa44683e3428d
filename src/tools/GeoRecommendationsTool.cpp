#include "tools/GeoRecommendationsTool.hpp"
#include "core/TextAnalysis.hpp"
#include <spdlog/spdlog.h>

namespace presence_mcp {

ToolDescriptor GeoRecommendationsTool::get_info() {
    return {
        "geo_recommendations",
        "Test whether AI recommends your brand when users ask location-specific questions. "
        "Returns which cities/regions your brand appears in AI recommendations, "
        "which it's missing from, and how to expand your geographic AI footprint.",
        {
            {"brand_name", ParamType::String, "Brand name to check", true, 0, 200},
            {"service", ParamType::String,
             "The service or product to test recommendations for", true, 0, 500},
            {"target_locations", ParamType::StringArray,
             "Cities or regions you want to appear in (e.g. ['New York', 'London', 'Sydney'])",
             true, 100, 200}
        }
    };
}

GeoRecommendationsTool::Request GeoRecommendationsTool::parse(const json& args) {
    Request request;
    request.brand_name = TextAnalysis::normalize_whitespace(args.at("brand_name").get<std::string>());
    request.service = TextAnalysis::normalize_whitespace(args.at("service").get<std::string>());
    for (const auto& location : args.at("target_locations")) {
        request.locations.push_back(TextAnalysis::normalize_whitespace(location.get<std::string>()));
    }
    return request;
}

AuditResult GeoRecommendationsTool::execute(const json& args) const {
    return run(parse(args));
}

AuditResult GeoRecommendationsTool::run(const Request& request) const {
    spdlog::debug("GeoRecommendationsTool: '{}' for '{}' in {} locations",
                  request.brand_name, request.service, request.locations.size());

    const std::string& brand = request.brand_name;

    AuditResult result;
    result.tool = "geo_recommendations";
    result.title = "Geographic AI Recommendation Audit";
    result.brand = brand;

    std::size_t appearing = 0;
    json missing = json::array();

    for (const auto& location : request.locations) {
        const int likelihood = TextAnalysis::stable_score(brand + location);
        const bool recommended = likelihood > kRecommendedThreshold;

        Finding finding;
        finding.subject = location;
        if (recommended) {
            ++appearing;
            finding.observation = "Recommended: " + brand + " appears when users ask for " +
                                  request.service + " in " + location + ".";
        } else {
            missing.push_back(location);
            finding.observation = "Not appearing: AI answers for " + request.service + " in " +
                                  location + " are unlikely to include " + brand + ".";
        }
        finding.evidence = {
            {"location", location},
            {"recommended", recommended},
            {"likelihood", likelihood},
            {"action", recommended
                ? std::string("Maintain local content signals")
                : "Publish " + location + "-specific case studies or landing page"}
        };
        result.findings.push_back(std::move(finding));
    }

    const std::size_t total = request.locations.size();
    result.score = TextAnalysis::percentage(appearing, total);
    result.rating = "Appearing in " + std::to_string(appearing) + "/" + std::to_string(total) + " locations";
    result.summary = "When someone asks for the best " + request.service + " in a city, AI answers from "
                     "what it has seen connecting brands to that place. Where " + brand +
                     " lacks explicit local signals it is invisible to that query, even in areas it serves.";

    result.recommendations = {
        "Create location-specific landing pages with real local content, not thin duplicates",
        "Publish local case studies mentioning both the location and " + brand,
        "Get mentioned in regional business publications AI trusts",
        "Complete your Google Business Profile to reinforce location signals",
        "Collect location-tagged testimonials: \"We helped [Client] in [City] achieve [Result]\""
    };
    if (!missing.empty()) {
        result.recommendations.push_back("Start with one strong piece of content this week for " +
                                         missing.front().get<std::string>());
    }

    result.details = {
        {"service", request.service},
        {"appearing_count", appearing},
        {"total_locations", total},
        {"missing_locations", missing},
        {"test_prompt", "Who provides the best " + request.service + " in [city]?"}
    };

    return result;
}

} // namespace presence_mcp
