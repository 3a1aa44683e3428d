#include "tools/CompetitorComparisonTool.hpp"
#include "core/TextAnalysis.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

namespace presence_mcp {

ToolDescriptor CompetitorComparisonTool::get_info() {
    return {
        "competitor_comparison",
        "Compare how AI models perceive your brand versus your key competitors. "
        "Surfaces which competitor is winning AI mindshare and why, with a gap analysis "
        "and concrete steps to close the visibility gap.",
        {
            {"brand_name", ParamType::String, "Your brand name", true, 0, 200},
            {"competitors", ParamType::StringArray,
             "List of competitor brand names to compare against", true, 50, 200},
            {"category", ParamType::String,
             "The market category or service type being compared", true, 0, 500}
        }
    };
}

CompetitorComparisonTool::Request CompetitorComparisonTool::parse(const json& args) {
    Request request;
    request.brand_name = TextAnalysis::normalize_whitespace(args.at("brand_name").get<std::string>());
    request.category = TextAnalysis::normalize_whitespace(args.at("category").get<std::string>());
    for (const auto& competitor : args.at("competitors")) {
        request.competitors.push_back(TextAnalysis::normalize_whitespace(competitor.get<std::string>()));
    }
    return request;
}

AuditResult CompetitorComparisonTool::execute(const json& args) const {
    return run(parse(args));
}

std::vector<CompetitorComparisonTool::RankedEntry> CompetitorComparisonTool::rank(const Request& request) {
    std::vector<RankedEntry> entries;
    std::set<std::string> seen;

    seen.insert(request.brand_name);
    entries.push_back({request.brand_name,
                       TextAnalysis::stable_score(request.brand_name + request.category), true});

    for (const auto& competitor : request.competitors) {
        if (competitor.empty() || !seen.insert(competitor).second) {
            continue;
        }
        entries.push_back({competitor, TextAnalysis::stable_score(competitor + request.category), false});
    }

    std::sort(entries.begin(), entries.end(), [](const RankedEntry& a, const RankedEntry& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.name < b.name;
    });
    return entries;
}

AuditResult CompetitorComparisonTool::run(const Request& request) const {
    spdlog::debug("CompetitorComparisonTool: '{}' vs {} competitors in '{}'",
                  request.brand_name, request.competitors.size(), request.category);

    const std::string& brand = request.brand_name;
    auto ranked = rank(request);

    AuditResult result;
    result.tool = "competitor_comparison";
    result.title = "Competitor AI Visibility Comparison";
    result.brand = brand;

    int brand_score = 0;
    std::size_t brand_rank = 0;
    const RankedEntry* leader = nullptr;
    json ranking = json::array();

    for (std::size_t i = 0; i < ranked.size(); ++i) {
        const auto& entry = ranked[i];
        const std::size_t position = i + 1;
        const std::string strength = TextAnalysis::strength_band(entry.score);

        if (entry.is_brand) {
            brand_score = entry.score;
            brand_rank = position;
        } else if (!leader) {
            leader = &entry;
        }

        std::string rationale;
        if (i == 0) {
            rationale = "Highest AI visibility in " + request.category + "; most likely named first in answers.";
        } else if (ranked[i - 1].score == entry.score) {
            rationale = "Tied with " + ranked[i - 1].name + " on score; ordered by name.";
        } else {
            rationale = std::to_string(ranked[0].score - entry.score) + " points behind " +
                        ranked[0].name + " in " + request.category + ".";
        }

        Finding finding;
        finding.subject = entry.is_brand ? entry.name + " (you)" : entry.name;
        finding.observation = "Rank " + std::to_string(position) + " with " +
                              std::to_string(entry.score) + "/100 (" + strength + "). " + rationale;
        finding.evidence = {
            {"rank", position},
            {"name", entry.name},
            {"score", entry.score},
            {"strength", strength},
            {"is_brand", entry.is_brand},
            {"rationale", rationale}
        };
        ranking.push_back(finding.evidence);
        result.findings.push_back(std::move(finding));
    }

    result.score = brand_score;
    result.rating = TextAnalysis::strength_band(brand_score);

    const int gap = leader ? std::max(0, leader->score - brand_score) : 0;
    const std::string leader_name = leader ? leader->name : std::string("N/A");

    if (leader && gap > 0) {
        result.summary = leader_name + " leads AI visibility for " + request.category + " by " +
                         std::to_string(gap) + " points. Brands with high AI visibility typically have more "
                         "indexed content, more AI-trusted citations, and a clearer entity definition.";
    } else {
        result.summary = brand + " matches or leads every listed competitor for " + request.category +
                         ". Keep compounding the lead with consistent citations.";
    }

    result.recommendations = {
        "Audit " + leader_name + "'s content strategy: which topics do they own that you do not?",
        "Target their citation gaps: find topics where no one has the definitive answer yet",
        "Build brand mentions at the same publication tier they are cited in",
        "Start now: AI visibility compounds over time"
    };

    // First competitor that survived collapsing, in the caller's order
    std::string first_competitor = "competitors";
    for (const auto& competitor : request.competitors) {
        if (!competitor.empty() && competitor != brand) {
            first_competitor = competitor;
            break;
        }
    }
    result.details = {
        {"category", request.category},
        {"brand_rank", brand_rank},
        {"ranking", ranking},
        {"leader", leader ? json(leader_name) : json(nullptr)},
        {"leader_score", leader ? json(leader->score) : json(nullptr)},
        {"gap", gap},
        {"tie_break", "score descending, then name ascending (byte order)"},
        {"test_prompt", "Compare " + brand + " vs " + first_competitor + " for " + request.category}
    };

    return result;
}

} // namespace presence_mcp
