#include "tools/BrandPerceptionAuditTool.hpp"
#include "tools/CitationCheckTool.hpp"
#include "tools/CompetitorComparisonTool.hpp"
#include "tools/EntityClarityScoreTool.hpp"
#include "tools/GeoRecommendationsTool.hpp"
#include "tools/ToolCatalog.hpp"
#include "core/TextAnalysis.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <set>

using namespace presence_mcp;
using json = nlohmann::json;

TEST(ToolsTest, ToolInfoSchemas) {
    auto brand_info = BrandPerceptionAuditTool::get_info();
    EXPECT_EQ(brand_info.name, "brand_perception_audit");
    EXPECT_FALSE(brand_info.description.empty());
    EXPECT_EQ(brand_info.input_schema()["required"], json::array({"brand_name", "industry"}));

    auto citation_info = CitationCheckTool::get_info();
    EXPECT_EQ(citation_info.name, "citation_check");
    EXPECT_EQ(citation_info.input_schema()["properties"]["topics"]["type"], "array");

    auto competitor_info = CompetitorComparisonTool::get_info();
    EXPECT_EQ(competitor_info.name, "competitor_comparison");
    EXPECT_EQ(competitor_info.input_schema()["required"],
              json::array({"brand_name", "competitors", "category"}));

    auto clarity_info = EntityClarityScoreTool::get_info();
    EXPECT_EQ(clarity_info.name, "entity_clarity_score");
    EXPECT_EQ(clarity_info.input_schema()["required"], json::array({"brand_name"}));

    auto geo_info = GeoRecommendationsTool::get_info();
    EXPECT_EQ(geo_info.name, "geo_recommendations");
    EXPECT_EQ(geo_info.input_schema()["required"],
              json::array({"brand_name", "service", "target_locations"}));
}

TEST(ToolsTest, CatalogueRegistersFiveUniqueTools) {
    ToolRegistry registry = build_tool_registry();
    ASSERT_EQ(registry.size(), 5);

    std::set<std::string> names;
    for (const auto& tool : registry.tools()) {
        names.insert(tool.descriptor.name);
    }
    EXPECT_EQ(names, (std::set<std::string>{
        "brand_perception_audit", "citation_check", "competitor_comparison",
        "entity_clarity_score", "geo_recommendations"}));
}

TEST(ToolsTest, BrandPerceptionAudit_Shape) {
    BrandPerceptionAuditTool tool;
    AuditResult result = tool.execute({
        {"brand_name", "Newtation"},
        {"industry", "SEO agency"},
        {"website", "https://newtation.com"}
    });

    EXPECT_EQ(result.tool, "brand_perception_audit");
    EXPECT_EQ(result.brand, "Newtation");
    EXPECT_GE(result.score, 0);
    EXPECT_LE(result.score, 100);
    EXPECT_FALSE(result.rating.empty());
    ASSERT_EQ(result.findings.size(), 4);
    EXPECT_EQ(result.findings[0].subject, "Authority tone");
    EXPECT_EQ(result.findings[1].subject, "Category clarity");
    EXPECT_FALSE(result.recommendations.empty());
    EXPECT_EQ(result.details["test_prompts"].size(), 3);
    EXPECT_EQ(result.details["sub_scores"]["trust_signals"], 80);
}

TEST(ToolsTest, BrandPerceptionAudit_CategoryClarityNeverDropsWithMoreDetail) {
    std::vector<std::string> industries = {
        "SaaS",
        "SaaS project",
        "SaaS project management",
        "SaaS project management software for agencies"
    };

    int previous = 0;
    for (const auto& industry : industries) {
        int clarity = BrandPerceptionAuditTool::category_clarity(industry);
        EXPECT_GE(clarity, previous) << industry;
        previous = clarity;
    }
    EXPECT_EQ(BrandPerceptionAuditTool::category_clarity("SaaS"), 50);
    EXPECT_EQ(BrandPerceptionAuditTool::category_clarity("SaaS project management software"), 90);

    // Generic filler adds no detail
    EXPECT_EQ(BrandPerceptionAuditTool::category_clarity("SaaS"),
              BrandPerceptionAuditTool::category_clarity("best innovative SaaS"));
}

TEST(ToolsTest, BrandPerceptionAudit_TrustSignals) {
    EXPECT_EQ(BrandPerceptionAuditTool::trust_signals(std::nullopt), 25);
    EXPECT_EQ(BrandPerceptionAuditTool::trust_signals(std::string("http://acme.io")), 65);
    EXPECT_EQ(BrandPerceptionAuditTool::trust_signals(std::string("https://acme.io/about")), 80);
    EXPECT_EQ(BrandPerceptionAuditTool::trust_signals(std::string("acme")), 50);
}

TEST(ToolsTest, BrandPerceptionAudit_MissingWebsiteAddsRecommendation) {
    BrandPerceptionAuditTool tool;
    AuditResult with_site = tool.execute({{"brand_name", "Acme"}, {"industry", "SaaS"}, {"website", "https://acme.io"}});
    AuditResult without_site = tool.execute({{"brand_name", "Acme"}, {"industry", "SaaS"}});

    EXPECT_GT(without_site.recommendations.size(), with_site.recommendations.size());
    EXPECT_TRUE(without_site.findings[2].evidence["website"].is_null());
}

TEST(ToolsTest, CitationCheck_PreservesTopicOrder) {
    CitationCheckTool tool;
    AuditResult result = tool.execute({
        {"brand_name", "Acme"},
        {"topics", json::array({"pricing", "support"})}
    });

    ASSERT_EQ(result.findings.size(), 2);
    EXPECT_EQ(result.findings[0].subject, "pricing");
    EXPECT_EQ(result.findings[1].subject, "support");

    for (const auto& finding : result.findings) {
        int likelihood = TextAnalysis::stable_score("Acme" + finding.subject);
        EXPECT_EQ(finding.evidence["likelihood"], likelihood);
        EXPECT_EQ(finding.evidence["cited"], likelihood > CitationCheckTool::kCitedThreshold);
        EXPECT_FALSE(finding.evidence["rationale"].get<std::string>().empty());
    }

    std::size_t cited = result.details["cited_count"].get<std::size_t>();
    EXPECT_EQ(result.score, TextAnalysis::percentage(cited, 2));
    EXPECT_EQ(result.details["total_topics"], 2);
}

TEST(ToolsTest, CitationCheck_EmptyTopicList) {
    CitationCheckTool tool;
    AuditResult result = tool.execute({{"brand_name", "Acme"}, {"topics", json::array()}});

    EXPECT_TRUE(result.findings.empty());
    EXPECT_EQ(result.score, 0);
    EXPECT_EQ(result.rating, "0/0 topics cited");
}

TEST(ToolsTest, CitationCheck_DuplicatesKept) {
    CitationCheckTool tool;
    AuditResult result = tool.execute({
        {"brand_name", "Acme"},
        {"topics", json::array({"seo", "seo", "ads"})}
    });
    ASSERT_EQ(result.findings.size(), 3);
    EXPECT_EQ(result.findings[2].subject, "ads");
}

TEST(ToolsTest, CompetitorComparison_RankingAndTieBreak) {
    // "ab" and "ba" have the same byte sum, so they always tie
    CompetitorComparisonTool::Request request{"Acme", {"ba", "ab"}, "crm"};
    auto ranked = CompetitorComparisonTool::rank(request);

    ASSERT_EQ(ranked.size(), 3);
    for (std::size_t i = 1; i < ranked.size(); ++i) {
        EXPECT_GE(ranked[i - 1].score, ranked[i].score);
        if (ranked[i - 1].score == ranked[i].score) {
            EXPECT_LT(ranked[i - 1].name, ranked[i].name);
        }
    }

    std::size_t ab = 0;
    std::size_t ba = 0;
    for (std::size_t i = 0; i < ranked.size(); ++i) {
        if (ranked[i].name == "ab") ab = i;
        if (ranked[i].name == "ba") ba = i;
    }
    EXPECT_EQ(ba, ab + 1);
}

TEST(ToolsTest, CompetitorComparison_CollapsesDuplicatesAndBrand) {
    CompetitorComparisonTool::Request request{"Acme", {"Globex", "Acme", "Globex", "", "Initech"}, "crm"};
    auto ranked = CompetitorComparisonTool::rank(request);

    ASSERT_EQ(ranked.size(), 3);
    int brand_entries = 0;
    for (const auto& entry : ranked) {
        brand_entries += entry.is_brand ? 1 : 0;
    }
    EXPECT_EQ(brand_entries, 1);
}

TEST(ToolsTest, CompetitorComparison_TestPromptSkipsCollapsedEntries) {
    CompetitorComparisonTool tool;
    AuditResult result = tool.execute({
        {"brand_name", "Acme"},
        {"competitors", json::array({"  ", "Acme", "Globex", "Initech"})},
        {"category", "CRM"}
    });
    EXPECT_EQ(result.details["test_prompt"], "Compare Acme vs Globex for CRM");

    AuditResult only_self = tool.execute({
        {"brand_name", "Acme"},
        {"competitors", json::array({"Acme"})},
        {"category", "CRM"}
    });
    EXPECT_EQ(only_self.details["test_prompt"], "Compare Acme vs competitors for CRM");
}

TEST(ToolsTest, CompetitorComparison_ResultShape) {
    CompetitorComparisonTool tool;
    AuditResult result = tool.execute({
        {"brand_name", "Acme"},
        {"competitors", json::array({"Globex", "Initech"})},
        {"category", "CRM software"}
    });

    ASSERT_EQ(result.findings.size(), 3);
    EXPECT_EQ(result.score, TextAnalysis::stable_score("AcmeCRM software"));

    int leader_score = 0;
    for (const auto& finding : result.findings) {
        EXPECT_FALSE(finding.evidence["rationale"].get<std::string>().empty());
        if (!finding.evidence["is_brand"].get<bool>()) {
            leader_score = std::max(leader_score, finding.evidence["score"].get<int>());
        }
    }
    EXPECT_EQ(result.findings[0].evidence["rank"], 1);
    EXPECT_EQ(result.details["leader_score"], leader_score);
    EXPECT_EQ(result.details["gap"], std::max(0, leader_score - result.score));
    EXPECT_EQ(result.details["ranking"].size(), 3);
}

TEST(ToolsTest, CompetitorComparison_NoCompetitors) {
    CompetitorComparisonTool tool;
    AuditResult result = tool.execute({
        {"brand_name", "Acme"},
        {"competitors", json::array()},
        {"category", "CRM"}
    });

    ASSERT_EQ(result.findings.size(), 1);
    EXPECT_TRUE(result.details["leader"].is_null());
    EXPECT_EQ(result.details["gap"], 0);
    EXPECT_EQ(result.details["brand_rank"], 1);
}

TEST(ToolsTest, EntityClarityScore_DocumentedRangeAndFindings) {
    EntityClarityScoreTool tool;
    AuditResult result = tool.execute({
        {"brand_name", "Acme Corp"},
        {"tagline_or_description", "The easiest way to manage projects"}
    });

    EXPECT_GE(result.score, EntityClarityScoreTool::kMinScore);
    EXPECT_LE(result.score, EntityClarityScoreTool::kMaxScore);
    EXPECT_FALSE(result.findings.empty());
    // 20 base + 20 length + 20 offering ("manage") - 5 generic ("easiest")
    EXPECT_EQ(result.score, 55);
    EXPECT_EQ(result.rating, "Needs Work");
}

TEST(ToolsTest, EntityClarityScore_StableUnderWhitespace) {
    EntityClarityScoreTool tool;
    AuditResult plain = tool.execute({
        {"brand_name", "Acme Corp"},
        {"tagline_or_description", "The easiest way to manage projects"}
    });
    AuditResult padded = tool.execute({
        {"brand_name", "Acme Corp"},
        {"tagline_or_description", " The easiest way to manage projects "}
    });
    AuditResult spread = tool.execute({
        {"brand_name", "Acme Corp"},
        {"tagline_or_description", "The\teasiest   way to\nmanage projects"}
    });

    EXPECT_EQ(plain.score, padded.score);
    EXPECT_EQ(plain.score, spread.score);
    EXPECT_EQ(plain.to_json(), padded.to_json());
}

TEST(ToolsTest, EntityClarityScore_RicherDescriptionScoresHigher) {
    EntityClarityScoreTool tool;
    AuditResult result = tool.execute({
        {"brand_name", "Acme Corp"},
        {"tagline_or_description", "Acme Corp builds project software that helps agencies save time"}
    });

    // 20 + 20 length + 10 brand + 20 offering + 15 audience + 15 outcome
    EXPECT_EQ(result.score, 100);
    EXPECT_EQ(result.rating, "Strong");
}

TEST(ToolsTest, EntityClarityScore_WithoutDescription) {
    EntityClarityScoreTool tool;
    AuditResult missing = tool.execute({{"brand_name", "Acme Corp"}});
    AuditResult blank = tool.execute({{"brand_name", "Acme Corp"}, {"tagline_or_description", "   "}});

    EXPECT_GE(missing.score, 10);
    EXPECT_LE(missing.score, 20);
    EXPECT_EQ(missing.score, blank.score);
    ASSERT_EQ(missing.findings.size(), 1);
    EXPECT_EQ(missing.findings[0].subject, "Self-description");
    EXPECT_TRUE(missing.details["description"].is_null());
}

TEST(ToolsTest, GeoRecommendations_PreservesLocationOrder) {
    GeoRecommendationsTool tool;
    AuditResult result = tool.execute({
        {"brand_name", "Acme"},
        {"service", "SEO consulting"},
        {"target_locations", json::array({"New York", "London", "Sydney"})}
    });

    ASSERT_EQ(result.findings.size(), 3);
    EXPECT_EQ(result.findings[0].subject, "New York");
    EXPECT_EQ(result.findings[1].subject, "London");
    EXPECT_EQ(result.findings[2].subject, "Sydney");

    std::size_t appearing = 0;
    for (const auto& finding : result.findings) {
        bool recommended = finding.evidence["recommended"].get<bool>();
        EXPECT_EQ(recommended, TextAnalysis::stable_score("Acme" + finding.subject) >
                               GeoRecommendationsTool::kRecommendedThreshold);
        appearing += recommended ? 1 : 0;
    }
    EXPECT_EQ(result.details["appearing_count"], appearing);
    EXPECT_EQ(result.details["missing_locations"].size(), 3 - appearing);
}

TEST(ToolsTest, AllToolsAreDeterministic) {
    ToolRegistry registry = build_tool_registry();

    std::vector<std::pair<std::string, json>> calls = {
        {"brand_perception_audit", {{"brand_name", "Acme"}, {"industry", "SaaS"}}},
        {"citation_check", {{"brand_name", "Acme"}, {"topics", json::array({"pricing"})}}},
        {"competitor_comparison", {{"brand_name", "Acme"}, {"competitors", json::array({"Globex"})}, {"category", "CRM"}}},
        {"entity_clarity_score", {{"brand_name", "Acme"}, {"tagline_or_description", "CRM for startups"}}},
        {"geo_recommendations", {{"brand_name", "Acme"}, {"service", "CRM"}, {"target_locations", json::array({"Oslo"})}}}
    };

    for (const auto& [name, args] : calls) {
        const RegisteredTool* tool = registry.find(name);
        ASSERT_NE(tool, nullptr) << name;
        AuditResult first = tool->handler(args);
        AuditResult second = tool->handler(args);
        EXPECT_EQ(first.to_json(), second.to_json()) << name;
        EXPECT_EQ(first.to_markdown(), second.to_markdown()) << name;
    }
}
