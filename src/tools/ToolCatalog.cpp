#include "tools/ToolCatalog.hpp"
#include "tools/BrandPerceptionAuditTool.hpp"
#include "tools/CitationCheckTool.hpp"
#include "tools/CompetitorComparisonTool.hpp"
#include "tools/EntityClarityScoreTool.hpp"
#include "tools/GeoRecommendationsTool.hpp"
#include <spdlog/spdlog.h>
#include <memory>

namespace presence_mcp {

ToolRegistry build_tool_registry() {
    ToolRegistry::Builder builder;

    auto brand_perception_tool = std::make_shared<BrandPerceptionAuditTool>();
    builder.add(BrandPerceptionAuditTool::get_info(),
        [brand_perception_tool](const json& args) {
            return brand_perception_tool->execute(args);
        });

    auto citation_tool = std::make_shared<CitationCheckTool>();
    builder.add(CitationCheckTool::get_info(),
        [citation_tool](const json& args) {
            return citation_tool->execute(args);
        });

    auto competitor_tool = std::make_shared<CompetitorComparisonTool>();
    builder.add(CompetitorComparisonTool::get_info(),
        [competitor_tool](const json& args) {
            return competitor_tool->execute(args);
        });

    auto entity_clarity_tool = std::make_shared<EntityClarityScoreTool>();
    builder.add(EntityClarityScoreTool::get_info(),
        [entity_clarity_tool](const json& args) {
            return entity_clarity_tool->execute(args);
        });

    auto geo_tool = std::make_shared<GeoRecommendationsTool>();
    builder.add(GeoRecommendationsTool::get_info(),
        [geo_tool](const json& args) {
            return geo_tool->execute(args);
        });

    ToolRegistry registry = builder.build();
    spdlog::info("All {} tools registered", registry.size());
    return registry;
}

} // namespace presence_mcp
