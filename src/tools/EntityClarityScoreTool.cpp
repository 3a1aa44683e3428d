#include "tools/EntityClarityScoreTool.hpp"
#include "core/Lexicon.hpp"
#include "core/TextAnalysis.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace presence_mcp {

ToolDescriptor EntityClarityScoreTool::get_info() {
    return {
        "entity_clarity_score",
        "Score how clearly AI models understand what your brand is, what it does, "
        "and who it serves. A low score means AI confuses you with others or gives "
        "vague descriptions. Returns a 0-100 score with specific fixes.",
        {
            {"brand_name", ParamType::String, "Brand name to score", true, 0, 200},
            {"tagline_or_description", ParamType::String,
             "Your brand's own description of itself (from homepage or About page)", false, 0, 2000}
        }
    };
}

EntityClarityScoreTool::Request EntityClarityScoreTool::parse(const json& args) {
    Request request;
    request.brand_name = TextAnalysis::normalize_whitespace(args.at("brand_name").get<std::string>());

    if (args.contains("tagline_or_description") && args["tagline_or_description"].is_string()) {
        std::string description =
            TextAnalysis::normalize_whitespace(args["tagline_or_description"].get<std::string>());
        if (!description.empty()) {
            request.description = description;
        }
    }
    return request;
}

AuditResult EntityClarityScoreTool::execute(const json& args) const {
    return run(parse(args));
}

std::string EntityClarityScoreTool::clarity_level(int score) {
    if (score > 75) {
        return "Strong";
    } else if (score > 55) {
        return "Moderate";
    }
    return "Needs Work";
}

AuditResult EntityClarityScoreTool::run(const Request& request) const {
    const std::string& brand = request.brand_name;

    AuditResult result;
    result.tool = "entity_clarity_score";
    result.title = "Entity Clarity Score";
    result.brand = brand;

    json checks = json::object();
    int score = 0;

    if (!request.description) {
        score = 10 + (TextAnalysis::stable_score(brand) - 40) / 5;
        result.findings.push_back({
            "Self-description",
            "No description supplied; AI has only the name to go on and will hedge "
            "(\"a company that may offer...\").",
            {{"provided", false}}
        });
    } else {
        const std::string& description = *request.description;
        auto tokens = TextAnalysis::tokenize(description);
        const std::size_t word_count = tokens.size();

        score = 20;

        int length_points = 0;
        if (word_count >= 5 && word_count <= 30) {
            length_points = 20;
        } else if ((word_count >= 3 && word_count < 5) || (word_count > 30 && word_count <= 50)) {
            length_points = 10;
        }
        score += length_points;
        result.findings.push_back({
            "Length",
            length_points == 20 ? "Description length (" + std::to_string(word_count) + " words) is easy for AI to quote."
                                : "At " + std::to_string(word_count) + " words the description is hard to quote verbatim; aim for 5-30.",
            {{"word_count", word_count}, {"points", length_points}}
        });

        const bool names_brand = TextAnalysis::contains_phrase(description, brand);
        score += names_brand ? 10 : 0;
        result.findings.push_back({
            "Brand mention",
            names_brand ? "The description names " + brand + ", tying the claim to the entity."
                        : "The description never names " + brand + "; quoted alone it describes no one.",
            {{"present", names_brand}, {"points", names_brand ? 10 : 0}}
        });

        const auto offering = TextAnalysis::count_matches(tokens, Lexicon::offering_terms());
        score += offering > 0 ? 20 : 0;
        result.findings.push_back({
            "What you do",
            offering > 0 ? "States what the brand does."
                         : "Does not say what the brand does in concrete terms.",
            {{"matches", offering}, {"points", offering > 0 ? 20 : 0}}
        });

        const auto audience = TextAnalysis::count_matches(tokens, Lexicon::audience_terms());
        score += audience > 0 ? 15 : 0;
        result.findings.push_back({
            "Who you serve",
            audience > 0 ? "Names the audience it serves."
                         : "Does not name who the brand serves.",
            {{"matches", audience}, {"points", audience > 0 ? 15 : 0}}
        });

        const auto outcome = TextAnalysis::count_matches(tokens, Lexicon::outcome_terms());
        score += outcome > 0 ? 15 : 0;
        result.findings.push_back({
            "Outcome",
            outcome > 0 ? "Names a concrete result customers get."
                        : "Does not name a concrete result customers get.",
            {{"matches", outcome}, {"points", outcome > 0 ? 15 : 0}}
        });

        const auto generic = TextAnalysis::count_matches(tokens, Lexicon::generic_terms());
        const int penalty = static_cast<int>(std::min<std::size_t>(generic * 5, 15));
        score -= penalty;
        if (generic > 0) {
            result.findings.push_back({
                "Generic language",
                std::to_string(generic) + " generic marketing term(s) blur the entity with competitors.",
                {{"matches", generic}, {"points", -penalty}}
            });
        }

        checks = {
            {"word_count", word_count},
            {"names_brand", names_brand},
            {"offering_terms", offering},
            {"audience_terms", audience},
            {"outcome_terms", outcome},
            {"generic_terms", generic}
        };
    }

    result.score = std::clamp(score, kMinScore, kMaxScore);
    result.rating = clarity_level(result.score);

    std::string ai_description;
    if (result.score > 75) {
        ai_description = "a detailed and accurate description that captures your positioning well";
    } else if (result.score > 55) {
        ai_description = "a partially accurate but generic description that misses key differentiators";
    } else {
        ai_description = "a vague or uncertain description that lacks specificity about what makes you unique";
    }
    result.summary = "AI models build an internal entity for every brand they encounter. For " + brand +
                     " they are likely to give " + ai_description + ".";

    std::string priority_fix;
    if (result.score > 75) {
        priority_fix = "Your entity is reasonably clear. Focus on expanding citation breadth.";
    } else if (result.score > 55) {
        priority_fix = "Standardize your brand description across all web properties first: "
                       "pick 1-2 sentences and use them everywhere.";
    } else {
        priority_fix = brand + " needs a consistent, explicit definition published on your homepage, "
                       "About page, and all social profiles.";
    }

    result.recommendations = {
        priority_fix,
        "Always write the name as \"" + brand + "\"; never vary spelling or abbreviation",
        "State on your About page what you do, who you serve, where you are based, and the year founded",
        "Add Organization schema with @id, name, url, description and founder",
        "Complete and align your Crunchbase, LinkedIn and Wikidata profiles",
        "Add /.well-known/llms.txt with structured brand facts"
    };

    result.details = {
        {"range", {{"min", kMinScore}, {"max", kMaxScore}}},
        {"description", request.description ? json(*request.description) : json(nullptr)},
        {"checks", checks}
    };

    spdlog::debug("EntityClarityScoreTool: '{}' scored {}", brand, result.score);
    return result;
}

} // namespace presence_mcp
