#include "core/AuditResult.hpp"

#include <sstream>

namespace presence_mcp {

json AuditResult::to_json() const {
    json findings_array = json::array();
    for (const auto& finding : findings) {
        findings_array.push_back({
            {"subject", finding.subject},
            {"observation", finding.observation},
            {"evidence", finding.evidence}
        });
    }

    return {
        {"tool", tool},
        {"brand", brand},
        {"score", score},
        {"rating", rating},
        {"summary", summary},
        {"findings", findings_array},
        {"recommendations", recommendations},
        {"details", details}
    };
}

std::string AuditResult::to_markdown() const {
    std::ostringstream out;
    out << "# " << title << " - " << brand << "\n\n";
    out << "## Score: " << score << "/100 (" << rating << ")\n\n";

    if (!summary.empty()) {
        out << summary << "\n\n";
    }

    if (!findings.empty()) {
        out << "### Findings\n";
        for (const auto& finding : findings) {
            out << "- **" << finding.subject << "**: " << finding.observation << "\n";
        }
        out << "\n";
    }

    if (!recommendations.empty()) {
        out << "### Recommendations\n";
        int index = 1;
        for (const auto& recommendation : recommendations) {
            out << index++ << ". " << recommendation << "\n";
        }
    }

    return out.str();
}

} // namespace presence_mcp
