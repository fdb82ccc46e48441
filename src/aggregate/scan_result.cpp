#include <scry/aggregate/scan_result.h>

namespace scry::aggregate {

const graph::CodeGraph& ScanResult::codeGraph() const {
    static const graph::CodeGraph kEmpty;
    return intelligence ? intelligence->graph : kEmpty;
}

nlohmann::json ScanResult::toJson() const {
    nlohmann::json out;
    out["languages"] = languages;
    out["primary_language"] =
        primary_language ? nlohmann::json(*primary_language) : nlohmann::json(nullptr);
    out["dependencies"] = dependencies;
    out["frameworks"] = frameworks;
    out["code_graph"] = codeGraph().toJson();
    out["findings"] = detect::toJson(findings);
    out["health_signals"] = health_signals;
    return out;
}

} // namespace scry::aggregate
