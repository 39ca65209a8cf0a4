#include "thumbnail/render_report.hpp"

#include <fstream>
#include <iomanip>

namespace tk {

nlohmann::json render_report_json(const std::vector<RenderOutcome>& outcomes) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& o : outcomes) {
        nlohmann::json skipped = nlohmann::json::array();
        for (const auto& e : o.discovery.skipped) {
            skipped.push_back({{"index", e.index()},
                               {"provider", e.info().name},
                               {"source", e.info().source},
                               {"cause", e.cause()}});
        }
        nlohmann::json item = {{"input", o.input.string()},
                               {"status", status_name(o.status)},
                               {"renderer", o.renderer},
                               {"examined", o.discovery.examined},
                               {"skipped_providers", skipped}};
        item["output"] = o.output ? nlohmann::json(o.output->string()) : nlohmann::json(nullptr);
        if (o.status != RenderOutcome::Status::Rendered) {
            item["code"] = errc_name(o.code);
            item["message"] = o.message;
        }
        j.push_back(std::move(item));
    }
    return j;
}

bool write_render_report(const std::vector<RenderOutcome>& outcomes, const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs) return false;
    ofs << std::setw(2) << render_report_json(outcomes) << std::endl;
    return static_cast<bool>(ofs);
}

} // namespace tk
