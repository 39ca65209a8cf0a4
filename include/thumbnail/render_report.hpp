// Thumbkit: JSON summary of a batch run
#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "thumbnail/thumbnail_service.hpp"

namespace tk {

// One object per outcome:
//   {"input", "status", "output", "renderer", "code", "message", "skipped_providers": [...]}
THUMBKIT_API nlohmann::json render_report_json(const std::vector<RenderOutcome>& outcomes);

// Returns false if the file could not be written.
THUMBKIT_API bool write_render_report(const std::vector<RenderOutcome>& outcomes, const std::string& path);

} // namespace tk
