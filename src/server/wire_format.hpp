#pragma once

#include <optional>
#include <string>

#include "execution/request.hpp"
#include "execution/result.hpp"
#include "governor/resource_governor.hpp"
#include "nlohmann/json.hpp"
#include "server/sample_catalog.hpp"

namespace vizrun::server {

struct ParsedRequest {
    std::optional<execution::VisualizationRequest> request;
    execution::Failure failure;

    bool Ok() const { return request.has_value(); }
};

// Reads {"code", "language", "viz_type"}; viz_type may be absent and then
// means "static". Malformed bodies come back as a validation failure.
ParsedRequest ParseRequestBody(const std::string& body);

// {"type", "content"} for an artifact, {"detail"} for a failure.
nlohmann::json ResultToJson(const execution::ExecutionResult& result);
int HttpStatus(const execution::ExecutionResult& result);

// Serializes with invalid UTF-8 replaced; user output is not trusted to be clean.
std::string DumpJson(const nlohmann::json& json);

nlohmann::json StatsToJson(const governor::GovernorStats& stats);
nlohmann::json SamplesToJson(const std::vector<SampleSnippet>& snippets);

}  // namespace vizrun::server
