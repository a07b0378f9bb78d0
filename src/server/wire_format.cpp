#include "server/wire_format.hpp"

namespace vizrun::server {
namespace {

// Returns an error message when the field is present but not a string.
std::optional<std::string> ReadStringField(const nlohmann::json& body,
                                           const char* key,
                                           std::string& target) {
    const auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        return std::string("Field '") + key + "' must be a string";
    }
    target = it->get<std::string>();
    return std::nullopt;
}

}  // namespace

ParsedRequest ParseRequestBody(const std::string& body) {
    ParsedRequest parsed;
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error&) {
        parsed.failure = execution::failures::Validation("Request body must be valid JSON");
        return parsed;
    }
    if (!json.is_object()) {
        parsed.failure = execution::failures::Validation("Request body must be a JSON object");
        return parsed;
    }

    for (const char* key : {"code", "language"}) {
        const auto it = json.find(key);
        if (it == json.end() || it->is_null()) {
            parsed.failure = execution::failures::Validation(std::string("Field '") + key + "' is required");
            return parsed;
        }
    }

    execution::VisualizationRequest request;
    for (const auto& field : {std::make_pair("code", &request.code),
                              std::make_pair("language", &request.language),
                              std::make_pair("viz_type", &request.viz_type)}) {
        if (auto error = ReadStringField(json, field.first, *field.second)) {
            parsed.failure = execution::failures::Validation(std::move(*error));
            return parsed;
        }
    }
    parsed.request = std::move(request);
    return parsed;
}

nlohmann::json ResultToJson(const execution::ExecutionResult& result) {
    if (result.IsArtifact()) {
        const auto& artifact = result.GetArtifact();
        return {{"type", execution::ToString(artifact.kind)}, {"content", artifact.content}};
    }
    return {{"detail", result.GetFailure().message}};
}

int HttpStatus(const execution::ExecutionResult& result) {
    return result.IsArtifact() ? 200 : result.GetFailure().http_status;
}

std::string DumpJson(const nlohmann::json& json) {
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json StatsToJson(const governor::GovernorStats& stats) {
    return {
        {"live", stats.live},
        {"capacity", stats.capacity},
        {"admitted", stats.admitted},
        {"rejected", stats.rejected},
        {"completed", stats.completed},
        {"timed_out", stats.timed_out},
        {"crashed", stats.crashed},
        {"killed", stats.killed}
    };
}

nlohmann::json SamplesToJson(const std::vector<SampleSnippet>& snippets) {
    nlohmann::json json = nlohmann::json::object();
    for (const auto& snippet : snippets) {
        json[execution::ToString(snippet.language)][execution::ToString(snippet.viz_type)] = snippet.code;
    }
    return json;
}

}  // namespace vizrun::server
