#pragma once

#include <string>
#include <utility>
#include <vector>

#include "execution/request.hpp"
#include "execution/result.hpp"

namespace vizrun::adapters {

// Written to the artifact channel by an epilogue that found nothing to render.
constexpr const char* kNoArtifactSentinel = "__VIZRUN_NO_ARTIFACT__";

// Environment variable naming the artifact channel inside the worker.
constexpr const char* kArtifactPathEnv = "VIZRUN_ARTIFACT_PATH";

// A fully wrapped, runnable program. Pure data: the worker that runs it
// decides where the script and the artifact live.
struct AdaptedUnit {
    execution::Language language = execution::Language::kPython;
    execution::VizType viz_type = execution::VizType::kStatic;
    execution::ArtifactKind artifact_kind = execution::ArtifactKind::kImage;
    // Interpreter and its flags; the script path is appended as the last argument.
    std::vector<std::string> command;
    std::string script_name;
    std::string source;
    std::vector<std::pair<std::string, std::string>> environment;
    // Substrings of stderr that identify a language-level error trace.
    std::vector<std::string> error_markers;
    // Substrings of stderr that identify an allocation failure.
    std::vector<std::string> memory_markers;
};

class RuntimeAdapter {
public:
    virtual ~RuntimeAdapter() = default;
    virtual execution::Language GetLanguage() const = 0;
    virtual AdaptedUnit BuildAdaptedUnit(const std::string& code, execution::VizType viz_type) const = 0;
};

}  // namespace vizrun::adapters
