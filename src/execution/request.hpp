#pragma once

#include <optional>
#include <string>
#include <utility>

namespace vizrun::execution {

enum class Language {
    kPython,
    kR
};

enum class VizType {
    kStatic,
    kInteractive,
    k3d
};

const char* ToString(Language language);
const char* ToString(VizType viz_type);

// Case-insensitive; surrounding whitespace is ignored.
std::optional<Language> ParseLanguage(const std::string& value);
std::optional<VizType> ParseVizType(const std::string& value);

// Request body as received on the wire, before validation.
struct VisualizationRequest {
    std::string code;
    std::string language;
    std::string viz_type = "static";
};

// A validated request. Immutable once accepted.
class ExecutionRequest {
public:
    ExecutionRequest(std::string code, Language language, VizType viz_type)
        : code_(std::move(code))
        , language_(language)
        , viz_type_(viz_type) {}

    const std::string& Code() const { return code_; }
    Language GetLanguage() const { return language_; }
    VizType GetVizType() const { return viz_type_; }

private:
    std::string code_;
    Language language_;
    VizType viz_type_;
};

}  // namespace vizrun::execution
