#include "execution/request.hpp"

#include "utils/common.hpp"

namespace vizrun::execution {

const char* ToString(Language language) {
    switch (language) {
        case Language::kPython:
            return "python";
        case Language::kR:
            return "r";
    }
    return "python";
}

const char* ToString(VizType viz_type) {
    switch (viz_type) {
        case VizType::kStatic:
            return "static";
        case VizType::kInteractive:
            return "interactive";
        case VizType::k3d:
            return "3d";
    }
    return "static";
}

std::optional<Language> ParseLanguage(const std::string& value) {
    const auto normalized = utils::ToLower(utils::Trim(value));
    if (normalized == "python") {
        return Language::kPython;
    }
    if (normalized == "r") {
        return Language::kR;
    }
    return std::nullopt;
}

std::optional<VizType> ParseVizType(const std::string& value) {
    const auto normalized = utils::ToLower(utils::Trim(value));
    if (normalized == "static") {
        return VizType::kStatic;
    }
    if (normalized == "interactive") {
        return VizType::kInteractive;
    }
    if (normalized == "3d") {
        return VizType::k3d;
    }
    return std::nullopt;
}

}  // namespace vizrun::execution
