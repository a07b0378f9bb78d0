#pragma once

#include <string>
#include <vector>

#include "execution/request.hpp"

namespace vizrun::server {

struct SampleSnippet {
    execution::Language language;
    execution::VizType viz_type;
    std::string code;
};

// Starter code for every language and visualization type, as the editor
// shows it before the user types anything.
const std::vector<SampleSnippet>& SampleSnippets();

}  // namespace vizrun::server
