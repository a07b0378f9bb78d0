#pragma once

#include <string>

#include "adapters/runtime_adapter.hpp"

namespace vizrun::adapters {

// ggplot2 or base graphics for static output, htmlwidgets (plotly) for
// interactive and 3d output.
class RAdapter : public RuntimeAdapter {
public:
    explicit RAdapter(std::string interpreter);

    execution::Language GetLanguage() const override { return execution::Language::kR; }
    AdaptedUnit BuildAdaptedUnit(const std::string& code, execution::VizType viz_type) const override;

private:
    std::string interpreter_;
};

}  // namespace vizrun::adapters
