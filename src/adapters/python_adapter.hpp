#pragma once

#include <string>

#include "adapters/runtime_adapter.hpp"

namespace vizrun::adapters {

// matplotlib for static output, plotly for interactive and 3d output.
class PythonAdapter : public RuntimeAdapter {
public:
    explicit PythonAdapter(std::string interpreter);

    execution::Language GetLanguage() const override { return execution::Language::kPython; }
    AdaptedUnit BuildAdaptedUnit(const std::string& code, execution::VizType viz_type) const override;

private:
    std::string interpreter_;
};

}  // namespace vizrun::adapters
