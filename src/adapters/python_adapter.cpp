#include "adapters/python_adapter.hpp"

#include <sstream>
#include <utility>

namespace vizrun::adapters {
namespace {

constexpr const char* kPreamble = R"PY(# --- vizrun preamble ---
import os as __vizrun_os
import sys as __vizrun_sys
__vizrun_os.environ.setdefault("MPLBACKEND", "Agg")
import matplotlib
matplotlib.use("Agg")
import matplotlib.pyplot as plt
import numpy as np
try:
    import pandas as pd
except ImportError:
    pass
__vizrun_created_figures = []
try:
    import plotly.express as px
    import plotly.graph_objects as go
    import plotly.io as pio
    from plotly.basedatatypes import BaseFigure as __vizrun_BaseFigure
    __vizrun_BaseFigure.show = lambda self, *args, **kwargs: None
    __vizrun_figure_init = __vizrun_BaseFigure.__init__
    def __vizrun_track_figure(self, *args, **kwargs):
        __vizrun_figure_init(self, *args, **kwargs)
        __vizrun_created_figures.append(self)
    __vizrun_BaseFigure.__init__ = __vizrun_track_figure
except ImportError:
    pass
plt.show = lambda *args, **kwargs: None
)PY";

constexpr const char* kStaticDefaults = R"PY(plt.rcParams["figure.figsize"] = (10, 6)
plt.rcParams["figure.dpi"] = 100
)PY";

constexpr const char* kInteractiveDefaults = R"PY(try:
    pio.templates.default = "plotly_white"
except NameError:
    pass
)PY";

constexpr const char* k3dDefaults = R"PY(from mpl_toolkits.mplot3d import Axes3D
try:
    pio.templates.default = "plotly"
except NameError:
    pass
)PY";

// Shared helpers of both epilogues; defined inside __vizrun_capture.
constexpr const char* kEpilogueHelpers = R"PY(
# --- vizrun epilogue ---
def __vizrun_capture():
    path = __vizrun_os.environ["VIZRUN_ARTIFACT_PATH"]
    namespace = globals()

    def write_sentinel():
        with open(path, "w") as handle:
            handle.write("__VIZRUN_NO_ARTIFACT__")

    def find_plotly_figure():
        try:
            from plotly.basedatatypes import BaseFigure
        except ImportError:
            return None
        candidate = namespace.get("fig")
        if isinstance(candidate, BaseFigure):
            return candidate
        bound = [value for name, value in namespace.items()
                 if not name.startswith("__vizrun") and isinstance(value, BaseFigure)]
        # Newest figure still bound to a global name, whatever order the
        # names were first assigned in.
        for figure in reversed(__vizrun_created_figures):
            if any(figure is value for value in bound):
                return figure
        return bound[-1] if bound else None

    def current_matplotlib_figure():
        import matplotlib.pyplot as pyplot
        if not pyplot.get_fignums():
            return None
        figure = pyplot.gcf()
        if not figure.get_axes():
            return None
        return figure
)PY";

constexpr const char* kStaticCapture = R"PY(
    figure = current_matplotlib_figure()
    if figure is not None:
        figure.savefig(path, format="png", bbox_inches="tight")
        return
    plotly_figure = find_plotly_figure()
    if plotly_figure is not None:
        try:
            plotly_figure.write_image(path, format="png")
            return
        except Exception as error:
            print("vizrun: plotly static export unavailable: %s" % error, file=__vizrun_sys.stderr)
    write_sentinel()

__vizrun_capture()
)PY";

constexpr const char* kHtmlCapture = R"PY(
    plotly_figure = find_plotly_figure()
    if plotly_figure is not None:
        document = plotly_figure.to_html(include_plotlyjs=True, full_html=True)
        if not document.lstrip().lower().startswith("<!doctype"):
            document = "<!DOCTYPE html>\n" + document
        with open(path, "w", encoding="utf-8") as handle:
            handle.write(document)
        return
    figure = current_matplotlib_figure()
    if figure is not None:
        import base64
        import io
        buffer = io.BytesIO()
        figure.savefig(buffer, format="png", bbox_inches="tight")
        encoded = base64.b64encode(buffer.getvalue()).decode("ascii")
        with open(path, "w", encoding="utf-8") as handle:
            handle.write(
                "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\"></head>"
                "<body style=\"margin:0\"><img alt=\"plot\" style=\"max-width:100%\" "
                "src=\"data:image/png;base64," + encoded + "\"></body></html>\n")
        return
    write_sentinel()

__vizrun_capture()
)PY";

}  // namespace

PythonAdapter::PythonAdapter(std::string interpreter)
    : interpreter_(std::move(interpreter)) {}

AdaptedUnit PythonAdapter::BuildAdaptedUnit(const std::string& code, execution::VizType viz_type) const {
    AdaptedUnit unit{};
    unit.language = execution::Language::kPython;
    unit.viz_type = viz_type;
    unit.artifact_kind = viz_type == execution::VizType::kStatic
        ? execution::ArtifactKind::kImage
        : execution::ArtifactKind::kHtml;
    unit.command = {interpreter_, "-B"};
    unit.script_name = "main.py";
    unit.environment = {
        {"MPLBACKEND", "Agg"},
        {"PYTHONDONTWRITEBYTECODE", "1"},
        {"PYTHONUNBUFFERED", "1"},
        {"PYTHONHASHSEED", "0"}
    };
    unit.error_markers = {"Traceback (most recent call last):", "SyntaxError:"};
    unit.memory_markers = {"MemoryError", "Unable to allocate"};

    std::ostringstream source;
    source << kPreamble;
    switch (viz_type) {
        case execution::VizType::kStatic:
            source << kStaticDefaults;
            break;
        case execution::VizType::kInteractive:
            source << kInteractiveDefaults;
            break;
        case execution::VizType::k3d:
            source << k3dDefaults;
            break;
    }
    source << "# --- user code ---\n" << code;
    if (code.empty() || code.back() != '\n') {
        source << "\n";
    }
    source << kEpilogueHelpers;
    source << (unit.artifact_kind == execution::ArtifactKind::kImage ? kStaticCapture : kHtmlCapture);
    unit.source = source.str();
    return unit;
}

}  // namespace vizrun::adapters
