#include "adapters/r_adapter.hpp"

#include <sstream>
#include <utility>

namespace vizrun::adapters {
namespace {

constexpr const char* kPreamble = R"R(# --- vizrun preamble ---
options(warn = 1, browser = function(url) invisible(NULL), viewer = NULL)
.vizrun_optional <- function(pkg) {
  if (requireNamespace(pkg, quietly = TRUE)) {
    suppressPackageStartupMessages(library(pkg, character.only = TRUE))
  }
}
)R";

// Base graphics land on an off-screen png device with a display list, so the
// epilogue can tell whether anything was drawn.
constexpr const char* kStaticDefaults = R"R(suppressPackageStartupMessages(library(ggplot2))
.vizrun_optional("plotly")
ggplot2::theme_set(ggplot2::theme_minimal())
.vizrun_base_png <- file.path(tempdir(), "vizrun_base.png")
grDevices::png(.vizrun_base_png, width = 1000, height = 600, res = 100)
grDevices::dev.control("enable")
)R";

// plotly covers both 2-D and 3-D widgets.
constexpr const char* kInteractiveDefaults = R"R(suppressPackageStartupMessages({
  library(plotly)
  library(htmlwidgets)
})
.vizrun_optional("ggplot2")
grDevices::pdf(NULL)
)R";

constexpr const char* kEpilogueHelpers = R"R(
# --- vizrun epilogue ---
.vizrun_path <- Sys.getenv("VIZRUN_ARTIFACT_PATH")
.vizrun_sentinel <- function() {
  writeLines("__VIZRUN_NO_ARTIFACT__", .vizrun_path)
}
.vizrun_find <- function(predicate) {
  env <- globalenv()
  if (exists("p", envir = env, inherits = FALSE)) {
    candidate <- get("p", envir = env)
    if (predicate(candidate)) {
      return(candidate)
    }
  }
  for (name in ls(env)) {
    candidate <- get(name, envir = env)
    if (predicate(candidate)) {
      return(candidate)
    }
  }
  NULL
}
.vizrun_last_ggplot <- function() {
  plot <- .vizrun_find(function(x) inherits(x, "ggplot"))
  if (is.null(plot) && requireNamespace("ggplot2", quietly = TRUE)) {
    plot <- ggplot2::last_plot()
  }
  plot
}
)R";

constexpr const char* kStaticCapture = R"R(
.vizrun_capture <- function() {
  plot <- .vizrun_last_ggplot()
  if (!is.null(plot)) {
    ggplot2::ggsave(.vizrun_path, plot = plot, device = "png", width = 10, height = 6, dpi = 100)
    return(invisible(NULL))
  }
  recorded <- tryCatch(grDevices::recordPlot(), error = function(e) NULL)
  if (!is.null(recorded) && length(recorded[[1]]) > 0) {
    grDevices::dev.off()
    file.copy(.vizrun_base_png, .vizrun_path, overwrite = TRUE)
    return(invisible(NULL))
  }
  if (file.exists(.vizrun_base_png) && file.info(.vizrun_base_png)$size > 0) {
    file.copy(.vizrun_base_png, .vizrun_path, overwrite = TRUE)
    return(invisible(NULL))
  }
  .vizrun_sentinel()
}
.vizrun_capture()
)R";

constexpr const char* kHtmlCapture = R"R(
.vizrun_capture <- function() {
  widget <- .vizrun_find(function(x) inherits(x, "htmlwidget"))
  if (is.null(widget)) {
    plot <- .vizrun_last_ggplot()
    if (!is.null(plot)) {
      widget <- plotly::ggplotly(plot)
    }
  }
  if (is.null(widget)) {
    .vizrun_sentinel()
    return(invisible(NULL))
  }
  htmlwidgets::saveWidget(
    widget = widget,
    file = .vizrun_path,
    selfcontained = TRUE,
    libdir = file.path(tempdir(), "vizrun_lib"))
  invisible(NULL)
}
.vizrun_capture()
)R";

}  // namespace

RAdapter::RAdapter(std::string interpreter)
    : interpreter_(std::move(interpreter)) {}

AdaptedUnit RAdapter::BuildAdaptedUnit(const std::string& code, execution::VizType viz_type) const {
    AdaptedUnit unit{};
    unit.language = execution::Language::kR;
    unit.viz_type = viz_type;
    unit.artifact_kind = viz_type == execution::VizType::kStatic
        ? execution::ArtifactKind::kImage
        : execution::ArtifactKind::kHtml;
    unit.command = {interpreter_, "--no-save", "--no-restore"};
    unit.script_name = "main.R";
    unit.environment = {
        {"R_BROWSER", "false"},
        {"R_INTERACTIVE_DEVICE", "pdf"}
    };
    unit.error_markers = {"Execution halted", "Error in ", "Error:"};
    unit.memory_markers = {"cannot allocate vector of size", "cannot allocate memory", "memory exhausted"};

    std::ostringstream source;
    source << kPreamble;
    switch (viz_type) {
        case execution::VizType::kStatic:
            source << kStaticDefaults;
            break;
        case execution::VizType::kInteractive:
        case execution::VizType::k3d:
            source << kInteractiveDefaults;
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
