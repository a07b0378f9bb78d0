#include <algorithm>

#include <gtest/gtest.h>

#include "adapters/adapter_registry.hpp"
#include "adapters/python_adapter.hpp"
#include "adapters/r_adapter.hpp"

namespace vizrun::adapters {
namespace {

using execution::ArtifactKind;
using execution::Language;
using execution::VizType;

bool HasEnv(const AdaptedUnit& unit, const std::string& key, const std::string& value) {
    return std::find(unit.environment.begin(), unit.environment.end(),
                     std::make_pair(key, value)) != unit.environment.end();
}

TEST(RequestParsingTest, LanguageAndVizTypeAreCaseInsensitive) {
    EXPECT_EQ(execution::ParseLanguage(" Python "), Language::kPython);
    EXPECT_EQ(execution::ParseLanguage("R"), Language::kR);
    EXPECT_FALSE(execution::ParseLanguage("julia").has_value());
    EXPECT_EQ(execution::ParseVizType("3D"), VizType::k3d);
    EXPECT_EQ(execution::ParseVizType("Interactive"), VizType::kInteractive);
    EXPECT_FALSE(execution::ParseVizType("animated").has_value());
}

TEST(PythonAdapterTest, StaticUnitProducesImage) {
    PythonAdapter adapter("python3");
    const std::string code = "plt.plot([1, 2, 3])";

    const auto unit = adapter.BuildAdaptedUnit(code, VizType::kStatic);

    EXPECT_EQ(unit.language, Language::kPython);
    EXPECT_EQ(unit.artifact_kind, ArtifactKind::kImage);
    ASSERT_FALSE(unit.command.empty());
    EXPECT_EQ(unit.command.front(), "python3");
    EXPECT_EQ(unit.script_name, "main.py");
    EXPECT_TRUE(HasEnv(unit, "MPLBACKEND", "Agg"));
    EXPECT_NE(unit.source.find("matplotlib.use(\"Agg\")"), std::string::npos);
    EXPECT_NE(unit.source.find("savefig(path, format=\"png\""), std::string::npos);
    EXPECT_EQ(unit.source.find("to_html("), std::string::npos);
}

TEST(PythonAdapterTest, UserCodeSitsVerbatimBetweenPreambleAndEpilogue) {
    PythonAdapter adapter("python3");
    const std::string code = "fig = px.line(x=[1, 2], y=[3, 4])\nprint('  indented\\tkept')";

    const auto unit = adapter.BuildAdaptedUnit(code, VizType::kInteractive);

    const auto preamble = unit.source.find("import matplotlib.pyplot as plt");
    const auto user = unit.source.find(code);
    const auto epilogue = unit.source.find("def __vizrun_capture");
    ASSERT_NE(preamble, std::string::npos);
    ASSERT_NE(user, std::string::npos);
    ASSERT_NE(epilogue, std::string::npos);
    EXPECT_LT(preamble, user);
    EXPECT_LT(user, epilogue);
}

TEST(PythonAdapterTest, InteractiveAnd3dProduceHtml) {
    PythonAdapter adapter("python3");

    const auto interactive = adapter.BuildAdaptedUnit("fig = None", VizType::kInteractive);
    const auto three_d = adapter.BuildAdaptedUnit("fig = None", VizType::k3d);

    EXPECT_EQ(interactive.artifact_kind, ArtifactKind::kHtml);
    EXPECT_EQ(three_d.artifact_kind, ArtifactKind::kHtml);
    EXPECT_NE(interactive.source.find("include_plotlyjs=True"), std::string::npos);
    EXPECT_NE(interactive.source.find("plotly_white"), std::string::npos);
    EXPECT_NE(three_d.source.find("mpl_toolkits.mplot3d"), std::string::npos);
}

TEST(PythonAdapterTest, PlotlyFiguresAreTrackedByCreation) {
    PythonAdapter adapter("python3");
    const auto unit = adapter.BuildAdaptedUnit("fig = None", VizType::kInteractive);

    const auto hook = unit.source.find("__vizrun_BaseFigure.__init__ = __vizrun_track_figure");
    const auto user = unit.source.find("# --- user code ---");
    ASSERT_NE(hook, std::string::npos);
    EXPECT_LT(hook, user);
    EXPECT_NE(unit.source.find("reversed(__vizrun_created_figures)"), std::string::npos);
    EXPECT_EQ(unit.source.find("reversed(list(namespace))"), std::string::npos);
}

TEST(PythonAdapterTest, BuildIsDeterministic) {
    PythonAdapter adapter("python3");
    const auto first = adapter.BuildAdaptedUnit("x = 1", VizType::kStatic);
    const auto second = adapter.BuildAdaptedUnit("x = 1", VizType::kStatic);
    EXPECT_EQ(first.source, second.source);
    EXPECT_EQ(first.command, second.command);
}

TEST(PythonAdapterTest, EpilogueWritesSentinelWhenNothingRendered) {
    PythonAdapter adapter("python3");
    const auto unit = adapter.BuildAdaptedUnit("x = 1", VizType::kStatic);
    EXPECT_NE(unit.source.find(kNoArtifactSentinel), std::string::npos);
    EXPECT_NE(unit.source.find(kArtifactPathEnv), std::string::npos);
}

TEST(RAdapterTest, StaticUnitUsesPngDeviceAndGgsave) {
    RAdapter adapter("Rscript");

    const auto unit = adapter.BuildAdaptedUnit("p <- ggplot(df, aes(x, y)) + geom_line()", VizType::kStatic);

    EXPECT_EQ(unit.language, Language::kR);
    EXPECT_EQ(unit.artifact_kind, ArtifactKind::kImage);
    EXPECT_EQ(unit.command.front(), "Rscript");
    EXPECT_EQ(unit.script_name, "main.R");
    EXPECT_NE(unit.source.find("grDevices::png("), std::string::npos);
    EXPECT_NE(unit.source.find("ggplot2::ggsave"), std::string::npos);
    EXPECT_NE(unit.source.find(kNoArtifactSentinel), std::string::npos);
}

TEST(RAdapterTest, InteractiveUnitSavesSelfContainedWidget) {
    RAdapter adapter("Rscript");

    const auto unit = adapter.BuildAdaptedUnit("p <- plot_ly(x = 1:3, y = 1:3)", VizType::kInteractive);

    EXPECT_EQ(unit.artifact_kind, ArtifactKind::kHtml);
    EXPECT_NE(unit.source.find("library(plotly)"), std::string::npos);
    EXPECT_NE(unit.source.find("selfcontained = TRUE"), std::string::npos);
    EXPECT_NE(unit.source.find("plotly::ggplotly"), std::string::npos);
}

TEST(RAdapterTest, ErrorMarkersRecognizeHaltedScripts) {
    RAdapter adapter("Rscript");
    const auto unit = adapter.BuildAdaptedUnit("stop('x')", VizType::k3d);
    EXPECT_NE(std::find(unit.error_markers.begin(), unit.error_markers.end(), "Execution halted"),
              unit.error_markers.end());
    EXPECT_FALSE(unit.memory_markers.empty());
}

TEST(AdapterRegistryTest, RegistersOnlyEnabledRuntimes) {
    config::RuntimesConfig runtimes;
    runtimes.r.enabled = false;

    const auto registry = CreateDefaultRegistry(runtimes);

    EXPECT_TRUE(registry.Has(Language::kPython));
    EXPECT_FALSE(registry.Has(Language::kR));
    EXPECT_EQ(registry.Get(Language::kR), nullptr);
    ASSERT_NE(registry.Get(Language::kPython), nullptr);
    EXPECT_EQ(registry.Get(Language::kPython)->GetLanguage(), Language::kPython);
    EXPECT_EQ(registry.List().size(), 1u);
}

TEST(AdapterRegistryTest, ConfiguredCommandReachesUnit) {
    config::RuntimesConfig runtimes;
    runtimes.r.command = "/opt/R/bin/Rscript";

    const auto registry = CreateDefaultRegistry(runtimes);
    const auto unit = registry.Get(Language::kR)->BuildAdaptedUnit("plot(1)", VizType::kStatic);

    EXPECT_EQ(unit.command.front(), "/opt/R/bin/Rscript");
}

}  // namespace
}  // namespace vizrun::adapters
