#include "server/sample_catalog.hpp"

namespace vizrun::server {
namespace {

constexpr const char* kPythonStatic = R"PY(import numpy as np

x = np.linspace(0, 10, 100)
y = np.sin(x)

plt.figure(figsize=(10, 6))
plt.plot(x, y, 'b-', label='sin(x)')
plt.title('Static Plot Example')
plt.xlabel('x')
plt.ylabel('sin(x)')
plt.grid(True)
plt.legend())PY";

constexpr const char* kPythonInteractive = R"PY(import numpy as np

x = np.linspace(0, 10, 100)
y = np.sin(x)

fig = px.line(x=x, y=y, title='Interactive Plot Example')
fig.update_layout(
    xaxis_title='x',
    yaxis_title='sin(x)',
    showlegend=True
))PY";

constexpr const char* kPython3d = R"PY(import numpy as np

x = np.linspace(-5, 5, 50)
y = np.linspace(-5, 5, 50)
X, Y = np.meshgrid(x, y)
Z = np.sin(np.sqrt(X**2 + Y**2))

fig = go.Figure(data=[go.Surface(z=Z, x=x, y=y)])
fig.update_layout(
    title='3D Surface Plot',
    scene=dict(
        xaxis_title='X',
        yaxis_title='Y',
        zaxis_title='Z'
    )
))PY";

constexpr const char* kRStatic = R"R(x <- seq(0, 10, length.out = 100)
y <- sin(x)
df <- data.frame(x = x, y = y)

p <- ggplot(df, aes(x = x, y = y)) +
  geom_line(color = "blue") +
  labs(title = "Static Plot Example",
       x = "x",
       y = "sin(x)") +
  theme_minimal())R";

constexpr const char* kRInteractive = R"R(x <- seq(0, 10, length.out = 100)
y <- sin(x)
df <- data.frame(x = x, y = y)

p <- plot_ly(data = df, x = ~x, y = ~y, type = 'scatter', mode = 'lines')
p$x$layout <- list(
  title = 'Interactive Plot Example',
  xaxis = list(title = 'x'),
  yaxis = list(title = 'sin(x)'),
  width = 800,
  height = 600
))R";

constexpr const char* kR3d = R"R(library(plotly)

x <- seq(-5, 5, length.out = 50)
y <- seq(-5, 5, length.out = 50)
grid <- expand.grid(x = x, y = y)
grid$z <- sin(sqrt(grid$x^2 + grid$y^2))

z_matrix <- matrix(grid$z, nrow = 50, ncol = 50)
x_vec <- unique(grid$x)
y_vec <- unique(grid$y)

p <- plot_ly(type = 'surface',
            x = x_vec,
            y = y_vec,
            z = z_matrix,
            colorscale = 'Viridis')
p$x$layout <- list(
  title = '3D Surface Plot',
  scene = list(
    xaxis = list(title = 'X'),
    yaxis = list(title = 'Y'),
    zaxis = list(title = 'Z')
  ),
  width = 800,
  height = 600
))R";

}  // namespace

const std::vector<SampleSnippet>& SampleSnippets() {
    using execution::Language;
    using execution::VizType;
    static const std::vector<SampleSnippet> kSnippets = {
        {Language::kPython, VizType::kStatic, kPythonStatic},
        {Language::kPython, VizType::kInteractive, kPythonInteractive},
        {Language::kPython, VizType::k3d, kPython3d},
        {Language::kR, VizType::kStatic, kRStatic},
        {Language::kR, VizType::kInteractive, kRInteractive},
        {Language::kR, VizType::k3d, kR3d},
    };
    return kSnippets;
}

}  // namespace vizrun::server
