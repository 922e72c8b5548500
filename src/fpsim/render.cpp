#include "fpsim/render.hpp"

#include "fpsim/io_csv.hpp"
#include "fpsim/io_vtk.hpp"
#include "fpsim/stability.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace fpsim {
namespace {

using nlohmann::json;

std::string frameName(double time) {
    std::ostringstream oss;
    oss << "t=" << std::fixed << std::setprecision(3) << time;
    return oss.str();
}

std::string sliderLabel(double time) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << time;
    return oss.str();
}

// Rows of z are y, columns x, matching Plotly's heatmap convention.
json heatmapRows(const Grid2D& grid, const std::vector<double>& density) {
    json rows = json::array();
    for (std::size_t j = 0; j < grid.ny; ++j) {
        json row = json::array();
        for (std::size_t i = 0; i < grid.nx; ++i) {
            row.push_back(density[grid.idx(i, j)]);
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

json playPauseMenu(int frameDurationMs) {
    json play = {{"label", "Play"},
                 {"method", "animate"},
                 {"args",
                  {nullptr,
                   {{"frame", {{"duration", frameDurationMs}, {"redraw", true}}},
                    {"fromcurrent", true},
                    {"transition", {{"duration", 0}}}}}}};
    json pause = {{"label", "Pause"},
                  {"method", "animate"},
                  {"args",
                   {json::array({nullptr}),
                    {{"frame", {{"duration", 0}, {"redraw", false}}},
                     {"mode", "immediate"},
                     {"transition", {{"duration", 0}}}}}}};
    return json::array({{{"type", "buttons"}, {"buttons", {play, pause}}}});
}

json timeSlider(const std::vector<double>& times) {
    json steps = json::array();
    for (const double t : times) {
        steps.push_back({{"method", "animate"},
                         {"label", sliderLabel(t)},
                         {"args",
                          {json::array({frameName(t)}),
                           {{"mode", "immediate"},
                            {"frame", {{"duration", 0}, {"redraw", true}}},
                            {"transition", {{"duration", 0}}}}}}});
    }
    return json::array({{{"steps", steps},
                         {"transition", {{"duration", 0}}},
                         {"x", 0.1},
                         {"xanchor", "left"},
                         {"y", -0.2},
                         {"yanchor", "top"}}});
}

void ensureParentDirectory(const std::string& path) {
    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
}

}  // namespace

std::string plotlyFigureJson(const SnapshotSeries1D& series, const AnimationOptions& options) {
    if (series.snapshots.empty()) {
        throw std::invalid_argument("plotlyFigureJson: series has no snapshots");
    }

    const std::string title = options.title.empty() ? "Fokker-Planck Evolution" : options.title;
    json figure;
    figure["data"] = json::array(
        {{{"type", "scatter"}, {"mode", "lines"}, {"x", series.x}, {"y", series.snapshots.front().density}}});

    double yMax = 0.0;
    for (const auto& snap : series.snapshots) {
        yMax = std::max(yMax, maxValue(snap.density));
    }

    figure["layout"] = {{"title", {{"text", title}}},
                        {"xaxis", {{"title", {{"text", "x"}}}}},
                        {"yaxis", {{"title", {{"text", "p(x,t)"}}}, {"range", {0.0, 1.05 * yMax}}}},
                        {"updatemenus", playPauseMenu(options.frameDurationMs)},
                        {"sliders", timeSlider(series.times())}};

    json frames = json::array();
    for (const auto& snap : series.snapshots) {
        frames.push_back({{"name", frameName(snap.time)},
                          {"data", json::array({{{"type", "scatter"},
                                                 {"mode", "lines"},
                                                 {"x", series.x},
                                                 {"y", snap.density}}})}});
    }
    figure["frames"] = std::move(frames);
    return figure.dump();
}

std::string plotlyFigureJson(const SnapshotSeries2D& series, const AnimationOptions& options) {
    if (series.snapshots.empty()) {
        throw std::invalid_argument("plotlyFigureJson: series has no snapshots");
    }

    const Grid2D& grid = series.grid;
    const std::string title =
        options.title.empty() ? "Fokker-Planck 2D: p(x,y,t) with Marginals" : options.title;

    double zMax = 0.0;
    for (const auto& snap : series.snapshots) {
        zMax = std::max(zMax, maxValue(snap.density));
    }

    const Snapshot2D& first = series.snapshots.front();
    json figure;
    figure["data"] = json::array({{{"type", "heatmap"},
                                   {"x", series.x},
                                   {"y", series.y},
                                   {"z", heatmapRows(grid, first.density)},
                                   {"zmin", 0.0},
                                   {"zmax", zMax},
                                   {"colorscale", options.colorscale},
                                   {"colorbar", {{"title", {{"text", "p(x,y)"}}}, {"x", 0.46}}},
                                   {"xaxis", "x"},
                                   {"yaxis", "y"}},
                                  {{"type", "scatter"},
                                   {"mode", "lines"},
                                   {"name", "p(x,t)"},
                                   {"x", series.x},
                                   {"y", marginalX(grid, first.density)},
                                   {"xaxis", "x2"},
                                   {"yaxis", "y2"}},
                                  {{"type", "scatter"},
                                   {"mode", "lines"},
                                   {"name", "p(y,t)"},
                                   {"x", series.y},
                                   {"y", marginalY(grid, first.density)},
                                   {"xaxis", "x3"},
                                   {"yaxis", "y3"}}});

    figure["layout"] = {{"title", {{"text", title}}},
                        {"xaxis", {{"domain", {0.0, 0.42}}, {"title", {{"text", "x"}}}}},
                        {"yaxis", {{"anchor", "x"}, {"title", {{"text", "y"}}}}},
                        {"xaxis2", {{"domain", {0.52, 0.74}}, {"anchor", "y2"}, {"title", {{"text", "x"}}}}},
                        {"yaxis2", {{"anchor", "x2"}, {"title", {{"text", "p(x,t)"}}}}},
                        {"xaxis3", {{"domain", {0.8, 1.0}}, {"anchor", "y3"}, {"title", {{"text", "y"}}}}},
                        {"yaxis3", {{"anchor", "x3"}, {"title", {{"text", "p(y,t)"}}}}},
                        {"showlegend", false},
                        {"updatemenus", playPauseMenu(options.frameDurationMs)},
                        {"sliders", timeSlider(series.times())}};

    // Frames only replace z and the marginal y values of the three traces.
    json frames = json::array();
    for (const auto& snap : series.snapshots) {
        frames.push_back({{"name", frameName(snap.time)},
                          {"data",
                           json::array({{{"type", "heatmap"}, {"z", heatmapRows(grid, snap.density)}},
                                        {{"type", "scatter"}, {"y", marginalX(grid, snap.density)}},
                                        {{"type", "scatter"}, {"y", marginalY(grid, snap.density)}}})},
                          {"traces", {0, 1, 2}}});
    }
    figure["frames"] = std::move(frames);
    return figure.dump();
}

HtmlAnimationRenderer::HtmlAnimationRenderer(std::string path, AnimationOptions options)
    : path_(std::move(path)), options_(std::move(options)) {
    if (path_.empty()) {
        throw std::invalid_argument("HtmlAnimationRenderer: output path must not be empty");
    }
}

std::string HtmlAnimationRenderer::render(const SnapshotSeries1D& series) {
    const std::string title = options_.title.empty() ? "Fokker-Planck Evolution" : options_.title;
    writeDocument(plotlyFigureJson(series, options_), title);
    return "wrote " + std::to_string(series.snapshots.size()) + " animation frames to " + path_;
}

std::string HtmlAnimationRenderer::render(const SnapshotSeries2D& series) {
    const std::string title = options_.title.empty() ? "Fokker-Planck 2D" : options_.title;
    writeDocument(plotlyFigureJson(series, options_), title);
    return "wrote " + std::to_string(series.snapshots.size()) + " animation frames to " + path_;
}

void HtmlAnimationRenderer::writeDocument(const std::string& figureJson, const std::string& title) const {
    ensureParentDirectory(path_);
    std::ofstream ofs(path_);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open HTML output: " + path_);
    }

    ofs << "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n";
    ofs << "<title>" << title << "</title>\n";
    ofs << "<script src=\"" << options_.plotlyScriptUrl << "\"></script>\n";
    ofs << "</head>\n<body>\n";
    ofs << "<div id=\"fpsim-plot\" style=\"width:100%;height:90vh;\"></div>\n";
    ofs << "<script>\n";
    ofs << "const figure = " << figureJson << ";\n";
    ofs << "Plotly.newPlot('fpsim-plot', figure.data, figure.layout).then(function () {\n";
    ofs << "  Plotly.addFrames('fpsim-plot', figure.frames);\n";
    ofs << "});\n";
    ofs << "</script>\n</body>\n</html>\n";
    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed while writing HTML output: " + path_);
    }
}

VtkSeriesRenderer::VtkSeriesRenderer(std::string directory, std::string basename)
    : directory_(std::move(directory)), basename_(std::move(basename)) {
    if (directory_.empty() || basename_.empty()) {
        throw std::invalid_argument("VtkSeriesRenderer: directory and basename must not be empty");
    }
}

std::string VtkSeriesRenderer::render(const SnapshotSeries1D& series) {
    const std::string pvd = write_vtk_series(directory_, basename_, series);
    return "wrote " + std::to_string(series.snapshots.size()) + " VTK timesteps to " + pvd;
}

std::string VtkSeriesRenderer::render(const SnapshotSeries2D& series) {
    const std::string pvd = write_vtk_series(directory_, basename_, series);
    return "wrote " + std::to_string(series.snapshots.size()) + " VTK timesteps to " + pvd;
}

CsvSeriesRenderer::CsvSeriesRenderer(std::string densityPath, std::string massHistoryPath, std::string marginalsPath)
    : densityPath_(std::move(densityPath)), massHistoryPath_(std::move(massHistoryPath)),
      marginalsPath_(std::move(marginalsPath)) {}

std::string CsvSeriesRenderer::render(const SnapshotSeries1D& series) {
    std::ostringstream summary;
    if (!densityPath_.empty()) {
        ensureParentDirectory(densityPath_);
        write_csv_series(densityPath_, series);
        summary << "density series to " << densityPath_ << ' ';
    }
    if (!massHistoryPath_.empty()) {
        ensureParentDirectory(massHistoryPath_);
        write_csv_mass_history(massHistoryPath_, series.times(), series.masses());
        summary << "mass history to " << massHistoryPath_ << ' ';
    }
    const std::string text = summary.str();
    return text.empty() ? "nothing requested" : "wrote " + text.substr(0, text.size() - 1);
}

std::string CsvSeriesRenderer::render(const SnapshotSeries2D& series) {
    std::ostringstream summary;
    if (!densityPath_.empty()) {
        ensureParentDirectory(densityPath_);
        write_csv_series(densityPath_, series);
        summary << "density series to " << densityPath_ << ' ';
    }
    if (!massHistoryPath_.empty()) {
        ensureParentDirectory(massHistoryPath_);
        write_csv_mass_history(massHistoryPath_, series.times(), series.masses());
        summary << "mass history to " << massHistoryPath_ << ' ';
    }
    if (!marginalsPath_.empty()) {
        ensureParentDirectory(marginalsPath_);
        write_csv_marginals(marginalsPath_, series);
        summary << "marginals to " << marginalsPath_ << ' ';
    }
    const std::string text = summary.str();
    return text.empty() ? "nothing requested" : "wrote " + text.substr(0, text.size() - 1);
}

}  // namespace fpsim
