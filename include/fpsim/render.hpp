// filename: render.hpp
// part of Fokker-Planck FVM Simulator
// MIT License

#pragma once

#include <string>

#include "fpsim/solver.hpp"

namespace fpsim {

/**
 * @brief Consumer of a finalised snapshot series. Renderers only read the series; they have
 *        no access to the engine that produced it.
 */
class SeriesRenderer {
public:
    virtual ~SeriesRenderer() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    // Each call returns a short human-readable description of what was written.
    virtual std::string render(const SnapshotSeries1D& series) = 0;
    virtual std::string render(const SnapshotSeries2D& series) = 0;
};

struct AnimationOptions {
    std::string title;
    std::string colorscale{"Viridis"};
    int frameDurationMs{50};
    std::string plotlyScriptUrl{"https://cdn.plot.ly/plotly-2.35.2.min.js"};
};

/**
 * @brief Plotly figure (data, layout, frames) for a 1D series: one line trace animated over
 *        the snapshots with play/pause buttons and a time slider.
 */
std::string plotlyFigureJson(const SnapshotSeries1D& series, const AnimationOptions& options);

/**
 * @brief Plotly figure for a 2D series: heatmap of p(x, y, t) beside the marginals p(x, t) and
 *        p(y, t). The colour range is fixed to [0, max over all snapshots].
 */
std::string plotlyFigureJson(const SnapshotSeries2D& series, const AnimationOptions& options);

class HtmlAnimationRenderer : public SeriesRenderer {
public:
    HtmlAnimationRenderer(std::string path, AnimationOptions options);

    [[nodiscard]] std::string name() const override { return "html"; }
    std::string render(const SnapshotSeries1D& series) override;
    std::string render(const SnapshotSeries2D& series) override;

private:
    void writeDocument(const std::string& figureJson, const std::string& title) const;

    std::string path_;
    AnimationOptions options_;
};

class VtkSeriesRenderer : public SeriesRenderer {
public:
    VtkSeriesRenderer(std::string directory, std::string basename);

    [[nodiscard]] std::string name() const override { return "vtk"; }
    std::string render(const SnapshotSeries1D& series) override;
    std::string render(const SnapshotSeries2D& series) override;

private:
    std::string directory_;
    std::string basename_;
};

/**
 * @brief CSV exports. Empty paths are skipped; marginals only apply to 2D series.
 */
class CsvSeriesRenderer : public SeriesRenderer {
public:
    CsvSeriesRenderer(std::string densityPath, std::string massHistoryPath, std::string marginalsPath);

    [[nodiscard]] std::string name() const override { return "csv"; }
    std::string render(const SnapshotSeries1D& series) override;
    std::string render(const SnapshotSeries2D& series) override;

private:
    std::string densityPath_;
    std::string massHistoryPath_;
    std::string marginalsPath_;
};

}  // namespace fpsim
