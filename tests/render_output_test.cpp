#include "fpsim/io_csv.hpp"
#include "fpsim/io_vtk.hpp"
#include "fpsim/render.hpp"
#include "fpsim/solver.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

std::vector<std::string> readLines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

fpsim::SnapshotSeries2D smallSeries2D() {
    fpsim::Config2D config{};
    config.driftX = [](double x, double) { return -x; };
    config.driftY = [](double, double y) { return -y; };
    config.diffusionX = [](double, double) { return 0.5; };
    config.diffusionY = [](double, double) { return 0.5; };
    config.xMin = -3.0;
    config.xMax = 3.0;
    config.yMin = -2.0;
    config.yMax = 2.0;
    config.nx = 12;
    config.ny = 8;
    fpsim::FokkerPlanck2D engine(config);
    fpsim::RunOptions options{};
    options.totalTime = 0.2;
    options.steps = 40;
    options.sampleStride = 10;
    return engine.run(options);
}

fpsim::SnapshotSeries1D smallSeries1D() {
    fpsim::Config1D config{};
    config.drift = [](double x) { return -0.2 * x * x * x; };
    config.diffusion = [](double) { return 0.5; };
    config.nx = 30;
    fpsim::FokkerPlanck1D engine(config);
    fpsim::RunOptions options{};
    options.totalTime = 0.1;
    options.sampleStride = 5;
    return engine.run(options);
}

}  // namespace

int main() {
    using namespace fpsim;
    namespace fs = std::filesystem;
    using nlohmann::json;

    const fs::path outDir = fs::path("outputs") / "render_output_test";
    fs::remove_all(outDir);

    const SnapshotSeries2D series2d = smallSeries2D();
    const SnapshotSeries1D series1d = smallSeries1D();
    if (series2d.snapshots.size() != 5) {
        std::cerr << "Expected 5 snapshots for 40 steps at stride 10, got " << series2d.snapshots.size() << '\n';
        return 1;
    }

    // CSV: long-format density, mass history and marginals.
    {
        CsvSeriesRenderer csv((outDir / "density2d.csv").string(), (outDir / "mass2d.csv").string(),
                              (outDir / "marginals2d.csv").string());
        (void)csv.render(series2d);

        const auto density = readLines(outDir / "density2d.csv");
        const std::size_t expectedRows = 1 + series2d.snapshots.size() * series2d.grid.size();
        if (density.size() != expectedRows || density.front() != "time,x,y,density") {
            std::cerr << "density2d.csv has " << density.size() << " lines, expected " << expectedRows << '\n';
            return 1;
        }
        const auto mass = readLines(outDir / "mass2d.csv");
        if (mass.size() != 1 + series2d.snapshots.size() || mass.front() != "time,mass") {
            std::cerr << "mass2d.csv malformed\n";
            return 1;
        }
        const auto marginals = readLines(outDir / "marginals2d.csv");
        const std::size_t expectedMarginals =
            1 + series2d.snapshots.size() * (series2d.grid.nx + series2d.grid.ny);
        if (marginals.size() != expectedMarginals || marginals.front() != "time,axis,coordinate,density") {
            std::cerr << "marginals2d.csv has " << marginals.size() << " lines, expected " << expectedMarginals
                      << '\n';
            return 1;
        }

        CsvSeriesRenderer csv1d((outDir / "density1d.csv").string(), "", "");
        (void)csv1d.render(series1d);
        const auto density1d = readLines(outDir / "density1d.csv");
        if (density1d.size() != 1 + series1d.snapshots.size() * series1d.x.size() ||
            density1d.front() != "time,x,density") {
            std::cerr << "density1d.csv malformed\n";
            return 1;
        }
    }

    // VTK: one .vti per snapshot plus the .pvd collection that references them.
    {
        VtkSeriesRenderer vtk((outDir / "vtk").string(), "fp2d");
        (void)vtk.render(series2d);
        const fs::path pvd = outDir / "vtk" / "fp2d.pvd";
        if (!fs::exists(pvd)) {
            std::cerr << "PVD collection missing\n";
            return 1;
        }
        const std::string collection = readFile(pvd);
        for (std::size_t k = 0; k < series2d.snapshots.size(); ++k) {
            const std::string name = "fp2d_000" + std::to_string(k) + ".vti";
            if (!fs::exists(outDir / "vtk" / name) || collection.find(name) == std::string::npos) {
                std::cerr << "Missing VTK frame " << name << '\n';
                return 1;
            }
        }
        const std::string frame = readFile(outDir / "vtk" / "fp2d_0000.vti");
        if (frame.find("WholeExtent=\"0 12 0 8 0 0\"") == std::string::npos ||
            frame.find("Name=\"density\"") == std::string::npos) {
            std::cerr << "VTK frame header does not describe a 12x8 cell field\n";
            return 1;
        }

        const std::string pvd1d = write_vtk_series((outDir / "vtk1d").string(), "fp1d", series1d);
        if (!fs::exists(pvd1d) || !fs::exists(outDir / "vtk1d" / "fp1d_0000.vti")) {
            std::cerr << "1D VTK series missing\n";
            return 1;
        }
    }

    // HTML: the embedded figure is valid JSON with one frame per snapshot.
    {
        const json figure2d = json::parse(plotlyFigureJson(series2d, AnimationOptions{}));
        if (figure2d.at("frames").size() != series2d.snapshots.size() || figure2d.at("data").size() != 3) {
            std::cerr << "2D figure should have 3 traces and one frame per snapshot\n";
            return 1;
        }
        const json& z = figure2d.at("data").at(0).at("z");
        if (z.size() != series2d.grid.ny || z.at(0).size() != series2d.grid.nx) {
            std::cerr << "Heatmap rows must follow y and columns x\n";
            return 1;
        }
        const json& marginal = figure2d.at("data").at(1).at("y");
        double marginalMass = 0.0;
        for (const auto& value : marginal) {
            marginalMass += value.get<double>() * series2d.grid.dx;
        }
        if (std::abs(marginalMass - series2d.snapshots.front().mass) > 1e-9) {
            std::cerr << "p(x) trace does not integrate to the snapshot mass\n";
            return 1;
        }

        const json figure1d = json::parse(plotlyFigureJson(series1d, AnimationOptions{}));
        if (figure1d.at("frames").size() != series1d.snapshots.size() ||
            figure1d.at("layout").at("sliders").at(0).at("steps").size() != series1d.snapshots.size()) {
            std::cerr << "1D figure frames or slider steps do not match the snapshots\n";
            return 1;
        }

        HtmlAnimationRenderer html((outDir / "anim" / "fp2d.html").string(), AnimationOptions{});
        (void)html.render(series2d);
        const std::string page = readFile(outDir / "anim" / "fp2d.html");
        if (page.find("Plotly.newPlot") == std::string::npos || page.find("\"frames\"") == std::string::npos) {
            std::cerr << "HTML page does not embed the animated figure\n";
            return 1;
        }
    }

    std::cout << "Renderer outputs written under " << outDir.string() << '\n';
    return 0;
}
