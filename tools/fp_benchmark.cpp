// filename: fp_benchmark.cpp
// part of Fokker-Planck FVM Simulator
// MIT License

#include "fpsim/fpsim.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct BenchmarkConfig {
    int dimension{2};
    std::size_t nx{200};
    std::size_t ny{200};
    double extent{5.0};
    double diffusion{0.5};
    double totalTime{0.5};
    std::size_t repeats{3};
    std::string boundary{"reflecting"};
    bool ito{false};
    bool writeCsv{false};
    std::string csvPath{};
};

void printUsage() {
    std::cout << "fp_benchmark options:\n"
              << "  --dim {1|2}            Engine dimension (default 2)\n"
              << "  --nx <int>             Number of cells in x-direction (default 200)\n"
              << "  --ny <int>             Number of cells in y-direction (default 200, 2D only)\n"
              << "  --extent <float>       Half-width of the square domain (default 5)\n"
              << "  --diffusion <float>    Constant diffusion coefficient (default 0.5)\n"
              << "  --time <float>         Simulated time per repeat (default 0.5)\n"
              << "  --boundary <kind>      reflecting, absorbing or periodic (default reflecting)\n"
              << "  --ito                  Use the Ito diffusion form\n"
              << "  --repeats <int>        Number of benchmark repeats (default 3)\n"
              << "  --csv <path>           Append benchmark results to CSV file\n"
              << "  --help                 Show this message\n";
}

bool parseArgs(int argc, char** argv, BenchmarkConfig& cfg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if (arg == "--help") {
                printUsage();
                return false;
            } else if (arg == "--dim" && i + 1 < argc) {
                cfg.dimension = std::stoi(argv[++i]);
            } else if (arg == "--nx" && i + 1 < argc) {
                cfg.nx = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--ny" && i + 1 < argc) {
                cfg.ny = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--extent" && i + 1 < argc) {
                cfg.extent = std::stod(argv[++i]);
            } else if (arg == "--diffusion" && i + 1 < argc) {
                cfg.diffusion = std::stod(argv[++i]);
            } else if (arg == "--time" && i + 1 < argc) {
                cfg.totalTime = std::stod(argv[++i]);
            } else if (arg == "--boundary" && i + 1 < argc) {
                cfg.boundary = argv[++i];
            } else if (arg == "--ito") {
                cfg.ito = true;
            } else if (arg == "--repeats" && i + 1 < argc) {
                cfg.repeats = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--csv" && i + 1 < argc) {
                cfg.writeCsv = true;
                cfg.csvPath = argv[++i];
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                return false;
            }
        } catch (const std::exception& ex) {
            std::cerr << "Failed to parse argument " << arg << ": " << ex.what() << "\n";
            return false;
        }
    }
    return true;
}

struct RunReport {
    std::size_t steps{0};
    double dt{0.0};
    double finalMass{0.0};
};

RunReport runOnce(const BenchmarkConfig& cfg) {
    const fpsim::BoundaryKind boundary = fpsim::parseBoundaryKind(cfg.boundary);
    const fpsim::DiffusionForm form = cfg.ito ? fpsim::DiffusionForm::Ito : fpsim::DiffusionForm::Fickian;
    const double d = cfg.diffusion;

    fpsim::RunOptions options{};
    options.totalTime = cfg.totalTime;
    options.sampleStride = std::numeric_limits<std::size_t>::max();
    options.progressEverySec = 0.0;

    RunReport report{};
    if (cfg.dimension == 1) {
        fpsim::Config1D config{};
        config.drift = [](double x) { return -0.2 * x * x * x; };
        config.diffusion = [d](double) { return d; };
        config.xMin = -cfg.extent;
        config.xMax = cfg.extent;
        config.nx = cfg.nx;
        config.boundary = boundary;
        config.diffusionForm = form;
        fpsim::FokkerPlanck1D engine(config);
        const fpsim::SnapshotSeries1D series = engine.run(options);
        report.steps = series.steps;
        report.dt = series.dt;
        report.finalMass = series.snapshots.back().mass;
    } else {
        fpsim::Config2D config{};
        config.driftX = [](double x, double) { return -0.2 * x * x * x; };
        config.driftY = [](double, double y) { return -y; };
        config.diffusionX = [d](double, double) { return d; };
        config.diffusionY = config.diffusionX;
        config.xMin = -cfg.extent;
        config.xMax = cfg.extent;
        config.yMin = -cfg.extent;
        config.yMax = cfg.extent;
        config.nx = cfg.nx;
        config.ny = cfg.ny;
        config.setBoundary(boundary);
        config.diffusionForm = form;
        fpsim::FokkerPlanck2D engine(config);
        const fpsim::SnapshotSeries2D series = engine.run(options);
        report.steps = series.steps;
        report.dt = series.dt;
        report.finalMass = series.snapshots.back().mass;
    }
    return report;
}

void writeCsvResult(const BenchmarkConfig& cfg,
                    std::size_t cells,
                    const RunReport& report,
                    double avgMs,
                    double minMs,
                    double maxMs,
                    double updatesPerSecond) {
    namespace fs = std::filesystem;
    const fs::path csvPath{cfg.csvPath};
    const bool newFile = !fs::exists(csvPath);
    std::ofstream csv(csvPath, std::ios::app);
    if (!csv) {
        throw std::runtime_error("Failed to open CSV file: " + cfg.csvPath);
    }
    if (newFile) {
        csv << "dim,nx,ny,boundary,form,cells,steps,dt,avg_ms,min_ms,max_ms,updates_per_second\n";
    }
    csv << cfg.dimension << ',' << cfg.nx << ',' << (cfg.dimension == 1 ? 1 : cfg.ny) << ',' << cfg.boundary << ','
        << (cfg.ito ? "ito" : "fickian") << ',' << cells << ',' << report.steps << ',' << report.dt << ',' << avgMs
        << ',' << minMs << ',' << maxMs << ',' << updatesPerSecond << '\n';
}

}  // namespace

int main(int argc, char** argv) {
    BenchmarkConfig cfg{};
    if (!parseArgs(argc, argv, cfg)) {
        return 1;
    }
    if (cfg.dimension != 1 && cfg.dimension != 2) {
        std::cerr << "--dim must be 1 or 2.\n";
        return 1;
    }
    if (cfg.repeats == 0) {
        std::cerr << "--repeats must be positive.\n";
        return 1;
    }

    std::vector<double> durationsMs;
    durationsMs.reserve(cfg.repeats);
    RunReport report{};

    for (std::size_t repeat = 0; repeat < cfg.repeats; ++repeat) {
        const auto start = std::chrono::steady_clock::now();
        try {
            report = runOnce(cfg);
        } catch (const fpsim::NumericalInstabilityError& ex) {
            std::cerr << "Benchmark run became unstable: " << ex.what() << "\n";
            return 2;
        } catch (const std::exception& ex) {
            std::cerr << "Benchmark setup failed: " << ex.what() << "\n";
            return 1;
        }
        const auto end = std::chrono::steady_clock::now();
        durationsMs.push_back(std::chrono::duration<double, std::milli>(end - start).count());
    }

    const std::size_t cells = cfg.dimension == 1 ? cfg.nx : cfg.nx * cfg.ny;
    const double avgMs = std::accumulate(durationsMs.begin(), durationsMs.end(), 0.0) /
                         static_cast<double>(durationsMs.size());
    const auto [minIt, maxIt] = std::minmax_element(durationsMs.begin(), durationsMs.end());
    const double minMs = *minIt;
    const double maxMs = *maxIt;

    const double cellUpdates = static_cast<double>(cells) * static_cast<double>(report.steps);
    const double updatesPerSecond = cellUpdates / (avgMs / 1000.0);

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Grid: " << cfg.nx;
    if (cfg.dimension == 2) {
        std::cout << " x " << cfg.ny;
    }
    std::cout << " (" << cells << " cells, " << cfg.boundary << ", " << (cfg.ito ? "ito" : "fickian") << ")\n";
    std::cout << "Steps: " << report.steps << " (dt=" << std::scientific << std::setprecision(3) << report.dt
              << std::fixed << ")\n";
    std::cout << "Average run time: " << avgMs << " ms (min=" << minMs << " ms, max=" << maxMs << " ms)\n";
    std::cout << "Throughput: " << updatesPerSecond / 1.0e6 << "e6 cell-updates/s\n";
    std::cout << "Final mass: " << std::setprecision(12) << report.finalMass << '\n';

    if (cfg.writeCsv) {
        try {
            writeCsvResult(cfg, cells, report, avgMs, minMs, maxMs, updatesPerSecond);
        } catch (const std::exception& ex) {
            std::cerr << "Warning: " << ex.what() << "\n";
        }
    }

    return 0;
}
