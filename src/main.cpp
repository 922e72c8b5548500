#include "fpsim/ingest.hpp"
#include "fpsim/render.hpp"
#include "fpsim/solver.hpp"
#include "fpsim/types.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void printUsage() {
    std::cout << "Usage: fp_sim [--dim {1|2}] [--scenario PATH] [--total-time T] [--dt {VALUE|auto}]"
                 " [--steps N] [--stride N] [--boundary {reflecting|absorbing|periodic}]"
                 " [--diffusion-form {fickian|ito}] [--courant C] [--html PATH] [--no-html]"
                 " [--vtk-series DIR] [--csv PATH] [--mass-history PATH] [--marginals PATH]"
                 " [--progress-every SEC] [--verbose] [--quiet]\n";
}

std::string formatElapsed(double seconds) {
    const int totalSeconds = static_cast<int>(seconds);
    const int minutes = totalSeconds / 60;
    const int remSeconds = totalSeconds % 60;
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << minutes << ':' << std::setw(2) << remSeconds;
    return oss.str();
}

class ConsoleProgress : public fpsim::ProgressSink {
public:
    void onProgress(const fpsim::ProgressSample& sample) override {
        const double ratio = sample.totalSteps > 0
                                 ? static_cast<double>(sample.step) / static_cast<double>(sample.totalSteps)
                                 : 1.0;
        std::ostringstream oss;
        oss << '[' << formatElapsed(sample.elapsedSeconds) << "] step " << sample.step << '/' << sample.totalSteps
            << " t=" << std::fixed << std::setprecision(4) << sample.time << " prog=" << std::setprecision(0)
            << ratio * 100.0 << '%' << std::defaultfloat << " mass=" << std::setprecision(10) << sample.mass
            << '\n';
        std::cout << oss.str();
        std::cout.flush();
    }
};

bool parseDouble(const std::string& flag, const char* text, double& out) {
    try {
        std::size_t used = 0;
        out = std::stod(text, &used);
        if (used != std::string(text).size()) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::exception&) {
        std::cerr << flag << " requires a valid floating-point argument\n";
        return false;
    }
    if (!(out > 0.0) || !std::isfinite(out)) {
        std::cerr << flag << " must be positive\n";
        return false;
    }
    return true;
}

bool parseCount(const std::string& flag, const char* text, std::size_t& out) {
    long long value = 0;
    try {
        value = std::stoll(text);
    } catch (const std::exception&) {
        std::cerr << flag << " requires a valid integer argument\n";
        return false;
    }
    if (value <= 0) {
        std::cerr << flag << " must be positive\n";
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

struct OutputPlan {
    std::string html;
    std::string vtkDirectory;
    std::string csv;
    std::string massHistory;
    std::string marginals;
};

std::vector<std::unique_ptr<fpsim::SeriesRenderer>> makeRenderers(const OutputPlan& plan, int dimension) {
    std::vector<std::unique_ptr<fpsim::SeriesRenderer>> renderers;
    if (!plan.html.empty()) {
        fpsim::AnimationOptions animation{};
        if (dimension == 2) {
            animation.title = "Fokker-Planck 2D: p(x,y,t) with Marginals";
        }
        renderers.push_back(std::make_unique<fpsim::HtmlAnimationRenderer>(plan.html, animation));
    }
    if (!plan.vtkDirectory.empty()) {
        renderers.push_back(std::make_unique<fpsim::VtkSeriesRenderer>(
            plan.vtkDirectory, dimension == 1 ? "fokker_planck_1d" : "fokker_planck_2d"));
    }
    if (!plan.csv.empty() || !plan.massHistory.empty() || !plan.marginals.empty()) {
        renderers.push_back(std::make_unique<fpsim::CsvSeriesRenderer>(plan.csv, plan.massHistory, plan.marginals));
    }
    return renderers;
}

template <typename Series>
bool renderAll(const std::vector<std::unique_ptr<fpsim::SeriesRenderer>>& renderers, const Series& series,
               bool quiet) {
    bool failure = false;
    for (const auto& renderer : renderers) {
        try {
            const std::string summary = renderer->render(series);
            if (!quiet) {
                std::cout << renderer->name() << ": " << summary << '\n';
            }
        } catch (const std::exception& ex) {
            std::cerr << "Failed to write " << renderer->name() << " output: " << ex.what() << '\n';
            failure = true;
        }
    }
    return !failure;
}

template <typename Series>
void printSummary(const Series& series) {
    const auto& first = series.snapshots.front();
    const auto& last = series.snapshots.back();
    std::cout << "Completed " << series.steps << " steps (dt=" << series.dt << "), " << series.snapshots.size()
              << " snapshots; mass " << std::setprecision(12) << first.mass << " -> " << last.mass
              << std::defaultfloat << std::setprecision(6) << '\n';
    if (series.massAnomaly) {
        std::cout << "Mass drift exceeded tolerance (max relative drift " << series.maxMassDrift << ")\n";
    }
}

}  // namespace

int main(int argc, char** argv) {
    using namespace fpsim;

    int dimension = 1;
    bool dimensionGiven = false;
    std::optional<std::string> scenarioPath;
    std::optional<double> totalTimeOverride;
    std::optional<double> dtOverride;
    bool dtAuto = false;
    std::optional<std::size_t> stepsOverride;
    std::optional<std::size_t> strideOverride;
    std::optional<std::string> boundaryOverride;
    std::optional<std::string> diffusionFormOverride;
    std::optional<double> courantOverride;
    std::optional<double> progressEveryOverride;
    std::optional<std::string> htmlOverride;
    bool noHtml = false;
    std::optional<std::string> vtkOverride;
    std::optional<std::string> csvOverride;
    std::optional<std::string> massHistoryOverride;
    std::optional<std::string> marginalsOverride;
    bool verbose = false;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (arg == "--dim") {
            if (!hasValue) {
                std::cerr << "--dim requires 1 or 2\n";
                printUsage();
                return 1;
            }
            const std::string value = argv[++i];
            if (value != "1" && value != "2") {
                std::cerr << "--dim must be 1 or 2\n";
                return 1;
            }
            dimension = value == "1" ? 1 : 2;
            dimensionGiven = true;
        } else if (arg == "--scenario") {
            if (!hasValue) {
                std::cerr << "--scenario requires a path argument\n";
                printUsage();
                return 1;
            }
            scenarioPath = std::string(argv[++i]);
        } else if (arg == "--total-time") {
            double value = 0.0;
            if (!hasValue || !parseDouble(arg, argv[++i], value)) {
                printUsage();
                return 1;
            }
            totalTimeOverride = value;
        } else if (arg == "--dt") {
            if (!hasValue) {
                std::cerr << "--dt requires a positive value or 'auto'\n";
                printUsage();
                return 1;
            }
            if (std::string(argv[i + 1]) == "auto") {
                ++i;
                dtAuto = true;
            } else {
                double value = 0.0;
                if (!parseDouble(arg, argv[++i], value)) {
                    return 1;
                }
                dtOverride = value;
            }
        } else if (arg == "--steps") {
            std::size_t value = 0;
            if (!hasValue || !parseCount(arg, argv[++i], value)) {
                printUsage();
                return 1;
            }
            stepsOverride = value;
        } else if (arg == "--stride") {
            std::size_t value = 0;
            if (!hasValue || !parseCount(arg, argv[++i], value)) {
                printUsage();
                return 1;
            }
            strideOverride = value;
        } else if (arg == "--boundary") {
            if (!hasValue) {
                std::cerr << "--boundary requires reflecting, absorbing or periodic\n";
                printUsage();
                return 1;
            }
            boundaryOverride = std::string(argv[++i]);
        } else if (arg == "--diffusion-form") {
            if (!hasValue) {
                std::cerr << "--diffusion-form requires fickian or ito\n";
                printUsage();
                return 1;
            }
            diffusionFormOverride = std::string(argv[++i]);
        } else if (arg == "--courant") {
            double value = 0.0;
            if (!hasValue || !parseDouble(arg, argv[++i], value)) {
                printUsage();
                return 1;
            }
            courantOverride = value;
        } else if (arg == "--progress-every") {
            if (!hasValue) {
                std::cerr << "--progress-every requires a value in seconds\n";
                return 1;
            }
            try {
                progressEveryOverride = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "--progress-every requires a valid floating-point argument\n";
                return 1;
            }
        } else if (arg == "--html") {
            if (!hasValue) {
                std::cerr << "--html requires a path argument\n";
                return 1;
            }
            htmlOverride = std::string(argv[++i]);
        } else if (arg == "--no-html") {
            noHtml = true;
        } else if (arg == "--vtk-series") {
            if (!hasValue) {
                std::cerr << "--vtk-series requires a directory argument\n";
                return 1;
            }
            vtkOverride = std::string(argv[++i]);
        } else if (arg == "--csv") {
            if (!hasValue) {
                std::cerr << "--csv requires a path argument\n";
                return 1;
            }
            csvOverride = std::string(argv[++i]);
        } else if (arg == "--mass-history") {
            if (!hasValue) {
                std::cerr << "--mass-history requires a path argument\n";
                return 1;
            }
            massHistoryOverride = std::string(argv[++i]);
        } else if (arg == "--marginals") {
            if (!hasValue) {
                std::cerr << "--marginals requires a path argument\n";
                return 1;
            }
            marginalsOverride = std::string(argv[++i]);
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--quiet") {
            quiet = true;
        } else {
            std::cerr << "Unknown argument: " << arg << '\n';
            printUsage();
            return 1;
        }
    }

    ScenarioSpec spec;
    try {
        if (scenarioPath) {
            spec = loadScenarioFromJson(*scenarioPath);
            if (dimensionGiven && spec.dimension != dimension) {
                std::cerr << "--dim " << dimension << " conflicts with the " << spec.dimension
                          << "D scenario " << *scenarioPath << '\n';
                return 1;
            }
            dimension = spec.dimension;
        } else {
            spec = defaultScenario(dimension);
        }
        if (boundaryOverride) {
            spec.boundaryX = parseBoundaryKind(*boundaryOverride);
            spec.boundaryY = spec.boundaryX;
        }
        if (diffusionFormOverride) {
            spec.diffusionForm = parseDiffusionForm(*diffusionFormOverride);
        }
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load scenario: " << ex.what() << '\n';
        return 1;
    }

    RunOptions options = spec.run;
    if (totalTimeOverride) {
        options.totalTime = *totalTimeOverride;
    }
    if (dtAuto) {
        options.dt.reset();
        options.steps.reset();
    }
    if (dtOverride) {
        options.dt = *dtOverride;
        options.steps.reset();
    }
    if (stepsOverride) {
        options.steps = *stepsOverride;
        options.dt.reset();
    }
    if (strideOverride) {
        options.sampleStride = *strideOverride;
    }
    if (courantOverride) {
        options.courant = *courantOverride;
    }
    if (progressEveryOverride) {
        options.progressEverySec = *progressEveryOverride;
    }
    options.verbose = verbose && !quiet;

    OutputPlan plan{};
    plan.html = spec.outputs.html;
    plan.vtkDirectory = spec.outputs.vtkDirectory;
    plan.csv = spec.outputs.csv;
    plan.massHistory = spec.outputs.massHistory;
    plan.marginals = spec.outputs.marginals;
    if (htmlOverride) {
        plan.html = *htmlOverride;
    }
    if (vtkOverride) {
        plan.vtkDirectory = *vtkOverride;
    }
    if (csvOverride) {
        plan.csv = *csvOverride;
    }
    if (massHistoryOverride) {
        plan.massHistory = *massHistoryOverride;
    }
    if (marginalsOverride) {
        plan.marginals = *marginalsOverride;
    }
    if (plan.html.empty() && !noHtml && plan.vtkDirectory.empty() && plan.csv.empty() && plan.massHistory.empty() &&
        plan.marginals.empty()) {
        plan.html = dimension == 1 ? "outputs/fokker_planck_1d.html" : "outputs/fokker_planck_2d.html";
    }
    if (noHtml) {
        plan.html.clear();
    }
    if (dimension == 1 && !plan.marginals.empty()) {
        std::cerr << "Warning: --marginals only applies to 2D runs; ignoring\n";
        plan.marginals.clear();
    }

    std::vector<std::unique_ptr<SeriesRenderer>> renderers;
    try {
        renderers = makeRenderers(plan, dimension);
    } catch (const std::exception& ex) {
        std::cerr << "Invalid output configuration: " << ex.what() << '\n';
        return 1;
    }

    ConsoleProgress console;
    ProgressSink* progress = quiet ? nullptr : &console;

    try {
        if (dimension == 1) {
            FokkerPlanck1D engine(makeConfig1D(spec));
            const SnapshotSeries1D series = engine.run(options, progress);
            if (!quiet) {
                printSummary(series);
            }
            return renderAll(renderers, series, quiet) ? 0 : 1;
        }
        FokkerPlanck2D engine(makeConfig2D(spec));
        const SnapshotSeries2D series = engine.run(options, progress);
        if (!quiet) {
            printSummary(series);
        }
        return renderAll(renderers, series, quiet) ? 0 : 1;
    } catch (const NumericalInstabilityError& ex) {
        std::cerr << "Numerical instability at step " << ex.step() << " (t=" << ex.time() << "): " << ex.what()
                  << '\n';
        return 2;
    } catch (const ConfigurationError& ex) {
        std::cerr << "Configuration error: " << ex.what() << '\n';
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Simulation failed: " << ex.what() << '\n';
        return 1;
    }
}
