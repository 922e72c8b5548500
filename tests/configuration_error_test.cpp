#include "fpsim/ingest.hpp"
#include "fpsim/solver.hpp"
#include "fpsim/types.hpp"

#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

template <typename Exception>
bool expectThrow(const std::string& label, const std::function<void()>& action) {
    try {
        action();
    } catch (const Exception&) {
        return true;
    } catch (const std::exception& ex) {
        std::cerr << label << ": threw the wrong exception type: " << ex.what() << '\n';
        return false;
    }
    std::cerr << label << ": expected an exception\n";
    return false;
}

fpsim::Config1D baseConfig() {
    fpsim::Config1D config{};
    config.drift = [](double) { return 0.0; };
    config.diffusion = [](double) { return 0.1; };
    config.xMin = 0.0;
    config.xMax = 1.0;
    config.nx = 20;
    return config;
}

const char* kScenarioHead = R"({"version": "0.1", "dimension": 1, "x_min": 0.0, "x_max": 1.0, "N": 10, )";

}  // namespace

int main() {
    using namespace fpsim;
    bool ok = true;

    ok &= expectThrow<ConfigurationError>("N < 2", [] {
        Config1D config = baseConfig();
        config.nx = 1;
        FokkerPlanck1D engine(config);
    });
    ok &= expectThrow<ConfigurationError>("degenerate bounds", [] {
        Config1D config = baseConfig();
        config.xMax = config.xMin;
        FokkerPlanck1D engine(config);
    });
    ok &= expectThrow<ConfigurationError>("reversed y bounds", [] {
        Config2D config{};
        config.driftX = config.driftY = [](double, double) { return 0.0; };
        config.diffusionX = config.diffusionY = [](double, double) { return 0.1; };
        config.yMin = 1.0;
        config.yMax = -1.0;
        FokkerPlanck2D engine(config);
    });
    ok &= expectThrow<ConfigurationError>("unknown boundary", [] { (void)parseBoundaryKind("sticky"); });
    ok &= expectThrow<ConfigurationError>("unknown diffusion form", [] { (void)parseDiffusionForm("stratonovich"); });
    ok &= expectThrow<ConfigurationError>("initial density size mismatch", [] {
        Config1D config = baseConfig();
        config.initialDensity.assign(19, 1.0);
        FokkerPlanck1D engine(config);
    });
    ok &= expectThrow<ConfigurationError>("negative initial density", [] {
        Config1D config = baseConfig();
        config.initialDensity.assign(20, 1.0);
        config.initialDensity[3] = -0.5;
        FokkerPlanck1D engine(config);
    });
    ok &= expectThrow<ConfigurationError>("normalising zero mass", [] {
        Config1D config = baseConfig();
        config.initialDensity.assign(20, 0.0);
        config.normalize = true;
        FokkerPlanck1D engine(config);
    });
    ok &= expectThrow<ConfigurationError>("negative diffusion", [] {
        Config1D config = baseConfig();
        config.diffusion = [](double x) { return x - 0.5; };
        FokkerPlanck1D engine(config);
    });
    ok &= expectThrow<ConfigurationError>("missing drift", [] {
        Config1D config = baseConfig();
        config.drift = nullptr;
        FokkerPlanck1D engine(config);
    });
    ok &= expectThrow<ConfigurationError>("zero stride", [] {
        FokkerPlanck1D engine(baseConfig());
        RunOptions options{};
        options.sampleStride = 0;
        (void)engine.run(options);
    });
    ok &= expectThrow<ConfigurationError>("non-positive total time", [] {
        FokkerPlanck1D engine(baseConfig());
        RunOptions options{};
        options.totalTime = 0.0;
        (void)engine.run(options);
    });
    ok &= expectThrow<ConfigurationError>("non-positive dt", [] {
        FokkerPlanck1D engine(baseConfig());
        RunOptions options{};
        options.dt = -1e-3;
        (void)engine.run(options);
    });
    ok &= expectThrow<ConfigurationError>("dt and steps together", [] {
        FokkerPlanck1D engine(baseConfig());
        RunOptions options{};
        options.dt = 1e-3;
        options.steps = 10;
        (void)engine.run(options);
    });
    ok &= expectThrow<ConfigurationError>("courant above one", [] {
        FokkerPlanck1D engine(baseConfig());
        RunOptions options{};
        options.courant = 1.5;
        (void)engine.run(options);
    });
    ok &= expectThrow<ConfigurationError>("negative stability tolerance", [] {
        FokkerPlanck1D engine(baseConfig());
        RunOptions options{};
        options.dt = 1e-4;
        options.stabilityTolerance = -0.5;
        (void)engine.run(options);
    });
    ok &= expectThrow<std::logic_error>("second run", [] {
        FokkerPlanck1D engine(baseConfig());
        RunOptions options{};
        options.totalTime = 0.01;
        (void)engine.run(options);
        (void)engine.run(options);
    });

    // A failed precondition leaves the engine runnable.
    {
        FokkerPlanck1D engine(baseConfig());
        RunOptions bad{};
        bad.totalTime = -1.0;
        ok &= expectThrow<ConfigurationError>("negative total time", [&] { (void)engine.run(bad); });
        RunOptions good{};
        good.totalTime = 0.01;
        try {
            (void)engine.run(good);
        } catch (const std::exception& ex) {
            std::cerr << "Engine unusable after a rejected run: " << ex.what() << '\n';
            ok = false;
        }
    }

    // Scenario files.
    ok &= expectThrow<ConfigurationError>("malformed JSON", [] { (void)parseScenarioJson("{\"version\": "); });
    ok &= expectThrow<ConfigurationError>("missing version", [] {
        (void)parseScenarioJson(R"({"dimension": 1, "x_min": 0, "x_max": 1, "N": 10, "A": 0, "D": 1})");
    });
    ok &= expectThrow<ConfigurationError>("unsupported version", [] {
        (void)parseScenarioJson(R"({"version": "9", "x_min": 0, "x_max": 1, "N": 10, "A": 0, "D": 1})");
    });
    ok &= expectThrow<ConfigurationError>("bad bc_type", [] {
        (void)parseScenarioJson(std::string(kScenarioHead) + R"("A": 0, "D": 1, "bc_type": "open"})");
    });
    ok &= expectThrow<ConfigurationError>("N below two", [] {
        (void)parseScenarioJson(R"({"version": "0.1", "x_min": 0, "x_max": 1, "N": 1, "A": 0, "D": 1})");
    });
    ok &= expectThrow<ConfigurationError>("missing D", [] {
        (void)parseScenarioJson(std::string(kScenarioHead) + R"("A": 0})");
    });
    ok &= expectThrow<ConfigurationError>("exponent out of range", [] {
        (void)parseScenarioJson(std::string(kScenarioHead) + R"("A": [{"c": 1, "px": 40}], "D": 1})");
    });
    ok &= expectThrow<ConfigurationError>("values length", [] {
        (void)parseScenarioJson(std::string(kScenarioHead) +
                                R"("A": 0, "D": 1, "initial_condition": {"type": "values", "values": [1, 2]}})");
    });
    ok &= expectThrow<ConfigurationError>("bad dt keyword", [] {
        (void)parseScenarioJson(std::string(kScenarioHead) + R"("A": 0, "D": 1, "run": {"dt": "fast"}})");
    });
    ok &= expectThrow<ConfigurationError>("negative stability_tolerance", [] {
        (void)parseScenarioJson(std::string(kScenarioHead) +
                                R"("A": 0, "D": 1, "run": {"stability_tolerance": -0.1}})");
    });
    ok &= expectThrow<std::runtime_error>("missing scenario file", [] {
        (void)loadScenarioFromJson("inputs/tests/does_not_exist.json");
    });

    if (!ok) {
        return 1;
    }
    std::cout << "Configuration errors rejected as expected\n";
    return 0;
}
