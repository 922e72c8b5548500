#include "run_monitor.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace fpsim {
namespace detail {
namespace {

constexpr double kTinyMass = 1e-300;

}  // namespace

RunMonitor::RunMonitor(std::string label,
                       const RunOptions& options,
                       ProgressSink* sink,
                       std::size_t totalSteps,
                       double initialMass,
                       bool conserving)
    : label_(std::move(label)), options_(options), sink_(sink), totalSteps_(totalSteps),
      initialMass_(initialMass), conserving_(conserving), start_(Clock::now()), lastEmission_(start_) {}

void RunMonitor::onStep(std::size_t step, double time, double mass) {
    trackMass(step, time, mass);

    const auto now = Clock::now();
    const bool last = step == totalSteps_;
    const bool intervalSatisfied = options_.progressEverySec <= 0.0 ||
                                   std::chrono::duration<double>(now - lastEmission_).count() >=
                                       options_.progressEverySec;
    if (!last && !intervalSatisfied) {
        return;
    }
    lastEmission_ = now;

    ProgressSample sample{};
    sample.step = step;
    sample.totalSteps = totalSteps_;
    sample.time = time;
    sample.mass = mass;
    sample.elapsedSeconds = std::chrono::duration<double>(now - start_).count();

    if (options_.verbose) {
        std::cout << label_ << " step " << step << '/' << totalSteps_ << ": t=" << time << " mass=" << mass
                  << '\n';
    }
    if (sink_ != nullptr) {
        sink_->onProgress(sample);
    }
}

void RunMonitor::trackMass(std::size_t step, double time, double mass) {
    const double scale = std::max(std::abs(initialMass_), kTinyMass);
    const double drift = std::abs(mass - initialMass_) / scale;
    maxDrift_ = std::max(maxDrift_, drift);

    if (!conserving_ || anomaly_ || drift <= options_.massTolerance) {
        return;
    }
    anomaly_ = true;
    std::cerr << "Warning: " << label_ << " mass drifted by " << drift << " (relative) at step " << step
              << ", t=" << time << "; the boundary policy should conserve mass\n";
}

}  // namespace detail
}  // namespace fpsim
