// filename: run_monitor.hpp
// part of Fokker-Planck FVM Simulator
// MIT License

#pragma once

#include "fpsim/solver.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace fpsim {
namespace detail {

/**
 * @brief Shared bookkeeping of an engine run: progress emission, mass drift tracking and the
 *        one-shot conservation warning.
 */
class RunMonitor {
public:
    RunMonitor(std::string label,
               const RunOptions& options,
               ProgressSink* sink,
               std::size_t totalSteps,
               double initialMass,
               bool conserving);

    void onStep(std::size_t step, double time, double mass);

    [[nodiscard]] bool massAnomaly() const { return anomaly_; }
    [[nodiscard]] double maxMassDrift() const { return maxDrift_; }

private:
    using Clock = std::chrono::steady_clock;

    void trackMass(std::size_t step, double time, double mass);

    std::string label_;
    const RunOptions& options_;
    ProgressSink* sink_{nullptr};
    std::size_t totalSteps_{0};
    double initialMass_{0.0};
    bool conserving_{false};
    bool anomaly_{false};
    double maxDrift_{0.0};
    Clock::time_point start_;
    Clock::time_point lastEmission_;
};

}  // namespace detail
}  // namespace fpsim
