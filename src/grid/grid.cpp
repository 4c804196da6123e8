#include "grid/grid.h"

#include "errors.h"
#include "parallel.h"

#include <utility>

namespace ssg {

void CellTotals::add(QuantizedTrajectory const& trajectory) {
    for (auto const& [cell, d] : trajectory.cellDurations()) {
        durations[cell] += d;
    }
    for (auto const& [cell, v] : trajectory.cellVisits()) {
        visits[cell] += v;
    }
    total_duration += trajectory.duration();
    total_visits += trajectory.numVisits();
}

Grid::Grid(QuantizationConfig config, int thread_count)
    : config_(std::move(config)), thread_count_(thread_count) {}

void Grid::setQuantization(QuantizationConfig config) {
    if (isResolved()) {
        throw ConfigError("Grid quantization is already resolved; "
                          "construct a new Grid for a different quantization");
    }
    config_ = std::move(config);
}

void Grid::addTrajectory(Trajectory trajectory) {
    if (findTrajectory(trajectory.id())) {
        throw ValidationError("Trajectory id '" + trajectory.id() + "' is already in the grid");
    }

    if (isResolved()) {
        // Quantize before storing so a misfit leaves the grid untouched
        QuantizedTrajectory quantized(trajectory, *quantizer_);
        totals_.add(quantized);
        quantized_.push_back(std::move(quantized));
    }
    trajectories_.push_back(std::move(trajectory));
}

void Grid::addTrajectories(std::vector<Trajectory> trajectories) {
    for (auto& trajectory : trajectories) {
        addTrajectory(std::move(trajectory));
    }
}

Trajectory const* Grid::findTrajectory(std::string const& id) const {
    for (auto const& trajectory : trajectories_) {
        if (trajectory.id() == id) {
            return &trajectory;
        }
    }
    return nullptr;
}

void Grid::resolve() {
    if (isResolved()) {
        return;
    }

    // Union of all member values
    std::vector<AxisValue> x_samples;
    std::vector<AxisValue> y_samples;
    for (auto const& trajectory : trajectories_) {
        x_samples.insert(x_samples.end(), trajectory.xValues().begin(), trajectory.xValues().end());
        y_samples.insert(y_samples.end(), trajectory.yValues().begin(), trajectory.yValues().end());
    }
    Quantizer quantizer = Quantizer::resolve(config_, x_samples, y_samples);

    // Independent per-trajectory stage
    std::vector<std::optional<QuantizedTrajectory>> slots(trajectories_.size());
    parallelFor(trajectories_.size(), thread_count_, [&](size_t i) {
        slots[i].emplace(trajectories_[i], quantizer);
    });

    // Barrier passed: sequential fold
    std::vector<QuantizedTrajectory> quantized;
    quantized.reserve(slots.size());
    CellTotals totals;
    for (auto& slot : slots) {
        totals.add(*slot);
        quantized.push_back(std::move(*slot));
    }

    quantized_ = std::move(quantized);
    totals_ = std::move(totals);
    quantizer_ = std::move(quantizer);
}

Quantizer const& Grid::quantizer() {
    resolve();
    return *quantizer_;
}

std::vector<QuantizedTrajectory> const& Grid::quantizedTrajectories() {
    resolve();
    return quantized_;
}

CellTotals const& Grid::totals() {
    resolve();
    return totals_;
}

size_t Grid::totalCells() {
    return quantizer().totalCells();
}

std::set<Cell> Grid::visitedCells() {
    std::set<Cell> cells;
    for (auto const& [cell, _] : totals().durations) {
        cells.insert(cell);
    }
    return cells;
}

std::optional<double> Grid::combinedDispersion() {
    auto const& t = totals();
    return computeDispersion(t.durations, t.total_duration, totalCells());
}

} // namespace ssg
