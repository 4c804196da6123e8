#pragma once

#include "grid/cell.h"
#include "grid/quantizer.h"
#include "grid/trajectory.h"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ssg {

// Per-cell totals accumulated over a set of quantized trajectories.
// Filled by a single-threaded fold after the per-trajectory stage.
struct CellTotals {
    std::map<Cell, double> durations;  // Sum of dwell time per cell
    std::map<Cell, size_t> visits;     // Sum of visits (merged states) per cell
    double total_duration = 0.0;
    size_t total_visits = 0;

    void add(QuantizedTrajectory const& trajectory);

    size_t visitedCells() const { return durations.size(); }
};

// A set of trajectories quantized under one shared Quantizer.
//
// Quantization is resolved lazily, on first access, from the union of all
// member values (or from the explicit config, whose set fields override the
// inferred ones). Once resolved it is frozen for the lifetime of the grid:
// later trajectories are quantized under it, and a different quantization
// needs a new Grid.
class Grid {
public:
    Grid() = default;
    explicit Grid(QuantizationConfig config, int thread_count = 1);

    // Replace the quantization config. Throws ConfigError once resolved.
    void setQuantization(QuantizationConfig config);
    QuantizationConfig const& quantizationConfig() const { return config_; }

    // Worker threads for the per-trajectory stage (0 = hardware concurrency)
    void setThreadCount(int thread_count) { thread_count_ = thread_count; }
    int threadCount() const { return thread_count_; }

    // Throws ValidationError on a duplicate id. On a resolved grid the new
    // trajectory is quantized immediately (ConfigError if it does not fit).
    void addTrajectory(Trajectory trajectory);
    void addTrajectories(std::vector<Trajectory> trajectories);

    size_t size() const { return trajectories_.size(); }
    bool empty() const { return trajectories_.empty(); }
    bool isResolved() const { return quantizer_.has_value(); }

    std::vector<Trajectory> const& trajectories() const { return trajectories_; }
    Trajectory const* findTrajectory(std::string const& id) const;

    // Resolve quantization and run the per-trajectory stage if needed
    void resolve();

    // Accessors below resolve on demand
    Quantizer const& quantizer();
    std::vector<QuantizedTrajectory> const& quantizedTrajectories();
    CellTotals const& totals();
    size_t totalCells();
    std::set<Cell> visitedCells();

    // Dispersion of the pooled per-cell durations of all members.
    // nullopt when the grid has a single cell or zero total duration.
    std::optional<double> combinedDispersion();

private:
    QuantizationConfig config_;
    int thread_count_ = 1;

    std::vector<Trajectory> trajectories_;

    std::optional<Quantizer> quantizer_;
    std::vector<QuantizedTrajectory> quantized_;
    CellTotals totals_;
};

} // namespace ssg
