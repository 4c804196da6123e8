#pragma once

#include "grid/cell.h"
#include "grid/quantizer.h"

#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ssg {

// One raw sample: the dyad sits at (x, y) from t_start to t_end
struct Event {
    AxisValue x;
    AxisValue y;
    double t_start = 0.0;
    double t_end = 0.0;

    double duration() const { return t_end - t_start; }
};

// Maximal run of consecutive events in one cell (one visit)
struct State {
    Cell cell;
    double start = 0.0;
    double end = 0.0;
    double duration = 0.0;
    size_t event_count = 0;  // Events merged into this state

    bool operator==(State const&) const = default;
};

// Coalesce consecutive states that share a cell. Durations and event counts
// are summed, the first start and last end are kept.
// Idempotent: coalescing an already merged sequence returns it unchanged.
std::vector<State> coalesceStates(std::vector<State> const& states);

// Raw trajectory: x/y samples plus fencepost timestamps (one more than samples)
class Trajectory {
public:
    // Throws ValidationError if timestamps.size() != x.size() + 1 or
    // y.size() + 1, if there are no events, if timestamps decrease, or if
    // the id is not a valid trajectory id (see isValidId).
    Trajectory(std::vector<AxisValue> x_values,
               std::vector<AxisValue> y_values,
               std::vector<double> timestamps,
               std::string id);

    // Numeric literals: Trajectory({1, 1, 3}, {2, 2, 3}, {0, 1, 2, 3}, "id")
    Trajectory(std::initializer_list<double> x_values,
               std::initializer_list<double> y_values,
               std::vector<double> timestamps,
               std::string id);

    static Trajectory numeric(std::vector<double> const& x_values,
                              std::vector<double> const& y_values,
                              std::vector<double> timestamps,
                              std::string id);

    // Ids are non-empty and free of ',', '|' and line breaks so that measures
    // tables can hold them
    static bool isValidId(std::string const& id);

    std::string const& id() const { return id_; }
    std::vector<AxisValue> const& xValues() const { return x_values_; }
    std::vector<AxisValue> const& yValues() const { return y_values_; }
    std::vector<double> const& timestamps() const { return timestamps_; }

    size_t eventCount() const { return x_values_.size(); }
    Event event(size_t index) const;
    std::vector<Event> events() const;

    double startTime() const { return timestamps_.front(); }
    double endTime() const { return timestamps_.back(); }
    double duration() const { return endTime() - startTime(); }

    // Cell of every event under `quantizer`
    std::vector<Cell> cells(Quantizer const& quantizer) const;

    // Dwell-state sequence under `quantizer`
    std::vector<State> mergeStates(Quantizer const& quantizer) const;

private:
    std::string id_;
    std::vector<AxisValue> x_values_;
    std::vector<AxisValue> y_values_;
    std::vector<double> timestamps_;

    void validate() const;
};

// Trajectory placed on a grid: merged states and per-cell tallies.
// Built independently per trajectory (safe to build on worker threads).
class QuantizedTrajectory {
public:
    QuantizedTrajectory(Trajectory const& trajectory, Quantizer const& quantizer);

    std::string const& id() const { return id_; }
    double duration() const { return duration_; }
    size_t eventCount() const { return event_count_; }

    std::vector<Cell> const& cells() const { return cells_; }
    std::vector<State> const& states() const { return states_; }

    // Number of merged states
    size_t numVisits() const { return states_.size(); }

    // Number of distinct cells; a revisited cell counts once
    size_t cellRange() const { return cell_durations_.size(); }

    std::vector<Cell> distinctCells() const;

    std::map<Cell, double> const& cellDurations() const { return cell_durations_; }
    std::map<Cell, size_t> const& cellVisits() const { return cell_visits_; }

    // Evenness of the time spread over a grid of `total_cells` cells:
    //   1 - (n * sum((d_i / D)^2) - 1) / (n - 1)
    // nullopt when n <= 1 or the trajectory has zero duration.
    std::optional<double> dispersion(size_t total_cells) const;

private:
    std::string id_;
    double duration_ = 0.0;
    size_t event_count_ = 0;
    std::vector<Cell> cells_;
    std::vector<State> states_;
    std::map<Cell, double> cell_durations_;
    std::map<Cell, size_t> cell_visits_;
};

// Dispersion of a per-cell duration distribution (shared by the per-trajectory
// and the pooled grid variants)
std::optional<double> computeDispersion(std::map<Cell, double> const& cell_durations,
                                        double total_duration,
                                        size_t total_cells);

} // namespace ssg
