#include "grid/trajectory.h"

#include "errors.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace ssg {

namespace {

// One single-event state per event, then merged
std::vector<State> statesFromCells(std::vector<Cell> const& cells,
                                   std::vector<double> const& t) {
    std::vector<State> single;
    single.reserve(cells.size());
    for (size_t i = 0; i < cells.size(); ++i) {
        single.push_back(State{cells[i], t[i], t[i + 1], t[i + 1] - t[i], 1});
    }
    return coalesceStates(single);
}

} // namespace

std::vector<State> coalesceStates(std::vector<State> const& states) {
    std::vector<State> merged;
    merged.reserve(states.size());

    for (auto const& state : states) {
        if (!merged.empty() && merged.back().cell == state.cell) {
            State& run = merged.back();
            run.end = state.end;
            run.duration += state.duration;
            run.event_count += state.event_count;
        } else {
            merged.push_back(state);
        }
    }
    return merged;
}

// ============================================================================
// Trajectory
// ============================================================================

Trajectory::Trajectory(std::vector<AxisValue> x_values,
                       std::vector<AxisValue> y_values,
                       std::vector<double> timestamps,
                       std::string id)
    : id_(std::move(id)),
      x_values_(std::move(x_values)),
      y_values_(std::move(y_values)),
      timestamps_(std::move(timestamps)) {
    validate();
}

Trajectory::Trajectory(std::initializer_list<double> x_values,
                       std::initializer_list<double> y_values,
                       std::vector<double> timestamps,
                       std::string id)
    : Trajectory(std::vector<AxisValue>(x_values.begin(), x_values.end()),
                 std::vector<AxisValue>(y_values.begin(), y_values.end()),
                 std::move(timestamps), std::move(id)) {}

Trajectory Trajectory::numeric(std::vector<double> const& x_values,
                               std::vector<double> const& y_values,
                               std::vector<double> timestamps,
                               std::string id) {
    return Trajectory(std::vector<AxisValue>(x_values.begin(), x_values.end()),
                      std::vector<AxisValue>(y_values.begin(), y_values.end()),
                      std::move(timestamps), std::move(id));
}

bool Trajectory::isValidId(std::string const& id) {
    return !id.empty() && id.find_first_of(",|\r\n") == std::string::npos;
}

void Trajectory::validate() const {
    if (!isValidId(id_)) {
        throw ValidationError("Invalid trajectory id '" + id_ +
                              "': ids must be non-empty and contain no ',', '|' or line breaks");
    }
    if (timestamps_.size() != x_values_.size() + 1 ||
        timestamps_.size() != y_values_.size() + 1) {
        throw ValidationError("Trajectory '" + id_ + "': expected " +
                              std::to_string(x_values_.size() + 1) +
                              " timestamps for " + std::to_string(x_values_.size()) +
                              " x and " + std::to_string(y_values_.size()) +
                              " y values, got " + std::to_string(timestamps_.size()));
    }
    if (x_values_.empty()) {
        throw ValidationError("Trajectory '" + id_ + "': at least one event is required");
    }
    for (size_t i = 0; i < timestamps_.size(); ++i) {
        if (!std::isfinite(timestamps_[i])) {
            throw ValidationError("Trajectory '" + id_ + "': non-finite timestamp at index " +
                                  std::to_string(i));
        }
        if (i > 0 && timestamps_[i] < timestamps_[i - 1]) {
            throw ValidationError("Trajectory '" + id_ + "': timestamps decrease at index " +
                                  std::to_string(i));
        }
    }
}

Event Trajectory::event(size_t index) const {
    return Event{x_values_[index], y_values_[index], timestamps_[index],
                 timestamps_[index + 1]};
}

std::vector<Event> Trajectory::events() const {
    std::vector<Event> result;
    result.reserve(eventCount());
    for (size_t i = 0; i < eventCount(); ++i) {
        result.push_back(event(i));
    }
    return result;
}

std::vector<Cell> Trajectory::cells(Quantizer const& quantizer) const {
    std::vector<Cell> result;
    result.reserve(eventCount());
    for (size_t i = 0; i < eventCount(); ++i) {
        result.push_back(quantizer.cellFor(x_values_[i], y_values_[i]));
    }
    return result;
}

std::vector<State> Trajectory::mergeStates(Quantizer const& quantizer) const {
    return statesFromCells(cells(quantizer), timestamps_);
}

// ============================================================================
// QuantizedTrajectory
// ============================================================================

QuantizedTrajectory::QuantizedTrajectory(Trajectory const& trajectory,
                                         Quantizer const& quantizer)
    : id_(trajectory.id()),
      duration_(trajectory.duration()),
      event_count_(trajectory.eventCount()),
      cells_(trajectory.cells(quantizer)) {
    auto const& t = trajectory.timestamps();
    for (size_t i = 0; i < cells_.size(); ++i) {
        cell_durations_[cells_[i]] += t[i + 1] - t[i];
    }

    states_ = statesFromCells(cells_, t);
    for (auto const& state : states_) {
        cell_visits_[state.cell]++;
    }
}

std::vector<Cell> QuantizedTrajectory::distinctCells() const {
    std::vector<Cell> result;
    result.reserve(cell_durations_.size());
    for (auto const& [cell, _] : cell_durations_) {
        result.push_back(cell);
    }
    return result;
}

std::optional<double> QuantizedTrajectory::dispersion(size_t total_cells) const {
    return computeDispersion(cell_durations_, duration_, total_cells);
}

std::optional<double> computeDispersion(std::map<Cell, double> const& cell_durations,
                                        double total_duration,
                                        size_t total_cells) {
    if (total_cells <= 1 || total_duration <= 0.0) {
        return std::nullopt;
    }

    double sum_sq = 0.0;
    for (auto const& [cell, d] : cell_durations) {
        double share = d / total_duration;
        sum_sq += share * share;
    }

    double const n = static_cast<double>(total_cells);
    double const dispersion = 1.0 - (n * sum_sq - 1.0) / (n - 1.0);
    return std::clamp(dispersion, 0.0, 1.0);
}

} // namespace ssg
