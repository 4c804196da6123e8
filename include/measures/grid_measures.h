#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <cmath>
#include <iosfwd>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ssg::measures {

// Sentinel for measures that are mathematically undefined for the input
constexpr double UNDEFINED = std::numeric_limits<double>::quiet_NaN();

inline bool isUndefined(double value) { return std::isnan(value); }

// Snapshot of the statistics of one or more trajectories evaluated together.
//
// Every numeric field is always present. Undefined measures hold UNDEFINED
// (NaN) rather than being omitted:
//   dispersion       NaN when every trajectory's dispersion is undefined
//                    (single-cell grid or zero duration)
//   visited_entropy  NaN when there are no visits
struct GridMeasures {
    std::vector<std::string> trajectory_ids;
    std::vector<std::string> undefined_dispersion_ids;  // Excluded from `dispersion`

    double trajectory_count = 0.0;
    double mean_duration = 0.0;
    double mean_number_of_events = 0.0;
    double mean_number_of_visits = 0.0;
    double mean_cell_range = 0.0;
    double overall_cell_range = 0.0;         // |union of visited cells|
    double mean_duration_per_event = 0.0;    // mean(duration_i / events_i)
    double mean_duration_per_visit = 0.0;    // mean(duration_i / visits_i)
    double mean_duration_per_cell = 0.0;     // mean(duration_i / cell_range_i)
    double dispersion = UNDEFINED;           // mean of defined per-trajectory dispersion
    double visited_entropy = UNDEFINED;      // -sum(P_i ln P_i) over combined visits

    // Numeric fields in their fixed export order
    static constexpr size_t FIELD_COUNT = 11;
    static std::array<std::string_view, FIELD_COUNT> const& fieldNames();

    std::array<double, FIELD_COUNT> values() const;

    // Field by export name (nullopt for an unknown name)
    std::optional<double> field(std::string_view name) const;

    nlohmann::json toJSON() const;

private:
    // Rebuilding a record by field name is reserved for the table readers
    friend std::vector<GridMeasures> readCSV(std::istream& in);
    friend GridMeasures readFieldTable(std::istream& in);

    static GridMeasures fromValues(std::array<double, FIELD_COUNT> const& values);
    bool setField(std::string_view name, double value);
};

} // namespace ssg::measures
