#include "measures/grid_measures.h"

#include <utility>

namespace ssg::measures {

namespace {

using FieldPtr = double GridMeasures::*;

// Fixed export order. Append new fields at the end so existing tables keep
// their column positions.
constexpr std::array<std::pair<std::string_view, FieldPtr>, GridMeasures::FIELD_COUNT> FIELDS = {{
    {"trajectory_count", &GridMeasures::trajectory_count},
    {"mean_duration", &GridMeasures::mean_duration},
    {"mean_number_of_events", &GridMeasures::mean_number_of_events},
    {"mean_number_of_visits", &GridMeasures::mean_number_of_visits},
    {"mean_cell_range", &GridMeasures::mean_cell_range},
    {"overall_cell_range", &GridMeasures::overall_cell_range},
    {"mean_duration_per_event", &GridMeasures::mean_duration_per_event},
    {"mean_duration_per_visit", &GridMeasures::mean_duration_per_visit},
    {"mean_duration_per_cell", &GridMeasures::mean_duration_per_cell},
    {"dispersion", &GridMeasures::dispersion},
    {"visited_entropy", &GridMeasures::visited_entropy},
}};

} // namespace

std::array<std::string_view, GridMeasures::FIELD_COUNT> const& GridMeasures::fieldNames() {
    static std::array<std::string_view, FIELD_COUNT> const names = [] {
        std::array<std::string_view, FIELD_COUNT> result;
        for (size_t i = 0; i < FIELD_COUNT; ++i) {
            result[i] = FIELDS[i].first;
        }
        return result;
    }();
    return names;
}

std::array<double, GridMeasures::FIELD_COUNT> GridMeasures::values() const {
    std::array<double, FIELD_COUNT> result;
    for (size_t i = 0; i < FIELD_COUNT; ++i) {
        result[i] = this->*FIELDS[i].second;
    }
    return result;
}

GridMeasures GridMeasures::fromValues(std::array<double, FIELD_COUNT> const& values) {
    GridMeasures measures;
    for (size_t i = 0; i < FIELD_COUNT; ++i) {
        measures.*FIELDS[i].second = values[i];
    }
    return measures;
}

std::optional<double> GridMeasures::field(std::string_view name) const {
    for (auto const& [field_name, ptr] : FIELDS) {
        if (field_name == name) {
            return this->*ptr;
        }
    }
    return std::nullopt;
}

bool GridMeasures::setField(std::string_view name, double value) {
    for (auto const& [field_name, ptr] : FIELDS) {
        if (field_name == name) {
            this->*ptr = value;
            return true;
        }
    }
    return false;
}

nlohmann::json GridMeasures::toJSON() const {
    nlohmann::json j;
    j["trajectory_ids"] = trajectory_ids;
    j["undefined_dispersion_ids"] = undefined_dispersion_ids;

    nlohmann::json fields;
    for (auto const& [name, ptr] : FIELDS) {
        double value = this->*ptr;
        if (isUndefined(value)) {
            fields[std::string(name)] = nullptr;
        } else {
            fields[std::string(name)] = value;
        }
    }
    j["measures"] = fields;

    return j;
}

} // namespace ssg::measures
