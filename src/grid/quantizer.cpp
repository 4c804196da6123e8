#include "grid/quantizer.h"

#include "errors.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <utility>

namespace ssg {

namespace {

// Relative slack for floating-point noise in (rank - min) / cell_size,
// e.g. 0.3 / 0.1 == 2.9999999999999996
constexpr double BIN_TOLERANCE = 1e-12;

constexpr double MAX_CELL_INDEX = static_cast<double>(std::numeric_limits<int>::max() - 1);

// Zero-based bin of an offset from the axis minimum
double binCoordinate(double offset, double cell_size) {
    double q = offset / cell_size;
    return std::floor(q + BIN_TOLERANCE * std::max(1.0, q));
}

bool isNumeric(AxisValue const& value) {
    return std::holds_alternative<double>(value);
}

} // namespace

std::string axisValueToString(AxisValue const& value) {
    if (auto const* number = std::get_if<double>(&value)) {
        std::ostringstream out;
        out << *number;
        return out.str();
    }
    return "\"" + std::get<std::string>(value) + "\"";
}

// ============================================================================
// AxisQuantizer
// ============================================================================

AxisQuantizer AxisQuantizer::resolve(AxisConfig const& config,
                                     std::vector<AxisValue> const& samples,
                                     std::string const& axis_name) {
    AxisQuantizer axis;
    axis.axis_name_ = axis_name;

    if (config.order) {
        if (config.order->empty()) {
            throw ConfigError("Axis " + axis_name + ": explicit order is empty");
        }
        axis.scale_ = AxisScale::Ordered;
        axis.order_ = *config.order;
        for (size_t i = 0; i < axis.order_.size(); ++i) {
            auto [it, inserted] = axis.ranks_.emplace(axis.order_[i], static_cast<int>(i));
            if (!inserted) {
                throw ConfigError("Axis " + axis_name + ": value " +
                                  axisValueToString(axis.order_[i]) +
                                  " appears more than once in the explicit order");
            }
        }
    } else {
        // No order supplied: only numeric data has a canonical order
        for (auto const& value : samples) {
            if (!isNumeric(value)) {
                throw ConfigError("Axis " + axis_name + ": categorical value " +
                                  axisValueToString(value) +
                                  " found but no explicit order was supplied");
            }
        }
        axis.scale_ = AxisScale::Numeric;
    }

    // Observed extrema in rank space
    std::optional<double> observed_min;
    std::optional<double> observed_max;
    for (auto const& value : samples) {
        double r = axis.rankOrThrow(value);
        observed_min = observed_min ? std::min(*observed_min, r) : r;
        observed_max = observed_max ? std::max(*observed_max, r) : r;
    }

    if (config.min) {
        axis.min_ = axis.boundRank(*config.min, "min");
    } else if (observed_min) {
        axis.min_ = *observed_min;
    } else {
        throw ConfigError("Axis " + axis_name + ": no samples and no explicit min");
    }

    if (config.max) {
        axis.max_ = axis.boundRank(*config.max, "max");
    } else if (observed_max) {
        axis.max_ = *observed_max;
    } else {
        throw ConfigError("Axis " + axis_name + ": no samples and no explicit max");
    }

    if (axis.min_ > axis.max_) {
        throw ConfigError("Axis " + axis_name + ": min is greater than max");
    }

    axis.cell_size_ = config.cell_size.value_or(1.0);
    if (!std::isfinite(axis.cell_size_) || axis.cell_size_ <= 0.0) {
        throw ConfigError("Axis " + axis_name + ": cell size must be positive");
    }
    if (!(binCoordinate(axis.max_ - axis.min_, axis.cell_size_) <= MAX_CELL_INDEX)) {
        throw ConfigError("Axis " + axis_name + ": range " + std::to_string(axis.min_) + ".." +
                          std::to_string(axis.max_) + " spans too many cells of size " +
                          std::to_string(axis.cell_size_));
    }

    // Explicit bounds may exclude observed values
    for (auto const& value : samples) {
        axis.cellIndex(value);
    }

    return axis;
}

int AxisQuantizer::cellCount() const {
    return static_cast<int>(binCoordinate(max_ - min_, cell_size_)) + 1;
}

double AxisQuantizer::rank(AxisValue const& value) const {
    return rankOrThrow(value);
}

int AxisQuantizer::cellIndex(AxisValue const& value) const {
    double r = rankOrThrow(value);
    if (r < min_ || r > max_) {
        throw ConfigError("Axis " + axis_name_ + ": value " + axisValueToString(value) +
                          " lies outside the configured range");
    }
    int index = static_cast<int>(binCoordinate(r - min_, cell_size_));
    return std::min(index, cellCount() - 1);
}

AxisConfig AxisQuantizer::toConfig() const {
    AxisConfig config;
    if (scale_ == AxisScale::Ordered) {
        config.order = order_;
        config.min = order_[static_cast<size_t>(min_)];
        config.max = order_[static_cast<size_t>(max_)];
    } else {
        config.min = min_;
        config.max = max_;
    }
    config.cell_size = cell_size_;
    return config;
}

double AxisQuantizer::rankOrThrow(AxisValue const& value) const {
    if (scale_ == AxisScale::Ordered) {
        auto it = ranks_.find(value);
        if (it == ranks_.end()) {
            throw ConfigError("Axis " + axis_name_ + ": value " + axisValueToString(value) +
                              " is absent from the explicit order");
        }
        return static_cast<double>(it->second);
    }

    auto const* number = std::get_if<double>(&value);
    if (!number) {
        throw ConfigError("Axis " + axis_name_ + ": categorical value " +
                          axisValueToString(value) + " on a numeric axis");
    }
    if (!std::isfinite(*number)) {
        throw ConfigError("Axis " + axis_name_ + ": non-finite value");
    }
    return *number;
}

double AxisQuantizer::boundRank(AxisValue const& bound, char const* which) const {
    if (scale_ == AxisScale::Numeric && !isNumeric(bound)) {
        throw ConfigError("Axis " + axis_name_ + ": " + which + " must be numeric");
    }
    return rankOrThrow(bound);
}

// ============================================================================
// Quantizer
// ============================================================================

Quantizer::Quantizer(AxisQuantizer x, AxisQuantizer y)
    : x_(std::move(x)), y_(std::move(y)) {
    auto const x_cells = static_cast<size_t>(x_.cellCount());
    auto const y_cells = static_cast<size_t>(y_.cellCount());
    if (x_cells > std::numeric_limits<size_t>::max() / y_cells) {
        throw ConfigError("Grid of " + std::to_string(x_cells) + " x " +
                          std::to_string(y_cells) + " cells is too large");
    }
}

Quantizer Quantizer::resolve(QuantizationConfig const& config,
                             std::vector<AxisValue> const& x_samples,
                             std::vector<AxisValue> const& y_samples) {
    return Quantizer(AxisQuantizer::resolve(config.x, x_samples, "x"),
                     AxisQuantizer::resolve(config.y, y_samples, "y"));
}

Cell Quantizer::cellFor(AxisValue const& x, AxisValue const& y) const {
    return Cell{x_.cellIndex(x), y_.cellIndex(y)};
}

size_t Quantizer::totalCells() const {
    return static_cast<size_t>(x_.cellCount()) * static_cast<size_t>(y_.cellCount());
}

QuantizationConfig Quantizer::toConfig() const {
    return QuantizationConfig{x_.toConfig(), y_.toConfig()};
}

} // namespace ssg
