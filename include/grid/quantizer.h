#pragma once

#include "grid/cell.h"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ssg {

// Raw sample on one axis: a number or a categorical label
using AxisValue = std::variant<double, std::string>;

std::string axisValueToString(AxisValue const& value);

// How ranks are assigned to values on an axis
enum class AxisScale {
    Numeric, // Natural numeric order, rank == value
    Ordered  // Caller-supplied sequence, rank == position in the sequence
};

// Per-axis quantization settings. Every field is optional; unset fields are
// inferred from the samples when the quantization is resolved.
//   order:     explicit value sequence (required for categorical labels)
//   min/max:   range in value space (number, or member of `order`)
//   cell_size: ranks per cell (defaults to 1)
struct AxisConfig {
    std::optional<std::vector<AxisValue>> order;
    std::optional<AxisValue> min;
    std::optional<AxisValue> max;
    std::optional<double> cell_size;

    bool operator==(AxisConfig const&) const = default;
};

struct QuantizationConfig {
    AxisConfig x;
    AxisConfig y;

    bool operator==(QuantizationConfig const&) const = default;
};

// Resolved quantization of one axis: raw value -> rank -> cell index
class AxisQuantizer {
public:
    // Resolve `config` against the observed `samples` of this axis.
    // Every sample is checked, so a successful resolve guarantees that
    // cellIndex() accepts all of them.
    // Throws ConfigError when the axis cannot be resolved.
    static AxisQuantizer resolve(AxisConfig const& config,
                                 std::vector<AxisValue> const& samples,
                                 std::string const& axis_name);

    AxisScale scale() const { return scale_; }
    std::vector<AxisValue> const& order() const { return order_; }
    double min() const { return min_; }
    double max() const { return max_; }
    double cellSize() const { return cell_size_; }

    // Number of cells along this axis (resolve() rejects ranges that would
    // exceed INT_MAX cells)
    int cellCount() const;

    // Rank of a raw value; throws ConfigError if the value has no rank
    double rank(AxisValue const& value) const;

    // Cell index of a raw value; throws ConfigError if outside [min, max].
    // (rank - min) / cell_size is nudged up by a relative 1e-12 before
    // flooring, so a quotient that should be a whole number (0.3 / 0.1) lands
    // in the cell it starts; 0.9999999995 with cell size 1 stays in cell 0.
    int cellIndex(AxisValue const& value) const;

    // Snapshot of the resolved settings (order, min, max, cell size)
    AxisConfig toConfig() const;

    bool operator==(AxisQuantizer const&) const = default;

private:
    AxisScale scale_ = AxisScale::Numeric;
    std::string axis_name_;
    std::vector<AxisValue> order_;
    std::map<AxisValue, int> ranks_;
    double min_ = 0.0;
    double max_ = 0.0;
    double cell_size_ = 1.0;

    double rankOrThrow(AxisValue const& value) const;
    double boundRank(AxisValue const& bound, char const* which) const;
};

// Two-axis quantization shared by every trajectory of a grid
class Quantizer {
public:
    Quantizer() = default;
    // Throws ConfigError if the cell count product overflows size_t
    Quantizer(AxisQuantizer x, AxisQuantizer y);

    static Quantizer resolve(QuantizationConfig const& config,
                             std::vector<AxisValue> const& x_samples,
                             std::vector<AxisValue> const& y_samples);

    AxisQuantizer const& x() const { return x_; }
    AxisQuantizer const& y() const { return y_; }

    Cell cellFor(AxisValue const& x, AxisValue const& y) const;

    // Realizable (x_bin, y_bin) pairs
    size_t totalCells() const;

    QuantizationConfig toConfig() const;

    bool operator==(Quantizer const&) const = default;

private:
    AxisQuantizer x_;
    AxisQuantizer y_;
};

} // namespace ssg
