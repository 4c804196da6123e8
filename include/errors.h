#pragma once

#include <stdexcept>
#include <string>

namespace ssg {

// Base for every error raised by the grid core
class Error : public std::runtime_error {
public:
    explicit Error(std::string const& message) : std::runtime_error(message) {}
};

// Malformed trajectory input (length mismatch, decreasing timestamps, ...)
class ValidationError : public Error {
public:
    using Error::Error;
};

// Quantization cannot be resolved (value missing from an explicit order,
// categorical axis without an order, invalid range or cell size)
class ConfigError : public Error {
public:
    using Error::Error;
};

// A measure cannot be computed at all (e.g. no trajectories supplied).
// Undefined-but-valid numeric cases use a NaN sentinel instead.
class ComputeError : public Error {
public:
    using Error::Error;
};

} // namespace ssg
