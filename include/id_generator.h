#pragma once

#include <string>
#include <utility>

namespace ssg {

// Hands out "<prefix><n>" ids for trajectories that arrive without one.
// One generator per batch; there is no process-wide counter.
class IdGenerator {
public:
    explicit IdGenerator(std::string prefix = "trajectory_", int first = 1)
        : prefix_(std::move(prefix)), next_(first) {}

    std::string next() { return prefix_ + std::to_string(next_++); }

    int peek() const { return next_; }

private:
    std::string prefix_;
    int next_;
};

} // namespace ssg
