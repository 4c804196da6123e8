#pragma once

#include <limits>
#include <vector>

namespace ssg::measures {

// Per-trajectory values of one base measure, reduced to a mean
template <typename T = double>
class MeasureSeries {
public:
    using value_type = T;

    void push(T value) { values_.push_back(value); }

    void reserve(size_t n) { values_.reserve(n); }

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    std::vector<T> const& values() const { return values_; }

    // Arithmetic mean as a running update m += (x - m) / n.
    // Identical inputs give back the input exactly (no summation drift).
    // NaN when empty.
    T mean() const {
        if (values_.empty())
            return std::numeric_limits<T>::quiet_NaN();
        T m = values_.front();
        for (size_t i = 1; i < values_.size(); ++i) {
            m += (values_[i] - m) / static_cast<T>(i + 1);
        }
        return m;
    }

private:
    std::vector<T> values_;
};

} // namespace ssg::measures
