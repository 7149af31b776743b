// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <deque>

namespace voxcap
{

/// @brief Arithmetic mean over the most recent N values.
class MovingAverage
{
  public:
    explicit MovingAverage(std::size_t window): _window(window == 0 ? 1 : window) {}

    /// @brief Adds a value, evicting the oldest one once the window is full.
    /// @return The mean of the values currently in the window.
    auto push(double value) -> double
    {
        _values.push_back(value);
        _sum += value;
        if (_values.size() > _window)
        {
            _sum -= _values.front();
            _values.pop_front();
        }
        return average();
    }

    [[nodiscard]] auto average() const noexcept -> double
    {
        if (_values.empty())
            return 0.0;
        return _sum / static_cast<double>(_values.size());
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return _values.size(); }
    [[nodiscard]] auto window() const noexcept -> std::size_t { return _window; }

    void clear()
    {
        _values.clear();
        _sum = 0.0;
    }

  private:
    std::size_t _window;
    std::deque<double> _values;
    double _sum = 0.0;
};

} // namespace voxcap
