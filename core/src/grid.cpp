#include "gpsmooth/grid.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

GPSMOOTH_NS_BEGIN

std::vector<double> make_range_grid(double lower, double upper, std::size_t n)
{
    if (n == 0)
    {
        throw std::invalid_argument("Error: Range grid needs at least one candidate.");
    }
    if (!(lower > 0.0) || !(upper >= lower) || !std::isfinite(upper))
    {
        throw std::invalid_argument("Error: Invalid range interval [" + std::to_string(lower) + ", "
                                    + std::to_string(upper) + "]");
    }

    std::vector<double> grid;
    grid.reserve(n);
    if (n == 1)
    {
        grid.push_back(lower);
        return grid;
    }
    const double step = (upper - lower) / static_cast<double>(n - 1);
    for (std::size_t i = 0; i < n; i++)
    {
        grid.push_back(lower + step * static_cast<double>(i));
    }
    // exact end point
    grid.back() = upper;
    validate_grid(grid);
    return grid;
}

std::vector<double> make_range_grid_by_step(double lower, double upper, double step)
{
    if (!(step > 0.0) || !(lower > 0.0) || !(upper >= lower) || !std::isfinite(upper))
    {
        throw std::invalid_argument("Error: Invalid range sequence from " + std::to_string(lower) + " to "
                                    + std::to_string(upper) + " by " + std::to_string(step));
    }

    // Tolerate round-off at the upper end the way seq(by=) does
    const auto n = static_cast<std::size_t>(std::floor((upper - lower) / step + 1e-10)) + 1;
    std::vector<double> grid;
    grid.reserve(n);
    for (std::size_t i = 0; i < n; i++)
    {
        grid.push_back(lower + step * static_cast<double>(i));
    }
    return grid;
}

void validate_grid(const std::vector<double> &grid)
{
    if (grid.empty())
    {
        throw std::invalid_argument("Error: Range grid is empty.");
    }
    for (std::size_t i = 0; i < grid.size(); i++)
    {
        if (!(grid[i] > 0.0) || !std::isfinite(grid[i]))
        {
            throw std::invalid_argument("Error: Range candidate " + std::to_string(i) + " is not positive and finite: "
                                        + std::to_string(grid[i]));
        }
        if (i > 0 && !(grid[i] > grid[i - 1]))
        {
            throw std::invalid_argument("Error: Range grid is not strictly ascending at position "
                                        + std::to_string(i));
        }
    }
}

GPSMOOTH_NS_END
