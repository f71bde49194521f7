#include "gpsmooth/utils.hpp"

#include <iostream>

GPSMOOTH_NS_BEGIN

void print_vector(const std::vector<double> &vec, int start, int end, const std::string &separator)
{
    // Convert negative indices to positive
    if (start < 0)
    {
        start += static_cast<int>(vec.size());
    }
    if (end < 0)
    {
        end += static_cast<int>(vec.size()) + 1;
    }

    // Ensure the indices are within bounds
    if (start < 0)
    {
        start = 0;
    }
    if (end > static_cast<int>(vec.size()))
    {
        end = static_cast<int>(vec.size());
    }

    // Validate the range
    if (start >= static_cast<int>(vec.size()) || start >= end)
    {
        std::cerr << "Invalid range" << std::endl;
        return;
    }

    for (int i = start; i < end; i++)
    {
        std::cout << vec[static_cast<std::size_t>(i)];
        if (i < end - 1)
        {
            std::cout << separator;
        }
    }
    std::cout << std::endl;
}

void start_hpx_runtime(int argc, char **argv) { hpx::start(nullptr, argc, argv); }

void stop_hpx_runtime()
{
    hpx::post([]() { hpx::finalize(); });
    hpx::stop();
}

GPSMOOTH_NS_END
