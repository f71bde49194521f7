#include "gpsmooth/utils.hpp"

#include <catch2/catch_session.hpp>

// The HPX runtime can be started only once per process, so it spans all test cases.
int main(int argc, char *argv[])
{
    // Initialize HPX with no arguments, don't run hpx_main
    gpsmooth::start_hpx_runtime(0, nullptr);

    const int result = Catch::Session().run(argc, argv);

    // Stop the HPX runtime
    gpsmooth::stop_hpx_runtime();
    return result;
}
