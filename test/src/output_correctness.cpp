#include "gpsmooth/grid.hpp"
#include "gpsmooth/observations.hpp"
#include "gpsmooth/profiler.hpp"

#include "test_data.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

// This is a standalone test, so including this directly is fine.
// Better than having the whole project depend on compiled Boost.Json!
#include <boost/json/src.hpp>

// std headers last
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>

// This logic is basically equivalent to the gpsmooth C++ example with its default options.
gpsmooth::ProfileResult profile_series(const std::string &series_path)
{
    const auto observations = gpsmooth::load_observations(series_path);
    gpsmooth::RangeProfiler profiler(
        observations,
        gpsmooth::make_range_grid(10.0, 500.0, 50),
        { gpsmooth::SmoothSpec(gpsmooth::matern(1.5), 20, "matern"),
          gpsmooth::SmoothSpec(gpsmooth::squared_exponential(), 20, "squared_exponential") });
    profiler.params.log_failures = false;
    return profiler.run();
}

gpsmooth_results to_results(const gpsmooth::ProfileResult &result)
{
    gpsmooth_results results;
    results.ranges = result.table.ranges;
    results.scores.resize(result.table.n_families());
    results.failed.resize(result.table.n_families());

    std::vector<double> x;
    for (std::size_t i = 0; i < 20; i++)
    {
        x.push_back(50.0 * static_cast<double>(i));
    }
    for (std::size_t f = 0; f < result.table.n_families(); f++)
    {
        for (const double score : result.table.family_scores(f))
        {
            set_score(results, f, score);
        }
        if (result.outcomes[f].model)
        {
            const auto &model = *result.outcomes[f].model;
            const auto mean_se = gpsmooth::predict_with_uncertainty(model, x);
            results.best_ranges.push_back(result.best_range(f));
            results.edf.push_back(model.edf);
            results.mean.push_back(mean_se[0]);
            results.se.push_back(mean_se[1]);
        }
        else
        {
            results.best_ranges.push_back(0.0);
            results.edf.push_back(0.0);
            results.mean.emplace_back();
            results.se.emplace_back();
        }
    }
    return results;
}

bool load_or_create_expected_results(
    const std::string &filename, const gpsmooth_results &fallback_results, gpsmooth_results &results)
{
    // First try to read our expected results file
    {
        std::ifstream ifs(filename);
        if (!ifs.fail())
        {
            using iterator_type = std::istreambuf_iterator<char>;
            const std::string content(iterator_type{ ifs }, iterator_type{});
            results = boost::json::value_to<gpsmooth_results>(boost::json::parse(content));
            return true;
        }
    }

    // If that doesn't work, just write out the results we want
    std::ofstream fout(filename);
    fout << boost::json::value_from(fallback_results);
    return false;
}

std::string get_root_directory()
{
    const char *env_root = std::getenv("GPSMOOTH_ROOT");
    if (env_root)
    {
        return env_root;
    }
    return "../data";
}

TEST_CASE("Profile of the noisy sinusoid covers the whole grid", "[integration][profile]")
{
    const std::string root = get_root_directory();
    const auto result = profile_series(root + "/series/series.csv");

    REQUIRE(result.table.n_ranges() == 50);
    REQUIRE(result.table.n_families() == 2);
    REQUIRE(result.table.size() == 100);
    REQUIRE_FALSE(result.stopped_early);

    for (std::size_t f = 0; f < 2; f++)
    {
        for (std::size_t r = 0; r < 50; r++)
        {
            REQUIRE(result.table.is_recorded(f, r));
        }
    }

    // the Matern smooth is well conditioned at every candidate range
    for (const double score : result.table.family_scores(0))
    {
        REQUIRE(std::isfinite(score));
    }

    for (std::size_t f = 0; f < 2; f++)
    {
        INFO("family " << result.table.families[f]);
        const auto scores = result.table.family_scores(f);
        const double best = result.best_range(f);
        const auto pos = std::find(result.table.ranges.begin(), result.table.ranges.end(), best);
        REQUIRE(pos != result.table.ranges.end());

        const double best_score = scores[static_cast<std::size_t>(pos - result.table.ranges.begin())];
        REQUIRE(std::isfinite(best_score));
        REQUIRE(best_score == *std::min_element(scores.begin(), scores.end()));
        REQUIRE_THAT(result.model(f).criterion_score, Catch::Matchers::WithinRel(best_score, 1e-12));
        REQUIRE(result.model(f).range() == best);
    }
}

// series.csv samples a sinusoid of period 400, whose autocorrelation first
// crosses zero at a quarter period.
constexpr double series_effective_length = 400.0 / 4.0;

TEST_CASE("Best ranges fall near the effective length of the sinusoid", "[integration][profile]")
{
    const std::string root = get_root_directory();
    const auto result = profile_series(root + "/series/series.csv");

    for (std::size_t f = 0; f < 2; f++)
    {
        INFO("family " << result.table.families[f]);
        const double best = result.best_range(f);
        REQUIRE(best >= series_effective_length / 2.0);
        REQUIRE(best <= series_effective_length * 2.0);

        // the finite part of the curve falls to the best range and rises after it
        const auto scores = result.table.family_scores(f);
        double previous = std::numeric_limits<double>::infinity();
        bool past_best = false;
        for (std::size_t r = 0; r < scores.size(); r++)
        {
            if (!std::isfinite(scores[r]))
            {
                continue;
            }
            INFO("range " << result.table.ranges[r]);
            if (past_best)
            {
                REQUIRE(scores[r] >= previous);
            }
            else
            {
                REQUIRE(scores[r] <= previous);
            }
            past_best = past_best || result.table.ranges[r] == best;
            previous = scores[r];
        }
    }
}

TEST_CASE("Profiling twice gives identical scores", "[integration][profile]")
{
    const std::string root = get_root_directory();
    const auto first = profile_series(root + "/series/series.csv");
    const auto second = profile_series(root + "/series/series.csv");

    for (std::size_t f = 0; f < 2; f++)
    {
        const auto a = first.table.family_scores(f);
        const auto b = second.table.family_scores(f);
        REQUIRE(a == b);
        REQUIRE(first.best_range(f) == second.best_range(f));
    }
}

TEST_CASE("Profile results match known-good values", "[integration][profile]")
{
    const std::string root = get_root_directory();
    const auto results = to_results(profile_series(root + "/series/series.csv"));

    gpsmooth_results expected_results;
    if (!load_or_create_expected_results(root + "/series/output.json", results, expected_results))
    {
        std::cerr << "No previous results to compare to. The current results have been saved instead!" << std::endl;
        FAIL("missing " << root << "/series/output.json");
    }

    // First we check for equal size
    REQUIRE(results.ranges.size() == expected_results.ranges.size());
    REQUIRE(results.scores.size() == expected_results.scores.size());
    REQUIRE(results.best_ranges.size() == expected_results.best_ranges.size());
    REQUIRE(results.mean.size() == expected_results.mean.size());

    // Now we can compare content
    using Catch::Matchers::WithinAbs;
    using Catch::Matchers::WithinRel;
    double eps = std::numeric_limits<double>::epsilon() * 1'000'000;
    for (std::size_t f = 0, n = results.scores.size(); f != n; ++f)
    {
        REQUIRE(results.failed[f] == expected_results.failed[f]);
        REQUIRE_THAT(results.best_ranges[f], WithinRel(expected_results.best_ranges[f], eps));
        REQUIRE_THAT(results.edf[f], WithinRel(expected_results.edf[f], 1e-6));
        for (std::size_t r = 0, m = results.scores[f].size(); r != m; ++r)
        {
            INFO("score " << f << " " << r);
            REQUIRE_THAT(results.scores[f][r], WithinRel(expected_results.scores[f][r], 1e-6));
        }
        REQUIRE(results.mean[f].size() == expected_results.mean[f].size());
        for (std::size_t i = 0, m = results.mean[f].size(); i != m; ++i)
        {
            INFO("mean " << f << " " << i);
            REQUIRE_THAT(results.mean[f][i], WithinAbs(expected_results.mean[f][i], 1e-5));
            REQUIRE_THAT(results.se[f][i], WithinAbs(expected_results.se[f][i], 1e-5));
        }
    }
}
