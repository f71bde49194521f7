#include "gpsmooth/profiler.hpp"

#include "gpsmooth/detail/async_helpers.hpp"
#include "gpsmooth/errors.hpp"
#include "gpsmooth/grid.hpp"
#include "gpsmooth/performance_counters.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <hpx/future.hpp>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

GPSMOOTH_NS_BEGIN

namespace
{

constexpr double failed_score = std::numeric_limits<double>::infinity();

double score_cell(const Fitter &fitter,
                  const Observations &observations,
                  const SmoothSpec &smooth,
                  double range,
                  bool log_failures)
{
    double score;
    try
    {
        score = fitter.fit(observations, smooth, range).criterion_score;
    }
    catch (const FitError &e)
    {
        if (log_failures)
        {
            std::cerr << "gpsmooth: fit of " << smooth.name() << " at range " << range << " failed: " << e.what()
                      << std::endl;
        }
        track_cell_failure();
        return failed_score;
    }

    if (!fitter.lower_is_better())
    {
        score = -score;
    }
    if (!std::isfinite(score))
    {
        if (log_failures)
        {
            std::cerr << "gpsmooth: fit of " << smooth.name() << " at range " << range << " has non-finite score"
                      << std::endl;
        }
        track_cell_failure();
        return failed_score;
    }
    track_cell_fit();
    return score;
}

FittedModel refit(const Fitter &fitter, const Observations &observations, const SmoothSpec &smooth, double range)
{
    return fitter.fit(observations, smooth, range);
}

void validate_setup(const Observations &observations,
                    const std::vector<double> &grid,
                    const std::vector<SmoothSpec> &smooths,
                    const Fitter *fitter)
{
    validate_observations(observations);
    validate_grid(grid);
    if (smooths.empty())
    {
        throw std::invalid_argument("Error: No covariance family to profile.");
    }
    if (fitter == nullptr)
    {
        throw std::invalid_argument("Error: No fitter given.");
    }
    const std::size_t n_distinct = distinct_covariates(observations).size();
    for (const auto &smooth : smooths)
    {
        validate_family(smooth.family);
        if (smooth.basis_size <= 2 || smooth.basis_size > n_distinct)
        {
            throw std::invalid_argument("Error: Basis size " + std::to_string(smooth.basis_size) + " of "
                                        + smooth.name() + " must be in (2, " + std::to_string(n_distinct)
                                        + "], the number of distinct covariate values.");
        }
        fitter->validate(observations, smooth);
    }
}

}  // namespace

///////////////////////////////////////////////////////////
// Score table

ScoreTable::ScoreTable(std::vector<double> in_ranges, std::vector<std::string> in_families) :
    ranges(std::move(in_ranges)),
    families(std::move(in_families)),
    scores_(ranges.size() * families.size(), failed_score),
    recorded_(ranges.size() * families.size(), false)
{ }

std::size_t ScoreTable::index(std::size_t family_idx, std::size_t range_idx) const
{
    if (family_idx >= n_families() || range_idx >= n_ranges())
    {
        throw std::out_of_range("Score table cell (" + std::to_string(family_idx) + ", " + std::to_string(range_idx)
                                + ") is outside " + std::to_string(n_families()) + " x "
                                + std::to_string(n_ranges()));
    }
    return family_idx * n_ranges() + range_idx;
}

void ScoreTable::record(std::size_t family_idx, std::size_t range_idx, double score)
{
    const std::size_t i = index(family_idx, range_idx);
    if (recorded_[i])
    {
        throw std::logic_error("Score table cell (" + std::to_string(family_idx) + ", " + std::to_string(range_idx)
                               + ") written twice");
    }
    scores_[i] = score;
    recorded_[i] = true;
}

bool ScoreTable::is_recorded(std::size_t family_idx, std::size_t range_idx) const
{
    return recorded_[index(family_idx, range_idx)];
}

double ScoreTable::at(std::size_t family_idx, std::size_t range_idx) const
{
    return scores_[index(family_idx, range_idx)];
}

std::vector<double> ScoreTable::family_scores(std::size_t family_idx) const
{
    const std::size_t begin = index(family_idx, 0);
    return std::vector<double>(scores_.begin() + static_cast<std::ptrdiff_t>(begin),
                               scores_.begin() + static_cast<std::ptrdiff_t>(begin + n_ranges()));
}

ScoreTable ScoreTable::head(std::size_t n) const
{
    n = std::min(n, n_ranges());
    ScoreTable out(std::vector<double>(ranges.begin(), ranges.begin() + static_cast<std::ptrdiff_t>(n)), families);
    for (std::size_t f = 0; f < n_families(); f++)
    {
        for (std::size_t r = 0; r < n; r++)
        {
            if (is_recorded(f, r))
            {
                out.record(f, r, at(f, r));
            }
        }
    }
    return out;
}

std::string ScoreTable::repr() const
{
    std::ostringstream oss;
    oss << "ScoreTable: [n_ranges=" << n_ranges() << ", n_families=" << n_families() << ", families=[";
    for (std::size_t f = 0; f < n_families(); f++)
    {
        oss << (f > 0 ? ", " : "") << families[f];
    }
    oss << "]]";
    return oss.str();
}

std::size_t select_best_range(const ScoreTable &table, std::size_t family_idx, TieBreak tie_break)
{
    const std::vector<double> scores = table.family_scores(family_idx);
    std::size_t best = scores.size();
    for (std::size_t r = 0; r < scores.size(); r++)
    {
        if (!std::isfinite(scores[r]))
        {
            continue;
        }
        if (best == scores.size() || scores[r] < scores[best]
            || (tie_break == TieBreak::last_in_grid && scores[r] == scores[best]))
        {
            best = r;
        }
    }
    if (best == scores.size())
    {
        throw AllCandidatesFailedError(table.families[family_idx]);
    }
    return best;
}

///////////////////////////////////////////////////////////
// Profile result

double ProfileResult::best_range(std::size_t family_idx) const
{
    const auto &outcome = outcomes.at(family_idx);
    if (!outcome.best_index)
    {
        throw AllCandidatesFailedError(table.families[family_idx]);
    }
    return table.ranges[*outcome.best_index];
}

const FittedModel &ProfileResult::model(std::size_t family_idx) const
{
    const auto &outcome = outcomes.at(family_idx);
    if (!outcome.best_index)
    {
        throw AllCandidatesFailedError(table.families[family_idx]);
    }
    if (!outcome.model)
    {
        throw FitError(outcome.failure);
    }
    return *outcome.model;
}

std::vector<std::pair<double, double>> ProfileResult::profile(std::size_t family_idx) const
{
    std::vector<std::pair<double, double>> pairs;
    pairs.reserve(table.n_ranges());
    for (std::size_t r = 0; r < table.n_ranges(); r++)
    {
        pairs.emplace_back(table.ranges[r], table.at(family_idx, r));
    }
    return pairs;
}

std::string ProfileResult::repr() const
{
    std::ostringstream oss;
    oss << std::setprecision(8);
    oss << "ProfileResult: [" << table.repr() << ", stopped_early=" << stopped_early;
    for (std::size_t f = 0; f < outcomes.size(); f++)
    {
        oss << ", " << table.families[f] << "=";
        if (outcomes[f].best_index)
        {
            oss << "{best_range=" << table.ranges[*outcomes[f].best_index]
                << ", score=" << table.at(f, *outcomes[f].best_index) << "}";
        }
        else
        {
            oss << "{failed}";
        }
    }
    oss << "]";
    return oss.str();
}

///////////////////////////////////////////////////////////
// Profiling

ProfileResult profile_ranges(const Observations &observations,
                             const std::vector<double> &grid,
                             const std::vector<SmoothSpec> &smooths,
                             std::shared_ptr<Fitter> fitter,
                             const ProfileParams &params)
{
    GPSMOOTH_TIME_FUNCTION(&profile_ranges);
    validate_setup(observations, grid, smooths, fitter.get());

    std::vector<std::string> labels;
    for (const auto &smooth : smooths)
    {
        labels.push_back(smooth.name());
    }

    ProfileResult result;
    result.smooths = smooths;
    result.table = ScoreTable(grid, labels);

    const std::size_t n_ranges = grid.size();
    const std::size_t n_families = smooths.size();
    const std::size_t batch_size = params.batch_size == 0 ? n_ranges : params.batch_size;

    // scan phase: only scores leave the tasks
    std::size_t done = 0;
    while (done < n_ranges)
    {
        const std::size_t end = std::min(done + batch_size, n_ranges);
        std::vector<hpx::future<double>> futures;
        futures.reserve((end - done) * n_families);
        for (std::size_t r = done; r < end; r++)
        {
            for (std::size_t f = 0; f < n_families; f++)
            {
                futures.push_back(detail::named_async(
                    "score_cell",
                    &score_cell,
                    std::cref(*fitter),
                    std::cref(observations),
                    std::cref(smooths[f]),
                    grid[r],
                    params.log_failures));
            }
        }
        // all tasks reference caller data, so none may outlive this scope;
        // failures surface through get() below
        hpx::wait_all_nothrow(futures);

        std::size_t i = 0;
        for (std::size_t r = done; r < end; r++)
        {
            for (std::size_t f = 0; f < n_families; f++)
            {
                result.table.record(f, r, futures[i++].get());
            }
        }
        done = end;

        if (params.verbose)
        {
            std::cerr << "gpsmooth: scanned " << done << " of " << n_ranges << " ranges" << std::endl;
        }
        if (done < n_ranges && params.stop_early && params.stop_early(result.table.head(done)))
        {
            if (params.verbose)
            {
                std::cerr << "gpsmooth: stopping early after range " << grid[done - 1] << std::endl;
            }
            result.table = result.table.head(done);
            result.stopped_early = true;
            break;
        }
    }

    // refit phase: one model per family at its best range
    result.outcomes.resize(n_families);
    std::vector<std::size_t> refit_families;
    std::vector<hpx::future<FittedModel>> refits;
    for (std::size_t f = 0; f < n_families; f++)
    {
        try
        {
            result.outcomes[f].best_index = select_best_range(result.table, f, params.tie_break);
        }
        catch (const AllCandidatesFailedError &e)
        {
            result.outcomes[f].failure = e.what();
            if (params.log_failures)
            {
                std::cerr << "gpsmooth: " << e.what() << std::endl;
            }
            continue;
        }
        refit_families.push_back(f);
        refits.push_back(detail::named_async("refit",
                                             &refit,
                                             std::cref(*fitter),
                                             std::cref(observations),
                                             std::cref(smooths[f]),
                                             result.table.ranges[*result.outcomes[f].best_index]));
    }
    // a failed refit only affects its own family
    hpx::wait_all_nothrow(refits);

    for (std::size_t i = 0; i < refits.size(); i++)
    {
        auto &outcome = result.outcomes[refit_families[i]];
        try
        {
            outcome.model = refits[i].get();
        }
        catch (const FitError &e)
        {
            outcome.failure = e.what();
            if (params.log_failures)
            {
                std::cerr << "gpsmooth: refit of " << labels[refit_families[i]] << " failed: " << e.what()
                          << std::endl;
            }
        }
        if (params.verbose && outcome.model)
        {
            std::cerr << "gpsmooth: " << labels[refit_families[i]] << " best range "
                      << result.table.ranges[*outcome.best_index] << ", " << outcome.model->repr() << std::endl;
        }
    }
    return result;
}

///////////////////////////////////////////////////////////
// Range profiler

RangeProfiler::RangeProfiler(Observations observations,
                             std::vector<double> grid,
                             std::vector<SmoothSpec> smooths,
                             std::shared_ptr<Fitter> fitter) :
    observations_(std::move(observations)),
    grid_(std::move(grid)),
    smooths_(std::move(smooths)),
    fitter_(std::move(fitter))
{ }

RangeProfiler::RangeProfiler(Observations observations,
                             std::vector<double> grid,
                             std::vector<SmoothSpec> smooths,
                             const FitParams &fit_params) :
    RangeProfiler(std::move(observations),
                  std::move(grid),
                  std::move(smooths),
                  std::make_shared<GPSmoothFitter>(fit_params))
{ }

std::string RangeProfiler::repr() const
{
    std::ostringstream oss;
    oss << std::setprecision(8);

    // clang-format off
    oss << "RangeProfiler: [" << observations_.repr()
                       << ", n_ranges=" << grid_.size();
    if (!grid_.empty())
    {
        oss << ", ranges=[" << grid_.front() << ", " << grid_.back() << "]";
    }
    oss << ", smooths=[";
    for (std::size_t f = 0; f < smooths_.size(); f++)
    {
        oss << (f > 0 ? ", " : "") << smooths_[f].repr();
    }
    oss << "], fitter=" << (fitter_ ? fitter_->repr() : std::string("none"))
        << ", " << params.repr() << "]";
    // clang-format on

    return oss.str();
}

ProfileResult RangeProfiler::run() const { return profile_ranges(observations_, grid_, smooths_, fitter_, params); }

GPSMOOTH_NS_END
