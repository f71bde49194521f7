#ifndef GPSMOOTH_PROFILER_HPP
#define GPSMOOTH_PROFILER_HPP

#pragma once

#include "gpsmooth/covariance.hpp"
#include "gpsmooth/detail/config.hpp"
#include "gpsmooth/fitter.hpp"
#include "gpsmooth/hyperparameters.hpp"
#include "gpsmooth/model.hpp"
#include "gpsmooth/observations.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

GPSMOOTH_NS_BEGIN

/**
 * @brief Criterion scores of every (family, range) cell, lower is better.
 *
 * Sized up front. Each cell is written exactly once; failed cells hold
 * +infinity.
 */
struct ScoreTable
{
    /** @brief Range candidates in grid order */
    std::vector<double> ranges;

    /** @brief Family labels */
    std::vector<std::string> families;

    ScoreTable() = default;

    ScoreTable(std::vector<double> in_ranges, std::vector<std::string> in_families);

    std::size_t n_ranges() const { return ranges.size(); }

    std::size_t n_families() const { return families.size(); }

    /**
     * @brief Number of cells
     */
    std::size_t size() const { return scores_.size(); }

    /**
     * @brief Write the score of a cell.
     *
     * @throws std::logic_error if the cell was already written
     */
    void record(std::size_t family_idx, std::size_t range_idx, double score);

    /**
     * @brief Returns true if the cell was written
     */
    bool is_recorded(std::size_t family_idx, std::size_t range_idx) const;

    /**
     * @brief Score of a cell
     */
    double at(std::size_t family_idx, std::size_t range_idx) const;

    /**
     * @brief Scores of one family in grid order
     */
    std::vector<double> family_scores(std::size_t family_idx) const;

    /**
     * @brief Copy holding only the first n_ranges grid points
     */
    ScoreTable head(std::size_t n_ranges) const;

    /**
     * @brief Returns a string representation of the table
     */
    std::string repr() const;

  private:
    std::size_t index(std::size_t family_idx, std::size_t range_idx) const;

    std::vector<double> scores_;
    std::vector<bool> recorded_;
};

/**
 * @brief Grid position of the lowest score of a family.
 *
 * @param table Score table
 * @param family_idx Family column
 * @param tie_break Which of several equal minima to return
 *
 * @throws AllCandidatesFailedError if every score of the family is +infinity
 */
std::size_t select_best_range(const ScoreTable &table, std::size_t family_idx, TieBreak tie_break);

/**
 * @brief Selection and refit of one family
 */
struct FamilyOutcome
{
    /** @brief Grid position of the best range, empty if all cells failed */
    std::optional<std::size_t> best_index;

    /** @brief Model refit at the best range */
    std::optional<FittedModel> model;

    /** @brief Reason why no model is available */
    std::string failure;
};

/**
 * @brief Score table of a profiling run plus one refit model per family
 */
struct ProfileResult
{
    /** @brief Scores of all evaluated cells */
    ScoreTable table;

    /** @brief Profiled smooths, in family order */
    std::vector<SmoothSpec> smooths;

    /** @brief Selection per family */
    std::vector<FamilyOutcome> outcomes;

    /** @brief True if the scan ended before the last grid point */
    bool stopped_early = false;

    /**
     * @brief Best range of a family
     *
     * @throws AllCandidatesFailedError if no range of the family could be fit
     */
    double best_range(std::size_t family_idx) const;

    /**
     * @brief Model refit at the best range of a family
     *
     * @throws AllCandidatesFailedError if no range of the family could be fit
     * @throws FitError if the refit itself failed
     */
    const FittedModel &model(std::size_t family_idx) const;

    /**
     * @brief (range, score) pairs of a family in grid order
     */
    std::vector<std::pair<double, double>> profile(std::size_t family_idx) const;

    /**
     * @brief Returns a string representation of the selections
     */
    std::string repr() const;
};

/**
 * @brief Profile the criterion score over a range grid for several families.
 *
 * Every (range, family) cell is fitted as an independent HPX task. Failed
 * fits and non-finite scores are recorded as +infinity. After the scan each
 * family is refit once at its best range.
 *
 * @param observations Shared observation set
 * @param grid Strictly ascending positive ranges
 * @param smooths Family descriptors with basis sizes
 * @param fitter Fitter evaluated per cell
 * @param params Tie-break, batching, early stopping and logging
 *
 * @throws DegenerateWeightError, std::invalid_argument on invalid input
 */
ProfileResult profile_ranges(const Observations &observations,
                             const std::vector<double> &grid,
                             const std::vector<SmoothSpec> &smooths,
                             std::shared_ptr<Fitter> fitter,
                             const ProfileParams &params = ProfileParams());

/**
 * @brief Range profiling problem bound to its data
 */
class RangeProfiler
{
  private:
    /** @brief Observation set */
    Observations observations_;

    /** @brief Range candidates */
    std::vector<double> grid_;

    /** @brief Profiled smooths */
    std::vector<SmoothSpec> smooths_;

    /** @brief Fitter handle */
    std::shared_ptr<Fitter> fitter_;

  public:
    /** @brief Profiler settings */
    ProfileParams params;

    /**
     * @brief Constructs a range profiler
     *
     * @param observations Observation set
     * @param grid Range candidates
     * @param smooths Smooth descriptors
     * @param fitter Fitter handle
     */
    RangeProfiler(Observations observations,
                  std::vector<double> grid,
                  std::vector<SmoothSpec> smooths,
                  std::shared_ptr<Fitter> fitter);

    /**
     * @brief Constructs a range profiler using a GPSmoothFitter
     */
    RangeProfiler(Observations observations,
                  std::vector<double> grid,
                  std::vector<SmoothSpec> smooths,
                  const FitParams &fit_params = FitParams());

    /**
     * @brief Returns profiler attributes as string.
     */
    std::string repr() const;

    /**
     * @brief Returns the observation set
     */
    const Observations &get_observations() const { return observations_; }

    /**
     * @brief Returns the range candidates
     */
    const std::vector<double> &get_grid() const { return grid_; }

    /**
     * @brief Run the scan and refit phases
     */
    ProfileResult run() const;
};

GPSMOOTH_NS_END

#endif
