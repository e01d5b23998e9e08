#ifndef NESTSAMP_NESTOPTIONS_H
#define NESTSAMP_NESTOPTIONS_H

#include <iostream>
#include <optional>

#include <NestSamp/TypeDefs.h>

namespace NEST {

// which sampler produces replacement points
// AUTO: direct rejection sampling from the unit cube, switching to SLICE once its efficiency collapses
// SLICE: slice sampling from the first iteration
enum SAMPLER { AUTO, SLICE };

// how the slice sampler picks a direction for each step
// AXIS: a random coordinate axis
// HARMONIC: a uniformly random unit vector
// DIFFERENTIAL: a recent accepted walk displacement, or the difference of two live points
// MIXTURE: one of the above, at random, for every step
enum DIRECTION { AXIS, HARMONIC, DIFFERENTIAL, MIXTURE };

std::ostream& operator<<(std::ostream &os, const SAMPLER &s);
std::ostream& operator<<(std::ostream &os, const DIRECTION &d);

struct SliceOptions {
    size_t nsteps = 0;                          // accepted steps per replacement; 0 => 2 * ndim
    DIRECTION direction = MIXTURE;
    bool adaptive_nsteps = true;
    size_t max_nsteps = 0;                      // 0 => 16 * ndim
    float_type adapt_contraction_threshold = 3; // mean contractions per step above which nsteps grows
    float_type adapt_nsteps_factor = 1.5;
    size_t max_stepouts = 20;                   // per bracket end
    float_type shrink_floor = 1e-9;             // relative to the current scale
    float_type min_scale = 1e-9;
    size_t max_reseeds = 100;                   // consecutive abandoned walks before giving up
    size_t history_size = 50;                   // walk displacements kept for DIFFERENTIAL directions
};

// Run-time options of a NestSampler. Zero means "unset" for budgets.
struct NestOptions {
    size_t min_num_live_points = 400;
    size_t max_num_live_points = 0; // 0 => min_num_live_points, i.e. no growth
    size_t grow_increment = 0;      // 0 => min_num_live_points / 2
    float_type dlogz = 0.5;         // grow the live set while logzerr exceeds this

    float_type min_ess = 400;
    float_type frac_remain = 0.01;
    size_t max_ncalls = 0;
    size_t max_iters = 0;
    float_type max_seconds = 0;

    SAMPLER sampler = AUTO;
    SliceOptions slice;
    float_type direct_min_efficiency = 0.01;
    float_type direct_patience = 10; // direct rejection budget, in units of 1 / direct_min_efficiency

    size_t init_attempts_factor = 100;
    size_t batch_size = 1;
    size_t num_threads = 1;
    std::optional<size_t> seed;

    size_t log_interval = 0; // iterations between progress records; 0 => none
    size_t tie_warning_threshold = 10;
    float_type order_test_zscore = 3;
    size_t verbose = 0;
};

// resolve the ndim-dependent defaults (nsteps, max_nsteps, max live points, grow increment)
NestOptions resolve_options(const NestOptions & opts, const size_t ndim);

// @throws std::invalid_argument describing the first bad option
void check_options(const NestOptions & opts, const size_t ndim);

} // namespace NEST

#endif // NESTSAMP_NESTOPTIONS_H
