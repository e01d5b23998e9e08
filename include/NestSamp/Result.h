#ifndef NESTSAMP_RESULT_H
#define NESTSAMP_RESULT_H

#include <optional>
#include <string>
#include <vector>
#include <gsl/gsl_rng.h>

#include <NestSamp/TypeDefs.h>
#include <NestSamp/Convergence.h>

namespace NEST {

struct ParameterSummary {
    std::string name;
    float_type mean;
    float_type sd;
    float_type median;
    float_type q05;
    float_type q95;
};

// Recoverable events of a run, and the state of the samplers at its end
struct Diagnostics {
    size_t nstuck = 0;   // abandoned slice walks
    size_t nties = 0;    // candidates rejected for equalling the threshold
    size_t nplateau = 0; // iterations whose threshold equalled the previous one
    size_t ngrow = 0;    // live points added after initialization
    std::optional<size_t> switch_iteration; // when AUTO changed from direct to slice sampling
    float_type order_test_zscore = 0.0;
    std::vector<size_t> order_test_runs; // iterations between significant order test results
    float_type direct_efficiency = 0.0;
    float_type slice_efficiency = 0.0;
    size_t slice_nsteps = 0;
    float_type elapsed_seconds = 0.0;
};

// The outcome of a run. Samples are the dead points in order of death, live points drained last;
// rows of `samples` (physical space) align with `logl`, `logvol` and `weights`.
struct Result {
    STATUS status = BUDGET_EXHAUSTED;
    STOP_REASON stop_reason = NONE;

    float_type logz = -std::numeric_limits<float_type>::infinity();
    float_type logzerr = 0.0;
    float_type information = 0.0;
    float_type ess = 0.0;
    size_t ncall = 0;
    size_t niter = 0;
    size_t nlive = 0; // at the stop, before the live points were drained

    std::vector<std::string> names; // parameter short names, one per column
    Mat2D samples;
    Col logl;
    Col logvol;
    Col weights; // normalized

    std::vector<ParameterSummary> summary;
    Diagnostics diagnostics;

    size_t npar() const { return samples.cols(); }
    size_t size() const { return samples.rows(); }

    Row posterior_mean() const;

    // `n` samples drawn with replacement, proportional to weight; n = 0 => ceil(ess)
    Mat2D resample_equal(const gsl_rng * rng, const size_t n = 0) const;

    // fill `summary` from the weighted samples
    void summarize();
};

} // namespace NEST

#endif // NESTSAMP_RESULT_H
