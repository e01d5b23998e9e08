#ifndef NESTSAMP_CONVERGENCE_H
#define NESTSAMP_CONVERGENCE_H

#include <chrono>
#include <functional>
#include <iostream>
#include <limits>

#include <NestSamp/TypeDefs.h>
#include <NestSamp/NestOptions.h>

namespace NEST {

enum STATUS { CONVERGED, BUDGET_EXHAUSTED };

// why a run stopped; NONE while it is still going
// PLATEAU: every live point shares the threshold log-likelihood and no sampler found a point above it
enum STOP_REASON { NONE, MAX_NCALLS, MAX_ITERS, DEADLINE, CANCELLED, MIN_ESS, FRAC_REMAIN, PLATEAU };

std::ostream& operator<<(std::ostream &os, const STATUS &s);
std::ostream& operator<<(std::ostream &os, const STOP_REASON &r);

// what the monitor looks at after every iteration
struct RunState {
    size_t ncall = 0;
    size_t niter = 0;
    float_type logz = -std::numeric_limits<float_type>::infinity();
    float_type remainder_logz = std::numeric_limits<float_type>::infinity();
    float_type ess = 0;
};

// what is reported every `log_interval` iterations
struct ProgressRecord {
    size_t iteration;
    size_t ncall;
    float_type logz;
    float_type logzerr;
    size_t nlive;
    float_type threshold;
    float_type efficiency;
};

// Decides when a run ends. Criteria, in priority order:
//  (a) call / iteration budget, wall-clock deadline, or cancellation -> BUDGET_EXHAUSTED
//  (b) effective sample size reached `min_ess` -> CONVERGED
//  (c) remaining evidence below `frac_remain` of the accumulated evidence -> CONVERGED
// A PLATEAU stop is decided by the controller, and also counts as CONVERGED: the drained live
// points integrate the flat top exactly.
class ConvergenceMonitor {
    public:
        typedef std::function<bool()> CancelHook;

        ConvergenceMonitor(const NestOptions & opts, CancelHook cancel = nullptr);

        // the clock for `max_seconds` starts here
        void start();

        STOP_REASON should_stop(const RunState & state) const;

        static STATUS status(const STOP_REASON reason);

    private:
        const size_t _max_ncalls;
        const size_t _max_iters;
        const float_type _max_seconds;
        const float_type _min_ess;
        const float_type _log_frac_remain;
        CancelHook _cancel;
        std::chrono::steady_clock::time_point _start;
};

} // namespace NEST

#endif // NESTSAMP_CONVERGENCE_H
