#ifndef NESTSAMP_INTEGRATOR_H
#define NESTSAMP_INTEGRATOR_H

#include <limits>
#include <vector>

#include <NestSamp/TypeDefs.h>
#include <NestSamp/LivePoints.h>

namespace NEST {

// Accumulates the evidence from the sequence of dead points.
//
// Everything is kept in log space. After dead point i, recorded with N_i live points, the
// prior volume is X_i = X_{i-1} exp(-1/N_i) and the shell width is w_i = X_{i-1} - X_i.
// The running evidence uses the trapezoid rule Z += (L_{i-1} + L_i) w_i / 2, with L_0 = 0,
// and the information H is updated alongside.
//
// The run may start from a prior volume below one: when part of the prior has a log-likelihood
// of -inf, the live points are drawn from the rest, whose volume is only estimated. Its log and
// the variance of that log enter the volumes and `logzerr`.
//
// The integrator owns the dead points; they are handed over by `record` and never returned.
class Integrator {
    public:
        Integrator(const float_type log_start_volume = 0.0, const float_type start_variance = 0.0);

        void record(LivePoint && dead, const size_t nlive, const size_t iteration);

        float_type logz() const { return _logz; }
        float_type information() const { return _information; }
        // sqrt(H / N + var(log X_0)), with N the live count at the last record, or the one given
        float_type logzerr() const { return logzerr(_last_nlive); }
        float_type logzerr(const size_t nlive) const;
        float_type logvol() const { return _logvol; }
        // effective sample size of the (rectangle rule) weights so far
        float_type ess() const;

        // upper bound on the evidence not yet accumulated
        float_type remainder_logz(const float_type max_live_logl) const { return max_live_logl + _logvol; }

        size_t size() const { return _dead.size(); }
        const std::vector<LivePoint> & dead_points() const { return _dead; }
        const std::vector<size_t> & iterations() const { return _iteration; }
        Col logls() const;
        Col logvols() const;

        // Posterior log-weights: (L_i / 2) (w_i + w_{i+1}), the last point also receiving L_n X_n
        // for the remaining volume. Unnormalized; their logsumexp is the final evidence.
        Col log_weights() const;
        // normalized posterior weights, summing to one
        Col weights() const;

    private:
        std::vector<LivePoint> _dead;
        std::vector<float_type> _logwidth;
        std::vector<float_type> _logvols;
        std::vector<size_t> _iteration;

        float_type _logz = -std::numeric_limits<float_type>::infinity();
        float_type _information = 0.0;
        float_type _logvol;
        const float_type _start_variance;
        float_type _last_logl = -std::numeric_limits<float_type>::infinity();
        size_t _last_nlive = 0;

        float_type _log_sum_w = -std::numeric_limits<float_type>::infinity();
        float_type _log_sum_w2 = -std::numeric_limits<float_type>::infinity();
};

} // namespace NEST

#endif // NESTSAMP_INTEGRATOR_H
