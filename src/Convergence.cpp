#include <NestSamp/Convergence.h>

#include <cmath>

namespace NEST {

std::ostream& operator<<(std::ostream &os, const STATUS &s) {
    switch (s) {
        case CONVERGED: os << "CONVERGED"; break;
        case BUDGET_EXHAUSTED: os << "BUDGET_EXHAUSTED"; break;
        default: os << "UNDEFINED NEST::STATUS"; break;
    }
    return os;
}

std::ostream& operator<<(std::ostream &os, const STOP_REASON &r) {
    switch (r) {
        case NONE: os << "NONE"; break;
        case MAX_NCALLS: os << "MAX_NCALLS"; break;
        case MAX_ITERS: os << "MAX_ITERS"; break;
        case DEADLINE: os << "DEADLINE"; break;
        case CANCELLED: os << "CANCELLED"; break;
        case MIN_ESS: os << "MIN_ESS"; break;
        case FRAC_REMAIN: os << "FRAC_REMAIN"; break;
        case PLATEAU: os << "PLATEAU"; break;
        default: os << "UNDEFINED NEST::STOP_REASON"; break;
    }
    return os;
}

ConvergenceMonitor::ConvergenceMonitor(const NestOptions & opts, CancelHook cancel) :
    _max_ncalls(opts.max_ncalls), _max_iters(opts.max_iters), _max_seconds(opts.max_seconds),
    _min_ess(opts.min_ess), _log_frac_remain(std::log(opts.frac_remain)),
    _cancel(std::move(cancel)), _start(std::chrono::steady_clock::now()) {}

void ConvergenceMonitor::start() { _start = std::chrono::steady_clock::now(); }

STOP_REASON ConvergenceMonitor::should_stop(const RunState & state) const {
    if ((_max_ncalls != 0) and (state.ncall >= _max_ncalls)) { return MAX_NCALLS; }
    if ((_max_iters != 0) and (state.niter >= _max_iters)) { return MAX_ITERS; }
    if (_max_seconds > 0) {
        const std::chrono::duration<float_type> elapsed = std::chrono::steady_clock::now() - _start;
        if (elapsed.count() >= _max_seconds) { return DEADLINE; }
    }
    if (_cancel and _cancel()) { return CANCELLED; }

    if ((_min_ess > 0) and (state.ess >= _min_ess)) { return MIN_ESS; }
    // with no evidence yet the difference is +inf, never a stop
    if (state.remainder_logz - state.logz < _log_frac_remain) { return FRAC_REMAIN; }
    return NONE;
}

STATUS ConvergenceMonitor::status(const STOP_REASON reason) {
    return ((reason == MIN_ESS) or (reason == FRAC_REMAIN) or (reason == PLATEAU)) ? CONVERGED : BUDGET_EXHAUSTED;
}

} // namespace NEST
