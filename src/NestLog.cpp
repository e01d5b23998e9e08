#include <NestSamp/NestLog.h>

#include <iomanip>

using std::setw;
using std::endl;

void NestLog::run_header(
    const NEST::ParameterSpace & space, const NEST::NestOptions & opts,
    std::ostream & os
) {
    os << double_bar << endl;
    os << "Nested sampling over " << space.size() << " parameter(s):\n";
    for (const auto & par : space) {
        os << "  " << setw(WIDTH) << par->get_short_name() << "  \"" << par->get_name() << "\""
           << (par->is_wrapped() ? "  (wrapped)" : "") << "\n";
    }
    os << "  live points: " << opts.min_num_live_points;
    if (opts.max_num_live_points > opts.min_num_live_points) { os << " (up to " << opts.max_num_live_points << ")"; }
    os << ", sampler: " << opts.sampler << ", direction: " << opts.slice.direction
       << ", slice steps: " << opts.slice.nsteps << (opts.slice.adaptive_nsteps ? " (adaptive)" : "") << "\n";
    os << "  stop at ESS >= " << opts.min_ess << " or remaining evidence < " << opts.frac_remain;
    if (opts.max_ncalls) { os << ", or " << opts.max_ncalls << " calls"; }
    if (opts.max_iters) { os << ", or " << opts.max_iters << " iterations"; }
    if (opts.max_seconds > 0) { os << ", or " << opts.max_seconds << " s"; }
    os << endl << double_bar << endl;
}

void NestLog::progress_header(std::ostream & os) {
    os << setw(WIDTH) << "iter" << setw(WIDTH) << "ncall" << setw(WIDTH) << "logz" << setw(WIDTH) << "logzerr"
       << setw(WIDTH) << "nlive" << setw(WIDTH) << "threshold" << setw(WIDTH) << "eff" << endl;
}

void NestLog::progress(const NEST::ProgressRecord & rec, std::ostream & os) {
    os << setw(WIDTH) << rec.iteration << setw(WIDTH) << rec.ncall << setw(WIDTH) << rec.logz << setw(WIDTH) << rec.logzerr
       << setw(WIDTH) << rec.nlive << setw(WIDTH) << rec.threshold << setw(WIDTH) << rec.efficiency << endl;
}

void NestLog::summary(const NEST::Result & res, std::ostream & os) {
    os << double_bar << endl;
    os << "Status: " << res.status << " (" << res.stop_reason << ")\n";
    os << "  logZ = " << res.logz << " +/- " << res.logzerr << ",  H = " << res.information << " nats\n";
    os << "  iterations: " << res.niter << ", likelihood calls: " << res.ncall
       << ", effective sample size: " << res.ess << "\n";

    const NEST::Diagnostics & diag = res.diagnostics;
    os << "  stuck walks: " << diag.nstuck << ", ties: " << diag.nties << ", plateaus: " << diag.nplateau
       << ", grown: " << diag.ngrow << "\n";
    if (diag.switch_iteration) { os << "  switched to slice sampling at iteration " << *diag.switch_iteration << "\n"; }
    os << "  insertion order z-score: " << diag.order_test_zscore;
    if (not diag.order_test_runs.empty()) { os << " (" << diag.order_test_runs.size() << " significant deviation(s))"; }
    os << "\n";

    os << "Posterior summary:" << endl;
    os << setw(WIDTH) << "par" << setw(WIDTH) << "mean" << setw(WIDTH) << "sd" << setw(WIDTH) << "median"
       << setw(WIDTH) << "q05" << setw(WIDTH) << "q95" << endl;
    for (const auto & ps : res.summary) {
        os << setw(WIDTH) << ps.name << setw(WIDTH) << ps.mean << setw(WIDTH) << ps.sd << setw(WIDTH) << ps.median
           << setw(WIDTH) << ps.q05 << setw(WIDTH) << ps.q95 << endl;
    }
    os << double_bar << endl;
}

void NestLog::stuck_proposal(
    const size_t nstuck, const size_t attempt, const float_type threshold,
    std::ostream & os
) {
    os << "WARNING: slice walk abandoned at logl threshold " << threshold << " (bracket collapsed); re-seeding, attempt "
       << attempt << " (" << nstuck << " stuck walks in total)" << endl;
}

void NestLog::sampler_switch(
    const size_t iteration, const std::string & from, const std::string & to,
    const float_type efficiency,
    std::ostream & os
) {
    os << "Iteration " << iteration << ": switching from " << from << " to " << to
       << " sampling (" << from << " efficiency " << efficiency << ")" << endl;
}

void NestLog::grow(
    const size_t iteration, const size_t added, const size_t nlive, const float_type logzerr,
    std::ostream & os
) {
    os << "Iteration " << iteration << ": logzerr " << logzerr << " too large, added " << added
       << " live points (now " << nlive << ")" << endl;
}

void NestLog::plateau(
    const size_t iteration, const float_type threshold, const size_t nlive,
    std::ostream & os
) {
    os << "WARNING: all " << nlive << " live points share logl " << threshold << " at iteration " << iteration
       << " and no point above it was found; stopping and integrating the plateau." << endl;
}

void NestLog::tie_recommendation(const size_t nties, std::ostream & os) {
    os << "WARNING: " << nties << " proposals tied with the likelihood threshold. "
       << "The likelihood has plateaus; consider adding a tiny jitter to it, or rounding it less coarsely." << endl;
}

void NestLog::order_test_warning(
    const size_t iteration, const float_type zscore, const size_t run_length,
    std::ostream & os
) {
    os << "WARNING: insertion order test failed at iteration " << iteration << " (z = " << zscore << " after "
       << run_length << " insertions); the sampler may be biased, consider more slice steps" << endl;
}
