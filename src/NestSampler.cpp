#include <NestSamp/NestSampler.h>
#include <NestSamp/NestError.h>
#include <NestSamp/NestLog.h>
#include <NestSamp/NestUtil.h>
#include <NestSamp/ModelAdapter.h>
#include <NestSamp/LivePoints.h>
#include <NestSamp/DirectSampler.h>
#include <NestSamp/SliceSampler.h>
#include <NestSamp/Integrator.h>
#include <NestSamp/OrderTest.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <limits>
#include <sstream>
#include <unistd.h>

using std::vector;

namespace NEST {

RngPtr make_rng(const std::optional<size_t> & seed) {
    RngPtr rng(gsl_rng_alloc(gsl_rng_taus2));
    if (seed) {
        gsl_rng_set(rng.get(), *seed);
    } else {
        gsl_rng_set(rng.get(), time(NULL) * getpid()); // seed the rng using sys time and the process id
    }
    return rng;
}

NestSampler::NestSampler(const ParameterSpace & space, const NestModel * model, const NestOptions & opts) :
    _space(space), _model(model), _opts(resolve_options(opts, space.size())), _rng(make_rng(opts.seed)) {
    check_options(_opts, _space.size());
    if (_model == nullptr) { throw std::invalid_argument("NestSampler requires a model"); }
}

NestSampler::~NestSampler() = default;

Result NestSampler::run() {
    const auto started = std::chrono::steady_clock::now();
    const size_t ndim = _space.size();
    const bool verbose = _opts.verbose > 0;

    ModelAdapter model(_model, ndim, _opts.num_threads);
    DirectSampler direct(model, _rng.get(), _opts.batch_size, _opts.direct_min_efficiency, _opts.direct_patience);
    SliceSampler slice(model, _rng.get(), _space.wrapped(), _opts.slice, _opts.verbose);
    Sampler * active = (_opts.sampler == SLICE) ? static_cast<Sampler*>(&slice) : &direct;

    LivePointSet live(ndim, _opts.min_num_live_points);
    OrderTest order;
    ConvergenceMonitor monitor(_opts, _cancel);
    Diagnostics diag;

    if (verbose) { NestLog::run_header(_space, _opts); }
    live.initialize(_opts.min_num_live_points, direct, _opts.init_attempts_factor);

    // the live points cover only the part of the prior with finite log-likelihood, whose volume
    // is the acceptance fraction of the initial draws; var(log f) ~ (1 - f) / accepted
    const float_type finite_frac = static_cast<float_type>(direct.naccept()) / direct.ndraw();
    Integrator integ(std::log(finite_frac), (1.0 - finite_frac) / direct.naccept());

    auto switch_to_slice = [&](const size_t iteration) {
        if (active == &slice) { return; }
        diag.switch_iteration = iteration;
        if (verbose) { NestLog::sampler_switch(iteration, direct.name(), slice.name(), direct.efficiency()); }
        active = &slice;
    };

    auto run_state = [&](const size_t iteration) {
        RunState state;
        state.ncall = model.ncall();
        state.niter = iteration;
        state.logz = integ.logz();
        state.remainder_logz = integ.remainder_logz(live.max_logl());
        state.ess = integ.ess();
        return state;
    };

    if (verbose and _opts.log_interval > 0) { NestLog::progress_header(); }

    size_t iter = 0;
    bool tie_warned = false;
    float_type last_threshold = std::numeric_limits<float_type>::quiet_NaN();
    STOP_REASON reason = NONE;
    while ((reason = monitor.should_stop(run_state(iter))) == NONE) {
        const size_t worst = live.worst_slot();
        const float_type threshold = live.threshold();
        if (threshold == last_threshold) { ++diag.nplateau; }
        last_threshold = threshold;

        LivePoint candidate;
        bool found = active->propose(threshold, live, candidate);
        if (not found and (active != &slice)) {
            // the direct sampler ran out of budget
            switch_to_slice(iter);
            found = slice.propose(threshold, live, candidate);
        } else if (found and active->collapsed()) {
            switch_to_slice(iter + 1);
        }

        diag.nties = direct.nties() + slice.nties();
        if (verbose and not tie_warned and (diag.nties >= _opts.tie_warning_threshold)) {
            NestLog::tie_recommendation(diag.nties);
            tie_warned = true;
        }

        if (not found) {
            // every live point is on the threshold; refuse to advance
            reason = PLATEAU;
            if (verbose) {
                NestLog::plateau(iter, threshold, live.size());
                if (not tie_warned) { NestLog::tie_recommendation(diag.nties); }
            }
            break;
        }

        const size_t nlive = live.size();
        // the point being replaced is always below the candidate
        const size_t nbelow = live.insertion_rank(candidate.logl);
        LivePoint dead;
        if (not live.replace(worst, std::move(candidate), dead)) {
            std::stringstream ss;
            ss << "replacement with logl " << candidate.logl << " does not improve on threshold " << threshold;
            throw SamplerError(ss.str());
        }

        ++iter;
        integ.record(std::move(dead), nlive, iter);

        order.add(nbelow - 1, nlive);
        if (order.significant(_opts.order_test_zscore)) {
            if (verbose) { NestLog::order_test_warning(iter, order.zscore(), order.count()); }
            order.restart();
        }

        if ((_opts.log_interval > 0) and (iter % _opts.log_interval == 0)) {
            const ProgressRecord rec{
                iter, model.ncall(), integ.logz(), integ.logzerr(), live.size(), threshold, active->efficiency()
            };
            if (_progress) { _progress(rec); }
            if (verbose) { NestLog::progress(rec); }
        }

        if ((integ.logzerr() > _opts.dlogz) and (live.size() < _opts.max_num_live_points)) {
            const size_t k = std::min(_opts.grow_increment, _opts.max_num_live_points - live.size());
            size_t added = live.grow(k, *active);
            if (added < k) {
                switch_to_slice(iter);
                added += live.grow(k - added, slice);
            }
            diag.ngrow += added;
            if (verbose) { NestLog::grow(iter, added, live.size(), integ.logzerr()); }
        }
    }

    // the remaining live points fill the last volume, in ascending order
    const size_t nlive_stop = live.size();
    vector<LivePoint> remaining = live.drain();
    for (size_t i = 0; i < remaining.size(); ++i) {
        integ.record(std::move(remaining[i]), remaining.size() - i, iter + i + 1);
    }

    Result res;
    res.stop_reason = reason;
    res.status = ConvergenceMonitor::status(reason);
    res.logz = logsumexp(integ.log_weights());
    res.logzerr = integ.logzerr(nlive_stop);
    res.information = integ.information();
    res.weights = integ.weights();
    res.ess = effective_sample_size(res.weights);
    res.ncall = model.ncall();
    res.niter = iter;
    res.nlive = nlive_stop;
    res.names = _space.short_names();

    const vector<LivePoint> & dead = integ.dead_points();
    res.samples.resize(dead.size(), ndim);
    for (size_t i = 0; i < dead.size(); ++i) { res.samples.row(i) = dead[i].p; }
    res.logl = integ.logls();
    res.logvol = integ.logvols();
    res.summarize();

    diag.nstuck = slice.nstuck();
    diag.nties = direct.nties() + slice.nties();
    diag.order_test_zscore = order.zscore();
    diag.order_test_runs = order.runs();
    diag.direct_efficiency = direct.efficiency();
    diag.slice_efficiency = slice.efficiency();
    diag.slice_nsteps = slice.nsteps();
    diag.elapsed_seconds = std::chrono::duration<float_type>(std::chrono::steady_clock::now() - started).count();
    res.diagnostics = diag;

    if (verbose) { NestLog::summary(res); }
    return res;
}

} // namespace NEST
