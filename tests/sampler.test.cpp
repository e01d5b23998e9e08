#include <cmath>
#include <limits>
#include <memory>

#include <NestSamp/NestSampler.h>
#include <NestSamp/NestError.h>
#include "testing.h"

using namespace NEST;
using namespace std;

ParameterSpace make_space(const size_t ndim, const bool wrapped = false) {
    ParameterSpace space;
    for (size_t i = 0; i < ndim; ++i) {
        space.add_next_parameter(make_shared<const Parameter>("coordinate " + to_string(i), "x" + to_string(i), wrapped));
    }
    return space;
}

// unit-variance Gaussian likelihood centred on 0, uniform prior on [-half_width, half_width]^ndim
NestFun gaussian(const float_type half_width) {
    return NestFun(
        [half_width](const Row & u) { return Row((2 * half_width * u.array() - half_width).matrix()); },
        [](const Row & p) { return -0.5 * p.squaredNorm() - 0.5 * p.size() * log(2 * M_PI); }
    );
}

void test_one_dimensional_evidence() {
    NestFun model = gaussian(5.0);
    const ParameterSpace space = make_space(1);
    const float_type expected = log(0.1 * erf(5.0 / sqrt(2.0)));

    const size_t trials = 20;
    size_t within = 0;
    for (size_t seed = 1; seed <= trials; ++seed) {
        NestOptions opts;
        opts.min_num_live_points = 100;
        opts.min_ess = 1e9; // stop on the remaining evidence only
        opts.seed = seed;
        NestSampler sampler(space, &model, opts);
        const Result res = sampler.run();
        IS_TRUE(res.status == CONVERGED);
        IS_TRUE(res.logzerr > 0.0);
        if (fabs(res.logz - expected) < 3 * res.logzerr) { ++within; }
    }
    cout << within << " of " << trials << " trials within 3 sigma" << endl;
    IS_TRUE(within >= 19);
}

void test_error_shrinks_with_live_points() {
    NestFun model = gaussian(5.0);
    const ParameterSpace space = make_space(1);

    NestOptions opts;
    opts.seed = 42;
    opts.min_num_live_points = 100;
    const Result small = NestSampler(space, &model, opts).run();
    opts.min_num_live_points = 400;
    const Result large = NestSampler(space, &model, opts).run();

    IS_TRUE(small.logzerr >= 0.0 and large.logzerr >= 0.0);
    IS_TRUE(large.logzerr < small.logzerr);
    IS_TRUE(fabs(small.weights.sum() - 1.0) < 1e-9);
    IS_TRUE(fabs(large.weights.sum() - 1.0) < 1e-9);
}

void test_two_dimensional_posterior() {
    NestFun model = gaussian(10.0);
    const ParameterSpace space = make_space(2);

    NestOptions opts;
    opts.seed = 2024;
    opts.min_num_live_points = 400;
    opts.min_ess = 1000;
    NestSampler sampler(space, &model, opts);
    const Result res = sampler.run();

    IS_TRUE(res.status == CONVERGED);
    IS_TRUE(res.ess > 500);
    const Row mean = res.posterior_mean();
    cout << "posterior mean: " << mean << ", logz: " << res.logz << " +/- " << res.logzerr << endl;
    IS_TRUE(fabs(mean[0]) < 0.1 and fabs(mean[1]) < 0.1);
    IS_TRUE(fabs(res.logz - 2 * log(1 / 20.0)) < 0.5);
    IS_TRUE(res.summary.size() == 2 and res.summary[0].name == "x0");
    IS_TRUE(fabs(res.summary[1].sd - 1.0) < 0.15);
    IS_TRUE(res.summary[0].q05 < res.summary[0].median and res.summary[0].median < res.summary[0].q95);
    IS_TRUE(fabs(res.weights.sum() - 1.0) < 1e-9);
    IS_TRUE(res.size() == static_cast<size_t>(res.logl.size()));

    // dead points, then drained live points: log-likelihoods never decrease
    bool ascending = true;
    for (long i = 1; i < res.logl.size(); ++i) { ascending = ascending and (res.logl[i - 1] <= res.logl[i]); }
    IS_TRUE(ascending);

    const Mat2D equal = res.resample_equal(sampler.rng(), 500);
    IS_TRUE(equal.rows() == 500 and equal.cols() == 2);
    IS_TRUE((equal.array().abs() <= 10.0).all());
}

void test_spike_fails_initialization() {
    NestFun spike(
        [](const Row & u) { return u; },
        [](const Row & p) { return fabs(p[0] - 0.5) < 1e-12 ? 0.0 : -numeric_limits<float_type>::infinity(); }
    );
    NestOptions opts;
    opts.seed = 1;
    opts.min_num_live_points = 50;
    NestSampler sampler(make_space(1), &spike, opts);
    THROWS(InitializationError, sampler.run());
}

void test_nan_likelihood_is_fatal() {
    NestFun broken(
        [](const Row & u) { return u; },
        [](const Row & p) { return p[0] > 0.9 ? numeric_limits<float_type>::quiet_NaN() : -p[0]; }
    );
    NestOptions opts;
    opts.seed = 1;
    opts.min_num_live_points = 50;
    NestSampler sampler(make_space(1), &broken, opts);
    THROWS(LikelihoodError, sampler.run());
}

void test_call_budget() {
    NestFun model = gaussian(10.0);
    NestOptions opts;
    opts.seed = 3;
    opts.min_num_live_points = 100;
    opts.max_ncalls = 2000;
    const Result res = NestSampler(make_space(2), &model, opts).run();

    IS_TRUE(res.status == BUDGET_EXHAUSTED);
    IS_TRUE(res.stop_reason == MAX_NCALLS);
    IS_TRUE(res.ncall >= 2000);
    IS_TRUE(res.size() == res.niter + 100);
    IS_TRUE(fabs(res.weights.sum() - 1.0) < 1e-9);

    opts.max_ncalls = 0;
    opts.max_iters = 50;
    const Result iters = NestSampler(make_space(2), &model, opts).run();
    IS_TRUE(iters.stop_reason == MAX_ITERS);
    IS_TRUE(iters.niter == 50);
}

void test_progress_and_cancellation() {
    NestFun model = gaussian(10.0);
    NestOptions opts;
    opts.seed = 4;
    opts.min_num_live_points = 50;
    opts.log_interval = 5;

    NestSampler sampler(make_space(2), &model, opts);
    size_t records = 0;
    size_t last_iteration = 0;
    sampler.set_progress_callback([&](const ProgressRecord & rec) {
        ++records;
        last_iteration = rec.iteration;
    });
    sampler.set_cancel_hook([&]() { return last_iteration >= 20; });

    const Result res = sampler.run();
    IS_TRUE(res.stop_reason == CANCELLED);
    IS_TRUE(res.status == BUDGET_EXHAUSTED);
    IS_TRUE(res.niter == 20);
    IS_TRUE(records == 4);
}

void test_slice_only_with_wrapped_parameter() {
    // von Mises-like ridge across the u = 0 / u = 1 boundary; integrates to 1 over the cube
    NestFun ring(
        [](const Row & u) { return u; },
        [](const Row & p) { return 5.0 * cos(2 * M_PI * p[0]) - log(std::cyl_bessel_i(0.0, 5.0)); }
    );
    NestOptions opts;
    opts.seed = 8;
    opts.min_num_live_points = 200;
    opts.sampler = SLICE;
    const Result res = NestSampler(make_space(1, true), &ring, opts).run();

    IS_TRUE(res.status == CONVERGED);
    IS_TRUE(not res.diagnostics.switch_iteration.has_value());
    IS_TRUE((res.samples.array() >= 0.0).all() and (res.samples.array() < 1.0).all());
    IS_TRUE(fabs(res.logz) < 0.5);
}

// logl = 0 on (0.25, 0.75), -inf elsewhere: Z = 0.5, and every live point ties with every other
void test_top_hat_stops_on_plateau() {
    NestFun top_hat(
        [](const Row & u) { return u; },
        [](const Row & p) { return (p[0] > 0.25 and p[0] < 0.75) ? 0.0 : -numeric_limits<float_type>::infinity(); }
    );
    NestOptions opts;
    opts.seed = 1;
    opts.min_num_live_points = 100;
    NestSampler sampler(make_space(1), &top_hat, opts);

    Result res;
    bool threw = false;
    try { res = sampler.run(); } catch (const NestError &) { threw = true; }
    IS_TRUE(not threw);
    IS_TRUE(res.stop_reason == PLATEAU);
    IS_TRUE(res.status == CONVERGED);
    IS_TRUE(res.niter == 0);
    IS_TRUE(res.size() == 100);
    IS_TRUE(res.logzerr > 0.0);
    cout << "top hat logz: " << res.logz << " +/- " << res.logzerr << endl;
    IS_TRUE(fabs(res.logz - log(0.5)) < 3 * res.logzerr);
    IS_TRUE(fabs(res.weights.sum() - 1.0) < 1e-9);
    IS_TRUE(res.diagnostics.nties > 0);
}

// a staircase likelihood ties often, then flattens out on its top step
void test_staircase_counts_ties() {
    NestFun stairs(
        [](const Row & u) { return u; },
        [](const Row & p) { return floor(10 * p[0]) + floor(10 * p[1]); }
    );
    NestOptions opts;
    opts.seed = 5;
    opts.min_num_live_points = 50;
    opts.min_ess = 0;
    opts.tie_warning_threshold = 1;
    opts.verbose = 1;
    const Result res = NestSampler(make_space(2), &stairs, opts).run();

    IS_TRUE(res.stop_reason == PLATEAU);
    IS_TRUE(res.diagnostics.nties > 0);
    IS_TRUE(res.niter > 0);
    IS_TRUE((res.logl.tail(50).array() == 18.0).all());
    IS_TRUE(fabs(res.weights.sum() - 1.0) < 1e-9);
}

void test_auto_switches_to_slice() {
    const float_type sd = 0.5;
    NestFun narrow(
        [](const Row & u) { return Row((20 * u.array() - 10).matrix()); },
        [sd](const Row & p) { return -0.5 * p.squaredNorm() / (sd * sd) - p.size() * log(sd * sqrt(2 * M_PI)); }
    );
    NestOptions opts;
    opts.seed = 11;
    opts.min_num_live_points = 200;
    opts.min_ess = 1e9;
    const Result res = NestSampler(make_space(3), &narrow, opts).run();

    IS_TRUE(res.status == CONVERGED);
    IS_TRUE(res.diagnostics.switch_iteration.has_value());
    IS_TRUE(res.diagnostics.switch_iteration.value() < res.niter);
    cout << "switched at " << res.diagnostics.switch_iteration.value() << ", logz: " << res.logz << " +/- " << res.logzerr << endl;
    IS_TRUE(fabs(res.logz - 3 * log(1 / 20.0)) < 3 * res.logzerr);
}

void test_live_set_growth() {
    NestFun model = gaussian(10.0);
    NestOptions opts;
    opts.seed = 6;
    opts.min_num_live_points = 50;
    opts.max_num_live_points = 200;
    opts.dlogz = 0.1;
    const Result res = NestSampler(make_space(2), &model, opts).run();

    IS_TRUE(res.diagnostics.ngrow > 0);
    IS_TRUE(res.diagnostics.ngrow <= 150);
    IS_TRUE(res.nlive == 50 + res.diagnostics.ngrow);
    IS_TRUE(res.size() == res.niter + res.nlive);
    IS_TRUE(fabs(res.weights.sum() - 1.0) < 1e-9);
    IS_TRUE(fabs(res.logz - 2 * log(1 / 20.0)) < 0.5);
}

// batches evaluated on several threads are still drawn from the one generator
void test_batched_runs_reproduce() {
    NestFun model = gaussian(10.0);
    NestOptions opts;
    opts.seed = 7;
    opts.min_num_live_points = 100;
    opts.batch_size = 4;
    opts.num_threads = 2;
    const Result first = NestSampler(make_space(2), &model, opts).run();
    const Result second = NestSampler(make_space(2), &model, opts).run();

    IS_TRUE(first.status == CONVERGED);
    IS_TRUE(first.logz == second.logz);
    IS_TRUE(first.ncall == second.ncall and first.niter == second.niter);
    IS_TRUE(fabs(first.logz - 2 * log(1 / 20.0)) < 0.5);
}

void test_deadline() {
    NestFun model = gaussian(10.0);
    NestOptions opts;
    opts.seed = 9;
    opts.min_num_live_points = 100;
    opts.max_seconds = 1e-6;
    const Result res = NestSampler(make_space(2), &model, opts).run();

    IS_TRUE(res.stop_reason == DEADLINE);
    IS_TRUE(res.status == BUDGET_EXHAUSTED);
    IS_TRUE(res.niter == 0);
    IS_TRUE(res.size() == 100);
    IS_TRUE(fabs(res.weights.sum() - 1.0) < 1e-9);
}

void test_invalid_options() {
    NestFun model = gaussian(1.0);
    NestOptions opts;
    opts.min_num_live_points = 5; // below 2 x ndim
    THROWS(std::invalid_argument, NestSampler(make_space(3), &model, opts));
    opts.min_num_live_points = 10;
    opts.frac_remain = 0.0;
    THROWS(std::invalid_argument, NestSampler(make_space(3), &model, opts));
    opts.frac_remain = 0.01;
    opts.slice.max_reseeds = 0;
    THROWS(std::invalid_argument, NestSampler(make_space(3), &model, opts));
    opts.slice.max_reseeds = 100;
    opts.slice.adapt_contraction_threshold = 0.0;
    THROWS(std::invalid_argument, NestSampler(make_space(3), &model, opts));
}

int main() {
    test_one_dimensional_evidence();
    test_error_shrinks_with_live_points();
    test_two_dimensional_posterior();
    test_spike_fails_initialization();
    test_nan_likelihood_is_fatal();
    test_call_budget();
    test_progress_and_cancellation();
    test_slice_only_with_wrapped_parameter();
    test_top_hat_stops_on_plateau();
    test_staircase_counts_ties();
    test_auto_switches_to_slice();
    test_live_set_growth();
    test_batched_runs_reproduce();
    test_deadline();
    test_invalid_options();
    return TEST_STATUS();
}
