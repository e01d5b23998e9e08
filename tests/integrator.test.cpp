#include <cmath>
#include <limits>

#include <NestSamp/Integrator.h>
#include <NestSamp/NestUtil.h>
#include "testing.h"

using namespace NEST;
using namespace std;

LivePoint dead_point(const float_type logl) {
    Row u(1);
    u << 0.5;
    return LivePoint{ u, u, logl };
}

void test_log_helpers() {
    const float_type ninf = -numeric_limits<float_type>::infinity();
    IS_TRUE(fabs(logaddexp(log(2.0), log(3.0)) - log(5.0)) < 1e-12);
    IS_TRUE(logaddexp(ninf, 1.5) == 1.5);
    IS_TRUE(logaddexp(ninf, ninf) == ninf);
    IS_TRUE(fabs(log1mexp(-0.01) - log(1 - exp(-0.01))) < 1e-12);
    IS_TRUE(fabs(log1mexp(-5.0) - log(1 - exp(-5.0))) < 1e-12);

    Col vals(3);
    vals << log(1.0), log(2.0), log(3.0);
    IS_TRUE(fabs(logsumexp(vals) - log(6.0)) < 1e-12);
    IS_TRUE(logsumexp(Col(0)) == ninf);
}

void test_weighted_statistics() {
    Col data(4), weights(4);
    data << 4.0, 1.0, 3.0, 2.0;
    weights << 1.0, 1.0, 1.0, 1.0;
    IS_TRUE(fabs(weighted_mean(data, weights) - 2.5) < 1e-12);
    IS_TRUE(fabs(weighted_variance(data, weights, 2.5) - 1.25) < 1e-12);
    IS_TRUE(weighted_quantile(data, weights, 0.5) == 2.0);
    IS_TRUE(weighted_quantile(data, weights, 1.0) == 4.0);

    weights << 0.0, 0.0, 1.0, 0.0;
    IS_TRUE(weighted_quantile(data, weights, 0.05) == 3.0);
    IS_TRUE(fabs(effective_sample_size(weights) - 1.0) < 1e-12);
    weights << 2.0, 2.0, 2.0, 2.0;
    IS_TRUE(fabs(effective_sample_size(weights) - 4.0) < 1e-12);
}

// L = 1 everywhere: Z = 1 less half the first shell, which the trapezoid rule leaves out
void test_constant_likelihood() {
    const size_t nlive = 100;
    Integrator integ;
    size_t iter = 0;
    for (; iter < 1000; ++iter) { integ.record(dead_point(0.0), nlive, iter + 1); }
    for (size_t n = nlive; n > 0; --n, ++iter) { integ.record(dead_point(0.0), n, iter + 1); }

    IS_TRUE(integ.size() == 1100);
    const float_type first_width = 1 - exp(-1.0 / nlive);
    IS_TRUE(fabs(logsumexp(integ.log_weights()) - log(1 - 0.5 * first_width)) < 1e-9);
    IS_TRUE(fabs(integ.weights().sum() - 1.0) < 1e-12);
    IS_TRUE(integ.information() >= 0.0);
    IS_TRUE(integ.logzerr() >= 0.0);
    IS_TRUE(integ.logvol() < -10.0);
}

// L = X: Z = int_0^1 X dX = 1/2
void test_linear_likelihood() {
    const size_t nlive = 1000;
    Integrator integ;
    IS_TRUE(integ.logz() == -numeric_limits<float_type>::infinity());
    IS_TRUE(integ.ess() == 0.0);

    float_type logvol = 0.0;
    for (size_t i = 0; i < 30 * nlive; ++i) {
        logvol -= 1.0 / nlive;
        integ.record(dead_point(logvol), nlive, i + 1);
    }
    IS_TRUE(fabs(exp(integ.logz()) - 0.5) < 1e-3);
    IS_TRUE(fabs(integ.logvol() - logvol) < 1e-9);
    IS_TRUE(fabs(integ.remainder_logz(2.0) - (2.0 + logvol)) < 1e-12);

    // H = int (L/Z) log(L/Z) dX = log 2 - 1/2
    IS_TRUE(fabs(integ.information() - (log(2.0) - 0.5)) < 1e-2);
    IS_TRUE(fabs(integ.logzerr() - sqrt(integ.information() / nlive)) < 1e-12);
    IS_TRUE(fabs(integ.logzerr(10) - sqrt(integ.information() / 10)) < 1e-12);

    const Col w = integ.weights();
    IS_TRUE(fabs(w.sum() - 1.0) < 1e-12);
    IS_TRUE((w.array() >= 0).all());
    IS_TRUE(integ.ess() > 1.0);
    IS_TRUE(integ.ess() <= integ.size());
    IS_TRUE(effective_sample_size(w) <= integ.size());
    IS_TRUE(integ.iterations().back() == 30 * nlive);
}

void test_rejects_empty_live_set() {
    Integrator integ;
    THROWS(std::invalid_argument, integ.record(dead_point(0.0), 0, 1));
}

int main() {
    test_log_helpers();
    test_weighted_statistics();
    test_constant_likelihood();
    test_linear_likelihood();
    test_rejects_empty_live_set();
    return TEST_STATUS();
}
