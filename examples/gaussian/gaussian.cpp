#include <cmath>
#include <cstddef>

// A correlation-free Gaussian likelihood on a uniform prior, exported for loading by `nestsamp`
// (the "shared" key of gaussian.json). Every coordinate has prior U(-10, 10) and a unit-variance
// likelihood centred on 0, so log Z = npar * log(1 / 20).

extern "C" {

void prior_transform(const double * u, double * p, const size_t npar) {
    for (size_t i = 0; i < npar; ++i) { p[i] = 20.0 * u[i] - 10.0; }
}

double loglikelihood(const double * p, const size_t npar) {
    double ss = 0.0;
    for (size_t i = 0; i < npar; ++i) { ss += p[i] * p[i]; }
    return -0.5 * ss - 0.5 * npar * std::log(2 * M_PI);
}

}
