#ifndef NESTSAMP_NESTUTIL_H
#define NESTSAMP_NESTUTIL_H

#include <cmath>
#include <limits>
#include <string>
#include <vector>
#include <gsl/gsl_rng.h>

#include <NestSamp/TypeDefs.h>

namespace NEST {

    std::string slurp(const std::string & filename);

    // log(exp(a) + exp(b)), exact when either side is -inf
    inline float_type logaddexp(const float_type a, const float_type b) {
        if (a == -std::numeric_limits<float_type>::infinity()) { return b; }
        if (b == -std::numeric_limits<float_type>::infinity()) { return a; }
        return a > b ? a + std::log1p(std::exp(b - a)) : b + std::log1p(std::exp(a - b));
    }

    // log(1 - exp(x)) for x < 0
    inline float_type log1mexp(const float_type x) {
        return x > -M_LN2 ? std::log(-std::expm1(x)) : std::log1p(-std::exp(x));
    }

    float_type logsumexp(const Col & data);

    // `data` need not be sorted; `weights` need not be normalized
    float_type weighted_quantile(const Col & data, const Col & weights, const float_type q);
    float_type weighted_mean(const Col & data, const Col & weights);
    float_type weighted_variance(const Col & data, const Col & weights, const float_type _mean);

    // Kish effective sample size (sum w)^2 / sum w^2
    float_type effective_sample_size(const Col & weights);

    std::vector<size_t> gsl_rng_nonuniform_int(const gsl_rng* RNG, const size_t num_samples, const Col & weights);

}

#endif // NESTSAMP_NESTUTIL_H
