#include <NestSamp/Result.h>
#include <NestSamp/NestUtil.h>

#include <cmath>

namespace NEST {

Row Result::posterior_mean() const {
    Row res(npar());
    for (size_t j = 0; j < npar(); ++j) { res[j] = weighted_mean(samples.col(j), weights); }
    return res;
}

Mat2D Result::resample_equal(const gsl_rng * rng, const size_t n) const {
    const size_t num_samples = n == 0 ? static_cast<size_t>(std::ceil(ess)) : n;
    if ((size() == 0) or (num_samples == 0)) { return Mat2D(0, npar()); }
    return samples(gsl_rng_nonuniform_int(rng, num_samples, weights), Eigen::placeholders::all);
}

void Result::summarize() {
    summary.clear();
    if (size() == 0) { return; }
    for (size_t j = 0; j < npar(); ++j) {
        const Col values = samples.col(j);
        const float_type mean = weighted_mean(values, weights);
        summary.push_back({
            j < names.size() ? names[j] : std::to_string(j),
            mean,
            std::sqrt(weighted_variance(values, weights, mean)),
            weighted_quantile(values, weights, 0.5),
            weighted_quantile(values, weights, 0.05),
            weighted_quantile(values, weights, 0.95)
        });
    }
}

} // namespace NEST
