#include <NestSamp/NestUtil.h>

#include <algorithm>
#include <cassert>
#include <fstream>
#include <numeric>
#include <sstream>
#include <gsl/gsl_randist.h>

using std::string;
using std::vector;

namespace NEST {

    string slurp(const string & filename) {
        std::ifstream ifs(filename.c_str());
        std::stringstream sstr;
        sstr << ifs.rdbuf();
        return sstr.str();
    }

    float_type logsumexp(const Col & data) {
        if (data.size() == 0) { return -std::numeric_limits<float_type>::infinity(); }
        const float_type top = data.maxCoeff();
        if (not std::isfinite(top)) { return top; }
        return top + std::log((data.array() - top).exp().sum());
    }

    float_type weighted_quantile(const Col & data, const Col & weights, const float_type q) {
        assert(data.size() > 0 and data.size() == weights.size());
        assert((0.0 <= q) and (q <= 1.0));
        vector<size_t> order(data.size());
        std::iota(order.begin(), order.end(), 0);
        std::sort(order.begin(), order.end(), [&data](const size_t a, const size_t b) { return data[a] < data[b]; });

        const float_type target = q * weights.sum();
        float_type cumulative = 0.0;
        for (const size_t idx : order) {
            cumulative += weights[idx];
            if (cumulative >= target) { return data[idx]; }
        }
        return data[order.back()];
    }

    float_type weighted_mean(const Col & data, const Col & weights) {
        assert(data.size() == weights.size());
        return data.dot(weights) / weights.sum();
    }

    float_type weighted_variance(const Col & data, const Col & weights, const float_type _mean) {
        assert(data.size() == weights.size());
        return (data.array() - _mean).square().matrix().dot(weights) / weights.sum();
    }

    float_type effective_sample_size(const Col & weights) {
        const float_type sum_w = weights.sum();
        const float_type sum_w2 = weights.squaredNorm();
        return sum_w2 > 0 ? sum_w * sum_w / sum_w2 : 0.0;
    }

    vector<size_t> gsl_rng_nonuniform_int(
        const gsl_rng* RNG, const size_t num_samples,
        const Col & weights
    ) {
        gsl_ran_discrete_t* gslweights = gsl_ran_discrete_preproc(weights.rows(), weights.data());
        vector<size_t> res(num_samples);
        for (size_t i = 0; i < res.size(); i++) { res[i] = gsl_ran_discrete(RNG, gslweights); }
        gsl_ran_discrete_free(gslweights);
        return res;
    }

}
