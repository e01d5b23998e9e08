#include <NestSamp/NestOptions.h>

#include <algorithm>
#include <sstream>
#include <stdexcept>

using std::stringstream;

namespace NEST {

std::ostream& operator<<(std::ostream &os, const SAMPLER &s) {
    switch (s) {
        case AUTO: os << "AUTO"; break;
        case SLICE: os << "SLICE"; break;
        default: os << "UNDEFINED NEST::SAMPLER"; break;
    }
    return os;
}

std::ostream& operator<<(std::ostream &os, const DIRECTION &d) {
    switch (d) {
        case AXIS: os << "AXIS"; break;
        case HARMONIC: os << "HARMONIC"; break;
        case DIFFERENTIAL: os << "DIFFERENTIAL"; break;
        case MIXTURE: os << "MIXTURE"; break;
        default: os << "UNDEFINED NEST::DIRECTION"; break;
    }
    return os;
}

NestOptions resolve_options(const NestOptions & opts, const size_t ndim) {
    NestOptions res = opts;
    if (res.slice.nsteps == 0) { res.slice.nsteps = 2 * ndim; }
    if (res.slice.max_nsteps == 0) { res.slice.max_nsteps = 16 * ndim; }
    if (res.slice.max_nsteps < res.slice.nsteps) { res.slice.max_nsteps = res.slice.nsteps; }
    if (res.max_num_live_points == 0) { res.max_num_live_points = res.min_num_live_points; }
    if (res.grow_increment == 0) { res.grow_increment = std::max<size_t>(1, res.min_num_live_points / 2); }
    if (res.batch_size == 0) { res.batch_size = 1; }
    if (res.num_threads == 0) { res.num_threads = 1; }
    return res;
}

void check_options(const NestOptions & opts, const size_t ndim) {
    stringstream ss;
    if (ndim == 0) {
        ss << "at least one parameter is required";
    } else if (opts.min_num_live_points < 2 * ndim) {
        ss << "min_num_live_points (" << opts.min_num_live_points << ") must be at least 2 x the dimension (" << 2 * ndim << ")";
    } else if ((opts.max_num_live_points != 0) and (opts.max_num_live_points < opts.min_num_live_points)) {
        ss << "max_num_live_points (" << opts.max_num_live_points << ") must not be below min_num_live_points (" << opts.min_num_live_points << ")";
    } else if (not (opts.frac_remain > 0)) {
        ss << "frac_remain must be positive";
    } else if (opts.min_ess < 0) {
        ss << "min_ess must not be negative";
    } else if (opts.max_seconds < 0) {
        ss << "max_seconds must not be negative";
    } else if (not ((0 < opts.direct_min_efficiency) and (opts.direct_min_efficiency < 1))) {
        ss << "direct_min_efficiency must be in (0, 1)";
    } else if (not (opts.direct_patience > 0)) {
        ss << "direct_patience must be positive";
    } else if (opts.init_attempts_factor == 0) {
        ss << "init_attempts_factor must be positive";
    } else if (opts.slice.max_reseeds == 0) {
        ss << "slice max_reseeds must be positive";
    } else if (not (opts.slice.adapt_contraction_threshold > 0)) {
        ss << "slice adapt_contraction_threshold must be positive";
    } else if (not (opts.slice.adapt_nsteps_factor > 1)) {
        ss << "slice adapt_nsteps_factor must exceed 1";
    } else if (not ((0 < opts.slice.shrink_floor) and (opts.slice.shrink_floor < 1))) {
        ss << "slice shrink_floor must be in (0, 1)";
    } else if (not ((0 < opts.slice.min_scale) and (opts.slice.min_scale < 1))) {
        ss << "slice min_scale must be in (0, 1)";
    } else if (opts.order_test_zscore <= 0) {
        ss << "order_test_zscore must be positive";
    } else {
        return;
    }
    throw std::invalid_argument(ss.str());
}

} // namespace NEST
