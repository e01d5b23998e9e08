#include <NestSamp/DirectSampler.h>

#include <algorithm>
#include <cmath>

using std::vector;

namespace NEST {

DirectSampler::DirectSampler(
    ModelAdapter & model, const gsl_rng * rng,
    const size_t batch_size, const float_type min_efficiency, const float_type patience
) : _model(model), _rng(rng), _batch_size(std::max<size_t>(1, batch_size)),
    _min_efficiency(min_efficiency),
    _budget(static_cast<size_t>(std::ceil(patience / min_efficiency))) {}

bool DirectSampler::propose(const float_type threshold, const LivePointSet & /* live */, LivePoint & point) {
    vector<LivePoint> accepted;
    draw(1, threshold, _budget, accepted);

    if ((_window.size() == _budget) and (efficiency() < _min_efficiency)) { _collapsed = true; }

    if (accepted.empty()) {
        _collapsed = true;
        return false;
    }
    point = std::move(accepted.front());
    return true;
}

size_t DirectSampler::draw(
    const size_t n, const float_type threshold, const size_t max_draws,
    vector<LivePoint> & accepted
) {
    const size_t ndim = _model.npar();
    const size_t start = accepted.size();
    size_t drawn = 0;
    while ((accepted.size() - start < n) and (drawn < max_draws)) {
        // draw at least enough for what is still missing, so initialization fills quickly
        const size_t missing = n - (accepted.size() - start);
        const size_t m = std::min(std::max(_batch_size, missing), max_draws - drawn);

        Mat2D us(m, ndim);
        for (size_t i = 0; i < m; ++i) {
            for (size_t j = 0; j < ndim; ++j) { us(i, j) = gsl_rng_uniform(_rng); }
        }
        Mat2D ps;
        Col logls;
        _model.evaluate(us, ps, logls);
        drawn += m;

        for (size_t i = 0; i < m; ++i) {
            const bool above = logls[i] > threshold;
            _record(above);
            if (not above) {
                if (std::isfinite(threshold) and (logls[i] == threshold)) { ++_nties; }
                continue;
            }
            // surplus acceptances are independent prior draws; dropping them keeps the sample unbiased
            if (accepted.size() - start < n) {
                accepted.push_back(LivePoint{ us.row(i), ps.row(i), logls[i] });
            }
        }
    }
    return accepted.size() - start;
}

float_type DirectSampler::efficiency() const {
    return _window.empty() ? 1.0 : static_cast<float_type>(_window_accepts) / _window.size();
}

void DirectSampler::_record(const bool accepted) {
    if (_window.size() < _budget) {
        _window.push_back(accepted);
    } else {
        const size_t oldest = _ndraw % _budget;
        if (_window[oldest]) { --_window_accepts; }
        _window[oldest] = accepted;
    }
    if (accepted) {
        ++_window_accepts;
        ++_naccept;
    }
    ++_ndraw;
}

} // namespace NEST
