#include <NestSamp/SliceSampler.h>
#include <NestSamp/NestError.h>
#include <NestSamp/NestLog.h>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <gsl/gsl_randist.h>

using std::vector;

namespace NEST {

float_type wrap_unit(const float_type x) {
    float_type res = x - std::floor(x);
    // x - floor(x) can round up to 1 for tiny negative x
    return res >= 1.0 ? 0.0 : res;
}

bool step_point(const Row & u, const Row & dir, const float_type t, const vector<bool> & wrapped, Row & out) {
    out = u + t * dir;
    for (size_t j = 0; j < static_cast<size_t>(out.size()); ++j) {
        if (wrapped[j]) {
            out[j] = wrap_unit(out[j]);
        } else if ((out[j] < 0.0) or (out[j] > 1.0)) {
            return false;
        }
    }
    return true;
}

SliceSampler::SliceSampler(
    ModelAdapter & model, const gsl_rng * rng, const vector<bool> & wrapped,
    const SliceOptions & opts, const size_t verbose
) : _model(model), _rng(rng), _wrapped(wrapped), _opts(opts), _verbose(verbose),
    _ndim(model.npar()), _nsteps(std::max<size_t>(1, opts.nsteps)) {
    if (_wrapped.size() != _ndim) { throw std::invalid_argument("SliceSampler: one wrapped flag per dimension is required"); }
}

bool SliceSampler::propose(const float_type threshold, const LivePointSet & live, LivePoint & point) {
    const size_t worst = live.worst_slot();
    for (size_t attempt = 1; attempt <= _opts.max_reseeds; ++attempt) {
        size_t seed;
        if (not live.random_slot_above(_rng, threshold, seed)) { return false; }
        StepSamplerState state{ live[seed].u, live[seed].p, live[seed].logl };

        bool stuck = false;
        while (state.nsteps < _nsteps) {
            const Row dir = _direction(live, worst);
            if (not _slice_step(state, threshold, dir)) { stuck = true; break; }
        }

        if (not stuck and state.logl > threshold) {
            _remember(live[seed].u, state.u);
            _adapt_nsteps(state);
            point = LivePoint{ std::move(state.u), std::move(state.p), state.logl };
            return true;
        }

        ++_nstuck;
        if (_verbose > 0) { NestLog::stuck_proposal(_nstuck, attempt, threshold); }
    }

    std::stringstream ss;
    ss << "slice sampler abandoned " << _opts.max_reseeds << " consecutive walks at logl threshold " << threshold;
    throw SamplerError(ss.str());
}

float_type SliceSampler::efficiency() const {
    return _nevals == 0 ? 1.0 : static_cast<float_type>(_naccept) / _nevals;
}

Row SliceSampler::_direction(const LivePointSet & live, const size_t exclude) {
    DIRECTION policy = _opts.direction;
    if (policy == MIXTURE) { policy = static_cast<DIRECTION>(gsl_rng_uniform_int(_rng, 3)); }

    Row dir = Row::Zero(_ndim);
    switch (policy) {
        case AXIS:
            dir[gsl_rng_uniform_int(_rng, _ndim)] = 1.0;
            break;
        case DIFFERENTIAL:
            dir = _differential_direction(live, exclude);
            if (dir.norm() > 0) { break; }
            [[fallthrough]];
        default: // HARMONIC
            gsl_ran_dir_nd(_rng, _ndim, dir.data());
            break;
    }
    return dir;
}

Row SliceSampler::_differential_direction(const LivePointSet & live, const size_t exclude) {
    Row dir;
    if (not _history.empty()) {
        dir = _history[gsl_rng_uniform_int(_rng, _history.size())];
    } else if (live.size() > 2) {
        const size_t a = live.random_slot(_rng, exclude);
        size_t b = live.random_slot(_rng, exclude);
        while (b == a) { b = live.random_slot(_rng, exclude); }
        dir = live[a].u - live[b].u;
        // minimal image across the boundary of periodic dimensions
        for (size_t j = 0; j < _ndim; ++j) { if (_wrapped[j]) { dir[j] -= std::round(dir[j]); } }
    } else {
        return Row::Zero(_ndim);
    }
    const float_type norm = dir.norm();
    return norm > 0 ? Row(dir / norm) : Row(Row::Zero(_ndim));
}

bool SliceSampler::_inside(const Row & u, const float_type threshold, Row & p, float_type & logl) {
    ++_nevals;
    _model.evaluate(u, p, logl);
    if (std::isfinite(threshold) and (logl == threshold)) { ++_nties; }
    return logl > threshold;
}

bool SliceSampler::_slice_step(StepSamplerState & state, const float_type threshold, const Row & dir) {
    Row x, p;
    float_type logl;

    // place a bracket of width `scale` at random around the current position
    float_type left = -gsl_rng_uniform(_rng) * _scale;
    float_type right = left + _scale;

    for (size_t k = 0; k < _opts.max_stepouts; ++k) {
        if (not step_point(state.u, dir, left, _wrapped, x) or not _inside(x, threshold, p, logl)) { break; }
        left -= _scale;
    }
    for (size_t k = 0; k < _opts.max_stepouts; ++k) {
        if (not step_point(state.u, dir, right, _wrapped, x) or not _inside(x, threshold, p, logl)) { break; }
        right += _scale;
    }

    size_t ncontract = 0;
    while (true) {
        const float_type t = left + gsl_rng_uniform(_rng) * (right - left);
        if (step_point(state.u, dir, t, _wrapped, x) and _inside(x, threshold, p, logl)) {
            state.u = x;
            state.p = p;
            state.logl = logl;
            ++state.nsteps;
            ++_naccept;
            break;
        }
        // the current position (t = 0) is always kept inside the bracket
        if (t < 0) { left = t; } else { right = t; }
        ++ncontract;
        if (right - left < _opts.shrink_floor * _scale) {
            state.ncontract += ncontract;
            return false;
        }
    }
    state.ncontract += ncontract;

    if (ncontract == 0) {
        _scale *= 1.1;
    } else if (ncontract > 2) {
        _scale /= 1.1;
    }
    _scale = std::clamp(_scale, _opts.min_scale, 1.0);
    return true;
}

void SliceSampler::_adapt_nsteps(const StepSamplerState & state) {
    if (not _opts.adaptive_nsteps or state.nsteps == 0) { return; }
    const float_type mean_contractions = static_cast<float_type>(state.ncontract) / state.nsteps;
    if ((mean_contractions > _opts.adapt_contraction_threshold) and (_nsteps < _opts.max_nsteps)) {
        const size_t grown = static_cast<size_t>(std::ceil(_nsteps * _opts.adapt_nsteps_factor));
        _nsteps = std::min(std::max(grown, _nsteps + 1), _opts.max_nsteps);
    }
}

void SliceSampler::_remember(const Row & from, const Row & to) {
    if (_opts.history_size == 0) { return; }
    Row disp = to - from;
    for (size_t j = 0; j < _ndim; ++j) { if (_wrapped[j]) { disp[j] -= std::round(disp[j]); } }
    if (disp.norm() == 0) { return; }
    _history.push_back(disp);
    while (_history.size() > _opts.history_size) { _history.pop_front(); }
}

} // namespace NEST
