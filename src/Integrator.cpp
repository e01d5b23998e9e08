#include <NestSamp/Integrator.h>
#include <NestSamp/NestUtil.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace NEST {

Integrator::Integrator(const float_type log_start_volume, const float_type start_variance) :
    _logvol(log_start_volume), _start_variance(start_variance) {
    if (log_start_volume > 0) { throw std::invalid_argument("Integrator: the starting prior volume cannot exceed one"); }
}

void Integrator::record(LivePoint && dead, const size_t nlive, const size_t iteration) {
    if (nlive == 0) { throw std::invalid_argument("Integrator::record requires at least one live point"); }

    const float_type logl = dead.logl;
    const float_type shrink = -1.0 / nlive;
    const float_type logwidth = _logvol + log1mexp(shrink);
    _logvol += shrink;

    const float_type logdz = std::log(0.5) + logaddexp(_last_logl, logl) + logwidth;
    const float_type logz_new = logaddexp(_logz, logdz);

    if (std::isfinite(logz_new)) {
        // Skilling's update, H = int (L/Z) log(L/Z) dX; the old term vanishes while Z is still zero
        float_type h = std::exp(logdz - logz_new) * logl;
        if (std::isfinite(_logz)) { h += std::exp(_logz - logz_new) * (_information + _logz); }
        h -= logz_new;
        _information = std::isfinite(h) ? std::max(0.0, h) : _information;
    }
    _logz = logz_new;

    const float_type logw = logl + logwidth;
    _log_sum_w = logaddexp(_log_sum_w, logw);
    _log_sum_w2 = logaddexp(_log_sum_w2, 2 * logw);

    _last_logl = logl;
    _last_nlive = nlive;
    _logwidth.push_back(logwidth);
    _logvols.push_back(_logvol);
    _iteration.push_back(iteration);
    _dead.push_back(std::move(dead));
}

float_type Integrator::logzerr(const size_t nlive) const {
    return nlive == 0 ? std::sqrt(_start_variance) : std::sqrt(_information / nlive + _start_variance);
}

float_type Integrator::ess() const {
    return std::isfinite(_log_sum_w) ? std::exp(2 * _log_sum_w - _log_sum_w2) : 0.0;
}

Col Integrator::logls() const {
    Col res(_dead.size());
    for (size_t i = 0; i < _dead.size(); ++i) { res[i] = _dead[i].logl; }
    return res;
}

Col Integrator::logvols() const {
    Col res(_logvols.size());
    for (size_t i = 0; i < _logvols.size(); ++i) { res[i] = _logvols[i]; }
    return res;
}

Col Integrator::log_weights() const {
    const size_t n = _dead.size();
    Col res(n);
    const float_type loghalf = std::log(0.5);
    for (size_t i = 0; i + 1 < n; ++i) {
        res[i] = loghalf + _dead[i].logl + logaddexp(_logwidth[i], _logwidth[i + 1]);
    }
    if (n > 0) {
        const float_type logl = _dead[n - 1].logl;
        res[n - 1] = logaddexp(loghalf + logl + _logwidth[n - 1], logl + _logvol);
    }
    return res;
}

Col Integrator::weights() const {
    const Col logw = log_weights();
    const float_type total = logsumexp(logw);
    if (not std::isfinite(total)) { return Col::Zero(logw.size()); }
    return (logw.array() - total).exp().matrix();
}

} // namespace NEST
