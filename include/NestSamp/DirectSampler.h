#ifndef NESTSAMP_DIRECTSAMPLER_H
#define NESTSAMP_DIRECTSAMPLER_H

#include <vector>
#include <gsl/gsl_rng.h>

#include <NestSamp/Sampler.h>
#include <NestSamp/ModelAdapter.h>

namespace NEST {

// Rejection sampling straight from the unit cube: draw, transform, evaluate, and accept if
// above the threshold. Candidates are drawn `batch_size` at a time, so the evaluation of a
// batch can run in parallel; the first accepted candidate in batch order is used.
//
// Each proposal may use at most `rejection_budget()` draws. Running out of budget, or an
// acceptance efficiency below `min_efficiency` over the last `rejection_budget()` draws,
// marks the sampler `collapsed()`.
class DirectSampler : public Sampler {
    public:
        DirectSampler(
            ModelAdapter & model, const gsl_rng * rng,
            const size_t batch_size, const float_type min_efficiency, const float_type patience
        );

        bool propose(const float_type threshold, const LivePointSet & live, LivePoint & point) override;

        // draw until `n` points above `threshold` are found, or `max_draws` candidates are spent
        // @return the number of points appended to `accepted`
        size_t draw(
            const size_t n, const float_type threshold, const size_t max_draws,
            std::vector<LivePoint> & accepted
        );

        std::string name() const override { return "direct"; }
        // acceptance rate over the last `rejection_budget()` draws (fewer, early on)
        float_type efficiency() const override;
        bool collapsed() const override { return _collapsed; }

        size_t rejection_budget() const { return _budget; }
        size_t ndraw() const { return _ndraw; }
        size_t naccept() const { return _naccept; }
        // candidates rejected for a log-likelihood exactly equal to a finite threshold
        size_t nties() const { return _nties; }

    private:
        ModelAdapter & _model;
        const gsl_rng * _rng;
        const size_t _batch_size;
        const float_type _min_efficiency;
        const size_t _budget;
        void _record(const bool accepted);

        size_t _ndraw = 0;
        size_t _naccept = 0;
        size_t _nties = 0;
        bool _collapsed = false;

        std::vector<bool> _window; // outcomes of the last `_budget` draws, as a ring
        size_t _window_accepts = 0;
};

} // namespace NEST

#endif // NESTSAMP_DIRECTSAMPLER_H
