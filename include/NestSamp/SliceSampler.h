#ifndef NESTSAMP_SLICESAMPLER_H
#define NESTSAMP_SLICESAMPLER_H

#include <deque>
#include <vector>
#include <gsl/gsl_rng.h>

#include <NestSamp/Sampler.h>
#include <NestSamp/ModelAdapter.h>
#include <NestSamp/NestOptions.h>

namespace NEST {

// map x onto [0, 1)
float_type wrap_unit(const float_type x);

// `out` = u + t * dir, wrapped dimensions taken modulo 1
// @return false if a non-wrapped coordinate leaves [0, 1]
bool step_point(const Row & u, const Row & dir, const float_type t, const std::vector<bool> & wrapped, Row & out);

// the walker of one replacement; lives only for the duration of a single `propose` call
struct StepSamplerState {
    Row u;
    Row p;
    float_type logl;
    size_t nsteps = 0;    // accepted slice steps
    size_t ncontract = 0; // bracket contractions, over all steps
};

// Constrained slice sampling: a walk of `nsteps` slice steps from a live point chosen at random
// among those strictly above the threshold, each step along a direction from the configured
// DIRECTION policy, restricted to logl > threshold.
//
// A walk whose bracket collapses below `shrink_floor * scale` is abandoned (a stuck proposal),
// and the walk restarts from another live point; `max_reseeds` consecutive abandoned walks
// raise a SamplerError. `propose` returns false, without evaluating anything, when every live
// point sits on the threshold: a likelihood plateau, from which no walk can start.
class SliceSampler : public Sampler {
    public:
        SliceSampler(
            ModelAdapter & model, const gsl_rng * rng, const std::vector<bool> & wrapped,
            const SliceOptions & opts, const size_t verbose = 0
        );

        bool propose(const float_type threshold, const LivePointSet & live, LivePoint & point) override;

        std::string name() const override { return "slice"; }
        float_type efficiency() const override;

        size_t nstuck() const { return _nstuck; }
        // evaluations rejected for a log-likelihood exactly equal to a finite threshold
        size_t nties() const { return _nties; }
        size_t nsteps() const { return _nsteps; }
        float_type scale() const { return _scale; }

    private:
        Row _direction(const LivePointSet & live, const size_t exclude);
        Row _differential_direction(const LivePointSet & live, const size_t exclude);

        // one slice step of `state` along `dir`; @return false if the bracket collapsed
        bool _slice_step(StepSamplerState & state, const float_type threshold, const Row & dir);

        // evaluate `u`, filling p / logl; @return logl > threshold
        bool _inside(const Row & u, const float_type threshold, Row & p, float_type & logl);

        void _adapt_nsteps(const StepSamplerState & state);
        void _remember(const Row & from, const Row & to);

        ModelAdapter & _model;
        const gsl_rng * _rng;
        const std::vector<bool> _wrapped;
        const SliceOptions _opts;
        const size_t _verbose;
        const size_t _ndim;

        size_t _nsteps;
        float_type _scale = 1.0;
        size_t _nstuck = 0;
        size_t _nties = 0;
        size_t _nevals = 0;
        size_t _naccept = 0;
        std::deque<Row> _history; // recent net walk displacements
};

} // namespace NEST

#endif // NESTSAMP_SLICESAMPLER_H
