#ifndef NESTSAMP_NESTSAMPLER_H
#define NESTSAMP_NESTSAMPLER_H

#include <functional>
#include <memory>
#include <gsl/gsl_rng.h>

#include <NestSamp/TypeDefs.h>
#include <NestSamp/Parameter.h>
#include <NestSamp/NestModel.h>
#include <NestSamp/NestOptions.h>
#include <NestSamp/Convergence.h>
#include <NestSamp/Result.h>

namespace NEST {

// gsl_rng with its matching deleter
struct RngDeleter { void operator()(gsl_rng * rng) const { gsl_rng_free(rng); } };
typedef std::unique_ptr<gsl_rng, RngDeleter> RngPtr;

// a gsl_rng_taus2 seeded with `seed`, or from the clock and process id when there is none
RngPtr make_rng(const std::optional<size_t> & seed);

// A `NestSampler` runs one nested sampling analysis: it owns the live points, the samplers, the
// integrator and the convergence monitor, and drives the iteration loop
//
//   worst -> sampler -> replace -> integrate -> order test -> progress -> grow -> stop?
//
// Conventions:
//  - internal state fields: _field_name
//  - private methods: _method_name()
//  - public methods: method_name()
class NestSampler {
    public:
        typedef std::function<void(const ProgressRecord &)> ProgressCallback;

        // @throws std::invalid_argument if `opts` are inconsistent with `space`
        NestSampler(const ParameterSpace & space, const NestModel * model, const NestOptions & opts);
        ~NestSampler();

        // called every `log_interval` iterations; observational only
        void set_progress_callback(ProgressCallback cb) { _progress = std::move(cb); }
        // polled between iterations; returning true ends the run with BUDGET_EXHAUSTED
        void set_cancel_hook(ConvergenceMonitor::CancelHook hook) { _cancel = std::move(hook); }

        // @throws InitializationError, LikelihoodError, SamplerError
        Result run();

        const NestOptions & options() const { return _opts; }
        const ParameterSpace & space() const { return _space; }
        const gsl_rng * rng() const { return _rng.get(); }

    private:
        const ParameterSpace _space;
        const NestModel * _model;
        const NestOptions _opts;
        RngPtr _rng;
        ProgressCallback _progress;
        ConvergenceMonitor::CancelHook _cancel;
};

} // namespace NEST

#endif // NESTSAMP_NESTSAMPLER_H
