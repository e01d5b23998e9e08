#ifndef NESTSAMP_NESTERROR_H
#define NESTSAMP_NESTERROR_H

#include <stdexcept>
#include <string>

namespace NEST {

// Fatal conditions of a nested sampling run. Recoverable events (stuck slice walks,
// refused ties, budget exhaustion) are counted in the run `Diagnostics` instead.
struct NestError : public std::runtime_error {
    NestError(const std::string & msg) : std::runtime_error(msg) {}
};

// not enough finite-likelihood points could be drawn to start the run
struct InitializationError : public NestError {
    InitializationError(const std::string & msg) : NestError(msg) {}
};

// the model returned NaN / +inf, or a prior transform of the wrong size
struct LikelihoodError : public NestError {
    LikelihoodError(const std::string & msg) : NestError(msg) {}
};

// the step sampler could not produce a replacement from any seed
struct SamplerError : public NestError {
    SamplerError(const std::string & msg) : NestError(msg) {}
};

} // namespace NEST

#endif // NESTSAMP_NESTERROR_H
