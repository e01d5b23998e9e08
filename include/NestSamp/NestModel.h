#ifndef NESTSAMP_NESTMODEL_H
#define NESTSAMP_NESTMODEL_H

#include <dlfcn.h> // for dynamic version
#include <cstdlib> // for exit
#include <functional>
#include <string> // for string
#include <iostream> // for cerr

#include <NestSamp/TypeDefs.h>

using std::string;

// defines the core abstraction for a model: (1) a functor pair, (2) `transform`, mapping a point of the
// unit cube to the physical parameter space, and (3) `loglike`, the log-likelihood of a physical point.
// implemented as a pure abstract class - i.e. must be extended by concrete implementations
// Implementations must *not* be stateful: the sampler may call them concurrently from several threads.
struct NestModel {
    virtual ~NestModel() = default;
    virtual Row transform(const Row & u) const = 0;
    virtual float_type loglike(const Row & p) const = 0;
};

// This defines the function types, for cleaner typing when using function pointers as a model
// Using a function pointer is the typical approach for both compiling the sampler + model together AND
// using a dynamic model object.
typedef void NestPriorTransform(const double * u, double * p, const size_t npar);
typedef double NestLogLikelihood(const double * p, const size_t npar);

// This function handles extracting a named function pointer from a shared object file
template <typename NestFunType>
inline NestFunType * loadSO(const char * target, const char * symbol) {
    void* handle = dlopen(target, RTLD_LAZY);
    if (!handle) {
        std::cerr << "Failed to open model object: " << target << " ; " << dlerror() << std::endl;
        exit(101);
    }
    auto fun = (NestFunType*)dlsym(handle, symbol);
    if(!fun) {
        std::cerr << "Failed to find '" << symbol << "' function in " << target << " ; " << dlerror() << std::endl;
        dlclose(handle);
        exit(102);
    }
    return fun;
}

// a NestModel built around a pair of function pointers. Those pointers can come from code compiled along with this library,
// or be loaded from a shared object file exporting `prior_transform` and `loglikelihood`.
struct NestFPtr : NestModel {
    NestPriorTransform * tptr;
    NestLogLikelihood * lptr;
    const size_t npar;

    NestFPtr(NestPriorTransform * _tptr, NestLogLikelihood * _lptr, const size_t _npar) :
        tptr(_tptr), lptr(_lptr), npar(_npar) { }
    NestFPtr(const char * target, const size_t _npar) : NestFPtr(
        loadSO<NestPriorTransform>(target, "prior_transform"),
        loadSO<NestLogLikelihood>(target, "loglikelihood"),
        _npar
    ) { }
    NestFPtr(const string target, const size_t _npar) : NestFPtr(target.c_str(), _npar) { }

    Row transform(const Row & u) const override {
        Row p(npar);
        tptr(u.data(), p.data(), npar);
        return p;
    }

    float_type loglike(const Row & p) const override { return lptr(p.data(), p.size()); }
};

// a NestModel built around std::functions, e.g. lambdas in the caller's program
struct NestFun : NestModel {
    const std::function<Row(const Row &)> tfun;
    const std::function<float_type(const Row &)> lfun;

    NestFun(
        std::function<Row(const Row &)> _tfun,
        std::function<float_type(const Row &)> _lfun
    ) : tfun(_tfun), lfun(_lfun) { }

    Row transform(const Row & u) const override { return tfun(u); }
    float_type loglike(const Row & p) const override { return lfun(p); }
};

#endif // NESTSAMP_NESTMODEL_H
