#ifndef NESTSAMP_MODELADAPTER_H
#define NESTSAMP_MODELADAPTER_H

#include <NestSamp/TypeDefs.h>
#include <NestSamp/NestModel.h>

namespace NEST {

// Wraps a user `NestModel` with contract enforcement:
//  - inputs must lie in the unit cube (std::out_of_range otherwise)
//  - the transform must return exactly `npar` values (LikelihoodError otherwise)
//  - the log-likelihood must be finite or exactly -inf (LikelihoodError otherwise)
//
// Batches are evaluated in parallel (OpenMP); results keep batch order, and any error
// from the batch is rethrown for the first failing row, after the whole batch completes.
class ModelAdapter {
    public:
        ModelAdapter(const NestModel * model, const size_t npar, const size_t num_threads = 1);

        Row transform(const Row & u) const;
        float_type loglike(const Row & p) const;

        // @param us: unit cube points, one per row
        // @param ps: filled with the physical points, one per row
        // @param logls: filled with the log-likelihoods
        void evaluate(const Mat2D & us, Mat2D & ps, Col & logls);
        void evaluate(const Row & u, Row & p, float_type & logl);

        size_t npar() const { return _npar; }
        size_t ncall() const { return _ncall; }
        size_t num_threads() const { return _num_threads; }

    private:
        const NestModel * _model;
        const size_t _npar;
        const size_t _num_threads;
        size_t _ncall = 0;
};

} // namespace NEST

#endif // NESTSAMP_MODELADAPTER_H
