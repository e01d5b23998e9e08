#include <NestSamp/ModelAdapter.h>
#include <NestSamp/NestError.h>

#include <cmath>
#include <exception>
#include <limits>
#include <sstream>
#include <vector>

using std::stringstream;
using std::vector;

namespace NEST {

ModelAdapter::ModelAdapter(
    const NestModel * model, const size_t npar, const size_t num_threads
) : _model(model), _npar(npar), _num_threads(num_threads > 0 ? num_threads : 1) {
    if (_model == nullptr) { throw std::invalid_argument("ModelAdapter requires a model"); }
}

Row ModelAdapter::transform(const Row & u) const {
    if ((u.array() < 0.0).any() or (u.array() > 1.0).any()) {
        stringstream ss;
        ss << "prior transform called outside of the unit cube: " << u;
        throw std::out_of_range(ss.str());
    }
    Row p = _model->transform(u);
    if (static_cast<size_t>(p.size()) != _npar) {
        stringstream ss;
        ss << "prior transform returned " << p.size() << " values; expected " << _npar;
        throw LikelihoodError(ss.str());
    }
    return p;
}

float_type ModelAdapter::loglike(const Row & p) const {
    const float_type logl = _model->loglike(p);
    if (std::isnan(logl) or (logl == std::numeric_limits<float_type>::infinity())) {
        stringstream ss;
        ss << "log-likelihood returned " << logl << " at parameters: " << p
           << "; it must be finite or -inf";
        throw LikelihoodError(ss.str());
    }
    return logl;
}

void ModelAdapter::evaluate(const Mat2D & us, Mat2D & ps, Col & logls) {
    const long n = us.rows();
    ps.resize(n, _npar);
    logls.resize(n);
    vector<std::exception_ptr> errors(n);

    #pragma omp parallel for schedule(dynamic, 1) num_threads(static_cast<int>(_num_threads))
    for (long i = 0; i < n; ++i) {
        try {
            const Row p = transform(us.row(i));
            ps.row(i) = p;
            logls[i] = loglike(p);
        } catch (...) {
            errors[i] = std::current_exception(); // rethrown below, in batch order
        }
    }

    _ncall += n;
    for (auto & err : errors) { if (err) { std::rethrow_exception(err); } }
}

void ModelAdapter::evaluate(const Row & u, Row & p, float_type & logl) {
    p = transform(u);
    logl = loglike(p);
    ++_ncall;
}

} // namespace NEST
