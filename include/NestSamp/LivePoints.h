#ifndef NESTSAMP_LIVEPOINTS_H
#define NESTSAMP_LIVEPOINTS_H

#include <set>
#include <tuple>
#include <vector>
#include <limits>
#include <gsl/gsl_rng.h>

#include <NestSamp/TypeDefs.h>

namespace NEST {

class Sampler;       // see Sampler.h
class DirectSampler; // see DirectSampler.h

// a point in the unit cube (`u`), its image under the prior transform (`p`), and its log-likelihood
struct LivePoint {
    Row u;
    Row p;
    float_type logl = -std::numeric_limits<float_type>::infinity();
};

// The live population of a nested sampling run.
//
// Points are stored in an arena of slots; an ordered index keyed on (logl, insertion sequence)
// identifies the worst point uniquely, with ties broken by insertion order. A slot keeps its
// index across `replace`, so callers may hold on to a slot number between `worst_slot()` and
// `replace()`.
//
// Ownership: the set owns every live point; `replace` and `pop_worst` move the discarded point
// out to the caller (generally the Integrator).
class LivePointSet {
    public:
        LivePointSet(const size_t ndim, const size_t min_size);

        // draw `n` points with finite log-likelihood from the whole prior
        // @throws std::invalid_argument if `n` is below the configured minimum size
        // @throws InitializationError if fewer than `n` are found in `n * attempts_factor` draws
        void initialize(const size_t n, DirectSampler & sampler, const size_t attempts_factor);

        // add `k` points drawn above the current threshold
        // @return the number actually added; stops at the first failed proposal
        size_t grow(const size_t k, Sampler & sampler);

        void insert(LivePoint && point);

        // replace the point in `old_slot` with `candidate`, moving the old point into `dead`
        // @return false, and leave the set untouched, unless candidate.logl > old.logl
        bool replace(const size_t old_slot, LivePoint && candidate, LivePoint & dead);

        // remove the worst point into `dead`; @return false if empty
        bool pop_worst(LivePoint & dead);

        // remove every point, in ascending order of log-likelihood
        std::vector<LivePoint> drain();

        size_t worst_slot() const;
        const LivePoint & worst() const { return _slots[worst_slot()]; }
        // the current likelihood threshold: the worst live log-likelihood (or -inf when empty)
        float_type threshold() const;
        float_type max_logl() const;

        // number of live points with log-likelihood strictly below `logl`
        size_t insertion_rank(const float_type logl) const;

        // a uniformly chosen slot, other than `exclude` when there is any alternative
        size_t random_slot(const gsl_rng * rng, const size_t exclude = std::numeric_limits<size_t>::max()) const;

        // a uniformly chosen slot among the points with log-likelihood strictly above `logl`
        // @return false if there is none, i.e. every live point sits at or below `logl`
        bool random_slot_above(const gsl_rng * rng, const float_type logl, size_t & slot) const;

        const LivePoint & operator[](const size_t slot) const { return _slots[slot]; }

        size_t size() const { return _slots.size(); }
        bool empty() const { return _slots.empty(); }
        size_t ndim() const { return _ndim; }
        size_t min_size() const { return _min_size; }

    private:
        // (logl, insertion sequence, slot)
        typedef std::tuple<float_type, size_t, size_t> Key;

        const size_t _ndim;
        const size_t _min_size;
        std::vector<LivePoint> _slots;
        std::vector<size_t> _seq; // insertion sequence for each slot
        std::set<Key> _index;
        size_t _next_seq = 0;
};

} // namespace NEST

#endif // NESTSAMP_LIVEPOINTS_H
