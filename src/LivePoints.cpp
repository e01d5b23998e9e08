#include <NestSamp/LivePoints.h>
#include <NestSamp/DirectSampler.h>
#include <NestSamp/NestError.h>

#include <cassert>
#include <iterator>
#include <sstream>
#include <stdexcept>

using std::vector;
using std::stringstream;

namespace NEST {

LivePointSet::LivePointSet(const size_t ndim, const size_t min_size) :
    _ndim(ndim), _min_size(min_size) {
    if (ndim == 0) { throw std::invalid_argument("LivePointSet requires at least one dimension"); }
}

void LivePointSet::initialize(const size_t n, DirectSampler & sampler, const size_t attempts_factor) {
    if (n < _min_size) {
        stringstream ss;
        ss << "LivePointSet::initialize: " << n << " points requested, below the minimum of " << _min_size;
        throw std::invalid_argument(ss.str());
    }
    vector<LivePoint> drawn;
    const size_t max_draws = n * attempts_factor;
    sampler.draw(n, -std::numeric_limits<float_type>::infinity(), max_draws, drawn);
    if (drawn.size() < n) {
        stringstream ss;
        ss << "found only " << drawn.size() << " of " << n << " initial live points with finite log-likelihood in "
           << max_draws << " draws from the prior; the likelihood appears to be -inf (almost) everywhere";
        throw InitializationError(ss.str());
    }
    for (auto & point : drawn) { insert(std::move(point)); }
}

size_t LivePointSet::grow(const size_t k, Sampler & sampler) {
    const float_type thresh = threshold();
    size_t added = 0;
    for (; added < k; ++added) {
        LivePoint point;
        if (not sampler.propose(thresh, *this, point)) { break; }
        insert(std::move(point));
    }
    return added;
}

void LivePointSet::insert(LivePoint && point) {
    assert(static_cast<size_t>(point.u.size()) == _ndim);
    const size_t slot = _slots.size();
    _index.emplace(point.logl, _next_seq, slot);
    _seq.push_back(_next_seq++);
    _slots.push_back(std::move(point));
}

bool LivePointSet::replace(const size_t old_slot, LivePoint && candidate, LivePoint & dead) {
    if (old_slot >= _slots.size()) { throw std::out_of_range("LivePointSet::replace: no such slot"); }
    LivePoint & old = _slots[old_slot];
    // strict improvement only: a tie would corrupt the volume shrinkage model
    if (not (candidate.logl > old.logl)) { return false; }

    _index.erase(Key(old.logl, _seq[old_slot], old_slot));
    dead = std::move(old);
    old = std::move(candidate);
    _seq[old_slot] = _next_seq++;
    _index.emplace(old.logl, _seq[old_slot], old_slot);
    return true;
}

bool LivePointSet::pop_worst(LivePoint & dead) {
    if (empty()) { return false; }
    const size_t slot = worst_slot();
    const size_t last = _slots.size() - 1;
    _index.erase(_index.begin());
    dead = std::move(_slots[slot]);

    if (slot != last) { // move the last slot into the hole, re-keying it
        _index.erase(Key(_slots[last].logl, _seq[last], last));
        _slots[slot] = std::move(_slots[last]);
        _seq[slot] = _seq[last];
        _index.emplace(_slots[slot].logl, _seq[slot], slot);
    }
    _slots.pop_back();
    _seq.pop_back();
    return true;
}

vector<LivePoint> LivePointSet::drain() {
    vector<LivePoint> res;
    res.reserve(size());
    LivePoint dead;
    while (pop_worst(dead)) { res.push_back(std::move(dead)); }
    return res;
}

size_t LivePointSet::worst_slot() const {
    if (empty()) { throw std::out_of_range("LivePointSet is empty"); }
    return std::get<2>(*_index.begin());
}

float_type LivePointSet::threshold() const {
    return empty() ? -std::numeric_limits<float_type>::infinity() : std::get<0>(*_index.begin());
}

float_type LivePointSet::max_logl() const {
    return empty() ? -std::numeric_limits<float_type>::infinity() : std::get<0>(*_index.rbegin());
}

size_t LivePointSet::insertion_rank(const float_type logl) const {
    auto it = _index.lower_bound(Key(logl, 0, 0));
    return std::distance(_index.begin(), it);
}

size_t LivePointSet::random_slot(const gsl_rng * rng, const size_t exclude) const {
    if (empty()) { throw std::out_of_range("LivePointSet is empty"); }
    if (size() == 1) { return 0; }
    size_t slot = gsl_rng_uniform_int(rng, size());
    while (slot == exclude) { slot = gsl_rng_uniform_int(rng, size()); }
    return slot;
}

bool LivePointSet::random_slot_above(const gsl_rng * rng, const float_type logl, size_t & slot) const {
    const size_t max = std::numeric_limits<size_t>::max();
    auto it = _index.upper_bound(Key(logl, max, max));
    const size_t nabove = std::distance(it, _index.end());
    if (nabove == 0) { return false; }
    std::advance(it, gsl_rng_uniform_int(rng, nabove));
    slot = std::get<2>(*it);
    return true;
}

} // namespace NEST
