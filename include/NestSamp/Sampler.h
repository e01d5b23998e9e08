#ifndef NESTSAMP_SAMPLER_H
#define NESTSAMP_SAMPLER_H

#include <string>

#include <NestSamp/TypeDefs.h>
#include <NestSamp/LivePoints.h>

namespace NEST {

// The capability every replacement-point sampler provides. Which sampler is active is a run-time
// decision of the NestSampler, so dispatch is through this interface.
class Sampler {
    public:
        virtual ~Sampler() = default;

        // find a new point with logl > threshold
        // @param live: the current population, which still contains the point being replaced
        // @return false if no point was found within the sampler's own budget
        virtual bool propose(const float_type threshold, const LivePointSet & live, LivePoint & point) = 0;

        virtual std::string name() const = 0;

        // accepted / evaluated, over the sampler's lifetime
        virtual float_type efficiency() const = 0;

        // true when the sampler recommends being replaced
        virtual bool collapsed() const { return false; }
};

} // namespace NEST

#endif // NESTSAMP_SAMPLER_H
