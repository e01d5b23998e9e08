#include <NestSamp/OrderTest.h>

#include <cmath>
#include <stdexcept>

namespace NEST {

void OrderTest::add(const size_t rank, const size_t nlive) {
    if (rank >= nlive) { throw std::out_of_range("OrderTest::add: rank must be below the live count"); }
    const float_type n = nlive;
    _sum += (rank + 0.5) / n - 0.5;
    _variance += (n * n - 1) / (12 * n * n);
    ++_count;
}

float_type OrderTest::zscore() const {
    return _variance > 0 ? _sum / std::sqrt(_variance) : 0.0;
}

bool OrderTest::significant(const float_type zmax) const {
    return std::fabs(zscore()) > zmax;
}

void OrderTest::restart() {
    _runs.push_back(_count);
    _count = 0;
    _sum = 0.0;
    _variance = 0.0;
}

} // namespace NEST
