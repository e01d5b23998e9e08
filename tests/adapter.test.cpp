#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include <NestSamp/ModelAdapter.h>
#include <NestSamp/NestError.h>
#include "testing.h"

using namespace NEST;
using namespace std;

NestFun identity(
    [](const Row & u) { return u; },
    [](const Row & p) { return p[0]; }
);

void test_contract_violations() {
    NestFun nan_model(
        [](const Row & u) { return u; },
        [](const Row &) { return numeric_limits<float_type>::quiet_NaN(); }
    );
    NestFun inf_model(
        [](const Row & u) { return u; },
        [](const Row &) { return numeric_limits<float_type>::infinity(); }
    );
    NestFun short_model(
        [](const Row & u) { return Row(u.head(1)); },
        [](const Row & p) { return p[0]; }
    );
    NestFun ninf_model(
        [](const Row & u) { return u; },
        [](const Row &) { return -numeric_limits<float_type>::infinity(); }
    );

    Row u(2);
    u << 0.25, 0.75;
    Row p;
    float_type logl;

    ModelAdapter nan_adapter(&nan_model, 2);
    THROWS(LikelihoodError, nan_adapter.evaluate(u, p, logl));

    ModelAdapter inf_adapter(&inf_model, 2);
    THROWS(LikelihoodError, inf_adapter.evaluate(u, p, logl));

    ModelAdapter short_adapter(&short_model, 2);
    THROWS(LikelihoodError, short_adapter.transform(u));

    ModelAdapter ninf_adapter(&ninf_model, 2);
    ninf_adapter.evaluate(u, p, logl);
    IS_TRUE(logl == -numeric_limits<float_type>::infinity());
    IS_TRUE(ninf_adapter.ncall() == 1);

    ModelAdapter adapter(&::identity, 2);
    Row outside(2);
    outside << 0.5, 1.5;
    THROWS(std::out_of_range, adapter.transform(outside));
    outside << -0.1, 0.5;
    THROWS(std::out_of_range, adapter.evaluate(outside, p, logl));

    // errors are LikelihoodErrors, and NestErrors
    THROWS(NestError, nan_adapter.evaluate(u, p, logl));
}

void test_batch_keeps_order() {
    ModelAdapter adapter(&::identity, 2, 4);
    IS_TRUE(adapter.num_threads() == 4);

    const size_t n = 64;
    Mat2D us(n, 2);
    for (size_t i = 0; i < n; ++i) { us(i, 0) = static_cast<float_type>(i) / n; us(i, 1) = 0.5; }
    Mat2D ps;
    Col logls;
    adapter.evaluate(us, ps, logls);

    IS_TRUE(ps.rows() == static_cast<long>(n) and ps.cols() == 2);
    bool ordered = true;
    for (size_t i = 0; i < n; ++i) { ordered = ordered and (logls[i] == us(i, 0)) and (ps(i, 0) == us(i, 0)); }
    IS_TRUE(ordered);
    IS_TRUE(adapter.ncall() == n);
}

void test_batch_rethrows_first_error() {
    NestFun picky(
        [](const Row & u) { return u; },
        [](const Row & p) {
            if (p[0] >= 0.45) { throw std::runtime_error(to_string(static_cast<int>(std::round(p[0] * 10)))); }
            return p[0];
        }
    );
    ModelAdapter adapter(&picky, 1, 4);
    Mat2D us(10, 1);
    for (size_t i = 0; i < 10; ++i) { us(i, 0) = i / 10.0; }
    Mat2D ps;
    Col logls;

    string message;
    try {
        adapter.evaluate(us, ps, logls);
    } catch (const std::runtime_error & e) {
        message = e.what();
    }
    IS_TRUE(message == "5");
    IS_TRUE(adapter.ncall() == 10); // the whole batch ran
}

int main() {
    test_contract_violations();
    test_batch_keeps_order();
    test_batch_rethrows_first_error();
    return TEST_STATUS();
}
