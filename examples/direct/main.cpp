#include <cmath>
#include <iostream>

#include <NestSamp/NestSampler.h>
#include <NestSamp/NestError.h>
#include <NestSamp/NestLog.h>

using namespace std;
using namespace NEST;

// this version of a main program demonstrates:
//  - using the NestSampler class without a configuration file
//  - a model given as lambdas
//  - a wrapped (periodic) parameter: the direction of a von Mises distribution

int main(int argc, char* argv[]) {

    if (argc != 2) {
        cerr << "\n\tUsage: examples/direct observed_angle\n\n";
        return 100;
    }
    const double observed = strtod(argv[1], nullptr);
    const double kappa = 4.0;

    ParameterSpace space;
    space.add_next_parameter(make_shared<const Parameter>("direction", "mu", true));
    space.add_next_parameter(make_shared<const Parameter>("log concentration", "logk"));

    NestFun model(
        [](const Row & u) {
            Row p(2);
            p[0] = 2 * M_PI * u[0];      // U(0, 2 pi), periodic
            p[1] = 6.0 * u[1] - 3.0;    // U(-3, 3)
            return p;
        },
        [observed, kappa](const Row & p) {
            // a von Mises observation of the direction, and a standard normal one of log(kappa)
            return kappa * cos(observed - p[0]) - log(2 * M_PI * cyl_bessel_i(0.0, kappa))
                 - 0.5 * pow(p[1] - log(kappa), 2) - 0.5 * log(2 * M_PI);
        }
    );

    NestOptions opts;
    opts.min_num_live_points = 200;
    opts.min_ess = 1000;
    opts.log_interval = 500;
    opts.verbose = 1;
    opts.seed = 20240101;

    try {
        NestSampler sampler(space, &model, opts);
        sampler.set_progress_callback([](const ProgressRecord & rec) {
            if (rec.iteration % 5000 == 0) { cout << rec.iteration << "\t" << rec.logz << endl; }
        });
        const Result res = sampler.run();
        NestLog::summary(res, cout);
    } catch (const NestError & e) {
        cerr << "Nested sampling failed: " << e.what() << endl;
        return 1;
    }

    return 0;
}
