#ifndef NESTSAMP_CLI_H
#define NESTSAMP_CLI_H

#include <iostream>
#include <vector>
#include <optional>
#include <string>

namespace NEST {

// A "usage" function for the built-in nestsamp CLI
// @param cmd the name of the executable
// @param msg an optional message to print before the usage
// @param status if non-zero, will exit with this status
void usage(
    const std::string &cmd,
    const std::string &msg = "",
    const int status = 0
);

// Enum for the steps of a nested sampling analysis
// SAMPLE: run the sampler to convergence (or budget exhaustion)
// STORE: write the result to the configured database
// REPORT: print the result summary; reads the database if nothing was sampled
enum STEP { SAMPLE, STORE, REPORT };

// Stream insertion operator for NEST::STEP
std::ostream& operator<<(std::ostream &os, const STEP &step);

// Container for the parsed command line arguments
// @var config_file the path to the configuration file
// @var steps the `STEP`s to perform
// @var seed overrides the configured seed
// @var max_ncalls overrides the configured likelihood call budget
// @var verbose the verbosity level (0 = quiet, 1 = progress, 2 = also stuck walks)
struct CLIArgs {
    CLIArgs() = delete;
    CLIArgs(const std::string & cf) : config_file(cf) {};

    std::string config_file;             // based on config file ...
    std::vector<STEP> steps = {};        // ... do nothing by default
    std::optional<size_t> seed;          // ... with the configured seed
    std::optional<size_t> max_ncalls;    // ... and the configured budget
    size_t verbose = 0;                  // ... quietly
};

// parses the args passed to a typical main() function for a nested sampling program
// when no step is requested, all of them are performed: sample => store => report
// @param argc the number of arguments (per typical main() signature)
// @param argv the arguments (per typical main() signature)
CLIArgs parse_args(const size_t argc, const char * argv[]);

// Runs the analysis, for some object that implements the nested sampling *verbs*:
// - parse(a string [configuration file path], a size_t [verbosity level])
// - sample(an optional seed, an optional call budget, a verbosity level)
// - store(a verbosity level)
// - report(a verbosity level)
// each returning false on failure
// @return true if every step succeeded
template<typename NestApp>
inline bool run(
    NestApp* app, const CLIArgs &args
) {

    if (not app->parse(args.config_file, args.verbose)) { return false; }

    if (args.verbose > 0) {
        std::cerr << "Running nested sampling as: " << std::endl;
        for (auto it = args.steps.begin(); it != args.steps.end(); it++) {
            if (it != args.steps.begin()) { std::cerr << " => "; }
            std::cerr << *it;
        }
        std::cerr << std::endl;
    }

    for (auto step : args.steps) {
        bool ok = false;
        switch(step) {
            case SAMPLE: ok = app->sample(args.seed, args.max_ncalls, args.verbose); break;
            case STORE: ok = app->store(args.verbose); break;
            case REPORT: ok = app->report(args.verbose); break;
            default:
                std::cerr << "Hit unimplemented STEP." << std::endl;
        }
        if (not ok) { return false; }
    }
    return true;
};

}

#endif // NESTSAMP_CLI_H
