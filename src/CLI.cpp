#include <NestSamp/CLI.h>

#include <cstring>
#include <cstdlib>
#include <algorithm>

using std::cerr;
using std::endl;
using std::string;

namespace NEST {

void usage(
    const string &cmd,
    const string &msg,
    const int status
) {
    const string ident = "\t";
    if (not msg.empty()) { cerr << msg << endl; }
    cerr << "Usage: " << cmd << " config.json [-option|--option (each space separated)]" << endl << endl;
    cerr << "Core options:" << endl;
    cerr << ident << "-(-r)un      : run the sampler until it converges or exhausts its budget." << endl;
    cerr << ident << "-(-w)rite    : write the result to the configured database_filename." << endl;
    cerr << ident << "-(-p)rint    : print the result summary; reads the database when used without -r." << endl;
    cerr << ident << "(none of the above implies -r -w -p)" << endl;
    cerr << endl;
    cerr << "Auxilary options:" << endl;
    cerr << ident << "-s 1234      : seed for the random number generator; overrides the configuration." << endl;
    cerr << ident << "-n 1234      : maximum number of likelihood calls; overrides the configuration." << endl;
    cerr << ident << "-(-h)elp     : print this message; ignore all other options." << endl;
    cerr << ident << "-(-v)erbose  : when working, be effusive; repeat for more." << endl;
    cerr << endl;
    cerr << "Example uses:" << endl;
    cerr << endl;
    cerr << "$ " << cmd << " config.json -s 42 -v # sample, store, and report" << endl;
    cerr << "$ " << cmd << " config.json -r -p -n 100000 # quick look, without storage" << endl;
    cerr << "$ " << cmd << " config.json -p # report a stored run" << endl;
    if (status != 0) { exit(status); }
}

std::ostream& operator<<(std::ostream &os, const STEP &step) {
    switch (step) {
        case SAMPLE: os << "SAMPLE"; break;
        case STORE: os << "STORE"; break;
        case REPORT: os << "REPORT"; break;
        default: os << "UNDEFINED NEST::STEP"; break;
    }
    return os;
}

// non-exported helper function for finding argument flags
bool argcheck(const char * arg, const char * short_arg, const char * long_arg) {
    return (strcmp(arg, short_arg) == 0) or (strcmp(arg, long_arg) == 0);
}

// non-exported helper: a strictly positive integer, or exit via usage
size_t positive_integer(const string & cmd, const char * flag, const char * value) {
    char * end = nullptr;
    const long long parsed = strtoll(value, &end, 10);
    if ((end == value) or (*end != '\0') or (parsed < 1)) {
        usage(cmd, "Error: " + string(flag) + " must be followed by a positive integer.", 103);
    }
    return static_cast<size_t>(parsed);
}

CLIArgs parse_args(const size_t argc, const char * argv[]) {

    // assert argv[0] = this program
    const string cmd = string(argv[0]);

    // check for help requested
    auto is_help = [](const char * arg) { return argcheck(arg, "-h", "--help"); };
    if (std::any_of(argv, argv + argc, is_help)) {
        usage(cmd);
        return CLIArgs("");
    }

    if (argc < 2) { usage(cmd, "Error: a configuration file is required.", 101); }

    auto args = CLIArgs(string(argv[1]));

    auto add_step = [&](const STEP step) {
        if (std::find(args.steps.begin(), args.steps.end(), step) != args.steps.end()) {
            cerr << "WARNING: " << step << " specified multiple times; ignoring redundant invocation." << endl;
        } else {
            args.steps.push_back(step);
        }
    };

    for (size_t i = 2; i < argc; i++) {
        if (argcheck(argv[i], "-r", "--run")) {
            add_step(SAMPLE);
        } else if (argcheck(argv[i], "-w", "--write")) {
            add_step(STORE);
        } else if (argcheck(argv[i], "-p", "--print")) {
            add_step(REPORT);
        } else if (strcmp(argv[i], "-s") == 0) {
            // this will occur if -s is the last argument, i.e. no number provided after
            if (i == (argc - 1)) { usage(cmd, "Error: -s must be followed by a positive integer.", 103); }
            ++i;
            args.seed.emplace(positive_integer(cmd, "-s", argv[i]));
        } else if (strcmp(argv[i], "-n") == 0) {
            if (i == (argc - 1)) { usage(cmd, "Error: -n must be followed by a positive integer.", 103); }
            ++i;
            args.max_ncalls.emplace(positive_integer(cmd, "-n", argv[i]));
        } else if (argcheck(argv[i], "-v", "--verbose")) {
            args.verbose += 1;
        } else {
            usage(cmd, "Error: unrecognized argument: " + string(argv[i]), 104);
        }
    }

    if (args.steps.empty()) {
        args.steps = { SAMPLE, STORE, REPORT };
    } else {
        // whatever order the flags came in, the steps run in pipeline order
        std::sort(args.steps.begin(), args.steps.end());
    }

    return args;
};

} // namespace NEST
