#include <NestSamp/NestApp.h>
#include <NestSamp/Config.h>
#include <NestSamp/NestDB.h>
#include <NestSamp/NestError.h>
#include <NestSamp/NestLog.h>
#include <NestSamp/NestSampler.h>

#include <iostream>
#include <stdexcept>

using std::cerr;
using std::endl;

namespace NEST {

bool NestApp::parse(const std::string & config_file, const size_t verbose) {
    JsonConfig config(config_file);
    if (not config.valid()) { return false; }
    if (not config.parse_parameters(_space) or not config.parse_options(_opts)) {
        cerr << "Invalid configuration: " << config_file << endl;
        return false;
    }
    _opts.verbose = verbose;
    _shared = config.shared_object();
    _database = config.database_filename();
    return true;
}

bool NestApp::sample(const std::optional<size_t> & seed, const std::optional<size_t> & max_ncalls, const size_t verbose) {
    if (_shared.empty()) {
        cerr << "Error: configuration must name the model's `shared` object to sample." << endl;
        return false;
    }
    if (seed) { _opts.seed = seed; }
    if (max_ncalls) { _opts.max_ncalls = *max_ncalls; }
    _opts.verbose = verbose;

    _model = std::make_unique<NestFPtr>(_shared, _space.size());
    try {
        NestSampler sampler(_space, _model.get(), _opts);
        _result = sampler.run();
    } catch (const std::invalid_argument & e) {
        cerr << "Invalid options: " << e.what() << endl;
        return false;
    } catch (const NestError & e) {
        cerr << "Nested sampling failed: " << e.what() << endl;
        return false;
    }
    return true;
}

bool NestApp::store(const size_t verbose) {
    if (not _result) {
        cerr << "Error: nothing to store; run the sampler first." << endl;
        return false;
    }
    if (_database.empty()) {
        cerr << "Error: configuration must name a `database_filename` to store results." << endl;
        return false;
    }
    NestDB db(_database);
    return db.setup(_space, verbose) and db.write_result(*_result, verbose);
}

bool NestApp::report(const size_t /* verbose */) {
    if (not _result) {
        if (_database.empty()) {
            cerr << "Error: nothing to report; no run and no `database_filename`." << endl;
            return false;
        }
        Result stored;
        NestDB db(_database);
        if (not db.read_result(stored)) { return false; }
        _result = std::move(stored);
    }
    NestLog::summary(*_result, std::cout);
    return true;
}

}
