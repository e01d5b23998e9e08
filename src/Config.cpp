#include <NestSamp/Config.h>
#include <NestSamp/NestUtil.h>

#include <fstream>
#include <iostream>
#include <stdexcept>

using std::cerr;
using std::endl;
using std::string;

namespace NEST {

namespace {

bool file_exists(const string & filename) {
    std::ifstream ifs(filename.c_str());
    return ifs.good();
}

// reads a non-negative integer option, if present
bool get_size(const Json::Value & root, const char * key, size_t & target) {
    if (not root.isMember(key)) { return true; }
    const Json::Value & val = root[key];
    if (not val.isIntegral() or val.asLargestInt() < 0) {
        cerr << "Error: `" << key << "` must be a non-negative integer." << endl;
        return false;
    }
    target = val.asLargestUInt();
    return true;
}

bool get_real(const Json::Value & root, const char * key, float_type & target) {
    if (not root.isMember(key)) { return true; }
    const Json::Value & val = root[key];
    if (not val.isNumeric()) {
        cerr << "Error: `" << key << "` must be a number." << endl;
        return false;
    }
    target = val.asDouble();
    return true;
}

bool get_string(const Json::Value & root, const char * key, string & target) {
    if (not root.isMember(key)) { return true; }
    const Json::Value & val = root[key];
    if (not val.isString()) {
        cerr << "Error: `" << key << "` must be a string." << endl;
        return false;
    }
    target = val.asString();
    return true;
}

bool get_bool(const Json::Value & root, const char * key, bool & target) {
    if (not root.isMember(key)) { return true; }
    const Json::Value & val = root[key];
    if (not val.isBool()) {
        cerr << "Error: `" << key << "` must be true or false." << endl;
        return false;
    }
    target = val.asBool();
    return true;
}

}

bool parse_sampler(const string & name, SAMPLER & sampler) {
    if (name == "AUTO") { sampler = AUTO; }
    else if (name == "SLICE") { sampler = SLICE; }
    else { return false; }
    return true;
}

bool parse_direction(const string & name, DIRECTION & direction) {
    if (name == "AXIS") { direction = AXIS; }
    else if (name == "HARMONIC") { direction = HARMONIC; }
    else if (name == "DIFFERENTIAL") { direction = DIFFERENTIAL; }
    else if (name == "MIXTURE") { direction = MIXTURE; }
    else { return false; }
    return true;
}

JsonConfig::JsonConfig(const string & filename) : _valid(false) {
    if (not file_exists(filename)) {
        cerr << "File does not exist: " << filename << endl;
        return;
    }
    Json::Reader reader;
    const string json_data = slurp(filename);
    if (not reader.parse(json_data, _root)) {
        // report to the user the failure and their locations in the document.
        cerr << "Failed to parse configuration\n" << reader.getFormattedErrorMessages();
        return;
    }
    if (not _root.isObject()) {
        cerr << "Configuration must be a JSON object: " << filename << endl;
        return;
    }
    _valid = true;
}

JsonConfig::JsonConfig(const Json::Value & root) : _root(root), _valid(root.isObject()) {}

bool JsonConfig::parse_parameters(ParameterSpace & space) const {
    const Json::Value & model_par = _root["parameters"];
    if (not model_par.isArray() or model_par.empty()) {
        cerr << "Error: configuration must list at least one entry in `parameters`." << endl;
        return false;
    }

    for (const Json::Value & mpar : model_par) {
        if (not mpar.isObject() or not mpar.isMember("name") or not mpar["name"].isString()) {
            cerr << "Error: every parameter needs a `name`." << endl;
            return false;
        }
        const string name = mpar["name"].asString();
        string short_name;
        bool wrapped = false;
        if (not get_string(mpar, "short_name", short_name) or not get_bool(mpar, "wrapped", wrapped)) { return false; }

        try {
            space.add_next_parameter(std::make_shared<const Parameter>(name, short_name, wrapped));
        } catch (const std::invalid_argument & e) {
            cerr << "Error: " << e.what() << endl;
            return false;
        }
    }
    return true;
}

bool JsonConfig::parse_options(NestOptions & opts) const {
    bool ok = get_size(_root, "min_num_live_points", opts.min_num_live_points)
        and get_size(_root, "max_num_live_points", opts.max_num_live_points)
        and get_size(_root, "grow_increment", opts.grow_increment)
        and get_real(_root, "dlogz", opts.dlogz)
        and get_real(_root, "min_ess", opts.min_ess)
        and get_real(_root, "frac_remain", opts.frac_remain)
        and get_size(_root, "max_ncalls", opts.max_ncalls)
        and get_size(_root, "max_iters", opts.max_iters)
        and get_real(_root, "max_seconds", opts.max_seconds)
        and get_real(_root, "direct_min_efficiency", opts.direct_min_efficiency)
        and get_real(_root, "direct_patience", opts.direct_patience)
        and get_size(_root, "init_attempts_factor", opts.init_attempts_factor)
        and get_size(_root, "batch_size", opts.batch_size)
        and get_size(_root, "num_threads", opts.num_threads)
        and get_size(_root, "log_interval", opts.log_interval)
        and get_size(_root, "tie_warning_threshold", opts.tie_warning_threshold)
        and get_real(_root, "order_test_zscore", opts.order_test_zscore);
    if (not ok) { return false; }

    if (_root.isMember("seed")) {
        size_t seed = 0;
        if (not get_size(_root, "seed", seed)) { return false; }
        opts.seed = seed;
    }

    if (_root.isMember("sampler")) {
        const Json::Value & samp = _root["sampler"];
        if (not samp.isObject()) {
            cerr << "Error: `sampler` must be an object." << endl;
            return false;
        }
        string type, direction;
        if (not get_string(samp, "type", type) or not get_string(samp, "direction", direction)) { return false; }
        if (not type.empty() and not parse_sampler(type, opts.sampler)) {
            cerr << "Error: unknown sampler type: " << type << " (expected AUTO or SLICE)" << endl;
            return false;
        }
        if (not direction.empty() and not parse_direction(direction, opts.slice.direction)) {
            cerr << "Error: unknown sampler direction: " << direction
                 << " (expected AXIS, HARMONIC, DIFFERENTIAL or MIXTURE)" << endl;
            return false;
        }
        ok = get_size(samp, "nsteps", opts.slice.nsteps)
            and get_bool(samp, "adaptive_nsteps", opts.slice.adaptive_nsteps)
            and get_size(samp, "max_nsteps", opts.slice.max_nsteps)
            and get_real(samp, "adapt_contraction_threshold", opts.slice.adapt_contraction_threshold)
            and get_real(samp, "adapt_nsteps_factor", opts.slice.adapt_nsteps_factor)
            and get_size(samp, "max_stepouts", opts.slice.max_stepouts)
            and get_real(samp, "shrink_floor", opts.slice.shrink_floor)
            and get_real(samp, "min_scale", opts.slice.min_scale)
            and get_size(samp, "max_reseeds", opts.slice.max_reseeds)
            and get_size(samp, "history_size", opts.slice.history_size);
        if (not ok) { return false; }
    }

    if (not (opts.frac_remain > 0) or not (opts.frac_remain < 1)) {
        cerr << "Error: `frac_remain` must be in (0, 1)." << endl;
        return false;
    }
    if (opts.min_num_live_points < 2) {
        cerr << "Error: `min_num_live_points` must be at least 2." << endl;
        return false;
    }
    return true;
}

// a non-string value reads as unset
string JsonConfig::shared_object() const {
    const Json::Value & val = _root["shared"];
    return val.isString() ? val.asString() : "";
}

string JsonConfig::database_filename() const {
    const Json::Value & val = _root["database_filename"];
    return val.isString() ? val.asString() : "";
}

}
